#include <atomic>

#include "errors.hpp"
#include "fake_transport.hpp"
#include "output_file.hpp"
#include "segment.hpp"
#include "segment_worker.hpp"
#include "test_support.hpp"

namespace
{
    const std::string URL = "https://example.com/stream.bin";
    constexpr std::uint64_t SIZE = 70001;

    RetryPolicy fastRetries()
    {
        RetryPolicy policy;
        policy.maxAttempts = 3;
        policy.initialDelayMs = 1;
        return policy;
    }
} // namespace

int main()
{
    TestReport report;
    auto root = makeTempDir("segment-worker");
    const std::string content = makeContent(SIZE);

    try
    {
        // Test 1: stream of unknown length
        {
            FakeServer server(content);
            server.sendContentLength = false;
            server.acceptRanges = false;
            FakeTransport transport(server);
            OutputFile file(root / "open-ended.bin");
            file.resize(0);
            std::atomic<bool> cancel{false};
            std::atomic<std::uint64_t> progress{0};

            Segment segment = SegmentPlanner::planOpenEnded().front();
            SegmentWorker worker(transport, file, URL, false, fastRetries(), cancel, progress);
            auto outcome = worker.run(segment);

            report.check(outcome == SegmentWorker::Outcome::Done, "Open-ended segment finishes when the body ends");
            report.check(segment.end == SIZE - 1 && segment.bytesWritten == SIZE,
                         "Open-ended segment records its final end offset");
            report.check(segment.status == SegmentStatus::Done && progress.load() == SIZE,
                         "Open-ended segment reports every byte as progress");
            report.check(readFile(root / "open-ended.bin") == content, "Open-ended body written from offset 0");
        }

        // Test 2: connection reset mid-segment, retry continues from the last byte
        {
            auto plan = SegmentPlanner::plan(SIZE, 2, 1);
            FakeServer server(content);
            server.failRangeEndingAt(plan[1].end, 1, 1000);
            FakeTransport transport(server);
            OutputFile file(root / "retry.bin");
            file.resize(SIZE);
            std::atomic<bool> cancel{false};
            std::atomic<std::uint64_t> progress{0};

            Segment segment = plan[1];
            SegmentWorker worker(transport, file, URL, true, fastRetries(), cancel, progress);
            auto outcome = worker.run(segment);
            auto ranges = server.rangedRequests();

            report.check(outcome == SegmentWorker::Outcome::Done && segment.retries == 1,
                         "Transient reset is retried once");
            report.check(ranges.size() == 2 && ranges[1].first == plan[1].start + 1000 &&
                             ranges[1].second == plan[1].end,
                         "Retry asks for the bytes not yet written");
            report.check(readFile(root / "retry.bin").substr(plan[1].start) == content.substr(plan[1].start),
                         "Segment bytes land at their offset");
        }

        // Test 3: 403 fails the segment without another attempt
        {
            auto plan = SegmentPlanner::plan(SIZE, 2, 1);
            FakeServer server(content);
            server.failRangeWithStatus(plan[0].end, 403);
            FakeTransport transport(server);
            OutputFile file(root / "forbidden.bin");
            file.resize(SIZE);
            std::atomic<bool> cancel{false};
            std::atomic<std::uint64_t> progress{0};

            Segment segment = plan[0];
            SegmentWorker worker(transport, file, URL, true, fastRetries(), cancel, progress);
            auto outcome = worker.run(segment);

            report.check(outcome == SegmentWorker::Outcome::Failed && segment.status == SegmentStatus::Failed,
                         "403 fails the segment");
            report.check(server.getCalls() == 1 && worker.getLastError().find("403") != std::string::npos,
                         "403 is attempted once and named in the error");
        }

        // Test 4: cancelled before the first request
        {
            FakeServer server(content);
            FakeTransport transport(server);
            OutputFile file(root / "cancelled.bin");
            file.resize(SIZE);
            std::atomic<bool> cancel{true};
            std::atomic<std::uint64_t> progress{0};

            Segment segment = SegmentPlanner::plan(SIZE, 1, 1).front();
            SegmentWorker worker(transport, file, URL, true, fastRetries(), cancel, progress);
            auto outcome = worker.run(segment);

            report.check(outcome == SegmentWorker::Outcome::Cancelled && server.getCalls() == 0 &&
                             segment.bytesWritten == 0,
                         "Cancelled worker sends no request");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        std::filesystem::remove_all(root);
        return 1;
    }

    std::filesystem::remove_all(root);
    return report.finish();
}
