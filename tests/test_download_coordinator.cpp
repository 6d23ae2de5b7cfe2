#include <atomic>
#include <stdexcept>

#include "checksum.hpp"
#include "download_coordinator.hpp"
#include "errors.hpp"
#include "fake_transport.hpp"
#include "resume_store.hpp"
#include "test_support.hpp"

namespace
{
    const std::string URL = "https://example.com/files/payload.bin";
    constexpr std::uint64_t SIZE = 100003;

    DownloadConfig testConfig(const std::filesystem::path &directory)
    {
        DownloadConfig config;
        config.url = URL;
        config.outputDirectory = directory.string();
        config.threads = 4;
        config.retryDelayMs = 1;
        config.minSegmentSize = 1;
        config.quiet = true;
        return config;
    }

    std::uint64_t servedRangeBytes(const FakeServer &server)
    {
        std::uint64_t total = 0;
        for (const auto &range : server.rangedRequests())
        {
            total += range.second - range.first + 1;
        }
        return total;
    }

    // Expected segment table for SIZE over 4 threads
    std::vector<Segment> expectedPlan()
    {
        return SegmentPlanner::plan(SIZE, 4, 1);
    }
} // namespace

int main()
{
    TestReport report;
    auto root = makeTempDir("coordinator");
    const std::string content = makeContent(SIZE);
    writeFile(root / "reference.bin", content);
    const std::string referenceDigest = ChecksumVerifier::computeSHA256(root / "reference.bin");

    try
    {
        // Test 1: full segmented download
        {
            auto dir = root / "full";
            FakeServer server(content);
            DownloadCoordinator coordinator(testConfig(dir), FakeTransport::factory(server));

            std::uint64_t lastProgress = 0;
            std::size_t lastSegmentsDone = 0;
            coordinator.setProgressCallback([&](const ProgressSnapshot &snapshot)
                                            {
                lastProgress = snapshot.bytesDone;
                lastSegmentsDone = snapshot.segmentsDone; });

            DownloadResult result = coordinator.run();
            auto ranges = server.rangedRequests();

            report.check(result.path == dir / "payload.bin", "Output named after the URL in the chosen directory");
            report.check(readFile(result.path) == content, "Reassembled file is byte-identical");
            report.check(result.sha256 == referenceDigest, "Reported digest matches the content");
            report.check(result.totalBytes == SIZE && !result.resumed, "Result carries size and fresh-start flag");
            report.check(ranges.size() == 4 && servedRangeBytes(server) == SIZE, "Four ranged requests cover the file once");
            report.check(coordinator.job().supportsRanges && coordinator.job().threadCount == 4, "Job records range mode");
            report.check(!std::filesystem::exists(ResumeStore::sidecarPath(result.path)), "Sidecar removed after success");
            report.check(lastProgress == SIZE && lastSegmentsDone == 4, "Final progress snapshot reports completion");
            report.check(result.segmentRetries == std::vector<int>(4, 0), "No retries on a clean run");
        }

        // Test 2: sidecar says everything is done
        {
            auto dir = root / "all-done";
            std::filesystem::create_directories(dir);
            writeFile(dir / "payload.bin", content);
            auto segments = expectedPlan();
            for (auto &segment : segments)
            {
                segment.bytesWritten = segment.length();
                segment.status = SegmentStatus::Done;
            }
            ResumeStore::save(ResumeStore::sidecarPath(dir / "payload.bin"),
                              ResumeRecord::fromSegments(URL, SIZE, segments));

            FakeServer server(content);
            DownloadResult result = DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            report.check(result.resumed && server.rangedRequests().empty(), "Completed sidecar: no segment is fetched");
            report.check(result.sha256 == referenceDigest, "Completed sidecar: digest still computed");
            report.check(!std::filesystem::exists(ResumeStore::sidecarPath(result.path)), "Completed sidecar: removed");
        }

        // Test 3: sidecar for another URL is ignored
        {
            auto dir = root / "other-url";
            std::filesystem::create_directories(dir);
            writeFile(dir / "payload.bin", std::string(SIZE, 'x'));
            auto segments = expectedPlan();
            for (auto &segment : segments)
            {
                segment.bytesWritten = segment.length();
                segment.status = SegmentStatus::Done;
            }
            ResumeStore::save(ResumeStore::sidecarPath(dir / "payload.bin"),
                              ResumeRecord::fromSegments("https://example.com/other.bin", SIZE, segments));

            FakeServer server(content);
            DownloadResult result = DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            report.check(!result.resumed && servedRangeBytes(server) == SIZE, "Mismatched sidecar: restart from zero");
            report.check(readFile(result.path) == content, "Mismatched sidecar: stale bytes overwritten");
        }

        // Test 4: sidecar without its output file is stale
        {
            auto dir = root / "missing-output";
            std::filesystem::create_directories(dir);
            auto segments = expectedPlan();
            segments[0].bytesWritten = segments[0].length();
            segments[0].status = SegmentStatus::Done;
            ResumeStore::save(ResumeStore::sidecarPath(dir / "payload.bin"),
                              ResumeRecord::fromSegments(URL, SIZE, segments));

            FakeServer server(content);
            DownloadResult result = DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            report.check(!result.resumed && readFile(result.path) == content, "Missing output file: fresh download");
        }

        // Test 5: one segment exhausts its retries, the rest finish, rerun fetches only that one
        {
            auto dir = root / "segment-failure";
            auto plan = expectedPlan();
            FakeServer server(content);
            server.failRangeEndingAt(plan[1].end, 3);

            std::vector<std::size_t> failed;
            std::string message;
            try
            {
                DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            }
            catch (const SegmentDownloadError &e)
            {
                failed = e.failedIndices();
                message = e.what();
            }
            report.check(failed == std::vector<std::size_t>{1}, "SegmentDownloadError names segment 1 only");
            report.check(message.find("segment 1") != std::string::npos, "Error message mentions the failed segment");

            int attemptsOnFailed = 0;
            for (const auto &range : server.rangedRequests())
            {
                attemptsOnFailed += range.second == plan[1].end ? 1 : 0;
            }
            report.check(attemptsOnFailed == 3, "Failed segment was attempted exactly 3 times");

            auto output = dir / "payload.bin";
            auto record = ResumeStore::load(ResumeStore::sidecarPath(output), URL, SIZE);
            bool sidecarState = record && record->segments.size() == 4 &&
                                record->segments[0].status == SegmentStatus::Done &&
                                record->segments[1].status == SegmentStatus::Pending &&
                                record->segments[2].status == SegmentStatus::Done &&
                                record->segments[3].status == SegmentStatus::Done;
            report.check(sidecarState, "Sidecar keeps segments 0, 2 and 3 as done");
            report.check(std::filesystem::exists(output) && std::filesystem::file_size(output) == SIZE,
                         "Partial file kept at full size");

            server.clearFaults();
            server.resetCounters();
            DownloadResult result = DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            auto ranges = server.rangedRequests();
            report.check(result.resumed && ranges.size() == 1 && ranges[0].first == plan[1].start &&
                             ranges[0].second == plan[1].end,
                         "Rerun fetches only the failed segment");
            report.check(result.sha256 == referenceDigest && readFile(output) == content, "Resumed file is correct");
        }

        // Test 6: Ctrl+C midway, then resume
        {
            auto dir = root / "interrupt";
            auto plan = expectedPlan();
            FakeServer server(content);
            std::atomic<bool> interrupted{false};
            server.interruptAt(plan[3].end, 4096, &interrupted, 3);

            DownloadCoordinator coordinator(testConfig(dir), FakeTransport::factory(server));
            coordinator.setInterruptFlag(&interrupted);
            bool cancelled = false;
            try
            {
                coordinator.run();
            }
            catch (const CancelledError &)
            {
                cancelled = true;
            }
            report.check(cancelled, "Interrupt surfaces as CancelledError");

            auto output = dir / "payload.bin";
            auto record = ResumeStore::load(ResumeStore::sidecarPath(output), URL, SIZE);
            report.check(record && record->segments[0].isComplete() && record->segments[1].isComplete() &&
                             record->segments[2].isComplete() && !record->segments[3].isComplete(),
                         "Sidecar records the three finished segments");

            server.clearFaults();
            server.resetCounters();
            DownloadResult result = DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            report.check(server.bytesServed() == plan[3].length(), "Resume downloads only the interrupted segment");
            report.check(result.sha256 == referenceDigest, "Interrupted then resumed file is correct");
        }

        // Test 7: server without a length falls back to one stream and no sidecar
        {
            auto dir = root / "unknown-size";
            FakeServer server(content);
            server.sendContentLength = false;
            server.acceptRanges = false;
            DownloadCoordinator coordinator(testConfig(dir), FakeTransport::factory(server));
            DownloadResult result = coordinator.run();
            report.check(!coordinator.job().totalSize && coordinator.job().threadCount == 1,
                         "Unknown size: single-stream job");
            report.check(result.totalBytes == SIZE && readFile(result.path) == content, "Unknown size: full content");
            report.check(!std::filesystem::exists(ResumeStore::sidecarPath(result.path)), "Unknown size: no sidecar");
        }

        // Test 8: known size without range support
        {
            auto dir = root / "no-ranges";
            FakeServer server(content);
            server.acceptRanges = false;
            DownloadCoordinator coordinator(testConfig(dir), FakeTransport::factory(server));
            DownloadResult result = coordinator.run();
            report.check(!coordinator.job().supportsRanges && coordinator.job().threadCount == 1,
                         "No ranges: thread count forced to 1");
            report.check(result.segmentRetries.size() == 1 && result.sha256 == referenceDigest,
                         "No ranges: one segment, correct file");
        }

        // Test 9: a 4xx on a segment is not retried
        {
            auto dir = root / "permanent";
            auto plan = expectedPlan();
            FakeServer server(content);
            server.failRangeWithStatus(plan[2].end, 403);
            std::vector<std::size_t> failed;
            try
            {
                DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            }
            catch (const SegmentDownloadError &e)
            {
                failed = e.failedIndices();
            }
            int attempts = 0;
            for (const auto &range : server.rangedRequests())
            {
                attempts += range.second == plan[2].end ? 1 : 0;
            }
            report.check(failed == std::vector<std::size_t>{2} && attempts == 1, "HTTP 403 fails the segment at once");
        }

        // Test 10: a dropped connection resumes inside the segment
        {
            auto dir = root / "partial-retry";
            auto plan = expectedPlan();
            FakeServer server(content);
            server.failRangeEndingAt(plan[0].end, 1, 5000);
            DownloadResult result = DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();

            bool continued = false;
            for (const auto &range : server.rangedRequests())
            {
                continued = continued || (range.first == plan[0].start + 5000 && range.second == plan[0].end);
            }
            report.check(continued, "Retry asks only for the missing tail of the segment");
            report.check(result.segmentRetries[0] == 1 && result.sha256 == referenceDigest,
                         "Retry is counted and the file is correct");
        }

        // Test 11: Content-Disposition picks the file name
        {
            auto dir = root / "disposition";
            FakeServer server(content);
            server.contentDisposition = "attachment; filename=\"named.bin\"";
            DownloadResult result = DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            report.check(result.path == dir / "named.bin", "Server-suggested file name is used");
        }

        // Test 12: negotiation errors propagate untouched
        {
            auto dir = root / "not-found";
            FakeServer server(content);
            server.headStatus = 404;
            server.getStatus = 404;
            long status = 0;
            try
            {
                DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            }
            catch (const HttpStatusError &e)
            {
                status = e.statusCode();
            }
            report.check(status == 404 && !std::filesystem::exists(dir / "payload.bin"),
                         "404 fails before any file is created");
        }

        // Test 13: server drops range support between runs
        {
            auto dir = root / "ranges-lost";
            auto plan = expectedPlan();
            FakeServer server(content);
            server.failRangeEndingAt(plan[1].end, 3);
            bool firstFailed = false;
            try
            {
                DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            }
            catch (const SegmentDownloadError &)
            {
                firstFailed = true;
            }

            server.clearFaults();
            server.acceptRanges = false;
            DownloadCoordinator coordinator(testConfig(dir), FakeTransport::factory(server));
            DownloadResult result = coordinator.run();
            report.check(firstFailed && !result.resumed && coordinator.job().threadCount == 1,
                         "Multi-segment sidecar is dropped when ranges are no longer supported");
            report.check(readFile(result.path) == content &&
                             !std::filesystem::exists(ResumeStore::sidecarPath(result.path)),
                         "Single-stream restart completes the file");
        }

        // Test 14: an exception from the progress callback unwinds cleanly
        {
            auto dir = root / "throwing-callback";
            FakeServer server(content);
            DownloadCoordinator coordinator(testConfig(dir), FakeTransport::factory(server));
            coordinator.setProgressCallback([](const ProgressSnapshot &)
                                            { throw std::runtime_error("progress sink closed"); });
            std::string caught;
            try
            {
                coordinator.run();
            }
            catch (const std::runtime_error &e)
            {
                caught = e.what();
            }
            report.check(caught == "progress sink closed", "Callback exception reaches the caller after workers stop");
            report.check(std::filesystem::exists(ResumeStore::sidecarPath(dir / "payload.bin")),
                         "Sidecar kept after the callback failure");

            DownloadResult result = DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            report.check(result.resumed && readFile(result.path) == content, "Next run resumes and completes");
        }

        // Test 15: an existing file that is not an unfinished download is left alone
        {
            auto dir = root / "existing";
            std::filesystem::create_directories(dir);
            writeFile(dir / "payload.bin", "keep me");
            FakeServer server(content);
            bool refused = false;
            try
            {
                DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            }
            catch (const FileWriteError &e)
            {
                refused = e.component() == "DownloadCoordinator";
            }
            report.check(refused && readFile(dir / "payload.bin") == "keep me" && server.getCalls() == 0,
                         "Existing file without sidecar is not overwritten");

            auto config = testConfig(dir);
            config.overwrite = true;
            DownloadResult result = DownloadCoordinator(config, FakeTransport::factory(server)).run();
            report.check(readFile(result.path) == content, "Overwrite option replaces the existing file");
        }

        // Test 16: interrupt raised before negotiation
        {
            auto dir = root / "interrupt-early";
            FakeServer server(content);
            std::atomic<bool> interrupted{true};
            DownloadCoordinator coordinator(testConfig(dir), FakeTransport::factory(server));
            coordinator.setInterruptFlag(&interrupted);
            bool cancelled = false;
            try
            {
                coordinator.run();
            }
            catch (const CancelledError &)
            {
                cancelled = true;
            }
            report.check(cancelled && server.getCalls() == 0 && !std::filesystem::exists(dir / "payload.bin"),
                         "Interrupt stops negotiation before any file is created");
        }

        // Test 17: interrupt after the last segment, before hashing
        {
            auto dir = root / "interrupt-late";
            FakeServer server(content);
            std::atomic<bool> interrupted{false};
            DownloadCoordinator coordinator(testConfig(dir), FakeTransport::factory(server));
            coordinator.setInterruptFlag(&interrupted);
            coordinator.setProgressCallback([&interrupted](const ProgressSnapshot &snapshot)
                                            {
                if (snapshot.segmentsDone == snapshot.segmentCount)
                {
                    interrupted.store(true);
                } });
            bool cancelled = false;
            try
            {
                coordinator.run();
            }
            catch (const CancelledError &)
            {
                cancelled = true;
            }
            auto sidecar = ResumeStore::sidecarPath(dir / "payload.bin");
            report.check(cancelled && std::filesystem::exists(sidecar), "Late interrupt keeps the sidecar");

            server.resetCounters();
            DownloadResult result = DownloadCoordinator(testConfig(dir), FakeTransport::factory(server)).run();
            report.check(result.resumed && server.rangedRequests().empty() && result.sha256 == referenceDigest,
                         "Rerun after a late interrupt only verifies the file");
        }
    }
    catch (const std::exception &e)
    {
        fmt::print(stderr, "❌ Error: {}\n", e.what());
        return 1;
    }

    std::filesystem::remove_all(root);
    return report.finish();
}
