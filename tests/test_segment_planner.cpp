#include "segment.hpp"
#include "test_support.hpp"

#include <vector>

namespace
{
    std::vector<std::uint64_t> lengths(const std::vector<Segment> &segments)
    {
        std::vector<std::uint64_t> result;
        for (const auto &segment : segments)
        {
            result.push_back(segment.length());
        }
        return result;
    }
} // namespace

int main()
{
    TestReport report;

    // Test 1: 1,000,000 bytes over 4 threads
    auto even = SegmentPlanner::plan(1000000, 4);
    report.check(lengths(even) == std::vector<std::uint64_t>{250000, 250000, 250000, 250000},
                 "1,000,000 bytes / 4 threads gives 4 x 250,000");

    // Test 2: tiny file collapses to one segment
    auto tiny = SegmentPlanner::plan(10, 8);
    report.check(tiny.size() == 1 && tiny[0].start == 0 && tiny[0].end == 9,
                 "10 bytes / 8 threads gives one 10-byte segment");

    // Test 3: last segment absorbs the remainder
    auto uneven = SegmentPlanner::plan(10, 4, 1);
    report.check(lengths(uneven) == std::vector<std::uint64_t>{3, 3, 3, 1}, "10 bytes / 4 threads gives 3,3,3,1");

    // Test 4: empty trailing segments are dropped
    auto dropped = SegmentPlanner::plan(9, 4, 1);
    report.check(lengths(dropped) == std::vector<std::uint64_t>{3, 3, 3}, "9 bytes / 4 threads drops the empty segment");

    // Test 5: more threads than bytes
    auto clamped = SegmentPlanner::plan(3, 8, 1);
    report.check(clamped.size() == 3, "3 bytes / 8 threads gives 3 one-byte segments");

    // Test 6: degenerate inputs
    report.check(SegmentPlanner::plan(0, 4).empty(), "Empty file has no segments");
    report.check(SegmentPlanner::plan(1000, 0, 1).size() == 1, "Zero threads is treated as one");
    report.check(SegmentPlanner::plan(1000, -3, 1).size() == 1, "Negative threads is treated as one");

    // Test 7: partition property over a grid of sizes and thread counts
    bool allPartitions = true;
    bool neverEmpty = true;
    bool boundedCount = true;
    const std::vector<std::uint64_t> sizes = {1, 2, 3, 7, 10, 63, 64, 65, 1000, 4096, 65535, 65536, 65537,
                                              1000000, 1048576, 10000019, 5000000000ULL};
    for (std::uint64_t size : sizes)
    {
        for (int threads = 1; threads <= 33; ++threads)
        {
            for (std::uint64_t minSegment : {std::uint64_t{1}, SegmentPlanner::DEFAULT_MIN_SEGMENT_SIZE})
            {
                auto segments = SegmentPlanner::plan(size, threads, minSegment);
                if (!SegmentPlanner::isPartition(segments, size))
                {
                    allPartitions = false;
                    fmt::print("  not a partition: size={} threads={} min={}\n", size, threads, minSegment);
                }
                for (const auto &segment : segments)
                {
                    if (segment.end < segment.start)
                    {
                        neverEmpty = false;
                    }
                }
                if (segments.empty() || segments.size() > static_cast<std::size_t>(threads))
                {
                    boundedCount = false;
                }
            }
        }
    }
    report.check(allPartitions, "Segments are contiguous and cover [0, size) exactly");
    report.check(neverEmpty, "No zero-length segments");
    report.check(boundedCount, "Between 1 and `threads` segments");

    // Test 8: determinism
    auto a = SegmentPlanner::plan(123456789, 7);
    auto b = SegmentPlanner::plan(123456789, 7);
    bool same = a.size() == b.size();
    for (std::size_t i = 0; same && i < a.size(); ++i)
    {
        same = a[i].start == b[i].start && a[i].end == b[i].end && a[i].index == b[i].index;
    }
    report.check(same, "Same (size, threads) always yields the same boundaries");

    // Test 9: fresh segments start Pending with nothing written
    bool fresh = true;
    for (const auto &segment : a)
    {
        fresh = fresh && segment.status == SegmentStatus::Pending && segment.bytesWritten == 0;
    }
    report.check(fresh, "Planned segments are Pending with zero bytes written");

    // Test 10: isPartition rejects gaps and overlaps
    auto gap = SegmentPlanner::plan(100, 4, 1);
    gap[1].end -= 1;
    report.check(!SegmentPlanner::isPartition(gap, 100), "Gap is detected");
    auto overlap = SegmentPlanner::plan(100, 4, 1);
    overlap[2].start -= 1;
    report.check(!SegmentPlanner::isPartition(overlap, 100), "Overlap is detected");
    report.check(!SegmentPlanner::isPartition(SegmentPlanner::plan(100, 4, 1), 101), "Short coverage is detected");

    // Test 11: single and open-ended plans
    auto single = SegmentPlanner::planSingle(500);
    report.check(single.size() == 1 && single[0].length() == 500, "Single-stream plan covers the whole file");
    auto open = SegmentPlanner::planOpenEnded();
    report.check(open.size() == 1 && open[0].openEnded, "Unknown size gives one open-ended segment");

    return report.finish();
}
