#include "segment.hpp"

#include <algorithm>

std::string toString(SegmentStatus status)
{
    switch (status)
    {
    case SegmentStatus::Pending:
        return "pending";
    case SegmentStatus::InProgress:
        return "in progress";
    case SegmentStatus::Done:
        return "done";
    case SegmentStatus::Failed:
        return "failed";
    }
    return "unknown";
}

std::vector<Segment> SegmentPlanner::plan(std::uint64_t totalSize, int threads, std::uint64_t minSegmentSize)
{
    std::vector<Segment> segments;
    if (totalSize == 0)
    {
        return segments;
    }

    std::uint64_t count = static_cast<std::uint64_t>(std::max(threads, 1));
    if (minSegmentSize > 0)
    {
        count = std::min(count, totalSize / minSegmentSize);
    }
    count = std::max<std::uint64_t>(count, 1);

    const std::uint64_t segmentSize = (totalSize + count - 1) / count;

    std::uint64_t offset = 0;
    for (std::uint64_t i = 0; i < count && offset < totalSize; ++i)
    {
        Segment segment;
        segment.index = segments.size();
        segment.start = offset;

        // Last segment absorbs the remainder
        std::uint64_t size = (i == count - 1) ? totalSize - offset : std::min(segmentSize, totalSize - offset);
        segment.end = offset + size - 1;

        segments.push_back(segment);
        offset += size;
    }

    return segments;
}

std::vector<Segment> SegmentPlanner::planSingle(std::uint64_t totalSize)
{
    if (totalSize == 0)
    {
        return {};
    }
    Segment segment;
    segment.end = totalSize - 1;
    return {segment};
}

std::vector<Segment> SegmentPlanner::planOpenEnded()
{
    Segment segment;
    segment.openEnded = true;
    return {segment};
}

bool SegmentPlanner::isPartition(const std::vector<Segment> &segments, std::uint64_t totalSize)
{
    std::uint64_t expectedStart = 0;
    for (size_t i = 0; i < segments.size(); ++i)
    {
        const Segment &segment = segments[i];
        if (segment.openEnded || segment.index != i || segment.start != expectedStart || segment.end < segment.start)
        {
            return false;
        }
        expectedStart = segment.end + 1;
    }
    return expectedStart == totalSize;
}
