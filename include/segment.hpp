#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

enum class SegmentStatus
{
    Pending,
    InProgress,
    Done,
    Failed
};

std::string toString(SegmentStatus status);

/**
 * A contiguous byte range [start, end] of the target file, assigned to one worker.
 *
 * Only the worker that owns the segment mutates it while it runs; the
 * coordinator reads it after the worker signals completion.
 */
struct Segment
{
    std::size_t index = 0;
    std::uint64_t start = 0;
    std::uint64_t end = 0; // Inclusive; an openEnded segment gets it when the body ends
    std::uint64_t bytesWritten = 0;
    SegmentStatus status = SegmentStatus::Pending;
    int retries = 0;

    // Unknown-size stream: the segment runs until the server closes the body
    bool openEnded = false;

    std::uint64_t length() const { return end - start + 1; }
    std::uint64_t remaining() const { return openEnded ? 0 : length() - bytesWritten; }
    bool isComplete() const { return !openEnded && bytesWritten == length(); }
};

/**
 * Divides a file into contiguous, non-overlapping segments.
 */
class SegmentPlanner
{
public:
    static constexpr std::uint64_t DEFAULT_MIN_SEGMENT_SIZE = 64 * 1024;

    /**
     * Split [0, totalSize) into at most `threads` segments.
     *
     * Effective count is min(threads, totalSize / minSegmentSize), at least 1.
     * Every segment is ceil(totalSize / count) bytes except the last, which
     * takes the remainder; empty segments are dropped. totalSize 0 gives no
     * segments. Same inputs always give the same partition.
     */
    static std::vector<Segment> plan(std::uint64_t totalSize, int threads,
                                     std::uint64_t minSegmentSize = DEFAULT_MIN_SEGMENT_SIZE);

    // One segment covering the whole known-size file (server without range support)
    static std::vector<Segment> planSingle(std::uint64_t totalSize);

    // One open-ended segment for a stream of unknown length
    static std::vector<Segment> planOpenEnded();

    /**
     * True when segments are ordered by index and cover [0, totalSize)
     * exactly, with no gaps, overlaps or empty ranges.
     */
    static bool isPartition(const std::vector<Segment> &segments, std::uint64_t totalSize);
};
