#pragma once

#include <atomic>
#include <cstdint>
#include <string>

#include "http_client.hpp"
#include "output_file.hpp"
#include "segment.hpp"

/**
 * Bounded retry with exponential backoff.
 * Attempt n waits initialDelayMs * 2^(n-1) (+/-20% jitter) before attempt n+1.
 */
struct RetryPolicy
{
    int maxAttempts = 3;
    int initialDelayMs = 1000;
};

/**
 * Downloads one segment straight into its slice of the shared output file.
 *
 * The worker requests [start + bytesWritten, end], writes every chunk at
 * start + bytesWritten and advances bytesWritten as data arrives. Transient
 * failures (network errors, stalls, 5xx, short bodies) are retried from the
 * current in-memory position; permanent ones (4xx, a server ignoring Range)
 * fail the segment at once.
 *
 * Without range support the whole file is fetched with a plain GET, and a
 * retry restarts from byte 0.
 */
class SegmentWorker
{
public:
    enum class Outcome
    {
        Done,
        Failed,
        Cancelled
    };

    /**
     * @param transport  Used by this worker only
     * @param file       Shared, pre-sized output file
     * @param cancel     Set by the coordinator on user interrupt
     * @param progress   Bytes received by all workers in this run
     */
    SegmentWorker(HttpTransport &transport,
                  OutputFile &file,
                  std::string url,
                  bool supportsRanges,
                  RetryPolicy policy,
                  const std::atomic<bool> &cancel,
                  std::atomic<std::uint64_t> &progress);

    /**
     * Run the segment to a terminal state.
     * On Done the segment is complete; on Failed lastError() holds the cause;
     * on Cancelled the segment is left InProgress.
     * @throws FileWriteError if the local file cannot be written
     */
    Outcome run(Segment &segment);

    std::string getLastError() const { return lastError_; }

private:
    enum class AttemptResult
    {
        Complete,
        Transient,
        Permanent,
        Cancelled
    };

    HttpTransport &transport_;
    OutputFile &file_;
    std::string url_;
    bool supportsRanges_;
    RetryPolicy policy_;
    const std::atomic<bool> &cancel_;
    std::atomic<std::uint64_t> &progress_;

    std::string lastError_;

    AttemptResult attempt(Segment &segment);

    // Drop in-memory progress when the server cannot resume mid-file
    void restartFromZero(Segment &segment);

    // Sleep for the backoff delay, waking early on cancellation
    bool waitBeforeRetry(int attemptNumber);

    static bool isTransientStatus(long statusCode);
};
