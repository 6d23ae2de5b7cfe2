#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "http_client.hpp"
#include "range_negotiator.hpp"
#include "segment.hpp"

/**
 * One download, as settled by negotiation. Not modified afterwards.
 */
struct DownloadJob
{
    std::string url;
    std::string effectiveUrl;
    std::filesystem::path outputPath;
    std::optional<std::uint64_t> totalSize;
    int threadCount = 1;
    bool supportsRanges = false;
};

/**
 * Minimal status signal published while segments are running.
 */
struct ProgressSnapshot
{
    std::uint64_t bytesDone = 0;
    std::optional<std::uint64_t> totalBytes;
    std::size_t segmentsDone = 0;
    std::size_t segmentCount = 0;
    std::chrono::steady_clock::duration elapsed{};
};

using ProgressCallback = std::function<void(const ProgressSnapshot &)>;

struct DownloadResult
{
    std::filesystem::path path;
    std::uint64_t totalBytes = 0;
    std::chrono::milliseconds elapsed{0};
    std::string sha256;
    std::vector<int> segmentRetries; // Retries of this run, by segment index
    bool resumed = false;            // Started from a resume sidecar
};

/**
 * Drives a segmented download from negotiation to verified file.
 *
 * The coordinator thread is the only one that touches the resume sidecar.
 * Worker threads each own one segment at a time and report back through a
 * completion queue; on every successful segment the coordinator flushes the
 * output file and rewrites the sidecar. A failed segment does not stop its
 * siblings. The job fails once every segment has reached a terminal state,
 * leaving the partial file and the sidecar behind for a later resume.
 */
class DownloadCoordinator
{
public:
    /**
     * @param factory Creates one transport per worker (and one for the probe).
     *                Defaults to libcurl clients configured from `config`.
     */
    explicit DownloadCoordinator(DownloadConfig config, TransportFactory factory = {});

    void setProgressCallback(ProgressCallback callback) { progressCallback_ = std::move(callback); }

    /**
     * Watch an external flag (e.g. set from a signal handler); when it turns
     * true the download is cancelled as if cancel() had been called.
     */
    void setInterruptFlag(const std::atomic<bool> *flag) { interruptFlag_ = flag; }

    // Ask all workers to stop. Safe from any thread.
    void cancel() { cancel_.store(true, std::memory_order_relaxed); }

    /**
     * Run the whole download.
     *
     * @throws UnreachableError, HttpStatusError, TooManyRedirectsError from negotiation
     * @throws SegmentDownloadError when segments exhausted their retries
     * @throws CancelledError after cancel() or the interrupt flag
     * @throws FileReadError, FileWriteError on local disk problems, or when the
     *         output file exists without a sidecar and overwriting is off
     */
    DownloadResult run();

    // Valid once run() got past negotiation
    const DownloadJob &job() const { return job_; }

private:
    struct CompletionEvent;

    DownloadConfig config_;
    TransportFactory factory_;
    ProgressCallback progressCallback_;
    const std::atomic<bool> *interruptFlag_ = nullptr;
    std::atomic<bool> cancel_{false};

    DownloadJob job_;
    std::chrono::steady_clock::time_point startTime_;

    void log(const std::string &message) const;

    // cancel() was called or the interrupt flag is up
    bool interrupted() const;

    // Flag handed to requests made on the coordinator thread (negotiation)
    const std::atomic<bool> *requestCancelFlag() const;

    // Refuse to clobber an existing file that is not an unfinished download of ours
    void checkOverwrite(bool sidecarPresent) const;

    // Resolve output path, size and thread count from the server's answer
    void buildJob(const RemoteInfo &remote);

    /**
     * Segment table for this run: the sidecar's when it is usable,
     * otherwise a fresh plan. Sets `resumed`.
     */
    std::vector<Segment> prepareSegments(const std::filesystem::path &sidecar, bool &resumed);

    void publishProgress(const std::vector<Segment> &persisted, std::uint64_t bytesDone) const;
};

/**
 * Invocation contract for front ends.
 * Empty outputDir means the platform Downloads folder; threadCount <= 0 means 8.
 */
DownloadResult runDownload(const std::string &url, const std::string &outputDir, int threadCount);
