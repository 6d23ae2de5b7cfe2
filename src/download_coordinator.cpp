#include "download_coordinator.hpp"

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <new>
#include <system_error>
#include <thread>

#include <fmt/core.h>

#include "checksum.hpp"
#include "errors.hpp"
#include "format.hpp"
#include "output_file.hpp"
#include "paths.hpp"
#include "resume_store.hpp"
#include "segment_worker.hpp"

namespace
{
    constexpr int DEFAULT_THREADS = 8;
    constexpr auto PROGRESS_INTERVAL = std::chrono::milliseconds(200);

    /**
     * Segment worker threads. Destroying a pool that was not joined (the
     * coordinator is unwinding) cancels the workers and waits for them.
     */
    class WorkerPool
    {
    public:
        explicit WorkerPool(std::atomic<bool> &cancel) : cancel_(cancel) {}

        ~WorkerPool()
        {
            if (!threads_.empty())
            {
                cancel_.store(true, std::memory_order_relaxed);
                join();
            }
        }

        WorkerPool(const WorkerPool &) = delete;
        WorkerPool &operator=(const WorkerPool &) = delete;

        template <typename Body>
        void start(std::size_t count, const Body &body)
        {
            threads_.reserve(count);
            for (std::size_t i = 0; i < count; ++i)
            {
                threads_.emplace_back(body);
            }
        }

        void join()
        {
            for (auto &thread : threads_)
            {
                if (thread.joinable())
                {
                    thread.join();
                }
            }
            threads_.clear();
        }

    private:
        std::atomic<bool> &cancel_;
        std::vector<std::thread> threads_;
    };
} // namespace

// Sent by a worker thread when a segment reaches a terminal state
struct DownloadCoordinator::CompletionEvent
{
    std::size_t segmentIndex = 0;
    SegmentWorker::Outcome outcome = SegmentWorker::Outcome::Failed;
    std::string error;
    std::exception_ptr fatal; // Local disk failure or transport construction failure
};

DownloadCoordinator::DownloadCoordinator(DownloadConfig config, TransportFactory factory)
    : config_(std::move(config)), factory_(std::move(factory))
{
    if (!factory_)
    {
        HttpClient::Options options;
        options.connectTimeoutSeconds = config_.connectTimeoutSeconds;
        options.readTimeoutSeconds = config_.readTimeoutSeconds;
        options.maxRedirects = config_.maxRedirects;
        factory_ = HttpClient::factory(options);
    }
}

bool DownloadCoordinator::interrupted() const
{
    return cancel_.load(std::memory_order_relaxed) ||
           (interruptFlag_ && interruptFlag_->load(std::memory_order_relaxed));
}

const std::atomic<bool> *DownloadCoordinator::requestCancelFlag() const
{
    return interruptFlag_ ? interruptFlag_ : &cancel_;
}

void DownloadCoordinator::log(const std::string &message) const
{
    if (!config_.quiet)
    {
        fmt::print("{}\n", message);
    }
}

void DownloadCoordinator::buildJob(const RemoteInfo &remote)
{
    job_.url = config_.url;
    job_.effectiveUrl = remote.effectiveUrl;
    job_.totalSize = remote.totalSize;
    job_.supportsRanges = remote.supportsRanges && remote.totalSize.has_value();
    job_.threadCount = std::max(config_.threads, 1);

    if (!job_.supportsRanges)
    {
        job_.threadCount = 1;
        log("Server does not support ranged downloads. Using single-stream mode.");
    }
    if (!job_.totalSize)
    {
        log("Server did not report a file size; this download cannot be resumed if interrupted.");
    }

    std::filesystem::path directory = config_.outputDirectory.empty()
                                          ? defaultDownloadDirectory()
                                          : std::filesystem::path(config_.outputDirectory);
    ensureDirectoryExists(directory);

    std::string fileName = remote.suggestedFileName ? *remote.suggestedFileName : fileNameFromUrl(config_.url);
    job_.outputPath = directory / fileName;
}

void DownloadCoordinator::checkOverwrite(bool sidecarPresent) const
{
    std::error_code ec;
    if (config_.overwrite || sidecarPresent || !std::filesystem::exists(job_.outputPath, ec))
    {
        return;
    }
    throw FileWriteError("DownloadCoordinator",
                         fmt::format("File {} already exists; use --force to overwrite it",
                                     job_.outputPath.string()));
}

std::vector<Segment> DownloadCoordinator::prepareSegments(const std::filesystem::path &sidecar, bool &resumed)
{
    resumed = false;

    // A sidecar marks the output as our own unfinished download
    std::error_code ec;
    const bool sidecarPresent = std::filesystem::exists(sidecar, ec);
    checkOverwrite(sidecarPresent);

    if (!job_.totalSize)
    {
        // Unknown length: a partial stream cannot be matched to an offset, always restart
        ResumeStore::clear(sidecar);
        return SegmentPlanner::planOpenEnded();
    }

    const std::uint64_t totalSize = *job_.totalSize;

    // The sidecar only means something if the pre-sized file it describes is still there
    bool outputIntact = std::filesystem::exists(job_.outputPath, ec) &&
                        std::filesystem::file_size(job_.outputPath, ec) == totalSize && !ec;

    if (outputIntact)
    {
        auto record = ResumeStore::load(sidecar, job_.url, totalSize);
        if (record && !job_.supportsRanges && record->segments.size() > 1)
        {
            // Segments past the first can only be fetched with Range requests
            fmt::print(stderr, "Warning: Server no longer supports ranged downloads; discarding {}-segment "
                               "resume state and restarting in single-stream mode.\n",
                       record->segments.size());
            ResumeStore::clear(sidecar);
            record.reset();
        }
        if (record)
        {
            resumed = true;
            std::size_t done = static_cast<std::size_t>(
                std::count_if(record->segments.begin(), record->segments.end(),
                              [](const Segment &segment)
                              { return segment.isComplete(); }));
            log(fmt::format("Resuming download: {} of {} segments already complete.",
                            done, record->segments.size()));
            return record->segments;
        }
    }
    else if (sidecarPresent)
    {
        fmt::print(stderr, "Warning: Output file {} is missing or has the wrong size. Starting fresh download.\n",
                   job_.outputPath.string());
        ResumeStore::clear(sidecar);
    }

    if (!job_.supportsRanges)
    {
        return SegmentPlanner::planSingle(totalSize);
    }

    auto segments = SegmentPlanner::plan(totalSize, job_.threadCount, config_.minSegmentSize);
    log(fmt::format("Server supports ranged downloads. Splitting {} into {} segments.",
                    formatBytes(totalSize), segments.size()));
    return segments;
}

void DownloadCoordinator::publishProgress(const std::vector<Segment> &persisted, std::uint64_t bytesDone) const
{
    if (!progressCallback_)
    {
        return;
    }

    ProgressSnapshot snapshot;
    snapshot.bytesDone = bytesDone;
    snapshot.totalBytes = job_.totalSize;
    snapshot.segmentCount = persisted.size();
    snapshot.segmentsDone = static_cast<std::size_t>(
        std::count_if(persisted.begin(), persisted.end(), [](const Segment &segment)
                      { return segment.status == SegmentStatus::Done; }));
    snapshot.elapsed = std::chrono::steady_clock::now() - startTime_;
    progressCallback_(snapshot);
}

DownloadResult DownloadCoordinator::run()
{
    startTime_ = std::chrono::steady_clock::now();
    cancel_.store(false, std::memory_order_relaxed);

    // 1. Negotiate size and range support
    RemoteInfo remote;
    {
        auto probeTransport = factory_();
        RangeNegotiator negotiator(*probeTransport, requestCancelFlag());
        remote = negotiator.negotiate(config_.url);
    }
    buildJob(remote);
    log(fmt::format("Saving to {}", job_.outputPath.string()));

    // 2. Resume state or a fresh plan
    const std::filesystem::path sidecar = ResumeStore::sidecarPath(job_.outputPath);
    bool resumed = false;
    std::vector<Segment> segments = prepareSegments(sidecar, resumed);

    // What the sidecar says; only the coordinator thread reads or writes it
    std::vector<Segment> persisted = segments;
    for (auto &segment : segments)
    {
        segment.retries = 0;
        if (segment.status != SegmentStatus::Done)
        {
            segment.status = SegmentStatus::Pending;
        }
    }

    std::vector<std::size_t> pending;
    std::uint64_t alreadyDone = 0;
    for (const auto &segment : segments)
    {
        alreadyDone += segment.bytesWritten;
        if (segment.status != SegmentStatus::Done)
        {
            pending.push_back(segment.index);
        }
    }

    std::vector<SegmentDownloadError::Failure> failures;
    std::exception_ptr fatal;

    {
        // 3. Pre-size the output file
        OutputFile file(job_.outputPath);
        if (job_.totalSize)
        {
            if (!resumed)
            {
                file.resize(0);
            }
            file.resize(*job_.totalSize);
        }
        else
        {
            file.resize(0);
        }

        if (job_.totalSize && !pending.empty())
        {
            ResumeStore::save(sidecar, ResumeRecord::fromSegments(job_.url, *job_.totalSize, persisted));
        }

        // 4. Worker pool, bounded by the thread count
        std::atomic<std::uint64_t> progress{alreadyDone};
        std::atomic<std::size_t> nextPending{0};
        std::mutex eventMutex;
        std::condition_variable eventReady;
        std::deque<CompletionEvent> events;
        std::atomic<std::size_t> lostEvents{0};

        RetryPolicy policy;
        policy.maxAttempts = config_.maxAttempts;
        policy.initialDelayMs = config_.retryDelayMs;

        auto workerLoop = [&]()
        {
            std::unique_ptr<HttpTransport> transport;
            for (;;)
            {
                std::size_t slot = nextPending.fetch_add(1);
                if (slot >= pending.size())
                {
                    return;
                }

                Segment &segment = segments[pending[slot]];
                CompletionEvent event;
                event.segmentIndex = segment.index;

                if (cancel_.load(std::memory_order_relaxed))
                {
                    event.outcome = SegmentWorker::Outcome::Cancelled;
                }
                else
                {
                    try
                    {
                        if (!transport)
                        {
                            transport = factory_();
                        }
                        SegmentWorker worker(*transport, file, job_.url, job_.supportsRanges, policy, cancel_, progress);
                        event.outcome = worker.run(segment);
                        event.error = worker.getLastError();
                    }
                    catch (...)
                    {
                        // Fatal for the whole job: stop the siblings and hand it to the coordinator
                        event.fatal = std::current_exception();
                        cancel_.store(true, std::memory_order_relaxed);
                    }
                }

                try
                {
                    std::lock_guard<std::mutex> lock(eventMutex);
                    events.push_back(std::move(event));
                }
                catch (const std::bad_alloc &)
                {
                    // The segment's state is unknown to the coordinator; give up on the job
                    cancel_.store(true, std::memory_order_relaxed);
                    lostEvents.fetch_add(1);
                }
                eventReady.notify_one();
            }
        };

        // Declared after everything the workers touch, so it is joined first on unwind
        WorkerPool pool(cancel_);
        pool.start(std::min<std::size_t>(static_cast<std::size_t>(job_.threadCount), pending.size()), workerLoop);

        // 5. Collect completions; persist after each finished segment
        std::size_t terminal = 0;
        while (terminal + lostEvents.load() < pending.size())
        {
            std::deque<CompletionEvent> batch;
            {
                std::unique_lock<std::mutex> lock(eventMutex);
                eventReady.wait_for(lock, PROGRESS_INTERVAL, [&]()
                                    { return !events.empty(); });
                batch.swap(events);
            }

            if (interrupted())
            {
                cancel();
            }

            for (auto &event : batch)
            {
                ++terminal;
                Segment &segment = segments[event.segmentIndex];

                if (event.fatal)
                {
                    if (!fatal)
                    {
                        fatal = event.fatal;
                    }
                    continue;
                }

                switch (event.outcome)
                {
                case SegmentWorker::Outcome::Done:
                    persisted[event.segmentIndex] = segment;
                    if (job_.totalSize)
                    {
                        try
                        {
                            file.sync();
                            ResumeStore::save(sidecar, ResumeRecord::fromSegments(job_.url, *job_.totalSize, persisted));
                        }
                        catch (const DownloadError &)
                        {
                            if (!fatal)
                            {
                                fatal = std::current_exception();
                            }
                            cancel();
                        }
                    }
                    break;

                case SegmentWorker::Outcome::Failed:
                    persisted[event.segmentIndex].status = SegmentStatus::Failed;
                    failures.push_back({event.segmentIndex, event.error});
                    fmt::print(stderr, "Segment {} failed: {}\n", event.segmentIndex, event.error);
                    break;

                case SegmentWorker::Outcome::Cancelled:
                    break;
                }
            }

            publishProgress(persisted, progress.load(std::memory_order_relaxed));
        }

        pool.join();

        // 6. Terminal states reached; decide the job's fate
        if (fatal)
        {
            std::rethrow_exception(fatal);
        }
        if (!failures.empty())
        {
            std::sort(failures.begin(), failures.end(), [](const auto &a, const auto &b)
                      { return a.index < b.index; });
            throw SegmentDownloadError(job_.url, std::move(failures));
        }
        if (lostEvents.load() > 0)
        {
            throw DownloadError("DownloadCoordinator",
                                fmt::format("Lost the completion report of {} segment(s)", lostEvents.load()));
        }
        if (interrupted())
        {
            throw CancelledError();
        }

        // Reassembly check: every byte accounted for and the file at its final length
        if (job_.totalSize)
        {
            for (const auto &segment : segments)
            {
                if (!segment.isComplete())
                {
                    throw FileWriteError("DownloadCoordinator",
                                         fmt::format("Segment {} is {} with {} of {} bytes",
                                                     segment.index, toString(segment.status),
                                                     segment.bytesWritten, segment.length()));
                }
            }
            if (file.size() != *job_.totalSize)
            {
                throw FileWriteError("DownloadCoordinator",
                                     fmt::format("File size mismatch: expected {} but got {}",
                                                 formatBytes(*job_.totalSize), formatBytes(file.size())));
            }
        }
        file.sync();
    }

    // 7. Hash, then drop the sidecar as the signal of a verified download
    log("Verifying file integrity...");
    DownloadResult result;
    result.path = job_.outputPath;
    result.totalBytes = job_.totalSize ? *job_.totalSize : segments.front().bytesWritten;
    result.sha256 = ChecksumVerifier::computeSHA256(job_.outputPath, [this]()
                                                    { return interrupted(); });
    result.resumed = resumed;
    for (const auto &segment : segments)
    {
        result.segmentRetries.push_back(segment.retries);
    }

    ResumeStore::clear(sidecar);

    result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startTime_);
    return result;
}

DownloadResult runDownload(const std::string &url, const std::string &outputDir, int threadCount)
{
    DownloadConfig config;
    config.url = url;
    config.outputDirectory = outputDir;
    config.threads = threadCount <= 0 ? DEFAULT_THREADS : threadCount;

    DownloadCoordinator coordinator(config);
    return coordinator.run();
}
