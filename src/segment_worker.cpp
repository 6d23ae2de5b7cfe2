#include "segment_worker.hpp"

#include <algorithm>
#include <chrono>
#include <exception>
#include <random>
#include <thread>

#include <fmt/core.h>

#include "errors.hpp"

SegmentWorker::SegmentWorker(HttpTransport &transport,
                             OutputFile &file,
                             std::string url,
                             bool supportsRanges,
                             RetryPolicy policy,
                             const std::atomic<bool> &cancel,
                             std::atomic<std::uint64_t> &progress)
    : transport_(transport),
      file_(file),
      url_(std::move(url)),
      supportsRanges_(supportsRanges),
      policy_(policy),
      cancel_(cancel),
      progress_(progress)
{
}

bool SegmentWorker::isTransientStatus(long statusCode)
{
    // 408 Request Timeout and 429 Too Many Requests clear up on their own
    return statusCode >= 500 || statusCode == 408 || statusCode == 429;
}

void SegmentWorker::restartFromZero(Segment &segment)
{
    progress_.fetch_sub(segment.bytesWritten, std::memory_order_relaxed);
    segment.bytesWritten = 0;
}

SegmentWorker::Outcome SegmentWorker::run(Segment &segment)
{
    segment.status = SegmentStatus::InProgress;
    lastError_.clear();

    if (segment.isComplete())
    {
        segment.status = SegmentStatus::Done;
        return Outcome::Done;
    }

    const int maxAttempts = std::max(policy_.maxAttempts, 1);
    for (int attemptNumber = 1; attemptNumber <= maxAttempts; ++attemptNumber)
    {
        if (cancel_.load(std::memory_order_relaxed))
        {
            return Outcome::Cancelled;
        }

        switch (attempt(segment))
        {
        case AttemptResult::Complete:
            segment.status = SegmentStatus::Done;
            return Outcome::Done;

        case AttemptResult::Cancelled:
            return Outcome::Cancelled;

        case AttemptResult::Permanent:
            segment.status = SegmentStatus::Failed;
            return Outcome::Failed;

        case AttemptResult::Transient:
            break;
        }

        if (attemptNumber == maxAttempts)
        {
            break;
        }

        fmt::print(stderr, "Segment {} failed (attempt {}/{}): {}. Retrying...\n",
                   segment.index, attemptNumber, maxAttempts, lastError_);
        ++segment.retries;
        if (!waitBeforeRetry(attemptNumber))
        {
            return Outcome::Cancelled;
        }
    }

    lastError_ = fmt::format("gave up after {} attempts: {}", maxAttempts, lastError_);
    segment.status = SegmentStatus::Failed;
    return Outcome::Failed;
}

SegmentWorker::AttemptResult SegmentWorker::attempt(Segment &segment)
{
    if (!supportsRanges_)
    {
        restartFromZero(segment);
    }

    GetRequest request;
    request.url = url_;
    request.cancel = &cancel_;
    const std::uint64_t requestedStart = segment.start + segment.bytesWritten;
    if (supportsRanges_)
    {
        request.rangeStart = requestedStart;
        if (!segment.openEnded)
        {
            request.rangeEnd = segment.end;
        }
    }

    // Exceptions must not unwind through libcurl; park them and rethrow after
    std::exception_ptr writeFailure;
    bool overflow = false;

    auto onData = [&](const char *data, std::size_t size)
    {
        if (cancel_.load(std::memory_order_relaxed))
        {
            return false;
        }
        if (!segment.openEnded && size > segment.remaining())
        {
            overflow = true;
            return false;
        }
        try
        {
            file_.writeAt(segment.start + segment.bytesWritten, data, size);
        }
        catch (...)
        {
            writeFailure = std::current_exception();
            return false;
        }
        segment.bytesWritten += size;
        progress_.fetch_add(size, std::memory_order_relaxed);
        return true;
    };

    HttpResponseInfo response;
    try
    {
        response = transport_.get(request, onData);
    }
    catch (const CancelledError &)
    {
        return AttemptResult::Cancelled;
    }
    catch (const TooManyRedirectsError &e)
    {
        lastError_ = e.what();
        return AttemptResult::Permanent;
    }
    catch (const UnreachableError &e)
    {
        lastError_ = e.what();
        return AttemptResult::Transient;
    }
    catch (const TransferError &e)
    {
        lastError_ = e.what();
        return AttemptResult::Transient;
    }

    if (writeFailure)
    {
        std::rethrow_exception(writeFailure);
    }
    // A bounded segment that arrived in full is kept even if cancel raced in
    if (cancel_.load(std::memory_order_relaxed) && (segment.openEnded || !segment.isComplete()))
    {
        return AttemptResult::Cancelled;
    }

    if (!response.isSuccess())
    {
        lastError_ = fmt::format("HTTP {} {}", response.statusCode, HttpClient::statusText(response.statusCode));
        return isTransientStatus(response.statusCode) ? AttemptResult::Transient : AttemptResult::Permanent;
    }

    if (request.isRanged() && response.statusCode != 206)
    {
        lastError_ = fmt::format("server ignored Range header (HTTP {})", response.statusCode);
        return AttemptResult::Permanent;
    }

    if (request.isRanged())
    {
        // The body must start exactly where we asked
        auto contentRange = response.header("content-range");
        if (contentRange)
        {
            size_t space = contentRange->find(' ');
            size_t dash = contentRange->find('-');
            if (space != std::string::npos && dash != std::string::npos && dash > space)
            {
                std::string startText = contentRange->substr(space + 1, dash - space - 1);
                if (startText != std::to_string(requestedStart))
                {
                    lastError_ = fmt::format("server returned range '{}' for requested offset {}",
                                             *contentRange, requestedStart);
                    return AttemptResult::Permanent;
                }
            }
        }
    }

    if (overflow)
    {
        lastError_ = fmt::format("server sent more than the {} bytes of the segment", segment.length());
        return AttemptResult::Permanent;
    }

    if (segment.openEnded)
    {
        // Length is only known now; an empty body leaves the segment at [start, start]
        if (segment.bytesWritten > 0)
        {
            segment.end = segment.start + segment.bytesWritten - 1;
        }
        return AttemptResult::Complete;
    }
    if (segment.isComplete())
    {
        return AttemptResult::Complete;
    }

    lastError_ = fmt::format("connection closed after {} of {} bytes", segment.bytesWritten, segment.length());
    return AttemptResult::Transient;
}

bool SegmentWorker::waitBeforeRetry(int attemptNumber)
{
    // Exponential backoff: 1s, 2s, 4s + jitter to prevent thundering herd
    int baseDelayMs = policy_.initialDelayMs * (1 << (attemptNumber - 1));
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(-20, 20);
    int delayMs = baseDelayMs + (baseDelayMs * dis(gen) / 100);

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delayMs);
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (cancel_.load(std::memory_order_relaxed))
        {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(std::min(delayMs, 50)));
    }
    return !cancel_.load(std::memory_order_relaxed);
}
