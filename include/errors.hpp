#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

/**
 * Base class for every error the download engine reports.
 * component() names the part of the engine that failed so the
 * front end can print something like "Error [RangeNegotiator]: ...".
 */
class DownloadError : public std::runtime_error
{
public:
    DownloadError(std::string component, const std::string &message)
        : std::runtime_error(message), component_(std::move(component))
    {
    }

    const std::string &component() const { return component_; }

private:
    std::string component_;
};

// DNS lookup or TCP/TLS connect failed
class UnreachableError : public DownloadError
{
public:
    UnreachableError(const std::string &url, const std::string &cause)
        : DownloadError("HttpClient", "Cannot reach " + url + ": " + cause)
    {
    }
};

// Final response (after redirects) had a non-success status
class HttpStatusError : public DownloadError
{
public:
    HttpStatusError(std::string component, const std::string &url, long statusCode, const std::string &statusText)
        : DownloadError(std::move(component),
                        "HTTP " + std::to_string(statusCode) + " " + statusText + " for " + url),
          statusCode_(statusCode)
    {
    }

    long statusCode() const { return statusCode_; }

private:
    long statusCode_;
};

class TooManyRedirectsError : public DownloadError
{
public:
    TooManyRedirectsError(const std::string &url, long maxRedirects)
        : DownloadError("HttpClient",
                        "More than " + std::to_string(maxRedirects) + " redirects while fetching " + url)
    {
    }
};

/**
 * Transient transfer failure (timeout, connection reset, short body).
 * SegmentWorker retries these; they never leave the worker directly.
 */
class TransferError : public DownloadError
{
public:
    explicit TransferError(const std::string &message)
        : DownloadError("HttpClient", message)
    {
    }
};

// Raised by the resume parser; ResumeStore::load turns it into a fresh start
class ResumeStateCorrupt : public DownloadError
{
public:
    explicit ResumeStateCorrupt(const std::string &message)
        : DownloadError("ResumeStore", message)
    {
    }
};

class FileReadError : public DownloadError
{
public:
    FileReadError(std::string component, const std::string &message)
        : DownloadError(std::move(component), message)
    {
    }
};

class FileWriteError : public DownloadError
{
public:
    FileWriteError(std::string component, const std::string &message)
        : DownloadError(std::move(component), message)
    {
    }
};

// User interrupt; partial file and sidecar are kept for a later resume
class CancelledError : public DownloadError
{
public:
    CancelledError()
        : DownloadError("DownloadCoordinator", "Download cancelled, progress saved for resume")
    {
    }
};

/**
 * One or more segments ended Failed after exhausting their retries.
 */
class SegmentDownloadError : public DownloadError
{
public:
    struct Failure
    {
        std::size_t index;
        std::string cause;
    };

    SegmentDownloadError(const std::string &url, std::vector<Failure> failures)
        : DownloadError("DownloadCoordinator", describe(url, failures)), failures_(std::move(failures))
    {
    }

    const std::vector<Failure> &failures() const { return failures_; }

    std::vector<std::size_t> failedIndices() const
    {
        std::vector<std::size_t> indices;
        for (const auto &failure : failures_)
        {
            indices.push_back(failure.index);
        }
        return indices;
    }

private:
    static std::string describe(const std::string &url, const std::vector<Failure> &failures)
    {
        std::string message = "Failed to download " + url + ":";
        for (const auto &failure : failures)
        {
            message += " segment " + std::to_string(failure.index) + " (" + failure.cause + ");";
        }
        message += " rerun to resume";
        return message;
    }

    std::vector<Failure> failures_;
};
