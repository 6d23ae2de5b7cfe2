#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <curl/curl.h>

/**
 * Status line and headers of the final response (after redirects).
 * Header names are stored lower-case.
 */
struct HttpResponseInfo
{
    long statusCode = 0;
    std::map<std::string, std::string> headers;
    std::string effectiveUrl;

    std::optional<std::string> header(const std::string &lowerName) const;
    bool isSuccess() const { return statusCode >= 200 && statusCode < 300; }
};

/**
 * A GET request, optionally restricted to a byte range.
 * rangeEnd unset with rangeStart set means "bytes=start-".
 */
struct GetRequest
{
    std::string url;
    std::optional<std::uint64_t> rangeStart;
    std::optional<std::uint64_t> rangeEnd;

    // Checked while the transfer runs; true aborts with CancelledError
    const std::atomic<bool> *cancel = nullptr;

    bool isRanged() const { return rangeStart.has_value(); }
};

/**
 * Receives body bytes. Return false to stop the transfer early
 * (the call then returns normally with whatever was received).
 */
using DataCallback = std::function<bool(const char *data, std::size_t size)>;

/**
 * Abstract HTTP seam used by RangeNegotiator and SegmentWorker.
 *
 * Implementations throw UnreachableError, TooManyRedirectsError,
 * TransferError (transient) or CancelledError. Non-success statuses are
 * returned, not thrown; the body of such a response is never passed to onData
 * and the transfer stops as soon as the status is known.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    // `cancel` may be null; when set and true the request aborts with CancelledError
    virtual HttpResponseInfo head(const std::string &url, const std::atomic<bool> *cancel) = 0;

    /**
     * Body bytes are forwarded only when the status is the expected one:
     * 206 for a ranged request, any 2xx otherwise.
     */
    virtual HttpResponseInfo get(const GetRequest &request, const DataCallback &onData) = 0;
};

// Each worker thread gets its own transport
using TransportFactory = std::function<std::unique_ptr<HttpTransport>()>;

/**
 * HttpTransport over libcurl.
 * Uses RAII to manage CURL handle lifecycle; one handle per client, so a
 * client must not be shared between threads.
 */
class HttpClient : public HttpTransport
{
public:
    struct Options
    {
        long connectTimeoutSeconds = 30;
        long readTimeoutSeconds = 60; // Abort when no byte arrives for this long
        long maxRedirects = 5;
    };

    explicit HttpClient(Options options);
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    HttpResponseInfo head(const std::string &url, const std::atomic<bool> *cancel) override;
    HttpResponseInfo get(const GetRequest &request, const DataCallback &onData) override;

    // Reason phrase for error messages ("Not Found" for 404)
    static std::string statusText(long code);

    // Factory producing libcurl clients for the coordinator's worker pool
    static TransportFactory factory(Options options);

private:
    // Per-transfer state handed to the static libcurl callbacks
    struct TransferContext;

    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;
    Options options_;

    /**
     * Run one request on the handle and translate libcurl failures into
     * the engine's exception types.
     */
    HttpResponseInfo perform(const std::string &url, TransferContext &context);

    /**
     * Body sink registered with libcurl (C callbacks must be static).
     * Decides on the first chunk whether the body goes to the caller.
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);

    // Collects response headers, restarting on every new status line (redirects)
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    // Returns non-zero to abort when cancellation was requested
    static int progressCallback(void *clientp,
                                curl_off_t dltotal,
                                curl_off_t dlnow,
                                curl_off_t ultotal,
                                curl_off_t ulnow);
};
