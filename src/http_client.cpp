#include "http_client.hpp"

#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

#include <fmt/core.h>

#include "errors.hpp"

namespace
{
    constexpr const char *USER_AGENT = "swiftdl/1.0";

    std::once_flag curlGlobalInitFlag;

    // curl_global_init is not thread-safe; run it once before any handle exists
    void ensureCurlGlobalInit()
    {
        std::call_once(curlGlobalInitFlag, []()
                       {
            if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
            {
                throw std::runtime_error("Failed to initialize libcurl");
            } });
    }

    std::string toLower(std::string value)
    {
        std::transform(value.begin(), value.end(), value.begin(),
                       [](unsigned char ch)
                       { return static_cast<char>(std::tolower(ch)); });
        return value;
    }

    std::string trim(const std::string &value)
    {
        const char *whitespace = " \t\r\n";
        size_t first = value.find_first_not_of(whitespace);
        if (first == std::string::npos)
        {
            return "";
        }
        size_t last = value.find_last_not_of(whitespace);
        return value.substr(first, last - first + 1);
    }
} // namespace

std::optional<std::string> HttpResponseInfo::header(const std::string &lowerName) const
{
    auto it = headers.find(lowerName);
    if (it == headers.end())
    {
        return std::nullopt;
    }
    return it->second;
}

struct HttpClient::TransferContext
{
    CURL *curl = nullptr;
    bool ranged = false;
    const DataCallback *onData = nullptr;
    const std::atomic<bool> *cancel = nullptr;

    HttpResponseInfo response;

    // Decided on the first body chunk, once the final status is known
    bool statusChecked = false;
    bool forwardBody = false;
    bool stoppedByCallback = false;
};

HttpClient::HttpClient(Options options) : curl_(nullptr, curl_easy_cleanup), options_(options)
{
    ensureCurlGlobalInit();

    curl_.reset(curl_easy_init());
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

TransportFactory HttpClient::factory(Options options)
{
    return [options]()
    { return std::make_unique<HttpClient>(options); };
}

size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    size_t totalSize = size * nmemb;
    auto *context = static_cast<TransferContext *>(userdata);

    if (!context->statusChecked)
    {
        long code = 0;
        curl_easy_getinfo(context->curl, CURLINFO_RESPONSE_CODE, &code);
        context->statusChecked = true;
        context->forwardBody = context->ranged ? code == 206 : (code >= 200 && code < 300);
    }

    // Error pages and range-ignoring 200s are never handed to the caller;
    // the status and headers are all it needs, so stop reading
    if (!context->forwardBody)
    {
        context->stoppedByCallback = true;
        return 0;
    }
    if (context->onData == nullptr)
    {
        return totalSize;
    }

    if (!(*context->onData)(ptr, totalSize))
    {
        context->stoppedByCallback = true;
        return 0; // libcurl aborts with CURLE_WRITE_ERROR
    }
    return totalSize;
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *context = static_cast<TransferContext *>(userdata);
    std::string line(buffer, totalSize);

    // A new status line starts a new response (redirect hop or 100-continue)
    if (line.rfind("HTTP/", 0) == 0)
    {
        context->response.headers.clear();
        return totalSize;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos)
    {
        context->response.headers[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
    }
    return totalSize;
}

int HttpClient::progressCallback(void *clientp,
                                 curl_off_t dltotal,
                                 curl_off_t dlnow,
                                 curl_off_t ultotal,
                                 curl_off_t ulnow)
{
    (void)dltotal;
    (void)dlnow;
    (void)ultotal;
    (void)ulnow;

    auto *context = static_cast<TransferContext *>(clientp);
    if (context->cancel && context->cancel->load(std::memory_order_relaxed))
    {
        return 1;
    }
    return 0;
}

HttpResponseInfo HttpClient::head(const std::string &url, const std::atomic<bool> *cancel)
{
    curl_easy_reset(curl_.get());
    curl_easy_setopt(curl_.get(), CURLOPT_NOBODY, 1L);

    TransferContext context;
    context.cancel = cancel;
    return perform(url, context);
}

HttpResponseInfo HttpClient::get(const GetRequest &request, const DataCallback &onData)
{
    curl_easy_reset(curl_.get());
    curl_easy_setopt(curl_.get(), CURLOPT_HTTPGET, 1L);

    std::string range;
    if (request.rangeStart)
    {
        // Format: "N-M" for a closed range, "N-" for everything from N
        range = fmt::format("{}-", *request.rangeStart);
        if (request.rangeEnd)
        {
            range += fmt::format("{}", *request.rangeEnd);
        }
        curl_easy_setopt(curl_.get(), CURLOPT_RANGE, range.c_str());
    }

    TransferContext context;
    context.ranged = request.isRanged();
    context.onData = &onData;
    context.cancel = request.cancel;
    return perform(request.url, context);
}

HttpResponseInfo HttpClient::perform(const std::string &url, TransferContext &context)
{
    CURL *curl = curl_.get();
    context.curl = curl;

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, USER_AGENT);

    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &context);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &context);

    // HTTPS settings
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, options_.maxRedirects);
    curl_easy_setopt(curl, CURLOPT_PROTOCOLS_STR, "http,https");
    curl_easy_setopt(curl, CURLOPT_REDIR_PROTOCOLS_STR, "http,https");

    // No total timeout: a large segment may legitimately take hours.
    // A transfer slower than 1 byte/s for readTimeoutSeconds counts as stalled.
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, options_.connectTimeoutSeconds);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, options_.readTimeoutSeconds);

    // Signals are handled by the process, not by libcurl's resolver
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, progressCallback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, &context);

    CURLcode res = curl_easy_perform(curl);

    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &context.response.statusCode);
    char *effective = nullptr;
    if (curl_easy_getinfo(curl, CURLINFO_EFFECTIVE_URL, &effective) == CURLE_OK && effective)
    {
        context.response.effectiveUrl = effective;
    }
    else
    {
        context.response.effectiveUrl = url;
    }

    switch (res)
    {
    case CURLE_OK:
        return context.response;

    case CURLE_WRITE_ERROR:
        if (context.stoppedByCallback)
        {
            return context.response;
        }
        throw TransferError(fmt::format("Write callback failed for {}", url));

    case CURLE_ABORTED_BY_CALLBACK:
        throw CancelledError();

    case CURLE_TOO_MANY_REDIRECTS:
        throw TooManyRedirectsError(url, options_.maxRedirects);

    // Never got a connection: DNS, refused, proxy, TLS handshake
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_COULDNT_CONNECT:
    case CURLE_SSL_CONNECT_ERROR:
    case CURLE_PEER_FAILED_VERIFICATION:
    case CURLE_URL_MALFORMAT:
    case CURLE_UNSUPPORTED_PROTOCOL:
        throw UnreachableError(url, curl_easy_strerror(res));

    // Connect timeout surfaces as OPERATION_TIMEDOUT with no response yet
    case CURLE_OPERATION_TIMEDOUT:
        if (context.response.statusCode == 0)
        {
            throw UnreachableError(url, curl_easy_strerror(res));
        }
        throw TransferError(fmt::format("Transfer stalled for {}: {}", url, curl_easy_strerror(res)));

    // Everything else happened mid-transfer and is worth retrying
    default:
        throw TransferError(fmt::format("Transfer failed for {}: {}", url, curl_easy_strerror(res)));
    }
}

std::string HttpClient::statusText(long code)
{
    switch (code)
    {
    case 200:
        return "OK";
    case 206:
        return "Partial Content";
    case 301:
        return "Moved Permanently";
    case 302:
        return "Found";
    case 400:
        return "Bad Request";
    case 401:
        return "Unauthorized";
    case 403:
        return "Forbidden";
    case 404:
        return "Not Found";
    case 405:
        return "Method Not Allowed";
    case 416:
        return "Range Not Satisfiable";
    case 500:
        return "Internal Server Error";
    case 502:
        return "Bad Gateway";
    case 503:
        return "Service Unavailable";
    default:
        return "Unknown Status";
    }
}
