#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>

#include "http_client.hpp"

/**
 * What the server told us about the resource.
 */
struct RemoteInfo
{
    std::optional<std::uint64_t> totalSize; // Unset when the server sent no length
    bool supportsRanges = false;            // Never true while totalSize is unknown
    std::string effectiveUrl;               // After redirects
    std::optional<std::string> suggestedFileName; // From Content-Disposition
};

/**
 * Probes a URL for its size and byte-range support.
 *
 * Tries HEAD first. When HEAD is refused or leaves size or range support
 * undecided, sends a 1-byte range GET (bytes=0-0) and trusts its answer.
 */
class RangeNegotiator
{
public:
    // `cancel` (may be null) aborts the HEAD and probe requests with CancelledError
    explicit RangeNegotiator(HttpTransport &transport, const std::atomic<bool> *cancel = nullptr);

    /**
     * @throws UnreachableError on connection failure
     * @throws HttpStatusError if the final response is not a success
     * @throws TooManyRedirectsError past the redirect limit
     * @throws CancelledError when the cancel flag was raised
     */
    RemoteInfo negotiate(const std::string &url);

    // Total from "bytes 0-0/12345"; nullopt for "*" or garbage
    static std::optional<std::uint64_t> parseContentRangeTotal(const std::string &value);

private:
    HttpTransport &transport_;
    const std::atomic<bool> *cancel_;

    static std::optional<std::uint64_t> parseContentLength(const HttpResponseInfo &response);
    static bool advertisesByteRanges(const HttpResponseInfo &response);
    static void takeFileName(const HttpResponseInfo &response, RemoteInfo &info);

    RemoteInfo probeWithRangeGet(const std::string &url, RemoteInfo info);
};
