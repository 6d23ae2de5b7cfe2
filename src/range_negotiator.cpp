#include "range_negotiator.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

#include "errors.hpp"
#include "paths.hpp"

namespace
{
    std::optional<std::uint64_t> parseUnsigned(const std::string &text)
    {
        if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos)
        {
            return std::nullopt;
        }
        try
        {
            return static_cast<std::uint64_t>(std::stoull(text));
        }
        catch (const std::exception &)
        {
            return std::nullopt;
        }
    }
} // namespace

RangeNegotiator::RangeNegotiator(HttpTransport &transport, const std::atomic<bool> *cancel)
    : transport_(transport), cancel_(cancel)
{
}

std::optional<std::uint64_t> RangeNegotiator::parseContentRangeTotal(const std::string &value)
{
    size_t slash = value.rfind('/');
    if (slash == std::string::npos)
    {
        return std::nullopt;
    }
    std::string total = value.substr(slash + 1);
    total.erase(std::remove_if(total.begin(), total.end(), [](unsigned char ch)
                               { return std::isspace(ch); }),
                total.end());
    return parseUnsigned(total);
}

std::optional<std::uint64_t> RangeNegotiator::parseContentLength(const HttpResponseInfo &response)
{
    auto length = response.header("content-length");
    if (!length)
    {
        return std::nullopt;
    }
    return parseUnsigned(*length);
}

bool RangeNegotiator::advertisesByteRanges(const HttpResponseInfo &response)
{
    auto acceptRanges = response.header("accept-ranges");
    if (!acceptRanges)
    {
        return false;
    }
    std::string value = *acceptRanges;
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char ch)
                   { return static_cast<char>(std::tolower(ch)); });
    return value.find("bytes") != std::string::npos;
}

void RangeNegotiator::takeFileName(const HttpResponseInfo &response, RemoteInfo &info)
{
    if (auto disposition = response.header("content-disposition"))
    {
        if (auto name = fileNameFromContentDisposition(*disposition))
        {
            info.suggestedFileName = name;
        }
    }
}

RemoteInfo RangeNegotiator::negotiate(const std::string &url)
{
    RemoteInfo info;
    info.effectiveUrl = url;

    HttpResponseInfo head = transport_.head(url, cancel_);
    if (head.isSuccess())
    {
        info.effectiveUrl = head.effectiveUrl.empty() ? url : head.effectiveUrl;
        info.totalSize = parseContentLength(head);
        info.supportsRanges = advertisesByteRanges(head);
        takeFileName(head, info);

        if (info.totalSize && info.supportsRanges)
        {
            return info;
        }
    }
    else
    {
        // Some servers refuse HEAD (405, 403) but serve GET fine
        fmt::print(stderr, "Warning: HEAD {} returned HTTP {}, probing with a range request.\n",
                   url, head.statusCode);
    }

    return probeWithRangeGet(url, info);
}

RemoteInfo RangeNegotiator::probeWithRangeGet(const std::string &url, RemoteInfo info)
{
    GetRequest request;
    request.url = url;
    request.rangeStart = 0;
    request.rangeEnd = 0;
    request.cancel = cancel_;

    // Only one byte was asked for; anything more means the range was ignored
    std::uint64_t received = 0;
    HttpResponseInfo probe = transport_.get(request, [&received](const char *, std::size_t size)
                                            {
        received += size;
        return received <= 1; });

    if (!probe.isSuccess())
    {
        throw HttpStatusError("RangeNegotiator", url, probe.statusCode, HttpClient::statusText(probe.statusCode));
    }

    info.effectiveUrl = probe.effectiveUrl.empty() ? url : probe.effectiveUrl;
    takeFileName(probe, info);

    if (probe.statusCode == 206)
    {
        auto contentRange = probe.header("content-range");
        auto total = contentRange ? parseContentRangeTotal(*contentRange) : std::nullopt;
        if (total)
        {
            info.totalSize = total;
            info.supportsRanges = true;
            return info;
        }
        // 206 without a usable total: keep whatever HEAD reported, no ranges
        info.supportsRanges = false;
    }
    else
    {
        // 200: the server ignored the Range header
        info.supportsRanges = false;
        if (auto length = parseContentLength(probe))
        {
            info.totalSize = length;
        }
    }

    if (!info.totalSize)
    {
        info.supportsRanges = false;
    }
    return info;
}
