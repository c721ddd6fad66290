#include "http_client.hpp"

#include <cstdlib>
#include <mutex>
#include <stdexcept>
#include <string_view>
#include <utility>

#include <fmt/core.h>

namespace
{

void ensureCurlInitialized()
{
    static std::once_flag flag;
    std::call_once(flag, [] {
        if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK)
        {
            throw std::runtime_error("Failed to initialize libcurl");
        }
        std::atexit([] { curl_global_cleanup(); });
    });
}

} // namespace

HttpClient::HttpClient(std::string userAgent, long stallTimeoutSeconds)
    : curl_(nullptr, curl_easy_cleanup),
      userAgent_(std::move(userAgent)),
      stallTimeoutSeconds_(stallTimeoutSeconds)
{
    ensureCurlInitialized();

    curl_.reset(curl_easy_init());
    if (!curl_)
    {
        throw std::runtime_error("Failed to initialize CURL (out of memory or library error)");
    }
}

// Destructor: unique_ptr handles cleanup automatically
HttpClient::~HttpClient() = default;

bool HttpClient::TransferContext::deliverHead()
{
    if (headDelivered)
    {
        return !stopped;
    }
    headDelivered = true;

    if (!handler->onHead(parser.head()))
    {
        stopped = true;
        return false;
    }
    return true;
}

size_t HttpClient::headerCallback(char *buffer, size_t size, size_t nitems, void *userdata)
{
    size_t totalSize = size * nitems;
    auto *ctx = static_cast<TransferContext *>(userdata);

    switch (ctx->parser.feed(std::string_view(buffer, totalSize)))
    {
    case ResponseHeaderParser::LineResult::Header:
    case ResponseHeaderParser::LineResult::SkipBlock:
        return totalSize;
    case ResponseHeaderParser::LineResult::FinalBlock:
        break;
    }

    // Returning a different count than we were given makes libcurl abort
    return ctx->deliverHead() ? totalSize : 0;
}

// Static callback: libcurl calls this with chunks of downloaded data
size_t HttpClient::writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata)
{
    // Calculate total bytes in this chunk
    size_t totalSize = size * nmemb;
    auto *ctx = static_cast<TransferContext *>(userdata);

    if (!ctx->deliverHead())
    {
        return 0;
    }
    if (!ctx->handler->onChunk(ptr, totalSize))
    {
        ctx->stopped = true;
        return 0; // Abort transfer
    }
    return totalSize;
}

FetchResult HttpClient::fetch(const RangeRequest &request, ResponseHandler &handler)
{
    TransferContext ctx;
    ctx.handler = &handler;

    std::string range = rangeHeader(request.offset);
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headers(
        curl_slist_append(nullptr, range.c_str()), curl_slist_free_all);
    if (!headers)
    {
        return FetchResult::failed("Failed to build request headers");
    }

    char errorBuffer[CURL_ERROR_SIZE] = {0};

    CURL *curl = curl_.get();

    // 1. Plain GET with our Range header and client identity
    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, userAgent_.c_str());

    // 2. Callbacks share one context per request
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, headerCallback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeCallback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
    curl_easy_setopt(curl, CURLOPT_SUPPRESS_CONNECT_HEADERS, 1L);

    // 3. HTTPS settings
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L); // Verify server certificate
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L); // Verify hostname matches cert

    // 4. Follow HTTP redirects; the Range header is kept on each hop
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 5L); // Limit redirect chain

    // 5. No overall timeout; optionally abort a body that stops flowing
    curl_easy_setopt(curl, CURLOPT_TIMEOUT, 0L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, stallTimeoutSeconds_ > 0 ? 1L : 0L);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, stallTimeoutSeconds_ > 0 ? stallTimeoutSeconds_ : 0L);

    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, errorBuffer);

    CURLcode res = curl_easy_perform(curl);

    // Don't leave pointers to locals in the handle
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, nullptr);
    curl_easy_setopt(curl, CURLOPT_ERRORBUFFER, nullptr);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, nullptr);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, nullptr);

    if (ctx.stopped)
    {
        return FetchResult::stopped();
    }

    if (res != CURLE_OK)
    {
        std::string detail = errorBuffer[0] != '\0' ? std::string(errorBuffer) : std::string(curl_easy_strerror(res));
        return FetchResult::failed(fmt::format("{} ({})", detail, static_cast<int>(res)));
    }

    // A response without a body (e.g. an unfollowed 3xx) never reached the write callback
    if (!ctx.headDelivered && ctx.parser.status() > 0 && !ctx.deliverHead())
    {
        return FetchResult::stopped();
    }

    return FetchResult::finished();
}
