#pragma once

#include "http_transport.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <curl/curl.h>

/**
 * HTTP transport for ranged downloads using libcurl.
 * Uses RAII to manage CURL handle lifecycle.
 */
class HttpClient : public HttpTransport
{
public:
    /**
     * @param userAgent Client identity sent with every request
     * @param stallTimeoutSeconds Abort a transfer that receives no data for this long (0 = never)
     */
    explicit HttpClient(std::string userAgent, long stallTimeoutSeconds = 0);
    ~HttpClient() override;

    // Delete copy operations (CURL handles aren't copyable)
    HttpClient(const HttpClient &) = delete;
    HttpClient &operator=(const HttpClient &) = delete;

    /**
     * Send "GET url" with "Range: bytes=<offset>-" and stream the response.
     * Redirects are followed; the handler only sees the final response.
     */
    FetchResult fetch(const RangeRequest &request, ResponseHandler &handler) override;

    const std::string &userAgent() const { return userAgent_; }

private:
    /**
     * Per-request state shared with the libcurl callbacks.
     */
    struct TransferContext
    {
        ResponseHandler *handler = nullptr;
        ResponseHeaderParser parser;
        bool headDelivered = false;
        bool stopped = false;

        bool deliverHead();
    };

    // CURL handle with custom deleter (RAII pattern)
    std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl_;

    std::string userAgent_;
    long stallTimeoutSeconds_;

    /**
     * Static callback for libcurl, called once per received header line.
     * Hands the final response block to the handler at its blank line.
     */
    static size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userdata);

    /**
     * Static callback for libcurl to pass on downloaded data.
     *
     * @param userdata Our TransferContext*
     * @return Number of bytes consumed (size * nmemb to continue, 0 to abort)
     */
    static size_t writeCallback(char *ptr, size_t size, size_t nmemb, void *userdata);
};
