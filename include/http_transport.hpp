#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

/**
 * A single ranged GET request: "Range: bytes=<offset>-".
 */
struct RangeRequest
{
    std::string url;
    std::uint64_t offset = 0;
};

/**
 * Status line and the headers of the final response that the core consumes.
 */
struct ResponseHead
{
    long status = 0;
    std::optional<std::string> contentRange;
};

/**
 * Receives a response as it arrives.
 * onHead is called exactly once before any onChunk call.
 * Returning false from either stops the transfer.
 */
class ResponseHandler
{
public:
    virtual ~ResponseHandler() = default;

    virtual bool onHead(const ResponseHead &head) = 0;
    virtual bool onChunk(const char *data, std::size_t size) = 0;
};

/**
 * How a fetch ended.
 */
struct FetchResult
{
    enum class Status
    {
        Finished, // Body fully received
        Stopped,  // Handler returned false
        Failed    // Transport error (before or during the body)
    };

    Status status = Status::Finished;
    std::string message; // Transport error description when Failed

    static FetchResult finished() { return {Status::Finished, {}}; }
    static FetchResult stopped() { return {Status::Stopped, {}}; }
    static FetchResult failed(std::string message) { return {Status::Failed, std::move(message)}; }
};

/**
 * Issues ranged GET requests and streams responses into a handler.
 */
class HttpTransport
{
public:
    virtual ~HttpTransport() = default;

    virtual FetchResult fetch(const RangeRequest &request, ResponseHandler &handler) = 0;
};

/**
 * Format the Range header line for a request starting at offset.
 * Example: 1024 -> "Range: bytes=1024-"
 */
std::string rangeHeader(std::uint64_t offset);

/**
 * Get human-readable HTTP status text for a status code.
 *
 * @param code HTTP status code (e.g., 206, 404, 416)
 * @return Descriptive text for the status code
 */
std::string getHttpStatusText(long code);

/**
 * Parse the status code out of a status line.
 * Example: "HTTP/1.1 206 Partial Content\r\n" -> 206, "HTTP/2 416" -> 416
 *
 * @return The three-digit status, or 0 if the line is not a status line
 */
long parseStatusLine(std::string_view line);

/**
 * Accumulates raw response header lines, one response block at a time.
 * A redirect chain or an interim 1xx response produces several blocks;
 * only the final block describes the body that follows.
 */
class ResponseHeaderParser
{
public:
    enum class LineResult
    {
        Header,     // Status or header line consumed
        SkipBlock,  // Blank line ending a 1xx block or a followed redirect
        FinalBlock  // Blank line ending the response the body belongs to
    };

    LineResult feed(std::string_view line);

    long status() const { return status_; }

    /**
     * Value of a header in the current block. Names are case-insensitive.
     */
    std::optional<std::string> header(std::string_view name) const;

    ResponseHead head() const;

private:
    long status_ = 0;
    std::map<std::string, std::string> headers_; // Lowercased names
};
