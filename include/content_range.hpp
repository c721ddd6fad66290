#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

/**
 * Byte range declared by a server in a Content-Range response header.
 * Textual form: "bytes <start>-<end>/<total>", with start <= end < total.
 */
struct ContentRange
{
    std::uint64_t start = 0;
    std::uint64_t end = 0;
    std::uint64_t total = 0;
};

/**
 * Reasons a Content-Range header is rejected.
 */
enum class ContentRangeError
{
    Missing,       // Header not present in the response
    BadPrefix,     // Does not start with "bytes "
    Malformed,     // Wrong field count or non-numeric field
    InvalidBounds, // start <= end < total does not hold
    StartMismatch, // start differs from the requested offset
    EndMismatch    // end is not total - 1 (server sent a sub-range)
};

using ContentRangeResult = std::variant<ContentRange, ContentRangeError>;

/**
 * Parse a Content-Range header value.
 * Pure function, performs no I/O.
 *
 * @param value Header value, e.g. "bytes 100-999/1000"
 * @return The parsed range or the reason it was rejected
 */
ContentRangeResult parseContentRange(std::string_view value);

/**
 * Cross-check a parsed range against the offset that was requested.
 * A valid range starts exactly at the offset and runs to the end of the resource.
 *
 * @return The violated constraint, or nullopt if the range is usable
 */
std::optional<ContentRangeError> checkContentRange(const ContentRange &range, std::uint64_t requestedOffset);

/**
 * Human-readable description of a rejection reason.
 */
const char *describe(ContentRangeError error);
