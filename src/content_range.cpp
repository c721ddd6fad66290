#include "content_range.hpp"

#include <charconv>
#include <system_error>

namespace
{

// Parse a full decimal field; rejects empty, signed and partially numeric text
bool parseField(std::string_view text, std::uint64_t &value)
{
    if (text.empty())
    {
        return false;
    }
    const char *first = text.data();
    const char *last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    return ec == std::errc() && ptr == last;
}

} // namespace

ContentRangeResult parseContentRange(std::string_view value)
{
    constexpr std::string_view prefix = "bytes ";
    if (value.substr(0, prefix.size()) != prefix)
    {
        return ContentRangeError::BadPrefix;
    }
    value.remove_prefix(prefix.size());

    // "<start>-<end>/<total>": exactly one '-' followed by exactly one '/'
    const auto dash = value.find('-');
    const auto slash = value.find('/');
    if (dash == std::string_view::npos || slash == std::string_view::npos || slash < dash)
    {
        return ContentRangeError::Malformed;
    }
    if (value.find_first_of("-/", slash + 1) != std::string_view::npos ||
        value.find('-', dash + 1) < slash)
    {
        return ContentRangeError::Malformed;
    }

    ContentRange range;
    if (!parseField(value.substr(0, dash), range.start) ||
        !parseField(value.substr(dash + 1, slash - dash - 1), range.end) ||
        !parseField(value.substr(slash + 1), range.total))
    {
        return ContentRangeError::Malformed;
    }

    if (range.start > range.end || range.end >= range.total)
    {
        return ContentRangeError::InvalidBounds;
    }
    return range;
}

std::optional<ContentRangeError> checkContentRange(const ContentRange &range, std::uint64_t requestedOffset)
{
    if (range.start != requestedOffset)
    {
        return ContentRangeError::StartMismatch;
    }
    // total >= 1 is guaranteed by the parser (end < total)
    if (range.end != range.total - 1)
    {
        return ContentRangeError::EndMismatch;
    }
    return std::nullopt;
}

const char *describe(ContentRangeError error)
{
    switch (error)
    {
    case ContentRangeError::Missing:
        return "Missing Content-Range header";
    case ContentRangeError::BadPrefix:
        return "Invalid Content-Range header (expected \"bytes \" prefix)";
    case ContentRangeError::Malformed:
        return "Invalid Content-Range header (expected \"bytes <start>-<end>/<total>\")";
    case ContentRangeError::InvalidBounds:
        return "Invalid Content-Range header (start <= end < total does not hold)";
    case ContentRangeError::StartMismatch:
        return "Server returned invalid start offset";
    case ContentRangeError::EndMismatch:
        return "Server returned invalid end offset";
    }
    return "Invalid Content-Range header";
}
