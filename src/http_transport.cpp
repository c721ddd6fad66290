#include "http_transport.hpp"

#include <algorithm>
#include <cctype>

#include <fmt/core.h>

std::string rangeHeader(std::uint64_t offset)
{
    // Open-ended range: from offset to the end of the resource
    return fmt::format("Range: bytes={}-", offset);
}

// Helper: Get human-readable HTTP status text
std::string getHttpStatusText(long code)
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

namespace
{

std::string_view trim(std::string_view text)
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())))
    {
        text.remove_prefix(1);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())))
    {
        text.remove_suffix(1);
    }
    return text;
}

std::string toLower(std::string_view text)
{
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower;
}

} // namespace

long parseStatusLine(std::string_view line)
{
    if (line.substr(0, 5) != "HTTP/")
    {
        return 0;
    }
    auto space = line.find(' ');
    if (space == std::string_view::npos)
    {
        return 0;
    }
    long code = 0;
    int digits = 0;
    for (auto i = space + 1; i < line.size() && digits < 3; ++i, ++digits)
    {
        char c = line[i];
        if (c < '0' || c > '9')
        {
            return 0;
        }
        code = code * 10 + (c - '0');
    }
    // Exactly three digits, then end of line or a reason phrase
    if (digits != 3)
    {
        return 0;
    }
    auto after = space + 4;
    if (after < line.size() && !std::isspace(static_cast<unsigned char>(line[after])))
    {
        return 0;
    }
    return code;
}

ResponseHeaderParser::LineResult ResponseHeaderParser::feed(std::string_view line)
{
    // Each response in a redirect chain starts with its own status line
    if (line.substr(0, 5) == "HTTP/")
    {
        status_ = parseStatusLine(line);
        headers_.clear();
        return LineResult::Header;
    }

    if (trim(line).empty())
    {
        bool interim = status_ >= 100 && status_ < 200;
        bool redirect = status_ >= 300 && status_ < 400 && headers_.count("location") > 0;
        return interim || redirect ? LineResult::SkipBlock : LineResult::FinalBlock;
    }

    auto colon = line.find(':');
    if (colon != std::string_view::npos)
    {
        headers_[toLower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
    }
    return LineResult::Header;
}

std::optional<std::string> ResponseHeaderParser::header(std::string_view name) const
{
    auto it = headers_.find(toLower(name));
    if (it == headers_.end())
    {
        return std::nullopt;
    }
    return it->second;
}

ResponseHead ResponseHeaderParser::head() const
{
    ResponseHead head;
    head.status = status_;
    head.contentRange = header("content-range");
    return head;
}
