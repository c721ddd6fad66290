#include "content_range.hpp"
#include "http_transport.hpp"
#include "test_support.hpp"

#include <fmt/core.h>

namespace
{

bool parsesTo(std::string_view text, std::uint64_t start, std::uint64_t end, std::uint64_t total)
{
    auto result = parseContentRange(text);
    const auto *range = std::get_if<ContentRange>(&result);
    return range && range->start == start && range->end == end && range->total == total;
}

bool rejectedAs(std::string_view text, ContentRangeError expected)
{
    auto result = parseContentRange(text);
    const auto *error = std::get_if<ContentRangeError>(&result);
    return error && *error == expected;
}

} // namespace

int main()
{
    TestReport report;

    // Well-formed headers
    report.check(parsesTo("bytes 0-99/100", 0, 99, 100), "parses a full range");
    report.check(parsesTo("bytes 1024-4095/4096", 1024, 4095, 4096), "parses a resumed range");
    report.check(parsesTo("bytes 0-0/1", 0, 0, 1), "parses a one-byte resource");
    report.check(parsesTo("bytes 0-18446744073709551614/18446744073709551615",
                          0, 18446744073709551614ull, 18446744073709551615ull),
                 "parses 64-bit sizes");

    // Prefix
    report.check(rejectedAs("0-99/100", ContentRangeError::BadPrefix), "rejects a missing unit");
    report.check(rejectedAs("Bytes 0-99/100", ContentRangeError::BadPrefix), "unit is case-sensitive");
    report.check(rejectedAs("items 0-99/100", ContentRangeError::BadPrefix), "rejects another unit");
    report.check(rejectedAs("", ContentRangeError::BadPrefix), "rejects an empty value");

    // Shape and numbers
    report.check(rejectedAs("bytes 0-99", ContentRangeError::Malformed), "rejects a missing total");
    report.check(rejectedAs("bytes 0/100", ContentRangeError::Malformed), "rejects a missing end");
    report.check(rejectedAs("bytes */100", ContentRangeError::Malformed), "rejects the unsatisfied-range form");
    report.check(rejectedAs("bytes 0-99/*", ContentRangeError::Malformed), "rejects an unknown total");
    report.check(rejectedAs("bytes a-99/100", ContentRangeError::Malformed), "rejects a non-numeric start");
    report.check(rejectedAs("bytes 0-99/1e3", ContentRangeError::Malformed), "rejects a non-numeric total");
    report.check(rejectedAs("bytes -5-99/100", ContentRangeError::Malformed), "rejects a negative start");
    report.check(rejectedAs("bytes +5-99/100", ContentRangeError::Malformed), "rejects a signed start");
    report.check(rejectedAs("bytes 0-1-2/100", ContentRangeError::Malformed), "rejects an extra dash");
    report.check(rejectedAs("bytes 0-99/100/100", ContentRangeError::Malformed), "rejects an extra slash");
    report.check(rejectedAs("bytes 0/99-100", ContentRangeError::Malformed), "rejects swapped separators");
    report.check(rejectedAs("bytes  0-99/100", ContentRangeError::Malformed), "rejects extra whitespace");
    report.check(rejectedAs("bytes 0-99/100000000000000000000", ContentRangeError::Malformed),
                 "rejects a total that overflows 64 bits");

    // Bounds
    report.check(rejectedAs("bytes 50-49/100", ContentRangeError::InvalidBounds), "rejects start after end");
    report.check(rejectedAs("bytes 0-100/100", ContentRangeError::InvalidBounds), "rejects end at total");
    report.check(rejectedAs("bytes 0-0/0", ContentRangeError::InvalidBounds), "rejects an empty resource");

    // Cross-check against the requested offset
    const ContentRange resumed{300, 999, 1000};
    report.check(!checkContentRange(resumed, 300), "accepts a range starting at the offset and ending at the end");
    report.check(checkContentRange(resumed, 0) == ContentRangeError::StartMismatch, "detects a start mismatch");
    report.check(checkContentRange(ContentRange{300, 499, 1000}, 300) == ContentRangeError::EndMismatch,
                 "detects a sub-range");
    report.check(checkContentRange(ContentRange{0, 499, 1000}, 300) == ContentRangeError::StartMismatch,
                 "start is checked before end");

    report.check(std::string(describe(ContentRangeError::Missing)) == "Missing Content-Range header",
                 "describes a missing header");

    // Request side
    report.check(rangeHeader(0) == "Range: bytes=0-", "range header at offset 0");
    report.check(rangeHeader(123456789012ull) == "Range: bytes=123456789012-", "range header at a large offset");

    return report.finish();
}
