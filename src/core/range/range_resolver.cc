#include <charconv>
#include <core/range/range_resolver.h>
#include <limits>
#include <string>

namespace rangeserve::core {

namespace {

constexpr std::string_view kBytesPrefix = "bytes=";

std::string_view trimSpace(std::string_view s) {
    constexpr std::string_view kSpace = " \t\r\n\v\f";
    auto first = s.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(kSpace);
    return s.substr(first, last - first + 1);
}

// Anything that does not fit in 64 unsigned bits is malformed. Values past
// int64 cannot exist in a file; they saturate so that a huge start becomes
// unsatisfiable and a huge end gets clamped.
std::int64_t parsePosition(std::string_view text, const char* what) {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        throw MalformedRangeError(std::string("invalid ") + what + ": \"" + std::string(text)
                                  + "\"");
    }
    if (value > static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max())) {
        return std::numeric_limits<std::int64_t>::max();
    }
    return static_cast<std::int64_t>(value);
}

} // namespace

ByteRange RangeResolver::Resolve(std::optional<std::string_view> range_header,
                                 std::int64_t file_size) {
    if (!range_header || range_header->empty()) {
        return ByteRange{
            .start = 0,
            .end = file_size - 1,
            .is_partial = false,
            .end_unspecified = true,
        };
    }

    auto raw = trimSpace(*range_header);
    if (!raw.starts_with(kBytesPrefix)) {
        throw MalformedRangeError("range must start with bytes= prefix");
    }
    raw.remove_prefix(kBytesPrefix.size());

    auto dash = raw.find('-');
    if (dash == std::string_view::npos || raw.find('-', dash + 1) != std::string_view::npos) {
        throw MalformedRangeError("invalid range format: \"" + std::string(raw) + "\"");
    }

    auto start_str = trimSpace(raw.substr(0, dash));
    auto end_str = trimSpace(raw.substr(dash + 1));
    if (start_str.empty()) {
        throw MalformedRangeError("start missing in range");
    }

    ByteRange range;
    range.is_partial = true;
    range.start = parsePosition(start_str, "start");
    if (end_str.empty()) {
        range.end = file_size - 1;
        range.end_unspecified = true;
    } else {
        range.end = parsePosition(end_str, "end");
        range.end_unspecified = false;
    }
    return range;
}

bool RangeResolver::ClampToFile(ByteRange& range, std::int64_t file_size) {
    if (range.end >= file_size) {
        range.end = file_size - 1;
    }
    if (!range.is_partial) {
        return true;
    }
    return range.start <= range.end;
}

} // namespace rangeserve::core
