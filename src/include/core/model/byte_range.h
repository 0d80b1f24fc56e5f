#pragma once

#include <cstdint>

namespace rangeserve::core {

// Concrete interval picked for one request. `end` is inclusive and may be -1
// for an empty file, so both bounds are signed.
struct ByteRange {
    std::int64_t start{0};
    std::int64_t end{-1};
    bool is_partial{false};      // a Range header was present and parsed
    bool end_unspecified{false}; // no header, or "bytes=N-"

    std::uint64_t length() const {
        return end < start ? 0 : static_cast<std::uint64_t>(end - start) + 1;
    }
};

} // namespace rangeserve::core
