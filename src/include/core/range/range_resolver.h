#pragma once

#include <core/model/byte_range.h>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string_view>

namespace rangeserve::core {

// Thrown for any Range header this server does not understand. Only the
// single-range form "bytes=<start>-[<end>]" is accepted.
class MalformedRangeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class RangeResolver {
public:
    /*
        Resolve a Range header against a file of `file_size` bytes.

        - no header / empty header: whole file, end_unspecified, not partial
        - "bytes=A-":  [A, file_size - 1], end_unspecified, partial
        - "bytes=A-B": [A, B], partial

        The result is not clamped; call ClampToFile() before serving it.
        Throws MalformedRangeError on anything else.
    */
    static ByteRange Resolve(std::optional<std::string_view> range_header, std::int64_t file_size);

    // Pulls `end` back to the last byte of the file. Returns false when the
    // range is unsatisfiable afterwards (start past end). A whole-file
    // request is always satisfiable, even for an empty file.
    static bool ClampToFile(ByteRange& range, std::int64_t file_size);
};

} // namespace rangeserve::core
