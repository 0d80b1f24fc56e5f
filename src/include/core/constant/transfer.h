#pragma once

#include <cstddef>
#include <cstdint>

namespace rangeserve::core {

namespace transfer {

constexpr std::uint16_t kDefaultPort = 7777;
constexpr std::size_t kDefaultCopyBufferSize = 32 * 1024; // 32 KiB
constexpr std::size_t kMaxRequestBodySize = 64 * 1024;
constexpr int kDefaultReadTimeoutSeconds = 30;
constexpr int kDefaultWriteTimeoutSeconds = 30;

// byte_end value recorded when the request left the end open or reached EOF
constexpr std::int64_t kUnspecifiedEnd = -1;

} // namespace transfer

} // namespace rangeserve::core
