#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace rangeserve::core {

namespace human_readable {

// 1024-based units from B to PiB, e.g. "0 B", "1.5 KiB", "1.0 GiB".
std::string Bytes(std::uint64_t bytes);

// Duration in the "1h2m3.5s" / "12.5ms" / "0s" notation.
std::string Duration(std::chrono::nanoseconds duration);

} // namespace human_readable

} // namespace rangeserve::core
