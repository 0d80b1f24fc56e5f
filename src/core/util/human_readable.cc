#include <array>
#include <core/util/human_readable.h>
#include <spdlog/fmt/fmt.h>
#include <string_view>

namespace rangeserve::core {

namespace human_readable {

namespace {

constexpr std::array<std::string_view, 6> kByteUnits = {"B", "KiB", "MiB", "GiB", "TiB", "PiB"};

// Appends "<whole>[.<fraction>]" where `fraction` has `digits` digits
// before its trailing zeros are dropped.
void appendDecimal(std::string& out, std::uint64_t whole, std::uint64_t fraction, int digits) {
    out += std::to_string(whole);
    if (fraction == 0) {
        return;
    }
    std::string frac = fmt::format("{:0{}}", fraction, digits);
    frac.erase(frac.find_last_not_of('0') + 1);
    out += '.';
    out += frac;
}

} // namespace

std::string Bytes(std::uint64_t bytes) {
    double size = static_cast<double>(bytes);
    std::size_t exp = 0;
    while (size >= 1024 && exp < kByteUnits.size() - 1) {
        size /= 1024;
        ++exp;
    }
    if (exp == 0) {
        return fmt::format("{:.0f} {}", size, kByteUnits[exp]);
    }
    return fmt::format("{:.1f} {}", size, kByteUnits[exp]);
}

std::string Duration(std::chrono::nanoseconds duration) {
    auto count = duration.count();
    if (count == 0) {
        return "0s";
    }

    std::string out;
    std::uint64_t ns;
    if (count < 0) {
        out += '-';
        ns = static_cast<std::uint64_t>(-(count + 1)) + 1;
    } else {
        ns = static_cast<std::uint64_t>(count);
    }

    constexpr std::uint64_t kMicro = 1'000;
    constexpr std::uint64_t kMilli = 1'000'000;
    constexpr std::uint64_t kSecond = 1'000'000'000;

    if (ns < kSecond) {
        if (ns < kMicro) {
            appendDecimal(out, ns, 0, 0);
            out += "ns";
        } else if (ns < kMilli) {
            appendDecimal(out, ns / kMicro, ns % kMicro, 3);
            out += "µs";
        } else {
            appendDecimal(out, ns / kMilli, ns % kMilli, 6);
            out += "ms";
        }
        return out;
    }

    std::uint64_t total_seconds = ns / kSecond;
    std::uint64_t hours = total_seconds / 3600;
    std::uint64_t minutes = (total_seconds / 60) % 60;
    if (hours > 0) {
        out += std::to_string(hours) + "h";
    }
    if (hours > 0 || minutes > 0) {
        out += std::to_string(minutes) + "m";
    }
    appendDecimal(out, total_seconds % 60, ns % kSecond, 9);
    out += 's';
    return out;
}

} // namespace human_readable

} // namespace rangeserve::core
