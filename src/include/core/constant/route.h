#pragma once

#include <string_view>

namespace rangeserve::core {

class ApiRoute {
public:
    // Subtree route: everything below it names a file.
    static constexpr std::string_view kGetFile = "/getfile/";
    static constexpr std::string_view kGetInfo = "/getinfo";
};

namespace query {

constexpr std::string_view kConvertId = "convert_id";

} // namespace query

} // namespace rangeserve::core
