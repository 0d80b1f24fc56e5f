#pragma once

#include <filesystem>

namespace rangeserve::core {
namespace path {

inline const std::filesystem::path kLogDir = std::filesystem::temp_directory_path() / "rangeserve"
                                             / "logs";

inline const std::filesystem::path kDefaultRootDir = "/";

} // namespace path
} // namespace rangeserve::core
