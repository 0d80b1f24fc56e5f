#pragma once

#include <boost/url/url_view.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace rangeserve::core {

namespace url {

// First value of `key` in the decoded query ("+" reads as a space), or
// nullopt when the key is absent. A bare key yields an empty string.
std::optional<std::string> QueryParam(const boost::urls::url_view& target, std::string_view key);

/*
    Maps the part of the URL path naming a file onto `root`.

    The path is normalised lexically first (repeated and "." segments
    collapse). Any ".." segment rejects the path, as does an empty one.
*/
std::optional<std::filesystem::path> ResolveFilePath(const std::filesystem::path& root,
                                                     std::string_view url_path);

} // namespace url

} // namespace rangeserve::core
