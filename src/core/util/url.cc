#include <boost/url/params_view.hpp>
#include <core/util/url.h>

namespace rangeserve::core {

namespace url {

std::optional<std::string> QueryParam(const boost::urls::url_view& target, std::string_view key) {
    auto params = target.params();
    auto it = params.find(key);
    if (it == params.end()) {
        return std::nullopt;
    }
    return (*it).value;
}

std::optional<std::filesystem::path> ResolveFilePath(const std::filesystem::path& root,
                                                     std::string_view url_path) {
    std::filesystem::path requested(url_path);
    for (const auto& segment : requested) {
        if (segment == "..") {
            return std::nullopt;
        }
    }

    auto relative = requested.lexically_normal().relative_path();
    if (relative.empty() || relative == ".") {
        return std::nullopt;
    }
    return root / relative;
}

} // namespace url

} // namespace rangeserve::core
