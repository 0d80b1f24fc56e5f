#include <algorithm>
#include <core/constant/path.h>
#include <core/constant/transfer.h>
#include <core/util/config.h>
#include <limits>
#include <spdlog/spdlog.h>
#include <thread>

namespace rangeserve::core {

Settings DefaultSettings() {
    return Settings{
        .port = transfer::kDefaultPort,
        .bind_address = "0.0.0.0",
        .root_dir = path::kDefaultRootDir,
        .threads = std::max(1u, std::thread::hardware_concurrency()),
        .copy_buffer_size = transfer::kDefaultCopyBufferSize,
        .read_timeout = std::chrono::seconds(transfer::kDefaultReadTimeoutSeconds),
        .write_timeout = std::chrono::seconds(transfer::kDefaultWriteTimeoutSeconds),
        .log_dir = path::kLogDir,
        .log_level = spdlog::level::info,
    };
}

spdlog::level::level_enum ParseLogLevel(const std::string& name,
                                        spdlog::level::level_enum fallback) {
    auto level = spdlog::level::from_str(name);
    // from_str() answers "off" for names it does not know
    if (level == spdlog::level::off && name != "off") {
        spdlog::warn("Unknown log level \"{}\", keeping {}",
                     name,
                     spdlog::level::to_string_view(fallback));
        return fallback;
    }
    return level;
}

Settings LoadSettings(const toml::table& config, Settings base) {
    const auto* server = config["server"].as_table();
    if (server == nullptr) {
        return base;
    }
    const auto& section = *server;

    if (auto port = section["port"].value<std::int64_t>()) {
        if (*port > 0 && *port <= std::numeric_limits<std::uint16_t>::max()) {
            base.port = static_cast<std::uint16_t>(*port);
        } else {
            spdlog::warn("Ignoring out-of-range port {}", *port);
        }
    }
    if (auto address = section["bind-address"].value<std::string>()) {
        base.bind_address = *address;
    }
    if (auto root = section["root-dir"].value<std::string>()) {
        base.root_dir = *root;
    }
    if (auto threads = section["threads"].value<std::int64_t>(); threads && *threads > 0) {
        base.threads = static_cast<unsigned int>(*threads);
    }
    if (auto buffer = section["copy-buffer-size"].value<std::int64_t>(); buffer && *buffer > 0) {
        base.copy_buffer_size = static_cast<std::size_t>(*buffer);
    }
    if (auto timeout = section["read-timeout"].value<std::int64_t>(); timeout && *timeout > 0) {
        base.read_timeout = std::chrono::seconds(*timeout);
    }
    if (auto timeout = section["write-timeout"].value<std::int64_t>(); timeout && *timeout > 0) {
        base.write_timeout = std::chrono::seconds(*timeout);
    }
    if (auto log_dir = section["log-dir"].value<std::string>()) {
        base.log_dir = *log_dir;
    }
    if (auto level = section["log-level"].value<std::string>()) {
        base.log_level = ParseLogLevel(*level, base.log_level);
    }
    return base;
}

void InitConfig(const std::filesystem::path& config_file) {
    if (config_file.empty() || !std::filesystem::exists(config_file)) {
        spdlog::info("No config file at \"{}\", using defaults", config_file.string());
        return;
    }
    try {
        auto config = toml::parse_file(config_file.string());
        settings = LoadSettings(config, settings);
        spdlog::info("Loaded config from \"{}\"", config_file.string());
    } catch (const toml::parse_error& err) {
        spdlog::error("\"{}\" could not be parsed: {}", config_file.string(), err.description());
    }
}

} // namespace rangeserve::core
