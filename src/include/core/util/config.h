/*
    config.h
    Server settings, read from an optional TOML file and overridable on the
    command line.

    Example file:

        [server]
        port = 7777
        bind-address = "0.0.0.0"
        root-dir = "/srv/files"
        threads = 8
        copy-buffer-size = 32768
        read-timeout = 30
        write-timeout = 30
        log-dir = "/var/log/rangeserve"
        log-level = "info"

    Usage:
    - Load the file (a missing file keeps the defaults):
        rangeserve::core::InitConfig("/etc/rangeserve.toml");
    - Read a setting:
        std::uint16_t port = rangeserve::core::settings.port;
*/

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <spdlog/common.h>
#include <string>
#include <toml++/toml.h>

namespace rangeserve::core {

struct Settings {
    std::uint16_t port;                // Listening port
    std::string bind_address;          // Address the acceptor binds to
    std::filesystem::path root_dir;    // Directory /getfile paths resolve under
    unsigned int threads;              // Threads running the io_context
    std::size_t copy_buffer_size;      // Bytes read from storage per write
    std::chrono::seconds read_timeout; // Idle time allowed while reading a request
    std::chrono::seconds write_timeout;
    std::filesystem::path log_dir;
    spdlog::level::level_enum log_level;
};

Settings DefaultSettings();

// Missing or mistyped keys keep the value already in `base`.
Settings LoadSettings(const toml::table& config, Settings base = DefaultSettings());

spdlog::level::level_enum ParseLogLevel(const std::string& name,
                                        spdlog::level::level_enum fallback);

inline Settings settings = DefaultSettings();

void InitConfig(const std::filesystem::path& config_file);

} // namespace rangeserve::core
