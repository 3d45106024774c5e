// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

namespace openpath::core {

constexpr std::uint32_t MAX_FRAME_SIZE = 1024 * 1024;               // 1 MiB per frame
constexpr int MAX_JSON_DEPTH = 512;                                 // nested arrays/objects per frame
constexpr std::uintmax_t MAX_LOG_SIZE = 5 * 1024 * 1024;            // rotate above 5 MiB
constexpr std::size_t MAX_DOMAINS = 50;                             // per check request

constexpr std::chrono::seconds QUERY_TIMEOUT{10};                   // check/domains/status
constexpr std::chrono::seconds UPDATE_TIMEOUT{60};

constexpr const char* DEFAULT_WHITELIST_CMD = "/usr/local/bin/whitelist";
constexpr const char* DEFAULT_UPDATE_SCRIPT = "/usr/local/bin/openpath-update.sh";

constexpr const char* ENV_WHITELIST_CMD = "OPENPATH_WHITELIST_CMD";
constexpr const char* ENV_UPDATE_SCRIPT = "OPENPATH_UPDATE_SCRIPT";
constexpr const char* ENV_LOG_FILE = "OPENPATH_LOG_FILE";

// Everything the host needs to know about its environment, resolved once
// in main() and passed down explicitly.
struct HostConfig {
    std::filesystem::path whitelist_command{DEFAULT_WHITELIST_CMD};
    std::filesystem::path update_script{DEFAULT_UPDATE_SCRIPT};
    std::filesystem::path log_file;
    std::chrono::milliseconds query_timeout{QUERY_TIMEOUT};
    std::chrono::milliseconds update_timeout{UPDATE_TIMEOUT};
    std::size_t max_domains{MAX_DOMAINS};
};

// $XDG_DATA_HOME/openpath/native-host.log, else ~/.local/share/openpath/...
// Falls back to the temp directory when the data directory can't be created.
[[nodiscard]] std::filesystem::path resolve_log_path() noexcept;

// Defaults overlaid with OPENPATH_* environment variables
[[nodiscard]] HostConfig config_from_environment() noexcept;

} // namespace openpath::core
