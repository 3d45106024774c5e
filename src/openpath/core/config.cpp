// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/core/config.hpp>
#include <cstdlib>
#include <system_error>

namespace openpath::core {

namespace fs = std::filesystem;

namespace {

constexpr const char* LOG_DIR_NAME = "openpath";
constexpr const char* LOG_FILE_NAME = "native-host.log";
constexpr const char* FALLBACK_LOG_NAME = "openpath-native-host.log";

const char* non_empty_env(const char* name) noexcept {
    const char* value = std::getenv(name);
    return (value != nullptr && *value != '\0') ? value : nullptr;
}

fs::path temp_log_path() {
    std::error_code ec;
    auto dir = fs::temp_directory_path(ec);
    if (ec || dir.empty()) {
        dir = "/tmp";
    }
    return dir / FALLBACK_LOG_NAME;
}

} // namespace

fs::path resolve_log_path() noexcept {
    try {
        fs::path data_dir;
        if (const char* xdg = non_empty_env("XDG_DATA_HOME")) {
            data_dir = xdg;
        } else if (const char* home = non_empty_env("HOME")) {
            data_dir = fs::path(home) / ".local" / "share";
        } else {
            return temp_log_path();
        }

        const auto log_dir = data_dir / LOG_DIR_NAME;
        std::error_code ec;
        fs::create_directories(log_dir, ec);
        if (ec || !fs::is_directory(log_dir, ec)) {
            return temp_log_path();
        }
        return log_dir / LOG_FILE_NAME;
    } catch (const std::exception&) {
        return fs::path("/tmp") / FALLBACK_LOG_NAME;
    }
}

HostConfig config_from_environment() noexcept {
    HostConfig config;

    try {
        if (const char* cmd = non_empty_env(ENV_WHITELIST_CMD)) {
            config.whitelist_command = cmd;
        }
        if (const char* script = non_empty_env(ENV_UPDATE_SCRIPT)) {
            config.update_script = script;
        }
        if (const char* log_file = non_empty_env(ENV_LOG_FILE)) {
            config.log_file = log_file;
        }
    } catch (const std::exception&) {
        // Keep whatever was assigned before the failure
    }

    if (config.log_file.empty()) {
        config.log_file = resolve_log_path();
    }

    return config;
}

} // namespace openpath::core
