// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <openpath/core/config.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

namespace openpath::log {

// Append-only text log of "[YYYY-MM-DD HH:MM:SS] message" lines.
//
// The file is opened, written and closed for every entry; no handle is kept
// between calls. Write failures (missing directory, permissions, full disk)
// are dropped inside the sink and never reach the caller.
class LogSink {
public:
    explicit LogSink(std::filesystem::path path);
    ~LogSink();

    LogSink(const LogSink&) = delete;
    LogSink& operator=(const LogSink&) = delete;

    void append(std::string_view message) noexcept;

    // Moves the current file to <path>.old if it is larger than max_size,
    // replacing any previous backup, and starts an empty file.
    void rotate_if_oversized(std::uintmax_t max_size = core::MAX_LOG_SIZE) noexcept;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] static std::filesystem::path backup_path(const std::filesystem::path& path);

private:
    std::filesystem::path path_;
    std::shared_ptr<spdlog::logger> logger_;
};

} // namespace openpath::log
