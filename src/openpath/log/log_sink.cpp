// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/log/log_sink.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/base_sink.h>
#include <spdlog/details/null_mutex.h>
#include <fstream>
#include <system_error>

namespace openpath::log {

namespace {

constexpr const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S] %v";

// spdlog sink that reopens the file in append mode for every message
class AppendFileSink final : public spdlog::sinks::base_sink<spdlog::details::null_mutex> {
public:
    explicit AppendFileSink(std::filesystem::path path) : path_(std::move(path)) {}

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        spdlog::memory_buf_t formatted;
        formatter_->format(msg, formatted);

        std::ofstream file(path_, std::ios::binary | std::ios::app);
        if (!file) {
            throw spdlog::spdlog_ex("cannot open log file " + path_.string());
        }
        file.write(formatted.data(), static_cast<std::streamsize>(formatted.size()));
        if (!file) {
            throw spdlog::spdlog_ex("cannot write log file " + path_.string());
        }
    }

    void flush_() override {}

private:
    std::filesystem::path path_;
};

} // namespace

LogSink::LogSink(std::filesystem::path path) : path_(std::move(path)) {
    auto sink = std::make_shared<AppendFileSink>(path_);
    logger_ = std::make_shared<spdlog::logger>("openpath", std::move(sink));
    logger_->set_pattern(LOG_PATTERN);
    logger_->set_level(spdlog::level::info);
    // The one place logging failures are absorbed
    logger_->set_error_handler([](const std::string&) {});
}

LogSink::~LogSink() = default;

void LogSink::append(std::string_view message) noexcept {
    try {
        logger_->info(spdlog::string_view_t(message.data(), message.size()));
    } catch (const std::exception&) {
        // Formatting or allocation failure; the entry is lost
    }
}

void LogSink::rotate_if_oversized(std::uintmax_t max_size) noexcept {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path_, ec);
    if (ec || size <= max_size) {
        return;
    }

    try {
        const auto backup = backup_path(path_);
        std::filesystem::remove(backup, ec);
        std::filesystem::rename(path_, backup, ec);
        if (ec) {
            return;
        }
        std::ofstream(path_, std::ios::binary | std::ios::trunc).close();
    } catch (const std::exception&) {
        // Rotation is best-effort; keep appending to whatever file exists
    }
}

std::filesystem::path LogSink::backup_path(const std::filesystem::path& path) {
    auto backup = path;
    backup += ".old";
    return backup;
}

} // namespace openpath::log
