// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <openpath/process/error.hpp>
#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace openpath::process {

// Captured output of a child that ran to completion. A nonzero exit_code is
// a normal result; a child killed by a signal reports 128 + signal.
struct ProcessResult {
    std::string out;
    std::string err;
    int exit_code{0};

    [[nodiscard]] bool succeeded() const noexcept { return exit_code == 0; }
};

// Error is ProcessErrc::timed_out, a ProcessErrc setup failure, or the
// system error that made exec fail (e.g. ENOENT, EACCES)
using ProcessOutcome = std::expected<ProcessResult, std::error_code>;

[[nodiscard]] inline bool is_timeout(std::error_code ec) noexcept {
    return ec == ProcessErrc::timed_out;
}

// Seam between request handling and real process creation
class CommandRunner {
public:
    virtual ~CommandRunner() = default;

    [[nodiscard]] virtual ProcessOutcome
    run(const std::filesystem::path& command,
        const std::vector<std::string>& args,
        std::chrono::milliseconds timeout) noexcept = 0;
};

// fork/exec runner. Arguments go straight into argv, no shell involved.
class SubprocessRunner final : public CommandRunner {
public:
    [[nodiscard]] ProcessOutcome
    run(const std::filesystem::path& command,
        const std::vector<std::string>& args,
        std::chrono::milliseconds timeout) noexcept override;
};

// Run command with args, killing it once timeout elapses
[[nodiscard]] ProcessOutcome run_process(const std::filesystem::path& command,
                                         const std::vector<std::string>& args,
                                         std::chrono::milliseconds timeout) noexcept;

} // namespace openpath::process
