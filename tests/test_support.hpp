// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <openpath/process/subprocess.hpp>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <random>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace openpath::test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction
struct TempDir {
    fs::path path;

    TempDir() {
        std::random_device rd;
        path = fs::temp_directory_path() / ("openpath_test_" + std::to_string(rd()));
        fs::create_directories(path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

inline std::string read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

inline void write_file(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

// CommandRunner that records calls and answers from a script
class FakeRunner final : public process::CommandRunner {
public:
    struct Call {
        fs::path command;
        std::vector<std::string> args;
        std::chrono::milliseconds timeout;
    };

    using Responder = std::function<process::ProcessOutcome(const Call&)>;

    std::vector<Call> calls;
    Responder respond = [](const Call&) { return process::ProcessResult{}; };

    [[nodiscard]] process::ProcessOutcome
    run(const fs::path& command,
        const std::vector<std::string>& args,
        std::chrono::milliseconds timeout) noexcept override {
        try {
            calls.push_back(Call{command, args, timeout});
            return respond(calls.back());
        } catch (const std::exception&) {
            return std::unexpected(make_error_code(process::ProcessErrc::launch_failed));
        }
    }
};

inline process::ProcessResult output(std::string out, int exit_code = 0, std::string err = {}) {
    return process::ProcessResult{std::move(out), std::move(err), exit_code};
}

} // namespace openpath::test
