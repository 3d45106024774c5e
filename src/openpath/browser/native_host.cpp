// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/browser/native_host.hpp>
#include <openpath/browser/frame_codec.hpp>
#include <csignal>
#include <format>
#include <istream>
#include <ostream>

namespace openpath::browser {

void ignore_broken_pipe() noexcept {
    std::signal(SIGPIPE, SIG_IGN);
}

int NativeHost::run() noexcept {
    state_ = HostState::running;
    log_.append("Native host started");

    while (step()) {
    }

    state_ = HostState::terminated;
    return 0;
}

bool NativeHost::step() noexcept {
    if (state_ != HostState::running) {
        return false;
    }

    auto request = read_frame(in_);
    if (!request) {
        if (request.error() == FrameErrc::parse_error) {
            log_.append("Invalid JSON payload received, exiting");
        } else {
            log_.append("No message received, exiting");
        }
        state_ = HostState::draining;
        return false;
    }

    try {
        log_.append(std::format("Received: {}", serialize_json(*request)));

        auto response = dispatcher_.dispatch(*request);

        log_.append(std::format("Sending: {}", serialize_json(response)));

        if (auto ec = write_frame(out_, response)) {
            log_.append(std::format("Failed to send response: {}", ec.message()));
            state_ = HostState::draining;
            return false;
        }
    } catch (const std::exception& e) {
        log_.append(std::format("Error processing message: {}", e.what()));
        state_ = HostState::draining;
        return false;
    }

    return true;
}

} // namespace openpath::browser
