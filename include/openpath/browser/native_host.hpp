// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <openpath/browser/dispatcher.hpp>
#include <openpath/log/log_sink.hpp>
#include <iosfwd>

namespace openpath::browser {

enum class HostState {
    running,
    draining,
    terminated,
};

// Native messaging host
// Compatible with Chrome and Firefox Native Messaging API
//
// Reads one frame, answers it, reads the next. Ends when the browser
// closes stdin, sends an oversized frame, or sends a payload that is not JSON.
class NativeHost {
public:
    NativeHost(RequestDispatcher& dispatcher, log::LogSink& log,
               std::istream& in, std::ostream& out) noexcept
        : dispatcher_(dispatcher), log_(log), in_(in), out_(out) {}

    // Run the native messaging loop; returns the process exit code
    [[nodiscard]] int run() noexcept;

    // Handle a single frame. Returns false once the loop should stop.
    [[nodiscard]] bool step() noexcept;

    [[nodiscard]] HostState state() const noexcept { return state_; }

private:
    RequestDispatcher& dispatcher_;
    log::LogSink& log_;
    std::istream& in_;
    std::ostream& out_;
    HostState state_{HostState::running};
};

// Turn a browser that closed its end of the port into a failed write
// instead of a SIGPIPE kill, so the loop can log it and exit normally
void ignore_broken_pipe() noexcept;

} // namespace openpath::browser
