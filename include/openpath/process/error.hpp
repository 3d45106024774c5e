// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace openpath::process {

enum class ProcessErrc {
    success = 0,
    timed_out,
    launch_failed,
    pipe_failed,
    wait_failed,
    not_found,
};

namespace detail {

struct ProcessErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "openpath::process";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<ProcessErrc>(ev)) {
            case ProcessErrc::success:        return "Success";
            case ProcessErrc::timed_out:      return "Process timed out";
            case ProcessErrc::launch_failed:  return "Process could not be launched";
            case ProcessErrc::pipe_failed:    return "Could not create process pipes";
            case ProcessErrc::wait_failed:    return "Could not wait for process";
            case ProcessErrc::not_found:      return "Executable not found";
            default:                          return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::ProcessErrcCategory& process_errc_category() noexcept {
    static detail::ProcessErrcCategory category;
    return category;
}

inline std::error_code make_error_code(ProcessErrc e) noexcept {
    return {static_cast<int>(e), process_errc_category()};
}

} // namespace openpath::process

namespace std {

template<>
struct is_error_code_enum<openpath::process::ProcessErrc> : true_type {};

} // namespace std
