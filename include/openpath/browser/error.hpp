// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace openpath::browser {

enum class FrameErrc {
    success = 0,
    end_of_stream,
    oversized,
    truncated,
    parse_error,
};

namespace detail {

struct FrameErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "openpath::frame";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<FrameErrc>(ev)) {
            case FrameErrc::success:        return "Success";
            case FrameErrc::end_of_stream:  return "End of stream";
            case FrameErrc::oversized:      return "Frame exceeds maximum size";
            case FrameErrc::truncated:      return "Frame payload truncated";
            case FrameErrc::parse_error:    return "Frame payload is not valid JSON";
            default:                        return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::FrameErrcCategory& frame_errc_category() noexcept {
    static detail::FrameErrcCategory category;
    return category;
}

inline std::error_code make_error_code(FrameErrc e) noexcept {
    return {static_cast<int>(e), frame_errc_category()};
}

} // namespace openpath::browser

namespace std {

template<>
struct is_error_code_enum<openpath::browser::FrameErrc> : true_type {};

} // namespace std

namespace openpath::browser {

// Framing failures all mean "stop reading"; only parse errors get logged
[[nodiscard]] inline bool is_end_of_stream(std::error_code ec) noexcept {
    return ec == FrameErrc::end_of_stream
        || ec == FrameErrc::oversized
        || ec == FrameErrc::truncated;
}

} // namespace openpath::browser
