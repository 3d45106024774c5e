// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <openpath/browser/error.hpp>
#include <openpath/core/config.hpp>
#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <expected>
#include <iosfwd>
#include <string>
#include <system_error>

namespace openpath::browser {

// Native messaging framing, as used by Chrome and Firefox:
// a 4-byte length in host byte order followed by that many bytes of UTF-8 JSON.

constexpr std::size_t FRAME_PREFIX_SIZE = sizeof(std::uint32_t);

// Read one frame. Short reads and oversized lengths come back as
// end_of_stream/truncated/oversized (see is_end_of_stream); an undecodable
// payload, or one nested deeper than max_depth, is parse_error.
[[nodiscard]] std::expected<nlohmann::json, std::error_code>
read_frame(std::istream& in,
           std::uint32_t max_size = core::MAX_FRAME_SIZE,
           int max_depth = core::MAX_JSON_DEPTH) noexcept;

// Write one frame and flush. Invalid UTF-8 inside strings is replaced.
[[nodiscard]] std::error_code write_frame(std::ostream& out, const nlohmann::json& value) noexcept;

// Compact JSON text; invalid UTF-8 becomes U+FFFD instead of throwing
[[nodiscard]] std::string serialize_json(const nlohmann::json& value);

// Prefix + payload as a single buffer
[[nodiscard]] std::string encode_frame(const nlohmann::json& value);

} // namespace openpath::browser
