// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/browser/frame_codec.hpp>
#include <nlohmann/json.hpp>
#include <cstring>
#include <istream>
#include <ostream>
#include <stdexcept>

namespace openpath::browser {

namespace {

// Thrown from the parser callback; serializing a value nested this deep
// would recurse once per level
struct DepthExceeded : std::runtime_error {
    DepthExceeded() : std::runtime_error("JSON nesting too deep") {}
};

std::string prefix_for(std::size_t length) {
    const auto len = static_cast<std::uint32_t>(length);
    std::string prefix(FRAME_PREFIX_SIZE, '\0');
    std::memcpy(prefix.data(), &len, FRAME_PREFIX_SIZE);
    return prefix;
}

} // namespace

std::expected<nlohmann::json, std::error_code>
read_frame(std::istream& in, std::uint32_t max_size, int max_depth) noexcept {
    try {
        char prefix[FRAME_PREFIX_SIZE];
        in.read(prefix, FRAME_PREFIX_SIZE);
        if (in.gcount() != static_cast<std::streamsize>(FRAME_PREFIX_SIZE)) {
            return std::unexpected(make_error_code(FrameErrc::end_of_stream));
        }

        std::uint32_t length = 0;
        std::memcpy(&length, prefix, FRAME_PREFIX_SIZE);
        if (length > max_size) {
            return std::unexpected(make_error_code(FrameErrc::oversized));
        }

        std::string payload(length, '\0');
        in.read(payload.data(), length);
        if (in.gcount() != static_cast<std::streamsize>(length)) {
            return std::unexpected(make_error_code(FrameErrc::truncated));
        }

        // depth counts the containers enclosing the one being opened
        auto limit_depth = [max_depth](int depth, nlohmann::json::parse_event_t event, nlohmann::json&) {
            if ((event == nlohmann::json::parse_event_t::object_start
                 || event == nlohmann::json::parse_event_t::array_start)
                && depth >= max_depth) {
                throw DepthExceeded();
            }
            return true;
        };

        return nlohmann::json::parse(payload, limit_depth);
    } catch (const nlohmann::json::exception&) {
        return std::unexpected(make_error_code(FrameErrc::parse_error));
    } catch (const DepthExceeded&) {
        return std::unexpected(make_error_code(FrameErrc::parse_error));
    } catch (const std::exception&) {
        return std::unexpected(make_error_code(FrameErrc::end_of_stream));
    }
}

std::error_code write_frame(std::ostream& out, const nlohmann::json& value) noexcept {
    try {
        const std::string payload = serialize_json(value);
        const std::string prefix = prefix_for(payload.size());

        out.write(prefix.data(), static_cast<std::streamsize>(prefix.size()));
        out.write(payload.data(), static_cast<std::streamsize>(payload.size()));
        out.flush();

        if (!out) {
            return std::make_error_code(std::errc::io_error);
        }
        return {};
    } catch (const std::exception&) {
        return std::make_error_code(std::errc::io_error);
    }
}

std::string serialize_json(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string encode_frame(const nlohmann::json& value) {
    const std::string payload = serialize_json(value);
    return prefix_for(payload.size()) + payload;
}

} // namespace openpath::browser
