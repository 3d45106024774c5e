// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <openpath/core/error.hpp>
#include <string>
#include <string_view>
#include <expected>

namespace openpath::core {

// Normalize a candidate domain (trim + ASCII lower-case) and check it
// against the [a-z0-9.-] allow-list. The result is safe to pass as a
// literal argv element.
[[nodiscard]] std::expected<std::string, std::error_code>
sanitize_domain(std::string_view raw) noexcept;

// True for a character in [a-z0-9.-]
[[nodiscard]] constexpr bool is_domain_char(char c) noexcept {
    return (c >= 'a' && c <= 'z')
        || (c >= '0' && c <= '9')
        || c == '.' || c == '-';
}

} // namespace openpath::core
