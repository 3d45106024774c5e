// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/core/domain.hpp>
#include <algorithm>
#include <cctype>

namespace openpath::core {

namespace {

constexpr std::string_view WHITESPACE = " \t\n\r\f\v";

std::string_view trim(std::string_view s) noexcept {
    auto first = s.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(WHITESPACE);
    return s.substr(first, last - first + 1);
}

} // namespace

std::expected<std::string, std::error_code>
sanitize_domain(std::string_view raw) noexcept {
    if (raw.empty()) {
        return std::unexpected(make_error_code(DomainErrc::empty));
    }

    auto trimmed = trim(raw);
    if (trimmed.empty()) {
        return std::unexpected(make_error_code(DomainErrc::empty));
    }

    try {
        std::string domain;
        domain.reserve(trimmed.size());
        for (char c : trimmed) {
            domain += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }

        if (!std::all_of(domain.begin(), domain.end(), is_domain_char)) {
            return std::unexpected(make_error_code(DomainErrc::invalid_character));
        }

        // "-x" would be read as an option by the whitelist tool
        if (domain.front() == '-') {
            return std::unexpected(make_error_code(DomainErrc::leading_hyphen));
        }

        return domain;
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

} // namespace openpath::core
