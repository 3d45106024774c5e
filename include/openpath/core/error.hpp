// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <system_error>
#include <string>

namespace openpath::core {

// Why a candidate domain was refused before reaching a subprocess argv
enum class DomainErrc {
    success = 0,
    not_a_string,
    empty,
    invalid_character,
    leading_hyphen,
};

namespace detail {

struct DomainErrcCategory : std::error_category {
    [[nodiscard]] const char* name() const noexcept override {
        return "openpath::domain";
    }

    [[nodiscard]] std::string message(int ev) const noexcept override {
        switch (static_cast<DomainErrc>(ev)) {
            case DomainErrc::success:            return "Success";
            case DomainErrc::not_a_string:       return "Domain is not a string";
            case DomainErrc::empty:              return "Domain is empty";
            case DomainErrc::invalid_character:  return "Domain contains invalid characters";
            case DomainErrc::leading_hyphen:     return "Domain starts with a hyphen";
            default:                             return "Unknown error";
        }
    }
};

} // namespace detail

inline const detail::DomainErrcCategory& domain_errc_category() noexcept {
    static detail::DomainErrcCategory category;
    return category;
}

inline std::error_code make_error_code(DomainErrc e) noexcept {
    return {static_cast<int>(e), domain_errc_category()};
}

} // namespace openpath::core

namespace std {

template<>
struct is_error_code_enum<openpath::core::DomainErrc> : true_type {};

} // namespace std
