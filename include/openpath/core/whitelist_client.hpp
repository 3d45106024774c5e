// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <openpath/core/config.hpp>
#include <openpath/process/subprocess.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace openpath::core {

// Marker tokens printed by `whitelist`. Its output is human-oriented text,
// so these substrings are the whole contract.
inline constexpr std::string_view MARKER_WHITELISTED_ES = "SÍ";
inline constexpr std::string_view MARKER_WHITELISTED_EN = "YES";
inline constexpr std::string_view MARKER_RESOLVES = "→";
inline constexpr std::string_view MARKER_ACTIVE_ES = "activo";
inline constexpr std::string_view MARKER_ACTIVE_EN = "active";

struct DomainCheckResult {
    std::string domain;
    bool in_whitelist{false};
    bool resolves{false};
    std::optional<std::string> resolved_ip;
};

struct WhitelistStatus {
    std::string output;
    bool active{false};
};

// Output parsers, independent of process execution
[[nodiscard]] DomainCheckResult parse_check_output(std::string_view domain,
                                                   std::string_view output);
[[nodiscard]] std::vector<std::string> parse_domains_output(std::string_view output);
[[nodiscard]] WhitelistStatus parse_status_output(std::string_view output);

// Typed front end for the `whitelist` CLI and the update script
class WhitelistClient {
public:
    WhitelistClient(process::CommandRunner& runner, const HostConfig& config) noexcept
        : runner_(runner), config_(config) {}

    // `whitelist check <domain>`; domain must already be sanitized
    [[nodiscard]] std::expected<DomainCheckResult, std::error_code>
    check(const std::string& domain) noexcept;

    // `whitelist domains`
    [[nodiscard]] std::expected<std::vector<std::string>, std::error_code>
    domains() noexcept;

    // `whitelist status`
    [[nodiscard]] std::expected<WhitelistStatus, std::error_code>
    status() noexcept;

    // `<update script> --update`. A missing script is reported as
    // ProcessErrc::not_found without spawning anything.
    [[nodiscard]] process::ProcessOutcome update() noexcept;

    [[nodiscard]] bool update_script_exists() const noexcept;

private:
    process::CommandRunner& runner_;
    const HostConfig& config_;
};

} // namespace openpath::core
