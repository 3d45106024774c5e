// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/core/whitelist_client.hpp>
#include <algorithm>
#include <cctype>

namespace openpath::core {

namespace {

constexpr std::string_view SPACES = " \t\r\n\f\v";

bool contains(std::string_view haystack, std::string_view needle) noexcept {
    return haystack.find(needle) != std::string_view::npos;
}

std::string_view trim(std::string_view s) noexcept {
    auto first = s.find_first_not_of(SPACES);
    if (first == std::string_view::npos) {
        return {};
    }
    auto last = s.find_last_not_of(SPACES);
    return s.substr(first, last - first + 1);
}

} // namespace

//=============================================================================
// Parsers
//=============================================================================

DomainCheckResult parse_check_output(std::string_view domain, std::string_view output) {
    DomainCheckResult result;
    result.domain = std::string(domain);

    result.in_whitelist = contains(output, MARKER_WHITELISTED_ES)
                       || contains(output, MARKER_WHITELISTED_EN);

    auto arrow = output.find(MARKER_RESOLVES);
    if (arrow != std::string_view::npos) {
        result.resolves = true;

        // First run of non-space characters after the arrow
        auto rest = output.substr(arrow + MARKER_RESOLVES.size());
        auto start = rest.find_first_not_of(SPACES);
        if (start != std::string_view::npos) {
            auto end = rest.find_first_of(SPACES, start);
            result.resolved_ip = std::string(rest.substr(start, end - start));
        }
    }

    return result;
}

std::vector<std::string> parse_domains_output(std::string_view output) {
    std::vector<std::string> domains;

    std::size_t pos = 0;
    while (pos <= output.size()) {
        auto eol = output.find('\n', pos);
        if (eol == std::string_view::npos) {
            eol = output.size();
        }
        auto line = trim(output.substr(pos, eol - pos));
        if (!line.empty()) {
            domains.emplace_back(line);
        }
        pos = eol + 1;
    }

    return domains;
}

WhitelistStatus parse_status_output(std::string_view output) {
    std::string lowered(output);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    WhitelistStatus status;
    status.output = std::string(output);
    status.active = contains(lowered, MARKER_ACTIVE_ES) || contains(lowered, MARKER_ACTIVE_EN);
    return status;
}

//=============================================================================
// WhitelistClient
//=============================================================================

std::expected<DomainCheckResult, std::error_code>
WhitelistClient::check(const std::string& domain) noexcept {
    auto outcome = runner_.run(config_.whitelist_command, {"check", domain}, config_.query_timeout);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    try {
        return parse_check_output(domain, outcome->out);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<std::vector<std::string>, std::error_code>
WhitelistClient::domains() noexcept {
    auto outcome = runner_.run(config_.whitelist_command, {"domains"}, config_.query_timeout);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    try {
        return parse_domains_output(outcome->out);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

std::expected<WhitelistStatus, std::error_code>
WhitelistClient::status() noexcept {
    auto outcome = runner_.run(config_.whitelist_command, {"status"}, config_.query_timeout);
    if (!outcome) {
        return std::unexpected(outcome.error());
    }

    try {
        return parse_status_output(outcome->out);
    } catch (const std::bad_alloc&) {
        return std::unexpected(std::make_error_code(std::errc::not_enough_memory));
    }
}

process::ProcessOutcome WhitelistClient::update() noexcept {
    if (!update_script_exists()) {
        return std::unexpected(make_error_code(process::ProcessErrc::not_found));
    }
    return runner_.run(config_.update_script, {"--update"}, config_.update_timeout);
}

bool WhitelistClient::update_script_exists() const noexcept {
    std::error_code ec;
    return std::filesystem::exists(config_.update_script, ec);
}

} // namespace openpath::core
