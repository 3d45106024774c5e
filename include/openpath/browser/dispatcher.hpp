// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <openpath/core/config.hpp>
#include <openpath/core/whitelist_client.hpp>
#include <openpath/log/log_sink.hpp>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>

namespace openpath::browser {

// Action names understood by the host
namespace action {
inline constexpr const char* CHECK = "check";
inline constexpr const char* LIST = "list";
inline constexpr const char* STATUS = "status";
inline constexpr const char* PING = "ping";
inline constexpr const char* GET_HOSTNAME = "get-hostname";
inline constexpr const char* UPDATE_WHITELIST = "update-whitelist";
} // namespace action

// Turns one request object into one response object. Holds no state
// between requests; every failure becomes a {"success": false} response.
class RequestDispatcher {
public:
    RequestDispatcher(core::WhitelistClient& client,
                      log::LogSink& log,
                      const core::HostConfig& config);

    [[nodiscard]] nlohmann::json dispatch(const nlohmann::json& request) noexcept;

private:
    using Handler = nlohmann::json (RequestDispatcher::*)(const nlohmann::json&);

    nlohmann::json handle_check(const nlohmann::json& request);
    nlohmann::json handle_list(const nlohmann::json& request);
    nlohmann::json handle_status(const nlohmann::json& request);
    nlohmann::json handle_ping(const nlohmann::json& request);
    nlohmann::json handle_get_hostname(const nlohmann::json& request);
    nlohmann::json handle_update(const nlohmann::json& request);

    core::WhitelistClient& client_;
    log::LogSink& log_;
    const core::HostConfig& config_;
    std::unordered_map<std::string, Handler> handlers_;
};

// Failure envelope shared by all handlers
[[nodiscard]] nlohmann::json error_response(const std::string& message);

// DomainCheckResult as sent on the wire
[[nodiscard]] nlohmann::json to_json(const core::DomainCheckResult& result);

// Network hostname of this machine
[[nodiscard]] std::string local_hostname();

} // namespace openpath::browser
