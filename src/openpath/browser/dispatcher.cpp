// Copyright (c) 2026 changcheng967. All rights reserved.

#include <openpath/browser/dispatcher.hpp>
#include <openpath/browser/frame_codec.hpp>
#include <openpath/core/domain.hpp>
#include <climits>
#include <format>
#include <unistd.h>

namespace openpath::browser {

using nlohmann::json;

namespace {

json success_response(const char* action_name) {
    return json{{"success", true}, {"action", action_name}};
}

} // namespace

json error_response(const std::string& message) {
    return json{{"success", false}, {"error", message}};
}

json to_json(const core::DomainCheckResult& result) {
    json j;
    j["domain"] = result.domain;
    j["in_whitelist"] = result.in_whitelist;
    j["resolves"] = result.resolves;
    if (result.resolved_ip) {
        j["resolved_ip"] = *result.resolved_ip;
    } else {
        j["resolved_ip"] = nullptr;
    }
    return j;
}

std::string local_hostname() {
    char name[HOST_NAME_MAX + 1] = {};
    if (::gethostname(name, sizeof(name)) != 0) {
        return "localhost";
    }
    name[HOST_NAME_MAX] = '\0';
    return name;
}

//=============================================================================
// RequestDispatcher
//=============================================================================

RequestDispatcher::RequestDispatcher(core::WhitelistClient& client,
                                     log::LogSink& log,
                                     const core::HostConfig& config)
    : client_(client), log_(log), config_(config) {
    handlers_ = {
        {action::CHECK,            &RequestDispatcher::handle_check},
        {action::LIST,             &RequestDispatcher::handle_list},
        {action::STATUS,           &RequestDispatcher::handle_status},
        {action::PING,             &RequestDispatcher::handle_ping},
        {action::GET_HOSTNAME,     &RequestDispatcher::handle_get_hostname},
        {action::UPDATE_WHITELIST, &RequestDispatcher::handle_update},
    };
}

json RequestDispatcher::dispatch(const json& request) noexcept {
    try {
        if (!request.is_object()) {
            return error_response("Invalid message format");
        }

        std::string name;
        if (auto it = request.find("action"); it != request.end() && it->is_string()) {
            name = it->get<std::string>();
        }

        auto handler = handlers_.find(name);
        if (handler == handlers_.end()) {
            return error_response("Unknown action: " + name);
        }

        return (this->*(handler->second))(request);
    } catch (const std::exception& e) {
        log_.append(std::format("Error handling request: {}", e.what()));
        return error_response("Internal error");
    }
}

json RequestDispatcher::handle_check(const json& request) {
    auto it = request.find("domains");
    if (it == request.end() || !it->is_array() || it->empty()) {
        return error_response("No domains provided");
    }

    json results = json::array();
    std::size_t seen = 0;
    for (const auto& raw : *it) {
        if (seen++ == config_.max_domains) {
            break;
        }

        std::expected<std::string, std::error_code> domain =
            std::unexpected(make_error_code(core::DomainErrc::not_a_string));
        if (raw.is_string()) {
            domain = core::sanitize_domain(raw.get_ref<const std::string&>());
        }
        if (!domain) {
            log_.append(std::format("Skipping domain {}: {}", serialize_json(raw), domain.error().message()));
            continue;
        }

        auto checked = client_.check(*domain);
        if (!checked) {
            if (process::is_timeout(checked.error())) {
                log_.append(std::format("Timeout checking domain: {}", *domain));
            } else {
                log_.append(std::format("Error checking domain {}: {}", *domain, checked.error().message()));
            }
            results.push_back(to_json(core::DomainCheckResult{*domain}));
            continue;
        }

        results.push_back(to_json(*checked));
    }

    auto response = success_response(action::CHECK);
    response["results"] = std::move(results);
    return response;
}

json RequestDispatcher::handle_list(const json&) {
    auto domains = client_.domains();
    if (!domains) {
        log_.append(std::format("Error getting domains: {}", domains.error().message()));
    }

    auto response = success_response(action::LIST);
    response["domains"] = domains ? json(*domains) : json::array();
    return response;
}

json RequestDispatcher::handle_status(const json&) {
    core::WhitelistStatus status;
    if (auto result = client_.status()) {
        status = std::move(*result);
    } else {
        log_.append(std::format("Error getting status: {}", result.error().message()));
    }

    auto response = success_response(action::STATUS);
    response["status"] = json{{"output", status.output}, {"active", status.active}};
    return response;
}

json RequestDispatcher::handle_ping(const json&) {
    auto response = success_response(action::PING);
    response["message"] = "pong";
    return response;
}

json RequestDispatcher::handle_get_hostname(const json&) {
    auto response = success_response(action::GET_HOSTNAME);
    response["hostname"] = local_hostname();
    return response;
}

json RequestDispatcher::handle_update(const json&) {
    auto response = json{{"success", false}, {"action", action::UPDATE_WHITELIST}};

    auto outcome = client_.update();
    if (!outcome) {
        if (outcome.error() == process::ProcessErrc::not_found) {
            log_.append(std::format("Update script not found: {}", config_.update_script.string()));
            response["error"] = "Update script not found";
        } else if (process::is_timeout(outcome.error())) {
            log_.append("Update timed out");
            response["error"] = "Update timed out";
        } else {
            log_.append(std::format("Error running update: {}", outcome.error().message()));
            response["error"] = outcome.error().message();
        }
        return response;
    }

    response["success"] = outcome->succeeded();
    response["output"] = outcome->out;
    if (outcome->succeeded()) {
        response["error"] = nullptr;
    } else {
        log_.append(std::format("Update failed with exit code {}", outcome->exit_code));
        response["error"] = outcome->err;
    }
    return response;
}

} // namespace openpath::browser
