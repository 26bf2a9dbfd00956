#include "dhcpwarden/api.h"

#include <nlohmann/json.hpp>

#include <algorithm>

namespace dhcpwarden {

using json = nlohmann::json;

StatusClass classify_status(const ApiContract &contract, int status) {
    if (status >= 200 && status < 300) return StatusClass::SUCCESS;
    const auto &auth = contract.auth_failure_statuses;
    if (std::find(auth.begin(), auth.end(), status) != auth.end()) return StatusClass::AUTH_REJECTED;
    return StatusClass::OTHER;
}

HttpRequest build_login_request(const ApiContract &contract, const std::string &secret, uint32_t timeout_ms) {
    HttpRequest req;
    req.method = "POST";
    req.target = contract.auth_path;
    req.body = json{{"password", secret}}.dump();
    req.timeout_ms = timeout_ms;
    return req;
}

HttpRequest build_health_request(const ApiContract &contract, uint32_t timeout_ms) {
    HttpRequest req;
    req.method = "GET";
    req.target = contract.health_path;
    req.timeout_ms = timeout_ms;
    req.send_cookies = false;
    return req;
}

HttpRequest build_dhcp_request(const ApiContract &contract, ApiGeneration api, const Session &session,
                               bool enable, uint32_t timeout_ms) {
    HttpRequest req;
    req.method = "PATCH";
    req.target = contract.config_path;
    if (contract.restart_on_apply) req.target += "?restart=true";
    req.body = json{{"config", {{"dhcp", {{"active", enable}}}}}}.dump();
    req.timeout_ms = timeout_ms;

    switch (api) {
        case ApiGeneration::V6:
            req.headers.emplace_back("sid", session.sid);
            req.headers.emplace_back("X-CSRF-Token", session.csrf);
            break;
        case ApiGeneration::LEGACY:
            // The sid travels as a cookie; the jar is bypassed so the header is not doubled.
            req.send_cookies = false;
            req.headers.emplace_back("Cookie", "sid=" + session.sid);
            req.headers.emplace_back("X-CSRF-Token", session.csrf);
            break;
    }
    return req;
}

std::optional<Session> parse_login_body(const std::string &body, std::string &error) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        error = "login response is not a JSON object";
        return std::nullopt;
    }
    auto it = doc.find("session");
    if (it == doc.end() || !it->is_object()) {
        error = "login response has no session object";
        return std::nullopt;
    }
    auto sid = it->find("sid");
    auto csrf = it->find("csrf");
    if (sid == it->end() || !sid->is_string() || sid->get<std::string>().empty() ||
        csrf == it->end() || !csrf->is_string() || csrf->get<std::string>().empty()) {
        error = "login response is missing sid or csrf";
        return std::nullopt;
    }
    return Session{sid->get<std::string>(), csrf->get<std::string>()};
}

MutationVerdict interpret_dhcp_body(ApiGeneration api, const std::string &body, bool enable) {
    json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded()) return MutationVerdict::MALFORMED;
    if (!doc.is_object()) return MutationVerdict::UNCONFIRMED;

    switch (api) {
        case ApiGeneration::V6: {
            auto it = doc.find("success");
            if (it != doc.end() && it->is_boolean() && it->get<bool>()) return MutationVerdict::CONFIRMED;
            return MutationVerdict::UNCONFIRMED;
        }
        case ApiGeneration::LEGACY: {
            auto it = doc.find("status");
            const char *expected = enable ? "dhcp_enabled" : "dhcp_disabled";
            if (it != doc.end() && it->is_string() && it->get<std::string>() == expected) {
                return MutationVerdict::CONFIRMED;
            }
            return MutationVerdict::UNCONFIRMED;
        }
    }
    return MutationVerdict::UNCONFIRMED;
}

} // namespace dhcpwarden
