#pragma once

#include "config.h"
#include "http.h"
#include "node.h"

#include <optional>
#include <string>

namespace dhcpwarden {

enum class StatusClass {
    SUCCESS,        // 2xx
    AUTH_REJECTED,  // one of ApiContract::auth_failure_statuses
    OTHER,
};

StatusClass classify_status(const ApiContract &contract, int status);

HttpRequest build_login_request(const ApiContract &contract, const std::string &secret, uint32_t timeout_ms);

// Unauthenticated; cookies are never sent with it.
HttpRequest build_health_request(const ApiContract &contract, uint32_t timeout_ms);

// Partial update of the single dhcp.active field, with the session presented
// the way the node's API generation expects it.
HttpRequest build_dhcp_request(const ApiContract &contract, ApiGeneration api, const Session &session,
                               bool enable, uint32_t timeout_ms);

// Extracts session.sid and session.csrf. Returns nullopt (with error) unless
// the body is JSON carrying both as non-empty strings.
std::optional<Session> parse_login_body(const std::string &body, std::string &error);

enum class MutationVerdict {
    CONFIRMED,    // node explicitly acknowledged the requested state
    UNCONFIRMED,  // valid reply without the acknowledgement
    MALFORMED,    // not JSON at all
};

MutationVerdict interpret_dhcp_body(ApiGeneration api, const std::string &body, bool enable);

} // namespace dhcpwarden
