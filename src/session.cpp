#include "dhcpwarden/session.h"
#include "dhcpwarden/api.h"
#include "dhcpwarden/logging.h"

namespace dhcpwarden {

NodeSession::NodeSession(const ApiContract &contract, uint32_t timeout_ms)
    : contract_(contract), timeout_ms_(timeout_ms) {}

std::optional<Session> NodeSession::ensure_authenticated(NodeContext &node, std::string &error) const {
    if (node.state.session) return node.state.session;

    LOG_INFO(LogCategory::SESSION) << "Authenticating with " << node.name() << "...";
    HttpRequest request = build_login_request(contract_, node.config.secret, timeout_ms_);
    HttpResponse response;
    if (!node.http->perform(request, response, error)) {
        error = "auth request failed: " + error;
        return std::nullopt;
    }
    if (!response.ok()) {
        error = "auth rejected with HTTP " + std::to_string(response.status);
        return std::nullopt;
    }

    std::string parse_error;
    auto session = parse_login_body(response.body, parse_error);
    if (!session) {
        error = "auth failed: " + parse_error;
        log_payload(LogLevel::DEBUG, LogCategory::SESSION, "auth response from " + node.name(), response.body);
        return std::nullopt;
    }

    node.state.session = session;
    LOG_INFO(LogCategory::SESSION) << "New session established for " << node.name() << ".";
    return session;
}

void NodeSession::invalidate(NodeContext &node) const {
    if (node.state.session) {
        LOG_WARN(LogCategory::SESSION) << "Clearing session tokens for " << node.name() << ".";
    }
    node.state.session.reset();
    node.http->clear_cookies();
}

} // namespace dhcpwarden
