#include "dhcpwarden/mutator.h"
#include "dhcpwarden/api.h"
#include "dhcpwarden/logging.h"

namespace dhcpwarden {

const char *mutation_outcome_str(MutationOutcome outcome) {
    switch (outcome) {
        case MutationOutcome::SKIPPED_UNREACHABLE: return "skipped_unreachable";
        case MutationOutcome::AUTH_FAILED: return "auth_failed";
        case MutationOutcome::SESSION_REJECTED: return "session_rejected";
        case MutationOutcome::APPLIED: return "applied";
        case MutationOutcome::UNCONFIRMED: return "unconfirmed";
        case MutationOutcome::FAILED: return "failed";
    }
    return "unknown";
}

ConfigMutator::ConfigMutator(const ApiContract &contract, const NodeSession &session, uint32_t timeout_ms)
    : contract_(contract), session_(session), timeout_ms_(timeout_ms) {}

MutationResult ConfigMutator::apply(NodeContext &node, bool enable) const {
    MutationResult result;
    if (!node.state.reachable) {
        result.outcome = MutationOutcome::SKIPPED_UNREACHABLE;
        return result;
    }

    std::string error;
    auto session = session_.ensure_authenticated(node, error);
    if (!session) {
        result.outcome = MutationOutcome::AUTH_FAILED;
        result.detail = error;
        return result;
    }

    const char *action = enable ? "enabled" : "disabled";
    LOG_INFO(LogCategory::MUTATION) << "Setting DHCP on " << node.name() << " to " << action << "...";
    HttpRequest request = build_dhcp_request(contract_, node.config.api, *session, enable, timeout_ms_);
    HttpResponse response;
    if (!node.http->perform(request, response, error)) {
        result.outcome = MutationOutcome::FAILED;
        result.detail = "request error: " + error;
        return result;
    }

    switch (classify_status(contract_, response.status)) {
        case StatusClass::AUTH_REJECTED:
            session_.invalidate(node);
            result.outcome = MutationOutcome::SESSION_REJECTED;
            result.detail = "session rejected with HTTP " + std::to_string(response.status);
            return result;
        case StatusClass::OTHER:
            result.outcome = MutationOutcome::FAILED;
            result.detail = "HTTP error " + std::to_string(response.status);
            if (!response.reason.empty()) result.detail += " " + response.reason;
            return result;
        case StatusClass::SUCCESS:
            break;
    }

    switch (interpret_dhcp_body(node.config.api, response.body, enable)) {
        case MutationVerdict::CONFIRMED:
            result.outcome = MutationOutcome::APPLIED;
            result.detail = std::string("DHCP is now ") + action;
            break;
        case MutationVerdict::UNCONFIRMED:
            result.outcome = MutationOutcome::UNCONFIRMED;
            result.detail = "unexpected response: " + response.body.substr(0, 256);
            break;
        case MutationVerdict::MALFORMED:
            result.outcome = MutationOutcome::FAILED;
            result.detail = "malformed response body";
            break;
    }
    return result;
}

} // namespace dhcpwarden
