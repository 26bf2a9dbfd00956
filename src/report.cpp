#include "dhcpwarden/report.h"
#include "dhcpwarden/logging.h"

namespace dhcpwarden {

const char *node_event_kind_str(NodeEventKind kind) {
    switch (kind) {
        case NodeEventKind::ONLINE: return "online";
        case NodeEventKind::OFFLINE: return "offline";
        case NodeEventKind::ELECTED: return "elected";
        case NodeEventKind::NO_LEADER: return "no_leader";
        case NodeEventKind::DHCP_APPLIED: return "dhcp_applied";
        case NodeEventKind::DHCP_UNCONFIRMED: return "dhcp_unconfirmed";
        case NodeEventKind::DHCP_ERROR: return "dhcp_error";
        case NodeEventKind::AUTH_FAILED: return "auth_failed";
        case NodeEventKind::SESSION_REJECTED: return "session_rejected";
        case NodeEventKind::SKIPPED_UNREACHABLE: return "skipped_unreachable";
    }
    return "unknown";
}

std::string format_event(const NodeEvent &event) {
    std::string out = "cycle=" + std::to_string(event.cycle) + " event=" + node_event_kind_str(event.kind);
    if (!event.node.empty()) out += " node=" + event.node;
    switch (event.kind) {
        case NodeEventKind::DHCP_APPLIED:
        case NodeEventKind::DHCP_UNCONFIRMED:
        case NodeEventKind::DHCP_ERROR:
        case NodeEventKind::AUTH_FAILED:
        case NodeEventKind::SESSION_REJECTED:
        case NodeEventKind::SKIPPED_UNREACHABLE:
            out += event.desired_enabled ? " desired=enabled" : " desired=disabled";
            break;
        default:
            break;
    }
    if (!event.detail.empty()) out += " detail=\"" + event.detail + "\"";
    return out;
}

void CycleReporter::log(const NodeEvent &event) const {
    const std::string &node = event.node;
    switch (event.kind) {
        case NodeEventKind::ONLINE:
            LOG_INFO(LogCategory::PROBE) << "OK: " << node << " is online.";
            break;
        case NodeEventKind::OFFLINE:
            LOG_WARN(LogCategory::PROBE) << "FAIL: " << node << " is unreachable.";
            break;
        case NodeEventKind::ELECTED:
            LOG_INFO(LogCategory::ELECTION) << "Active DHCP server should be: " << node;
            break;
        case NodeEventKind::NO_LEADER:
            LOG_WARN(LogCategory::ELECTION) << "All servers offline. DHCP stays disabled everywhere.";
            break;
        case NodeEventKind::DHCP_APPLIED:
            LOG_INFO(LogCategory::MUTATION) << "SUCCESS: " << node << " " << event.detail << ".";
            break;
        case NodeEventKind::DHCP_UNCONFIRMED:
            LOG_WARN(LogCategory::MUTATION) << node << ": " << event.detail;
            break;
        case NodeEventKind::DHCP_ERROR:
            LOG_ERROR(LogCategory::MUTATION) << node << ": " << event.detail;
            break;
        case NodeEventKind::AUTH_FAILED:
            LOG_ERROR(LogCategory::SESSION) << "Auth error for " << node << ": " << event.detail;
            break;
        case NodeEventKind::SESSION_REJECTED:
            LOG_WARN(LogCategory::SESSION) << "Session for " << node << " rejected (" << event.detail
                                           << "), will log in again next cycle.";
            break;
        case NodeEventKind::SKIPPED_UNREACHABLE:
            LOG_DEBUG(LogCategory::MUTATION) << node << ": unreachable, DHCP left untouched.";
            break;
    }
}

void CycleReporter::emit(const NodeEvent &event) const {
    log(event);
    if (sink_.callback) sink_.callback(event);
    if (sink_.stream) {
        (*sink_.stream) << format_event(event) << '\n';
        sink_.stream->flush();
    }
}

} // namespace dhcpwarden
