#pragma once

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <utility>

namespace dhcpwarden {

enum class NodeEventKind {
    ONLINE,
    OFFLINE,
    ELECTED,
    NO_LEADER,
    DHCP_APPLIED,
    DHCP_UNCONFIRMED,
    DHCP_ERROR,
    AUTH_FAILED,
    SESSION_REJECTED,
    SKIPPED_UNREACHABLE,
};

const char *node_event_kind_str(NodeEventKind kind);

struct NodeEvent {
    uint64_t cycle{0};
    NodeEventKind kind{NodeEventKind::ONLINE};
    std::string node;  // empty for NO_LEADER
    bool desired_enabled{false};
    std::string detail;
};

// Observer for cycle outcomes; either member may be left empty.
struct ReportSink {
    std::ostream *stream{nullptr};
    std::function<void(const NodeEvent &)> callback;
};

// "cycle=3 event=dhcp_applied node=Primary desired=enabled detail=..."
std::string format_event(const NodeEvent &event);

// Logs every event and forwards it to the sink.
class CycleReporter {
public:
    explicit CycleReporter(ReportSink sink) : sink_(std::move(sink)) {}

    void emit(const NodeEvent &event) const;

private:
    void log(const NodeEvent &event) const;

    ReportSink sink_;
};

} // namespace dhcpwarden
