#include "dhcpwarden/enforcer.h"
#include "dhcpwarden/logging.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <thread>

namespace dhcpwarden {

std::optional<size_t> elect_leader(const std::vector<NodeContext> &nodes) {
    std::optional<size_t> best;
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (!nodes[i].state.reachable) continue;
        if (!best || nodes[i].priority() < nodes[*best].priority()) best = i;
    }
    return best;
}

ElectionEnforcer::ElectionEnforcer(WardenConfig config, std::vector<NodeContext> nodes, ReportSink sink)
    : config_(std::move(config)),
      nodes_(std::move(nodes)),
      reporter_(std::move(sink)),
      session_(config_.api, config_.login_timeout_ms),
      probe_(config_.api, config_.probe_timeout_ms),
      mutator_(config_.api, session_, config_.mutation_timeout_ms) {
    std::stable_sort(nodes_.begin(), nodes_.end(),
                     [](const NodeContext &a, const NodeContext &b) { return a.priority() < b.priority(); });
}

void ElectionEnforcer::probe_all(CycleResult &result) {
    result.reachable.reserve(nodes_.size());
    for (auto &node : nodes_) {
        NodeEvent event;
        event.cycle = result.cycle;
        event.node = node.name();
        try {
            probe_.check(node);
        } catch (const std::exception &e) {
            node.state.reachable = false;
            event.detail = std::string("probe error: ") + e.what();
        }
        event.kind = node.state.reachable ? NodeEventKind::ONLINE : NodeEventKind::OFFLINE;
        result.reachable.push_back(node.state.reachable);
        reporter_.emit(event);
    }
}

void ElectionEnforcer::report_mutation(const NodeContext &node, bool enable, const MutationResult &mutation) {
    NodeEvent event;
    event.cycle = cycle_;
    event.node = node.name();
    event.desired_enabled = enable;
    event.detail = mutation.detail;
    switch (mutation.outcome) {
        case MutationOutcome::SKIPPED_UNREACHABLE: event.kind = NodeEventKind::SKIPPED_UNREACHABLE; break;
        case MutationOutcome::AUTH_FAILED: event.kind = NodeEventKind::AUTH_FAILED; break;
        case MutationOutcome::SESSION_REJECTED: event.kind = NodeEventKind::SESSION_REJECTED; break;
        case MutationOutcome::APPLIED: event.kind = NodeEventKind::DHCP_APPLIED; break;
        case MutationOutcome::UNCONFIRMED: event.kind = NodeEventKind::DHCP_UNCONFIRMED; break;
        case MutationOutcome::FAILED: event.kind = NodeEventKind::DHCP_ERROR; break;
    }
    reporter_.emit(event);
}

void ElectionEnforcer::converge_all(CycleResult &result) {
    result.mutations.reserve(nodes_.size());
    for (size_t i = 0; i < nodes_.size(); ++i) {
        const bool enable = result.elected && *result.elected == i;
        MutationResult mutation;
        try {
            mutation = mutator_.apply(nodes_[i], enable);
        } catch (const std::exception &e) {
            mutation.outcome = MutationOutcome::FAILED;
            mutation.detail = std::string("unexpected error: ") + e.what();
        }
        LOG_DEBUG(LogCategory::MUTATION) << nodes_[i].name() << " desired=" << (enable ? "enabled" : "disabled")
                                         << " outcome=" << mutation_outcome_str(mutation.outcome);
        report_mutation(nodes_[i], enable, mutation);
        result.mutations.push_back(std::move(mutation));
    }
}

CycleResult ElectionEnforcer::run_cycle() {
    CycleResult result;
    result.cycle = ++cycle_;
    LOG_INFO(LogCategory::SERVICE) << "--- Starting check cycle " << cycle_ << " ---";

    probe_all(result);

    result.elected = elect_leader(nodes_);
    NodeEvent election;
    election.cycle = cycle_;
    if (result.elected) {
        election.kind = NodeEventKind::ELECTED;
        election.node = nodes_[*result.elected].name();
        election.desired_enabled = true;
    } else {
        election.kind = NodeEventKind::NO_LEADER;
    }
    reporter_.emit(election);

    converge_all(result);
    return result;
}

void ElectionEnforcer::sleep_interval(std::atomic<bool> &stop_flag) const {
    using clock = std::chrono::steady_clock;
    const auto deadline = clock::now() + std::chrono::seconds(config_.check_interval_seconds);
    while (!stop_flag.load()) {
        const auto now = clock::now();
        if (now >= deadline) break;
        std::this_thread::sleep_for(std::min<clock::duration>(deadline - now, std::chrono::milliseconds(200)));
    }
}

void ElectionEnforcer::run(std::atomic<bool> &stop_flag) {
    while (!stop_flag.load()) {
        run_cycle();
        if (stop_flag.load()) break;
        LOG_INFO(LogCategory::SERVICE) << "--- Cycle complete. Sleeping " << config_.check_interval_seconds << "s ---";
        sleep_interval(stop_flag);
    }
}

} // namespace dhcpwarden
