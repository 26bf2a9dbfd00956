#pragma once

#include "config.h"
#include "mutator.h"
#include "node.h"
#include "probe.h"
#include "report.h"
#include "session.h"

#include <atomic>
#include <cstdint>
#include <optional>
#include <vector>

namespace dhcpwarden {

struct CycleResult {
    uint64_t cycle{0};
    std::vector<bool> reachable;               // indexed like nodes()
    std::optional<size_t> elected;             // index into nodes()
    std::vector<MutationResult> mutations;     // one per node, in priority order
};

// Index of the reachable node with the lowest priority value, or nullopt when
// none is reachable. Equal priorities fall back to list position.
std::optional<size_t> elect_leader(const std::vector<NodeContext> &nodes);

// Runs probe, elect and converge cycles over a fixed node set. All node state
// lives here and is only touched from the calling thread.
class ElectionEnforcer {
public:
    ElectionEnforcer(WardenConfig config, std::vector<NodeContext> nodes, ReportSink sink);

    ElectionEnforcer(const ElectionEnforcer &) = delete;
    ElectionEnforcer &operator=(const ElectionEnforcer &) = delete;

    CycleResult run_cycle();

    // Cycles until stop_flag is set; the sleep between cycles is interrupted
    // by it as well.
    void run(std::atomic<bool> &stop_flag);

    const std::vector<NodeContext> &nodes() const { return nodes_; }
    std::vector<NodeContext> &nodes() { return nodes_; }

private:
    void probe_all(CycleResult &result);
    void converge_all(CycleResult &result);
    void report_mutation(const NodeContext &node, bool enable, const MutationResult &mutation);
    void sleep_interval(std::atomic<bool> &stop_flag) const;

    const WardenConfig config_;
    std::vector<NodeContext> nodes_;
    CycleReporter reporter_;
    NodeSession session_;
    HealthProbe probe_;
    ConfigMutator mutator_;
    uint64_t cycle_{0};
};

} // namespace dhcpwarden
