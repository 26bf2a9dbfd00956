#pragma once

#include "config.h"
#include "node.h"

namespace dhcpwarden {

// Reachability check against the node's management interface. Never
// authenticates and never touches the node's session.
class HealthProbe {
public:
    HealthProbe(const ApiContract &contract, uint32_t timeout_ms);

    // Sets node.state.reachable and returns it. Transport failures and
    // 5xx replies count as unreachable, any other reply as reachable.
    bool check(NodeContext &node) const;

private:
    const ApiContract &contract_;
    uint32_t timeout_ms_;
};

} // namespace dhcpwarden
