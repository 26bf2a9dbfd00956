#pragma once

#include "config.h"
#include "node.h"
#include "session.h"

#include <string>

namespace dhcpwarden {

enum class MutationOutcome {
    SKIPPED_UNREACHABLE,  // node not probed reachable this cycle, nothing sent
    AUTH_FAILED,          // login did not produce a session
    SESSION_REJECTED,     // update refused with an auth status, session dropped
    APPLIED,              // node confirmed the requested state
    UNCONFIRMED,          // accepted without confirmation
    FAILED,               // transport error, other status or unparsable reply
};

const char *mutation_outcome_str(MutationOutcome outcome);

struct MutationResult {
    MutationOutcome outcome{MutationOutcome::SKIPPED_UNREACHABLE};
    std::string detail;
};

// Drives a node's dhcp.active flag to the desired value, logging in on
// demand. Only SESSION_REJECTED changes the node's session.
class ConfigMutator {
public:
    ConfigMutator(const ApiContract &contract, const NodeSession &session, uint32_t timeout_ms);

    MutationResult apply(NodeContext &node, bool enable) const;

private:
    const ApiContract &contract_;
    const NodeSession &session_;
    uint32_t timeout_ms_;
};

} // namespace dhcpwarden
