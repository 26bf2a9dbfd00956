#pragma once

#include "config.h"
#include "node.h"

#include <optional>
#include <string>

namespace dhcpwarden {

// Login state machine of a node. A held session is reused until a request
// made with it is rejected for authorization reasons; only then does the
// caller invalidate it, and the next ensure_authenticated() logs in again.
class NodeSession {
public:
    NodeSession(const ApiContract &contract, uint32_t timeout_ms);

    // Returns the node's session, logging in first if none is held. On any
    // failure nothing is stored and error says why.
    std::optional<Session> ensure_authenticated(NodeContext &node, std::string &error) const;

    // Drops both tokens and the node's cookies. Safe to call repeatedly.
    void invalidate(NodeContext &node) const;

private:
    const ApiContract &contract_;
    uint32_t timeout_ms_;
};

} // namespace dhcpwarden
