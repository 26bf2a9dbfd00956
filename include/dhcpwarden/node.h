#pragma once

#include "config.h"
#include "http.h"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace dhcpwarden {

// Both tokens are always stored together; the appliance needs the pair.
struct Session {
    std::string sid;
    std::string csrf;
};

// Per-node state carried across cycles by the enforcement loop.
struct NodeRuntimeState {
    bool reachable{false};
    std::optional<Session> session;
};

// One managed node: immutable identity plus its runtime state and transport.
struct NodeContext {
    NodeConfig config;
    Endpoint endpoint;
    NodeRuntimeState state;
    std::unique_ptr<HttpClient> http;

    const std::string &name() const { return config.name; }
    uint32_t priority() const { return config.priority; }
};

// Builds contexts with a SocketHttpClient per node. Fails on an address that
// does not parse.
bool make_node_contexts(const WardenConfig &config, std::vector<NodeContext> &nodes, std::string &error);

} // namespace dhcpwarden
