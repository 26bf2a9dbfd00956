#include "dhcpwarden/node.h"

namespace dhcpwarden {

bool make_node_contexts(const WardenConfig &config, std::vector<NodeContext> &nodes, std::string &error) {
    std::vector<NodeContext> out;
    out.reserve(config.nodes.size());
    for (const auto &node : config.nodes) {
        NodeContext ctx;
        ctx.config = node;
        std::string parse_error;
        if (!parse_endpoint(node.address, ctx.endpoint, parse_error)) {
            error = node.name + ": " + parse_error;
            return false;
        }
        ctx.http = std::make_unique<SocketHttpClient>(ctx.endpoint, config.tls_verify);
        out.push_back(std::move(ctx));
    }
    nodes = std::move(out);
    return true;
}

} // namespace dhcpwarden
