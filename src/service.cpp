#include "dhcpwarden/service.h"
#include "dhcpwarden/enforcer.h"
#include "dhcpwarden/logging.h"
#include "dhcpwarden/node.h"

#include <iostream>
#include <string>
#include <vector>

namespace dhcpwarden {

int run_warden(const WardenConfig &config, const ReportSink &sink, std::atomic<bool> &stop) {
    std::string error;
    if (!validate_config(config, error)) {
        std::cerr << "error: " << error << std::endl;
        return 1;
    }

    std::vector<NodeContext> nodes;
    if (!make_node_contexts(config, nodes, error)) {
        std::cerr << "error: " << error << std::endl;
        return 1;
    }

    LOG_INFO(LogCategory::CONFIG) << "Configured for " << nodes.size() << " DHCP nodes.";
    for (const auto &node : nodes) {
        LOG_INFO(LogCategory::CONFIG) << "  " << node.name() << " (priority " << node.priority() << ") at "
                                      << node.endpoint.base_url() << ", api " << api_generation_str(node.config.api);
    }

    ElectionEnforcer enforcer(config, std::move(nodes), sink);
    if (config.run_once) {
        enforcer.run_cycle();
        return 0;
    }
    enforcer.run(stop);
    LOG_INFO(LogCategory::SERVICE) << "Stop requested, exiting.";
    return 0;
}

} // namespace dhcpwarden
