#include "dhcpwarden/probe.h"
#include "dhcpwarden/api.h"
#include "dhcpwarden/logging.h"

namespace dhcpwarden {

HealthProbe::HealthProbe(const ApiContract &contract, uint32_t timeout_ms)
    : contract_(contract), timeout_ms_(timeout_ms) {}

bool HealthProbe::check(NodeContext &node) const {
    HttpRequest request = build_health_request(contract_, timeout_ms_);
    HttpResponse response;
    std::string error;
    bool reachable = false;
    if (!node.http->perform(request, response, error)) {
        LOG_DEBUG(LogCategory::PROBE) << node.name() << ": " << error;
    } else if (response.status >= 500) {
        LOG_DEBUG(LogCategory::PROBE) << node.name() << ": health endpoint answered HTTP " << response.status;
    } else {
        reachable = true;
    }
    node.state.reachable = reachable;
    return reachable;
}

} // namespace dhcpwarden
