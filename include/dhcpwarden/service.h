#pragma once

#include "config.h"
#include "report.h"

#include <atomic>

namespace dhcpwarden {

// Run the failover loop until stop_flag is set (or for one cycle when
// config.run_once is set). Returns 0 on graceful exit, non-zero when the
// configuration cannot be turned into node contexts.
int run_warden(const WardenConfig &config, const ReportSink &sink, std::atomic<bool> &stop_flag);

}
