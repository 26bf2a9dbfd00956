#pragma once

#include "logging.h"

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace dhcpwarden {

// Remote API generation of a node. Selected once in configuration, never
// detected from responses.
enum class ApiGeneration {
    V6,      // sid/X-CSRF-Token headers, {"success": bool} replies
    LEGACY,  // sid cookie + X-CSRF-Token header, {"status": "dhcp_enabled"} replies
};

const char *api_generation_str(ApiGeneration api);
std::optional<ApiGeneration> parse_api_generation(const std::string &name);

struct NodeConfig {
    std::string name;
    std::string address;
    std::string secret;
    uint32_t priority{0};  // lower is preferred
    ApiGeneration api{ApiGeneration::V6};
};

// Paths and status codes of the appliance API. Kept in configuration since
// the contract drifted between appliance releases.
struct ApiContract {
    std::string auth_path{"/api/auth"};
    std::string config_path{"/api/config"};
    std::string health_path{"/admin/"};
    bool restart_on_apply{true};
    std::vector<int> auth_failure_statuses{401, 403};
};

struct WardenConfig {
    std::vector<NodeConfig> nodes;
    ApiContract api;

    uint32_t check_interval_seconds{60};

    uint32_t probe_timeout_ms{5000};
    uint32_t login_timeout_ms{10000};
    uint32_t mutation_timeout_ms{15000};

    bool tls_verify{false};

    LogLevel log_level{LogLevel::ERROR | LogLevel::WARN | LogLevel::INFO};
    LogCategory log_categories{LogCategory::ALL};

    // "-" for stdout, empty to only log events
    std::string events_output;
    bool run_once{false};
};

// Returns the value of an environment-style key, or nullopt when unset.
using EnvLookup = std::function<std::optional<std::string>(const std::string &)>;

// Parses a dotenv style file into values. Missing file is not an error, it
// just yields no values; returns false only when the file exists but cannot be
// read.
bool load_env_file(const std::string &path, std::map<std::string, std::string> &values, std::string &error);

// Process environment first, then the file values.
EnvLookup make_env_lookup(std::map<std::string, std::string> file_values);

// Fills config from environment keys. Returns false (with error set) when the
// mandatory primary/secondary nodes are incomplete or any value is invalid.
bool load_config_from_env(const EnvLookup &env, WardenConfig &config, std::string &error);

// Final checks shared by the env and argument paths.
bool validate_config(const WardenConfig &config, std::string &error);

} // namespace dhcpwarden
