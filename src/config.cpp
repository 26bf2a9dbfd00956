#include "dhcpwarden/config.h"
#include "dhcpwarden/http.h"
#include "dhcpwarden/logging.h"

#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

namespace dhcpwarden {

namespace {

struct NodeSlot {
    const char *prefix;
    const char *name;
    bool mandatory;
};

constexpr NodeSlot NODE_SLOTS[] = {
    {"PRIMARY", "Primary", true},
    {"SECONDARY", "Secondary", true},
    {"TERTIARY", "Tertiary", false},
    {"QUATERNARY", "Quaternary", false},
    {"QUINARY", "Quinary", false},
};

std::string trim(const std::string &s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string lower(std::string s) {
    for (auto &c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

bool parse_positive(const std::string &key, const std::string &text, uint32_t &out, std::string &error) {
    std::string value = trim(text);
    uint64_t parsed = 0;
    bool valid = !value.empty() && value.size() <= 10;
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            valid = false;
            break;
        }
        parsed = parsed * 10 + static_cast<uint64_t>(c - '0');
    }
    if (!valid || parsed == 0 || parsed > 0xFFFFFFFFull) {
        error = key + " must be a positive integer, got '" + text + "'";
        return false;
    }
    out = static_cast<uint32_t>(parsed);
    return true;
}

bool parse_bool(const std::string &key, const std::string &text, bool &out, std::string &error) {
    std::string value = lower(trim(text));
    if (value == "1" || value == "true" || value == "yes" || value == "on") {
        out = true;
        return true;
    }
    if (value == "0" || value == "false" || value == "no" || value == "off") {
        out = false;
        return true;
    }
    error = key + " must be a boolean, got '" + text + "'";
    return false;
}

bool parse_status_list(const std::string &text, std::vector<int> &out, std::string &error) {
    std::vector<int> statuses;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        uint32_t code = 0;
        if (!parse_positive("AUTH_FAILURE_STATUSES", item, code, error)) return false;
        if (code < 100 || code > 599) {
            error = "AUTH_FAILURE_STATUSES entry " + item + " is not an HTTP status";
            return false;
        }
        statuses.push_back(static_cast<int>(code));
    }
    if (statuses.empty()) {
        error = "AUTH_FAILURE_STATUSES must list at least one status";
        return false;
    }
    out = std::move(statuses);
    return true;
}

std::optional<std::string> non_empty(const EnvLookup &env, const std::string &key) {
    auto v = env(key);
    if (!v) return std::nullopt;
    std::string t = trim(*v);
    if (t.empty()) return std::nullopt;
    return t;
}

} // namespace

const char *api_generation_str(ApiGeneration api) {
    switch (api) {
        case ApiGeneration::V6: return "v6";
        case ApiGeneration::LEGACY: return "legacy";
    }
    return "?";
}

std::optional<ApiGeneration> parse_api_generation(const std::string &name) {
    std::string n = lower(trim(name));
    if (n == "v6" || n == "current" || n == "new") return ApiGeneration::V6;
    if (n == "legacy" || n == "v5") return ApiGeneration::LEGACY;
    return std::nullopt;
}

bool load_env_file(const std::string &path, std::map<std::string, std::string> &values, std::string &error) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) return true;  // the file is optional

    std::ifstream probe(path);
    if (!probe.is_open()) {
        error = "cannot open " + path;
        return false;
    }

    std::string line;
    size_t lineno = 0;
    while (std::getline(probe, line)) {
        ++lineno;
        std::string t = trim(line);
        if (t.empty() || t[0] == '#') continue;
        if (t.rfind("export ", 0) == 0) t = trim(t.substr(7));
        size_t eq = t.find('=');
        if (eq == std::string::npos || eq == 0) {
            LOG_WARN(LogCategory::CONFIG) << path << ":" << lineno << ": ignoring line without KEY=VALUE";
            continue;
        }
        std::string key = trim(t.substr(0, eq));
        std::string value = trim(t.substr(eq + 1));
        if (value.size() >= 2 && (value.front() == '"' || value.front() == '\'') && value.back() == value.front()) {
            value = value.substr(1, value.size() - 2);
        } else {
            size_t comment = value.find(" #");
            if (comment != std::string::npos) value = trim(value.substr(0, comment));
        }
        values[key] = value;
    }
    if (probe.bad()) {
        error = "failed to read " + path;
        return false;
    }
    return true;
}

EnvLookup make_env_lookup(std::map<std::string, std::string> file_values) {
    return [file_values = std::move(file_values)](const std::string &key) -> std::optional<std::string> {
        if (const char *v = std::getenv(key.c_str())) return std::string(v);
        auto it = file_values.find(key);
        if (it != file_values.end()) return it->second;
        return std::nullopt;
    };
}

bool load_config_from_env(const EnvLookup &env, WardenConfig &config, std::string &error) {
    std::vector<NodeConfig> nodes;
    for (const auto &slot : NODE_SLOTS) {
        const std::string prefix = slot.prefix;
        auto ip = non_empty(env, prefix + "_PIHOLE_IP");
        auto token = non_empty(env, prefix + "_PIHOLE_TOKEN");
        if (!ip || !token) {
            if (slot.mandatory) {
                error = "Ensure that PRIMARY and SECONDARY IP/Password are set (missing " + prefix +
                        (ip ? "_PIHOLE_TOKEN" : "_PIHOLE_IP") + ")";
                return false;
            }
            if (ip || token) {
                LOG_WARN(LogCategory::CONFIG) << prefix << " node ignored: both " << prefix << "_PIHOLE_IP and "
                                              << prefix << "_PIHOLE_TOKEN are required";
            }
            continue;
        }
        NodeConfig node;
        node.name = slot.name;
        node.address = *ip;
        node.secret = *token;
        node.priority = static_cast<uint32_t>(nodes.size());
        if (auto api = non_empty(env, prefix + "_PIHOLE_API")) {
            auto parsed = parse_api_generation(*api);
            if (!parsed) {
                error = prefix + "_PIHOLE_API must be 'v6' or 'legacy', got '" + *api + "'";
                return false;
            }
            node.api = *parsed;
        }
        nodes.push_back(std::move(node));
    }
    config.nodes = std::move(nodes);

    if (auto v = non_empty(env, "CHECK_INTERVAL")) {
        if (!parse_positive("CHECK_INTERVAL", *v, config.check_interval_seconds, error)) return false;
    }
    if (auto v = non_empty(env, "PROBE_TIMEOUT_MS")) {
        if (!parse_positive("PROBE_TIMEOUT_MS", *v, config.probe_timeout_ms, error)) return false;
    }
    if (auto v = non_empty(env, "LOGIN_TIMEOUT_MS")) {
        if (!parse_positive("LOGIN_TIMEOUT_MS", *v, config.login_timeout_ms, error)) return false;
    }
    if (auto v = non_empty(env, "MUTATION_TIMEOUT_MS")) {
        if (!parse_positive("MUTATION_TIMEOUT_MS", *v, config.mutation_timeout_ms, error)) return false;
    }
    if (auto v = non_empty(env, "HEALTH_PATH")) config.api.health_path = *v;
    if (auto v = non_empty(env, "AUTH_PATH")) config.api.auth_path = *v;
    if (auto v = non_empty(env, "CONFIG_PATH")) config.api.config_path = *v;
    if (auto v = non_empty(env, "RESTART_DHCP")) {
        if (!parse_bool("RESTART_DHCP", *v, config.api.restart_on_apply, error)) return false;
    }
    if (auto v = non_empty(env, "AUTH_FAILURE_STATUSES")) {
        if (!parse_status_list(*v, config.api.auth_failure_statuses, error)) return false;
    }
    if (auto v = non_empty(env, "TLS_VERIFY")) {
        if (!parse_bool("TLS_VERIFY", *v, config.tls_verify, error)) return false;
    }
    if (auto v = non_empty(env, "LOG_LEVEL")) {
        auto level = parse_log_level(lower(*v));
        if (!level) {
            error = "LOG_LEVEL must be one of error, warn, info, debug, trace; got '" + *v + "'";
            return false;
        }
        config.log_level = *level;
    }
    if (auto v = non_empty(env, "LOG_CATEGORIES")) {
        auto cats = parse_log_categories(lower(*v));
        if (!cats) {
            error = "LOG_CATEGORIES must list service, config, http, probe, session, mutation, election or all; got '" +
                    *v + "'";
            return false;
        }
        config.log_categories = *cats;
    }
    return true;
}

bool validate_config(const WardenConfig &config, std::string &error) {
    if (config.nodes.size() < 2) {
        error = "at least two nodes are required, " + std::to_string(config.nodes.size()) + " configured";
        return false;
    }
    for (const auto &node : config.nodes) {
        if (node.address.empty() || node.secret.empty()) {
            error = node.name + ": address and secret are required";
            return false;
        }
        Endpoint endpoint;
        std::string parse_error;
        if (!parse_endpoint(node.address, endpoint, parse_error)) {
            error = node.name + ": " + parse_error;
            return false;
        }
    }
    if (config.check_interval_seconds == 0) {
        error = "check interval must be positive";
        return false;
    }
    if (config.probe_timeout_ms == 0 || config.login_timeout_ms == 0 || config.mutation_timeout_ms == 0) {
        error = "request timeouts must be positive";
        return false;
    }
    for (const std::string *path : {&config.api.auth_path, &config.api.config_path, &config.api.health_path}) {
        if (path->empty() || (*path)[0] != '/') {
            error = "API path '" + *path + "' must start with '/'";
            return false;
        }
    }
    if (config.api.auth_failure_statuses.empty()) {
        error = "no authorization failure statuses configured";
        return false;
    }
    return true;
}

} // namespace dhcpwarden
