#include "dhcpwarden/config.h"
#include "dhcpwarden/logging.h"
#include "dhcpwarden/service.h"

#include <atomic>
#include <csignal>
#include <fstream>
#include <iostream>
#include <map>
#include <optional>
#include <string>

using namespace dhcpwarden;

static std::atomic<bool> *g_stop_flag = nullptr;

void handle_stop_signal(int) {
    if (g_stop_flag) g_stop_flag->store(true);
}

static void print_usage() {
    std::cerr << "Usage: dhcpwarden [--env-file path] [--interval seconds] [--log-level level] "
                 "[--events-out path|-] [--once] [--tls-verify]\n"
                 "Nodes come from PRIMARY_PIHOLE_IP/TOKEN, SECONDARY_PIHOLE_IP/TOKEN and the optional\n"
                 "TERTIARY/QUATERNARY/QUINARY slots, read from the environment or the env file." << std::endl;
}

struct CliOptions {
    std::string env_file{".env"};
    std::optional<std::string> interval;
    std::optional<std::string> log_level;
    std::optional<std::string> events_output;
    bool run_once{false};
    bool tls_verify{false};
    bool help{false};
};

static bool parse_args(int argc, char **argv, CliOptions &opts, std::string &error) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&](std::string &out) -> bool {
            if (i + 1 >= argc) {
                error = "missing value for " + arg;
                return false;
            }
            out = argv[++i];
            return true;
        };
        std::string value;
        if (arg == "--env-file") {
            if (!next(opts.env_file)) return false;
        } else if (arg == "--interval") {
            if (!next(value)) return false;
            opts.interval = value;
        } else if (arg == "--log-level") {
            if (!next(value)) return false;
            opts.log_level = value;
        } else if (arg == "--events-out") {
            if (!next(value)) return false;
            opts.events_output = value;
        } else if (arg == "--once") {
            opts.run_once = true;
        } else if (arg == "--tls-verify") {
            opts.tls_verify = true;
        } else if (arg == "--help" || arg == "-h") {
            opts.help = true;
        } else {
            error = "unknown argument " + arg;
            return false;
        }
    }
    return true;
}

int main(int argc, char **argv) {
    CliOptions opts;
    std::string error;
    if (!parse_args(argc, argv, opts, error)) {
        std::cerr << "error: " << error << std::endl;
        print_usage();
        return 1;
    }
    if (opts.help) {
        print_usage();
        return 0;
    }

    std::map<std::string, std::string> file_values;
    if (!load_env_file(opts.env_file, file_values, error)) {
        std::cerr << "error: " << error << std::endl;
        return 1;
    }

    // Command line values override the environment
    std::map<std::string, std::string> overrides;
    if (opts.interval) overrides["CHECK_INTERVAL"] = *opts.interval;
    if (opts.log_level) overrides["LOG_LEVEL"] = *opts.log_level;
    EnvLookup env_lookup = make_env_lookup(std::move(file_values));
    EnvLookup lookup = [&](const std::string &key) -> std::optional<std::string> {
        auto it = overrides.find(key);
        if (it != overrides.end()) return it->second;
        return env_lookup(key);
    };

    WardenConfig config;
    if (!load_config_from_env(lookup, config, error)) {
        std::cerr << "error: " << error << std::endl;
        return 1;
    }
    if (opts.events_output) config.events_output = *opts.events_output;
    if (opts.tls_verify) config.tls_verify = true;
    config.run_once = opts.run_once;
    Logger::instance().set_level(config.log_level);
    Logger::instance().set_categories(config.log_categories);

    LOG_INFO(LogCategory::SERVICE) << "DHCP Controller started.";

    std::atomic<bool> stop{false};
    g_stop_flag = &stop;
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
    std::signal(SIGPIPE, SIG_IGN);

    ReportSink sink;
    std::ofstream events_file;
    if (config.events_output == "-") {
        sink.stream = &std::cout;
    } else if (!config.events_output.empty()) {
        events_file.open(config.events_output, std::ios::out | std::ios::app);
        if (!events_file.good()) {
            std::cerr << "error: cannot open event output " << config.events_output << std::endl;
            return 1;
        }
        sink.stream = &events_file;
    }
    return run_warden(config, sink, stop);
}
