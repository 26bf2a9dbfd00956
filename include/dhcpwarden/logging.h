#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>

namespace dhcpwarden {

// Log levels (can be combined as bitmask)
enum class LogLevel : uint32_t {
    NONE    = 0,
    ERROR   = 1 << 0,  // Always show errors
    WARN    = 1 << 1,  // Warnings
    INFO    = 1 << 2,  // Cycle and per-node outcomes
    DEBUG   = 1 << 3,  // Request level detail
    TRACE   = 1 << 4,  // Raw HTTP payloads
    ALL     = 0xFFFFFFFF
};

// Log categories (can be combined as bitmask)
enum class LogCategory : uint32_t {
    NONE     = 0,
    SERVICE  = 1 << 0,   // Process lifecycle, cycle loop
    CONFIG   = 1 << 1,   // Environment and argument parsing
    HTTP     = 1 << 2,   // Socket/TLS transport
    PROBE    = 1 << 3,   // Health checks
    SESSION  = 1 << 4,   // Login and invalidation
    MUTATION = 1 << 5,   // DHCP config updates
    ELECTION = 1 << 6,   // Leader choice and reporting
    ALL      = 0xFFFFFFFF
};

inline LogLevel operator|(LogLevel a, LogLevel b) {
    return static_cast<LogLevel>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline LogLevel operator&(LogLevel a, LogLevel b) {
    return static_cast<LogLevel>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

inline LogCategory operator|(LogCategory a, LogCategory b) {
    return static_cast<LogCategory>(static_cast<uint32_t>(a) | static_cast<uint32_t>(b));
}

inline LogCategory operator&(LogCategory a, LogCategory b) {
    return static_cast<LogCategory>(static_cast<uint32_t>(a) & static_cast<uint32_t>(b));
}

class Logger {
public:
    static Logger& instance() {
        static Logger logger;
        return logger;
    }

    void set_level(LogLevel level) { level_ = level; }
    void set_categories(LogCategory cats) { categories_ = cats; }

    bool should_log(LogLevel level, LogCategory cat) const {
        return (static_cast<uint32_t>(level_) & static_cast<uint32_t>(level)) != 0 &&
               (static_cast<uint32_t>(categories_) & static_cast<uint32_t>(cat)) != 0;
    }

    static const char* level_str(LogLevel level) {
        switch (level) {
            case LogLevel::ERROR: return "ERROR";
            case LogLevel::WARN:  return "WARN ";
            case LogLevel::INFO:  return "INFO ";
            case LogLevel::DEBUG: return "DEBUG";
            case LogLevel::TRACE: return "TRACE";
            default: return "?????";
        }
    }

    static const char* category_str(LogCategory cat) {
        switch (cat) {
            case LogCategory::SERVICE:  return "SERVICE ";
            case LogCategory::CONFIG:   return "CONFIG  ";
            case LogCategory::HTTP:     return "HTTP    ";
            case LogCategory::PROBE:    return "PROBE   ";
            case LogCategory::SESSION:  return "SESSION ";
            case LogCategory::MUTATION: return "MUTATION";
            case LogCategory::ELECTION: return "ELECTION";
            default: return "????????";
        }
    }

    // "2024-05-01 12:00:00,123", local time
    static std::string timestamp() {
        using clock = std::chrono::system_clock;
        const auto now = clock::now();
        const std::time_t secs = clock::to_time_t(now);
        const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                                now.time_since_epoch()).count() % 1000;
        std::tm tm_buf{};
        localtime_r(&secs, &tm_buf);
        char date[32];
        std::strftime(date, sizeof(date), "%Y-%m-%d %H:%M:%S", &tm_buf);
        char out[40];
        std::snprintf(out, sizeof(out), "%s,%03d", date, static_cast<int>(millis));
        return out;
    }

private:
    Logger() : level_(LogLevel::ERROR | LogLevel::WARN | LogLevel::INFO),
               categories_(LogCategory::ALL) {}

    LogLevel level_;
    LogCategory categories_;
};

// Helper class for streaming log messages
class LogStream {
public:
    LogStream(LogLevel level, LogCategory cat, bool enabled)
        : enabled_(enabled), level_(level), cat_(cat) {}

    ~LogStream() {
        if (enabled_) {
            std::cerr << Logger::timestamp() << " "
                      << "[" << Logger::level_str(level_) << "] "
                      << "[" << Logger::category_str(cat_) << "] "
                      << ss_.str() << std::endl;
        }
    }

    template<typename T>
    LogStream& operator<<(const T& value) {
        if (enabled_) {
            ss_ << value;
        }
        return *this;
    }

private:
    bool enabled_;
    LogLevel level_;
    LogCategory cat_;
    std::ostringstream ss_;
};

// Macros for zero-overhead logging when disabled
#define LOG(level, cat) \
    if (!dhcpwarden::Logger::instance().should_log(level, cat)) {} \
    else dhcpwarden::LogStream(level, cat, true)

#define LOG_ERROR(cat)   LOG(dhcpwarden::LogLevel::ERROR, cat)
#define LOG_WARN(cat)    LOG(dhcpwarden::LogLevel::WARN, cat)
#define LOG_INFO(cat)    LOG(dhcpwarden::LogLevel::INFO, cat)
#define LOG_DEBUG(cat)   LOG(dhcpwarden::LogLevel::DEBUG, cat)
#define LOG_TRACE(cat)   LOG(dhcpwarden::LogLevel::TRACE, cat)

// Payload dump helper, non-printable bytes are escaped
inline void log_payload(LogLevel level, LogCategory cat, const std::string& label,
                        const std::string& body, size_t max_len = 512) {
    if (!Logger::instance().should_log(level, cat)) return;

    std::ostringstream ss;
    ss << label << " (" << body.size() << " bytes): ";
    for (size_t i = 0; i < body.size() && i < max_len; ++i) {
        unsigned char c = static_cast<unsigned char>(body[i]);
        if (c >= 0x20 && c < 0x7f) {
            ss << static_cast<char>(c);
        } else {
            char hex[8];
            snprintf(hex, sizeof(hex), "\\x%02x", c);
            ss << hex;
        }
    }
    if (body.size() > max_len) ss << "...";

    LogStream(level, cat, true) << ss.str();
}

// Cumulative mask for a level name: "debug" enables ERROR through DEBUG.
inline std::optional<LogLevel> parse_log_level(const std::string& name) {
    LogLevel mask = LogLevel::ERROR;
    if (name == "error") return mask;
    mask = mask | LogLevel::WARN;
    if (name == "warn" || name == "warning") return mask;
    mask = mask | LogLevel::INFO;
    if (name == "info") return mask;
    mask = mask | LogLevel::DEBUG;
    if (name == "debug") return mask;
    mask = mask | LogLevel::TRACE;
    if (name == "trace") return mask;
    return std::nullopt;
}

// Mask for a comma separated list of category names, or "all".
inline std::optional<LogCategory> parse_log_categories(const std::string& list) {
    LogCategory mask = LogCategory::NONE;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        std::string name = list.substr(start, comma - start);
        name.erase(0, name.find_first_not_of(" \t"));
        name.erase(name.find_last_not_of(" \t") + 1);
        start = comma + 1;
        if (name.empty()) continue;
        if (name == "all") mask = mask | LogCategory::ALL;
        else if (name == "service") mask = mask | LogCategory::SERVICE;
        else if (name == "config") mask = mask | LogCategory::CONFIG;
        else if (name == "http") mask = mask | LogCategory::HTTP;
        else if (name == "probe") mask = mask | LogCategory::PROBE;
        else if (name == "session") mask = mask | LogCategory::SESSION;
        else if (name == "mutation") mask = mask | LogCategory::MUTATION;
        else if (name == "election") mask = mask | LogCategory::ELECTION;
        else return std::nullopt;
    }
    if (mask == LogCategory::NONE) return std::nullopt;
    return mask;
}

} // namespace dhcpwarden
