#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <iostream>
#include <string>

namespace codeact::utils {

enum class LogLevel {
    kDebug,
    kInfo,
    kWarn,
    kError
};

inline const char* ToString(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return "DEBUG";
        case LogLevel::kInfo: return "INFO";
        case LogLevel::kWarn: return "WARN";
        case LogLevel::kError: return "ERROR";
    }
    return "UNKNOWN";
}

inline LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") return LogLevel::kDebug;
    if (lowered == "info") return LogLevel::kInfo;
    if (lowered == "warn" || lowered == "warning") return LogLevel::kWarn;
    if (lowered == "error") return LogLevel::kError;
    return fallback;
}

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

inline std::atomic<LogLevel>& MinLogLevel() {
    static std::atomic<LogLevel> level{LogLevel::kInfo};
    return level;
}

inline void SetLogLevel(LogLevel level) {
    MinLogLevel().store(level);
}

inline void ApplyLogConfig(const LogConfig& config) {
    SetLogLevel(config.min_level);
}

inline bool ShouldLog(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(MinLogLevel().load());
}

// Writes "[tag] message" to stderr when the level passes the threshold.
inline void Log(LogLevel level, const char* tag, const std::string& message) {
    if (!ShouldLog(level)) {
        return;
    }
    std::cerr << "[" << tag << "] " << message << std::endl;
}

}  // namespace codeact::utils
