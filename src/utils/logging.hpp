#pragma once

#include <string>
#include <utility>
#include <vector>

namespace runbox::utils {

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

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback = LogLevel::kInfo);

using LogFields = std::vector<std::pair<std::string, std::string>>;

struct LogMessage {
    LogLevel level;
    std::string tag;
    std::string message;
    LogFields fields;
};

struct LogConfig {
    LogLevel min_level = LogLevel::kInfo;
};

void ConfigureLogging(const LogConfig& config);
bool IsEnabled(LogLevel level);
void Log(const LogMessage& msg);

// Formats one line without writing it; exposed for tests.
std::string FormatLogLine(const LogMessage& msg);

inline void LogDebug(std::string tag, std::string message, LogFields fields = {}) {
    Log({LogLevel::kDebug, std::move(tag), std::move(message), std::move(fields)});
}

inline void LogInfo(std::string tag, std::string message, LogFields fields = {}) {
    Log({LogLevel::kInfo, std::move(tag), std::move(message), std::move(fields)});
}

inline void LogWarn(std::string tag, std::string message, LogFields fields = {}) {
    Log({LogLevel::kWarn, std::move(tag), std::move(message), std::move(fields)});
}

inline void LogError(std::string tag, std::string message, LogFields fields = {}) {
    Log({LogLevel::kError, std::move(tag), std::move(message), std::move(fields)});
}

}  // namespace runbox::utils
