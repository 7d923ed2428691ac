#include "utils/logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace runbox::utils {
namespace {

std::atomic<LogLevel> g_min_level{LogLevel::kInfo};
std::mutex g_output_mutex;

std::string Timestamp() {
    const auto now = std::chrono::system_clock::now();
    const auto seconds = std::chrono::system_clock::to_time_t(now);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()).count() % 1000;
    std::tm local{};
    ::localtime_r(&seconds, &local);
    std::ostringstream oss;
    oss << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
        << '.' << std::setw(3) << std::setfill('0') << millis;
    return oss.str();
}

bool NeedsQuoting(const std::string& value) {
    if (value.empty()) {
        return true;
    }
    return std::any_of(value.begin(), value.end(), [](unsigned char c) {
        return std::isspace(c) || c == '"';
    });
}

}  // namespace

LogLevel ParseLogLevel(const std::string& value, LogLevel fallback) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") {
        return LogLevel::kDebug;
    }
    if (lowered == "info") {
        return LogLevel::kInfo;
    }
    if (lowered == "warn" || lowered == "warning") {
        return LogLevel::kWarn;
    }
    if (lowered == "error") {
        return LogLevel::kError;
    }
    return fallback;
}

void ConfigureLogging(const LogConfig& config) {
    g_min_level.store(config.min_level);
}

bool IsEnabled(LogLevel level) {
    return static_cast<int>(level) >= static_cast<int>(g_min_level.load());
}

std::string FormatLogLine(const LogMessage& msg) {
    std::ostringstream oss;
    oss << "[" << ToString(msg.level) << "]";
    if (!msg.tag.empty()) {
        oss << " [" << msg.tag << "]";
    }
    oss << " " << msg.message;
    for (const auto& [key, value] : msg.fields) {
        oss << " " << key << "=";
        if (NeedsQuoting(value)) {
            oss << std::quoted(value);
        } else {
            oss << value;
        }
    }
    return oss.str();
}

void Log(const LogMessage& msg) {
    if (!IsEnabled(msg.level)) {
        return;
    }
    const auto line = Timestamp() + " " + FormatLogLine(msg);
    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cerr << line << std::endl;
}

}  // namespace runbox::utils
