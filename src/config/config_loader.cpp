#include "config/config_loader.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>

#include "utils/logging.hpp"

namespace runbox::config {
namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return GetEnv(secondary);
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

std::filesystem::path GetConfigPath() {
    return GetHomePath() / ".runbox" / "config.json";
}

bool ParseBool(const std::string& value) {
    std::string lowered = value;
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

int ParseInt(const std::string& value, int fallback) {
    try {
        std::size_t consumed = 0;
        const auto parsed = std::stoi(value, &consumed);
        return consumed == value.size() ? parsed : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

void ApplyInt(const nlohmann::json& source, const char* key, int& target) {
    if (source.contains(key) && source[key].is_number_integer()) {
        target = source[key].get<int>();
    }
}

void ApplyString(const nlohmann::json& source, const char* key, std::string& target) {
    if (source.contains(key) && source[key].is_string()) {
        target = source[key].get<std::string>();
    }
}

void ApplyBool(const nlohmann::json& source, const char* key, bool& target) {
    if (source.contains(key) && source[key].is_boolean()) {
        target = source[key].get<bool>();
    }
}

void ApplyIntEnv(const char* primary, const char* secondary, int& target) {
    const auto value = GetEnvFallback(primary, secondary);
    if (!value.empty()) {
        target = ParseInt(value, target);
    }
}

Config LoadFromFile(const std::filesystem::path& config_path) {
    Config config{};
    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "failed to parse config file, keeping defaults",
                           {{"path", config_path.string()}, {"error", ex.what()}});
        }
    }
    ApplyEnvOverrides(config);
    return config;
}

}  // namespace

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("sandbox") && data["sandbox"].is_object()) {
        ApplyString(data["sandbox"], "root", config.sandbox.root);
    }

    if (data.contains("limits") && data["limits"].is_object()) {
        const auto& limits = data["limits"];
        ApplyInt(limits, "defaultTimeoutS", config.limits.default_timeout_s);
        ApplyInt(limits, "maxTimeoutS", config.limits.max_timeout_s);
        ApplyInt(limits, "maxProcesses", config.limits.max_processes);
        ApplyInt(limits, "maxMemoryMb", config.limits.max_memory_mb);
        ApplyInt(limits, "pollIntervalMs", config.limits.poll_interval_ms);
    }

    if (data.contains("monitor") && data["monitor"].is_object()) {
        ApplyBool(data["monitor"], "enabled", config.monitor.enabled);
        ApplyInt(data["monitor"], "intervalMs", config.monitor.interval_ms);
    }

    if (data.contains("server") && data["server"].is_object()) {
        const auto& server = data["server"];
        ApplyString(server, "host", config.server.host);
        ApplyInt(server, "port", config.server.port);
        ApplyString(server, "environment", config.server.environment);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ApplyString(data["logging"], "level", config.logging.level);
    }
}

void ApplyEnvOverrides(Config& config) {
    const auto root = GetEnvFallback("RUNBOX_SANDBOX__ROOT", "RUNBOX_SANDBOX_ROOT");
    if (!root.empty()) {
        config.sandbox.root = root;
    }

    ApplyIntEnv("RUNBOX_LIMITS__DEFAULT_TIMEOUT_S", "DEFAULT_TIMEOUT", config.limits.default_timeout_s);
    ApplyIntEnv("RUNBOX_LIMITS__MAX_TIMEOUT_S", "MAX_TIMEOUT", config.limits.max_timeout_s);
    ApplyIntEnv("RUNBOX_LIMITS__MAX_PROCESSES", "RUNBOX_LIMITS_MAX_PROCESSES", config.limits.max_processes);
    ApplyIntEnv("RUNBOX_LIMITS__MAX_MEMORY_MB", "RUNBOX_LIMITS_MAX_MEMORY_MB", config.limits.max_memory_mb);
    ApplyIntEnv("RUNBOX_LIMITS__POLL_INTERVAL_MS", "RUNBOX_LIMITS_POLL_INTERVAL_MS",
                config.limits.poll_interval_ms);

    const auto monitor_enabled = GetEnvFallback("RUNBOX_MONITOR__ENABLED", "RUNBOX_MONITOR_ENABLED");
    if (!monitor_enabled.empty()) {
        config.monitor.enabled = ParseBool(monitor_enabled);
    }
    ApplyIntEnv("RUNBOX_MONITOR__INTERVAL_MS", "RUNBOX_MONITOR_INTERVAL_MS", config.monitor.interval_ms);

    const auto host = GetEnvFallback("RUNBOX_SERVER__HOST", "RUNBOX_SERVER_HOST");
    if (!host.empty()) {
        config.server.host = host;
    }
    ApplyIntEnv("RUNBOX_SERVER__PORT", "PORT", config.server.port);

    const auto environment = GetEnvFallback("RUNBOX_SERVER__ENVIRONMENT", "ENVIRONMENT");
    if (!environment.empty()) {
        config.server.environment = environment;
    }

    const auto level = GetEnvFallback("RUNBOX_LOGGING__LEVEL", "RUNBOX_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }

    if (config.limits.max_timeout_s < 1) {
        config.limits.max_timeout_s = 1;
    }
    if (config.limits.poll_interval_ms < 1) {
        config.limits.poll_interval_ms = 1;
    }
    if (config.monitor.interval_ms < 1) {
        config.monitor.interval_ms = 1;
    }
}

Config LoadConfig() {
    return LoadFromFile(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    return LoadFromFile(config_path);
}

}  // namespace runbox::config
