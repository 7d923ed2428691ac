#pragma once

#include <string>

namespace runbox::config {

struct SandboxConfig {
    std::string root = "/home/sandbox/code";
};

struct LimitsConfig {
    int default_timeout_s = 30;
    int max_timeout_s = 120;
    // 0 leaves the inherited limit untouched.
    int max_processes = 20;
    int max_memory_mb = 512;
    int poll_interval_ms = 100;
};

struct MonitorConfig {
    bool enabled = true;
    int interval_ms = 500;
};

struct ServerConfig {
    std::string host = "0.0.0.0";
    int port = 8000;
    std::string environment = "production";
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    SandboxConfig sandbox;
    LimitsConfig limits;
    MonitorConfig monitor;
    ServerConfig server;
    LoggingConfig logging;
};

}  // namespace runbox::config
