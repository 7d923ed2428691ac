#pragma once

#include <chrono>
#include <string>

#include "config/config_schema.hpp"
#include "nlohmann/json.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace runbox::server {

struct JsonReply {
    int status = 200;
    nlohmann::json body = nlohmann::json::object();
};

// POST /run. Maps validation failures to 400, execution failures to 500 with
// phase "execution", anything else to an opaque 500.
JsonReply HandleRun(const std::string& body, const sandbox::SandboxExecutor& executor);

// GET /health
JsonReply HandleHealth(const config::Config& config, std::chrono::steady_clock::time_point started);

// GET /
JsonReply HandleServiceInfo(const config::Config& config);

}  // namespace runbox::server
