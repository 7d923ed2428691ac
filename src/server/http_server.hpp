#pragma once

#include <chrono>

#include "config/config_schema.hpp"
#include "httplib.h"
#include "sandbox/sandbox_executor.hpp"

namespace runbox::server {

class HttpServer {
public:
    HttpServer(config::Config config, const sandbox::SandboxExecutor& executor);

    // Blocks until Stop() is called or binding fails; false on bind failure.
    bool Listen();
    void Stop();

private:
    void RegisterRoutes();

    config::Config config_;
    const sandbox::SandboxExecutor& executor_;
    httplib::Server server_;
    std::chrono::steady_clock::time_point started_;
};

}  // namespace runbox::server
