#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "config/config_schema.hpp"
#include "sandbox/execution_context.hpp"

namespace runbox::sandbox {

struct ExecutionResult {
    int exit_code = -1;
    bool timed_out = false;
    std::string output;
    std::string error;
    // output, then error after a blank line; see CombineOutput.
    std::string combined_output;
};

std::string CombineOutput(const std::string& output, const std::string& error, int exit_code);

struct SupervisorOptions {
    // 0 leaves the limit inherited from the supervisor untouched.
    int max_processes = 20;
    std::uint64_t max_memory_bytes = 512ULL * 1024 * 1024;
    std::chrono::milliseconds poll_interval{100};
    bool monitor_enabled = true;
    std::chrono::milliseconds monitor_interval{500};

    static SupervisorOptions FromConfig(const config::Config& config);
};

class ProcessSupervisor {
public:
    explicit ProcessSupervisor(SupervisorOptions options = {});

    // Launches `command` inside ctx.directory in its own process group under
    // the configured resource ceilings and waits at most `timeout`. A timeout
    // is reported through the result, not thrown. Throws ExecutionError when
    // the process cannot be launched at all.
    ExecutionResult Run(ExecutionContext& ctx,
                        const std::vector<std::string>& command,
                        std::chrono::seconds timeout) const;

    const SupervisorOptions& Options() const { return options_; }

private:
    SupervisorOptions options_;
};

}  // namespace runbox::sandbox
