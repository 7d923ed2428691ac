#pragma once

#include <chrono>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/execution_directory.hpp"
#include "sandbox/execution_request.hpp"
#include "sandbox/process_supervisor.hpp"

namespace runbox::sandbox {

struct ExecutionOutcome {
    std::string execution_id;
    std::string language;
    int timeout_seconds = 0;
    ExecutionResult result;
    std::chrono::steady_clock::duration elapsed{};
};

class SandboxExecutor {
public:
    explicit SandboxExecutor(const config::Config& config);
    SandboxExecutor(config::LimitsConfig limits,
                    ExecutionDirectoryManager directories,
                    ProcessSupervisor supervisor);

    // One closed unit of work: nothing it creates on disk survives the call.
    // Throws ValidationError (before touching the filesystem) or
    // ExecutionError; timeouts come back as a result with timed_out set.
    ExecutionOutcome Execute(const ExecutionRequest& request) const;

    const ExecutionDirectoryManager& Directories() const { return directories_; }

private:
    config::LimitsConfig limits_;
    ExecutionDirectoryManager directories_;
    ProcessSupervisor supervisor_;
};

}  // namespace runbox::sandbox
