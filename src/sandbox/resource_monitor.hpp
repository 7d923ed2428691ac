#pragma once

#include <sys/types.h>

#include <chrono>
#include <string>

namespace runbox::sandbox {

// Advisory sampler of a supervised process group. Results only reach the log.
class ResourceMonitor {
public:
    // Starts a detached sampling thread that ends by itself once the leader
    // has exited. Never throws.
    static void Launch(pid_t pid, std::string execution_id, std::chrono::milliseconds interval);

    // One sampling loop, run on the calling thread. Exposed for tests.
    static void Run(pid_t pid, const std::string& execution_id, std::chrono::milliseconds interval);
};

}  // namespace runbox::sandbox
