#include "sandbox/process_supervisor.hpp"

#include <boost/process.hpp>
#include <boost/process/extend.hpp>
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <system_error>
#include <thread>
#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include "nlohmann/json.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/proc_stats.hpp"
#include "sandbox/resource_monitor.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace bp = boost::process;

namespace {

constexpr std::size_t kSnippetLength = 100;

// Runs in the forked child before execve: new process group plus the resource
// ceilings, all inherited by whatever the child spawns. Only async-signal-safe
// calls are allowed here.
class ChildSetup : public bp::extend::handler {
public:
    ChildSetup(rlim_t max_processes, rlim_t cpu_seconds, rlim_t max_memory_bytes)
        : max_processes_(max_processes)
        , cpu_seconds_(cpu_seconds)
        , max_memory_bytes_(max_memory_bytes) {}

    template <typename Executor>
    void on_exec_setup(Executor& exec) const {
        if (::setpgid(0, 0) != 0) {
            Fail(exec, "setpgid failed");
        }
        if (max_processes_ > 0 && !SetLimit(RLIMIT_NPROC, max_processes_)) {
            Fail(exec, "setrlimit(RLIMIT_NPROC) failed");
        }
        if (cpu_seconds_ > 0 && !SetLimit(RLIMIT_CPU, cpu_seconds_)) {
            Fail(exec, "setrlimit(RLIMIT_CPU) failed");
        }
        if (max_memory_bytes_ > 0 && !SetLimit(RLIMIT_AS, max_memory_bytes_)) {
            Fail(exec, "setrlimit(RLIMIT_AS) failed");
        }
    }

private:
    // Soft and hard limit both, capped at the current hard limit so an
    // unprivileged supervisor can still lower it.
    static bool SetLimit(int resource, rlim_t value) {
        struct rlimit current {};
        if (::getrlimit(resource, &current) != 0) {
            return false;
        }
        if (current.rlim_max != RLIM_INFINITY && value > current.rlim_max) {
            value = current.rlim_max;
        }
        struct rlimit limit {};
        limit.rlim_cur = value;
        limit.rlim_max = value;
        return ::setrlimit(resource, &limit) == 0;
    }

    template <typename Executor>
    [[noreturn]] static void Fail(Executor& exec, const char* what) {
        const int err = errno;
        exec.set_error(std::error_code(err, std::system_category()), what);
        ::_exit(EXIT_FAILURE);
    }

    rlim_t max_processes_;
    rlim_t cpu_seconds_;
    rlim_t max_memory_bytes_;
};

std::string ReadCapture(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::in | std::ios::binary);
    if (!input.is_open()) {
        return {};
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

// Names containing a slash are taken as paths, anything else is looked up on
// PATH. Empty when nothing executable was found.
std::string ResolveExecutable(const std::string& name) {
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? name : std::string();
    }
    return bp::search_path(name).string();
}

int DecodeStatus(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

void SignalGroup(pid_t pgid, int signal, const std::string& execution_id) {
    if (::killpg(pgid, signal) != 0) {
        utils::LogDebug("supervisor", "error signalling process group", {
            {"exec_id", execution_id},
            {"pgid", std::to_string(pgid)},
            {"signal", std::to_string(signal)},
            {"error", std::strerror(errno)}
        });
    }
}

void ReapChild(pid_t pid, int& status) {
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            break;
        }
    }
}

// SIGKILL whatever is left in the group once the leader has been reaped. The
// pgid cannot be handed to a new process while any member still holds it.
void SweepGroup(pid_t pgid, const std::string& execution_id) {
    if (::killpg(pgid, SIGKILL) == 0) {
        utils::LogDebug("supervisor", "killed leftover group members",
                        {{"exec_id", execution_id}, {"pgid", std::to_string(pgid)}});
    } else if (errno != ESRCH) {
        utils::LogDebug("supervisor", "error sweeping process group",
                        {{"exec_id", execution_id}, {"error", std::strerror(errno)}});
    }
}

// Timeout path: SIGTERM to the group, SIGKILL to the direct child whether or
// not that worked, reap the child, then SIGKILL anything left in the group.
void TerminateTree(pid_t pid, const std::string& execution_id) {
    const auto members = ListProcessGroup(pid);
    utils::LogDebug("supervisor", "process tree before killing", {
        {"exec_id", execution_id},
        {"parent", std::to_string(pid)},
        {"members", std::to_string(members.size())}
    });

    utils::LogDebug("supervisor", "attempting to kill process group",
                    {{"exec_id", execution_id}, {"pgid", std::to_string(pid)}});
    SignalGroup(pid, SIGTERM, execution_id);

    utils::LogDebug("supervisor", "killing process directly",
                    {{"exec_id", execution_id}, {"pid", std::to_string(pid)}});
    if (::kill(pid, SIGKILL) != 0) {
        utils::LogDebug("supervisor", "error killing process",
                        {{"exec_id", execution_id}, {"error", std::strerror(errno)}});
    }

    int status = 0;
    ReapChild(pid, status);

    SweepGroup(pid, execution_id);
}

}  // namespace

std::string CombineOutput(const std::string& output, const std::string& error, int exit_code) {
    std::string combined = output;
    if (!error.empty()) {
        if (!combined.empty()) {
            combined += "\n\n" + error;
        } else {
            combined = error;
        }
    }
    if (combined.empty() && exit_code != 0) {
        combined = "Process exited with code " + std::to_string(exit_code);
    }
    return combined;
}

SupervisorOptions SupervisorOptions::FromConfig(const config::Config& config) {
    SupervisorOptions options;
    options.max_processes = std::max(0, config.limits.max_processes);
    options.max_memory_bytes =
        static_cast<std::uint64_t>(std::max(0, config.limits.max_memory_mb)) * 1024 * 1024;
    options.poll_interval = std::chrono::milliseconds(std::max(1, config.limits.poll_interval_ms));
    options.monitor_enabled = config.monitor.enabled;
    options.monitor_interval = std::chrono::milliseconds(std::max(1, config.monitor.interval_ms));
    return options;
}

ProcessSupervisor::ProcessSupervisor(SupervisorOptions options)
    : options_(std::move(options)) {}

ExecutionResult ProcessSupervisor::Run(ExecutionContext& ctx,
                                       const std::vector<std::string>& command,
                                       std::chrono::seconds timeout) const {
    if (command.empty()) {
        throw ExecutionError("Execution error: empty launch command");
    }
    const auto executable = ResolveExecutable(command.front());
    if (executable.empty()) {
        utils::LogError("supervisor", "command not found",
                        {{"exec_id", ctx.id}, {"command", command.front()}});
        throw ExecutionError("Execution error: command not found: " + command.front());
    }

    const std::vector<std::string> args(command.begin() + 1, command.end());
    if (ctx.stdout_file.empty() || ctx.stderr_file.empty()) {
        throw ExecutionError("Execution error: output capture files not allocated");
    }
    const auto& stdout_path = ctx.stdout_file;
    const auto& stderr_path = ctx.stderr_file;

    utils::LogInfo("supervisor", "starting execution",
                   {{"exec_id", ctx.id}, {"timeout", std::to_string(timeout.count()) + "s"}});

    ctx.phases.execution.Begin();
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    pid_t pid = 0;
    try {
        bp::child child(
            bp::exe = executable,
            bp::args = args,
            bp::start_dir = ctx.directory.string(),
            bp::std_in < bp::null,
            bp::std_out > stdout_path.string(),
            bp::std_err > stderr_path.string(),
            ChildSetup(static_cast<rlim_t>(options_.max_processes),
                       static_cast<rlim_t>(timeout.count()),
                       static_cast<rlim_t>(options_.max_memory_bytes)));
        pid = child.id();
        // Reaped below with waitpid; boost must not touch it afterwards.
        child.detach();
    } catch (const bp::process_error& ex) {
        ctx.phases.execution.Finish();
        utils::LogError("supervisor", "execution error", {{"exec_id", ctx.id}, {"error", ex.what()}});
        throw ExecutionError(std::string("Execution error: ") + ex.what());
    }
    utils::LogDebug("supervisor", "process started",
                    {{"exec_id", ctx.id}, {"pid", std::to_string(pid)}});

    if (options_.monitor_enabled) {
        ResourceMonitor::Launch(pid, ctx.id, options_.monitor_interval);
    }

    ExecutionResult result{};
    int status = 0;
    bool finished = false;
    while (true) {
        const auto waited = ::waitpid(pid, &status, WNOHANG);
        if (waited == pid) {
            finished = true;
            break;
        }
        if (waited < 0 && errno != EINTR) {
            const std::string reason = std::strerror(errno);
            SignalGroup(pid, SIGKILL, ctx.id);
            ctx.phases.execution.Finish();
            utils::LogError("supervisor", "waitpid failed", {{"exec_id", ctx.id}, {"error", reason}});
            throw ExecutionError("Execution error: waitpid failed: " + reason);
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            break;
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(options_.poll_interval,
                                             remaining + std::chrono::milliseconds(1)));
    }

    if (finished) {
        result.exit_code = DecodeStatus(status);
        utils::LogDebug("supervisor", "process completed",
                        {{"exec_id", ctx.id}, {"exit_code", std::to_string(result.exit_code)}});
        // Background descendants do not outlive the snippet.
        SweepGroup(pid, ctx.id);
        result.output = ReadCapture(stdout_path);
        result.error = ReadCapture(stderr_path);
    } else {
        utils::LogWarn("supervisor", "process timeout",
                       {{"exec_id", ctx.id}, {"timeout", std::to_string(timeout.count()) + "s"}});
        TerminateTree(pid, ctx.id);
        utils::LogDebug("supervisor", "retrieving output from timed-out process", {{"exec_id", ctx.id}});
        result.output = ReadCapture(stdout_path);
        result.error = ReadCapture(stderr_path);
        result.exit_code = -1;
        result.timed_out = true;
        result.error += "\n\nExecution timed out after " + std::to_string(timeout.count()) + " seconds.";
        utils::LogInfo("supervisor", "process terminated due to timeout", {{"exec_id", ctx.id}});
    }
    ctx.phases.execution.Finish();

    const nlohmann::json stats = {
        {"exit_code", result.exit_code},
        {"timed_out", result.timed_out},
        {"execution_time", utils::RoundTo(ctx.phases.execution.DurationMs().value_or(0.0) / 1000.0, 4)},
        {"stdout_length", result.output.size()},
        {"stderr_length", result.error.size()},
        {"has_output", !result.output.empty() || !result.error.empty()}
    };
    utils::LogInfo("supervisor", "execution stats", {{"exec_id", ctx.id}, {"stats", stats.dump()}});
    if (!result.output.empty()) {
        utils::LogDebug("supervisor", "stdout snippet",
                        {{"exec_id", ctx.id}, {"text", utils::Truncate(result.output, kSnippetLength)}});
    }
    if (!result.error.empty()) {
        utils::LogDebug("supervisor", "stderr snippet",
                        {{"exec_id", ctx.id}, {"text", utils::Truncate(result.error, kSnippetLength)}});
    }

    result.combined_output = CombineOutput(result.output, result.error, result.exit_code);
    return result;
}

}  // namespace runbox::sandbox
