#include "sandbox/sandbox_executor.hpp"

#include "nlohmann/json.hpp"
#include "sandbox/errors.hpp"
#include "sandbox/proc_stats.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace {

void LogSystemResources(const std::string& execution_id) {
    const auto snapshot = ReadSystemSnapshot();
    const nlohmann::json resources = {
        {"cpu_count", snapshot.cpu_count},
        {"load_1m", snapshot.load_1m},
        {"memory_total_mb", utils::RoundTo(snapshot.memory_total_mb, 1)},
        {"memory_available_mb", utils::RoundTo(snapshot.memory_available_mb, 1)}
    };
    utils::LogInfo("executor", "system resources",
                   {{"exec_id", execution_id}, {"resources", resources.dump()}});
}

}  // namespace

SandboxExecutor::SandboxExecutor(const config::Config& config)
    : SandboxExecutor(config.limits,
                      ExecutionDirectoryManager(config.sandbox.root),
                      ProcessSupervisor(SupervisorOptions::FromConfig(config))) {}

SandboxExecutor::SandboxExecutor(config::LimitsConfig limits,
                                 ExecutionDirectoryManager directories,
                                 ProcessSupervisor supervisor)
    : limits_(std::move(limits))
    , directories_(std::move(directories))
    , supervisor_(std::move(supervisor)) {}

ExecutionOutcome SandboxExecutor::Execute(const ExecutionRequest& request) const {
    const auto started = std::chrono::steady_clock::now();
    const auto normalized = NormalizeRequest(request, limits_);

    auto ctx = directories_.Allocate();
    ctx.phases.setup.start = started;
    ctx.phases.compilation_needed = normalized.profile->needs_compile;
    utils::LogInfo("executor", "starting execution",
                   {{"exec_id", ctx.id}, {"language", normalized.language}});

    ExecutionOutcome outcome;
    outcome.execution_id = ctx.id;
    outcome.language = normalized.language;
    outcome.timeout_seconds = normalized.timeout_seconds;
    {
        ScopedExecutionDirectory scope(directories_, ctx);
        const auto finish = [&scope, &ctx]() {
            scope.Release();
            utils::LogInfo("executor", "execution completed",
                           {{"exec_id", ctx.id}, {"timings", ctx.phases.Summary().dump()}});
        };
        try {
            LogSystemResources(ctx.id);
            directories_.WriteSource(ctx, normalized.profile->SourceFileName(), normalized.code);
            ctx.command = normalized.profile->build_command(ctx.source_file);
            ctx.phases.setup.Finish();
            utils::LogInfo("executor", "execution command",
                           {{"exec_id", ctx.id}, {"command", utils::Join(ctx.command, " ")}});

            outcome.result = supervisor_.Run(
                ctx, ctx.command, std::chrono::seconds(normalized.timeout_seconds));
        } catch (const SandboxError&) {
            finish();
            throw;
        } catch (const std::exception& ex) {
            utils::LogError("executor", "execution error", {{"exec_id", ctx.id}, {"error", ex.what()}});
            finish();
            throw ExecutionError(std::string("Execution error: ") + ex.what());
        }
        finish();
    }
    outcome.elapsed = std::chrono::steady_clock::now() - started;
    return outcome;
}

}  // namespace runbox::sandbox
