#include "server/api_handlers.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdint>
#include <ctime>
#include <limits>
#include <vector>

#include "sandbox/errors.hpp"
#include "sandbox/language_profile.hpp"
#include "sandbox/proc_stats.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::server {
namespace {

constexpr const char* kServiceVersion = "2.0.0";

JsonReply ErrorReply(int status, const std::string& message) {
    JsonReply reply;
    reply.status = status;
    reply.body = {{"error", message}};
    return reply;
}

// JSON integers wider than int saturate instead of wrapping.
int SaturatingInt(const nlohmann::json& value) {
    if (value.is_number_unsigned()) {
        const auto wide = value.get<std::uint64_t>();
        return wide > static_cast<std::uint64_t>(std::numeric_limits<int>::max())
            ? std::numeric_limits<int>::max()
            : static_cast<int>(wide);
    }
    const auto wide = value.get<std::int64_t>();
    return static_cast<int>(std::clamp<std::int64_t>(
        wide, std::numeric_limits<int>::min(), std::numeric_limits<int>::max()));
}

std::string CurrentTime() {
    const auto now = std::time(nullptr);
    std::tm local{};
    ::localtime_r(&now, &local);
    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
    return buffer;
}

std::string HostName() {
    char buffer[256] = {};
    if (::gethostname(buffer, sizeof(buffer) - 1) != 0) {
        return "unknown";
    }
    return buffer;
}

}  // namespace

JsonReply HandleRun(const std::string& body, const sandbox::SandboxExecutor& executor) {
    const auto data = nlohmann::json::parse(body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        utils::LogWarn("api", "request missing body or invalid JSON");
        return ErrorReply(400, "Request body must be valid JSON");
    }

    std::vector<std::string> violations;
    sandbox::ExecutionRequest request;
    if (data.contains("language") && !data["language"].is_null()) {
        if (data["language"].is_string()) {
            request.language = data["language"].get<std::string>();
        } else {
            violations.emplace_back("'language' must be a string");
        }
    }
    if (data.contains("code") && !data["code"].is_null()) {
        if (data["code"].is_string()) {
            request.code = data["code"].get<std::string>();
        } else {
            violations.emplace_back("'code' must be a string");
        }
    }
    if (data.contains("timeout") && !data["timeout"].is_null()) {
        if (data["timeout"].is_number_integer()) {
            request.timeout_seconds = SaturatingInt(data["timeout"]);
        } else {
            violations.emplace_back("'timeout' must be an integer");
        }
    }
    if (!violations.empty()) {
        const auto message = utils::Join(violations, "; ");
        utils::LogWarn("api", "validation failed", {{"errors", message}});
        return ErrorReply(400, message);
    }

    utils::LogInfo("api", "request parameters", {
        {"language", request.language},
        {"timeout", request.timeout_seconds ? std::to_string(*request.timeout_seconds) : "default"},
        {"code_length", std::to_string(request.code.size())}
    });

    try {
        const auto outcome = executor.Execute(request);
        const auto seconds = std::chrono::duration<double>(outcome.elapsed).count();
        const auto& output = outcome.result.combined_output;
        utils::LogInfo("api", "code execution completed", {
            {"exec_id", outcome.execution_id},
            {"execution_time", utils::FormatFixed(seconds, 4) + "s"},
            {"output_length", std::to_string(output.size())}
        });

        JsonReply reply;
        reply.body = {
            {"output", output},
            {"execution_time", utils::RoundTo(seconds, 3)},
            {"language", outcome.language},
            {"output_length", output.size()},
            {"exit_code", outcome.result.exit_code},
            {"timed_out", outcome.result.timed_out}
        };
        return reply;
    } catch (const sandbox::ValidationError& ex) {
        return ErrorReply(400, ex.what());
    } catch (const sandbox::ExecutionError& ex) {
        utils::LogError("api", "code execution error", {{"error", ex.what()}});
        auto reply = ErrorReply(500, ex.what());
        reply.body["phase"] = "execution";
        return reply;
    } catch (const std::exception& ex) {
        utils::LogError("api", "unexpected server error", {{"error", ex.what()}});
        return ErrorReply(500, "Internal server error");
    }
}

JsonReply HandleHealth(const config::Config& config, std::chrono::steady_clock::time_point started) {
    const auto system = sandbox::ReadSystemSnapshot(config.sandbox.root);
    const auto self = sandbox::ReadProcessSample(::getpid());
    const auto uptime = std::chrono::duration<double>(std::chrono::steady_clock::now() - started).count();

    JsonReply reply;
    reply.body = {
        {"status", "ok"},
        {"message", "Code runner service is operational"},
        {"time", CurrentTime()},
        {"system", {
            {"cpu_count", system.cpu_count},
            {"load_1m", system.load_1m},
            {"memory_total_mb", utils::RoundTo(system.memory_total_mb, 1)},
            {"memory_available_mb", utils::RoundTo(system.memory_available_mb, 1)},
            {"memory_percent", utils::RoundTo(system.memory_percent, 1)},
            {"disk_percent", utils::RoundTo(system.disk_percent, 1)}
        }},
        {"process", {
            {"memory_mb", self ? utils::RoundTo(static_cast<double>(self->rss_bytes) / (1024.0 * 1024.0), 1) : 0.0},
            {"threads", self ? self->threads : 0L},
            {"uptime_seconds", utils::RoundTo(uptime, 1)}
        }}
    };
    return reply;
}

JsonReply HandleServiceInfo(const config::Config& config) {
    JsonReply reply;
    reply.body = {
        {"service", "Code Runner Service"},
        {"version", kServiceVersion},
        {"environment", config.server.environment},
        {"endpoints", {
            {"/run", "POST - Run code in the sandbox"},
            {"/health", "GET - Service health check"}
        }},
        {"supported_languages", sandbox::SupportedLanguages()},
        {"system_info", {
            {"hostname", HostName()},
            {"cpus", ::sysconf(_SC_NPROCESSORS_ONLN)}
        }}
    };
    return reply;
}

}  // namespace runbox::server
