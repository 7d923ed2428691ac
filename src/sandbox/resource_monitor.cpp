#include "sandbox/resource_monitor.hpp"

#include <system_error>
#include <thread>
#include <unordered_map>

#include "nlohmann/json.hpp"
#include "sandbox/proc_stats.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {
namespace {

double ToMb(std::uint64_t bytes) {
    return static_cast<double>(bytes) / (1024.0 * 1024.0);
}

double CpuPercent(std::uint64_t ticks_delta, std::chrono::steady_clock::duration wall) {
    const auto seconds = std::chrono::duration<double>(wall).count();
    if (seconds <= 0.0) {
        return 0.0;
    }
    return 100.0 * static_cast<double>(ticks_delta) /
           static_cast<double>(ClockTicksPerSecond()) / seconds;
}

bool IsSameLiveProcess(const std::optional<ProcessSample>& sample, std::uint64_t start_ticks) {
    return sample && sample->state != 'Z' && sample->start_ticks == start_ticks;
}

}  // namespace

void ResourceMonitor::Launch(pid_t pid, std::string execution_id, std::chrono::milliseconds interval) {
    try {
        std::thread([pid, id = execution_id, interval]() {
            Run(pid, id, interval);
        }).detach();
    } catch (const std::system_error& ex) {
        utils::LogWarn("monitor", "process monitor failed to start",
                       {{"exec_id", execution_id}, {"error", ex.what()}});
    }
}

void ResourceMonitor::Run(pid_t pid, const std::string& execution_id,
                          std::chrono::milliseconds interval) {
    try {
        const auto first = ReadProcessSample(pid);
        if (!first || first->state == 'Z') {
            return;
        }
        const auto start_ticks = first->start_ticks;

        std::unordered_map<pid_t, std::uint64_t> last_ticks{{pid, first->cpu_ticks}};
        auto last_time = std::chrono::steady_clock::now();

        while (true) {
            std::this_thread::sleep_for(interval);
            try {
                const auto leader = ReadProcessSample(pid);
                if (!IsSameLiveProcess(leader, start_ticks)) {
                    break;
                }
                const auto now = std::chrono::steady_clock::now();
                const auto wall = now - last_time;

                const auto leader_cpu = CpuPercent(leader->cpu_ticks - last_ticks[pid], wall);
                utils::LogDebug("monitor", "process stats", {
                    {"exec_id", execution_id},
                    {"pid", std::to_string(pid)},
                    {"cpu", utils::FormatFixed(leader_cpu, 1) + "%"},
                    {"memory_mb", utils::FormatFixed(ToMb(leader->rss_bytes), 1)}
                });

                std::unordered_map<pid_t, std::uint64_t> current_ticks{{pid, leader->cpu_ticks}};
                nlohmann::json children = nlohmann::json::array();
                for (const auto& member : ListProcessGroup(pid)) {
                    if (member.pid == pid) {
                        continue;
                    }
                    current_ticks[member.pid] = member.cpu_ticks;
                    const auto previous = last_ticks.find(member.pid);
                    const auto baseline = previous != last_ticks.end() && previous->second <= member.cpu_ticks
                        ? previous->second
                        : member.cpu_ticks;
                    children.push_back({
                        {"pid", member.pid},
                        {"cpu", utils::RoundTo(CpuPercent(member.cpu_ticks - baseline, wall), 1)},
                        {"memory_mb", utils::RoundTo(ToMb(member.rss_bytes), 1)}
                    });
                }
                if (!children.empty()) {
                    utils::LogDebug("monitor", "child processes",
                                    {{"exec_id", execution_id}, {"children", children.dump()}});
                }

                last_ticks = std::move(current_ticks);
                last_time = now;
            } catch (const std::exception& ex) {
                utils::LogWarn("monitor", "monitoring error",
                               {{"exec_id", execution_id}, {"error", ex.what()}});
            }
        }
    } catch (const std::exception& ex) {
        utils::LogWarn("monitor", "process monitor failed",
                       {{"exec_id", execution_id}, {"error", ex.what()}});
    }
}

}  // namespace runbox::sandbox
