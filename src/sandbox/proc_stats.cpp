#include "sandbox/proc_stats.hpp"

#include <sys/statvfs.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>

namespace runbox::sandbox {
namespace {

std::optional<std::string> ReadWholeFile(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        return std::nullopt;
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    return buffer.str();
}

// /proc/<pid>/status lines look like "VmRSS:	    1234 kB".
std::optional<std::uint64_t> ReadStatusKb(const std::string& status, const std::string& key) {
    std::istringstream stream(status);
    std::string line;
    while (std::getline(stream, line)) {
        if (line.rfind(key + ":", 0) != 0) {
            continue;
        }
        std::istringstream fields(line.substr(key.size() + 1));
        std::uint64_t value = 0;
        if (fields >> value) {
            return value;
        }
        return std::nullopt;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> ReadMeminfoKb(const std::string& key) {
    const auto meminfo = ReadWholeFile("/proc/meminfo");
    if (!meminfo) {
        return std::nullopt;
    }
    return ReadStatusKb(*meminfo, key);
}

}  // namespace

long ClockTicksPerSecond() {
    static const long ticks = [] {
        const long value = ::sysconf(_SC_CLK_TCK);
        return value > 0 ? value : 100L;
    }();
    return ticks;
}

std::optional<ProcessSample> ReadProcessSample(pid_t pid) {
    const auto base = std::filesystem::path("/proc") / std::to_string(pid);
    const auto stat = ReadWholeFile(base / "stat");
    if (!stat) {
        return std::nullopt;
    }

    // The command name is parenthesised and may itself contain spaces or
    // parentheses, so parse from the last ')'.
    const auto close = stat->rfind(')');
    if (close == std::string::npos) {
        return std::nullopt;
    }
    std::istringstream fields(stat->substr(close + 1));

    ProcessSample sample;
    sample.pid = pid;
    std::string skip;
    std::uint64_t utime = 0;
    std::uint64_t stime = 0;
    long long pgrp = 0;
    // Fields 3..22 of proc(5): state ppid pgrp session tty_nr tpgid flags
    // minflt cminflt majflt cmajflt utime stime cutime cstime priority nice
    // num_threads itrealvalue starttime.
    fields >> sample.state >> skip >> pgrp;
    for (int i = 0; i < 8; ++i) {
        fields >> skip;
    }
    fields >> utime >> stime;
    for (int i = 0; i < 4; ++i) {
        fields >> skip;
    }
    fields >> sample.threads >> skip >> sample.start_ticks;
    if (!fields) {
        return std::nullopt;
    }
    sample.pgrp = static_cast<pid_t>(pgrp);
    sample.cpu_ticks = utime + stime;

    if (const auto status = ReadWholeFile(base / "status")) {
        sample.rss_bytes = ReadStatusKb(*status, "VmRSS").value_or(0) * 1024;
    }
    return sample;
}

std::vector<ProcessSample> ListProcessGroup(pid_t pgid) {
    std::vector<ProcessSample> members;
    std::error_code ec;
    std::filesystem::directory_iterator it("/proc", ec);
    if (ec) {
        return members;
    }
    for (const std::filesystem::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            break;
        }
        const auto name = it->path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](unsigned char c) {
                return std::isdigit(c);
            })) {
            continue;
        }
        const auto pid = static_cast<pid_t>(std::stol(name));
        auto sample = ReadProcessSample(pid);
        if (sample && sample->pgrp == pgid && sample->state != 'Z') {
            members.push_back(*sample);
        }
    }
    return members;
}

SystemSnapshot ReadSystemSnapshot(const std::filesystem::path& disk_path) {
    SystemSnapshot snapshot;
    snapshot.cpu_count = ::sysconf(_SC_NPROCESSORS_ONLN);

    if (const auto loadavg = ReadWholeFile("/proc/loadavg")) {
        std::istringstream stream(*loadavg);
        stream >> snapshot.load_1m;
    }

    const auto total_kb = ReadMeminfoKb("MemTotal").value_or(0);
    const auto available_kb = ReadMeminfoKb("MemAvailable").value_or(0);
    snapshot.memory_total_mb = static_cast<double>(total_kb) / 1024.0;
    snapshot.memory_available_mb = static_cast<double>(available_kb) / 1024.0;
    if (total_kb > 0) {
        snapshot.memory_percent =
            100.0 * static_cast<double>(total_kb - available_kb) / static_cast<double>(total_kb);
    }

    struct statvfs disk {};
    if (::statvfs(disk_path.c_str(), &disk) == 0 && disk.f_blocks > 0) {
        const auto used = disk.f_blocks - disk.f_bfree;
        const auto usable = used + disk.f_bavail;
        if (usable > 0) {
            snapshot.disk_percent = 100.0 * static_cast<double>(used) / static_cast<double>(usable);
        }
    }
    return snapshot;
}

}  // namespace runbox::sandbox
