#pragma once

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <optional>
#include <vector>

namespace runbox::sandbox {

struct ProcessSample {
    pid_t pid = 0;
    pid_t pgrp = 0;
    char state = '?';
    // utime + stime, in clock ticks.
    std::uint64_t cpu_ticks = 0;
    std::uint64_t start_ticks = 0;
    std::uint64_t rss_bytes = 0;
    long threads = 0;
};

struct SystemSnapshot {
    long cpu_count = 0;
    double load_1m = 0.0;
    double memory_total_mb = 0.0;
    double memory_available_mb = 0.0;
    double memory_percent = 0.0;
    double disk_percent = 0.0;
};

// nullopt when the process does not exist (or vanished mid-read).
std::optional<ProcessSample> ReadProcessSample(pid_t pid);

// Every live process whose process group is `pgid`.
std::vector<ProcessSample> ListProcessGroup(pid_t pgid);

SystemSnapshot ReadSystemSnapshot(const std::filesystem::path& disk_path = "/");

long ClockTicksPerSecond();

}  // namespace runbox::sandbox
