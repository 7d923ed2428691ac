#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"

namespace runbox::sandbox {

struct PhaseTiming {
    std::optional<std::chrono::steady_clock::time_point> start;
    std::optional<std::chrono::steady_clock::time_point> end;

    void Begin() { start = std::chrono::steady_clock::now(); }
    void Finish() { end = std::chrono::steady_clock::now(); }
    // Milliseconds, or nullopt when the phase never completed.
    std::optional<double> DurationMs() const;
};

struct PhaseTimings {
    PhaseTiming setup;
    PhaseTiming compilation;
    bool compilation_needed = false;
    PhaseTiming execution;
    PhaseTiming cleanup;

    nlohmann::json Summary() const;
};

struct ExecutionContext {
    std::string id;
    std::filesystem::path directory;
    std::filesystem::path source_file;
    // Beside the directory, not inside it, so the snippet cannot see them.
    std::filesystem::path stdout_file;
    std::filesystem::path stderr_file;
    std::vector<std::string> command;
    PhaseTimings phases;
};

}  // namespace runbox::sandbox
