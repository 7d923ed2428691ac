#include "sandbox/execution_context.hpp"

#include "utils/common.hpp"

namespace runbox::sandbox {
namespace {

nlohmann::json MsOrNull(const std::optional<double>& value) {
    if (!value) {
        return nullptr;
    }
    return utils::RoundTo(*value, 2);
}

}  // namespace

std::optional<double> PhaseTiming::DurationMs() const {
    if (!start || !end) {
        return std::nullopt;
    }
    return utils::ElapsedMs(*start, *end);
}

nlohmann::json PhaseTimings::Summary() const {
    std::optional<double> total;
    if (setup.start && cleanup.end) {
        total = utils::ElapsedMs(*setup.start, *cleanup.end);
    }
    return {
        {"setup_time", MsOrNull(setup.DurationMs())},
        {"compilation_needed", compilation_needed},
        {"execution_time", MsOrNull(execution.DurationMs())},
        {"cleanup_time", MsOrNull(cleanup.DurationMs())},
        {"total_time", MsOrNull(total)}
    };
}

}  // namespace runbox::sandbox
