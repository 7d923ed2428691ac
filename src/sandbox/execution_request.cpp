#include "sandbox/execution_request.hpp"

#include <algorithm>
#include <vector>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {

int ClampTimeout(int requested, const config::LimitsConfig& limits) {
    const int upper = std::max(1, limits.max_timeout_s);
    return std::min(std::max(1, requested), upper);
}

NormalizedRequest NormalizeRequest(const ExecutionRequest& request,
                                   const config::LimitsConfig& limits) {
    std::vector<std::string> violations;
    if (request.language.empty()) {
        violations.emplace_back("Missing 'language' parameter");
    }
    if (request.code.empty()) {
        violations.emplace_back("Missing 'code' parameter");
    }

    const LanguageProfile* profile = nullptr;
    if (!request.language.empty()) {
        profile = FindLanguage(request.language);
        if (profile == nullptr) {
            violations.push_back(
                "Unsupported language: " + utils::ToLower(request.language) +
                ". Supported languages: " + utils::Join(SupportedLanguages(), ", "));
        }
    }

    if (!violations.empty()) {
        utils::LogWarn("request", "validation failed",
                       {{"violations", utils::Join(violations, "; ")}});
        throw ValidationError(std::move(violations));
    }

    NormalizedRequest normalized;
    normalized.language = profile->name;
    normalized.code = request.code;
    normalized.profile = profile;

    const int requested = request.timeout_seconds.value_or(limits.default_timeout_s);
    normalized.timeout_seconds = ClampTimeout(requested, limits);
    if (normalized.timeout_seconds != requested) {
        utils::LogInfo("request", "Adjusted timeout " + std::to_string(requested) +
                                      " -> " + std::to_string(normalized.timeout_seconds));
    }
    return normalized;
}

}  // namespace runbox::sandbox
