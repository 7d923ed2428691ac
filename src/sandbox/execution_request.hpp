#pragma once

#include <optional>
#include <string>

#include "config/config_schema.hpp"
#include "sandbox/language_profile.hpp"

namespace runbox::sandbox {

struct ExecutionRequest {
    std::string language;
    std::string code;
    std::optional<int> timeout_seconds;
};

// Validated, immutable copy used downstream of validation.
struct NormalizedRequest {
    std::string language;
    std::string code;
    int timeout_seconds = 0;
    const LanguageProfile* profile = nullptr;
};

// Throws ValidationError listing every violation found.
NormalizedRequest NormalizeRequest(const ExecutionRequest& request,
                                   const config::LimitsConfig& limits);

int ClampTimeout(int requested, const config::LimitsConfig& limits);

}  // namespace runbox::sandbox
