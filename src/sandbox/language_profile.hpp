#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace runbox::sandbox {

using CommandBuilder = std::vector<std::string> (*)(const std::filesystem::path& source_file);

struct LanguageProfile {
    const char* name;
    const char* extension;
    // Empty when the default "snippet<extension>" is fine.
    const char* file_name;
    bool needs_compile;
    CommandBuilder build_command;

    std::string SourceFileName() const;
};

// Case-insensitive lookup over the fixed table; nullptr when unsupported.
const LanguageProfile* FindLanguage(const std::string& language);

// Every accepted identifier, aliases included, in table order.
std::vector<std::string> SupportedLanguages();

std::string ShellQuote(const std::string& value);

}  // namespace runbox::sandbox
