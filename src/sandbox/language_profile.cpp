#include "sandbox/language_profile.hpp"

#include <array>

#include "utils/common.hpp"

namespace runbox::sandbox {
namespace {

std::vector<std::string> PythonCommand(const std::filesystem::path& source_file) {
    return {"python3", source_file.string()};
}

std::vector<std::string> NodeCommand(const std::filesystem::path& source_file) {
    return {"node", source_file.string()};
}

// javac needs the public class to match the file name, hence Solution.java.
std::vector<std::string> JavaCommand(const std::filesystem::path& source_file) {
    const auto dir = source_file.parent_path().string();
    const auto class_name = source_file.stem().string();
    return {"sh", "-c",
            "javac " + ShellQuote(source_file.string()) +
            " && java -cp " + ShellQuote(dir) + " " + class_name};
}

std::vector<std::string> GoCommand(const std::filesystem::path& source_file) {
    return {"go", "run", source_file.string()};
}

std::vector<std::string> TypeScriptCommand(const std::filesystem::path& source_file) {
    auto compiled = source_file;
    compiled.replace_extension(".js");
    return {"sh", "-c",
            "tsc " + ShellQuote(source_file.string()) +
            " && node " + ShellQuote(compiled.string())};
}

constexpr std::array<LanguageProfile, 7> kLanguages = {{
    {"python", ".py", "", false, &PythonCommand},
    {"javascript", ".js", "", false, &NodeCommand},
    {"js", ".js", "", false, &NodeCommand},
    {"java", ".java", "Solution.java", true, &JavaCommand},
    {"go", ".go", "", false, &GoCommand},
    {"typescript", ".ts", "", true, &TypeScriptCommand},
    {"ts", ".ts", "", true, &TypeScriptCommand},
}};

}  // namespace

std::string LanguageProfile::SourceFileName() const {
    if (file_name != nullptr && file_name[0] != '\0') {
        return file_name;
    }
    return std::string("snippet") + extension;
}

const LanguageProfile* FindLanguage(const std::string& language) {
    const auto normalized = utils::ToLower(language);
    for (const auto& profile : kLanguages) {
        if (normalized == profile.name) {
            return &profile;
        }
    }
    return nullptr;
}

std::vector<std::string> SupportedLanguages() {
    std::vector<std::string> names;
    names.reserve(kLanguages.size());
    for (const auto& profile : kLanguages) {
        names.emplace_back(profile.name);
    }
    return names;
}

std::string ShellQuote(const std::string& value) {
    std::string quoted = "'";
    for (const char c : value) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += "'";
    return quoted;
}

}  // namespace runbox::sandbox
