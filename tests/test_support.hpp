#pragma once

#include <boost/process/search_path.hpp>
#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <string>

#include "config/config_schema.hpp"
#include "utils/common.hpp"

namespace runbox::testing {

inline bool HasCommand(const std::string& name) {
    return !boost::process::search_path(name).empty();
}

inline std::size_t CountEntries(const std::filesystem::path& dir) {
    if (!std::filesystem::exists(dir)) {
        return 0;
    }
    std::size_t count = 0;
    for (auto it = std::filesystem::directory_iterator(dir); it != std::filesystem::directory_iterator(); ++it) {
        ++count;
    }
    return count;
}

// Unique scratch directory removed on teardown. The sandbox root lives below
// it and is not created up front.
class ScratchDirTest : public ::testing::Test {
protected:
    void SetUp() override {
        scratch_ = std::filesystem::temp_directory_path() / ("runbox_test_" + utils::GenerateUuid());
        std::filesystem::create_directories(scratch_);
        root_ = scratch_ / "sandbox";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(scratch_, ec);
    }

    // Limits relaxed so the runtime tests do not depend on how many processes
    // the test user already owns or how much address space a runtime reserves.
    config::Config RelaxedConfig() const {
        config::Config config;
        config.sandbox.root = root_.string();
        config.limits.max_processes = 0;
        config.limits.max_memory_mb = 0;
        config.limits.poll_interval_ms = 20;
        config.monitor.interval_ms = 50;
        return config;
    }

    std::filesystem::path scratch_;
    std::filesystem::path root_;
};

// Restores PATH on destruction.
class ScopedPath {
public:
    explicit ScopedPath(const std::string& value) {
        const char* current = std::getenv("PATH");
        had_value_ = current != nullptr;
        if (had_value_) {
            saved_ = current;
        }
        ::setenv("PATH", value.c_str(), 1);
    }

    ~ScopedPath() {
        if (had_value_) {
            ::setenv("PATH", saved_.c_str(), 1);
        } else {
            ::unsetenv("PATH");
        }
    }

    ScopedPath(const ScopedPath&) = delete;
    ScopedPath& operator=(const ScopedPath&) = delete;

private:
    bool had_value_ = false;
    std::string saved_;
};

}  // namespace runbox::testing
