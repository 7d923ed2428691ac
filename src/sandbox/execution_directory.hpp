#pragma once

#include <filesystem>
#include <string>

#include "sandbox/execution_context.hpp"

namespace runbox::sandbox {

class ExecutionDirectoryManager {
public:
    explicit ExecutionDirectoryManager(std::filesystem::path root);

    // Throws DirectoryError when the root or the per-execution directory
    // cannot be created.
    ExecutionContext Allocate() const;

    // Writes the code byte for byte. Throws WriteError on I/O failure.
    std::filesystem::path WriteSource(ExecutionContext& ctx,
                                      const std::string& file_name,
                                      const std::string& code) const;

    // Never throws; failures are logged.
    void Release(ExecutionContext& ctx) const noexcept;

    const std::filesystem::path& Root() const { return root_; }

private:
    std::filesystem::path root_;
};

// Releases the directory exactly once when it goes out of scope.
class ScopedExecutionDirectory {
public:
    ScopedExecutionDirectory(const ExecutionDirectoryManager& manager, ExecutionContext& ctx);
    ~ScopedExecutionDirectory();

    ScopedExecutionDirectory(const ScopedExecutionDirectory&) = delete;
    ScopedExecutionDirectory& operator=(const ScopedExecutionDirectory&) = delete;

    void Release() noexcept;

private:
    const ExecutionDirectoryManager& manager_;
    ExecutionContext& ctx_;
    bool released_ = false;
};

}  // namespace runbox::sandbox
