#include "sandbox/execution_directory.hpp"

#include <fstream>
#include <iostream>
#include <system_error>

#include "sandbox/errors.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace runbox::sandbox {

ExecutionDirectoryManager::ExecutionDirectoryManager(std::filesystem::path root)
    : root_(std::move(root)) {}

ExecutionContext ExecutionDirectoryManager::Allocate() const {
    ExecutionContext ctx;
    ctx.id = utils::GenerateUuid();

    std::error_code ec;
    std::filesystem::create_directories(root_, ec);
    if (ec) {
        utils::LogError("sandbox", "failed to create sandbox root",
                        {{"exec_id", ctx.id}, {"path", root_.string()}, {"error", ec.message()}});
        throw DirectoryError("Failed to create sandbox root: " + ec.message());
    }

    ctx.directory = root_ / ctx.id;
    if (!std::filesystem::create_directory(ctx.directory, ec) || ec) {
        const auto reason = ec ? ec.message() : std::string("directory already exists");
        utils::LogError("sandbox", "failed to create execution directory",
                        {{"exec_id", ctx.id}, {"path", ctx.directory.string()}, {"error", reason}});
        throw DirectoryError("Failed to create execution directory: " + reason);
    }
    ctx.stdout_file = root_ / (ctx.id + ".stdout");
    ctx.stderr_file = root_ / (ctx.id + ".stderr");
    utils::LogDebug("sandbox", "created execution directory",
                    {{"exec_id", ctx.id}, {"path", ctx.directory.string()}});
    return ctx;
}

std::filesystem::path ExecutionDirectoryManager::WriteSource(ExecutionContext& ctx,
                                                             const std::string& file_name,
                                                             const std::string& code) const {
    const auto path = ctx.directory / file_name;
    utils::LogDebug("sandbox", "creating source file",
                    {{"exec_id", ctx.id}, {"path", path.string()}});

    std::ofstream output(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!output.is_open()) {
        throw WriteError("Failed to open source file " + file_name + " for writing");
    }
    output.write(code.data(), static_cast<std::streamsize>(code.size()));
    output.close();
    if (!output) {
        throw WriteError("Failed to write source file " + file_name);
    }

    ctx.source_file = path;
    utils::LogDebug("sandbox", "source file created",
                    {{"exec_id", ctx.id}, {"bytes", std::to_string(code.size())}});
    return path;
}

void ExecutionDirectoryManager::Release(ExecutionContext& ctx) const noexcept {
    if (ctx.directory.empty()) {
        return;
    }
    try {
        utils::LogDebug("sandbox", "cleaning up execution directory", {{"exec_id", ctx.id}});
        std::error_code ec;
        std::filesystem::remove_all(ctx.directory, ec);
        for (const auto* capture : {&ctx.stdout_file, &ctx.stderr_file}) {
            std::error_code capture_ec;
            if (!capture->empty()) {
                std::filesystem::remove(*capture, capture_ec);
            }
            if (capture_ec && !ec) {
                ec = capture_ec;
            }
        }
        if (ec) {
            utils::LogError("sandbox", "cleanup error",
                            {{"exec_id", ctx.id}, {"error", ec.message()}});
            return;
        }
        utils::LogDebug("sandbox", "cleanup completed", {{"exec_id", ctx.id}});
    } catch (const std::exception& ex) {
        // Logging can throw bad_alloc; fall back to a raw write.
        std::cerr << "[sandbox] cleanup error exec_id=" << ctx.id << " " << ex.what() << std::endl;
    }
}

ScopedExecutionDirectory::ScopedExecutionDirectory(const ExecutionDirectoryManager& manager,
                                                   ExecutionContext& ctx)
    : manager_(manager), ctx_(ctx) {}

ScopedExecutionDirectory::~ScopedExecutionDirectory() {
    Release();
}

void ScopedExecutionDirectory::Release() noexcept {
    if (released_) {
        return;
    }
    released_ = true;
    ctx_.phases.cleanup.Begin();
    manager_.Release(ctx_);
    ctx_.phases.cleanup.Finish();
}

}  // namespace runbox::sandbox
