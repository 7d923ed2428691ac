#pragma once

#include <stdexcept>
#include <string>
#include <vector>

#include "utils/common.hpp"

namespace runbox::sandbox {

class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Caller fault: rejected before any directory or process exists.
class ValidationError : public SandboxError {
public:
    explicit ValidationError(std::vector<std::string> violations)
        : SandboxError(utils::Join(violations, "; "))
        , violations_(std::move(violations)) {}

    const std::vector<std::string>& Violations() const { return violations_; }

private:
    std::vector<std::string> violations_;
};

// Environment or launch fault. A non-zero exit code is not one of these.
class ExecutionError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

class DirectoryError : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

class WriteError : public ExecutionError {
public:
    using ExecutionError::ExecutionError;
};

}  // namespace runbox::sandbox
