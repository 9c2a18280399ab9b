/**
 * @file errors.hpp
 * @brief Exception taxonomy of the execution session
 *
 * Transport and provisioning failures are exceptions. Failures of the guest
 * program (compile errors, non-zero exits) are never thrown; they travel as
 * data in ConsoleOutput / ExecutionResult.
 *
 * @date 2025
 */

#pragma once

#include <stdexcept>
#include <string>

namespace monolith {
namespace core {

/**
 * @class SandboxError
 * @brief Base of every error raised by the session layer
 */
class SandboxError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Base image could not be found, pulled or built
class ProvisionError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Live environment could not be started from a resolved image
class EnvironmentStartError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Operation invoked while the session is not open
class NotOpenError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Language/operation combination is not supported
class UnsupportedOperationError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Expected artifact is missing inside the environment
class RemoteFileNotFoundError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Supervised operation exceeded its wall-clock budget
class TimeoutError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Container runtime or archive tool failed to carry out a request
class BackendError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

/// Invalid configuration file or option combination
class ConfigError : public SandboxError {
public:
    using SandboxError::SandboxError;
};

} // namespace core
} // namespace monolith
