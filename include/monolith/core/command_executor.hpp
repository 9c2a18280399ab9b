/**
 * @file command_executor.hpp
 * @brief Single-command execution inside a live environment
 *
 * @date 2025
 */

#pragma once

#include "monolith/core/environment.hpp"

#include <string>

namespace monolith {
namespace core {

/**
 * @class CommandExecutor
 * @brief Runs one shell command in an environment and returns its output
 *
 * A non-zero exit code is returned as data. Only delivery failures of the
 * backend surface as exceptions.
 */
class CommandExecutor {
public:
    /**
     * @brief Construct executor
     * @param backend Backend owning the environment
     * @param verbose Echo command output at info level
     */
    CommandExecutor(EnvironmentBackend& backend, bool verbose = false);

    /**
     * @brief Execute a command
     *
     * @param env Live environment
     * @param command Shell command
     * @param working_dir Working directory (empty: environment default)
     * @return Separated stdout/stderr and exit code
     * @throws std::invalid_argument if the command is empty
     * @throws BackendError if the backend cannot deliver the command
     */
    ConsoleOutput Execute(const EnvironmentHandle& env,
                          const std::string& command,
                          const std::string& working_dir = "") const;

    bool IsVerbose() const { return verbose_; }

private:
    EnvironmentBackend& backend_;
    bool verbose_;
};

} // namespace core
} // namespace monolith
