/**
 * @file command_executor.cpp
 * @brief Single-command execution inside a live environment
 *
 * @date 2025
 */

#include "monolith/core/command_executor.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace monolith {
namespace core {

using utils::StringUtils;

CommandExecutor::CommandExecutor(EnvironmentBackend& backend, bool verbose)
    : backend_(backend), verbose_(verbose) {
}

ConsoleOutput CommandExecutor::Execute(const EnvironmentHandle& env,
                                       const std::string& command,
                                       const std::string& working_dir) const {
    if (StringUtils::Trim(command).empty()) {
        throw std::invalid_argument("Command must not be empty");
    }

    if (working_dir.empty()) {
        spdlog::debug("[{}] $ {}", env.ShortId(), command);
    } else {
        spdlog::debug("[{}:{}] $ {}", env.ShortId(), working_dir, command);
    }

    auto output = backend_.Execute(env, command, working_dir);

    if (verbose_) {
        spdlog::info("Executing command: {}", command);
        if (output.HasStdout()) {
            spdlog::info("stdout: {}", StringUtils::TrimRight(*output.stdout_output));
        }
        if (output.HasStderr()) {
            spdlog::info("stderr: {}", StringUtils::TrimRight(*output.stderr_output));
        }
        spdlog::info("exit code: {}", output.exit_code);
    } else if (!output.Succeeded()) {
        spdlog::debug("Command exited with {}: {}", output.exit_code, command);
    }

    return output;
}

} // namespace core
} // namespace monolith
