/**
 * @file process_utils.hpp
 * @brief Host-side subprocess execution with separated output streams
 *
 * Every interaction with the container runtime and the archive tool goes
 * through RunProcess(). The child is started directly from an argument vector
 * (no intermediate shell), stdout and stderr are captured independently, and
 * either stream can be redirected from or to a file for archive transfers.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <cstddef>

namespace monolith {
namespace utils {

/**
 * @struct ProcessSpec
 * @brief Description of a host process to run
 */
struct ProcessSpec {
    std::vector<std::string> argv;          ///< Program followed by its arguments (PATH lookup)
    std::filesystem::path working_dir;      ///< Working directory (empty: inherit)
    std::filesystem::path stdin_file;       ///< File fed to stdin (empty: /dev/null)
    std::filesystem::path stdout_file;      ///< File receiving stdout (empty: captured)
    std::size_t max_output_bytes{16 * 1024 * 1024};  ///< Capture cap per stream
};

/**
 * @struct ProcessResult
 * @brief Outcome of a host process
 */
struct ProcessResult {
    bool spawned{false};            ///< Process was started
    int exit_code{-1};              ///< Exit status (128 + signal when killed)
    std::string stdout_output;      ///< Captured standard output
    std::string stderr_output;      ///< Captured standard error
    bool stdout_truncated{false};   ///< Output exceeded max_output_bytes
    bool stderr_truncated{false};   ///< Error output exceeded max_output_bytes
    std::string error_message;      ///< Spawn failure description

    bool Succeeded() const { return spawned && exit_code == 0; }
};

/**
 * @brief Run a process to completion
 *
 * Blocks until the child exits. Both pipes are drained concurrently with
 * poll() so a chatty child cannot dead-lock on a full stderr pipe.
 *
 * @param spec Process description
 * @return ProcessResult, `spawned == false` when the child could not start
 */
ProcessResult RunProcess(const ProcessSpec& spec);

/**
 * @brief Render an argument vector for logging
 * @param argv Arguments
 * @return Space separated, shell-quoted command line
 */
std::string FormatCommandLine(const std::vector<std::string>& argv);

} // namespace utils
} // namespace monolith
