/**
 * @file transfer_protocol.hpp
 * @brief File movement between the host and a live environment
 *
 * Files travel as single-entry tar archives:
 * ```
 * CopyTo:   test -d <parent> || mkdir -p <parent>
 *           tar <base name>  → PutArchive(<parent>)
 * CopyFrom: test -e <path>   → GetArchive(<path>)
 *           extract          → <local path>
 * ```
 *
 * @date 2025
 */

#pragma once

#include "monolith/core/command_executor.hpp"
#include "monolith/core/environment.hpp"

#include <string>
#include <filesystem>

namespace monolith {
namespace core {

/**
 * @class TransferProtocol
 * @brief Archive-based copy in both directions
 */
class TransferProtocol {
public:
    /**
     * @brief Construct protocol
     * @param backend Backend moving the archives
     * @param executor Executor used for remote directory checks
     * @param scratch_root Host directory for staging archives (default: system temp)
     */
    TransferProtocol(EnvironmentBackend& backend,
                     const CommandExecutor& executor,
                     std::filesystem::path scratch_root = {});

    /**
     * @brief Copy a host file into the environment
     *
     * Missing parent directories of the destination are created. The file
     * lands under the destination's base name.
     *
     * @param env Live environment
     * @param local Host file
     * @param remote Absolute destination path inside the environment
     * @throws std::invalid_argument if the host file is missing or remote is relative
     * @throws BackendError if archiving or the transfer fails
     */
    void CopyTo(const EnvironmentHandle& env,
                const std::filesystem::path& local,
                const std::string& remote) const;

    /**
     * @brief Copy a file (or directory) out of the environment
     *
     * @param env Live environment
     * @param remote Path inside the environment
     * @param local Host destination; parent directories are created
     * Symbolic links and special files are refused, at the top level and
     * inside directories.
     *
     * @throws RemoteFileNotFoundError if the remote path is absent, empty,
     *         or not made of regular files and directories
     * @throws BackendError if the transfer or extraction fails
     */
    void CopyFrom(const EnvironmentHandle& env,
                  const std::string& remote,
                  const std::filesystem::path& local) const;

    /// Parent directory of an absolute in-environment path ("/" for top-level entries)
    static std::string RemoteParent(const std::string& remote);

    /// Last component of an in-environment path
    static std::string RemoteBaseName(const std::string& remote);

private:
    EnvironmentBackend& backend_;
    const CommandExecutor& executor_;
    std::filesystem::path scratch_root_;
};

} // namespace core
} // namespace monolith
