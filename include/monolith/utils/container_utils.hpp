/**
 * @file container_utils.hpp
 * @brief Container runtime CLI wrapper (Docker, Podman)
 *
 * Thin, stateless layer over the `docker` command line: image resolution
 * (inspect, pull, build), container lifecycle (run, exec, commit, rm), archive
 * transfer through `docker cp -` and image reference checks. Methods report
 * failure through return values and logs; translating failures into
 * session errors is the job of core::DockerBackend.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>

namespace monolith {
namespace utils {

/**
 * @enum ContainerRuntime
 * @brief Supported container runtime engines
 */
enum class ContainerRuntime {
    DOCKER,          ///< Docker Engine
    PODMAN           ///< Podman (Docker-compatible CLI)
};

/**
 * @enum ContainerState
 * @brief Container lifecycle states
 */
enum class ContainerState {
    CREATED,   ///< Container created but not started
    RUNNING,   ///< Container is running
    PAUSED,    ///< Container paused
    EXITED,    ///< Container exited
    DEAD,      ///< Container is dead
    UNKNOWN    ///< Unknown state or container missing
};

/**
 * @enum NetworkMode
 * @brief Container network modes
 */
enum class NetworkMode {
    BRIDGE,      ///< Default bridge network (needed for package installs)
    NONE,        ///< No network access
    HOST         ///< Host network
};

/**
 * @struct BindMount
 * @brief Host directory or file mounted into the container
 */
struct BindMount {
    std::filesystem::path host_path;   ///< Source on the host
    std::string container_path;        ///< Target inside the container
    bool read_only{false};             ///< Mount read-only
};

/**
 * @struct ContainerConfig
 * @brief Configuration of a long-lived sandbox container
 */
struct ContainerConfig {
    std::string name;                           ///< Container name (empty: runtime picks)
    std::string image;                          ///< Image reference or id

    // Resource Limits (0 = unlimited)
    std::size_t memory_limit_mb{0};             ///< Memory limit
    double cpu_limit{0.0};                      ///< CPU limit
    int pids_limit{0};                          ///< Process limit

    NetworkMode network_mode{NetworkMode::BRIDGE};  ///< Network mode

    std::vector<BindMount> mounts;              ///< Bind mounts
    std::map<std::string, std::string> environment_vars;  ///< Environment variables
    std::string working_dir;                    ///< Working directory (empty: image default)
};

/**
 * @struct ContainerExecResult
 * @brief Result of a runtime CLI invocation or a command run in a container
 */
struct ContainerExecResult {
    int exit_code{0};              ///< Exit code
    std::string stdout_output;     ///< Standard output
    std::string stderr_output;     ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool success{false};           ///< CLI started and exited with 0
    bool spawned{true};            ///< CLI binary could be executed
};

/**
 * @class ContainerUtils
 * @brief Container runtime management utilities
 *
 * Stateless: every method maps onto one or two CLI invocations, so a single
 * instance can be shared by any number of sessions.
 *
 * **Usage Example**:
 * @code
 * ContainerUtils utils(ContainerRuntime::DOCKER);
 *
 * if (!utils.GetImageId("python:3.9.19-bullseye")) {
 *     utils.PullImage("python:3.9.19-bullseye");
 * }
 *
 * ContainerConfig config;
 * config.image = "python:3.9.19-bullseye";
 * auto created = utils.CreateContainer(config);
 * std::string container_id = created.stdout_output;
 *
 * auto result = utils.ExecuteCommand(container_id, {"python", "-V"});
 * utils.RemoveContainer(container_id, true);
 * @endcode
 */
class ContainerUtils {
public:
    /**
     * @brief Construct container utilities for specific runtime
     * @param runtime Container runtime to use
     * @throws std::runtime_error if the runtime CLI is not available
     */
    explicit ContainerUtils(ContainerRuntime runtime = ContainerRuntime::DOCKER);

    /**
     * @brief Check if container runtime is available
     * @param runtime Runtime to check
     * @return true if the CLI answers and the daemon is reachable
     */
    static bool IsRuntimeAvailable(ContainerRuntime runtime = ContainerRuntime::DOCKER);

    /**
     * @brief Get runtime version string
     * @param runtime Runtime to query
     * @return Version string ("unknown" on failure)
     */
    static std::string GetRuntimeVersion(ContainerRuntime runtime = ContainerRuntime::DOCKER);

    /***************************************************************************
     * Images
     ***************************************************************************/

    /**
     * @brief Resolve an image reference to its content id
     * @param image Image reference
     * @return Image id ("sha256:...") if the image exists locally
     */
    std::optional<std::string> GetImageId(const std::string& image) const;

    /**
     * @brief Pull image from its registry
     * @param image Image reference
     * @return Execution result (stderr holds the registry error)
     */
    ContainerExecResult PullImage(const std::string& image) const;

    /**
     * @brief Build image from a Dockerfile
     * @param dockerfile Dockerfile path
     * @param tag Tag to apply
     * @return Execution result
     *
     * The build context is the Dockerfile's directory.
     */
    ContainerExecResult BuildImage(const std::filesystem::path& dockerfile,
                                   const std::string& tag) const;

    /**
     * @brief Remove image
     * @param image Image reference or id
     * @param force Force removal
     * @return true if removed successfully
     */
    bool RemoveImage(const std::string& image, bool force = false) const;

    /**
     * @brief List containers (any state) created from an image or its descendants
     * @param image_id Image id
     * @return Container ids, std::nullopt if the runtime could not be queried
     */
    std::optional<std::vector<std::string>> ListContainersUsingImage(const std::string& image_id) const;

    /***************************************************************************
     * Containers
     ***************************************************************************/

    /**
     * @brief Create and start a detached container with an allocated TTY
     *
     * The image's default command keeps running on its TTY, which keeps the
     * container alive for subsequent exec calls.
     *
     * @param config Container configuration
     * @return Execution result, container id in stdout_output on success
     */
    ContainerExecResult CreateContainer(const ContainerConfig& config) const;

    ContainerState GetContainerState(const std::string& container_id) const;

    /**
     * @brief Execute command in container
     * @param container_id Container ID
     * @param command Command argument vector
     * @param working_dir Working directory inside the container (empty: default)
     * @return Execution result of the command
     */
    ContainerExecResult ExecuteCommand(const std::string& container_id,
                                       const std::vector<std::string>& command,
                                       const std::string& working_dir = "") const;

    /**
     * @brief Unpack a tar archive into a container directory
     * @param container_id Container ID
     * @param archive Host tar archive
     * @param dest_dir Existing directory inside the container
     * @return Execution result of `docker cp -`
     */
    ContainerExecResult CopyArchiveToContainer(const std::string& container_id,
                                               const std::filesystem::path& archive,
                                               const std::string& dest_dir) const;

    /**
     * @brief Fetch a tar archive of a container path
     * @param container_id Container ID
     * @param source Path inside the container
     * @param archive Host file receiving the archive
     * @return Execution result of `docker cp ... -`
     */
    ContainerExecResult CopyArchiveFromContainer(const std::string& container_id,
                                                 const std::string& source,
                                                 const std::filesystem::path& archive) const;

    /**
     * @brief Commit container state into an image
     * @param container_id Container ID
     * @param tag Image tag
     * @return New image id, empty on failure
     */
    std::string CreateSnapshot(const std::string& container_id,
                               const std::string& tag) const;

    /**
     * @brief Remove container
     * @param container_id Container ID
     * @param force Force removal (kills a running container)
     * @return true if removed successfully
     */
    bool RemoveContainer(const std::string& container_id, bool force = false) const;

    bool ContainerExists(const std::string& container_id) const;

    ContainerRuntime GetRuntime() const { return runtime_; }

private:
    ContainerRuntime runtime_;                          ///< Container runtime

    ContainerExecResult ExecuteDockerCommand(const std::vector<std::string>& args,
                                             const std::filesystem::path& stdin_file = {},
                                             const std::filesystem::path& stdout_file = {}) const;
    std::vector<std::string> BuildRunCommand(const ContainerConfig& config) const;
    static std::string GetRuntimeBinary(ContainerRuntime runtime);
    static ContainerState ParseState(const std::string& state_str);
};

} // namespace utils
} // namespace monolith
