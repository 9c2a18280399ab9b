/**
 * @file environment.hpp
 * @brief Environment backend interface and the value types crossing it
 *
 * The session only ever talks to an EnvironmentBackend. Concrete variants
 * (DockerBackend today; a process-sandbox or VM backend would slot in the
 * same way) own the mechanics of images, live environments, command
 * execution and archive movement.
 *
 * @date 2025
 */

#pragma once

#include "monolith/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <optional>
#include <filesystem>

namespace monolith {
namespace core {

/**
 * @struct ImageSpec
 * @brief Where the base image comes from
 *
 * At most one of `image` and `dockerfile` may be set. With neither set the
 * session falls back to the language's default image.
 */
struct ImageSpec {
    std::string image;                   ///< Registry reference, e.g. "python:3.9.19-bullseye"
    std::filesystem::path dockerfile;    ///< Dockerfile to build from
};

/**
 * @struct ImageRef
 * @brief Resolved base image
 */
struct ImageRef {
    std::string tag;                 ///< Tag the image is known by
    std::string id;                  ///< Content id
    bool freshly_created{false};     ///< Pulled or built while resolving
};

/**
 * @struct EnvironmentHandle
 * @brief Opaque reference to a live environment
 */
struct EnvironmentHandle {
    std::string id;          ///< Backend-specific environment id
    std::string image_id;    ///< Id of the image it was started from

    std::string ShortId() const { return id.substr(0, 12); }
};

/**
 * @struct ResourceLimits
 * @brief Resource caps applied when an environment starts (0 = unlimited)
 */
struct ResourceLimits {
    std::size_t memory_mb{0};    ///< Memory limit (MB)
    double cpus{0.0};            ///< CPU limit (cores)
    int pids_limit{0};           ///< Maximum process count
};

/**
 * @struct EnvironmentOptions
 * @brief Everything needed to start an environment besides the image
 */
struct EnvironmentOptions {
    std::vector<utils::BindMount> mounts;                   ///< Bind mounts
    ResourceLimits limits;                                  ///< Resource caps
    utils::NetworkMode network{utils::NetworkMode::BRIDGE}; ///< Network mode
};

/**
 * @struct ConsoleOutput
 * @brief Output of one command run inside an environment
 *
 * Streams that produced no bytes are std::nullopt rather than empty strings.
 */
struct ConsoleOutput {
    std::optional<std::string> stdout_output;   ///< Standard output
    std::optional<std::string> stderr_output;   ///< Standard error
    int exit_code{0};                           ///< Exit status of the command

    bool HasStdout() const { return stdout_output && !stdout_output->empty(); }
    bool HasStderr() const { return stderr_output && !stderr_output->empty(); }
    bool Succeeded() const { return exit_code == 0; }
};

/**
 * @class EnvironmentBackend
 * @brief Capability interface of an isolated runtime provider
 *
 * Implementations must be safe to share between sessions; they carry no
 * per-session state.
 */
class EnvironmentBackend {
public:
    virtual ~EnvironmentBackend() = default;

    /// Short backend name for logs
    virtual std::string Name() const = 0;

    /**
     * @brief Resolve the base image, pulling or building when absent
     *
     * @param spec Image source
     * @param build_tag Tag used when building from a Dockerfile
     * @return Resolved image
     * @throws ProvisionError if the image cannot be resolved
     */
    virtual ImageRef ResolveImage(const ImageSpec& spec, const std::string& build_tag) = 0;

    /**
     * @brief Start a live environment
     * @throws EnvironmentStartError if it cannot start
     */
    virtual EnvironmentHandle StartEnvironment(const ImageRef& image,
                                               const EnvironmentOptions& options) = 0;

    /**
     * @brief Run one shell command inside the environment
     *
     * @param env Live environment
     * @param command Shell command (interpreted by /bin/sh)
     * @param working_dir Working directory (empty: environment default)
     * @return Command output; a non-zero exit is data, not an error
     * @throws BackendError if the command could not be delivered
     */
    virtual ConsoleOutput Execute(const EnvironmentHandle& env,
                                  const std::string& command,
                                  const std::string& working_dir) = 0;

    /**
     * @brief Unpack a host tar archive into an existing remote directory
     * @throws BackendError on transfer failure
     */
    virtual void PutArchive(const EnvironmentHandle& env,
                            const std::filesystem::path& archive,
                            const std::string& remote_dir) = 0;

    /**
     * @brief Write a tar archive of a remote path to a host file
     * @throws RemoteFileNotFoundError if the remote path does not exist
     * @throws BackendError on transfer failure
     */
    virtual void GetArchive(const EnvironmentHandle& env,
                            const std::string& remote_path,
                            const std::filesystem::path& archive) = 0;

    /**
     * @brief Commit the environment's state into an image tag
     * @throws BackendError on failure
     */
    virtual void Commit(const EnvironmentHandle& env, const std::string& tag) = 0;

    /**
     * @brief Force-remove an environment
     * @return false if removal failed (already gone counts as success)
     */
    virtual bool RemoveEnvironment(const EnvironmentHandle& env) = 0;

    /**
     * @brief Point-in-time check whether any environment references an image
     *
     * Answers true when the check itself fails, so callers err on the side
     * of keeping the image.
     */
    virtual bool IsImageInUse(const std::string& image_id) = 0;

    /// Remove an image; false on failure
    virtual bool RemoveImage(const ImageRef& image) = 0;

    /**
     * @brief Remove an image unless an environment still references it
     *
     * The check and the removal are not atomic: two sessions sharing an
     * image and closing concurrently can race.
     *
     * @return true if the image was removed
     */
    bool RemoveImageIfUnused(const ImageRef& image);
};

} // namespace core
} // namespace monolith
