/**
 * @file container_utils.cpp
 * @brief Implementation of the container runtime CLI wrapper
 *
 * Every operation is one CLI round-trip executed through RunProcess() with an
 * argument vector, so image names, paths and user commands never pass through
 * a host shell.
 *
 * **Container Lifecycle**:
 * ```
 * Resolve image (inspect | pull | build) → run -dit → exec* → commit? → rm -f
 * ```
 *
 * **Archive Transfer**:
 * - To container:   `docker cp - <id>:<dir>`  (tar on stdin, unpacked in dir)
 * - From container: `docker cp <id>:<path> -` (tar of path on stdout)
 *
 * @date 2025
 */

#include "monolith/utils/container_utils.hpp"
#include "monolith/utils/process_utils.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>
#include <stdexcept>

namespace monolith {
namespace utils {

// ============================================================================
// CONSTRUCTOR
// ============================================================================
// Verifies runtime availability before any session uses it

ContainerUtils::ContainerUtils(ContainerRuntime runtime)
    : runtime_(runtime) {
    spdlog::debug("Container Utils initialized with runtime: {}", GetRuntimeBinary(runtime));

    if (!IsRuntimeAvailable(runtime)) {
        spdlog::error("Container runtime not available");
        throw std::runtime_error("Container runtime not available: " + GetRuntimeBinary(runtime));
    }

    spdlog::debug("Runtime version: {}", GetRuntimeVersion(runtime));
}

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

bool ContainerUtils::IsRuntimeAvailable(ContainerRuntime runtime) {
    ProcessSpec spec;
    spec.argv = {GetRuntimeBinary(runtime), "info", "--format", "{{.ServerVersion}}"};
    auto result = RunProcess(spec);
    return result.Succeeded();
}

std::string ContainerUtils::GetRuntimeVersion(ContainerRuntime runtime) {
    ProcessSpec spec;
    spec.argv = {GetRuntimeBinary(runtime), "--version"};
    auto result = RunProcess(spec);
    if (result.Succeeded()) {
        // Extract version number (x.y.z)
        std::regex version_regex(R"((\d+\.\d+\.\d+))");
        std::smatch match;
        std::string output_copy = result.stdout_output;
        if (std::regex_search(output_copy, match, version_regex)) {
            return match[1].str();
        }
        return StringUtils::TrimRight(result.stdout_output);
    }

    return "unknown";
}

// ============================================================================
// IMAGES
// ============================================================================

std::optional<std::string> ContainerUtils::GetImageId(const std::string& image) const {
    auto result = ExecuteDockerCommand({"image", "inspect", "--format", "{{.Id}}", image});
    if (!result.success) {
        return std::nullopt;
    }

    std::string id = StringUtils::Trim(result.stdout_output);
    if (id.empty()) {
        return std::nullopt;
    }
    return id;
}

ContainerExecResult ContainerUtils::PullImage(const std::string& image) const {
    spdlog::info("Pulling image {}..", image);

    auto result = ExecuteDockerCommand({"pull", image});
    if (result.success) {
        spdlog::info("Image pulled: {}", image);
    } else {
        spdlog::error("Failed to pull image {}: {}", image, StringUtils::TrimRight(result.stderr_output));
    }
    return result;
}

ContainerExecResult ContainerUtils::BuildImage(const std::filesystem::path& dockerfile,
                                               const std::string& tag) const {
    auto context = dockerfile.parent_path();
    if (context.empty()) {
        context = ".";
    }

    spdlog::info("Building image {} from {}", tag, dockerfile.string());

    auto result = ExecuteDockerCommand({
        "build",
        "-f", dockerfile.string(),
        "-t", tag,
        context.string()
    });

    if (result.success) {
        spdlog::info("Image built successfully: {}", tag);
    } else {
        spdlog::error("Failed to build image {}: {}", tag, StringUtils::TrimRight(result.stderr_output));
    }
    return result;
}

bool ContainerUtils::RemoveImage(const std::string& image, bool force) const {
    spdlog::info("Removing image: {} (force: {})", image, force);

    std::vector<std::string> args = {"rmi"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(image);

    auto result = ExecuteDockerCommand(args);
    if (result.success) {
        spdlog::info("Image removed successfully");
        return true;
    }

    spdlog::error("Failed to remove image: {}", StringUtils::TrimRight(result.stderr_output));
    return false;
}

std::optional<std::vector<std::string>> ContainerUtils::ListContainersUsingImage(
    const std::string& image_id) const {

    auto result = ExecuteDockerCommand({
        "ps", "--all", "--quiet", "--no-trunc",
        "--filter", "ancestor=" + image_id
    });

    if (!result.success) {
        spdlog::error("Failed to list containers for image {}: {}",
                      image_id, StringUtils::TrimRight(result.stderr_output));
        return std::nullopt;
    }

    return StringUtils::SplitWhitespace(result.stdout_output);
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

ContainerExecResult ContainerUtils::CreateContainer(const ContainerConfig& config) const {
    spdlog::info("Creating container from image: {}", config.image);

    auto result = ExecuteDockerCommand(BuildRunCommand(config));

    if (result.success) {
        result.stdout_output = StringUtils::Trim(result.stdout_output);
        spdlog::info("Container created: {}", result.stdout_output.substr(0, 12));
    } else {
        spdlog::error("Failed to create container: {}", StringUtils::TrimRight(result.stderr_output));
    }
    return result;
}

ContainerState ContainerUtils::GetContainerState(const std::string& container_id) const {
    auto result = ExecuteDockerCommand({
        "inspect",
        "--format", "{{.State.Status}}",
        container_id
    });

    if (result.success) {
        return ParseState(StringUtils::Trim(result.stdout_output));
    }

    return ContainerState::UNKNOWN;
}

ContainerExecResult ContainerUtils::ExecuteCommand(const std::string& container_id,
                                                   const std::vector<std::string>& command,
                                                   const std::string& working_dir) const {
    std::vector<std::string> args = {"exec"};

    if (!working_dir.empty()) {
        args.push_back("-w");
        args.push_back(working_dir);
    }

    args.push_back(container_id);
    args.insert(args.end(), command.begin(), command.end());

    return ExecuteDockerCommand(args);
}

ContainerExecResult ContainerUtils::CopyArchiveToContainer(const std::string& container_id,
                                                           const std::filesystem::path& archive,
                                                           const std::string& dest_dir) const {
    spdlog::debug("Copying archive {} to container {}:{}",
                  archive.string(), container_id.substr(0, 12), dest_dir);

    auto result = ExecuteDockerCommand({"cp", "-", container_id + ":" + dest_dir}, archive);
    if (!result.success) {
        spdlog::error("Failed to copy archive: {}", StringUtils::TrimRight(result.stderr_output));
    }
    return result;
}

ContainerExecResult ContainerUtils::CopyArchiveFromContainer(const std::string& container_id,
                                                             const std::string& source,
                                                             const std::filesystem::path& archive) const {
    spdlog::debug("Copying {}:{} to archive {}",
                  container_id.substr(0, 12), source, archive.string());

    auto result = ExecuteDockerCommand({"cp", container_id + ":" + source, "-"}, {}, archive);
    if (!result.success) {
        spdlog::debug("Archive copy failed: {}", StringUtils::TrimRight(result.stderr_output));
    }
    return result;
}

std::string ContainerUtils::CreateSnapshot(const std::string& container_id,
                                           const std::string& tag) const {
    spdlog::info("Creating snapshot of container: {} with tag: {}",
                 container_id.substr(0, 12), tag);

    auto result = ExecuteDockerCommand({"commit", container_id, tag});

    if (result.success) {
        std::string image_id = StringUtils::Trim(result.stdout_output);
        spdlog::info("Snapshot created: {}", image_id);
        return image_id;
    }

    spdlog::error("Failed to create snapshot: {}", StringUtils::TrimRight(result.stderr_output));
    return "";
}

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) const {
    spdlog::info("Removing container: {} (force: {})", container_id.substr(0, 12), force);

    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("-f");
    }
    args.push_back(container_id);

    auto result = ExecuteDockerCommand(args);

    if (result.success) {
        spdlog::info("Container removed successfully");
        return true;
    }

    spdlog::error("Failed to remove container: {}", StringUtils::TrimRight(result.stderr_output));
    return false;
}

bool ContainerUtils::ContainerExists(const std::string& container_id) const {
    auto result = ExecuteDockerCommand({
        "inspect", "--format", "{{.Id}}", container_id
    });
    return result.success;
}

// ============================================================================
// PRIVATE HELPER METHODS
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteDockerCommand(const std::vector<std::string>& args,
                                                         const std::filesystem::path& stdin_file,
                                                         const std::filesystem::path& stdout_file) const {
    ProcessSpec spec;
    spec.argv.push_back(GetRuntimeBinary(runtime_));
    spec.argv.insert(spec.argv.end(), args.begin(), args.end());
    spec.stdin_file = stdin_file;
    spec.stdout_file = stdout_file;

    spdlog::debug("Executing: {}", FormatCommandLine(spec.argv));

    auto start_time = std::chrono::steady_clock::now();
    auto process = RunProcess(spec);
    auto end_time = std::chrono::steady_clock::now();

    ContainerExecResult exec_result;
    exec_result.spawned = process.spawned;
    exec_result.exit_code = process.exit_code;
    exec_result.stdout_output = std::move(process.stdout_output);
    exec_result.stderr_output = process.spawned ? std::move(process.stderr_output)
                                                : process.error_message;
    exec_result.success = process.Succeeded();
    exec_result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        end_time - start_time);

    return exec_result;
}

std::vector<std::string> ContainerUtils::BuildRunCommand(const ContainerConfig& config) const {
    std::vector<std::string> args;

    args.push_back("run");
    args.push_back("-d");  // Detached mode
    args.push_back("-i");  // Keep stdin open
    args.push_back("-t");  // Allocate TTY so the default command stays alive

    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }

    // Memory limit
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }

    // CPU limit
    if (config.cpu_limit > 0) {
        args.push_back("--cpus");
        args.push_back(std::to_string(config.cpu_limit));
    }

    // Process limit
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }

    // Network mode
    switch (config.network_mode) {
        case NetworkMode::NONE:
            args.push_back("--network");
            args.push_back("none");
            break;
        case NetworkMode::HOST:
            args.push_back("--network");
            args.push_back("host");
            spdlog::warn("WARNING: Sandbox container shares the host network");
            break;
        case NetworkMode::BRIDGE:
        default:
            break;
    }

    // Volume mounts
    for (const auto& mount : config.mounts) {
        args.push_back("-v");
        args.push_back(mount.host_path.string() + ":" + mount.container_path +
                       (mount.read_only ? ":ro" : ""));
    }

    // Environment variables
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("-e");
        args.push_back(key + "=" + value);
    }

    // Working directory
    if (!config.working_dir.empty()) {
        args.push_back("-w");
        args.push_back(config.working_dir);
    }

    // Image (must be last)
    args.push_back(config.image);

    return args;
}

std::string ContainerUtils::GetRuntimeBinary(ContainerRuntime runtime) {
    switch (runtime) {
        case ContainerRuntime::PODMAN:
            return "podman";
        case ContainerRuntime::DOCKER:
        default:
            return "docker";
    }
}

ContainerState ContainerUtils::ParseState(const std::string& state_str) {
    if (state_str == "created") return ContainerState::CREATED;
    if (state_str == "running") return ContainerState::RUNNING;
    if (state_str == "paused") return ContainerState::PAUSED;
    if (state_str == "restarting") return ContainerState::RUNNING;
    if (state_str == "exited") return ContainerState::EXITED;
    if (state_str == "dead") return ContainerState::DEAD;
    return ContainerState::UNKNOWN;
}

} // namespace utils
} // namespace monolith
