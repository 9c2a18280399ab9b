/**
 * @file docker_backend.cpp
 * @brief Docker implementation of the environment backend
 *
 * **Image Resolution**:
 * ```
 * dockerfile set → docker build -t <build_tag>        (freshly created)
 * image local    → docker image inspect               (reused)
 * image missing  → docker pull                        (freshly created)
 * ```
 *
 * **Error Mapping**:
 * - build/pull/inspect failure        → ProvisionError
 * - run failure, container not alive  → EnvironmentStartError
 * - missing remote path on cp         → RemoteFileNotFoundError
 * - daemon/CLI failure on cp          → BackendError
 * - daemon error on exec, container
 *   no longer running                  → BackendError
 * - non-zero exit of a guest command  → returned as ConsoleOutput
 *
 * @date 2025
 */

#include "monolith/core/docker_backend.hpp"
#include "monolith/core/errors.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>

namespace monolith {
namespace core {

using utils::StringUtils;

namespace {

std::optional<std::string> NonEmpty(const std::string& text) {
    if (text.empty()) {
        return std::nullopt;
    }
    return text;
}

} // anonymous namespace

DockerBackend::DockerBackend(utils::ContainerRuntime runtime) {
    try {
        containers_ = std::make_unique<utils::ContainerUtils>(runtime);
    }
    catch (const std::runtime_error& e) {
        throw BackendError(e.what());
    }
}

std::string DockerBackend::Name() const {
    return containers_->GetRuntime() == utils::ContainerRuntime::PODMAN ? "podman" : "docker";
}

// ============================================================================
// IMAGE RESOLUTION
// ============================================================================

ImageRef DockerBackend::ResolveImage(const ImageSpec& spec, const std::string& build_tag) {
    if (!spec.image.empty() && !spec.dockerfile.empty()) {
        throw ProvisionError("Only one of image or dockerfile should be provided");
    }

    ImageRef ref;

    if (!spec.dockerfile.empty()) {
        if (!std::filesystem::is_regular_file(spec.dockerfile)) {
            throw ProvisionError("Dockerfile not found: " + spec.dockerfile.string());
        }
        if (build_tag.empty()) {
            throw ProvisionError("A build tag is required to build " + spec.dockerfile.string());
        }

        auto result = containers_->BuildImage(spec.dockerfile, build_tag);
        if (!result.success) {
            throw ProvisionError("Failed to build image from " + spec.dockerfile.string() + ": " +
                                 StringUtils::TrimRight(result.stderr_output));
        }

        auto id = containers_->GetImageId(build_tag);
        if (!id) {
            throw ProvisionError("Built image " + build_tag + " cannot be inspected");
        }

        ref.tag = build_tag;
        ref.id = *id;
        ref.freshly_created = true;
        return ref;
    }

    if (spec.image.empty()) {
        throw ProvisionError("No image or dockerfile provided");
    }

    ref.tag = spec.image;
    if (auto id = containers_->GetImageId(spec.image)) {
        spdlog::info("Using image {}", spec.image);
        ref.id = *id;
        ref.freshly_created = false;
        return ref;
    }

    auto pulled = containers_->PullImage(spec.image);
    if (!pulled.success) {
        throw ProvisionError("Failed to pull image " + spec.image + ": " +
                             StringUtils::TrimRight(pulled.stderr_output));
    }

    auto id = containers_->GetImageId(spec.image);
    if (!id) {
        throw ProvisionError("Pulled image " + spec.image + " cannot be inspected");
    }
    ref.id = *id;
    ref.freshly_created = true;
    return ref;
}

// ============================================================================
// ENVIRONMENT LIFECYCLE
// ============================================================================

EnvironmentHandle DockerBackend::StartEnvironment(const ImageRef& image,
                                                  const EnvironmentOptions& options) {
    utils::ContainerConfig config;
    config.image = image.id.empty() ? image.tag : image.id;
    config.memory_limit_mb = options.limits.memory_mb;
    config.cpu_limit = options.limits.cpus;
    config.pids_limit = options.limits.pids_limit;
    config.network_mode = options.network;
    config.mounts = options.mounts;

    auto result = containers_->CreateContainer(config);
    if (!result.success || result.stdout_output.empty()) {
        throw EnvironmentStartError("Failed to start container from " + image.tag + ": " +
                                    StringUtils::TrimRight(result.stderr_output));
    }

    EnvironmentHandle handle;
    handle.id = result.stdout_output;
    handle.image_id = image.id;

    auto state = containers_->GetContainerState(handle.id);
    if (state != utils::ContainerState::RUNNING) {
        containers_->RemoveContainer(handle.id, true);
        throw EnvironmentStartError("Container " + handle.ShortId() +
                                    " is not running after start");
    }

    return handle;
}

ConsoleOutput DockerBackend::Execute(const EnvironmentHandle& env,
                                     const std::string& command,
                                     const std::string& working_dir) {
    auto result = containers_->ExecuteCommand(env.id, {"/bin/sh", "-c", command}, working_dir);

    if (!result.spawned) {
        throw BackendError("Cannot run container runtime: " + result.stderr_output);
    }
    if (LooksLikeDaemonError(result) &&
        IsTransportFailure(result, containers_->GetContainerState(env.id))) {
        throw BackendError("Command delivery to " + env.ShortId() + " failed: " +
                           StringUtils::TrimRight(result.stderr_output));
    }

    ConsoleOutput output;
    output.stdout_output = NonEmpty(result.stdout_output);
    output.stderr_output = NonEmpty(result.stderr_output);
    output.exit_code = result.exit_code;
    return output;
}

// ============================================================================
// ARCHIVE TRANSFER
// ============================================================================

void DockerBackend::PutArchive(const EnvironmentHandle& env,
                               const std::filesystem::path& archive,
                               const std::string& remote_dir) {
    auto result = containers_->CopyArchiveToContainer(env.id, archive, remote_dir);
    if (!result.success) {
        throw BackendError("Failed to copy archive into " + env.ShortId() + ":" + remote_dir +
                           ": " + StringUtils::TrimRight(result.stderr_output));
    }
}

void DockerBackend::GetArchive(const EnvironmentHandle& env,
                               const std::string& remote_path,
                               const std::filesystem::path& archive) {
    auto result = containers_->CopyArchiveFromContainer(env.id, remote_path, archive);
    if (result.success) {
        return;
    }

    const auto& err = result.stderr_output;
    if (StringUtils::Contains(err, "Could not find the file") ||
        StringUtils::Contains(err, "No such file or directory")) {
        throw RemoteFileNotFoundError("File " + remote_path + " not found in the container");
    }
    throw BackendError("Failed to copy " + env.ShortId() + ":" + remote_path + ": " +
                       StringUtils::TrimRight(err));
}

void DockerBackend::Commit(const EnvironmentHandle& env, const std::string& tag) {
    if (containers_->CreateSnapshot(env.id, tag).empty()) {
        throw BackendError("Failed to commit " + env.ShortId() + " to " + tag);
    }
}

bool DockerBackend::RemoveEnvironment(const EnvironmentHandle& env) {
    if (containers_->RemoveContainer(env.id, true)) {
        return true;
    }
    // Already gone is as good as removed
    return !containers_->ContainerExists(env.id);
}

// ============================================================================
// IMAGE RETENTION
// ============================================================================

bool DockerBackend::IsImageInUse(const std::string& image_id) {
    auto containers = containers_->ListContainersUsingImage(image_id);
    if (!containers) {
        spdlog::warn("Cannot determine users of image {}, treating it as in use", image_id);
        return true;
    }
    return !containers->empty();
}

bool DockerBackend::RemoveImage(const ImageRef& image) {
    return containers_->RemoveImage(image.id.empty() ? image.tag : image.id, true);
}

bool DockerBackend::LooksLikeDaemonError(const utils::ContainerExecResult& result) {
    const auto& err = result.stderr_output;
    return result.exit_code != 0 &&
           (StringUtils::StartsWith(err, "Error response from daemon") ||
            StringUtils::StartsWith(err, "Error: No such container") ||
            StringUtils::Contains(err, "OCI runtime exec failed"));
}

bool DockerBackend::IsTransportFailure(const utils::ContainerExecResult& result,
                                       utils::ContainerState state) {
    return LooksLikeDaemonError(result) && state != utils::ContainerState::RUNNING;
}

} // namespace core
} // namespace monolith
