/**
 * @file docker_backend.hpp
 * @brief Docker implementation of the environment backend
 *
 * @date 2025
 */

#pragma once

#include "monolith/core/environment.hpp"
#include "monolith/utils/container_utils.hpp"

#include <memory>

namespace monolith {
namespace core {

/**
 * @class DockerBackend
 * @brief Environment backend driving the Docker (or Podman) CLI
 *
 * Translates ContainerUtils' boolean/exit-code reporting into the session's
 * error taxonomy. Commands run through `/bin/sh -c` inside the container.
 *
 * **Usage Example**:
 * @code
 * auto backend = std::make_shared<DockerBackend>();
 * auto image = backend->ResolveImage({"python:3.9.19-bullseye", {}}, "");
 * auto env = backend->StartEnvironment(image, {});
 * auto out = backend->Execute(env, "python -c 'print(1+1)'", "/tmp");
 * backend->RemoveEnvironment(env);
 * @endcode
 */
class DockerBackend : public EnvironmentBackend {
public:
    /**
     * @brief Connect to the container runtime
     * @param runtime Runtime CLI to drive
     * @throws BackendError if the runtime is not available
     */
    explicit DockerBackend(utils::ContainerRuntime runtime = utils::ContainerRuntime::DOCKER);

    std::string Name() const override;

    ImageRef ResolveImage(const ImageSpec& spec, const std::string& build_tag) override;
    EnvironmentHandle StartEnvironment(const ImageRef& image,
                                       const EnvironmentOptions& options) override;
    ConsoleOutput Execute(const EnvironmentHandle& env,
                          const std::string& command,
                          const std::string& working_dir) override;
    void PutArchive(const EnvironmentHandle& env,
                    const std::filesystem::path& archive,
                    const std::string& remote_dir) override;
    void GetArchive(const EnvironmentHandle& env,
                    const std::string& remote_path,
                    const std::filesystem::path& archive) override;
    void Commit(const EnvironmentHandle& env, const std::string& tag) override;
    bool RemoveEnvironment(const EnvironmentHandle& env) override;
    bool IsImageInUse(const std::string& image_id) override;
    bool RemoveImage(const ImageRef& image) override;

    /**
     * @brief Decide whether a failed exec is a transport failure
     *
     * The guest shares stderr with the runtime CLI, so the runtime's error
     * text alone is not enough: the container must also have stopped
     * running. A guest printing the same text into a live container gets
     * its output back as a normal result.
     *
     * @param result Outcome of `docker exec`
     * @param state Container state observed after the failure
     * @return true if the command never reached a running container
     */
    static bool IsTransportFailure(const utils::ContainerExecResult& result,
                                   utils::ContainerState state);

private:
    std::unique_ptr<utils::ContainerUtils> containers_;

    static bool LooksLikeDaemonError(const utils::ContainerExecResult& result);
};

} // namespace core
} // namespace monolith
