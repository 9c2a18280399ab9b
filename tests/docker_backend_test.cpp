/**
 * @file docker_backend_test.cpp
 * @brief End-to-end checks against a live Docker daemon
 *
 * Skipped when the docker CLI or daemon is unavailable.
 */

#include "monolith/core/docker_backend.hpp"
#include "monolith/core/errors.hpp"
#include "monolith/core/execution_service.hpp"
#include "monolith/utils/container_utils.hpp"

#include <gtest/gtest.h>

using namespace monolith;
using namespace monolith::core;

namespace {

utils::ContainerExecResult ExecFailure(const std::string& err) {
    utils::ContainerExecResult result;
    result.exit_code = 1;
    result.stderr_output = err;
    return result;
}

} // anonymous namespace

TEST(DockerBackendErrors, GuestStderrInLiveContainerIsData) {
    using utils::ContainerState;
    EXPECT_FALSE(DockerBackend::IsTransportFailure(
        ExecFailure("Error: No such container: 1234"), ContainerState::RUNNING));
    EXPECT_FALSE(DockerBackend::IsTransportFailure(
        ExecFailure("Error response from daemon: conflict"), ContainerState::RUNNING));
    EXPECT_FALSE(DockerBackend::IsTransportFailure(
        ExecFailure("OCI runtime exec failed"), ContainerState::RUNNING));
}

TEST(DockerBackendErrors, DaemonErrorOnStoppedContainerIsTransport) {
    using utils::ContainerState;
    EXPECT_TRUE(DockerBackend::IsTransportFailure(
        ExecFailure("Error: No such container: 1234"), ContainerState::UNKNOWN));
    EXPECT_TRUE(DockerBackend::IsTransportFailure(
        ExecFailure("Error response from daemon: container is not running"),
        ContainerState::EXITED));
    EXPECT_FALSE(DockerBackend::IsTransportFailure(
        ExecFailure("Traceback (most recent call last):"), ContainerState::UNKNOWN));

    auto succeeded = ExecFailure("Error: No such container");
    succeeded.exit_code = 0;
    EXPECT_FALSE(DockerBackend::IsTransportFailure(succeeded, ContainerState::UNKNOWN));
}

class DockerBackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!utils::ContainerUtils::IsRuntimeAvailable()) {
            GTEST_SKIP() << "Docker is not available";
        }
    }
};

TEST_F(DockerBackendTest, RejectsImageAndDockerfile) {
    DockerBackend backend;
    ImageSpec spec;
    spec.image = "python:3.9.19-bullseye";
    spec.dockerfile = "Dockerfile";
    EXPECT_THROW(backend.ResolveImage(spec, "sandbox-python-x"), ProvisionError);
}

TEST_F(DockerBackendTest, UnknownImageFailsToResolve) {
    DockerBackend backend;
    ImageSpec spec;
    spec.image = "monolith-no-such-image:never";
    EXPECT_THROW(backend.ResolveImage(spec, ""), ProvisionError);
}

TEST_F(DockerBackendTest, ProfiledPythonRun) {
    ServiceConfig config;
    config.run_timeout = std::chrono::seconds(300);
    config.session_defaults.retention.keep_template = true;
    ExecutionService service(config, std::make_shared<DockerBackend>());

    ExecutionRequest request;
    request.language = Language::PYTHON;
    request.code = "x = [0] * 1000000\nprint(len(x))\n";
    auto report = service.Execute(request);

    ASSERT_FALSE(report.HasError()) << report.error;
    EXPECT_EQ(report.stdout_output, "1000000\n");
    EXPECT_EQ(report.exit_code, 0);
    EXPECT_FALSE(report.usage.memory_series.empty());
    EXPECT_GT(report.usage.peak_memory_kb, 0);
}

TEST_F(DockerBackendTest, RuntimeErrorIsResult) {
    ServiceConfig config;
    config.run_timeout = std::chrono::seconds(300);
    config.session_defaults.retention.keep_template = true;
    ExecutionService service(config, std::make_shared<DockerBackend>());

    ExecutionRequest request;
    request.language = Language::PYTHON;
    request.code = "raise ValueError('boom')\n";
    request.profile = false;
    auto report = service.Execute(request);

    EXPECT_EQ(report.error, "failed");
    EXPECT_NE(report.exit_code, 0);
    EXPECT_NE(report.stderr_output.find("ValueError: boom"), std::string::npos);
}

TEST_F(DockerBackendTest, DaemonLookingStderrFromGuestIsResult) {
    ServiceConfig config;
    config.run_timeout = std::chrono::seconds(300);
    config.session_defaults.retention.keep_template = true;
    ExecutionService service(config, std::make_shared<DockerBackend>());

    ExecutionRequest request;
    request.language = Language::PYTHON;
    request.code = "import sys\nprint('partial')\n"
                   "sys.stderr.write('Error: No such container')\nsys.exit(1)\n";
    request.profile = false;
    auto report = service.Execute(request);

    EXPECT_EQ(report.error, "failed");
    EXPECT_EQ(report.exit_code, 1);
    EXPECT_EQ(report.stdout_output, "partial\n");
    EXPECT_EQ(report.stderr_output, "Error: No such container");
}
