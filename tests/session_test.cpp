/**
 * @file session_test.cpp
 * @brief Session lifecycle, setup, run and retention against the in-process backend
 */

#include "fake_backend.hpp"

#include "monolith/core/errors.hpp"
#include "monolith/core/session.hpp"
#include "monolith/utils/archive_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <fstream>
#include <sstream>

using namespace monolith;
using namespace monolith::core;
using fakes::FakeBackend;
using fakes::ScriptedStep;

namespace {

ConsoleOutput Output(int exit_code, const std::string& out = "", const std::string& err = "") {
    ConsoleOutput output;
    output.exit_code = exit_code;
    if (!out.empty()) output.stdout_output = out;
    if (!err.empty()) output.stderr_output = err;
    return output;
}

std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream content;
    content << file.rdbuf();
    return content.str();
}

bool Contains(const std::vector<std::string>& lines, const std::string& line) {
    return std::find(lines.begin(), lines.end(), line) != lines.end();
}

class SessionTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeBackend> backend = std::make_shared<FakeBackend>();
    utils::TemporaryDirectory host{"monolith-session-test"};
    std::filesystem::path profiler;

    void SetUp() override {
        profiler = host.Path() / "memory_profiler.sh";
        std::ofstream(profiler) << "#!/usr/bin/env bash\n\"$@\"\n";
    }

    SessionBuilder Builder(Language language) const {
        SessionBuilder builder;
        builder.WithLanguage(language).WithProfilerScript(profiler);
        return builder;
    }

    std::shared_ptr<Session> Make(const SessionConfig& config) {
        return std::make_shared<Session>(config, backend);
    }

    /// Script the sampler so a profiled step leaves a feed behind
    void ScriptProfiledRun(const std::string& feed, ConsoleOutput output) {
        ScriptedStep step;
        step.prefix = kProfilerCommand;
        step.output = std::move(output);
        step.effect = [feed](const std::string&, const std::filesystem::path& workdir) {
            std::ofstream(workdir / kMemoryFeedName) << feed;
        };
        backend->Script(step);
    }
};

} // anonymous namespace

// ============================================================================
// LIFECYCLE
// ============================================================================

TEST_F(SessionTest, OpenBootstrapsAndCloseRemovesEnvironment) {
    auto session = Make(Builder(Language::PYTHON).Build());
    EXPECT_EQ(session->GetState(), SessionState::UNINITIALIZED);
    EXPECT_EQ(session->GetConfig().image.image, "python:3.9.19-bullseye");

    session->Open();
    EXPECT_TRUE(session->IsOpen());
    ASSERT_TRUE(session->GetHandle().has_value());
    EXPECT_EQ(backend->LiveEnvironments(), 1u);

    auto lines = backend->CommandLines();
    ASSERT_GE(lines.size(), 2u);
    EXPECT_EQ(lines[0], "apt-get update");
    EXPECT_EQ(lines[1], "apt-get install -y time");

    session->Close();
    EXPECT_EQ(session->GetState(), SessionState::CLOSED);
    EXPECT_FALSE(session->GetHandle().has_value());
    EXPECT_EQ(backend->LiveEnvironments(), 0u);

    session->Close();
    EXPECT_EQ(session->GetState(), SessionState::CLOSED);
}

TEST_F(SessionTest, BootstrapFailureIsNotFatal) {
    backend->Script("apt-get update", Output(100, "", "network unreachable"));
    auto session = Make(Builder(Language::PYTHON).Build());

    session->Open();
    EXPECT_TRUE(session->IsOpen());
}

TEST_F(SessionTest, SkipBootstrapRunsNoCommands) {
    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();
    EXPECT_TRUE(backend->CommandLines().empty());
}

TEST_F(SessionTest, ClosedSessionCannotReopen) {
    auto session = Make(Builder(Language::PYTHON).Build());
    session->Open();
    EXPECT_THROW(session->Open(), UnsupportedOperationError);
    session->Close();
    EXPECT_THROW(session->Open(), NotOpenError);
}

TEST_F(SessionTest, OperationsRequireOpenSession) {
    auto session = Make(Builder(Language::PYTHON).Build());
    auto local = host.Path() / "x.txt";

    EXPECT_THROW(session->Setup({"numpy"}), NotOpenError);
    EXPECT_THROW(session->Run("print(1)", false), NotOpenError);
    EXPECT_THROW(session->CopyTo(profiler, "/tmp/x.sh"), NotOpenError);
    EXPECT_THROW(session->CopyFrom("/tmp/x.sh", local), NotOpenError);
    EXPECT_THROW(session->ExecuteCommand("ls"), NotOpenError);

    session->Open();
    session->Close();

    EXPECT_THROW(session->Run("print(1)", false), NotOpenError);
    EXPECT_THROW(session->ExecuteCommand("ls"), NotOpenError);
}

TEST_F(SessionTest, ImageAndDockerfileAreExclusive) {
    auto config = Builder(Language::PYTHON)
        .WithImage("python:3.11")
        .WithDockerfile(host.Path() / "Dockerfile")
        .Build();
    EXPECT_THROW(Make(config), ConfigError);
}

TEST_F(SessionTest, DockerfileBuildTagUsesContextDirectory) {
    auto context = host.Path() / "MyContext";
    std::filesystem::create_directories(context);
    std::ofstream(context / "Dockerfile") << "FROM python:3.9\n";

    EXPECT_EQ(Session::BuildTag(Language::PYTHON, context / "Dockerfile"), "sandbox-python-mycontext");

    auto session = Make(Builder(Language::PYTHON).WithDockerfile(context / "Dockerfile").Build());
    session->Open();
    auto tags = backend->ResolvedBuildTags();
    ASSERT_EQ(tags.size(), 1u);
    EXPECT_EQ(tags[0], "sandbox-python-mycontext");
    ASSERT_TRUE(session->GetImage().has_value());
    EXPECT_TRUE(session->GetImage()->freshly_created);
}

TEST_F(SessionTest, ProvisionFailurePropagates) {
    backend->FailResolve();
    auto session = Make(Builder(Language::PYTHON).Build());
    EXPECT_THROW(session->Open(), ProvisionError);
    EXPECT_EQ(session->GetState(), SessionState::UNINITIALIZED);
    EXPECT_EQ(backend->LiveEnvironments(), 0u);
}

TEST_F(SessionTest, StartFailureStillCleansFreshImage) {
    backend->MarkImageMissing("python:3.9.19-bullseye");
    backend->FailStart();
    auto session = Make(Builder(Language::PYTHON).Build());

    EXPECT_THROW(session->Open(), EnvironmentStartError);
    session->Close();

    auto removed = backend->RemovedImages();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "python:3.9.19-bullseye");
}

TEST_F(SessionTest, ScopeClosesOnExit) {
    auto session = Make(Builder(Language::RUBY).Build());
    {
        SessionScope scope(session);
        EXPECT_TRUE(scope->IsOpen());
        EXPECT_EQ(backend->LiveEnvironments(), 1u);
    }
    EXPECT_EQ(session->GetState(), SessionState::CLOSED);
    EXPECT_EQ(backend->LiveEnvironments(), 0u);
}

TEST_F(SessionTest, ScopeClosesWhenOpenFails) {
    backend->FailStart();
    auto session = Make(Builder(Language::RUBY).Build());
    EXPECT_THROW(SessionScope scope(session), EnvironmentStartError);
    EXPECT_EQ(session->GetState(), SessionState::CLOSED);
}

// ============================================================================
// SETUP
// ============================================================================

TEST_F(SessionTest, SetupWithoutLibrariesDoesNothing) {
    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();
    EXPECT_TRUE(session->Setup({}).empty());
    EXPECT_TRUE(backend->CommandLines().empty());
}

TEST_F(SessionTest, SetupInstallsInOrder) {
    backend->Script("pip install numpy", Output(0, "Successfully installed numpy"));
    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();

    auto outputs = session->Setup({"numpy", "requests"});

    ASSERT_EQ(outputs.size(), 2u);
    EXPECT_EQ(outputs[0].stdout_output.value_or(""), "Successfully installed numpy");
    auto lines = backend->CommandLines();
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "pip install numpy");
    EXPECT_EQ(lines[1], "pip install requests");
}

TEST_F(SessionTest, SetupRejectsJavaBeforeAnyCommand) {
    auto session = Make(Builder(Language::JAVA).SkipBootstrap().Build());
    session->Open();
    EXPECT_THROW(session->Setup({"junit"}), UnsupportedOperationError);
    EXPECT_TRUE(backend->CommandLines().empty());
}

TEST_F(SessionTest, GoWorkspaceIsInitialisedOnce) {
    auto session = Make(Builder(Language::GO).SkipBootstrap().Build());
    session->Open();

    session->Setup({"github.com/google/uuid"});
    session->Setup({"golang.org/x/text"});

    auto commands = backend->Commands();
    ASSERT_EQ(commands.size(), 5u);
    EXPECT_EQ(commands[0].command, "mkdir -p /go_space");
    EXPECT_EQ(commands[1].command, "go mod init go_space");
    EXPECT_EQ(commands[1].working_dir, "/go_space");
    EXPECT_EQ(commands[2].command, "go mod tidy");
    EXPECT_EQ(commands[3].command, "go get -u github.com/google/uuid");
    EXPECT_EQ(commands[3].working_dir, "/go_space");
    EXPECT_EQ(commands[4].command, "go get -u golang.org/x/text");
}

// ============================================================================
// RUN
// ============================================================================

TEST_F(SessionTest, RunWithoutProfiling) {
    backend->Script("python /tmp/code.py", Output(0, "2\n"));
    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();

    auto result = session->Run("print(1 + 1)\n", false);

    EXPECT_EQ(result.stdout_output, "2\n");
    EXPECT_EQ(result.stderr_output, "");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.usage.peak_memory_kb, 0);
    EXPECT_EQ(result.usage.integral_kb_ms, 0);
    EXPECT_TRUE(result.usage.memory_series.empty());

    auto env = *session->GetHandle();
    EXPECT_EQ(ReadFile(backend->HostPath(env, "/tmp/code.py")), "print(1 + 1)\n");
    EXPECT_FALSE(std::filesystem::exists(backend->HostPath(env, kProfilerRemotePath)));

    auto commands = backend->Commands();
    ASSERT_FALSE(commands.empty());
    EXPECT_EQ(commands.back().command, "python /tmp/code.py");
    EXPECT_EQ(commands.back().working_dir, "/tmp");
}

TEST_F(SessionTest, ProfiledRunReducesFeed) {
    ScriptProfiledRun("0 10\n1000000 50\n2000000 30\n", Output(0, "done\n"));
    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();

    auto result = session->Run("print('done')\n", true);

    EXPECT_EQ(result.stdout_output, "done\n");
    EXPECT_EQ(result.usage.peak_memory_kb, 50);
    EXPECT_DOUBLE_EQ(result.usage.duration_ms, 2.0);
    EXPECT_EQ(result.usage.integral_kb_ms, 110);
    EXPECT_EQ(result.usage.memory_series.size(), 3u);

    auto env = *session->GetHandle();
    EXPECT_TRUE(std::filesystem::exists(backend->HostPath(env, kProfilerRemotePath)));

    auto lines = backend->CommandLines();
    EXPECT_TRUE(Contains(lines, "rm -f /tmp/mem_usage.log"));
    EXPECT_TRUE(Contains(lines, "bash /tmp/memory_profiler.sh python /tmp/code.py"));
}

TEST_F(SessionTest, ProfiledRunWithoutFeedRaises) {
    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();
    EXPECT_THROW(session->Run("print(1)", true), RemoteFileNotFoundError);
}

TEST_F(SessionTest, StaleFeedRemovalFailureIsNotFatal) {
    backend->Script("rm -f ", Output(1, "", "rm: cannot remove '/tmp/mem_usage.log'"));
    ScriptProfiledRun("0 10\n1000000 20\n", Output(0, "ok\n"));
    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();

    auto result = session->Run("print('ok')\n", true);

    EXPECT_TRUE(result.completed);
    EXPECT_EQ(result.stdout_output, "ok\n");
    EXPECT_EQ(result.usage.peak_memory_kb, 20);
    EXPECT_TRUE(Contains(backend->CommandLines(), "rm -f /tmp/mem_usage.log"));
}

TEST_F(SessionTest, PlantedFeedSymlinkIsRefused) {
    auto secret = host.Path() / "host-only.txt";
    std::ofstream(secret) << "HOST-ONLY-SECRET\n";

    ScriptedStep step;
    step.prefix = kProfilerCommand;
    step.effect = [secret](const std::string&, const std::filesystem::path& workdir) {
        std::filesystem::create_symlink(secret, workdir / kMemoryFeedName);
    };
    backend->Script(step);

    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();
    EXPECT_THROW(session->Run("import os", true), RemoteFileNotFoundError);

    auto local = host.Path() / "copied.log";
    EXPECT_THROW(session->CopyFrom("/tmp/mem_usage.log", local), RemoteFileNotFoundError);
    EXPECT_FALSE(std::filesystem::exists(std::filesystem::symlink_status(local)));
}

TEST_F(SessionTest, ProfiledRunNeedsSamplerScript) {
    auto session = Make(Builder(Language::PYTHON)
                            .SkipBootstrap()
                            .WithProfilerScript(host.Path() / "missing.sh")
                            .Build());
    session->Open();
    EXPECT_THROW(session->Run("print(1)", true), ConfigError);
}

TEST_F(SessionTest, GoRunsInWorkspace) {
    ScriptProfiledRun("5 100\n", Output(0, "hello\n"));
    auto session = Make(Builder(Language::GO).SkipBootstrap().Build());
    session->Open();

    auto result = session->Run("package main\n", true);

    EXPECT_EQ(result.stdout_output, "hello\n");
    EXPECT_EQ(result.usage.peak_memory_kb, 100);

    auto env = *session->GetHandle();
    EXPECT_TRUE(std::filesystem::exists(backend->HostPath(env, "/go_space/code.go")));
    auto commands = backend->Commands();
    auto run = std::find_if(commands.begin(), commands.end(), [](const fakes::RecordedCommand& c) {
        return c.command == "bash /tmp/memory_profiler.sh go run /go_space/code.go";
    });
    ASSERT_NE(run, commands.end());
    EXPECT_EQ(run->working_dir, "/go_space");
    EXPECT_EQ(commands.back().command, "test -e /go_space/mem_usage.log");
}

TEST_F(SessionTest, CompileFailureStopsSequence) {
    backend->Script("g++", Output(1, "", "code.cpp:1:1: error: expected unqualified-id"));
    auto session = Make(Builder(Language::CPP).SkipBootstrap().Build());
    session->Open();

    auto result = session->Run("int main( {", true);

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_FALSE(result.completed);
    EXPECT_EQ(result.stderr_output, "code.cpp:1:1: error: expected unqualified-id");
    EXPECT_EQ(result.usage.peak_memory_kb, 0);

    auto lines = backend->CommandLines();
    EXPECT_TRUE(Contains(lines, "g++ -o a.out /tmp/code.cpp"));
    EXPECT_FALSE(Contains(lines, "bash /tmp/memory_profiler.sh ./a.out"));
    EXPECT_FALSE(Contains(lines, "test -e /tmp/mem_usage.log"));
}

TEST_F(SessionTest, CompileWarningsSurfaceWhenRunIsQuiet) {
    backend->Script("g++", Output(0, "", "warning: unused variable 'x'"));
    backend->Script("./a.out", Output(0, "42\n"));
    auto session = Make(Builder(Language::CPP).SkipBootstrap().Build());
    session->Open();

    auto result = session->Run("int main() { int x; return 0; }", false);

    EXPECT_TRUE(result.completed);
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.stdout_output, "42\n");
    EXPECT_EQ(result.stderr_output, "warning: unused variable 'x'");
}

TEST_F(SessionTest, RuntimeErrorIsData) {
    backend->Script("python", Output(1, "", "ZeroDivisionError: division by zero"));
    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();

    auto result = session->Run("1/0", false);

    EXPECT_EQ(result.exit_code, 1);
    EXPECT_TRUE(result.completed);
    EXPECT_EQ(result.stderr_output, "ZeroDivisionError: division by zero");
}

TEST_F(SessionTest, RawOperations) {
    auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    session->Open();

    session->CopyTo(profiler, "/data/in/script.sh");
    auto local = host.Path() / "back" / "script.sh";
    session->CopyFrom("/data/in/script.sh", local);
    EXPECT_EQ(ReadFile(local), ReadFile(profiler));

    EXPECT_THROW(session->CopyFrom("/data/none", host.Path() / "none"), RemoteFileNotFoundError);
    EXPECT_THROW(session->ExecuteCommand("   "), std::invalid_argument);

    backend->Script("echo hi", Output(0, "hi\n"));
    auto output = session->ExecuteCommand("echo hi", "/data");
    EXPECT_EQ(output.stdout_output.value_or(""), "hi\n");
    EXPECT_EQ(backend->Commands().back().working_dir, "/data");
}

// ============================================================================
// RETENTION
// ============================================================================

TEST_F(SessionTest, FreshImageRemovedOnClose) {
    backend->MarkImageMissing("ruby:3.0.2-bullseye");
    auto session = Make(Builder(Language::RUBY).SkipBootstrap().Build());
    session->Open();
    session->Close();

    auto removed = backend->RemovedImages();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "ruby:3.0.2-bullseye");
}

TEST_F(SessionTest, CachedImageIsKept) {
    auto session = Make(Builder(Language::RUBY).SkipBootstrap().Build());
    session->Open();
    session->Close();
    EXPECT_TRUE(backend->RemovedImages().empty());
}

TEST_F(SessionTest, KeepTemplateKeepsFreshImage) {
    backend->MarkImageMissing("ruby:3.0.2-bullseye");
    auto session = Make(Builder(Language::RUBY).SkipBootstrap().KeepTemplate().Build());
    session->Open();
    session->Close();
    EXPECT_TRUE(backend->RemovedImages().empty());
}

TEST_F(SessionTest, CommitOnCloseCommitsToImageTag) {
    auto session = Make(Builder(Language::RUBY).SkipBootstrap().CommitOnClose().Build());
    session->Open();
    auto env = *session->GetHandle();
    session->Close();

    auto commits = backend->Commits();
    ASSERT_EQ(commits.size(), 1u);
    EXPECT_EQ(commits[0].first, env.id);
    EXPECT_EQ(commits[0].second, "ruby:3.0.2-bullseye");
}

TEST_F(SessionTest, SharedImageSurvivesWhileInUse) {
    backend->MarkImageMissing("python:3.9.19-bullseye");
    auto first = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    auto second = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    first->Open();
    second->Open();
    ASSERT_TRUE(first->GetImage()->freshly_created);
    ASSERT_FALSE(second->GetImage()->freshly_created);

    first->Close();
    EXPECT_TRUE(backend->RemovedImages().empty());

    second->Close();
    EXPECT_TRUE(backend->RemovedImages().empty());
}

TEST_F(SessionTest, FreshImageRemovedAfterLastUserCloses) {
    backend->MarkImageMissing("python:3.9.19-bullseye");
    auto first = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    auto second = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
    first->Open();
    second->Open();

    second->Close();
    first->Close();

    auto removed = backend->RemovedImages();
    ASSERT_EQ(removed.size(), 1u);
    EXPECT_EQ(removed[0], "python:3.9.19-bullseye");
}

TEST_F(SessionTest, DestructorCloses) {
    {
        auto session = Make(Builder(Language::PYTHON).SkipBootstrap().Build());
        session->Open();
        EXPECT_EQ(backend->LiveEnvironments(), 1u);
    }
    EXPECT_EQ(backend->LiveEnvironments(), 0u);
}
