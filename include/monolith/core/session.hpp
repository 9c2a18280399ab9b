/**
 * @file session.hpp
 * @brief Sandboxed execution session
 *
 * A Session owns exactly one live environment for one language and drives
 * it through its lifecycle:
 *
 * ```
 * UNINITIALIZED ──Open()──▶ OPEN ──Close()──▶ CLOSED
 *       │                                       ▲
 *       └──────────────Close()──────────────────┘
 * ```
 *
 * Setup(), Run(), CopyTo(), CopyFrom() and ExecuteCommand() are valid only
 * while OPEN. CLOSED is terminal; a repeated Close() is a no-op.
 *
 * **Usage Example**:
 * @code
 * auto backend = std::make_shared<DockerBackend>();
 * auto session = std::make_shared<Session>(
 *     SessionBuilder().WithLanguage(Language::PYTHON).Verbose().Build(), backend);
 *
 * SessionScope scope(session);
 * session->Setup({"numpy"});
 * auto result = session->Run("import numpy; print(numpy.arange(3))", true);
 * spdlog::info("peak {} KB", result.usage.peak_memory_kb);
 * @endcode
 *
 * @date 2025
 */

#pragma once

#include "monolith/core/command_executor.hpp"
#include "monolith/core/environment.hpp"
#include "monolith/core/language_profile.hpp"
#include "monolith/core/resource_accountant.hpp"
#include "monolith/core/transfer_protocol.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#ifndef MONOLITH_PROFILER_SCRIPT
#define MONOLITH_PROFILER_SCRIPT "scripts/memory_profiler.sh"
#endif

namespace monolith {
namespace core {

/**
 * @enum SessionState
 * @brief Lifecycle state of a session
 */
enum class SessionState {
    UNINITIALIZED,   ///< Constructed, no environment yet
    OPEN,            ///< Environment live
    CLOSED           ///< Torn down (terminal)
};

/**
 * @struct RetentionPolicy
 * @brief What survives Close()
 */
struct RetentionPolicy {
    bool keep_template{false};     ///< Keep a pulled/built image after close
    bool commit_on_close{false};   ///< Commit the environment back into the image tag
};

/**
 * @struct SessionConfig
 * @brief Session configuration
 */
struct SessionConfig {
    Language language{Language::PYTHON};
    bool verbose{false};                     ///< Echo command output
    ImageSpec image;                         ///< Empty: language default image
    RetentionPolicy retention;
    EnvironmentOptions environment;          ///< Mounts, limits, network
    std::filesystem::path profiler_script{MONOLITH_PROFILER_SCRIPT};  ///< Host copy of the sampler
    std::filesystem::path scratch_root;      ///< Host staging directory (empty: system temp)
    bool bootstrap{true};                    ///< Install base tooling on open
    std::size_t max_feed_samples{ResourceAccountant::DEFAULT_MAX_SAMPLES};
};

/**
 * @struct ExecutionResult
 * @brief Outcome of Run()
 *
 * A failing program is a normal result: non-zero exit_code and its stderr.
 * Usage metrics are zero for unprofiled runs.
 */
struct ExecutionResult {
    std::string stdout_output;
    std::string stderr_output;
    int exit_code{0};
    bool completed{true};     ///< false if a build step failed and later steps were skipped
    ResourceUsage usage;
};

/**
 * @class Session
 * @brief Stateful orchestrator of one sandboxed environment
 *
 * Single-writer: one caller drives a session at a time. State changes are
 * atomic and the environment handle is read under a lock, so an operation
 * left running on a detached thread after a timeout sees the session closed
 * and fails with NotOpenError instead of touching a removed environment.
 * Hold sessions in std::shared_ptr when operations may outlive the caller.
 */
class Session {
public:
    /**
     * @brief Construct session
     * @param config Session configuration
     * @param backend Environment provider
     * @throws ConfigError if both an image and a Dockerfile are configured
     */
    Session(SessionConfig config, std::shared_ptr<EnvironmentBackend> backend);

    /// Closes the session
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Provision and start the environment
     *
     * Resolves the image (local, pull or build), starts the environment and
     * installs base tooling. Bootstrap command failures are logged only.
     *
     * @throws ProvisionError if the image cannot be resolved
     * @throws EnvironmentStartError if the environment cannot start
     * @throws NotOpenError if the session is already closed
     * @throws UnsupportedOperationError if the session is already open
     */
    void Open();

    /**
     * @brief Install dependencies
     *
     * @param libraries Dependency names, installed in order
     * @return Output of every install command (empty for an empty list)
     * @throws NotOpenError if the session is not open
     * @throws UnsupportedOperationError if the language cannot install libraries
     */
    std::vector<ConsoleOutput> Setup(const std::vector<std::string>& libraries);

    /**
     * @brief Build and run source code
     *
     * A build step that fails stops the sequence; its output becomes the
     * result. Otherwise stdout is the last step's, and stderr the last
     * step's or, when that is empty, the latest non-empty earlier stderr.
     *
     * @param code Source code
     * @param profile Sample memory while the program runs
     * @return Program output and usage metrics
     * @throws NotOpenError if the session is not open
     * @throws RemoteFileNotFoundError if a profiled run left no sample feed
     */
    ExecutionResult Run(const std::string& code, bool profile);

    /**
     * @brief Copy a host file into the environment
     * @throws NotOpenError if the session is not open
     */
    void CopyTo(const std::filesystem::path& local, const std::string& remote);

    /**
     * @brief Copy a file out of the environment
     * @throws NotOpenError if the session is not open
     * @throws RemoteFileNotFoundError if the remote path does not exist
     */
    void CopyFrom(const std::string& remote, const std::filesystem::path& local);

    /**
     * @brief Run a raw shell command
     * @throws NotOpenError if the session is not open
     * @throws std::invalid_argument if the command is empty
     */
    ConsoleOutput ExecuteCommand(const std::string& command, const std::string& working_dir = "");

    /**
     * @brief Tear down according to the retention policy
     *
     * Idempotent; never throws. Removal failures are logged.
     */
    void Close();

    SessionState GetState() const { return state_.load(); }
    bool IsOpen() const { return state_.load() == SessionState::OPEN; }
    const SessionConfig& GetConfig() const { return config_; }
    const LanguageProfile& GetProfile() const { return profile_; }

    /// Live environment, if any
    std::optional<EnvironmentHandle> GetHandle() const;

    /// Resolved image, once Open() got that far
    std::optional<ImageRef> GetImage() const;

    /// Tag used when building from a Dockerfile: sandbox-<lang>-<context dir name>
    static std::string BuildTag(Language language, const std::filesystem::path& dockerfile);

private:
    SessionConfig config_;
    std::shared_ptr<EnvironmentBackend> backend_;
    const LanguageProfile& profile_;
    CommandExecutor executor_;
    TransferProtocol transfer_;

    std::atomic<SessionState> state_{SessionState::UNINITIALIZED};
    mutable std::mutex mutex_;
    std::optional<EnvironmentHandle> handle_;   ///< Guarded by mutex_
    std::optional<ImageRef> image_;             ///< Guarded by mutex_
    bool workspace_ready_{false};

    EnvironmentHandle RequireOpen(const std::string& action) const;
    void Bootstrap(const EnvironmentHandle& env);
    void EnsureWorkspace(const EnvironmentHandle& env);
    ExecutionResult RunSequence(const EnvironmentHandle& env,
                                const std::vector<std::string>& commands);
};

/**
 * @class SessionScope
 * @brief Opens a session on construction and closes it on destruction
 */
class SessionScope {
public:
    /**
     * @brief Open the session
     * @throws Whatever Session::Open() throws (the session is closed first)
     */
    explicit SessionScope(std::shared_ptr<Session> session);
    ~SessionScope();

    SessionScope(const SessionScope&) = delete;
    SessionScope& operator=(const SessionScope&) = delete;

    Session* operator->() const { return session_.get(); }
    const std::shared_ptr<Session>& Get() const { return session_; }

private:
    std::shared_ptr<Session> session_;
};

/**
 * @class SessionBuilder
 * @brief Fluent API for constructing session configurations
 *
 * **Usage Example**:
 * @code
 * auto config = SessionBuilder()
 *     .WithLanguage(Language::GO)
 *     .WithMemoryLimit(512)
 *     .WithCPULimit(1.0)
 *     .KeepTemplate()
 *     .Build();
 * @endcode
 */
class SessionBuilder {
public:
    SessionBuilder& WithLanguage(Language language) {
        config_.language = language;
        return *this;
    }

    /**
     * @brief Use a registry image
     * @param image Image reference, e.g. "python:3.11-bullseye"
     * @return Reference to builder for chaining
     */
    SessionBuilder& WithImage(const std::string& image) {
        config_.image.image = image;
        return *this;
    }

    /**
     * @brief Build the image from a Dockerfile (its directory is the build context)
     * @param dockerfile Dockerfile path
     * @return Reference to builder for chaining
     */
    SessionBuilder& WithDockerfile(const std::filesystem::path& dockerfile) {
        config_.image.dockerfile = dockerfile;
        return *this;
    }

    SessionBuilder& KeepTemplate(bool keep = true) {
        config_.retention.keep_template = keep;
        return *this;
    }

    SessionBuilder& CommitOnClose(bool commit = true) {
        config_.retention.commit_on_close = commit;
        return *this;
    }

    SessionBuilder& WithMount(const std::string& host_path,
                              const std::string& container_path,
                              bool read_only = true) {
        config_.environment.mounts.push_back({host_path, container_path, read_only});
        return *this;
    }

    /**
     * @brief Set memory limit
     * @param mb Memory limit in megabytes (0: unlimited)
     * @return Reference to builder for chaining
     */
    SessionBuilder& WithMemoryLimit(std::size_t mb) {
        config_.environment.limits.memory_mb = mb;
        return *this;
    }

    SessionBuilder& WithCPULimit(double cpus) {
        config_.environment.limits.cpus = cpus;
        return *this;
    }

    SessionBuilder& WithPidsLimit(int pids) {
        config_.environment.limits.pids_limit = pids;
        return *this;
    }

    SessionBuilder& WithNetworkMode(utils::NetworkMode mode) {
        config_.environment.network = mode;
        return *this;
    }

    SessionBuilder& WithProfilerScript(const std::filesystem::path& script) {
        config_.profiler_script = script;
        return *this;
    }

    SessionBuilder& WithScratchRoot(const std::filesystem::path& root) {
        config_.scratch_root = root;
        return *this;
    }

    SessionBuilder& Verbose(bool verbose = true) {
        config_.verbose = verbose;
        return *this;
    }

    /// Skip the apt-get bootstrap (images that already ship the tooling)
    SessionBuilder& SkipBootstrap(bool skip = true) {
        config_.bootstrap = !skip;
        return *this;
    }

    SessionConfig Build() const { return config_; }

private:
    SessionConfig config_;
};

} // namespace core
} // namespace monolith
