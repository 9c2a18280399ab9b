/**
 * @file session.cpp
 * @brief Sandboxed execution session
 *
 * **Run Workflow**:
 * 1. Write the code to a scratch file `code.<ext>`
 * 2. Copy it to `<working dir>/code.<ext>`
 * 3. When profiling: copy the sampler to /tmp/memory_profiler.sh and
 *    remove any feed left by an earlier run
 * 4. Execute the build/run sequence in the working directory
 * 5. When profiling: fetch `<working dir>/mem_usage.log` and reduce it
 *
 * **Teardown** (Close):
 * 1. Commit to the image tag (commit_on_close)
 * 2. Force-remove the environment
 * 3. Remove a pulled/built image unless keep_template is set or another
 *    environment still references it
 *
 * @date 2025
 */

#include "monolith/core/session.hpp"
#include "monolith/core/errors.hpp"
#include "monolith/utils/archive_utils.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <stdexcept>

namespace monolith {
namespace core {

using utils::StringUtils;
using utils::TemporaryDirectory;

namespace {

const char* const BOOTSTRAP_COMMANDS[] = {
    "apt-get update",
    "apt-get install -y time",
};

const char* StateName(SessionState state) {
    switch (state) {
        case SessionState::UNINITIALIZED: return "uninitialized";
        case SessionState::OPEN: return "open";
        case SessionState::CLOSED: return "closed";
    }
    return "unknown";
}

SessionConfig ValidateConfig(SessionConfig config) {
    if (!config.image.image.empty() && !config.image.dockerfile.empty()) {
        throw ConfigError("Only one of image or dockerfile should be provided");
    }
    if (config.image.image.empty() && config.image.dockerfile.empty()) {
        config.image.image = GetLanguageProfile(config.language).default_image;
    }
    return config;
}

} // anonymous namespace

Session::Session(SessionConfig config, std::shared_ptr<EnvironmentBackend> backend)
    : config_(ValidateConfig(std::move(config)))
    , backend_(std::move(backend))
    , profile_(GetLanguageProfile(config_.language))
    , executor_(*backend_, config_.verbose)
    , transfer_(*backend_, executor_, config_.scratch_root) {

    spdlog::debug("Session created: language={}, image={}", profile_.name,
                  config_.image.dockerfile.empty() ? config_.image.image
                                                   : config_.image.dockerfile.string());
}

Session::~Session() {
    Close();
}

std::string Session::BuildTag(Language language, const std::filesystem::path& dockerfile) {
    auto context = dockerfile.parent_path().filename().string();
    return "sandbox-" + ToString(language) + "-" + StringUtils::ToLower(context);
}

std::optional<EnvironmentHandle> Session::GetHandle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_;
}

std::optional<ImageRef> Session::GetImage() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return image_;
}

EnvironmentHandle Session::RequireOpen(const std::string& action) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto state = state_.load();
    if (state != SessionState::OPEN || !handle_) {
        throw NotOpenError(std::string("Session is ") + StateName(state) +
                           ". Please call Open() before trying to " + action + ".");
    }
    return *handle_;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void Session::Open() {
    auto state = state_.load();
    if (state == SessionState::OPEN) {
        throw UnsupportedOperationError("Session is already open");
    }
    if (state == SessionState::CLOSED) {
        throw NotOpenError("Session is closed and cannot be reopened");
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("OPENING {} SESSION", StringUtils::ToLower(profile_.name));
    spdlog::info("═══════════════════════════════════════════════════════════════");

    std::string build_tag;
    if (!config_.image.dockerfile.empty()) {
        build_tag = BuildTag(config_.language, config_.image.dockerfile);
        spdlog::info("Building image {} from {}", build_tag, config_.image.dockerfile.string());
    }
    if (config_.retention.keep_template) {
        spdlog::info("keep_template is set: the image will not be removed after the session "
                     "ends and remains for future use");
    }

    auto image = backend_->ResolveImage(config_.image, build_tag);
    {
        std::lock_guard<std::mutex> lock(mutex_);
        image_ = image;
    }
    spdlog::info("✓ Image {} ({})", image.tag, image.freshly_created ? "fresh" : "cached");

    auto env = backend_->StartEnvironment(image, config_.environment);
    spdlog::info("✓ Environment {} started on {}", env.ShortId(), backend_->Name());

    try {
        if (config_.bootstrap) {
            Bootstrap(env);
        }

        std::lock_guard<std::mutex> lock(mutex_);
        if (state_.load() != SessionState::UNINITIALIZED) {
            throw NotOpenError("Session was closed while opening");
        }
        handle_ = env;
        state_.store(SessionState::OPEN);
    }
    catch (const std::exception& e) {
        spdlog::error("Session open failed, removing environment {}: {}", env.ShortId(), e.what());
        if (!backend_->RemoveEnvironment(env)) {
            spdlog::error("Failed to remove environment {}", env.ShortId());
        }
        throw;
    }

    spdlog::info("✓ Session open");
}

void Session::Bootstrap(const EnvironmentHandle& env) {
    for (const char* command : BOOTSTRAP_COMMANDS) {
        auto output = executor_.Execute(env, command);
        if (!output.Succeeded()) {
            spdlog::warn("Bootstrap step '{}' failed with exit code {}: {}", command,
                         output.exit_code,
                         StringUtils::Truncate(StringUtils::TrimRight(output.stderr_output.value_or("")), 200));
        }
    }
}

void Session::Close() {
    auto previous = state_.exchange(SessionState::CLOSED);
    if (previous == SessionState::CLOSED) {
        return;
    }

    std::optional<EnvironmentHandle> handle;
    std::optional<ImageRef> image;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handle.swap(handle_);
        image = image_;
    }

    if (!handle && !image) {
        return;
    }

    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("CLOSING {} SESSION", StringUtils::ToLower(profile_.name));
    spdlog::info("═══════════════════════════════════════════════════════════════");

    if (handle) {
        if (config_.retention.commit_on_close && image && !image->tag.empty()) {
            try {
                backend_->Commit(*handle, image->tag);
                spdlog::info("✓ Committed {} to {}", handle->ShortId(), image->tag);
            }
            catch (const std::exception& e) {
                spdlog::error("Failed to commit {}: {}", handle->ShortId(), e.what());
            }
        }

        try {
            if (backend_->RemoveEnvironment(*handle)) {
                spdlog::info("✓ Environment {} removed", handle->ShortId());
            } else {
                spdlog::error("Failed to remove environment {}", handle->ShortId());
            }
        }
        catch (const std::exception& e) {
            spdlog::error("Failed to remove environment {}: {}", handle->ShortId(), e.what());
        }
    }

    if (image && image->freshly_created && !config_.retention.keep_template) {
        try {
            if (backend_->RemoveImageIfUnused(*image)) {
                spdlog::info("✓ Image {} removed", image->tag);
            }
        }
        catch (const std::exception& e) {
            spdlog::error("Failed to remove image {}: {}", image->tag, e.what());
        }
    }
}

// ============================================================================
// DEPENDENCIES
// ============================================================================

std::vector<ConsoleOutput> Session::Setup(const std::vector<std::string>& libraries) {
    auto env = RequireOpen("set up libraries");
    if (libraries.empty()) {
        return {};
    }

    // Resolve every command first so an unsupported language fails before any side effect
    std::vector<std::string> commands;
    commands.reserve(libraries.size());
    for (const auto& library : libraries) {
        commands.push_back(InstallCommand(config_.language, library));
    }

    EnsureWorkspace(env);

    spdlog::info("Installing {} librar{}: {}", libraries.size(),
                 libraries.size() == 1 ? "y" : "ies", StringUtils::Join(libraries, ", "));

    std::vector<ConsoleOutput> outputs;
    outputs.reserve(commands.size());
    for (const auto& command : commands) {
        auto output = executor_.Execute(env, command, profile_.WorkingDirectory());
        if (!output.Succeeded()) {
            spdlog::warn("'{}' exited with {}", command, output.exit_code);
        }
        outputs.push_back(std::move(output));
    }
    return outputs;
}

void Session::EnsureWorkspace(const EnvironmentHandle& env) {
    if (!profile_.workspace || workspace_ready_) {
        return;
    }

    const auto& workspace = *profile_.workspace;
    auto mkdir = executor_.Execute(env, "mkdir -p " + StringUtils::ShellQuote(workspace.directory));
    if (!mkdir.Succeeded()) {
        throw BackendError("Cannot create workspace " + workspace.directory + ": " +
                           mkdir.stderr_output.value_or(""));
    }
    for (const auto& command : workspace.init_commands) {
        auto output = executor_.Execute(env, command, workspace.directory);
        if (!output.Succeeded()) {
            spdlog::warn("Workspace step '{}' exited with {}", command, output.exit_code);
        }
    }
    workspace_ready_ = true;
    spdlog::debug("Workspace {} initialised", workspace.directory);
}

// ============================================================================
// EXECUTION
// ============================================================================

ExecutionResult Session::Run(const std::string& code, bool profile) {
    auto env = RequireOpen("run code");

    TemporaryDirectory scratch("monolith-run", config_.scratch_root);
    auto local_code = scratch.Path() / ("code." + profile_.extension);
    {
        std::ofstream file(local_code, std::ios::binary);
        file << code;
        if (!file) {
            throw SandboxError("Cannot write code to " + local_code.string());
        }
    }

    transfer_.CopyTo(env, local_code, profile_.CodePath());

    if (profile) {
        if (!std::filesystem::is_regular_file(config_.profiler_script)) {
            throw ConfigError("Memory profiler script not found: " +
                              config_.profiler_script.string());
        }
        transfer_.CopyTo(env, config_.profiler_script, kProfilerRemotePath);
        auto cleared = executor_.Execute(env, "rm -f " + StringUtils::ShellQuote(profile_.FeedPath()));
        if (!cleared.Succeeded()) {
            spdlog::warn("Cannot remove stale feed {} (exit code {}): {}", profile_.FeedPath(),
                         cleared.exit_code,
                         StringUtils::Truncate(StringUtils::TrimRight(cleared.stderr_output.value_or("")), 200));
        }
    }

    auto commands = RunCommands(config_.language, profile_.CodePath(), profile);
    auto result = RunSequence(env, commands);

    if (profile && result.completed) {
        auto local_feed = scratch.Path() / kMemoryFeedName;
        transfer_.CopyFrom(env, profile_.FeedPath(), local_feed);

        auto samples = ResourceAccountant::ParseFeedFile(local_feed, config_.max_feed_samples);
        result.usage = ResourceAccountant::Reduce(samples);

        std::error_code ec;
        std::filesystem::remove(local_feed, ec);
        if (ec) {
            spdlog::warn("Cannot remove {}: {}", local_feed.string(), ec.message());
        }

        spdlog::debug("Usage: peak={} KB, duration={:.3f} ms, integral={} KB*ms, samples={}",
                      result.usage.peak_memory_kb, result.usage.duration_ms,
                      result.usage.integral_kb_ms, result.usage.memory_series.size());
    }

    return result;
}

ExecutionResult Session::RunSequence(const EnvironmentHandle& env,
                                     const std::vector<std::string>& commands) {
    ExecutionResult result;
    std::string earlier_stderr;

    for (std::size_t i = 0; i < commands.size(); ++i) {
        auto output = executor_.Execute(env, commands[i], profile_.WorkingDirectory());
        bool last = (i + 1 == commands.size());

        result.stdout_output = output.stdout_output.value_or("");
        result.stderr_output = output.stderr_output.value_or("");
        result.exit_code = output.exit_code;

        if (!last && !output.Succeeded()) {
            spdlog::info("Step '{}' failed with exit code {}, skipping the rest", commands[i],
                         output.exit_code);
            result.completed = false;
            break;
        }

        if (last && result.stderr_output.empty()) {
            result.stderr_output = earlier_stderr;
        }
        if (output.HasStderr()) {
            earlier_stderr = *output.stderr_output;
        }
    }

    return result;
}

// ============================================================================
// RAW OPERATIONS
// ============================================================================

void Session::CopyTo(const std::filesystem::path& local, const std::string& remote) {
    auto env = RequireOpen("copy files");
    transfer_.CopyTo(env, local, remote);
}

void Session::CopyFrom(const std::string& remote, const std::filesystem::path& local) {
    auto env = RequireOpen("copy files");
    transfer_.CopyFrom(env, remote, local);
}

ConsoleOutput Session::ExecuteCommand(const std::string& command, const std::string& working_dir) {
    auto env = RequireOpen("execute commands");
    return executor_.Execute(env, command, working_dir);
}

// ============================================================================
// SESSION SCOPE
// ============================================================================

SessionScope::SessionScope(std::shared_ptr<Session> session)
    : session_(std::move(session)) {
    if (!session_) {
        throw std::invalid_argument("SessionScope requires a session");
    }
    try {
        session_->Open();
    }
    catch (const std::exception&) {
        session_->Close();
        throw;
    }
}

SessionScope::~SessionScope() {
    session_->Close();
}

} // namespace core
} // namespace monolith
