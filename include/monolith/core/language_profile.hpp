/**
 * @file language_profile.hpp
 * @brief Static per-language command table
 *
 * Maps each supported language to its source extension, default base image,
 * dependency install template and build/run command sequences. The table is
 * plain data: adding a language means adding one entry, control flow in the
 * session never branches on the language.
 *
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>

namespace monolith {
namespace core {

/**
 * @enum Language
 * @brief Languages the sandbox can build and run
 */
enum class Language {
    PYTHON,
    JAVA,
    JAVASCRIPT,
    CPP,
    GO,
    RUBY
};

/// In-environment location of the memory sampler script
inline constexpr const char* kProfilerRemotePath = "/tmp/memory_profiler.sh";

/// Prefix that runs an execution step under the memory sampler
inline constexpr const char* kProfilerCommand = "bash /tmp/memory_profiler.sh";

/// File name of the sample feed, written to the step's working directory
inline constexpr const char* kMemoryFeedName = "mem_usage.log";

/**
 * @struct WorkspaceSpec
 * @brief Build workspace required before installing dependencies
 *
 * Initialised once per session; every command of the language then runs
 * with the workspace as its working directory.
 */
struct WorkspaceSpec {
    std::string directory;                     ///< Workspace directory
    std::vector<std::string> init_commands;    ///< Commands run inside it once
};

/**
 * @struct LanguageProfile
 * @brief Static description of one language
 *
 * Command templates use `{code}` for the in-environment source path and
 * `{library}` for a (shell-quoted) dependency name.
 */
struct LanguageProfile {
    Language language{Language::PYTHON};
    std::string name;                      ///< Canonical lowercase name
    std::string extension;                 ///< Source file extension (no dot)
    std::string default_image;             ///< Base image when none configured
    std::string install_template;          ///< Empty when installs are unsupported
    std::string compile_template;          ///< Empty for interpreted languages
    std::string run_template;              ///< Execution step
    std::string working_directory{"/tmp"}; ///< Where code is placed and run
    std::optional<WorkspaceSpec> workspace;

    bool SupportsInstall() const { return !install_template.empty(); }
    bool IsCompiled() const { return !compile_template.empty(); }

    /// Directory used for code, build artifacts and the sample feed
    std::string WorkingDirectory() const;

    /// In-environment path of the submitted source file
    std::string CodePath() const;

    /// In-environment path of the sample feed
    std::string FeedPath() const;
};

/**
 * @brief Look up the profile of a language
 * @param language Language tag
 * @return Immutable profile
 */
const LanguageProfile& GetLanguageProfile(Language language);

/**
 * @brief Parse a language name
 *
 * Case-insensitive; accepts the canonical names plus the aliases `js`,
 * `node`, `c++`, `golang` and `py`.
 *
 * @param name Language name
 * @return Language tag
 * @throws UnsupportedOperationError for unknown names
 */
Language ParseLanguage(const std::string& name);

/// Canonical name of a language
std::string ToString(Language language);

/// All languages in table order
std::vector<Language> SupportedLanguages();

/**
 * @brief Command installing one dependency
 * @param language Language tag
 * @param library Dependency name (shell-quoted into the command)
 * @return Shell command
 * @throws UnsupportedOperationError if the language does not support installs
 */
std::string InstallCommand(Language language, const std::string& library);

/**
 * @brief Ordered build/run command sequence
 *
 * Compiled languages yield exactly two commands (compile, run); interpreted
 * languages exactly one. When profiled, execution steps are prefixed with
 * the memory sampler; compile steps never are.
 *
 * @param language Language tag
 * @param code_path In-environment source path
 * @param profiled Run under the memory sampler
 * @return Shell commands in execution order
 */
std::vector<std::string> RunCommands(Language language,
                                     const std::string& code_path,
                                     bool profiled);

} // namespace core
} // namespace monolith
