/**
 * @file language_profile.cpp
 * @brief Language profile table
 *
 * @date 2025
 */

#include "monolith/core/language_profile.hpp"
#include "monolith/core/errors.hpp"
#include "monolith/utils/string_utils.hpp"

#include <map>

namespace monolith {
namespace core {

using utils::StringUtils;

namespace {

const std::map<Language, LanguageProfile>& ProfileTable() {
    static const std::map<Language, LanguageProfile> table = [] {
        std::map<Language, LanguageProfile> profiles;

        LanguageProfile python;
        python.language = Language::PYTHON;
        python.name = "python";
        python.extension = "py";
        python.default_image = "python:3.9.19-bullseye";
        python.install_template = "pip install {library}";
        python.run_template = "python {code}";
        profiles[Language::PYTHON] = python;

        // Single-file source launch, no separate javac step
        LanguageProfile java;
        java.language = Language::JAVA;
        java.name = "java";
        java.extension = "java";
        java.default_image = "openjdk:11.0.12-jdk-bullseye";
        java.run_template = "java {code}";
        profiles[Language::JAVA] = java;

        LanguageProfile javascript;
        javascript.language = Language::JAVASCRIPT;
        javascript.name = "javascript";
        javascript.extension = "js";
        javascript.default_image = "node:22-bullseye";
        javascript.install_template = "yarn add {library}";
        javascript.run_template = "node {code}";
        profiles[Language::JAVASCRIPT] = javascript;

        LanguageProfile cpp;
        cpp.language = Language::CPP;
        cpp.name = "cpp";
        cpp.extension = "cpp";
        cpp.default_image = "gcc:11.2.0-bullseye";
        cpp.install_template = "apt-get install -y {library}";
        cpp.compile_template = "g++ -o a.out {code}";
        cpp.run_template = "./a.out";
        profiles[Language::CPP] = cpp;

        LanguageProfile go;
        go.language = Language::GO;
        go.name = "go";
        go.extension = "go";
        go.default_image = "golang:1.17.0-bullseye";
        go.install_template = "go get -u {library}";
        go.run_template = "go run {code}";
        go.workspace = WorkspaceSpec{"/go_space", {"go mod init go_space", "go mod tidy"}};
        profiles[Language::GO] = go;

        LanguageProfile ruby;
        ruby.language = Language::RUBY;
        ruby.name = "ruby";
        ruby.extension = "rb";
        ruby.default_image = "ruby:3.0.2-bullseye";
        ruby.install_template = "gem install {library}";
        ruby.run_template = "ruby {code}";
        profiles[Language::RUBY] = ruby;

        return profiles;
    }();
    return table;
}

} // anonymous namespace

std::string LanguageProfile::WorkingDirectory() const {
    return workspace ? workspace->directory : working_directory;
}

std::string LanguageProfile::CodePath() const {
    return WorkingDirectory() + "/code." + extension;
}

std::string LanguageProfile::FeedPath() const {
    return WorkingDirectory() + "/" + kMemoryFeedName;
}

const LanguageProfile& GetLanguageProfile(Language language) {
    const auto& table = ProfileTable();
    auto it = table.find(language);
    if (it == table.end()) {
        throw UnsupportedOperationError("Language " + std::to_string(static_cast<int>(language)) +
                                        " is not supported");
    }
    return it->second;
}

Language ParseLanguage(const std::string& name) {
    static const std::map<std::string, Language> aliases = {
        {"py", Language::PYTHON},
        {"js", Language::JAVASCRIPT},
        {"node", Language::JAVASCRIPT},
        {"c++", Language::CPP},
        {"golang", Language::GO},
    };

    std::string key = StringUtils::ToLower(StringUtils::Trim(name));
    for (const auto& [language, profile] : ProfileTable()) {
        if (profile.name == key) {
            return language;
        }
    }

    auto alias = aliases.find(key);
    if (alias != aliases.end()) {
        return alias->second;
    }

    std::vector<std::string> names;
    for (auto language : SupportedLanguages()) {
        names.push_back(ToString(language));
    }
    throw UnsupportedOperationError("Language " + name + " is not supported. Must be one of " +
                                    StringUtils::Join(names, ", "));
}

std::string ToString(Language language) {
    return GetLanguageProfile(language).name;
}

std::vector<Language> SupportedLanguages() {
    std::vector<Language> languages;
    for (const auto& entry : ProfileTable()) {
        languages.push_back(entry.first);
    }
    return languages;
}

std::string InstallCommand(Language language, const std::string& library) {
    const auto& profile = GetLanguageProfile(language);
    if (!profile.SupportsInstall()) {
        throw UnsupportedOperationError("Library installation has not been supported for " +
                                        profile.name + " yet!");
    }
    return StringUtils::ReplaceAll(profile.install_template, "{library}",
                                   StringUtils::ShellQuote(library));
}

std::vector<std::string> RunCommands(Language language,
                                     const std::string& code_path,
                                     bool profiled) {
    const auto& profile = GetLanguageProfile(language);
    std::vector<std::string> commands;

    if (profile.IsCompiled()) {
        commands.push_back(StringUtils::ReplaceAll(profile.compile_template, "{code}", code_path));
    }

    std::string run = StringUtils::ReplaceAll(profile.run_template, "{code}", code_path);
    if (profiled) {
        run = std::string(kProfilerCommand) + " " + run;
    }
    commands.push_back(run);

    return commands;
}

} // namespace core
} // namespace monolith
