/**
 * @file language_profile_test.cpp
 * @brief Tests of the language profile table
 */

#include "monolith/core/errors.hpp"
#include "monolith/core/language_profile.hpp"

#include <gtest/gtest.h>

using namespace monolith::core;

TEST(LanguageProfile, EveryLanguageHasAProfile) {
    for (auto language : SupportedLanguages()) {
        const auto& profile = GetLanguageProfile(language);
        EXPECT_EQ(profile.language, language);
        EXPECT_FALSE(profile.name.empty());
        EXPECT_FALSE(profile.extension.empty());
        EXPECT_FALSE(profile.default_image.empty());
        EXPECT_FALSE(profile.run_template.empty());
    }
    EXPECT_EQ(SupportedLanguages().size(), 6u);
}

TEST(LanguageProfile, DefaultImages) {
    EXPECT_EQ(GetLanguageProfile(Language::PYTHON).default_image, "python:3.9.19-bullseye");
    EXPECT_EQ(GetLanguageProfile(Language::JAVA).default_image, "openjdk:11.0.12-jdk-bullseye");
    EXPECT_EQ(GetLanguageProfile(Language::JAVASCRIPT).default_image, "node:22-bullseye");
    EXPECT_EQ(GetLanguageProfile(Language::CPP).default_image, "gcc:11.2.0-bullseye");
    EXPECT_EQ(GetLanguageProfile(Language::GO).default_image, "golang:1.17.0-bullseye");
    EXPECT_EQ(GetLanguageProfile(Language::RUBY).default_image, "ruby:3.0.2-bullseye");
}

TEST(LanguageProfile, ParseCanonicalNamesAndAliases) {
    EXPECT_EQ(ParseLanguage("python"), Language::PYTHON);
    EXPECT_EQ(ParseLanguage("PY"), Language::PYTHON);
    EXPECT_EQ(ParseLanguage(" Java "), Language::JAVA);
    EXPECT_EQ(ParseLanguage("js"), Language::JAVASCRIPT);
    EXPECT_EQ(ParseLanguage("node"), Language::JAVASCRIPT);
    EXPECT_EQ(ParseLanguage("c++"), Language::CPP);
    EXPECT_EQ(ParseLanguage("golang"), Language::GO);
    EXPECT_EQ(ParseLanguage("ruby"), Language::RUBY);

    for (auto language : SupportedLanguages()) {
        EXPECT_EQ(ParseLanguage(ToString(language)), language);
    }
}

TEST(LanguageProfile, UnknownLanguageIsUnsupported) {
    EXPECT_THROW(ParseLanguage("cobol"), UnsupportedOperationError);
    try {
        ParseLanguage("rust");
        FAIL() << "expected UnsupportedOperationError";
    }
    catch (const UnsupportedOperationError& e) {
        EXPECT_NE(std::string(e.what()).find("python"), std::string::npos);
    }
}

TEST(LanguageProfile, CompiledLanguagesHaveTwoSteps) {
    auto plain = RunCommands(Language::CPP, "/tmp/code.cpp", false);
    ASSERT_EQ(plain.size(), 2u);
    EXPECT_EQ(plain[0], "g++ -o a.out /tmp/code.cpp");
    EXPECT_EQ(plain[1], "./a.out");

    auto profiled = RunCommands(Language::CPP, "/tmp/code.cpp", true);
    ASSERT_EQ(profiled.size(), 2u);
    EXPECT_EQ(profiled[0], "g++ -o a.out /tmp/code.cpp");
    EXPECT_EQ(profiled[1], "bash /tmp/memory_profiler.sh ./a.out");
}

TEST(LanguageProfile, InterpretedLanguagesHaveOneStep) {
    struct Case {
        Language language;
        std::string path;
        std::string command;
    };
    std::vector<Case> cases = {
        {Language::PYTHON, "/tmp/code.py", "python /tmp/code.py"},
        {Language::JAVA, "/tmp/code.java", "java /tmp/code.java"},
        {Language::JAVASCRIPT, "/tmp/code.js", "node /tmp/code.js"},
        {Language::GO, "/go_space/code.go", "go run /go_space/code.go"},
        {Language::RUBY, "/tmp/code.rb", "ruby /tmp/code.rb"},
    };

    for (const auto& c : cases) {
        auto plain = RunCommands(c.language, c.path, false);
        ASSERT_EQ(plain.size(), 1u) << ToString(c.language);
        EXPECT_EQ(plain[0], c.command);

        auto profiled = RunCommands(c.language, c.path, true);
        ASSERT_EQ(profiled.size(), 1u) << ToString(c.language);
        EXPECT_EQ(profiled[0], std::string(kProfilerCommand) + " " + c.command);
    }
}

TEST(LanguageProfile, InstallCommands) {
    EXPECT_EQ(InstallCommand(Language::PYTHON, "numpy"), "pip install numpy");
    EXPECT_EQ(InstallCommand(Language::JAVASCRIPT, "lodash"), "yarn add lodash");
    EXPECT_EQ(InstallCommand(Language::CPP, "libboost-dev"), "apt-get install -y libboost-dev");
    EXPECT_EQ(InstallCommand(Language::GO, "github.com/google/uuid"),
              "go get -u github.com/google/uuid");
    EXPECT_EQ(InstallCommand(Language::RUBY, "colorize"), "gem install colorize");
}

TEST(LanguageProfile, InstallQuotesLibraryNames) {
    EXPECT_EQ(InstallCommand(Language::PYTHON, "numpy==1.26.4"), "pip install numpy==1.26.4");
    EXPECT_EQ(InstallCommand(Language::PYTHON, "x; rm -rf /"), "pip install 'x; rm -rf /'");
}

TEST(LanguageProfile, JavaCannotInstall) {
    EXPECT_FALSE(GetLanguageProfile(Language::JAVA).SupportsInstall());
    EXPECT_THROW(InstallCommand(Language::JAVA, "junit"), UnsupportedOperationError);
}

TEST(LanguageProfile, GoUsesWorkspace) {
    const auto& go = GetLanguageProfile(Language::GO);
    ASSERT_TRUE(go.workspace.has_value());
    EXPECT_EQ(go.workspace->directory, "/go_space");
    ASSERT_EQ(go.workspace->init_commands.size(), 2u);
    EXPECT_EQ(go.workspace->init_commands[0], "go mod init go_space");
    EXPECT_EQ(go.workspace->init_commands[1], "go mod tidy");
    EXPECT_EQ(go.WorkingDirectory(), "/go_space");
    EXPECT_EQ(go.CodePath(), "/go_space/code.go");
    EXPECT_EQ(go.FeedPath(), "/go_space/mem_usage.log");

    const auto& python = GetLanguageProfile(Language::PYTHON);
    EXPECT_FALSE(python.workspace.has_value());
    EXPECT_EQ(python.CodePath(), "/tmp/code.py");
    EXPECT_EQ(python.FeedPath(), "/tmp/mem_usage.log");
}
