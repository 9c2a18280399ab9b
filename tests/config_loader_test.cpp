/**
 * @file config_loader_test.cpp
 * @brief Tests of the JSON configuration overlay
 */

#include "monolith/core/config_loader.hpp"
#include "monolith/core/errors.hpp"
#include "monolith/utils/archive_utils.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <fstream>

using namespace monolith;
using namespace monolith::core;
using json = nlohmann::json;

TEST(ConfigLoader, EmptyObjectKeepsDefaults) {
    ServiceConfig config;
    ApplyServiceConfig(config, json::object());

    EXPECT_EQ(config.setup_timeout, std::chrono::seconds(120));
    EXPECT_EQ(config.run_timeout, std::chrono::seconds(60));
    EXPECT_FALSE(config.session_defaults.retention.keep_template);
    EXPECT_FALSE(config.session_defaults.retention.commit_on_close);
    EXPECT_TRUE(config.images.empty());
}

TEST(ConfigLoader, AppliesEveryKey) {
    auto data = json::parse(R"({
        "setupTimeoutSeconds": 300,
        "runTimeoutSeconds": 10,
        "verbose": true,
        "keepTemplate": true,
        "commitOnClose": true,
        "profilerScript": "/opt/monolith/memory_profiler.sh",
        "scratchRoot": "/var/tmp/monolith",
        "limits": {"memoryMb": 512, "cpus": 1.5, "pidsLimit": 64},
        "network": "none",
        "images": {"python": "python:3.11-bullseye", "golang": "golang:1.21"}
    })");

    ServiceConfig config;
    ApplyServiceConfig(config, data);

    const auto& session = config.session_defaults;
    EXPECT_EQ(config.setup_timeout, std::chrono::seconds(300));
    EXPECT_EQ(config.run_timeout, std::chrono::seconds(10));
    EXPECT_TRUE(session.verbose);
    EXPECT_TRUE(session.retention.keep_template);
    EXPECT_TRUE(session.retention.commit_on_close);
    EXPECT_EQ(session.profiler_script, "/opt/monolith/memory_profiler.sh");
    EXPECT_EQ(session.scratch_root, "/var/tmp/monolith");
    EXPECT_EQ(session.environment.limits.memory_mb, 512u);
    EXPECT_DOUBLE_EQ(session.environment.limits.cpus, 1.5);
    EXPECT_EQ(session.environment.limits.pids_limit, 64);
    EXPECT_EQ(session.environment.network, utils::NetworkMode::NONE);
    EXPECT_EQ(config.images.at(Language::PYTHON), "python:3.11-bullseye");
    EXPECT_EQ(config.images.at(Language::GO), "golang:1.21");
}

TEST(ConfigLoader, RejectsWrongTypes) {
    ServiceConfig config;
    EXPECT_THROW(ApplyServiceConfig(config, json::parse(R"({"verbose": "yes"})")), ConfigError);
    EXPECT_THROW(ApplyServiceConfig(config, json::parse(R"({"runTimeoutSeconds": -1})")), ConfigError);
    EXPECT_THROW(ApplyServiceConfig(config, json::parse(R"({"limits": []})")), ConfigError);
    EXPECT_THROW(ApplyServiceConfig(config, json::parse(R"({"network": "overlay"})")), ConfigError);
    EXPECT_THROW(ApplyServiceConfig(config, json::parse(R"({"images": {"cobol": "x"}})")), ConfigError);
    EXPECT_THROW(ApplyServiceConfig(config, json::parse("[1, 2]")), ConfigError);
}

TEST(ConfigLoader, LoadsFileOverBase) {
    utils::TemporaryDirectory dir("monolith-config-test");
    auto path = dir.Path() / "config.json";
    std::ofstream(path) << R"({"runTimeoutSeconds": 5})";

    ServiceConfig base;
    base.setup_timeout = std::chrono::seconds(7);
    auto config = LoadServiceConfig(path, base);

    EXPECT_EQ(config.run_timeout, std::chrono::seconds(5));
    EXPECT_EQ(config.setup_timeout, std::chrono::seconds(7));
}

TEST(ConfigLoader, InvalidJsonIsConfigError) {
    utils::TemporaryDirectory dir("monolith-config-test");
    auto path = dir.Path() / "config.json";
    std::ofstream(path) << "{ not json";

    EXPECT_THROW(LoadServiceConfig(path), ConfigError);
    EXPECT_THROW(LoadServiceConfig(dir.Path() / "absent.json"), ConfigError);
}

TEST(ConfigLoader, ResolvePathPrecedence) {
    utils::TemporaryDirectory dir("monolith-config-test");
    auto explicit_path = dir.Path() / "explicit.json";
    auto env_path = dir.Path() / "env.json";
    std::ofstream(explicit_path) << "{}";
    std::ofstream(env_path) << "{}";

    ::setenv("MONOLITH_CONFIG", env_path.c_str(), 1);
    EXPECT_EQ(ResolveConfigPath(explicit_path.string()), explicit_path);
    EXPECT_EQ(ResolveConfigPath(""), env_path);

    ::setenv("MONOLITH_CONFIG", (dir.Path() / "gone.json").c_str(), 1);
    EXPECT_THROW(ResolveConfigPath(""), ConfigError);
    ::unsetenv("MONOLITH_CONFIG");

    EXPECT_THROW(ResolveConfigPath((dir.Path() / "missing.json").string()), ConfigError);
}
