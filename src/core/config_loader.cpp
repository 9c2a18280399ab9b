/**
 * @file config_loader.cpp
 * @brief JSON configuration file for the execution service
 *
 * @date 2025
 */

#include "monolith/core/config_loader.hpp"
#include "monolith/core/errors.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace monolith {
namespace core {

using json = nlohmann::json;
using utils::StringUtils;

namespace {

std::string GetEnv(const char* name) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

std::filesystem::path GetHomePath() {
    const char* home = std::getenv("HOME");
    return std::filesystem::path(home ? home : ".");
}

const json* Find(const json& data, const char* key) {
    auto it = data.find(key);
    return it == data.end() ? nullptr : &*it;
}

bool GetBool(const json& data, const char* key, bool fallback) {
    const auto* value = Find(data, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_boolean()) {
        throw ConfigError(std::string("'") + key + "' must be a boolean");
    }
    return value->get<bool>();
}

std::string GetString(const json& data, const char* key, const std::string& fallback) {
    const auto* value = Find(data, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_string()) {
        throw ConfigError(std::string("'") + key + "' must be a string");
    }
    return value->get<std::string>();
}

long long GetNonNegative(const json& data, const char* key, long long fallback) {
    const auto* value = Find(data, key);
    if (!value) {
        return fallback;
    }
    if (!value->is_number_integer() || value->get<long long>() < 0) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    return value->get<long long>();
}

utils::NetworkMode ParseNetworkMode(const std::string& name) {
    auto mode = StringUtils::ToLower(name);
    if (mode == "bridge") return utils::NetworkMode::BRIDGE;
    if (mode == "none") return utils::NetworkMode::NONE;
    if (mode == "host") return utils::NetworkMode::HOST;
    throw ConfigError("Unknown network mode '" + name + "' (bridge, none or host)");
}

void ApplyLimits(ResourceLimits& limits, const json& data) {
    if (!data.is_object()) {
        throw ConfigError("'limits' must be an object");
    }
    limits.memory_mb = static_cast<std::size_t>(
        GetNonNegative(data, "memoryMb", static_cast<long long>(limits.memory_mb)));
    limits.pids_limit = static_cast<int>(GetNonNegative(data, "pidsLimit", limits.pids_limit));
    if (const auto* cpus = Find(data, "cpus")) {
        if (!cpus->is_number() || cpus->get<double>() < 0.0) {
            throw ConfigError("'cpus' must be a non-negative number");
        }
        limits.cpus = cpus->get<double>();
    }
}

void ApplyImages(std::map<Language, std::string>& images, const json& data) {
    if (!data.is_object()) {
        throw ConfigError("'images' must be an object");
    }
    for (auto it = data.begin(); it != data.end(); ++it) {
        if (!it.value().is_string()) {
            throw ConfigError("Image for '" + it.key() + "' must be a string");
        }
        Language language;
        try {
            language = ParseLanguage(it.key());
        }
        catch (const UnsupportedOperationError& e) {
            throw ConfigError(std::string("images: ") + e.what());
        }
        images[language] = it.value().get<std::string>();
    }
}

} // anonymous namespace

std::filesystem::path ResolveConfigPath(const std::string& explicit_path) {
    if (!explicit_path.empty()) {
        if (!std::filesystem::exists(explicit_path)) {
            throw ConfigError("Configuration file not found: " + explicit_path);
        }
        return explicit_path;
    }

    auto from_env = GetEnv("MONOLITH_CONFIG");
    if (!from_env.empty()) {
        if (!std::filesystem::exists(from_env)) {
            throw ConfigError("MONOLITH_CONFIG points to a missing file: " + from_env);
        }
        return from_env;
    }

    auto home_config = GetHomePath() / ".monolith" / "config.json";
    if (std::filesystem::exists(home_config)) {
        return home_config;
    }
    return {};
}

void ApplyServiceConfig(ServiceConfig& config, const json& data) {
    if (!data.is_object()) {
        throw ConfigError("Configuration root must be an object");
    }

    config.setup_timeout = std::chrono::seconds(
        GetNonNegative(data, "setupTimeoutSeconds", config.setup_timeout.count()));
    config.run_timeout = std::chrono::seconds(
        GetNonNegative(data, "runTimeoutSeconds", config.run_timeout.count()));

    auto& session = config.session_defaults;
    session.verbose = GetBool(data, "verbose", session.verbose);
    session.retention.keep_template = GetBool(data, "keepTemplate", session.retention.keep_template);
    session.retention.commit_on_close = GetBool(data, "commitOnClose", session.retention.commit_on_close);
    session.profiler_script = GetString(data, "profilerScript", session.profiler_script.string());
    session.scratch_root = GetString(data, "scratchRoot", session.scratch_root.string());

    if (const auto* network = Find(data, "network")) {
        if (!network->is_string()) {
            throw ConfigError("'network' must be a string");
        }
        session.environment.network = ParseNetworkMode(network->get<std::string>());
    }
    if (const auto* limits = Find(data, "limits")) {
        ApplyLimits(session.environment.limits, *limits);
    }
    if (const auto* images = Find(data, "images")) {
        ApplyImages(config.images, *images);
    }
}

ServiceConfig LoadServiceConfig(const std::filesystem::path& path, ServiceConfig base) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("Cannot open configuration file: " + path.string());
    }

    json data;
    try {
        file >> data;
    }
    catch (const json::parse_error& e) {
        throw ConfigError("Invalid JSON in " + path.string() + ": " + e.what());
    }

    ApplyServiceConfig(base, data);
    spdlog::debug("Loaded configuration from {}", path.string());
    return base;
}

} // namespace core
} // namespace monolith
