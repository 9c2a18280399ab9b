/**
 * @file config_loader.hpp
 * @brief JSON configuration file for the execution service
 *
 * **Lookup Order**:
 * 1. `--config <path>`
 * 2. `$MONOLITH_CONFIG`
 * 3. `~/.monolith/config.json` (only if present)
 *
 * **Schema** (every key optional):
 * ```json
 * {
 *   "setupTimeoutSeconds": 120,
 *   "runTimeoutSeconds": 60,
 *   "verbose": false,
 *   "keepTemplate": false,
 *   "commitOnClose": false,
 *   "profilerScript": "/opt/monolith/memory_profiler.sh",
 *   "scratchRoot": "/var/tmp/monolith",
 *   "limits": {"memoryMb": 512, "cpus": 1.0, "pidsLimit": 256},
 *   "network": "bridge",
 *   "images": {"python": "python:3.11-bullseye"}
 * }
 * ```
 *
 * @date 2025
 */

#pragma once

#include "monolith/core/execution_service.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace monolith {
namespace core {

/**
 * @brief Locate the configuration file
 * @param explicit_path Path given on the command line (may be empty)
 * @return Path to load, or empty when no configuration applies
 * @throws ConfigError if an explicitly named file does not exist
 */
std::filesystem::path ResolveConfigPath(const std::string& explicit_path);

/**
 * @brief Overlay JSON settings onto a configuration
 * @throws ConfigError on unknown languages, bad values or wrong types
 */
void ApplyServiceConfig(ServiceConfig& config, const nlohmann::json& data);

/**
 * @brief Load a configuration file over defaults
 *
 * @param path JSON file
 * @param base Defaults to overlay
 * @return Merged configuration
 * @throws ConfigError if the file cannot be read or parsed
 */
ServiceConfig LoadServiceConfig(const std::filesystem::path& path, ServiceConfig base = {});

} // namespace core
} // namespace monolith
