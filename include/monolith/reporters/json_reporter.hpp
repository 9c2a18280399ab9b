/**
 * @file json_reporter.hpp
 * @brief JSON rendering of execution reports
 *
 * **Payload**:
 * ```json
 * {
 *   "language": "python",
 *   "code": "print(1)",
 *   "libraries": [],
 *   "stdout": "1\n",
 *   "stderr": "",
 *   "exit_code": 0,
 *   "peak_memory_kb": 9120,
 *   "duration_ms": 21.4,
 *   "integral_kb_ms": 401280,
 *   "memory_series": [[1737331200000000000, 3000], ...],
 *   "timed_out": false,
 *   "error": null
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
namespace reporters {

/**
 * @struct JsonReporterConfig
 * @brief JSON report options
 */
struct JsonReporterConfig {
    bool pretty_print{true};        ///< Pretty print JSON
    int indent_size{2};             ///< Indentation spaces
    bool include_code{true};        ///< Echo the submitted code
    bool include_series{true};      ///< Include the raw memory series (can be large)
};

/**
 * @class JsonReporter
 * @brief Serialises ExecutionReport payloads
 */
class JsonReporter {
public:
    explicit JsonReporter(const JsonReporterConfig& config = {});

    /// Payload as a JSON value
    nlohmann::json ToJson(const core::ExecutionReport& report) const;

    /// Payload as text, formatted per configuration
    std::string GenerateJsonString(const core::ExecutionReport& report) const;

    /**
     * @brief Write the payload to a file
     * @return true on success (failures are logged)
     */
    bool WriteReport(const core::ExecutionReport& report,
                     const std::filesystem::path& output_path) const;

    /// Multi-line human-readable summary for the console
    static std::string GenerateSummary(const core::ExecutionReport& report);

private:
    JsonReporterConfig config_;
};

} // namespace reporters
} // namespace monolith
