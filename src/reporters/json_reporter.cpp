/**
 * @file json_reporter.cpp
 * @brief JSON rendering of execution reports
 *
 * @date 2025
 */

#include "monolith/reporters/json_reporter.hpp"
#include "monolith/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <iomanip>
#include <sstream>

namespace monolith {
namespace reporters {

using json = nlohmann::json;
using utils::StringUtils;

JsonReporter::JsonReporter(const JsonReporterConfig& config)
    : config_(config) {
}

json JsonReporter::ToJson(const core::ExecutionReport& report) const {
    json j;
    j["language"] = core::ToString(report.language);
    if (config_.include_code) {
        j["code"] = report.code;
    }
    j["libraries"] = report.libraries;
    j["stdout"] = report.stdout_output;
    j["stderr"] = report.stderr_output;
    j["exit_code"] = report.exit_code;
    j["peak_memory_kb"] = report.usage.peak_memory_kb;
    j["duration_ms"] = report.usage.duration_ms;
    j["integral_kb_ms"] = report.usage.integral_kb_ms;

    if (config_.include_series) {
        json series = json::array();
        for (const auto& sample : report.usage.memory_series) {
            series.push_back(json::array({sample.timestamp_ns, sample.resident_kb}));
        }
        j["memory_series"] = std::move(series);
    }

    j["timed_out"] = report.timed_out;
    j["error"] = report.error.empty() ? json(nullptr) : json(report.error);
    return j;
}

std::string JsonReporter::GenerateJsonString(const core::ExecutionReport& report) const {
    json j = ToJson(report);
    return config_.pretty_print ? j.dump(config_.indent_size) : j.dump();
}

bool JsonReporter::WriteReport(const core::ExecutionReport& report,
                               const std::filesystem::path& output_path) const {
    try {
        if (output_path.has_parent_path()) {
            std::filesystem::create_directories(output_path.parent_path());
        }

        std::ofstream file(output_path);
        if (!file) {
            spdlog::error("Failed to open file for writing: {}", output_path.string());
            return false;
        }
        file << GenerateJsonString(report) << '\n';
        if (!file) {
            spdlog::error("Failed to write report: {}", output_path.string());
            return false;
        }

        spdlog::info("✓ Report written to {}", output_path.string());
        return true;
    }
    catch (const std::exception& e) {
        spdlog::error("Failed to save JSON: {}", e.what());
        return false;
    }
}

std::string JsonReporter::GenerateSummary(const core::ExecutionReport& report) {
    std::ostringstream out;
    out << "Language:       " << core::ToString(report.language) << '\n';
    if (!report.libraries.empty()) {
        out << "Libraries:      " << StringUtils::Join(report.libraries, ", ") << '\n';
    }
    out << "Exit code:      " << report.exit_code << '\n';
    out << std::fixed << std::setprecision(3)
        << "Execution time: " << report.usage.duration_ms << " ms\n"
        << "Peak memory:    " << report.usage.peak_memory_kb << " KB\n"
        << "Integral:       " << report.usage.integral_kb_ms << " KB*ms\n"
        << "Samples:        " << report.usage.memory_series.size() << '\n';

    if (!report.stdout_output.empty()) {
        out << "--- stdout ---\n" << StringUtils::TrimRight(report.stdout_output) << '\n';
    }
    if (!report.stderr_output.empty()) {
        out << "--- stderr ---\n" << StringUtils::TrimRight(report.stderr_output) << '\n';
    }
    if (report.HasError()) {
        out << "Error:          " << report.error << (report.timed_out ? " (timeout)" : "") << '\n';
    }
    return out.str();
}

} // namespace reporters
} // namespace monolith
