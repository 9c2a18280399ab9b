/**
 * @file execution_service.hpp
 * @brief Request/response front end over sessions
 *
 * One request, one session:
 * ```
 * open ─▶ [Setup(libraries) within setup budget] ─▶ Run(code) within run budget ─▶ close
 * ```
 * Every failure is folded into the report's `error` field; Execute() itself
 * does not throw for session, backend or timeout failures.
 *
 * @date 2025
 */

#pragma once

#include "monolith/core/environment.hpp"
#include "monolith/core/session.hpp"
#include "monolith/core/timeout_supervisor.hpp"

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace monolith {
namespace core {

/**
 * @struct ExecutionRequest
 * @brief One code submission
 */
struct ExecutionRequest {
    Language language{Language::PYTHON};
    std::string code;
    std::vector<std::string> libraries;
    bool profile{true};
};

/**
 * @struct ExecutionReport
 * @brief Result payload of one submission
 */
struct ExecutionReport {
    Language language{Language::PYTHON};
    std::string code;
    std::vector<std::string> libraries;

    std::string stdout_output;
    std::string stderr_output;
    int exit_code{0};
    ResourceUsage usage;

    std::string error;          ///< "failed" when the program wrote stderr, else the failure message
    bool timed_out{false};      ///< Setup or run exceeded its budget

    bool HasError() const { return !error.empty(); }
};

/**
 * @struct ServiceConfig
 * @brief Budgets and per-request session defaults
 */
struct ServiceConfig {
    std::chrono::seconds setup_timeout{120};
    std::chrono::seconds run_timeout{60};
    std::chrono::milliseconds poll_interval{1000};
    SessionConfig session_defaults;               ///< Language is taken from the request
    std::map<Language, std::string> images;       ///< Per-language image overrides
};

/**
 * @class ExecutionService
 * @brief Runs submissions in fresh sessions under time budgets
 */
class ExecutionService {
public:
    ExecutionService(ServiceConfig config,
                     std::shared_ptr<EnvironmentBackend> backend,
                     ProgressObserver observer = nullptr);

    /**
     * @brief Execute one submission
     * @param request Language, code, libraries and profiling flag
     * @return Report with output, metrics and error
     */
    ExecutionReport Execute(const ExecutionRequest& request);

    /// Session configuration a request would run with
    SessionConfig MakeSessionConfig(Language language) const;

    const ServiceConfig& GetConfig() const { return config_; }

private:
    ServiceConfig config_;
    std::shared_ptr<EnvironmentBackend> backend_;
    TimeoutSupervisor supervisor_;
};

} // namespace core
} // namespace monolith
