/**
 * @file execution_service.cpp
 * @brief Request/response front end over sessions
 *
 * @date 2025
 */

#include "monolith/core/execution_service.hpp"
#include "monolith/core/errors.hpp"

#include <spdlog/spdlog.h>

namespace monolith {
namespace core {

ExecutionService::ExecutionService(ServiceConfig config,
                                   std::shared_ptr<EnvironmentBackend> backend,
                                   ProgressObserver observer)
    : config_(std::move(config))
    , backend_(std::move(backend))
    , supervisor_(std::move(observer), config_.poll_interval) {
}

SessionConfig ExecutionService::MakeSessionConfig(Language language) const {
    SessionConfig session = config_.session_defaults;
    session.language = language;

    if (session.image.image.empty() && session.image.dockerfile.empty()) {
        auto it = config_.images.find(language);
        if (it != config_.images.end()) {
            session.image.image = it->second;
        }
    }
    return session;
}

ExecutionReport ExecutionService::Execute(const ExecutionRequest& request) {
    ExecutionReport report;
    report.language = request.language;
    report.code = request.code;
    report.libraries = request.libraries;

    spdlog::info("Executing {} submission ({} bytes, {} librar{})", ToString(request.language),
                 request.code.size(), request.libraries.size(),
                 request.libraries.size() == 1 ? "y" : "ies");

    try {
        auto session = std::make_shared<Session>(MakeSessionConfig(request.language), backend_);
        SessionScope scope(session);

        if (!request.libraries.empty()) {
            auto libraries = request.libraries;
            auto setup = supervisor_.Supervise(
                [session, libraries] { return session->Setup(libraries); },
                config_.setup_timeout, "Setup");
            if (!setup.Succeeded()) {
                report.error = setup.error_message;
                report.timed_out = setup.timed_out;
                spdlog::error("Setup failed: {}", report.error);
                return report;
            }
        }

        auto code = request.code;
        bool profile = request.profile;
        auto run = supervisor_.Supervise(
            [session, code, profile] { return session->Run(code, profile); },
            config_.run_timeout, "Execution");
        if (!run.Succeeded()) {
            report.error = run.error_message;
            report.timed_out = run.timed_out;
            spdlog::error("Execution failed: {}", report.error);
            return report;
        }

        const auto& result = *run.output;
        report.stdout_output = result.stdout_output;
        report.stderr_output = result.stderr_output;
        report.exit_code = result.exit_code;
        report.usage = result.usage;

        if (!report.stderr_output.empty()) {
            report.error = "failed";
        }
    }
    catch (const std::exception& e) {
        report.error = e.what();
        spdlog::error("Session failed: {}", e.what());
    }

    return report;
}

} // namespace core
} // namespace monolith
