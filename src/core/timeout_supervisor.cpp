/**
 * @file timeout_supervisor.cpp
 * @brief Progress reporting of the timeout supervisor
 *
 * @date 2025
 */

#include "monolith/core/timeout_supervisor.hpp"

#include <spdlog/spdlog.h>

namespace monolith {
namespace core {

TimeoutSupervisor::TimeoutSupervisor(ProgressObserver observer,
                                     std::chrono::milliseconds poll_interval)
    : observer_(std::move(observer))
    , poll_interval_(poll_interval.count() > 0 ? poll_interval : std::chrono::milliseconds(1)) {
}

std::string TimeoutSupervisor::RunningText(const std::string& description,
                                           std::chrono::milliseconds elapsed,
                                           std::chrono::milliseconds budget) {
    auto elapsed_s = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    auto budget_s = std::chrono::duration_cast<std::chrono::seconds>(budget).count();
    return description + " Running (" + std::to_string(elapsed_s) + "/" +
           std::to_string(budget_s) + ") s...";
}

void TimeoutSupervisor::Report(double fraction, const std::string& text) const {
    spdlog::debug("{} ({:.0f}%)", text, fraction * 100.0);
    if (!observer_) {
        return;
    }
    try {
        observer_(fraction, text);
    }
    catch (const std::exception& e) {
        spdlog::warn("Progress observer failed: {}", e.what());
    }
    catch (...) {
        spdlog::warn("Progress observer failed with a non-standard exception");
    }
}

} // namespace core
} // namespace monolith
