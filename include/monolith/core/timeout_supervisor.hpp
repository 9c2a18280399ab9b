/**
 * @file timeout_supervisor.hpp
 * @brief Wall-clock budget enforcement for blocking session operations
 *
 * The supervised operation runs on a detached thread and hands its value or
 * exception back through a std::promise. The caller polls the matching
 * future, reporting progress, until the value arrives or the budget runs out.
 *
 * ```
 * caller                       worker (detached)
 *   │  spawn ───────────────────▶ op()
 *   │  wait_for(poll) ◀─ ─ ─ ─ ─  set_value / set_exception
 *   │  observer("Running (t/T) s...")
 *   │  ...
 *   └▶ Finished | Timeout reached
 * ```
 *
 * A timed-out worker is not cancelled. It keeps whatever it captured alive
 * (capture shared_ptrs, not references) and its late result is discarded.
 *
 * @date 2025
 */

#pragma once

#include "monolith/core/errors.hpp"

#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <thread>
#include <type_traits>
#include <utility>

namespace monolith {
namespace core {

/// Progress callback: fraction of the budget in [0, 1] and a status text
using ProgressObserver = std::function<void(double, const std::string&)>;

/**
 * @struct SupervisedResult
 * @brief Tagged outcome of a supervised operation
 *
 * Exactly one of `output` and `error` is set.
 */
template <typename T>
struct SupervisedResult {
    std::optional<T> output;       ///< Value returned by the operation
    std::exception_ptr error;      ///< Exception raised, or TimeoutError
    std::string error_message;     ///< what() of `error`
    bool timed_out{false};         ///< Budget exceeded

    bool Succeeded() const { return output.has_value(); }

    /// Return the value or rethrow the captured error
    T& Value() {
        if (error) {
            std::rethrow_exception(error);
        }
        return *output;
    }
};

/**
 * @class TimeoutSupervisor
 * @brief Runs operations under a hard wall-clock budget
 *
 * **Usage Example**:
 * @code
 * TimeoutSupervisor supervisor([](double fraction, const std::string& text) {
 *     spdlog::info("[{:3.0f}%] {}", fraction * 100, text);
 * });
 * auto result = supervisor.Supervise([session] { return session->Run(code, true); },
 *                                    std::chrono::seconds(60), "Running code");
 * if (result.timed_out) { ... }
 * @endcode
 */
class TimeoutSupervisor {
public:
    explicit TimeoutSupervisor(ProgressObserver observer = nullptr,
                               std::chrono::milliseconds poll_interval = std::chrono::seconds(1));

    /**
     * @brief Run an operation under a budget
     *
     * Never throws: exceptions of the operation (and the TimeoutError of an
     * exceeded budget) are returned in the result.
     *
     * @param operation Callable returning a non-void value
     * @param budget Wall-clock budget
     * @param description Prefix of the progress texts
     * @return Value, error or timeout
     */
    template <typename Fn>
    auto Supervise(Fn&& operation,
                   std::chrono::milliseconds budget,
                   const std::string& description) const
        -> SupervisedResult<std::invoke_result_t<std::decay_t<Fn>&>>;

    std::chrono::milliseconds GetPollInterval() const { return poll_interval_; }

    /// Status text while the operation is still running, e.g. "Setup Running (3/120) s..."
    static std::string RunningText(const std::string& description,
                                   std::chrono::milliseconds elapsed,
                                   std::chrono::milliseconds budget);

private:
    ProgressObserver observer_;
    std::chrono::milliseconds poll_interval_;

    void Report(double fraction, const std::string& text) const;
};

// ============================================================================
// TEMPLATE IMPLEMENTATION
// ============================================================================

template <typename Fn>
auto TimeoutSupervisor::Supervise(Fn&& operation,
                                  std::chrono::milliseconds budget,
                                  const std::string& description) const
    -> SupervisedResult<std::invoke_result_t<std::decay_t<Fn>&>> {
    using T = std::invoke_result_t<std::decay_t<Fn>&>;
    static_assert(!std::is_void<T>::value, "Supervised operations must return a value");

    SupervisedResult<T> result;

    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();

    Report(0.0, description + " starts");

    try {
        std::thread([promise, op = std::decay_t<Fn>(std::forward<Fn>(operation))]() mutable {
            try {
                promise->set_value(op());
            }
            catch (...) {
                promise->set_exception(std::current_exception());
            }
        }).detach();
    }
    catch (const std::system_error& e) {
        result.error = std::current_exception();
        result.error_message = e.what();
        return result;
    }

    const auto start = std::chrono::steady_clock::now();
    const auto deadline = start + budget;

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            // One last non-blocking look before declaring the timeout
            if (future.wait_for(std::chrono::seconds(0)) == std::future_status::ready) {
                break;
            }
            Report(1.0, description + " Timeout reached.");
            result.timed_out = true;
            result.error_message = description + " timed out after " +
                std::to_string(budget.count()) + " ms";
            result.error = std::make_exception_ptr(TimeoutError(result.error_message));
            return result;
        }

        auto wait = std::min<std::chrono::steady_clock::duration>(poll_interval_, deadline - now);
        if (future.wait_for(wait) == std::future_status::ready) {
            break;
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        double fraction = budget.count() > 0
            ? std::min(1.0, static_cast<double>(elapsed.count()) / budget.count())
            : 1.0;
        Report(fraction, RunningText(description, elapsed, budget));
    }

    try {
        result.output.emplace(future.get());
    }
    catch (const std::exception& e) {
        result.error = std::current_exception();
        result.error_message = e.what();
    }
    catch (...) {
        result.error = std::current_exception();
        result.error_message = description + " failed with a non-standard exception";
    }

    Report(1.0, description + " Finished.");
    return result;
}

} // namespace core
} // namespace monolith
