/**
 * @file types.hpp
 * @brief Fundamental types used throughout the diagnostics engine.
 *
 * Defines SessionId, TaskId, timestamps, session/runner status enums and
 * the task cadence. All types are plain values.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace diagnostics_engine {

// ─────────────────────────────────────────────
// Identity Types
// ─────────────────────────────────────────────

using SessionId = std::string;
using TaskId = std::string;
using Timestamp = std::chrono::system_clock::time_point;
using Millis = std::chrono::milliseconds;
using SteadyTime = std::chrono::steady_clock::time_point;

// ─────────────────────────────────────────────
// Task Cadence
// ─────────────────────────────────────────────

/**
 * @brief Timing of a repeating task: first run after initial_delay, then
 *        every period, run_count times in total.
 */
struct TaskCadence {
    Millis initial_delay{0};
    Millis period{1000};
    int run_count{1};

    [[nodiscard]] constexpr bool valid() const noexcept {
        return initial_delay.count() >= 0 && period.count() > 0 && run_count >= 1;
    }

    bool operator==(const TaskCadence&) const = default;
};

// ─────────────────────────────────────────────
// Session Status
// ─────────────────────────────────────────────

/**
 * @brief Session status. Transitions only move forward:
 *        None → Running → {Succeeded, Cancelled, Failed}.
 */
enum class SessionStatus : uint8_t {
    None,          ///< Created, run() not called yet
    Running,
    Succeeded,     ///< Finished, archive written
    Cancelled,     ///< Cancelled by the operator, partial archive written
    Failed         ///< Archive could not be written, or aborted by a restart
};

[[nodiscard]] constexpr std::string_view to_string(SessionStatus status) noexcept {
    switch (status) {
        case SessionStatus::None:      return "NONE";
        case SessionStatus::Running:   return "RUNNING";
        case SessionStatus::Succeeded: return "SUCCEEDED";
        case SessionStatus::Cancelled: return "CANCELLED";
        case SessionStatus::Failed:    return "FAILED";
    }
    return "UNKNOWN";
}

[[nodiscard]] constexpr bool is_terminal(SessionStatus status) noexcept {
    return status == SessionStatus::Succeeded
        || status == SessionStatus::Cancelled
        || status == SessionStatus::Failed;
}

[[nodiscard]] std::optional<SessionStatus> parse_session_status(std::string_view text) noexcept;

// ─────────────────────────────────────────────
// Runner State
// ─────────────────────────────────────────────

enum class RunnerState : uint8_t {
    Unscheduled,
    Scheduled,
    Finished,
    FailedToStart
};

[[nodiscard]] constexpr std::string_view to_string(RunnerState state) noexcept {
    switch (state) {
        case RunnerState::Unscheduled:   return "unscheduled";
        case RunnerState::Scheduled:     return "scheduled";
        case RunnerState::Finished:      return "finished";
        case RunnerState::FailedToStart: return "failed_to_start";
    }
    return "unknown";
}

[[nodiscard]] std::optional<RunnerState> parse_runner_state(std::string_view text) noexcept;

}  // namespace diagnostics_engine
