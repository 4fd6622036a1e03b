/**
 * @file types.cpp
 * @brief Parsing of status enums from their persisted text form.
 */

#include "core/types.hpp"

namespace diagnostics_engine {

std::optional<SessionStatus> parse_session_status(std::string_view text) noexcept {
    for (auto status : {SessionStatus::None, SessionStatus::Running,
                        SessionStatus::Succeeded, SessionStatus::Cancelled,
                        SessionStatus::Failed}) {
        if (to_string(status) == text) return status;
    }
    return std::nullopt;
}

std::optional<RunnerState> parse_runner_state(std::string_view text) noexcept {
    for (auto state : {RunnerState::Unscheduled, RunnerState::Scheduled,
                       RunnerState::Finished, RunnerState::FailedToStart}) {
        if (to_string(state) == text) return state;
    }
    return std::nullopt;
}

}  // namespace diagnostics_engine
