/**
 * @file test_types.cpp
 * @brief Unit tests for core types.
 */

#include "core/types.hpp"

#include <gtest/gtest.h>

using namespace diagnostics_engine;

TEST(TaskCadenceTest, Validity) {
    EXPECT_TRUE((TaskCadence{Millis{0}, Millis{100}, 1}.valid()));
    EXPECT_FALSE((TaskCadence{Millis{-1}, Millis{100}, 1}.valid()));
    EXPECT_FALSE((TaskCadence{Millis{0}, Millis{0}, 1}.valid()));
    EXPECT_FALSE((TaskCadence{Millis{0}, Millis{100}, 0}.valid()));
}

TEST(SessionStatusTest, TerminalStates) {
    EXPECT_FALSE(is_terminal(SessionStatus::None));
    EXPECT_FALSE(is_terminal(SessionStatus::Running));
    EXPECT_TRUE(is_terminal(SessionStatus::Succeeded));
    EXPECT_TRUE(is_terminal(SessionStatus::Cancelled));
    EXPECT_TRUE(is_terminal(SessionStatus::Failed));
}

TEST(SessionStatusTest, ParseRoundTrip) {
    for (auto status : {SessionStatus::None, SessionStatus::Running, SessionStatus::Succeeded,
                        SessionStatus::Cancelled, SessionStatus::Failed}) {
        EXPECT_EQ(parse_session_status(to_string(status)), status);
    }
    EXPECT_FALSE(parse_session_status("DONE").has_value());
    EXPECT_FALSE(parse_session_status("running").has_value());
}

TEST(RunnerStateTest, ToString) {
    EXPECT_EQ(to_string(RunnerState::Unscheduled), "unscheduled");
    EXPECT_EQ(to_string(RunnerState::FailedToStart), "failed_to_start");
    EXPECT_EQ(parse_runner_state("finished"), RunnerState::Finished);
    EXPECT_FALSE(parse_runner_state("paused").has_value());
}
