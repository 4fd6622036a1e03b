/**
 * @file session_record.hpp
 * @brief Plain-value snapshot of a session, and its TOML codec.
 *
 * Records are what survives a restart: identities, timestamps, status and
 * per-task progress. No runtime object (runner, container, job) is ever
 * serialized; Session::rehydrate() builds fresh ones from a record.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace diagnostics_engine {

struct RunnerRecord {
    TaskId task_id;
    std::string display_name;
    TaskCadence cadence;
    int runs_completed{0};
    RunnerState state{RunnerState::Unscheduled};
    std::optional<std::string> start_error;

    bool operator==(const RunnerRecord&) const = default;
};

struct SessionRecord {
    SessionId id;
    std::string name;
    std::string description;
    std::string user;
    std::optional<SessionStatus> status;    ///< Missing in files cut short by a crash
    Timestamp created_at{};
    std::optional<Timestamp> started_at;
    std::optional<Timestamp> ended_at;
    std::vector<RunnerRecord> runners;

    bool operator==(const SessionRecord&) const = default;
};

/// Serialize as an array of `[[sessions]]` tables.
[[nodiscard]] std::string encode_records(const std::vector<SessionRecord>& records);

Result<std::vector<SessionRecord>> decode_records(std::string_view text);

/// Write through a temporary file renamed into place.
Result<void> save_records(const std::filesystem::path& path,
                          const std::vector<SessionRecord>& records);

/// A missing file is an empty list, not an error.
Result<std::vector<SessionRecord>> load_records(const std::filesystem::path& path);

}  // namespace diagnostics_engine
