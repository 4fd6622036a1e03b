/**
 * @file session_record.cpp
 * @brief SessionRecord TOML codec using toml++.
 */

#include "persistence/session_record.hpp"

#include "core/time_utils.hpp"

#include <toml++/toml.hpp>

#include <fstream>
#include <sstream>
#include <system_error>

namespace diagnostics_engine {

namespace {

toml::table encode_runner(const RunnerRecord& runner) {
    toml::table t{
        {"task_id", runner.task_id},
        {"display_name", runner.display_name},
        {"initial_delay_ms", static_cast<int64_t>(runner.cadence.initial_delay.count())},
        {"period_ms", static_cast<int64_t>(runner.cadence.period.count())},
        {"run_count", static_cast<int64_t>(runner.cadence.run_count)},
        {"runs_completed", static_cast<int64_t>(runner.runs_completed)},
        {"state", std::string{to_string(runner.state)}},
    };
    if (runner.start_error) {
        t.insert("start_error", *runner.start_error);
    }
    return t;
}

toml::table encode_session(const SessionRecord& record) {
    toml::table t{
        {"id", record.id},
        {"name", record.name},
        {"description", record.description},
        {"user", record.user},
        {"created_at", format_iso8601(record.created_at)},
    };
    if (record.status) t.insert("status", std::string{to_string(*record.status)});
    if (record.started_at) t.insert("started_at", format_iso8601(*record.started_at));
    if (record.ended_at) t.insert("ended_at", format_iso8601(*record.ended_at));

    toml::array runners;
    for (const auto& runner : record.runners) {
        runners.push_back(encode_runner(runner));
    }
    t.insert("runners", std::move(runners));
    return t;
}

Result<std::optional<Timestamp>> decode_time(const toml::table& t, std::string_view key) {
    auto text = t[key].value<std::string>();
    if (!text) return std::optional<Timestamp>{};
    auto ts = parse_iso8601(*text);
    if (!ts) {
        return Error{ErrorCode::Parse, "Invalid timestamp for '" + std::string{key} + "': " + *text};
    }
    return std::optional<Timestamp>{*ts};
}

Result<RunnerRecord> decode_runner(const toml::table& t) {
    RunnerRecord runner;
    auto task_id = t["task_id"].value<std::string>();
    if (!task_id) {
        return Error{ErrorCode::Parse, "Runner record without task_id"};
    }
    runner.task_id = *task_id;
    runner.display_name = t["display_name"].value_or(runner.task_id);
    runner.cadence.initial_delay = Millis{t["initial_delay_ms"].value_or(int64_t{0})};
    runner.cadence.period = Millis{t["period_ms"].value_or(int64_t{1000})};
    runner.cadence.run_count = static_cast<int>(t["run_count"].value_or(int64_t{1}));
    runner.runs_completed = static_cast<int>(t["runs_completed"].value_or(int64_t{0}));

    auto state_text = t["state"].value_or(std::string{"unscheduled"});
    auto state = parse_runner_state(state_text);
    if (!state) {
        return Error{ErrorCode::Parse, "Unknown runner state '" + state_text + "'"};
    }
    runner.state = *state;
    if (auto err = t["start_error"].value<std::string>()) {
        runner.start_error = *err;
    }
    return runner;
}

Result<SessionRecord> decode_session(const toml::table& t) {
    SessionRecord record;
    auto id = t["id"].value<std::string>();
    auto name = t["name"].value<std::string>();
    if (!id || !name) {
        return Error{ErrorCode::Parse, "Session record without id or name"};
    }
    record.id = *id;
    record.name = *name;
    record.description = t["description"].value_or(std::string{});
    record.user = t["user"].value_or(std::string{});

    if (auto status_text = t["status"].value<std::string>()) {
        auto status = parse_session_status(*status_text);
        if (!status) {
            return Error{ErrorCode::Parse, "Unknown session status '" + *status_text + "'"};
        }
        record.status = *status;
    }

    auto created = decode_time(t, "created_at");
    if (!created) return created.error();
    record.created_at = created->value_or(Timestamp{});

    auto started = decode_time(t, "started_at");
    if (!started) return started.error();
    record.started_at = *started;

    auto ended = decode_time(t, "ended_at");
    if (!ended) return ended.error();
    record.ended_at = *ended;

    if (auto* runners = t["runners"].as_array()) {
        for (const auto& node : *runners) {
            const auto* runner_table = node.as_table();
            if (runner_table == nullptr) {
                return Error{ErrorCode::Parse, "Runner entry of session " + record.id + " is not a table"};
            }
            auto runner = decode_runner(*runner_table);
            if (!runner) return runner.error();
            record.runners.push_back(std::move(*runner));
        }
    }
    return record;
}

}  // anonymous namespace

std::string encode_records(const std::vector<SessionRecord>& records) {
    toml::array sessions;
    for (const auto& record : records) {
        sessions.push_back(encode_session(record));
    }
    toml::table root{{"sessions", std::move(sessions)}};

    std::ostringstream oss;
    oss << root << '\n';
    return oss.str();
}

Result<std::vector<SessionRecord>> decode_records(std::string_view text) {
    try {
        auto tbl = toml::parse(text);
        std::vector<SessionRecord> records;

        auto* sessions = tbl["sessions"].as_array();
        if (sessions == nullptr) return records;

        for (const auto& node : *sessions) {
            const auto* session_table = node.as_table();
            if (session_table == nullptr) {
                return Error{ErrorCode::Parse, "Session entry is not a table"};
            }
            auto record = decode_session(*session_table);
            if (!record) return record.error();
            records.push_back(std::move(*record));
        }
        return records;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Result<void> save_records(const std::filesystem::path& path,
                          const std::vector<SessionRecord>& records) {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot create " + path.parent_path().string() + ": " + ec.message()};
        }
    }

    auto tmp = path;
    tmp += ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Error{ErrorCode::Io, "Cannot open " + tmp.string() + " for writing"};
        }
        out << encode_records(records);
        out.flush();
        if (!out) {
            return Error{ErrorCode::Io, "Write to " + tmp.string() + " failed"};
        }
    }

    std::filesystem::rename(tmp, path, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot replace " + path.string() + ": " + ec.message()};
    }
    return {};
}

Result<std::vector<SessionRecord>> load_records(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::vector<SessionRecord>{};
    }

    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::Io, "Cannot open " + path.string()};
    }
    std::ostringstream oss;
    oss << in.rdbuf();
    return decode_records(oss.str());
}

}  // namespace diagnostics_engine
