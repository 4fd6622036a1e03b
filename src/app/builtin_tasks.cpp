/**
 * @file builtin_tasks.cpp
 * @brief Built-in /proc readers.
 */

#include "app/builtin_tasks.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <vector>

namespace diagnostics_engine {

namespace {

/// Copy a whole text file into out under a `## path` heading.
Result<void> copy_proc_file(std::ostream& out, const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return Error{ErrorCode::Io, "Cannot read " + path.string()};
    }
    out << "## " << path.string() << "\n\n" << in.rdbuf() << '\n';
    return {};
}

std::string read_first_line(const std::filesystem::path& path) {
    std::ifstream in(path);
    std::string line;
    std::getline(in, line);
    return line;
}

/// Third field of /proc/<pid>/task/<tid>/stat, after the parenthesised name.
char thread_state(const std::filesystem::path& stat_path) {
    auto line = read_first_line(stat_path);
    auto close = line.rfind(')');
    if (close == std::string::npos || close + 2 >= line.size()) return '?';
    return line[close + 2];
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// HeartbeatTask
// ─────────────────────────────────────────────

HeartbeatTask::HeartbeatTask(TaskCadence cadence)
    : FileTask(ID, "Heartbeat", cadence) {}

Result<void> HeartbeatTask::write_run(std::ostream& out, int run, std::stop_token /*stop*/) {
    auto now = format_iso8601(std::chrono::system_clock::now());
    out << "run " << run << " of " << cadence().run_count << " at " << now << '\n';
    log_timeline("heartbeat " + std::to_string(run));
    return {};
}

// ─────────────────────────────────────────────
// ProcessStatusTask
// ─────────────────────────────────────────────

ProcessStatusTask::ProcessStatusTask(TaskCadence cadence)
    : FileTask(ID, "Process Status", cadence) {}

Result<void> ProcessStatusTask::write_run(std::ostream& out, int run, std::stop_token stop) {
    if (auto r = copy_proc_file(out, "/proc/self/status"); !r) return r;
    if (stop.stop_requested()) {
        return Error{ErrorCode::TaskFailed, "Interrupted during run " + std::to_string(run)};
    }
    if (auto r = copy_proc_file(out, "/proc/loadavg"); !r) return r;
    log_timeline("load " + read_first_line("/proc/loadavg"));
    return {};
}

// ─────────────────────────────────────────────
// ThreadListTask
// ─────────────────────────────────────────────

ThreadListTask::ThreadListTask(TaskCadence cadence)
    : FileTask(ID, "Thread List", cadence) {}

Result<void> ThreadListTask::write_run(std::ostream& out, int /*run*/, std::stop_token stop) {
    const std::filesystem::path task_dir = "/proc/self/task";
    std::error_code ec;
    std::vector<std::filesystem::path> threads;
    for (const auto& entry : std::filesystem::directory_iterator(task_dir, ec)) {
        threads.push_back(entry.path());
    }
    if (ec) {
        return Error{ErrorCode::Io, "Cannot list " + task_dir.string() + ": " + ec.message()};
    }
    std::sort(threads.begin(), threads.end());

    out << "tid\tstate\tname\n";
    for (const auto& thread : threads) {
        if (stop.stop_requested()) {
            return Error{ErrorCode::TaskFailed, "Interrupted while listing threads"};
        }
        out << thread.filename().string() << '\t'
            << thread_state(thread / "stat") << '\t'
            << read_first_line(thread / "comm") << '\n';
    }
    log_timeline(std::to_string(threads.size()) + " threads");
    return {};
}

// ─────────────────────────────────────────────
// Registration
// ─────────────────────────────────────────────

Result<void> register_builtin_tasks(TaskRegistry& registry) {
    if (auto r = registry.add(HeartbeatTask::ID, "Run number and time stamp per run",
                              [](const TaskCadence& c) { return std::make_shared<HeartbeatTask>(c); });
        !r) {
        return r;
    }
    if (auto r = registry.add(ProcessStatusTask::ID, "Copies of /proc/self/status and /proc/loadavg",
                              [](const TaskCadence& c) { return std::make_shared<ProcessStatusTask>(c); });
        !r) {
        return r;
    }
    return registry.add(ThreadListTask::ID, "Threads of this process with their states",
                        [](const TaskCadence& c) { return std::make_shared<ThreadListTask>(c); });
}

}  // namespace diagnostics_engine
