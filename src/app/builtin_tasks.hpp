/**
 * @file builtin_tasks.hpp
 * @brief Diagnostic tasks shipped with the command-line front-end.
 *
 * All of them read from /proc and write one text file per run.
 */

#pragma once

#include "session/file_task.hpp"
#include "session/task_registry.hpp"

namespace diagnostics_engine {

/// Writes the run number and wall-clock time; useful to check cadences.
class HeartbeatTask : public FileTask {
public:
    static constexpr const char* ID = "heartbeat";

    explicit HeartbeatTask(TaskCadence cadence);

protected:
    Result<void> write_run(std::ostream& out, int run, std::stop_token stop) override;
};

/// Copies /proc/self/status and /proc/loadavg.
class ProcessStatusTask : public FileTask {
public:
    static constexpr const char* ID = "process_status";

    explicit ProcessStatusTask(TaskCadence cadence);

protected:
    Result<void> write_run(std::ostream& out, int run, std::stop_token stop) override;
};

/// Lists the threads of this process with their names and states.
class ThreadListTask : public FileTask {
public:
    static constexpr const char* ID = "threads";

    explicit ThreadListTask(TaskCadence cadence);

    [[nodiscard]] bool selected_by_default() const override { return false; }

protected:
    Result<void> write_run(std::ostream& out, int run, std::stop_token stop) override;
};

/**
 * @brief Register every built-in task.
 * @return the first registration error.
 */
Result<void> register_builtin_tasks(TaskRegistry& registry);

}  // namespace diagnostics_engine
