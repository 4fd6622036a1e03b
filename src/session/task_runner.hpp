/**
 * @file task_runner.hpp
 * @brief Drives one task through its cadence inside one session.
 */

#pragma once

#include "core/logger.hpp"
#include "core/types.hpp"
#include "executor/scheduler.hpp"
#include "persistence/session_record.hpp"
#include "session/container.hpp"
#include "session/task.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>

namespace diagnostics_engine {

class TaskRunner;

/**
 * @brief Receives runner progress. Callbacks run on pool threads.
 */
class RunnerListener {
public:
    virtual ~RunnerListener() = default;

    virtual void on_run_finished(TaskRunner& runner) = 0;

    /// At most once per runner.
    virtual void on_task_finished(TaskRunner& runner) = 0;
};

/**
 * @brief Per-session execution state of one task.
 *
 * UNSCHEDULED → SCHEDULED → FINISHED, or UNSCHEDULED → FAILED_TO_START when
 * the cadence is invalid, before_start fails or the scheduler rejects the
 * job. A runner is used for exactly one session.
 */
class TaskRunner : public std::enable_shared_from_this<TaskRunner> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    /// Longest cancel() waits for an interrupted run to hand in its output.
    static constexpr Millis DRAIN_TIMEOUT{5000};

    static std::shared_ptr<TaskRunner> create(std::shared_ptr<ITask> task,
                                              std::shared_ptr<Container> container,
                                              std::weak_ptr<RunnerListener> listener,
                                              std::shared_ptr<Logger> logger);

    TaskRunner(PrivateTag,
               std::shared_ptr<ITask> task,
               std::shared_ptr<Container> container,
               std::weak_ptr<RunnerListener> listener,
               std::shared_ptr<Logger> logger);

    TaskRunner(const TaskRunner&) = delete;
    TaskRunner& operator=(const TaskRunner&) = delete;

    /**
     * @brief Run before_start and register the periodic job.
     *
     * @return the start failure, also recorded in the container and kept
     *         in start_error(); IllegalState if already scheduled.
     */
    Result<void> schedule(IScheduler& scheduler);

    /**
     * @brief Stop the schedule, run after_finish and report the task as
     *        finished.
     *
     * A run in progress on another thread is waited for, up to
     * DRAIN_TIMEOUT, so that its output still reaches the container.
     *
     * @param interrupt signal the stop token of a run in progress instead
     *        of letting it complete
     * @return true if this call finished the runner; false when it was
     *         already finished or never scheduled
     */
    bool cancel(bool interrupt);

    [[nodiscard]] bool is_running() const;
    [[nodiscard]] RunnerState state() const;
    [[nodiscard]] std::optional<std::string> start_error() const;
    [[nodiscard]] int runs_completed() const noexcept { return runs_.load(); }

    [[nodiscard]] TaskId task_id() const { return task_id_; }
    [[nodiscard]] const ITask& task() const noexcept { return *task_; }
    [[nodiscard]] const TaskCadence& cadence() const noexcept { return cadence_; }
    [[nodiscard]] Container& container() const noexcept { return *container_; }

    [[nodiscard]] RunnerRecord record() const;

private:
    void tick(std::stop_token stop);
    Result<void> fail_to_start(Error error);
    void report_failure(std::string title, std::string detail);
    void await_idle();

    std::shared_ptr<ITask> task_;
    TaskId task_id_;
    TaskCadence cadence_;
    std::shared_ptr<Container> container_;
    std::weak_ptr<RunnerListener> listener_;
    std::shared_ptr<Logger> logger_;

    std::atomic<int> runs_{0};

    mutable std::mutex mutex_;
    RunnerState state_{RunnerState::Unscheduled};
    bool finishing_{false};     ///< cancel() claimed; stays Scheduled until after_finish returns
    std::optional<std::string> start_error_;
    JobHandle job_;
    bool executing_{false};
    std::thread::id executing_thread_;
    std::condition_variable idle_cv_;
};

}  // namespace diagnostics_engine
