/**
 * @file task_runner.cpp
 * @brief TaskRunner implementation.
 */

#include "session/task_runner.hpp"

#include <exception>
#include <thread>

namespace diagnostics_engine {

namespace {

/// Run a task hook, folding an escaping exception into its Result.
template <typename F>
Result<void> invoke_hook(F&& hook) {
    try {
        return hook();
    } catch (const std::exception& e) {
        return Error{ErrorCode::TaskFailed, e.what()};
    } catch (...) {
        return Error{ErrorCode::TaskFailed, "non-standard exception"};
    }
}

}  // anonymous namespace

std::shared_ptr<TaskRunner> TaskRunner::create(std::shared_ptr<ITask> task,
                                               std::shared_ptr<Container> container,
                                               std::weak_ptr<RunnerListener> listener,
                                               std::shared_ptr<Logger> logger) {
    return std::make_shared<TaskRunner>(PrivateTag{}, std::move(task), std::move(container),
                                        std::move(listener), std::move(logger));
}

TaskRunner::TaskRunner(PrivateTag,
                       std::shared_ptr<ITask> task,
                       std::shared_ptr<Container> container,
                       std::weak_ptr<RunnerListener> listener,
                       std::shared_ptr<Logger> logger)
    : task_(std::move(task))
    , task_id_(task_->id())
    , cadence_(task_->cadence())
    , container_(std::move(container))
    , listener_(std::move(listener))
    , logger_(std::move(logger)) {}

// ─────────────────────────────────────────────
// Scheduling
// ─────────────────────────────────────────────

Result<void> TaskRunner::schedule(IScheduler& scheduler) {
    {
        std::lock_guard lock(mutex_);
        if (state_ != RunnerState::Unscheduled) {
            logger_->warn("Task '" + task_id_ + "' is already " + std::string{to_string(state_)});
            return Error{ErrorCode::IllegalState,
                         "Task '" + task_id_ + "' cannot be scheduled twice"};
        }
    }

    if (!cadence_.valid()) {
        return fail_to_start(Error{ErrorCode::InvalidArgument,
            "Invalid cadence: initialDelay=" + std::to_string(cadence_.initial_delay.count()) +
            "ms, period=" + std::to_string(cadence_.period.count()) +
            "ms, runs=" + std::to_string(cadence_.run_count)});
    }

    if (auto r = invoke_hook([&] { return task_->before_start(*container_); }); !r) {
        return fail_to_start(Error{r.error().code, "before_start failed: " + r.error().message});
    }

    std::lock_guard lock(mutex_);
    if (state_ != RunnerState::Unscheduled) {
        return Error{ErrorCode::IllegalState, "Task '" + task_id_ + "' changed state while starting"};
    }

    // A zero initial delay may tick before this returns; the tick waits on
    // mutex_ until state_ and job_ are set.
    auto self = shared_from_this();
    auto job = scheduler.schedule_periodic(cadence_.initial_delay, cadence_.period,
                                           [self](std::stop_token stop) { self->tick(stop); });
    if (!job) {
        // Still under mutex_, so fail_to_start() cannot be used here.
        Error error{job.error().code, "Scheduling failed: " + job.error().message};
        state_ = RunnerState::FailedToStart;
        start_error_ = error.message;
        logger_->error("Task '" + task_id_ + "' failed to start: " + error.message);
        report_failure("Task '" + task_->display_name() + "' failed to start", error.message);
        return error;
    }

    job_ = std::move(*job);
    state_ = RunnerState::Scheduled;
    logger_->debug("Task '" + task_id_ + "' scheduled: runs=" + std::to_string(cadence_.run_count) +
                   " period=" + std::to_string(cadence_.period.count()) + "ms");
    return {};
}

Result<void> TaskRunner::fail_to_start(Error error) {
    {
        std::lock_guard lock(mutex_);
        state_ = RunnerState::FailedToStart;
        start_error_ = error.message;
    }
    logger_->error("Task '" + task_id_ + "' failed to start: " + error.message);
    report_failure("Task '" + task_->display_name() + "' failed to start", error.message);
    return error;
}

void TaskRunner::report_failure(std::string title, std::string detail) {
    if (auto r = container_->record_failure(title, detail); !r) {
        logger_->error("Task '" + task_id_ + "': " + title + " (" + detail +
                       "), not added to the error log: " + r.error().message);
    }
}

// ─────────────────────────────────────────────
// Execution
// ─────────────────────────────────────────────

void TaskRunner::tick(std::stop_token stop) {
    {
        std::lock_guard lock(mutex_);
        if (state_ != RunnerState::Scheduled || finishing_) return;
        executing_ = true;
        executing_thread_ = std::this_thread::get_id();
    }

    int run = runs_.fetch_add(1) + 1;
    auto r = invoke_hook([&] { return task_->execute(*container_, run, stop); });
    if (!r) {
        logger_->warn("Task '" + task_id_ + "' run " + std::to_string(run) + " failed: " + r.error().message);
        report_failure("Run " + std::to_string(run) + " of task '" + task_->display_name() + "' failed",
                       r.error().message);
    }

    {
        std::lock_guard lock(mutex_);
        executing_ = false;
        executing_thread_ = std::thread::id{};
    }
    idle_cv_.notify_all();

    if (auto listener = listener_.lock()) {
        listener->on_run_finished(*this);
    }

    if (run >= cadence_.run_count) {
        cancel(false);
    }
}

bool TaskRunner::cancel(bool interrupt) {
    auto self = shared_from_this();
    JobHandle job;
    {
        std::lock_guard lock(mutex_);
        if (state_ != RunnerState::Scheduled || finishing_) return false;
        finishing_ = true;
        job = std::move(job_);
    }

    if (job) job->cancel(interrupt);
    await_idle();

    if (auto r = invoke_hook([&] { return task_->after_finish(*container_); }); !r) {
        logger_->warn("Task '" + task_id_ + "' after_finish failed: " + r.error().message);
        report_failure("Task '" + task_->display_name() + "' failed to finish cleanly",
                       r.error().message);
    }

    {
        std::lock_guard lock(mutex_);
        state_ = RunnerState::Finished;
    }
    logger_->debug("Task '" + task_id_ + "' finished after " + std::to_string(runs_.load()) + " runs");
    if (auto listener = listener_.lock()) {
        listener->on_task_finished(*this);
    }
    return true;
}

void TaskRunner::await_idle() {
    std::unique_lock lock(mutex_);
    // A run that finishes its own schedule calls cancel() from inside tick().
    if (!executing_ || executing_thread_ == std::this_thread::get_id()) return;
    if (!idle_cv_.wait_for(lock, DRAIN_TIMEOUT, [this] { return !executing_; })) {
        logger_->warn("Task '" + task_id_ + "' did not stop within " +
                      std::to_string(DRAIN_TIMEOUT.count()) + "ms; finishing without its last run");
    }
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

bool TaskRunner::is_running() const {
    std::lock_guard lock(mutex_);
    return state_ == RunnerState::Scheduled;
}

RunnerState TaskRunner::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

std::optional<std::string> TaskRunner::start_error() const {
    std::lock_guard lock(mutex_);
    return start_error_;
}

RunnerRecord TaskRunner::record() const {
    std::lock_guard lock(mutex_);
    return RunnerRecord{task_id_, task_->display_name(), cadence_, runs_.load(), state_, start_error_};
}

}  // namespace diagnostics_engine
