/**
 * @file session.cpp
 * @brief Session implementation.
 */

#include "session/session.hpp"

#include "core/time_utils.hpp"

#include <algorithm>
#include <set>
#include <system_error>

namespace diagnostics_engine {

namespace {

std::string generate_session_name(Timestamp created_at) {
    return std::string{Session::NAME_PREFIX} + "-" + process_id() + "-" +
           format_file_timestamp(created_at) + "_" + random_alphanumeric(4);
}

}  // anonymous namespace

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

std::shared_ptr<Session> Session::create(std::string description,
                                         std::string user,
                                         SessionOptions options,
                                         std::shared_ptr<IScheduler> scheduler,
                                         std::shared_ptr<Logger> logger,
                                         std::weak_ptr<SessionListener> listener) {
    auto created_at = std::chrono::system_clock::now();
    return std::make_shared<Session>(
        ConstructionTag{}, generate_uuid(), generate_session_name(created_at), std::move(description),
        std::move(user), created_at, std::move(options), std::move(scheduler),
        std::move(logger), std::move(listener), false);
}

std::shared_ptr<Session> Session::rehydrate(const SessionRecord& record,
                                            SessionOptions options,
                                            std::shared_ptr<IScheduler> scheduler,
                                            std::shared_ptr<Logger> logger,
                                            std::weak_ptr<SessionListener> listener) {
    auto session = std::make_shared<Session>(
        ConstructionTag{}, record.id, record.name, record.description, record.user, record.created_at,
        std::move(options), std::move(scheduler), std::move(logger), std::move(listener), true);

    {
        std::lock_guard lock(session->mutex_);
        session->status_ = record.status.value_or(SessionStatus::None);
        session->started_at_ = record.started_at;
        session->ended_at_ = record.ended_at;
        session->started_ = true;
        session->scheduling_done_ = true;
        session->finishing_ = is_terminal(session->status_);
        session->restored_runners_ = record.runners;
        for (const auto& runner : record.runners) {
            session->task_order_.push_back(runner.task_id);
        }
    }

    if (!record.status || *record.status == SessionStatus::Running) {
        session->recover(!record.status.has_value());
    }
    return session;
}

Session::Session(ConstructionTag,
                 SessionId id,
                 std::string name,
                 std::string description,
                 std::string user,
                 Timestamp created_at,
                 SessionOptions options,
                 std::shared_ptr<IScheduler> scheduler,
                 std::shared_ptr<Logger> logger,
                 std::weak_ptr<SessionListener> listener,
                 bool detached)
    : id_(std::move(id))
    , name_(std::move(name))
    , description_(std::move(description))
    , user_(std::move(user))
    , created_at_(created_at)
    , options_(std::move(options))
    , scheduler_(std::move(scheduler))
    , logger_(std::move(logger))
    , listener_(std::move(listener))
    , root_(detached ? Container::create_detached(name_, options_.working_root / name_)
                     : Container::create_root(name_, options_.working_root / name_))
    , archiver_(logger_) {}

Session::~Session() {
    JobHandle watchdog;
    {
        std::lock_guard lock(mutex_);
        watchdog = std::move(watchdog_);
    }
    if (watchdog) watchdog->cancel(false);
    for (auto& runner : runner_snapshot()) {
        runner->cancel(true);
    }
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<void> Session::run(const std::vector<std::shared_ptr<ITask>>& tasks) {
    std::set<TaskId> seen;
    for (const auto& task : tasks) {
        if (!task) {
            return Error{ErrorCode::InvalidArgument, "Null task given to session " + name_};
        }
        if (!seen.insert(task->id()).second) {
            return Error{ErrorCode::InvalidArgument, "Duplicate task '" + task->id() + "'"};
        }
    }

    {
        std::lock_guard lock(mutex_);
        if (started_ || status_ != SessionStatus::None) {
            return Error{ErrorCode::IllegalState, "Session " + name_ + " was already run"};
        }
        started_ = true;
        status_ = SessionStatus::Running;
        started_at_ = std::chrono::system_clock::now();
    }
    logger_->info("Session " + name_ + " started with " + std::to_string(tasks.size()) + " tasks");

    std::error_code ec;
    std::filesystem::create_directories(root_->folder(), ec);
    if (ec) {
        logger_->warn("Cannot create working directory " + root_->folder().string() + ": " + ec.message());
    }

    std::vector<std::shared_ptr<TaskRunner>> runners;
    for (const auto& task : tasks) {
        if (!task->enabled()) {
            logger_->warn("Session " + name_ + " skips disabled task '" + task->id() + "'");
            if (auto r = root_->record_failure("Task '" + task->display_name() + "' is disabled",
                                               "The task was requested but is disabled; it was not scheduled.");
                !r) {
                logger_->warn("Failure of task '" + task->id() + "' not recorded: " + r.error().message);
            }
            continue;
        }
        auto folder = task->file_name().empty() ? task->id() : task->file_name();
        auto child = root_->create_child(task->display_name(), folder);
        if (!child) {
            logger_->error("Cannot create container for task '" + task->id() + "': " + child.error().message);
            if (auto r = root_->record_failure("Task '" + task->display_name() + "' could not be prepared",
                                               child.error().message); !r) {
                logger_->warn("Failure of task '" + task->id() + "' not recorded: " + r.error().message);
            }
            continue;
        }
        auto runner = TaskRunner::create(task, *child, weak_from_this(), logger_);
        runners.push_back(runner);

        std::lock_guard lock(mutex_);
        runners_.emplace(task->id(), runner);
        task_order_.push_back(task->id());
    }

    if (tasks.empty()) {
        {
            std::lock_guard lock(mutex_);
            scheduling_done_ = true;
            finishing_ = true;
        }
        finalize(SessionStatus::Succeeded);
        return {};
    }

    // The watchdog goes first so that a finish always finds its handle.
    std::weak_ptr<Session> weak_self = weak_from_this();
    auto watchdog = scheduler_->schedule_periodic(
        options_.watchdog_interval, options_.watchdog_interval,
        [weak_self](std::stop_token) {
            if (auto self = weak_self.lock()) self->check_completion(true);
        });
    if (watchdog) {
        std::lock_guard lock(mutex_);
        watchdog_ = std::move(*watchdog);
    } else {
        logger_->error("Session " + name_ + " runs without watchdog: " + watchdog.error().message);
    }

    bool cancelled_meanwhile = false;
    for (auto& runner : runners) {
        {
            std::lock_guard lock(mutex_);
            cancelled_meanwhile = finishing_;
        }
        if (cancelled_meanwhile) break;
        // The runner logs and records its own start failure.
        if (auto r = runner->schedule(*scheduler_); !r) {
            logger_->debug("Session " + name_ + " continues without task '" + runner->task_id() + "'");
        }
    }

    {
        std::lock_guard lock(mutex_);
        scheduling_done_ = true;
        cancelled_meanwhile = finishing_;
    }
    if (cancelled_meanwhile) {
        for (auto& runner : runners) runner->cancel(true);
        return {};
    }

    check_completion(false);
    return {};
}

Result<void> Session::cancel() {
    {
        std::lock_guard lock(mutex_);
        if (status_ != SessionStatus::Running || finishing_) {
            return Error{ErrorCode::IllegalState,
                         "Session " + name_ + " is " + std::string{to_string(status_)} + ", not running"};
        }
        finishing_ = true;
    }

    logger_->info("Cancelling session " + name_);
    for (auto& runner : runner_snapshot()) {
        runner->cancel(true);
    }
    finalize(SessionStatus::Cancelled);
    return {};
}

Result<void> Session::remove() {
    {
        std::lock_guard lock(mutex_);
        if (!is_terminal(status_)) {
            return Error{ErrorCode::IllegalState,
                         "Session " + name_ + " is " + std::string{to_string(status_)} +
                         "; only finished sessions can be deleted"};
        }
    }

    std::error_code ec;
    std::filesystem::remove(archive_path(), ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot delete " + archive_path().string() + ": " + ec.message()};
    }
    std::filesystem::remove_all(working_directory(), ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot delete " + working_directory().string() + ": " + ec.message()};
    }
    logger_->info("Deleted session " + name_);
    return {};
}

// ─────────────────────────────────────────────
// Completion
// ─────────────────────────────────────────────

void Session::check_completion(bool from_watchdog) {
    {
        std::lock_guard lock(mutex_);
        if (status_ != SessionStatus::Running || finishing_ || !scheduling_done_) return;
    }
    auto runners = runner_snapshot();

    bool any_running = std::any_of(runners.begin(), runners.end(),
                                   [](const auto& r) { return r->is_running(); });
    if (any_running) return;

    {
        std::lock_guard lock(mutex_);
        if (status_ != SessionStatus::Running || finishing_) return;
        finishing_ = true;
    }
    if (from_watchdog) {
        logger_->warn("Session " + name_ + " has no running task left; finished by watchdog");
    }
    finalize(SessionStatus::Succeeded);
}

void Session::finalize(SessionStatus target) {
    JobHandle watchdog;
    {
        std::lock_guard lock(mutex_);
        watchdog = std::move(watchdog_);
        ended_at_ = std::chrono::system_clock::now();
    }
    if (watchdog) watchdog->cancel(false);

    auto archived = archiver_.archive(*root_, archive_path());
    auto final_status = target;
    if (!archived) {
        logger_->error("Session " + name_ + " could not be archived, keeping " +
                       working_directory().string() + ": " + archived.error().message);
        final_status = SessionStatus::Failed;
    }

    {
        std::lock_guard lock(mutex_);
        status_ = final_status;
    }
    logger_->info("Session " + name_ + " " + std::string{to_string(final_status)} +
                  " after " + run_time());

    if (auto listener = listener_.lock()) {
        listener->on_session_finished(*this);
    }
}

void Session::recover(bool status_missing) {
    {
        std::lock_guard lock(mutex_);
        status_ = SessionStatus::Failed;
        finishing_ = true;
        if (!ended_at_) ended_at_ = std::chrono::system_clock::now();
    }

    std::error_code ec;
    if (status_missing && std::filesystem::exists(archive_path(), ec)) {
        logger_->warn("Session " + name_ + " has no saved status but was archived; marked FAILED");
        return;
    }
    if (!std::filesystem::is_directory(working_directory(), ec)) {
        logger_->warn("Session " + name_ + " was interrupted and left no files; marked FAILED");
        return;
    }

    logger_->warn("Session " + name_ + " was interrupted; packing " + working_directory().string());
    auto archived = archiver_.archive_directory(working_directory(), archive_path());
    if (!archived) {
        logger_->error("Recovery bundle for " + name_ + " failed: " + archived.error().message);
    }
}

// ─────────────────────────────────────────────
// RunnerListener
// ─────────────────────────────────────────────

void Session::on_run_finished(TaskRunner& runner) {
    if (auto listener = listener_.lock()) {
        listener->on_run_finished(*this, runner);
    }
}

void Session::on_task_finished(TaskRunner& runner) {
    if (auto listener = listener_.lock()) {
        listener->on_task_finished(*this, runner);
    }
    check_completion(false);
}

// ─────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────

SessionStatus Session::status() const {
    std::lock_guard lock(mutex_);
    return status_;
}

std::optional<Timestamp> Session::started_at() const {
    std::lock_guard lock(mutex_);
    return started_at_;
}

std::optional<Timestamp> Session::ended_at() const {
    std::lock_guard lock(mutex_);
    return ended_at_;
}

std::string Session::run_time() const {
    std::lock_guard lock(mutex_);
    if (!started_at_) return {};
    auto end = ended_at_.value_or(std::chrono::system_clock::now());
    return format_time_span(std::chrono::duration_cast<Millis>(end - *started_at_));
}

bool Session::is_download_ready() const {
    auto s = status();
    return s == SessionStatus::Succeeded || s == SessionStatus::Cancelled;
}

std::filesystem::path Session::working_directory() const {
    return root_->folder();
}

std::filesystem::path Session::archive_path() const {
    return options_.working_root / (name_ + ARCHIVE_EXTENSION);
}

std::shared_ptr<TaskRunner> Session::runner(const TaskId& task_id) const {
    std::lock_guard lock(mutex_);
    auto it = runners_.find(task_id);
    return it == runners_.end() ? nullptr : it->second;
}

bool Session::is_task_running(const TaskId& task_id) const {
    auto r = runner(task_id);
    return r && r->is_running();
}

std::vector<TaskId> Session::task_ids() const {
    std::lock_guard lock(mutex_);
    return task_order_;
}

std::vector<std::shared_ptr<TaskRunner>> Session::runner_snapshot() const {
    std::lock_guard lock(mutex_);
    std::vector<std::shared_ptr<TaskRunner>> out;
    out.reserve(task_order_.size());
    for (const auto& id : task_order_) {
        auto it = runners_.find(id);
        if (it != runners_.end()) out.push_back(it->second);
    }
    return out;
}

SessionRecord Session::record() const {
    SessionRecord out;
    out.id = id_;
    out.name = name_;
    out.description = description_;
    out.user = user_;
    out.created_at = created_at_;

    auto runners = runner_snapshot();
    {
        std::lock_guard lock(mutex_);
        out.status = status_;
        out.started_at = started_at_;
        out.ended_at = ended_at_;
        if (runners.empty()) out.runners = restored_runners_;
    }
    for (const auto& runner : runners) {
        out.runners.push_back(runner->record());
    }
    return out;
}

}  // namespace diagnostics_engine
