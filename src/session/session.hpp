/**
 * @file session.hpp
 * @brief One diagnostic run: schedules its tasks, detects completion and
 *        archives the results.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "core/types.hpp"
#include "executor/scheduler.hpp"
#include "persistence/session_record.hpp"
#include "session/archiver.hpp"
#include "session/container.hpp"
#include "session/task.hpp"
#include "session/task_runner.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace diagnostics_engine {

class Session;

/**
 * @brief Observer of session progress. Callbacks run on pool threads, or on
 *        the thread that called cancel().
 */
class SessionListener {
public:
    virtual ~SessionListener() = default;

    virtual void on_run_finished(Session& /*session*/, TaskRunner& /*runner*/) {}
    virtual void on_task_finished(Session& /*session*/, TaskRunner& /*runner*/) {}

    /// Exactly once per session, after the archive attempt.
    virtual void on_session_finished(Session& /*session*/) {}
};

struct SessionOptions {
    std::filesystem::path working_root = "./diagnostics";
    Millis watchdog_interval{500};
};

/**
 * @brief Session lifecycle: NONE → RUNNING → SUCCEEDED | CANCELLED | FAILED.
 *
 * Completion is detected twice over: every "task finished" notification
 * re-scans the runners, and a watchdog job re-scans on a timer in case a
 * notification never arrives. Whichever path first sees no running task
 * claims the finish under the session mutex and archives; the other backs
 * off. Status stays RUNNING until the archive attempt is over.
 */
class Session : public RunnerListener, public std::enable_shared_from_this<Session> {
protected:
    /// Nameable only by Session and its subclasses.
    struct ConstructionTag {
        explicit ConstructionTag() = default;
    };

public:
    static constexpr const char* NAME_PREFIX = "diagnosticsSession";
    static constexpr const char* ARCHIVE_EXTENSION = ".tar.zst";

    static std::shared_ptr<Session> create(std::string description,
                                           std::string user,
                                           SessionOptions options,
                                           std::shared_ptr<IScheduler> scheduler,
                                           std::shared_ptr<Logger> logger,
                                           std::weak_ptr<SessionListener> listener = {});

    /**
     * @brief Rebuild a session from its persisted record.
     *
     * The result has a detached container and no live runners. A record
     * left RUNNING by a crash is marked FAILED; its working directory,
     * if still present, is packed with ContainerArchiver::archive_directory.
     * A record without status whose archive already exists is only marked
     * FAILED.
     */
    static std::shared_ptr<Session> rehydrate(const SessionRecord& record,
                                              SessionOptions options,
                                              std::shared_ptr<IScheduler> scheduler,
                                              std::shared_ptr<Logger> logger,
                                              std::weak_ptr<SessionListener> listener = {});

    Session(ConstructionTag,
            SessionId id,
            std::string name,
            std::string description,
            std::string user,
            Timestamp created_at,
            SessionOptions options,
            std::shared_ptr<IScheduler> scheduler,
            std::shared_ptr<Logger> logger,
            std::weak_ptr<SessionListener> listener,
            bool detached);
    ~Session() override;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Start the given tasks. Allowed once.
     *
     * An empty task list finishes at once with a manifest-only archive.
     * Duplicate task ids are rejected before anything changes. Disabled
     * tasks get no runner; each is reported in the bundle's error log.
     */
    Result<void> run(const std::vector<std::shared_ptr<ITask>>& tasks);

    /// Interrupt every task and archive what was produced so far.
    /// Only while RUNNING.
    Result<void> cancel();

    /// Delete the archive and the working directory. Only once terminal.
    Result<void> remove();

    // ── Queries ──────────────────────────────────

    [[nodiscard]] const SessionId& id() const noexcept { return id_; }
    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::string& description() const noexcept { return description_; }
    [[nodiscard]] const std::string& user() const noexcept { return user_; }
    [[nodiscard]] Timestamp created_at() const noexcept { return created_at_; }

    [[nodiscard]] SessionStatus status() const;
    [[nodiscard]] std::optional<Timestamp> started_at() const;
    [[nodiscard]] std::optional<Timestamp> ended_at() const;

    /// "1.2 sec", "3 min 4 sec"; empty before the session started.
    [[nodiscard]] std::string run_time() const;

    [[nodiscard]] bool is_running() const { return status() == SessionStatus::Running; }

    /// An archive exists for the operator to fetch.
    [[nodiscard]] bool is_download_ready() const;

    [[nodiscard]] std::filesystem::path working_directory() const;
    [[nodiscard]] std::filesystem::path archive_path() const;

    [[nodiscard]] std::shared_ptr<TaskRunner> runner(const TaskId& task_id) const;
    [[nodiscard]] bool is_task_running(const TaskId& task_id) const;
    [[nodiscard]] std::vector<TaskId> task_ids() const;

    [[nodiscard]] SessionRecord record() const;

    // ── RunnerListener ───────────────────────────

    void on_run_finished(TaskRunner& runner) override;
    void on_task_finished(TaskRunner& runner) override;

protected:
    /// Re-scan the runners and finish the session when none is running.
    void check_completion(bool from_watchdog);

private:
    /// Called by the thread that won the finish; archives and notifies.
    void finalize(SessionStatus target);
    void recover(bool status_missing);

    [[nodiscard]] std::vector<std::shared_ptr<TaskRunner>> runner_snapshot() const;

    const SessionId id_;
    const std::string name_;
    const std::string description_;
    const std::string user_;
    const Timestamp created_at_;
    const SessionOptions options_;

    std::shared_ptr<IScheduler> scheduler_;
    std::shared_ptr<Logger> logger_;
    std::weak_ptr<SessionListener> listener_;
    std::shared_ptr<Container> root_;
    ContainerArchiver archiver_;

    mutable std::mutex mutex_;
    SessionStatus status_{SessionStatus::None};
    std::optional<Timestamp> started_at_;
    std::optional<Timestamp> ended_at_;
    bool started_{false};           ///< run() was called
    bool scheduling_done_{false};   ///< every runner was submitted
    bool finishing_{false};         ///< a finish has been claimed
    std::map<TaskId, std::shared_ptr<TaskRunner>> runners_;
    std::vector<TaskId> task_order_;
    std::vector<RunnerRecord> restored_runners_;
    JobHandle watchdog_;
};

}  // namespace diagnostics_engine
