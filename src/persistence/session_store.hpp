/**
 * @file session_store.hpp
 * @brief Owns every session of the process and keeps their records on disk.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/result.hpp"
#include "executor/pool_manager.hpp"
#include "session/session.hpp"

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

namespace diagnostics_engine {

/**
 * @brief Session registry persisted to `<working_root>/<state_file>`.
 *
 * Adding or removing a session and finishing one save at once. Per-run and
 * per-task progress only marks the store dirty and saves when the previous
 * save is older than lazy_save_min_delay_ms.
 */
class SessionStore : public SessionListener, public std::enable_shared_from_this<SessionStore> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static std::shared_ptr<SessionStore> create(Config config,
                                                std::shared_ptr<WorkerPoolManager> pools,
                                                std::shared_ptr<Logger> logger);

    SessionStore(PrivateTag, Config config, std::shared_ptr<WorkerPoolManager> pools,
                 std::shared_ptr<Logger> logger);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /**
     * @brief Read the state file and rehydrate every session in it,
     *        recovering the ones a crash left unfinished.
     *
     * @return the number of sessions loaded. A missing file loads nothing;
     *         an unreadable one is an error and leaves the store empty.
     */
    Result<std::size_t> load();

    /// Create a session reporting to this store, add it and save.
    Result<std::shared_ptr<Session>> create_session(std::string description, std::string user = {});

    Result<void> add(std::shared_ptr<Session> session);

    [[nodiscard]] std::shared_ptr<Session> get(const SessionId& id) const;

    /// Oldest start first; sessions never started come last.
    [[nodiscard]] std::vector<std::shared_ptr<Session>> list() const;

    [[nodiscard]] bool is_any_running() const;

    /// Forget the session and delete its files. Running sessions are refused.
    Result<void> remove(const SessionId& id);

    Result<void> save();

    /// Cancel every running session; used on shutdown.
    void cancel_all();

    [[nodiscard]] std::filesystem::path state_file() const { return config_.state_file_path(); }
    [[nodiscard]] uint64_t save_count() const noexcept { return save_count_.load(); }

    /// Progress not yet written to the state file.
    [[nodiscard]] bool is_dirty() const;

    // ── SessionListener ──────────────────────────

    void on_run_finished(Session& session, TaskRunner& runner) override;
    void on_task_finished(Session& session, TaskRunner& runner) override;
    void on_session_finished(Session& session) override;

private:
    [[nodiscard]] SessionOptions session_options() const;
    void lazy_save();

    Config config_;
    std::shared_ptr<WorkerPoolManager> pools_;
    std::shared_ptr<Logger> logger_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<SessionId, std::shared_ptr<Session>> sessions_;
    bool dirty_{false};
    SteadyTime last_save_{};

    std::mutex file_mutex_;     ///< Serializes writers of the state file
    std::atomic<uint64_t> save_count_{0};
};

}  // namespace diagnostics_engine
