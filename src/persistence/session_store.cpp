/**
 * @file session_store.cpp
 * @brief SessionStore implementation.
 */

#include "persistence/session_store.hpp"

#include <algorithm>

namespace diagnostics_engine {

std::shared_ptr<SessionStore> SessionStore::create(Config config,
                                                   std::shared_ptr<WorkerPoolManager> pools,
                                                   std::shared_ptr<Logger> logger) {
    return std::make_shared<SessionStore>(PrivateTag{}, std::move(config), std::move(pools),
                                          std::move(logger));
}

SessionStore::SessionStore(PrivateTag,
                           Config config,
                           std::shared_ptr<WorkerPoolManager> pools,
                           std::shared_ptr<Logger> logger)
    : config_(std::move(config))
    , pools_(std::move(pools))
    , logger_(std::move(logger)) {}

SessionOptions SessionStore::session_options() const {
    return SessionOptions{config_.engine.working_root,
                          Millis{config_.engine.watchdog_interval_ms}};
}

// ─────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────

Result<std::size_t> SessionStore::load() {
    auto records = load_records(state_file());
    if (!records) {
        logger_->error("Could not load sessions from " + state_file().string() + ": " +
                       records.error().message);
        return records.error();
    }

    std::vector<std::shared_ptr<Session>> loaded;
    bool recovered = false;
    for (const auto& record : *records) {
        auto session = Session::rehydrate(record, session_options(), pools_->get(),
                                          logger_, weak_from_this());
        if (record.status != session->status()) recovered = true;
        loaded.push_back(std::move(session));
    }

    {
        std::unique_lock lock(mutex_);
        sessions_.clear();
        for (auto& session : loaded) {
            sessions_.emplace(session->id(), session);
        }
    }
    logger_->info("Loaded " + std::to_string(loaded.size()) + " sessions from " + state_file().string());

    if (recovered) {
        if (auto r = save(); !r) return r.error();
    }
    return loaded.size();
}

// ─────────────────────────────────────────────
// Registry
// ─────────────────────────────────────────────

Result<std::shared_ptr<Session>> SessionStore::create_session(std::string description, std::string user) {
    if (user.empty()) user = config_.engine.default_user;
    auto session = Session::create(std::move(description), std::move(user), session_options(),
                                   pools_->get(), logger_, weak_from_this());
    if (auto r = add(session); !r) return r.error();
    return session;
}

Result<void> SessionStore::add(std::shared_ptr<Session> session) {
    if (!session) {
        return Error{ErrorCode::InvalidArgument, "Null session"};
    }
    {
        std::unique_lock lock(mutex_);
        if (sessions_.contains(session->id())) {
            return Error{ErrorCode::InvalidArgument, "Session " + session->id() + " already exists"};
        }
        sessions_.emplace(session->id(), session);
        dirty_ = true;
    }
    return save();
}

std::shared_ptr<Session> SessionStore::get(const SessionId& id) const {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Session>> SessionStore::list() const {
    std::vector<std::shared_ptr<Session>> out;
    {
        std::shared_lock lock(mutex_);
        out.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) out.push_back(session);
    }

    std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        auto sa = a->started_at();
        auto sb = b->started_at();
        if (sa && sb) return *sa < *sb;
        return sa.has_value() && !sb.has_value();
    });
    return out;
}

bool SessionStore::is_any_running() const {
    std::shared_lock lock(mutex_);
    return std::any_of(sessions_.begin(), sessions_.end(),
                       [](const auto& entry) { return entry.second->is_running(); });
}

Result<void> SessionStore::remove(const SessionId& id) {
    std::shared_ptr<Session> session;
    {
        std::unique_lock lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return Error{ErrorCode::NotFound, "No session with id " + id};
        }
        if (it->second->is_running()) {
            return Error{ErrorCode::IllegalState,
                         "Cannot delete session " + it->second->name() + " while it is running; cancel it first"};
        }
        session = it->second;
        sessions_.erase(it);
        dirty_ = true;
    }

    // A session that never ran has no files.
    if (session->status() != SessionStatus::None) {
        if (auto r = session->remove(); !r) {
            logger_->warn(r.error().message);
            return r;
        }
    }
    return save();
}

void SessionStore::cancel_all() {
    for (const auto& session : list()) {
        if (!session->is_running()) continue;
        if (auto r = session->cancel(); !r) {
            logger_->debug("Session " + session->name() + " not cancelled: " + r.error().message);
        }
    }
}

// ─────────────────────────────────────────────
// Persistence
// ─────────────────────────────────────────────

Result<void> SessionStore::save() {
    std::vector<std::shared_ptr<Session>> sessions;
    {
        std::unique_lock lock(mutex_);
        dirty_ = false;
        last_save_ = std::chrono::steady_clock::now();
        for (const auto& [id, session] : sessions_) sessions.push_back(session);
    }

    std::vector<SessionRecord> records;
    records.reserve(sessions.size());
    for (const auto& session : sessions) records.push_back(session->record());
    std::sort(records.begin(), records.end(),
              [](const SessionRecord& a, const SessionRecord& b) { return a.created_at < b.created_at; });

    std::lock_guard file_lock(file_mutex_);
    auto r = save_records(state_file(), records);
    if (!r) {
        logger_->warn("Could not save sessions: " + r.error().message);
        return r;
    }
    save_count_.fetch_add(1);
    return {};
}

void SessionStore::lazy_save() {
    bool due = false;
    {
        std::unique_lock lock(mutex_);
        dirty_ = true;
        auto since = std::chrono::steady_clock::now() - last_save_;
        due = since > Millis{config_.persistence.lazy_save_min_delay_ms};
    }
    if (due && !save()) {
        logger_->debug("Lazy save failed; the next event retries");
    }
}

bool SessionStore::is_dirty() const {
    std::shared_lock lock(mutex_);
    return dirty_;
}

void SessionStore::on_run_finished(Session& /*session*/, TaskRunner& /*runner*/) {
    lazy_save();
}

void SessionStore::on_task_finished(Session& /*session*/, TaskRunner& /*runner*/) {
    lazy_save();
}

void SessionStore::on_session_finished(Session& session) {
    logger_->debug("Saving after session " + session.name() + " finished");
    if (auto r = save(); !r) {
        logger_->error("Final state of session " + session.name() + " was not saved");
    }
}

}  // namespace diagnostics_engine
