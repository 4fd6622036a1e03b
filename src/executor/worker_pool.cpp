/**
 * @file worker_pool.cpp
 * @brief ScheduledWorkerPool implementation.
 */

#include "executor/worker_pool.hpp"

#include <atomic>
#include <exception>

namespace diagnostics_engine {

namespace {

// Set on a worker thread whose pool was shut down from inside one of its own
// jobs. The worker is detached and must not touch the pool again.
thread_local bool t_worker_abandoned = false;

}  // anonymous namespace

namespace detail {

/// Guarded by the owning pool's mutex, except the two atomics which are
/// also read lock-free by handles.
struct JobState {
    uint64_t id{0};
    JobFunction fn;
    Millis period{0};                   ///< Zero for one-shot jobs
    SteadyTime next_run{};
    std::pair<SteadyTime, uint64_t> key{};
    bool queued{false};
    bool running{false};
    std::stop_source stop_source;
    std::atomic<bool> cancelled{false};
    std::atomic<bool> done{false};
};

class PoolJob : public ScheduledJob {
public:
    PoolJob(std::shared_ptr<JobState> state, std::weak_ptr<ScheduledWorkerPool> pool)
        : state_(std::move(state)), pool_(std::move(pool)) {}

    bool cancel(bool interrupt) override {
        if (auto pool = pool_.lock()) {
            return pool->cancel_job(state_, interrupt);
        }
        // Pool already gone: shutdown cancelled everything it held.
        return false;
    }

    [[nodiscard]] bool is_cancelled() const override { return state_->cancelled.load(); }
    [[nodiscard]] bool is_done() const override { return state_->done.load(); }

private:
    std::shared_ptr<JobState> state_;
    std::weak_ptr<ScheduledWorkerPool> pool_;
};

}  // namespace detail

// ─────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────

std::shared_ptr<ScheduledWorkerPool> ScheduledWorkerPool::create(std::size_t core_size,
                                                                 Millis keep_alive,
                                                                 std::shared_ptr<Logger> logger) {
    return std::make_shared<ScheduledWorkerPool>(PrivateTag{}, core_size, keep_alive, std::move(logger));
}

ScheduledWorkerPool::ScheduledWorkerPool(PrivateTag,
                                         std::size_t core_size,
                                         Millis keep_alive,
                                         std::shared_ptr<Logger> logger)
    : core_size_(core_size == 0 ? 1 : core_size)
    , keep_alive_(keep_alive)
    , logger_(std::move(logger)) {}

ScheduledWorkerPool::~ScheduledWorkerPool() {
    shutdown();

    std::vector<std::jthread> retired;
    {
        std::lock_guard lock(mutex_);
        retired = std::move(retired_);
    }
    // jthreads join on destruction
}

// ─────────────────────────────────────────────
// Submission
// ─────────────────────────────────────────────

Result<JobHandle> ScheduledWorkerPool::schedule_once(Millis delay, JobFunction fn) {
    return enqueue(delay, Millis{0}, std::move(fn));
}

Result<JobHandle> ScheduledWorkerPool::schedule_periodic(Millis initial_delay,
                                                         Millis period,
                                                         JobFunction fn) {
    if (period.count() <= 0) {
        return Error{ErrorCode::InvalidArgument,
                     "Period must be positive, got " + std::to_string(period.count()) + " ms"};
    }
    return enqueue(initial_delay, period, std::move(fn));
}

Result<JobHandle> ScheduledWorkerPool::enqueue(Millis delay, Millis period, JobFunction fn) {
    if (!fn) {
        return Error{ErrorCode::InvalidArgument, "Job function is empty"};
    }
    if (delay.count() < 0) delay = Millis{0};

    auto job = std::make_shared<detail::JobState>();
    job->fn = std::move(fn);
    job->period = period;

    {
        std::lock_guard lock(mutex_);
        if (shutdown_) {
            return Error{ErrorCode::Rejected, "Worker pool is shut down"};
        }
        job->id = next_job_id_++;
        job->next_run = Clock::now() + delay;
        job->key = {job->next_run, next_seq_++};
        job->queued = true;
        queue_.emplace(job->key, job);
        ++generation_;
        spawn_worker_locked();
    }
    cv_.notify_one();

    JobHandle handle = std::make_shared<detail::PoolJob>(job, weak_from_this());
    return handle;
}

bool ScheduledWorkerPool::cancel_job(const std::shared_ptr<detail::JobState>& job, bool interrupt) {
    JobFunction dropped;  // destroyed after the lock is released
    {
        std::lock_guard lock(mutex_);
        if (job->cancelled.load() || job->done.load()) return false;
        job->cancelled.store(true);

        if (job->queued) {
            queue_.erase(job->key);
            job->queued = false;
            job->done.store(true);
            dropped = std::move(job->fn);
            ++generation_;
        } else if (job->running && interrupt) {
            job->stop_source.request_stop();
        }
    }
    cv_.notify_all();
    return true;
}

// ─────────────────────────────────────────────
// Configuration / Lifecycle
// ─────────────────────────────────────────────

Result<void> ScheduledWorkerPool::set_core_size(std::size_t core_size) {
    if (core_size == 0) {
        return Error{ErrorCode::InvalidArgument, "Core pool size must be at least 1"};
    }
    {
        std::lock_guard lock(mutex_);
        core_size_ = core_size;
        ++generation_;
        while (!shutdown_ && workers_.size() < core_size_
               && workers_.size() < queue_.size() + running_.size()) {
            spawn_worker_locked();
        }
    }
    cv_.notify_all();
    logger_->debug("Worker pool core size set to " + std::to_string(core_size));
    return {};
}

void ScheduledWorkerPool::shutdown() {
    std::vector<std::shared_ptr<detail::JobState>> dropped;
    std::unordered_map<uint64_t, std::jthread> workers;
    std::vector<std::jthread> retired;
    {
        std::lock_guard lock(mutex_);
        if (shutdown_) return;
        shutdown_ = true;

        for (auto& [key, job] : queue_) {
            job->queued = false;
            job->cancelled.store(true);
            job->done.store(true);
            dropped.push_back(job);
        }
        queue_.clear();

        for (auto& [id, job] : running_) {
            job->cancelled.store(true);
            job->stop_source.request_stop();
        }

        workers = std::move(workers_);
        workers_.clear();
        retired = std::move(retired_);
        retired_.clear();
        ++generation_;
    }
    cv_.notify_all();

    for (auto& job : dropped) {
        job->fn = nullptr;
    }
    dropped.clear();

    const auto self_id = std::this_thread::get_id();
    for (auto& [id, worker] : workers) {
        worker.request_stop();
        if (worker.get_id() == self_id) {
            worker.detach();
            t_worker_abandoned = true;
        }
    }
    workers.clear();    // joins the rest
    retired.clear();
}

bool ScheduledWorkerPool::is_shutdown() const {
    std::lock_guard lock(mutex_);
    return shutdown_;
}

std::size_t ScheduledWorkerPool::core_size() const {
    std::lock_guard lock(mutex_);
    return core_size_;
}

std::size_t ScheduledWorkerPool::worker_count() const {
    std::lock_guard lock(mutex_);
    return workers_.size();
}

std::size_t ScheduledWorkerPool::queued_count() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

std::size_t ScheduledWorkerPool::active_count() const {
    std::lock_guard lock(mutex_);
    return running_.size();
}

// ─────────────────────────────────────────────
// Workers
// ─────────────────────────────────────────────

void ScheduledWorkerPool::spawn_worker_locked() {
    reap_retired_locked();
    if (shutdown_ || workers_.size() >= core_size_) return;

    uint64_t worker_id = next_worker_id_++;
    workers_.emplace(worker_id, std::jthread([this, worker_id](std::stop_token stop) {
        worker_loop(stop, worker_id);
    }));
}

void ScheduledWorkerPool::retire_worker_locked(uint64_t worker_id) {
    auto it = workers_.find(worker_id);
    if (it == workers_.end()) return;
    retired_.push_back(std::move(it->second));
    workers_.erase(it);
}

void ScheduledWorkerPool::reap_retired_locked() {
    // A retired worker released the mutex on its way out, so joining it
    // here cannot deadlock.
    retired_.clear();
}

bool ScheduledWorkerPool::run_job(detail::JobState& job, std::stop_token token) {
    try {
        job.fn(token);
        return true;
    } catch (const std::exception& e) {
        logger_->error("Scheduled job " + std::to_string(job.id) + " failed: " + e.what());
    } catch (...) {
        logger_->error("Scheduled job " + std::to_string(job.id) + " failed with a non-standard exception");
    }
    return false;
}

void ScheduledWorkerPool::worker_loop(std::stop_token stop, uint64_t worker_id) {
    std::unique_lock lock(mutex_);
    while (!stop.stop_requested()) {
        if (workers_.size() > core_size_) {
            retire_worker_locked(worker_id);
            return;
        }

        if (queue_.empty()) {
            auto seen = generation_;
            bool woken = cv_.wait_for(lock, stop, keep_alive_,
                                      [&] { return generation_ != seen; });
            if (stop.stop_requested()) return;
            if (!woken && queue_.empty()) {
                retire_worker_locked(worker_id);
                return;
            }
            continue;
        }

        auto head = queue_.begin();
        if (head->first.first > Clock::now()) {
            // Copied: cancel_job() may erase the head node while we wait.
            const auto deadline = head->first.first;
            auto seen = generation_;
            cv_.wait_until(lock, stop, deadline,
                           [&] { return generation_ != seen; });
            continue;
        }

        auto job = head->second;
        queue_.erase(head);
        job->queued = false;
        job->running = true;
        job->stop_source = std::stop_source{};
        auto token = job->stop_source.get_token();
        running_.emplace(job->id, job);
        ++generation_;

        auto self = weak_from_this().lock();
        lock.unlock();

        bool completed = run_job(*job, token);

        JobFunction finished;
        lock.lock();
        running_.erase(job->id);
        job->running = false;
        if (completed && job->period.count() > 0 && !job->cancelled.load() && !shutdown_) {
            job->next_run += job->period;
            job->key = {job->next_run, next_seq_++};
            job->queued = true;
            queue_.emplace(job->key, job);
            ++generation_;
        } else {
            job->done.store(true);
            finished = std::move(job->fn);
        }
        lock.unlock();

        finished = nullptr;
        job.reset();
        self.reset();
        if (t_worker_abandoned) return;

        lock.lock();
    }
}

}  // namespace diagnostics_engine
