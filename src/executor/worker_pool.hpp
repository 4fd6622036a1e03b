/**
 * @file worker_pool.hpp
 * @brief std::jthread-based scheduled worker pool with idle eviction.
 */

#pragma once

#include "core/logger.hpp"
#include "executor/scheduler.hpp"

#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace diagnostics_engine {

namespace detail {
struct JobState;
class PoolJob;
}  // namespace detail

/**
 * @brief Delay-ordered job queue served by up to core_size jthreads.
 *
 * Workers are started on demand when work is submitted and exit after
 * keep_alive without queued work, so an unused pool holds no threads.
 * Cancelled jobs leave the queue at once.
 *
 * Always owned through std::shared_ptr; job handles keep only a weak
 * reference to the pool.
 */
class ScheduledWorkerPool : public IScheduler,
                            public std::enable_shared_from_this<ScheduledWorkerPool> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static std::shared_ptr<ScheduledWorkerPool> create(std::size_t core_size,
                                                       Millis keep_alive,
                                                       std::shared_ptr<Logger> logger);
    ScheduledWorkerPool(PrivateTag, std::size_t core_size, Millis keep_alive,
                        std::shared_ptr<Logger> logger);
    ~ScheduledWorkerPool() override;

    ScheduledWorkerPool(const ScheduledWorkerPool&) = delete;
    ScheduledWorkerPool& operator=(const ScheduledWorkerPool&) = delete;

    Result<JobHandle> schedule_once(Millis delay, JobFunction fn) override;
    Result<JobHandle> schedule_periodic(Millis initial_delay,
                                        Millis period,
                                        JobFunction fn) override;

    /// Takes effect immediately: extra workers are started for queued work,
    /// surplus workers exit once idle.
    Result<void> set_core_size(std::size_t core_size);

    /**
     * @brief Cancel every queued job, interrupt running ones and stop the
     *        workers. Further submissions are rejected.
     */
    void shutdown();

    [[nodiscard]] bool is_shutdown() const;
    [[nodiscard]] std::size_t core_size() const;
    [[nodiscard]] std::size_t worker_count() const;
    [[nodiscard]] std::size_t queued_count() const;
    [[nodiscard]] std::size_t active_count() const;

private:
    friend class detail::PoolJob;

    using Clock = std::chrono::steady_clock;
    using QueueKey = std::pair<SteadyTime, uint64_t>;

    Result<JobHandle> enqueue(Millis delay, Millis period, JobFunction fn);
    bool cancel_job(const std::shared_ptr<detail::JobState>& job, bool interrupt);
    bool run_job(detail::JobState& job, std::stop_token token);

    void worker_loop(std::stop_token stop, uint64_t worker_id);
    void spawn_worker_locked();
    void retire_worker_locked(uint64_t worker_id);
    void reap_retired_locked();

    std::size_t core_size_;
    Millis keep_alive_;
    std::shared_ptr<Logger> logger_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::map<QueueKey, std::shared_ptr<detail::JobState>> queue_;
    std::unordered_map<uint64_t, std::shared_ptr<detail::JobState>> running_;
    std::unordered_map<uint64_t, std::jthread> workers_;
    std::vector<std::jthread> retired_;
    uint64_t next_job_id_{1};
    uint64_t next_seq_{0};
    uint64_t next_worker_id_{0};
    uint64_t generation_{0};
    bool shutdown_{false};
};

}  // namespace diagnostics_engine
