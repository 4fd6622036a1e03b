/**
 * @file pool_manager.hpp
 * @brief Owner of the engine's shared worker pool.
 */

#pragma once

#include "core/config.hpp"
#include "core/logger.hpp"
#include "executor/worker_pool.hpp"

#include <cstddef>
#include <memory>
#include <mutex>

namespace diagnostics_engine {

/**
 * @brief Lazily builds the one ScheduledWorkerPool every session and runner
 *        of the engine shares.
 *
 * Constructed once at start-up and handed to the components that need it.
 * After shutdown() the next get() builds a fresh pool.
 */
class WorkerPoolManager {
public:
    static constexpr std::size_t DEFAULT_CORE_SIZE = 10;
    static constexpr Millis DEFAULT_KEEP_ALIVE{5000};

    explicit WorkerPoolManager(std::shared_ptr<Logger> logger,
                               std::size_t core_size = DEFAULT_CORE_SIZE,
                               Millis keep_alive = DEFAULT_KEEP_ALIVE);
    WorkerPoolManager(const PoolConfig& config, std::shared_ptr<Logger> logger);
    ~WorkerPoolManager();

    WorkerPoolManager(const WorkerPoolManager&) = delete;
    WorkerPoolManager& operator=(const WorkerPoolManager&) = delete;

    [[nodiscard]] std::shared_ptr<ScheduledWorkerPool> get();

    /// Also applied to the live pool, if there is one.
    Result<void> set_core_size(std::size_t core_size);
    [[nodiscard]] std::size_t core_size() const;

    void shutdown();
    [[nodiscard]] bool has_pool() const;

private:
    std::shared_ptr<Logger> logger_;
    std::size_t core_size_;
    Millis keep_alive_;

    mutable std::mutex mutex_;
    std::shared_ptr<ScheduledWorkerPool> pool_;
};

}  // namespace diagnostics_engine
