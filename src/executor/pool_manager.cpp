/**
 * @file pool_manager.cpp
 * @brief WorkerPoolManager implementation.
 */

#include "executor/pool_manager.hpp"

namespace diagnostics_engine {

WorkerPoolManager::WorkerPoolManager(std::shared_ptr<Logger> logger,
                                     std::size_t core_size,
                                     Millis keep_alive)
    : logger_(std::move(logger))
    , core_size_(core_size == 0 ? DEFAULT_CORE_SIZE : core_size)
    , keep_alive_(keep_alive) {}

WorkerPoolManager::WorkerPoolManager(const PoolConfig& config, std::shared_ptr<Logger> logger)
    : WorkerPoolManager(std::move(logger), config.core_size, Millis{config.keep_alive_ms}) {}

WorkerPoolManager::~WorkerPoolManager() {
    shutdown();
}

std::shared_ptr<ScheduledWorkerPool> WorkerPoolManager::get() {
    std::lock_guard lock(mutex_);
    if (!pool_) {
        pool_ = ScheduledWorkerPool::create(core_size_, keep_alive_, logger_);
        logger_->debug("Worker pool created with core size " + std::to_string(core_size_));
    }
    return pool_;
}

Result<void> WorkerPoolManager::set_core_size(std::size_t core_size) {
    if (core_size == 0) {
        return Error{ErrorCode::InvalidArgument, "Core pool size must be at least 1"};
    }
    std::lock_guard lock(mutex_);
    core_size_ = core_size;
    if (pool_) {
        return pool_->set_core_size(core_size);
    }
    return {};
}

std::size_t WorkerPoolManager::core_size() const {
    std::lock_guard lock(mutex_);
    return core_size_;
}

void WorkerPoolManager::shutdown() {
    std::shared_ptr<ScheduledWorkerPool> pool;
    {
        std::lock_guard lock(mutex_);
        pool = std::move(pool_);
        pool_.reset();
    }
    if (pool) {
        pool->shutdown();
        logger_->debug("Worker pool shut down");
    }
}

bool WorkerPoolManager::has_pool() const {
    std::lock_guard lock(mutex_);
    return pool_ != nullptr;
}

}  // namespace diagnostics_engine
