/**
 * @file scheduler.hpp
 * @brief Delayed and periodic job scheduling abstraction.
 *
 * Sessions and runners only see IScheduler; the process-wide
 * ScheduledWorkerPool is one implementation of it.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <functional>
#include <memory>
#include <stop_token>

namespace diagnostics_engine {

/// Job body. The token is signalled when the job is cancelled with
/// interruption or when the scheduler shuts down.
using JobFunction = std::function<void(std::stop_token)>;

/**
 * @brief Handle to a job submitted to an IScheduler.
 */
class ScheduledJob {
public:
    virtual ~ScheduledJob() = default;

    /**
     * @brief Remove the job from the schedule.
     *
     * A queued run is dropped immediately. A run already in progress
     * completes unless interrupt is set, in which case its stop token is
     * signalled.
     *
     * @return true if this call cancelled the job, false if it was already
     *         cancelled or done.
     */
    virtual bool cancel(bool interrupt) = 0;

    [[nodiscard]] virtual bool is_cancelled() const = 0;

    /// True once the job will never run again.
    [[nodiscard]] virtual bool is_done() const = 0;
};

using JobHandle = std::shared_ptr<ScheduledJob>;

/**
 * @brief Abstract scheduler interface.
 */
class IScheduler {
public:
    virtual ~IScheduler() = default;

    /// Run fn once after delay.
    virtual Result<JobHandle> schedule_once(Millis delay, JobFunction fn) = 0;

    /**
     * @brief Run fn at a fixed rate: first after initial_delay, then every
     *        period measured from the previous scheduled start. A run never
     *        overlaps the previous run of the same job.
     */
    virtual Result<JobHandle> schedule_periodic(Millis initial_delay,
                                                Millis period,
                                                JobFunction fn) = 0;
};

}  // namespace diagnostics_engine
