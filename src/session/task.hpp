/**
 * @file task.hpp
 * @brief Contract between the engine and a pluggable diagnostic task.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <stop_token>
#include <string>

namespace diagnostics_engine {

class Container;

/**
 * @brief A unit of repeated diagnostic work with its own cadence.
 *
 * Tasks are owned outside the engine; every hook receives the container of
 * the session it runs for. TaskRegistry hands each session fresh instances,
 * so a task may keep per-session state, but a task shared between sessions
 * must not. Hooks report problems through their Result; an exception
 * escaping a hook is caught by the engine and treated the same way.
 */
class ITask {
public:
    virtual ~ITask() = default;

    [[nodiscard]] virtual TaskId id() const = 0;
    [[nodiscard]] virtual std::string display_name() const = 0;

    /// Folder name for this task's output inside a session.
    [[nodiscard]] virtual std::string file_name() const = 0;

    [[nodiscard]] virtual TaskCadence cadence() const = 0;

    [[nodiscard]] virtual bool enabled() const { return true; }
    [[nodiscard]] virtual bool selected_by_default() const { return true; }

    /// Once, before the first run.
    virtual Result<void> before_start(Container& /*container*/) { return {}; }

    /**
     * @brief One run. run is 1-based. The token is signalled when the
     *        session is cancelled; long runs should poll it.
     */
    virtual Result<void> execute(Container& container, int run, std::stop_token stop) = 0;

    /// Once, after the last run or on cancellation.
    virtual Result<void> after_finish(Container& /*container*/) { return {}; }
};

}  // namespace diagnostics_engine
