/**
 * @file task_registry.hpp
 * @brief Name → factory table of the tasks an application offers.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"
#include "session/task.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace diagnostics_engine {

using TaskFactory = std::function<std::shared_ptr<ITask>(const TaskCadence&)>;

/**
 * @brief Explicit registry populated by the application at start-up.
 *
 * Not thread-safe for registration; fill it before sessions are created.
 */
class TaskRegistry {
public:
    Result<void> add(std::string name, std::string description, TaskFactory factory);

    /// A fresh task instance with the given cadence.
    [[nodiscard]] Result<std::shared_ptr<ITask>> create(const std::string& name,
                                                        const TaskCadence& cadence) const;

    /**
     * @brief Fresh instances of every registered task that is enabled and
     *        selected by default, in name order.
     */
    [[nodiscard]] Result<std::vector<std::shared_ptr<ITask>>>
    create_default_selection(const TaskCadence& cadence) const;

    [[nodiscard]] bool contains(const std::string& name) const { return entries_.contains(name); }

    /// Sorted.
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::string description(const std::string& name) const;

private:
    struct Entry {
        std::string description;
        TaskFactory factory;
    };

    std::map<std::string, Entry> entries_;
};

}  // namespace diagnostics_engine
