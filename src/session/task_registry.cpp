/**
 * @file task_registry.cpp
 * @brief TaskRegistry implementation.
 */

#include "session/task_registry.hpp"

namespace diagnostics_engine {

Result<void> TaskRegistry::add(std::string name, std::string description, TaskFactory factory) {
    if (name.empty() || !factory) {
        return Error{ErrorCode::InvalidArgument, "Task registration needs a name and a factory"};
    }
    if (entries_.contains(name)) {
        return Error{ErrorCode::InvalidArgument, "Task '" + name + "' is already registered"};
    }
    entries_.emplace(std::move(name), Entry{std::move(description), std::move(factory)});
    return {};
}

Result<std::shared_ptr<ITask>> TaskRegistry::create(const std::string& name,
                                                    const TaskCadence& cadence) const {
    auto it = entries_.find(name);
    if (it == entries_.end()) {
        return Error{ErrorCode::NotFound, "Unknown task '" + name + "'"};
    }
    auto task = it->second.factory(cadence);
    if (!task) {
        return Error{ErrorCode::InvalidArgument, "Factory for '" + name + "' returned no task"};
    }
    return task;
}

Result<std::vector<std::shared_ptr<ITask>>>
TaskRegistry::create_default_selection(const TaskCadence& cadence) const {
    std::vector<std::shared_ptr<ITask>> tasks;
    for (const auto& [name, entry] : entries_) {
        auto task = create(name, cadence);
        if (!task) return task.error();
        if ((*task)->enabled() && (*task)->selected_by_default()) {
            tasks.push_back(std::move(*task));
        }
    }
    return tasks;
}

std::vector<std::string> TaskRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& [name, entry] : entries_) out.push_back(name);
    return out;
}

std::string TaskRegistry::description(const std::string& name) const {
    auto it = entries_.find(name);
    return it == entries_.end() ? std::string{} : it->second.description;
}

}  // namespace diagnostics_engine
