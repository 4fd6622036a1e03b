/**
 * @file file_task.hpp
 * @brief Base for tasks that write one output file per run.
 */

#pragma once

#include "session/task.hpp"

#include <filesystem>
#include <fstream>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>

namespace diagnostics_engine {

/**
 * @brief Task writing `<base>-<pid>-<run>-<timestamp><ext>` per run.
 *
 * before_start() opens a timeline log `<base>-Logs-<pid>.log` that
 * subclasses append to with log_timeline(); after_finish() records
 * `[runs:x/y, initialDelay:d, period:p]` as the container's manifest
 * details. Instances belong to one session.
 */
class FileTask : public ITask {
public:
    FileTask(TaskId id, std::string display_name, TaskCadence cadence,
             std::string extension = ".txt");

    [[nodiscard]] TaskId id() const override { return id_; }
    [[nodiscard]] std::string display_name() const override { return display_name_; }
    [[nodiscard]] std::string file_name() const override { return id_; }
    [[nodiscard]] TaskCadence cadence() const override { return cadence_; }

    Result<void> before_start(Container& container) override;
    Result<void> execute(Container& container, int run, std::stop_token stop) override;
    Result<void> after_finish(Container& container) override;

    [[nodiscard]] int actual_runs() const;

    /// `[runs:x/y, initialDelay:d, period:p]`
    [[nodiscard]] std::string manifest_details() const;

protected:
    /// Produce the content of one run.
    virtual Result<void> write_run(std::ostream& out, int run, std::stop_token stop) = 0;

    void log_timeline(std::string_view line);

    [[nodiscard]] std::string run_file_name(int run) const;
    [[nodiscard]] std::string timeline_file_name() const;

private:
    Result<std::filesystem::path> ensure_directory(const Container& container) const;

    TaskId id_;
    std::string display_name_;
    TaskCadence cadence_;
    std::string extension_;

    mutable std::mutex mutex_;
    int actual_runs_{0};
    std::ofstream timeline_;
};

}  // namespace diagnostics_engine
