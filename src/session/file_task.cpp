/**
 * @file file_task.cpp
 * @brief FileTask implementation.
 */

#include "session/file_task.hpp"

#include "core/time_utils.hpp"
#include "session/container.hpp"

#include <system_error>

namespace diagnostics_engine {

FileTask::FileTask(TaskId id, std::string display_name, TaskCadence cadence, std::string extension)
    : id_(std::move(id))
    , display_name_(std::move(display_name))
    , cadence_(cadence)
    , extension_(std::move(extension)) {}

Result<std::filesystem::path> FileTask::ensure_directory(const Container& container) const {
    const auto& dir = container.folder();
    std::error_code ec;
    if (std::filesystem::exists(dir, ec) && !std::filesystem::is_directory(dir, ec)) {
        return Error{ErrorCode::Io, "A file named " + dir.string() + " is in the way"};
    }
    std::filesystem::create_directories(dir, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot create " + dir.string() + ": " + ec.message()};
    }
    return dir;
}

std::string FileTask::run_file_name(int run) const {
    return file_name() + "-" + process_id() + "-" + std::to_string(run) + "-" +
           format_file_timestamp(std::chrono::system_clock::now()) + extension_;
}

std::string FileTask::timeline_file_name() const {
    return file_name() + "-Logs-" + process_id() + ".log";
}

Result<void> FileTask::before_start(Container& container) {
    auto dir = ensure_directory(container);
    if (!dir) return dir.error();

    auto name = timeline_file_name();
    auto path = *dir / name;
    {
        std::lock_guard lock(mutex_);
        timeline_.open(path, std::ios::trunc);
        if (!timeline_) {
            return Error{ErrorCode::Io, "Cannot create " + path.string()};
        }
        timeline_ << "=== This file contains all the " << display_name_
                  << " in a time line fashion ===" << std::endl;
    }
    return container.add(std::make_unique<FileContent>(name, path));
}

Result<void> FileTask::execute(Container& container, int run, std::stop_token stop) {
    {
        std::lock_guard lock(mutex_);
        ++actual_runs_;
    }

    auto dir = ensure_directory(container);
    if (!dir) return dir.error();

    auto name = run_file_name(run);
    auto path = *dir / name;
    std::ofstream out(path, std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::Io, "Cannot create " + path.string()};
    }
    if (auto r = container.add(std::make_unique<FileContent>(name, path)); !r) return r;

    auto r = write_run(out, run, stop);
    out.flush();
    if (r && !out) {
        return Error{ErrorCode::Io, "Write to " + path.string() + " failed"};
    }
    return r;
}

Result<void> FileTask::after_finish(Container& container) {
    container.set_manifest_details(manifest_details());
    std::lock_guard lock(mutex_);
    if (timeline_.is_open()) timeline_.close();
    return {};
}

void FileTask::log_timeline(std::string_view line) {
    std::lock_guard lock(mutex_);
    if (!timeline_.is_open()) return;
    timeline_ << format_iso8601(std::chrono::system_clock::now()) << ' ' << line << '\n';
    timeline_.flush();
}

int FileTask::actual_runs() const {
    std::lock_guard lock(mutex_);
    return actual_runs_;
}

std::string FileTask::manifest_details() const {
    return "[runs:" + std::to_string(actual_runs()) + "/" + std::to_string(cadence_.run_count) +
           ", initialDelay:" + std::to_string(cadence_.initial_delay.count()) +
           ", period:" + std::to_string(cadence_.period.count()) + "]";
}

}  // namespace diagnostics_engine
