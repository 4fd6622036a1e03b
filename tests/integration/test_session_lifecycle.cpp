/**
 * @file test_session_lifecycle.cpp
 * @brief Integration tests: sessions running real tasks on a worker pool
 *        through to their archives.
 */

#include "archive/bundle_reader.hpp"
#include "core/time_utils.hpp"
#include "executor/worker_pool.hpp"
#include "session/archiver.hpp"
#include "session/session.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace diagnostics_engine;
using namespace std::chrono_literals;

namespace {

enum class Behaviour { Ok, FailRuns, ThrowRuns, FailStart, Block };

/// Adds one text entry per run.
class RecordingTask : public ITask {
public:
    RecordingTask(TaskId id, TaskCadence cadence, Behaviour behaviour = Behaviour::Ok)
        : id_(std::move(id)), cadence_(cadence), behaviour_(behaviour) {}

    TaskId id() const override { return id_; }
    std::string display_name() const override { return "Task " + id_; }
    std::string file_name() const override { return id_; }
    TaskCadence cadence() const override { return cadence_; }

    Result<void> before_start(Container&) override {
        if (behaviour_ == Behaviour::FailStart) return Error{ErrorCode::Io, "device missing"};
        return {};
    }

    Result<void> execute(Container& container, int run, std::stop_token stop) override {
        switch (behaviour_) {
            case Behaviour::FailRuns:
                return Error{ErrorCode::TaskFailed, "probe " + std::to_string(run) + " timed out"};
            case Behaviour::ThrowRuns:
                throw std::runtime_error("probe crashed");
            case Behaviour::Block:
                while (!stop.stop_requested()) std::this_thread::sleep_for(2ms);
                break;
            default:
                break;
        }
        return container.add(std::make_unique<StringContent>(
            "run-" + std::to_string(run) + ".txt", id_ + " run " + std::to_string(run)));
    }

    Result<void> after_finish(Container& container) override {
        container.set_manifest_details("[done]");
        return {};
    }

private:
    TaskId id_;
    TaskCadence cadence_;
    Behaviour behaviour_;
};

class DisabledTask : public RecordingTask {
public:
    using RecordingTask::RecordingTask;
    bool enabled() const override { return false; }
};

class RecordingListener : public SessionListener {
public:
    void on_run_finished(Session&, TaskRunner&) override { ++runs; }

    void on_task_finished(Session&, TaskRunner& runner) override {
        std::lock_guard lock(mutex);
        ++finished[runner.task_id()];
    }

    void on_session_finished(Session&) override { ++sessions; }

    int finished_count(const TaskId& id) {
        std::lock_guard lock(mutex);
        auto it = finished.find(id);
        return it == finished.end() ? 0 : it->second;
    }

    std::atomic<int> runs{0};
    std::atomic<int> sessions{0};
    std::mutex mutex;
    std::map<TaskId, int> finished;
};

class CapturingSink : public ILogSink {
public:
    explicit CapturingSink(std::vector<std::string>& lines, std::mutex& mutex)
        : lines_(lines), mutex_(mutex) {}

    void write(std::string_view json_line) override {
        std::lock_guard lock(mutex_);
        lines_.emplace_back(json_line);
    }
    void flush() override {}

private:
    std::vector<std::string>& lines_;
    std::mutex& mutex_;
};

/// Ignores every "task finished" notification, leaving completion to the
/// watchdog.
class DeafSession : public Session {
public:
    static std::shared_ptr<DeafSession> make(SessionOptions options,
                                             std::shared_ptr<IScheduler> scheduler,
                                             std::shared_ptr<Logger> logger) {
        return std::make_shared<DeafSession>(ConstructionTag{}, std::move(options),
                                             std::move(scheduler), std::move(logger));
    }

    DeafSession(ConstructionTag tag, SessionOptions options, std::shared_ptr<IScheduler> scheduler,
                std::shared_ptr<Logger> logger)
        : Session(tag, generate_uuid(), "diagnosticsSession-deaf", "lost notifications", "tester",
                  std::chrono::system_clock::now(), std::move(options), std::move(scheduler),
                  std::move(logger), {}, false) {}

    void on_task_finished(TaskRunner&) override { ++dropped; }

    std::atomic<int> dropped{0};
};

template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = 10000ms) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

std::size_t count_failures(const std::string& errors) {
    const std::string rule = "\n" + std::string(71, '-') + "\n";
    std::size_t n = 0;
    for (auto pos = errors.find(rule); pos != std::string::npos; pos = errors.find(rule, pos + 1)) ++n;
    return n;
}

}  // namespace

class SessionLifecycleTest : public ::testing::Test {
protected:
    std::filesystem::path root_;
    SessionOptions options_;
    std::shared_ptr<ScheduledWorkerPool> pool_ = ScheduledWorkerPool::create(4, 2000ms, make_null_logger());
    std::shared_ptr<RecordingListener> listener_ = std::make_shared<RecordingListener>();

    void SetUp() override {
        root_ = std::filesystem::temp_directory_path() / "de_test_lifecycle";
        std::filesystem::remove_all(root_);
        options_.working_root = root_;
        options_.watchdog_interval = 50ms;
    }

    void TearDown() override {
        pool_->shutdown();
        std::filesystem::remove_all(root_);
    }

    std::shared_ptr<Session> make_session() {
        return Session::create("integration", "tester", options_, pool_, make_null_logger(), listener_);
    }

    static bool finished(const std::shared_ptr<Session>& session) {
        return is_terminal(session->status());
    }
};

// ═══════════════════════════════════════════════
// Normal completion
// ═══════════════════════════════════════════════

TEST_F(SessionLifecycleTest, TwoCadencesRunToCompletion) {
    auto session = make_session();
    EXPECT_EQ(session->status(), SessionStatus::None);
    EXPECT_TRUE(session->run_time().empty());
    EXPECT_EQ(session->name().rfind("diagnosticsSession-" + process_id() + "-", 0), 0u);

    ASSERT_TRUE(session->run({
        std::make_shared<RecordingTask>("fast", TaskCadence{0ms, 100ms, 10}),
        std::make_shared<RecordingTask>("slow", TaskCadence{0ms, 200ms, 5}),
    }));
    EXPECT_TRUE(session->is_running());
    EXPECT_TRUE(session->is_task_running("fast"));
    EXPECT_FALSE(session->is_download_ready());

    // The listener hears about the finish after the status changed.
    ASSERT_TRUE(wait_for([&] { return listener_->sessions.load() == 1; }));
    EXPECT_EQ(session->status(), SessionStatus::Succeeded);
    EXPECT_TRUE(session->is_download_ready());
    EXPECT_FALSE(session->is_task_running("fast"));

    ASSERT_TRUE(session->started_at().has_value());
    ASSERT_TRUE(session->ended_at().has_value());
    EXPECT_GE(*session->ended_at() - *session->started_at(), 850ms);
    EXPECT_FALSE(session->run_time().empty());

    EXPECT_EQ(session->runner("fast")->runs_completed(), 10);
    EXPECT_EQ(session->runner("slow")->runs_completed(), 5);
    EXPECT_EQ(listener_->finished_count("fast"), 1);
    EXPECT_EQ(listener_->finished_count("slow"), 1);
    EXPECT_EQ(listener_->runs.load(), 15);
    EXPECT_EQ(listener_->sessions.load(), 1);
    EXPECT_EQ(session->task_ids(), (std::vector<TaskId>{"fast", "slow"}));

    EXPECT_FALSE(std::filesystem::exists(session->working_directory()));
    ASSERT_TRUE(std::filesystem::exists(session->archive_path()));
    EXPECT_EQ(session->archive_path(), root_ / (session->name() + ".tar.zst"));

    auto reader = BundleReader::open(session->archive_path());
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    EXPECT_EQ(reader->size(), 16u);
    EXPECT_FALSE(reader->contains(ContainerArchiver::ERRORS_ENTRY));
    ASSERT_NE(reader->find("fast/run-10.txt"), nullptr);
    EXPECT_EQ(reader->find("fast/run-10.txt")->data, "fast run 10");
    EXPECT_TRUE(reader->contains("slow/run-5.txt"));

    const auto* manifest = reader->find(ContainerArchiver::MANIFEST_ENTRY);
    ASSERT_NE(manifest, nullptr);
    EXPECT_NE(manifest->data.find("   * Task fast\n  [done]\n"), std::string::npos);
    EXPECT_NE(manifest->data.find("`slow/run-1.txt`"), std::string::npos);
}

TEST_F(SessionLifecycleTest, RecordReflectsFinishedRunners) {
    auto session = make_session();
    ASSERT_TRUE(session->run({std::make_shared<RecordingTask>("once", TaskCadence{0ms, 10ms, 2})}));
    ASSERT_TRUE(wait_for([&] { return finished(session); }));

    auto record = session->record();
    EXPECT_EQ(record.id, session->id());
    EXPECT_EQ(record.status, std::optional<SessionStatus>{SessionStatus::Succeeded});
    EXPECT_EQ(record.user, "tester");
    ASSERT_EQ(record.runners.size(), 1u);
    EXPECT_EQ(record.runners[0].task_id, "once");
    EXPECT_EQ(record.runners[0].display_name, "Task once");
    EXPECT_EQ(record.runners[0].runs_completed, 2);
    EXPECT_EQ(record.runners[0].state, RunnerState::Finished);
}

TEST_F(SessionLifecycleTest, EmptyTaskSetArchivesManifestOnly) {
    auto session = make_session();
    ASSERT_TRUE(session->run({}));
    EXPECT_EQ(session->status(), SessionStatus::Succeeded);
    EXPECT_EQ(listener_->sessions.load(), 1);

    auto reader = BundleReader::open(session->archive_path());
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    ASSERT_EQ(reader->size(), 1u);
    EXPECT_EQ(reader->entries().front().name, ContainerArchiver::MANIFEST_ENTRY);
}

// ═══════════════════════════════════════════════
// Watchdog
// ═══════════════════════════════════════════════

TEST_F(SessionLifecycleTest, WatchdogFinishesWhenNotificationsAreLost) {
    std::vector<std::string> lines;
    std::mutex lines_mutex;
    auto logger = std::make_shared<Logger>(std::make_unique<CapturingSink>(lines, lines_mutex),
                                           LogLevel::Warn, "test");

    auto session = DeafSession::make(options_, pool_, logger);
    ASSERT_TRUE(session->run({
        std::make_shared<RecordingTask>("a", TaskCadence{0ms, 40ms, 3}),
        std::make_shared<RecordingTask>("b", TaskCadence{20ms, 40ms, 2}),
    }));

    ASSERT_TRUE(wait_for([&] { return finished(session); }, 5000ms));
    EXPECT_EQ(session->status(), SessionStatus::Succeeded);
    EXPECT_EQ(session->dropped.load(), 2);
    EXPECT_TRUE(std::filesystem::exists(session->archive_path()));

    std::lock_guard lock(lines_mutex);
    bool watchdog_logged = std::any_of(lines.begin(), lines.end(), [](const std::string& line) {
        return line.find("finished by watchdog") != std::string::npos;
    });
    EXPECT_TRUE(watchdog_logged);
}

// ═══════════════════════════════════════════════
// Cancellation
// ═══════════════════════════════════════════════

TEST_F(SessionLifecycleTest, CancelInterruptsAndArchives) {
    auto session = make_session();
    ASSERT_TRUE(session->run({
        std::make_shared<RecordingTask>("steady", TaskCadence{0ms, 1000ms, 100}),
        std::make_shared<RecordingTask>("stuck", TaskCadence{0ms, 1000ms, 5}, Behaviour::Block),
    }));
    ASSERT_TRUE(wait_for([&] { return session->runner("steady")->runs_completed() >= 1; }));

    ASSERT_TRUE(session->cancel());
    EXPECT_EQ(session->status(), SessionStatus::Cancelled);
    EXPECT_TRUE(session->is_download_ready());
    EXPECT_EQ(listener_->sessions.load(), 1);
    EXPECT_EQ(listener_->finished_count("steady"), 1);
    EXPECT_EQ(listener_->finished_count("stuck"), 1);

    auto again = session->cancel();
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::IllegalState);

    auto reader = BundleReader::open(session->archive_path());
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    EXPECT_TRUE(reader->contains("steady/run-1.txt"));
    EXPECT_TRUE(reader->contains("stuck/run-1.txt"));

    // Nothing finishes the session a second time.
    std::this_thread::sleep_for(150ms);
    EXPECT_EQ(listener_->sessions.load(), 1);
    EXPECT_EQ(session->status(), SessionStatus::Cancelled);
}

TEST_F(SessionLifecycleTest, CancelKeepsOutputOfInterruptedRun) {
    auto session = make_session();
    ASSERT_TRUE(session->run({
        std::make_shared<RecordingTask>("slow", TaskCadence{0ms, 1000ms, 3}, Behaviour::Block),
    }));
    ASSERT_TRUE(wait_for([&] { return session->runner("slow")->runs_completed() == 1; }));

    ASSERT_TRUE(session->cancel());
    EXPECT_EQ(session->status(), SessionStatus::Cancelled);

    auto reader = BundleReader::open(session->archive_path());
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    const auto* partial = reader->find("slow/run-1.txt");
    ASSERT_NE(partial, nullptr);
    EXPECT_EQ(partial->data, "slow run 1");
    EXPECT_FALSE(reader->contains(ContainerArchiver::ERRORS_ENTRY));
    EXPECT_NE(reader->find("manifest.md")->data.find("   * Task slow\n  [done]\n"), std::string::npos);
}

TEST_F(SessionLifecycleTest, CancelBeforeRunIsRejected) {
    auto session = make_session();
    auto cancelled = session->cancel();
    ASSERT_FALSE(cancelled);
    EXPECT_EQ(cancelled.error().code, ErrorCode::IllegalState);
    EXPECT_EQ(session->status(), SessionStatus::None);
}

// ═══════════════════════════════════════════════
// Failures
// ═══════════════════════════════════════════════

TEST_F(SessionLifecycleTest, FailedRunsAreReportedOncePerRun) {
    auto session = make_session();
    ASSERT_TRUE(session->run({
        std::make_shared<RecordingTask>("flaky", TaskCadence{0ms, 10ms, 3}, Behaviour::FailRuns),
        std::make_shared<RecordingTask>("crashy", TaskCadence{0ms, 10ms, 2}, Behaviour::ThrowRuns),
    }));
    ASSERT_TRUE(wait_for([&] { return finished(session); }));
    EXPECT_EQ(session->status(), SessionStatus::Succeeded);
    EXPECT_EQ(session->runner("flaky")->runs_completed(), 3);
    EXPECT_EQ(session->runner("crashy")->runs_completed(), 2);

    auto reader = BundleReader::open(session->archive_path());
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    const auto* errors = reader->find(ContainerArchiver::ERRORS_ENTRY);
    ASSERT_NE(errors, nullptr);
    EXPECT_EQ(count_failures(errors->data), 5u);
    EXPECT_NE(errors->data.find("Run 3 of task 'Task flaky' failed"), std::string::npos);
    EXPECT_NE(errors->data.find("probe crashed"), std::string::npos);
}

TEST_F(SessionLifecycleTest, StartFailureLeavesOtherTasksRunning) {
    auto session = make_session();
    ASSERT_TRUE(session->run({
        std::make_shared<RecordingTask>("broken", TaskCadence{0ms, 10ms, 3}, Behaviour::FailStart),
        std::make_shared<RecordingTask>("invalid", TaskCadence{0ms, 0ms, 3}),
        std::make_shared<RecordingTask>("healthy", TaskCadence{0ms, 10ms, 3}),
    }));
    ASSERT_TRUE(wait_for([&] { return finished(session); }));
    EXPECT_EQ(session->status(), SessionStatus::Succeeded);

    auto broken = session->runner("broken");
    EXPECT_EQ(broken->state(), RunnerState::FailedToStart);
    ASSERT_TRUE(broken->start_error().has_value());
    EXPECT_NE(broken->start_error()->find("device missing"), std::string::npos);
    EXPECT_EQ(broken->runs_completed(), 0);
    EXPECT_EQ(session->runner("invalid")->state(), RunnerState::FailedToStart);
    EXPECT_EQ(session->runner("healthy")->runs_completed(), 3);
    EXPECT_EQ(listener_->finished_count("broken"), 0);

    auto reader = BundleReader::open(session->archive_path());
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    const auto* errors = reader->find(ContainerArchiver::ERRORS_ENTRY);
    ASSERT_NE(errors, nullptr);
    EXPECT_EQ(count_failures(errors->data), 2u);
    EXPECT_NE(errors->data.find("Task 'Task broken' failed to start"), std::string::npos);
}

TEST_F(SessionLifecycleTest, DisabledTasksAreSkipped) {
    auto session = make_session();
    ASSERT_TRUE(session->run({
        std::make_shared<DisabledTask>("off", TaskCadence{0ms, 10ms, 3}),
        std::make_shared<RecordingTask>("on", TaskCadence{0ms, 10ms, 2}),
    }));
    ASSERT_TRUE(wait_for([&] { return finished(session); }));
    EXPECT_EQ(session->status(), SessionStatus::Succeeded);

    EXPECT_EQ(session->runner("off"), nullptr);
    EXPECT_EQ(session->task_ids(), (std::vector<TaskId>{"on"}));
    EXPECT_EQ(session->runner("on")->runs_completed(), 2);
    EXPECT_EQ(listener_->finished_count("off"), 0);

    auto reader = BundleReader::open(session->archive_path());
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    EXPECT_TRUE(reader->contains("on/run-2.txt"));
    EXPECT_FALSE(reader->contains("off/run-1.txt"));
    const auto* errors = reader->find(ContainerArchiver::ERRORS_ENTRY);
    ASSERT_NE(errors, nullptr);
    EXPECT_EQ(count_failures(errors->data), 1u);
    EXPECT_NE(errors->data.find("Task 'Task off' is disabled"), std::string::npos);
}

TEST_F(SessionLifecycleTest, OnlyDisabledTasksFinishAtOnce) {
    auto session = make_session();
    ASSERT_TRUE(session->run({std::make_shared<DisabledTask>("off", TaskCadence{0ms, 10ms, 3})}));
    ASSERT_TRUE(wait_for([&] { return finished(session); }, 1000ms));
    EXPECT_EQ(session->status(), SessionStatus::Succeeded);
    EXPECT_TRUE(session->task_ids().empty());
}

TEST_F(SessionLifecycleTest, NoTaskStartingStillSucceeds) {
    auto session = make_session();
    ASSERT_TRUE(session->run({
        std::make_shared<RecordingTask>("broken", TaskCadence{0ms, 10ms, 3}, Behaviour::FailStart),
    }));
    ASSERT_TRUE(wait_for([&] { return finished(session); }));
    EXPECT_EQ(session->status(), SessionStatus::Succeeded);

    auto reader = BundleReader::open(session->archive_path());
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    EXPECT_TRUE(reader->contains(ContainerArchiver::ERRORS_ENTRY));
}

// ═══════════════════════════════════════════════
// Misuse
// ═══════════════════════════════════════════════

TEST_F(SessionLifecycleTest, RunIsAllowedOnce) {
    auto session = make_session();
    ASSERT_TRUE(session->run({}));
    auto again = session->run({});
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, ErrorCode::IllegalState);
}

TEST_F(SessionLifecycleTest, DuplicateTaskIdsAreRejected) {
    auto session = make_session();
    auto r = session->run({
        std::make_shared<RecordingTask>("same", TaskCadence{0ms, 10ms, 1}),
        std::make_shared<RecordingTask>("same", TaskCadence{0ms, 20ms, 1}),
    });
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(session->status(), SessionStatus::None);
    EXPECT_TRUE(session->task_ids().empty());

    // Still usable afterwards.
    ASSERT_TRUE(session->run({std::make_shared<RecordingTask>("same", TaskCadence{0ms, 10ms, 1})}));
    EXPECT_TRUE(wait_for([&] { return finished(session); }));
}

TEST_F(SessionLifecycleTest, RemoveOnlyOnceFinished) {
    auto session = make_session();
    ASSERT_TRUE(session->run({std::make_shared<RecordingTask>("long", TaskCadence{0ms, 1000ms, 50})}));
    ASSERT_TRUE(wait_for([&] { return session->runner("long")->runs_completed() >= 1; }));

    auto refused = session->remove();
    ASSERT_FALSE(refused);
    EXPECT_EQ(refused.error().code, ErrorCode::IllegalState);
    EXPECT_TRUE(std::filesystem::is_directory(session->working_directory()));
    EXPECT_TRUE(session->is_running());

    ASSERT_TRUE(session->cancel());
    ASSERT_TRUE(std::filesystem::exists(session->archive_path()));
    ASSERT_TRUE(session->remove());
    EXPECT_FALSE(std::filesystem::exists(session->archive_path()));
    EXPECT_FALSE(std::filesystem::exists(session->working_directory()));
}

// ═══════════════════════════════════════════════
// Recovery
// ═══════════════════════════════════════════════

TEST_F(SessionLifecycleTest, InterruptedSessionIsPackedOnRehydrate) {
    SessionRecord record;
    record.id = generate_uuid();
    record.name = "diagnosticsSession-crashed";
    record.status = SessionStatus::Running;
    record.created_at = std::chrono::system_clock::now() - 1h;
    record.started_at = record.created_at;
    record.runners = {RunnerRecord{"probe", "Probe", TaskCadence{0ms, 100ms, 10}, 4, RunnerState::Scheduled, std::nullopt}};

    auto dir = root_ / record.name / "probe";
    std::filesystem::create_directories(dir);
    std::ofstream(dir / "probe-1.txt") << "first run";

    auto session = Session::rehydrate(record, options_, pool_, make_null_logger(), listener_);
    EXPECT_EQ(session->status(), SessionStatus::Failed);
    EXPECT_TRUE(session->ended_at().has_value());
    EXPECT_FALSE(session->is_download_ready());
    EXPECT_FALSE(std::filesystem::exists(root_ / record.name));

    auto reader = BundleReader::open(session->archive_path());
    ASSERT_TRUE(reader.has_value()) << reader.error().message;
    ASSERT_NE(reader->find("probe/probe-1.txt"), nullptr);
    EXPECT_EQ(reader->find("probe/probe-1.txt")->data, "first run");

    // Restored runners are reported as persisted; nothing runs again.
    auto restored = session->record();
    EXPECT_EQ(restored.status, std::optional<SessionStatus>{SessionStatus::Failed});
    EXPECT_EQ(restored.runners, record.runners);
    EXPECT_FALSE(session->is_task_running("probe"));
    EXPECT_FALSE(session->cancel());
    EXPECT_FALSE(session->run({}));
}

TEST_F(SessionLifecycleTest, MissingStatusWithArchiveIsOnlyMarkedFailed) {
    SessionRecord record;
    record.id = generate_uuid();
    record.name = "diagnosticsSession-half-saved";
    record.created_at = std::chrono::system_clock::now();

    std::filesystem::create_directories(root_);
    std::ofstream(root_ / (record.name + ".tar.zst")) << "existing bundle";

    auto session = Session::rehydrate(record, options_, pool_, make_null_logger());
    EXPECT_EQ(session->status(), SessionStatus::Failed);

    std::ifstream in(session->archive_path());
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, "existing bundle");
}

TEST_F(SessionLifecycleTest, TerminalRecordIsRestoredAsIs) {
    SessionRecord record;
    record.id = generate_uuid();
    record.name = "diagnosticsSession-done";
    record.status = SessionStatus::Cancelled;
    record.created_at = std::chrono::system_clock::now() - 2h;
    record.started_at = record.created_at + 1s;
    record.ended_at = record.created_at + 3s;

    auto session = Session::rehydrate(record, options_, pool_, make_null_logger(), listener_);
    EXPECT_EQ(session->status(), SessionStatus::Cancelled);
    EXPECT_EQ(session->ended_at(), record.ended_at);
    EXPECT_EQ(session->run_time(), "2.0 sec");
    EXPECT_EQ(listener_->sessions.load(), 0);
}
