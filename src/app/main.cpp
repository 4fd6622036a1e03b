/**
 * @file main.cpp
 * @brief diagnostics_engine command-line entry point.
 *
 * Wires the engine together:
 *   Config → Logger → WorkerPoolManager → TaskRegistry → SessionStore
 * and runs one command against it.
 */

#include "app/builtin_tasks.hpp"
#include "archive/bundle_reader.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/time_utils.hpp"
#include "core/types.hpp"
#include "executor/pool_manager.hpp"
#include "persistence/session_store.hpp"
#include "session/task_registry.hpp"
#include "telemetry/json_sink.hpp"

#include <charconv>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using namespace diagnostics_engine;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

/// Cadence of `run` without task arguments.
constexpr TaskCadence DEFAULT_CADENCE{Millis{0}, Millis{1000}, 5};

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║         Diagnostics Engine v1.0.0         ║
  ║   Scheduled diagnostic sessions bundled   ║
  ║   into one .tar.zst archive               ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

void print_usage() {
    std::cout << "Usage: diagnostics_engine [OPTIONS] <command> [ARGS]\n"
              << "  --config <path>    Configuration file (default: config/default.toml)\n"
              << "  --log-dir <path>   Log output directory (default: stdout)\n"
              << "  --help, -h         Show this help message\n"
              << "\n"
              << "Commands:\n"
              << "  run [--description <text>] [--user <name>] <task>:<delay>:<period>:<runs> ...\n"
              << "                     Run a session; delay and period in milliseconds.\n"
              << "                     Without tasks, runs the default selection every second, 5 times\n"
              << "  list               List stored sessions\n"
              << "  delete <id>        Delete a finished session and its files\n"
              << "  inspect <archive>  List the entries of a session archive\n"
              << "  tasks              List the available tasks\n";
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string log_dir;
    std::string command;
    std::string description;
    std::string user;
    std::vector<std::string> operands;
};

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--log-dir" && i + 1 < argc) {
            args.log_dir = argv[++i];
        } else if (arg == "--description" && i + 1 < argc) {
            args.description = argv[++i];
        } else if (arg == "--user" && i + 1 < argc) {
            args.user = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            print_usage();
            std::exit(0);
        } else if (arg.starts_with("--")) {
            return Error{ErrorCode::InvalidArgument, "Unknown option " + arg};
        } else if (args.command.empty()) {
            args.command = arg;
        } else {
            args.operands.push_back(arg);
        }
    }
    if (args.command.empty()) {
        return Error{ErrorCode::InvalidArgument, "No command given"};
    }
    return args;
}

Result<int64_t> parse_number(std::string_view text, std::string_view what) {
    int64_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return Error{ErrorCode::InvalidArgument,
                     "Invalid " + std::string{what} + " '" + std::string{text} + "'"};
    }
    return value;
}

struct TaskRequest {
    std::string name;
    TaskCadence cadence;
};

/// `<task>:<delay>:<period>:<runs>`
Result<TaskRequest> parse_task_request(std::string_view text) {
    std::vector<std::string_view> parts;
    std::size_t start = 0;
    while (true) {
        auto colon = text.find(':', start);
        parts.push_back(text.substr(start, colon - start));
        if (colon == std::string_view::npos) break;
        start = colon + 1;
    }
    if (parts.size() != 4) {
        return Error{ErrorCode::InvalidArgument,
                     "Expected <task>:<delay>:<period>:<runs>, got '" + std::string{text} + "'"};
    }

    auto delay = parse_number(parts[1], "delay");
    if (!delay) return delay.error();
    auto period = parse_number(parts[2], "period");
    if (!period) return period.error();
    auto runs = parse_number(parts[3], "run count");
    if (!runs) return runs.error();

    TaskRequest request;
    request.name = std::string{parts[0]};
    request.cadence.initial_delay = Millis{*delay};
    request.cadence.period = Millis{*period};
    request.cadence.run_count = static_cast<int>(*runs);
    if (!request.cadence.valid()) {
        return Error{ErrorCode::InvalidArgument,
                     "Cadence of '" + request.name + "' needs delay >= 0, period > 0, runs >= 1"};
    }
    return request;
}

// ─────────────────────────────────────────────
// Commands
// ─────────────────────────────────────────────

int run_session(const CLIArgs& args, SessionStore& store, const TaskRegistry& registry, Logger& logger) {
    std::vector<std::shared_ptr<ITask>> tasks;
    if (args.operands.empty()) {
        auto selection = registry.create_default_selection(DEFAULT_CADENCE);
        if (!selection) {
            std::cerr << "run: " << selection.error().message << std::endl;
            return 2;
        }
        if (selection->empty()) {
            std::cerr << "run: no task is selected by default (see 'tasks')" << std::endl;
            return 2;
        }
        tasks = std::move(*selection);
    }

    for (const auto& operand : args.operands) {
        auto request = parse_task_request(operand);
        if (!request) {
            std::cerr << "run: " << request.error().message << std::endl;
            return 2;
        }
        auto task = registry.create(request->name, request->cadence);
        if (!task) {
            std::cerr << "run: " << task.error().message << std::endl;
            return 2;
        }
        tasks.push_back(std::move(*task));
    }

    auto session = store.create_session(args.description, args.user);
    if (!session) {
        std::cerr << "run: " << session.error().message << std::endl;
        return 1;
    }
    auto& s = **session;

    if (auto r = s.run(tasks); !r) {
        std::cerr << "run: " << r.error().message << std::endl;
        return 1;
    }
    std::cout << "Session " << s.id() << " (" << s.name() << ") running "
              << tasks.size() << " tasks. Press Ctrl+C to cancel." << std::endl;

    while (s.is_running()) {
        if (g_shutdown_requested) {
            logger.info("Shutdown requested, cancelling session " + s.name());
            if (auto r = s.cancel(); !r) {
                logger.debug(r.error().message);
            }
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    while (s.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::cout << "Session " << s.name() << " " << to_string(s.status())
              << " after " << s.run_time() << std::endl;
    if (s.is_download_ready()) {
        std::cout << "Archive: " << s.archive_path().string() << std::endl;
    }
    return s.status() == SessionStatus::Failed ? 1 : 0;
}

int list_sessions(const SessionStore& store) {
    auto sessions = store.list();
    if (sessions.empty()) {
        std::cout << "No sessions." << std::endl;
        return 0;
    }
    std::cout << std::left << std::setw(38) << "ID" << std::setw(11) << "STATUS"
              << std::setw(26) << "STARTED" << std::setw(16) << "RUN TIME" << "DESCRIPTION" << '\n';
    for (const auto& session : sessions) {
        auto started = session->started_at();
        std::cout << std::setw(38) << session->id()
                  << std::setw(11) << to_string(session->status())
                  << std::setw(26) << (started ? format_iso8601(*started) : std::string{"-"})
                  << std::setw(16) << session->run_time()
                  << session->description() << '\n';
    }
    std::cout.flush();
    return 0;
}

int delete_session(const CLIArgs& args, SessionStore& store) {
    if (args.operands.size() != 1) {
        std::cerr << "delete: expected one session id" << std::endl;
        return 2;
    }
    if (auto r = store.remove(args.operands.front()); !r) {
        std::cerr << "delete: " << r.error().message << std::endl;
        return 1;
    }
    std::cout << "Deleted " << args.operands.front() << std::endl;
    return 0;
}

int inspect_archive(const CLIArgs& args) {
    if (args.operands.size() != 1) {
        std::cerr << "inspect: expected one archive path" << std::endl;
        return 2;
    }
    auto reader = BundleReader::open(args.operands.front());
    if (!reader) {
        std::cerr << "inspect: " << reader.error().message << std::endl;
        return 1;
    }
    for (const auto& entry : reader->entries()) {
        std::cout << std::right << std::setw(10) << entry.data.size() << "  "
                  << format_iso8601(entry.mtime) << "  " << entry.name << '\n';
    }
    std::cout << reader->size() << " entries" << std::endl;
    return 0;
}

int list_tasks(const TaskRegistry& registry) {
    std::cout << std::left << std::setw(18) << "TASK" << std::setw(9) << "ENABLED"
              << std::setw(9) << "DEFAULT" << "DESCRIPTION" << '\n';
    for (const auto& name : registry.names()) {
        auto task = registry.create(name, DEFAULT_CADENCE);
        if (!task) {
            std::cerr << "tasks: " << task.error().message << std::endl;
            return 1;
        }
        std::cout << std::left << std::setw(18) << name
                  << std::setw(9) << ((*task)->enabled() ? "yes" : "no")
                  << std::setw(9) << ((*task)->selected_by_default() ? "yes" : "no")
                  << registry.description(name) << '\n';
    }
    std::cout.flush();
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto args_result = parse_args(argc, argv);
    if (!args_result) {
        std::cerr << args_result.error().message << "\n\n";
        print_usage();
        return 2;
    }
    auto args = *args_result;

    if (args.command == "inspect") {
        return inspect_archive(args);
    }

    print_banner();

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.log_dir.empty()) config.telemetry.log_dir = args.log_dir;
    auto env_result = apply_environment(config);

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    if (!args.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "diagnostics_engine",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
    }
    auto level = parse_log_level(config.telemetry.log_level).value_or(LogLevel::Info);
    auto logger = std::make_shared<Logger>(std::move(log_sink), level, "engine");
    logger->info("Diagnostics engine starting...");
    logger->info("Working root: " + config.engine.working_root.string());
    if (!env_result) {
        logger->warn(env_result.error().message);
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ── Initialize Worker Pool ───────────────
    auto pools = std::make_shared<WorkerPoolManager>(config.pool, logger);
    logger->info("Worker pool: core size " + std::to_string(config.pool.core_size) +
                 ", keep-alive " + std::to_string(config.pool.keep_alive_ms) + "ms");

    // ── Initialize Task Registry ─────────────
    TaskRegistry registry;
    if (auto r = register_builtin_tasks(registry); !r) {
        logger->error("Task registration failed: " + r.error().message);
        return 1;
    }

    // ── Initialize Session Store ─────────────
    auto store = SessionStore::create(config, pools, logger);
    if (auto loaded = store->load(); loaded) {
        logger->info("Loaded " + std::to_string(*loaded) + " sessions from " + store->state_file().string());
    } else {
        logger->error("Cannot load sessions: " + loaded.error().message);
    }

    int exit_code = 2;
    if (args.command == "run") {
        exit_code = run_session(args, *store, registry, *logger);
    } else if (args.command == "list") {
        exit_code = list_sessions(*store);
    } else if (args.command == "delete") {
        exit_code = delete_session(args, *store);
    } else if (args.command == "tasks") {
        exit_code = list_tasks(registry);
    } else {
        std::cerr << "Unknown command '" << args.command << "'\n\n";
        print_usage();
    }

    // ── Graceful Shutdown ────────────────────
    store->cancel_all();
    if (auto r = store->save(); !r) {
        logger->error("Final save failed: " + r.error().message);
    }
    pools->shutdown();
    logger->info("Diagnostics engine stopped.");
    logger->flush();
    return exit_code;
}
