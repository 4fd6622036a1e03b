/**
 * @file archiver.cpp
 * @brief ContainerArchiver implementation.
 */

#include "session/archiver.hpp"

#include "archive/bundle_writer.hpp"
#include "core/time_utils.hpp"

#include <system_error>
#include <vector>

namespace diagnostics_engine {

struct ContainerArchiver::WalkState {
    std::string manifest;
    std::string errors;
    std::size_t failures{0};

    void add_failure(const Failure& failure) {
        errors += format_failure(failure);
        ++failures;
    }
};

ContainerArchiver::ContainerArchiver(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

std::string ContainerArchiver::format_failure(const Failure& failure) {
    std::string out = failure.title;
    out += '\n';
    out.append(71, '-');
    out += "\n\n";
    out += failure.detail;
    out += "\n\n";
    return out;
}

// ─────────────────────────────────────────────
// Container tree
// ─────────────────────────────────────────────

Result<ArchiveSummary> ContainerArchiver::archive(Container& root,
                                                  const std::filesystem::path& archive_path) {
    if (!root.begin_archive()) {
        logger_->debug("Container '" + root.name() + "' already archived");
        return ArchiveSummary{};
    }

    auto writer = BundleWriter::open(archive_path);
    if (!writer) return writer.error();

    WalkState state;
    std::string title = MANIFEST_TITLE;
    state.manifest = title + "\n" + std::string(title.size(), '=') + "\n\n";
    state.manifest += "Generated on " +
        format_manifest_timestamp(std::chrono::system_clock::now()) + "\n\n";
    state.manifest += "Included diagnostics:\n\n";

    walk(root, 0, **writer, state);

    auto now = std::chrono::system_clock::now();
    if (auto r = (*writer)->add(MANIFEST_ENTRY, state.manifest, now); !r) {
        logger_->warn("Could not write " + std::string{MANIFEST_ENTRY} + ": " + r.error().message);
        state.add_failure({"Could not write " + std::string{MANIFEST_ENTRY} + " to the bundle",
                           r.error().message});
    }
    if (state.failures > 0) {
        if (auto r = (*writer)->add(ERRORS_ENTRY, state.errors, now); !r) {
            logger_->warn("Could not write " + std::string{ERRORS_ENTRY} + ": " + r.error().message);
        }
    }

    if (auto r = (*writer)->finish(); !r) {
        logger_->error("Bundle " + archive_path.string() + " failed: " + r.error().message);
        return r.error();
    }

    ArchiveSummary summary{(*writer)->entry_count(), state.failures};
    logger_->info("Wrote " + archive_path.string() + " with " +
                  std::to_string(summary.entries) + " entries");
    remove_directory(root.folder());
    return summary;
}

void ContainerArchiver::walk(Container& container, int depth, BundleWriter& writer, WalkState& state) {
    if (depth > 0 && !container.begin_archive()) return;

    std::string indent(static_cast<std::size_t>(depth) * 2, ' ');
    state.manifest += indent + " * " + container.name() + "\n";
    if (auto details = container.manifest_details()) {
        state.manifest += prefix_lines(indent, *details) + "\n";
    }

    while (auto content = container.pop_content()) {
        const auto& item = **content;
        std::string entry_name = container.archive_prefix() + item.name();
        state.manifest += indent + "   - `" + entry_name + "`\n";

        if (auto r = item.write_to(writer, entry_name); !r) {
            logger_->warn("Could not attach '" + entry_name + "' to the bundle: " + r.error().message);
            state.add_failure({"Could not attach '" + entry_name + "' to the bundle",
                               r.error().message});
        }
    }

    while (auto failure = container.pop_failure()) {
        state.add_failure(*failure);
    }

    while (auto child = container.pop_child()) {
        walk(**child, depth + 1, writer, state);
    }
}

// ─────────────────────────────────────────────
// Raw directory (recovery)
// ─────────────────────────────────────────────

Result<ArchiveSummary> ContainerArchiver::archive_directory(const std::filesystem::path& directory,
                                                            const std::filesystem::path& archive_path) {
    std::error_code ec;
    std::vector<std::filesystem::path> files;
    if (std::filesystem::is_directory(directory, ec)) {
        std::filesystem::recursive_directory_iterator it(
            directory, std::filesystem::directory_options::skip_permission_denied, ec);
        for (; !ec && it != std::filesystem::recursive_directory_iterator(); it.increment(ec)) {
            if (it->is_regular_file(ec)) files.push_back(it->path());
        }
        if (ec) {
            logger_->warn("Incomplete listing of " + directory.string() + ": " + ec.message());
        }
    }

    auto writer = BundleWriter::open(archive_path);
    if (!writer) return writer.error();

    ArchiveSummary summary;
    for (const auto& file : files) {
        auto entry_name = file.lexically_relative(directory).generic_string();
        std::error_code mtime_ec;
        auto ftime = std::filesystem::last_write_time(file, mtime_ec);
        auto mtime = mtime_ec ? std::chrono::system_clock::now() : to_timestamp(ftime);

        if (auto r = (*writer)->add_file(entry_name, file, mtime); !r) {
            logger_->warn("Skipping '" + entry_name + "' in recovery bundle: " + r.error().message);
        }
    }

    if (auto r = (*writer)->finish(); !r) {
        logger_->error("Recovery bundle " + archive_path.string() + " failed: " + r.error().message);
        return r.error();
    }
    summary.entries = (*writer)->entry_count();
    logger_->info("Wrote recovery bundle " + archive_path.string() + " with " +
                  std::to_string(summary.entries) + " entries");
    remove_directory(directory);
    return summary;
}

void ContainerArchiver::remove_directory(const std::filesystem::path& directory) {
    std::error_code ec;
    std::filesystem::remove_all(directory, ec);
    if (ec) {
        logger_->warn("Could not delete " + directory.string() + ": " + ec.message());
    }
}

}  // namespace diagnostics_engine
