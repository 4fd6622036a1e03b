/**
 * @file archiver.hpp
 * @brief Turns a container tree, or a raw working directory, into a bundle.
 */

#pragma once

#include "core/logger.hpp"
#include "core/result.hpp"
#include "session/container.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <string>

namespace diagnostics_engine {

class BundleWriter;

struct ArchiveSummary {
    std::size_t entries{0};      ///< Entries written, manifest files included
    std::size_t failures{0};     ///< Records in manifest/errors.txt
};

/**
 * @brief Writes `<archive>.tar.zst` bundles.
 *
 * archive() walks a container tree depth first, draining every queue, and
 * writes each content item under its accumulated path followed by
 * `manifest.md` and, when anything went wrong, `manifest/errors.txt`.
 * Per-entry failures are reported in the error log and never abort the walk;
 * only a failure of the bundle itself is returned as an error.
 *
 * archive_directory() is the recovery path: every regular file below the
 * directory becomes an entry named by its relative path.
 *
 * Both delete the source directory once the bundle is complete.
 */
class ContainerArchiver {
public:
    static constexpr const char* MANIFEST_ENTRY = "manifest.md";
    static constexpr const char* ERRORS_ENTRY = "manifest/errors.txt";
    static constexpr const char* MANIFEST_TITLE = "Diagnostics Session";

    explicit ContainerArchiver(std::shared_ptr<Logger> logger);

    Result<ArchiveSummary> archive(Container& root, const std::filesystem::path& archive_path);

    Result<ArchiveSummary> archive_directory(const std::filesystem::path& directory,
                                             const std::filesystem::path& archive_path);

    /// Format one error log record.
    [[nodiscard]] static std::string format_failure(const Failure& failure);

private:
    struct WalkState;

    void walk(Container& container, int depth, BundleWriter& writer, WalkState& state);
    void remove_directory(const std::filesystem::path& directory);

    std::shared_ptr<Logger> logger_;
};

}  // namespace diagnostics_engine
