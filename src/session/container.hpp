/**
 * @file container.hpp
 * @brief Result tree node collecting artifacts, nested containers and
 *        failures until the session is archived.
 */

#pragma once

#include "core/concurrent_queue.hpp"
#include "core/result.hpp"
#include "session/content.hpp"

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace diagnostics_engine {

/// A problem to report in the bundle's error log.
struct Failure {
    std::string title;
    std::string detail;
};

/**
 * @brief Append-only node of the result tree.
 *
 * Any number of task threads may add content, children and failures
 * concurrently; the archiver is the single consumer and drains each queue
 * exactly once. Containers rebuilt from persisted state are detached and
 * reject every addition.
 */
class Container : public std::enable_shared_from_this<Container> {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static std::shared_ptr<Container> create_root(std::string name, std::filesystem::path folder);

    /// Root rebuilt from persisted state.
    static std::shared_ptr<Container> create_detached(std::string name, std::filesystem::path folder);

    Container(PrivateTag,
              std::string name,
              std::filesystem::path folder,
              std::optional<std::string> relative_folder,
              std::string archive_prefix,
              bool detached);
    ~Container() = default;
    Container(const Container&) = delete;
    Container& operator=(const Container&) = delete;

    /**
     * @brief Create a nested container stored under relative_folder and
     *        queue it for archiving.
     */
    Result<std::shared_ptr<Container>> create_child(std::string name, std::string relative_folder);

    Result<void> add(std::unique_ptr<Content> content);

    /// Queue a failure for the bundle's error log. Rejected with
    /// IllegalState once the container is detached or archived.
    Result<void> record_failure(std::string title, std::string detail);

    void set_manifest_details(std::string details);
    [[nodiscard]] std::optional<std::string> manifest_details() const;

    [[nodiscard]] const std::string& name() const noexcept { return name_; }
    [[nodiscard]] const std::filesystem::path& folder() const noexcept { return folder_; }
    [[nodiscard]] const std::optional<std::string>& relative_folder() const noexcept { return relative_folder_; }

    /// Entry-name prefix accumulated from the root: "" for the root,
    /// "a/b/" for a grandchild stored under a then b.
    [[nodiscard]] const std::string& archive_prefix() const noexcept { return archive_prefix_; }

    [[nodiscard]] bool is_root() const noexcept { return !relative_folder_.has_value(); }
    [[nodiscard]] bool is_detached() const noexcept { return detached_; }
    [[nodiscard]] bool is_archived() const noexcept { return archived_.load(); }

    // ── Archiver side (single consumer) ──────────

    /// Claim this container for archiving; true only for the first caller.
    bool begin_archive() noexcept;

    std::optional<std::unique_ptr<Content>> pop_content() { return contents_.try_pop(); }
    std::optional<std::shared_ptr<Container>> pop_child() { return children_.try_pop(); }
    std::optional<Failure> pop_failure() { return failures_.try_pop(); }

private:
    Result<void> check_accepting() const;

    std::string name_;
    std::filesystem::path folder_;
    std::optional<std::string> relative_folder_;
    std::string archive_prefix_;
    bool detached_;
    std::atomic<bool> archived_{false};

    mutable std::mutex details_mutex_;
    std::optional<std::string> manifest_details_;

    ConcurrentQueue<std::unique_ptr<Content>> contents_;
    ConcurrentQueue<std::shared_ptr<Container>> children_;
    ConcurrentQueue<Failure> failures_;
};

}  // namespace diagnostics_engine
