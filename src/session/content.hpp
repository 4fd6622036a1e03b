/**
 * @file content.hpp
 * @brief Artifacts a task attaches to its container.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <string>
#include <string_view>

namespace diagnostics_engine {

class BundleWriter;

/**
 * @brief A named, timestamped artifact whose bytes are produced only when
 *        the container is archived.
 */
class Content {
public:
    virtual ~Content() = default;

    /// Path relative to the owning container's folder, '/'-separated.
    [[nodiscard]] const std::string& name() const noexcept { return name_; }

    [[nodiscard]] virtual Timestamp timestamp() const = 0;

    /// Append this artifact to the bundle as entry_name.
    virtual Result<void> write_to(BundleWriter& writer, std::string_view entry_name) const = 0;

protected:
    explicit Content(std::string name) : name_(std::move(name)) {}

private:
    std::string name_;
};

/// In-memory text.
class StringContent : public Content {
public:
    StringContent(std::string name, std::string text, Timestamp timestamp = std::chrono::system_clock::now());

    [[nodiscard]] Timestamp timestamp() const override { return timestamp_; }
    Result<void> write_to(BundleWriter& writer, std::string_view entry_name) const override;

    [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
    std::string text_;
    Timestamp timestamp_;
};

/**
 * @brief A file on disk, read at archive time. Its timestamp is the file's
 *        modification time, or the creation time of this object when the
 *        file cannot be stat'ed.
 */
class FileContent : public Content {
public:
    FileContent(std::string name, std::filesystem::path file);

    [[nodiscard]] Timestamp timestamp() const override;
    Result<void> write_to(BundleWriter& writer, std::string_view entry_name) const override;

    [[nodiscard]] const std::filesystem::path& file() const noexcept { return file_; }

private:
    std::filesystem::path file_;
    Timestamp created_;
};

}  // namespace diagnostics_engine
