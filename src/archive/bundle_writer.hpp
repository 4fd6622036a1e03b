/**
 * @file bundle_writer.hpp
 * @brief Streaming writer for `.tar.zst` bundles.
 *
 * Entries are laid out as a POSIX ustar stream (names longer than the
 * ustar fields use a GNU `././@LongLink` record) and compressed on the fly
 * into a single zstd frame, so the result opens with `tar --zstd -xf`.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

struct ZSTD_CCtx_s;

namespace diagnostics_engine {

class BundleWriter {
    struct PrivateTag {
        explicit PrivateTag() = default;
    };

public:
    static constexpr int DEFAULT_LEVEL = 3;

    /**
     * @brief Start a bundle at path. Data goes to `<path>.partial` until
     *        finish() renames it over path, replacing any existing file.
     */
    static Result<std::unique_ptr<BundleWriter>> open(const std::filesystem::path& path,
                                                      int compression_level = DEFAULT_LEVEL);

    BundleWriter(PrivateTag, std::filesystem::path path, std::filesystem::path partial_path);

    /// Removes the partial file if finish() was never reached.
    ~BundleWriter();

    BundleWriter(const BundleWriter&) = delete;
    BundleWriter& operator=(const BundleWriter&) = delete;

    /// Add an in-memory entry.
    Result<void> add(std::string_view entry_name, std::string_view data, Timestamp mtime);

    /**
     * @brief Add a file from disk, streamed in chunks.
     *
     * Fails without writing anything when the file cannot be opened. A read
     * error part way through zero-fills the rest of the entry and is
     * reported, leaving the stream itself intact.
     */
    Result<void> add_file(std::string_view entry_name,
                          const std::filesystem::path& source,
                          Timestamp mtime);

    /// Write the end-of-archive blocks, close the frame and publish the file.
    Result<void> finish();

    [[nodiscard]] std::size_t entry_count() const noexcept { return entry_count_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    struct CCtxDeleter {
        void operator()(ZSTD_CCtx_s* ctx) const noexcept;
    };

    Result<void> write_header(std::string_view entry_name, uint64_t size, Timestamp mtime);
    Result<void> write_record(std::string_view name, uint64_t size, Timestamp mtime,
                              char typeflag);
    Result<void> write_padding(uint64_t size);
    Result<void> write_tar(const char* data, std::size_t size);
    Result<void> compress(const char* data, std::size_t size, bool end_frame);

    std::filesystem::path path_;
    std::filesystem::path partial_path_;
    std::ofstream out_;
    std::unique_ptr<ZSTD_CCtx_s, CCtxDeleter> cctx_;
    std::vector<char> out_buffer_;
    std::size_t entry_count_{0};
    bool finished_{false};
    bool failed_{false};
};

}  // namespace diagnostics_engine
