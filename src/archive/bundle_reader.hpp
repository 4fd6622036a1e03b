/**
 * @file bundle_reader.hpp
 * @brief Reads back `.tar.zst` bundles produced by BundleWriter.
 */

#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace diagnostics_engine {

struct BundleEntry {
    std::string name;
    Timestamp mtime;
    std::string data;
};

/**
 * @brief Whole-bundle reader: decompresses the frame and indexes the tar
 *        entries in memory. Intended for inspection and tests, not for
 *        multi-gigabyte bundles.
 */
class BundleReader {
public:
    static Result<BundleReader> open(const std::filesystem::path& path);

    [[nodiscard]] const std::vector<BundleEntry>& entries() const noexcept { return entries_; }
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] const BundleEntry* find(std::string_view name) const;
    [[nodiscard]] bool contains(std::string_view name) const { return find(name) != nullptr; }
    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }

private:
    BundleReader() = default;

    static Result<std::string> decompress(const std::filesystem::path& path);
    Result<void> parse(const std::string& tar_stream);

    std::vector<BundleEntry> entries_;
};

}  // namespace diagnostics_engine
