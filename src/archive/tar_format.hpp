/**
 * @file tar_format.hpp
 * @brief ustar header layout shared by the bundle writer and reader.
 */

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace diagnostics_engine::tar {

inline constexpr std::size_t BLOCK_SIZE = 512;
inline constexpr std::string_view LONG_LINK_NAME = "././@LongLink";

inline constexpr char TYPE_FILE = '0';
inline constexpr char TYPE_LONG_NAME = 'L';

// Field offsets and widths inside a header block.
inline constexpr std::size_t NAME_OFFSET = 0,       NAME_SIZE = 100;
inline constexpr std::size_t MODE_OFFSET = 100,     MODE_SIZE = 8;
inline constexpr std::size_t UID_OFFSET = 108,      UID_SIZE = 8;
inline constexpr std::size_t GID_OFFSET = 116,      GID_SIZE = 8;
inline constexpr std::size_t SIZE_OFFSET = 124,     SIZE_SIZE = 12;
inline constexpr std::size_t MTIME_OFFSET = 136,    MTIME_SIZE = 12;
inline constexpr std::size_t CHKSUM_OFFSET = 148,   CHKSUM_SIZE = 8;
inline constexpr std::size_t TYPEFLAG_OFFSET = 156;
inline constexpr std::size_t MAGIC_OFFSET = 257;
inline constexpr std::size_t VERSION_OFFSET = 263;
inline constexpr std::size_t UNAME_OFFSET = 265,    UNAME_SIZE = 32;
inline constexpr std::size_t GNAME_OFFSET = 297,    GNAME_SIZE = 32;
inline constexpr std::size_t PREFIX_OFFSET = 345,   PREFIX_SIZE = 155;

using Block = std::array<char, BLOCK_SIZE>;

/// Bytes of zero padding that follow size bytes of entry data.
[[nodiscard]] constexpr std::size_t padding_for(uint64_t size) noexcept {
    auto rem = static_cast<std::size_t>(size % BLOCK_SIZE);
    return rem == 0 ? 0 : BLOCK_SIZE - rem;
}

/// Zero-padded octal, NUL terminated, filling width bytes.
void write_octal(Block& block, std::size_t offset, std::size_t width, uint64_t value);

[[nodiscard]] std::optional<uint64_t> read_octal(const Block& block,
                                                 std::size_t offset,
                                                 std::size_t width);

/// Copy text into a fixed field, truncating; unused bytes stay zero.
void write_field(Block& block, std::size_t offset, std::size_t width, std::string_view text);

[[nodiscard]] std::string read_field(const Block& block, std::size_t offset, std::size_t width);

/// Sum of all header bytes with the checksum field counted as spaces.
[[nodiscard]] uint32_t checksum(const Block& block);

[[nodiscard]] bool is_zero_block(const Block& block);

/**
 * @brief Split a path into ustar (prefix, name) at a '/' so both parts fit.
 * @return nullopt when no split fits; the caller falls back to a long-name
 *         record.
 */
[[nodiscard]] std::optional<std::pair<std::string, std::string>>
split_ustar_name(std::string_view path);

}  // namespace diagnostics_engine::tar
