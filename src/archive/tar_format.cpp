/**
 * @file tar_format.cpp
 * @brief ustar header field helpers.
 */

#include "archive/tar_format.hpp"

#include <algorithm>
#include <cstdio>

namespace diagnostics_engine::tar {

void write_octal(Block& block, std::size_t offset, std::size_t width, uint64_t value) {
    // width - 1 digits plus the terminating NUL
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%0*llo",
                  static_cast<int>(width - 1), static_cast<unsigned long long>(value));
    std::copy_n(buf, width - 1, block.begin() + static_cast<std::ptrdiff_t>(offset));
    block[offset + width - 1] = '\0';
}

std::optional<uint64_t> read_octal(const Block& block, std::size_t offset, std::size_t width) {
    uint64_t value = 0;
    bool any_digit = false;
    for (std::size_t i = offset; i < offset + width; ++i) {
        char c = block[i];
        if (c == '\0' || c == ' ') {
            if (any_digit) break;
            continue;
        }
        if (c < '0' || c > '7') return std::nullopt;
        value = (value << 3) + static_cast<uint64_t>(c - '0');
        any_digit = true;
    }
    if (!any_digit) return uint64_t{0};
    return value;
}

void write_field(Block& block, std::size_t offset, std::size_t width, std::string_view text) {
    auto n = std::min(width, text.size());
    std::copy_n(text.data(), n, block.begin() + static_cast<std::ptrdiff_t>(offset));
}

std::string read_field(const Block& block, std::size_t offset, std::size_t width) {
    const char* begin = block.data() + offset;
    const char* end = std::find(begin, begin + width, '\0');
    return std::string(begin, end);
}

uint32_t checksum(const Block& block) {
    uint32_t sum = 0;
    for (std::size_t i = 0; i < BLOCK_SIZE; ++i) {
        if (i >= CHKSUM_OFFSET && i < CHKSUM_OFFSET + CHKSUM_SIZE) {
            sum += static_cast<uint32_t>(' ');
        } else {
            sum += static_cast<unsigned char>(block[i]);
        }
    }
    return sum;
}

bool is_zero_block(const Block& block) {
    return std::all_of(block.begin(), block.end(), [](char c) { return c == '\0'; });
}

std::optional<std::pair<std::string, std::string>> split_ustar_name(std::string_view path) {
    if (path.size() <= NAME_SIZE) {
        return std::make_pair(std::string{}, std::string{path});
    }
    if (path.size() > PREFIX_SIZE + 1 + NAME_SIZE) return std::nullopt;

    // Leftmost slash that leaves a name short enough.
    for (std::size_t pos = path.find('/'); pos != std::string_view::npos;
         pos = path.find('/', pos + 1)) {
        if (pos > PREFIX_SIZE) break;
        auto name_len = path.size() - pos - 1;
        if (name_len > 0 && name_len <= NAME_SIZE) {
            return std::make_pair(std::string{path.substr(0, pos)},
                                  std::string{path.substr(pos + 1)});
        }
    }
    return std::nullopt;
}

}  // namespace diagnostics_engine::tar
