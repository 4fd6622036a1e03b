/**
 * @file bundle_reader.cpp
 * @brief BundleReader implementation.
 */

#include "archive/bundle_reader.hpp"
#include "archive/tar_format.hpp"

#include <zstd.h>

#include <algorithm>
#include <cstring>
#include <fstream>
#include <memory>

namespace diagnostics_engine {

namespace {

struct DCtxDeleter {
    void operator()(ZSTD_DCtx* ctx) const noexcept { ZSTD_freeDCtx(ctx); }
};

}  // anonymous namespace

Result<BundleReader> BundleReader::open(const std::filesystem::path& path) {
    auto stream = decompress(path);
    if (!stream) return stream.error();

    BundleReader reader;
    if (auto r = reader.parse(*stream); !r) return r.error();
    return reader;
}

std::vector<std::string> BundleReader::names() const {
    std::vector<std::string> out;
    out.reserve(entries_.size());
    for (const auto& entry : entries_) out.push_back(entry.name);
    return out;
}

const BundleEntry* BundleReader::find(std::string_view name) const {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const BundleEntry& e) { return e.name == name; });
    return it == entries_.end() ? nullptr : &*it;
}

Result<std::string> BundleReader::decompress(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::NotFound, "Cannot open bundle " + path.string()};
    }

    std::unique_ptr<ZSTD_DCtx, DCtxDeleter> dctx(ZSTD_createDCtx());
    if (!dctx) {
        return Error{ErrorCode::Compression, "ZSTD_createDCtx failed"};
    }

    std::vector<char> in_buf(ZSTD_DStreamInSize());
    std::vector<char> out_buf(ZSTD_DStreamOutSize());
    std::string result;
    std::size_t last_ret = 0;
    bool any_input = false;

    while (in) {
        in.read(in_buf.data(), static_cast<std::streamsize>(in_buf.size()));
        auto got = static_cast<std::size_t>(in.gcount());
        if (got == 0) break;
        any_input = true;

        ZSTD_inBuffer input{in_buf.data(), got, 0};
        while (input.pos < input.size) {
            ZSTD_outBuffer output{out_buf.data(), out_buf.size(), 0};
            last_ret = ZSTD_decompressStream(dctx.get(), &output, &input);
            if (ZSTD_isError(last_ret)) {
                return Error{ErrorCode::Compression,
                             std::string{"zstd decompression failed: "} + ZSTD_getErrorName(last_ret)};
            }
            result.append(out_buf.data(), output.pos);
        }
    }

    if (!any_input) {
        return Error{ErrorCode::Parse, "Bundle " + path.string() + " is empty"};
    }
    if (last_ret != 0) {
        return Error{ErrorCode::Compression, "Bundle " + path.string() + " is truncated"};
    }
    return result;
}

Result<void> BundleReader::parse(const std::string& tar_stream) {
    std::size_t offset = 0;
    std::string pending_long_name;

    while (offset + tar::BLOCK_SIZE <= tar_stream.size()) {
        tar::Block block;
        std::memcpy(block.data(), tar_stream.data() + offset, tar::BLOCK_SIZE);
        offset += tar::BLOCK_SIZE;

        if (tar::is_zero_block(block)) return {};

        auto stored = tar::read_octal(block, tar::CHKSUM_OFFSET, tar::CHKSUM_SIZE);
        if (!stored || *stored != tar::checksum(block)) {
            return Error{ErrorCode::Parse, "Bad tar header checksum at offset " +
                         std::to_string(offset - tar::BLOCK_SIZE)};
        }
        auto size = tar::read_octal(block, tar::SIZE_OFFSET, tar::SIZE_SIZE);
        auto mtime = tar::read_octal(block, tar::MTIME_OFFSET, tar::MTIME_SIZE);
        if (!size || !mtime) {
            return Error{ErrorCode::Parse, "Malformed tar header field"};
        }
        if (offset + *size > tar_stream.size()) {
            return Error{ErrorCode::Parse, "Tar entry runs past end of stream"};
        }

        std::string data = tar_stream.substr(offset, static_cast<std::size_t>(*size));
        offset += static_cast<std::size_t>(*size) + tar::padding_for(*size);

        char typeflag = block[tar::TYPEFLAG_OFFSET];
        if (typeflag == tar::TYPE_LONG_NAME) {
            pending_long_name = std::string(data.c_str());
            continue;
        }

        std::string name;
        if (!pending_long_name.empty()) {
            name = std::move(pending_long_name);
            pending_long_name.clear();
        } else {
            auto prefix = tar::read_field(block, tar::PREFIX_OFFSET, tar::PREFIX_SIZE);
            name = tar::read_field(block, tar::NAME_OFFSET, tar::NAME_SIZE);
            if (!prefix.empty()) name = prefix + "/" + name;
        }

        if (typeflag != tar::TYPE_FILE && typeflag != '\0') continue;

        entries_.push_back(BundleEntry{
            std::move(name),
            Timestamp{std::chrono::seconds{static_cast<int64_t>(*mtime)}},
            std::move(data)});
    }
    return Error{ErrorCode::Parse, "Tar stream ended without end-of-archive marker"};
}

}  // namespace diagnostics_engine
