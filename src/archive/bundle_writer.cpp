/**
 * @file bundle_writer.cpp
 * @brief BundleWriter implementation using the zstd streaming API.
 */

#include "archive/bundle_writer.hpp"
#include "archive/tar_format.hpp"

#include <zstd.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdio>
#include <system_error>

namespace diagnostics_engine {

namespace {

constexpr std::size_t FILE_CHUNK_SIZE = 64 * 1024;

uint64_t to_unix_seconds(Timestamp ts) {
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(ts.time_since_epoch()).count();
    return secs < 0 ? 0 : static_cast<uint64_t>(secs);
}

}  // anonymous namespace

void BundleWriter::CCtxDeleter::operator()(ZSTD_CCtx_s* ctx) const noexcept {
    ZSTD_freeCCtx(ctx);
}

// ─────────────────────────────────────────────
// Lifecycle
// ─────────────────────────────────────────────

Result<std::unique_ptr<BundleWriter>> BundleWriter::open(const std::filesystem::path& path,
                                                         int compression_level) {
    auto partial = path;
    partial += ".partial";

    auto writer = std::make_unique<BundleWriter>(PrivateTag{}, path, partial);

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return Error{ErrorCode::Io, "Cannot create directory " +
                         path.parent_path().string() + ": " + ec.message()};
        }
    }

    writer->out_.open(partial, std::ios::binary | std::ios::trunc);
    if (!writer->out_) {
        return Error{ErrorCode::Io, "Cannot open " + partial.string() + " for writing"};
    }

    writer->cctx_.reset(ZSTD_createCCtx());
    if (!writer->cctx_) {
        return Error{ErrorCode::Compression, "ZSTD_createCCtx failed"};
    }
    auto rc = ZSTD_CCtx_setParameter(writer->cctx_.get(), ZSTD_c_compressionLevel,
                                     compression_level);
    if (ZSTD_isError(rc)) {
        return Error{ErrorCode::Compression,
                     std::string{"Invalid compression level: "} + ZSTD_getErrorName(rc)};
    }
    rc = ZSTD_CCtx_setParameter(writer->cctx_.get(), ZSTD_c_checksumFlag, 1);
    if (ZSTD_isError(rc)) {
        return Error{ErrorCode::Compression,
                     std::string{"Cannot enable frame checksum: "} + ZSTD_getErrorName(rc)};
    }
    writer->out_buffer_.resize(ZSTD_CStreamOutSize());

    return std::move(writer);
}

BundleWriter::BundleWriter(PrivateTag, std::filesystem::path path, std::filesystem::path partial_path)
    : path_(std::move(path)), partial_path_(std::move(partial_path)) {}

BundleWriter::~BundleWriter() {
    if (!finished_) {
        if (out_.is_open()) out_.close();
        std::error_code ec;
        std::filesystem::remove(partial_path_, ec);
    }
}

// ─────────────────────────────────────────────
// Entries
// ─────────────────────────────────────────────

Result<void> BundleWriter::add(std::string_view entry_name, std::string_view data, Timestamp mtime) {
    if (auto r = write_header(entry_name, data.size(), mtime); !r) return r;
    if (auto r = write_tar(data.data(), data.size()); !r) return r;
    if (auto r = write_padding(data.size()); !r) return r;
    ++entry_count_;
    return {};
}

Result<void> BundleWriter::add_file(std::string_view entry_name,
                                    const std::filesystem::path& source,
                                    Timestamp mtime) {
    std::error_code ec;
    auto size = std::filesystem::file_size(source, ec);
    if (ec) {
        return Error{ErrorCode::Io, "Cannot stat " + source.string() + ": " + ec.message()};
    }
    std::ifstream in(source, std::ios::binary);
    if (!in) {
        return Error{ErrorCode::Io, "Cannot open " + source.string() + " for reading"};
    }

    if (auto r = write_header(entry_name, size, mtime); !r) return r;

    std::vector<char> chunk(FILE_CHUNK_SIZE);
    uint64_t remaining = size;
    bool short_read = false;
    while (remaining > 0) {
        auto want = static_cast<std::size_t>(std::min<uint64_t>(remaining, chunk.size()));
        std::size_t got = 0;
        if (!short_read) {
            in.read(chunk.data(), static_cast<std::streamsize>(want));
            got = static_cast<std::size_t>(in.gcount());
            if (got < want) short_read = true;
        }
        // The header already promised size bytes.
        std::fill(chunk.begin() + static_cast<std::ptrdiff_t>(got),
                  chunk.begin() + static_cast<std::ptrdiff_t>(want), '\0');
        if (auto r = write_tar(chunk.data(), want); !r) return r;
        remaining -= want;
    }
    if (auto r = write_padding(size); !r) return r;
    ++entry_count_;

    if (short_read) {
        return Error{ErrorCode::Io, "Short read from " + source.string() +
                     ", entry " + std::string{entry_name} + " was zero-filled"};
    }
    return {};
}

Result<void> BundleWriter::finish() {
    if (finished_) return {};
    if (failed_) {
        return Error{ErrorCode::Io, "Bundle " + path_.string() + " is in a failed state"};
    }

    tar::Block zero{};
    for (int i = 0; i < 2; ++i) {
        if (auto r = write_tar(zero.data(), zero.size()); !r) return r;
    }
    if (auto r = compress(nullptr, 0, true); !r) return r;

    out_.flush();
    out_.close();
    if (!out_) {
        failed_ = true;
        return Error{ErrorCode::Io, "Failed to close " + partial_path_.string()};
    }

    std::error_code ec;
    std::filesystem::rename(partial_path_, path_, ec);
    if (ec) {
        failed_ = true;
        return Error{ErrorCode::Io, "Cannot move bundle into place at " +
                     path_.string() + ": " + ec.message()};
    }
    finished_ = true;
    return {};
}

// ─────────────────────────────────────────────
// ustar records
// ─────────────────────────────────────────────

Result<void> BundleWriter::write_header(std::string_view entry_name, uint64_t size, Timestamp mtime) {
    if (entry_name.empty()) {
        return Error{ErrorCode::InvalidArgument, "Bundle entry name is empty"};
    }
    if (tar::split_ustar_name(entry_name)) {
        return write_record(entry_name, size, mtime, tar::TYPE_FILE);
    }

    // GNU long name: a record holding the full name precedes the real header.
    std::string long_name{entry_name};
    long_name.push_back('\0');
    if (auto r = write_record(tar::LONG_LINK_NAME, long_name.size(), mtime, tar::TYPE_LONG_NAME); !r) {
        return r;
    }
    if (auto r = write_tar(long_name.data(), long_name.size()); !r) return r;
    if (auto r = write_padding(long_name.size()); !r) return r;
    return write_record(entry_name.substr(0, tar::NAME_SIZE), size, mtime, tar::TYPE_FILE);
}

Result<void> BundleWriter::write_record(std::string_view name, uint64_t size, Timestamp mtime,
                                        char typeflag) {
    tar::Block block{};

    auto split = tar::split_ustar_name(name);
    if (split) {
        tar::write_field(block, tar::NAME_OFFSET, tar::NAME_SIZE, split->second);
        tar::write_field(block, tar::PREFIX_OFFSET, tar::PREFIX_SIZE, split->first);
    } else {
        tar::write_field(block, tar::NAME_OFFSET, tar::NAME_SIZE, name);
    }

    tar::write_octal(block, tar::MODE_OFFSET, tar::MODE_SIZE, 0644);
    tar::write_octal(block, tar::UID_OFFSET, tar::UID_SIZE, 0);
    tar::write_octal(block, tar::GID_OFFSET, tar::GID_SIZE, 0);
    tar::write_octal(block, tar::SIZE_OFFSET, tar::SIZE_SIZE, size);
    tar::write_octal(block, tar::MTIME_OFFSET, tar::MTIME_SIZE, to_unix_seconds(mtime));
    block[tar::TYPEFLAG_OFFSET] = typeflag;
    tar::write_field(block, tar::MAGIC_OFFSET, 6, std::string_view{"ustar\0", 6});
    tar::write_field(block, tar::VERSION_OFFSET, 2, "00");
    tar::write_field(block, tar::UNAME_OFFSET, tar::UNAME_SIZE, "diagnostics");
    tar::write_field(block, tar::GNAME_OFFSET, tar::GNAME_SIZE, "diagnostics");

    // Six octal digits, NUL, space.
    char chk[8];
    std::snprintf(chk, sizeof(chk), "%06o", tar::checksum(block));
    std::copy_n(chk, 6, block.begin() + tar::CHKSUM_OFFSET);
    block[tar::CHKSUM_OFFSET + 6] = '\0';
    block[tar::CHKSUM_OFFSET + 7] = ' ';

    return write_tar(block.data(), block.size());
}

Result<void> BundleWriter::write_padding(uint64_t size) {
    static const tar::Block zero{};
    auto pad = tar::padding_for(size);
    if (pad == 0) return {};
    return write_tar(zero.data(), pad);
}

Result<void> BundleWriter::write_tar(const char* data, std::size_t size) {
    if (finished_ || failed_) {
        return Error{ErrorCode::IllegalState, "Bundle " + path_.string() + " is closed"};
    }
    return compress(data, size, false);
}

// ─────────────────────────────────────────────
// zstd stream
// ─────────────────────────────────────────────

Result<void> BundleWriter::compress(const char* data, std::size_t size, bool end_frame) {
    ZSTD_inBuffer input{data, size, 0};
    const auto mode = end_frame ? ZSTD_e_end : ZSTD_e_continue;

    bool done = false;
    while (!done) {
        ZSTD_outBuffer output{out_buffer_.data(), out_buffer_.size(), 0};
        std::size_t remaining = ZSTD_compressStream2(cctx_.get(), &output, &input, mode);
        if (ZSTD_isError(remaining)) {
            failed_ = true;
            return Error{ErrorCode::Compression,
                         std::string{"zstd compression failed: "} + ZSTD_getErrorName(remaining)};
        }
        if (output.pos > 0) {
            out_.write(out_buffer_.data(), static_cast<std::streamsize>(output.pos));
            if (!out_) {
                failed_ = true;
                return Error{ErrorCode::Io, "Write to " + partial_path_.string() + " failed"};
            }
        }
        done = end_frame ? remaining == 0 : input.pos == input.size;
    }
    return {};
}

}  // namespace diagnostics_engine
