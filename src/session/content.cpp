/**
 * @file content.cpp
 * @brief StringContent and FileContent.
 */

#include "session/content.hpp"

#include "archive/bundle_writer.hpp"
#include "core/time_utils.hpp"

#include <system_error>

namespace diagnostics_engine {

StringContent::StringContent(std::string name, std::string text, Timestamp timestamp)
    : Content(std::move(name)), text_(std::move(text)), timestamp_(timestamp) {}

Result<void> StringContent::write_to(BundleWriter& writer, std::string_view entry_name) const {
    return writer.add(entry_name, text_, timestamp_);
}

FileContent::FileContent(std::string name, std::filesystem::path file)
    : Content(std::move(name))
    , file_(std::move(file))
    , created_(std::chrono::system_clock::now()) {}

Timestamp FileContent::timestamp() const {
    std::error_code ec;
    auto mtime = std::filesystem::last_write_time(file_, ec);
    if (ec) return created_;
    return to_timestamp(mtime);
}

Result<void> FileContent::write_to(BundleWriter& writer, std::string_view entry_name) const {
    return writer.add_file(entry_name, file_, timestamp());
}

}  // namespace diagnostics_engine
