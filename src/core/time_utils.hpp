/**
 * @file time_utils.hpp
 * @brief Timestamp formatting, identifier generation and text helpers.
 */

#pragma once

#include "core/types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace diagnostics_engine {

/// `yyyy-MM-dd_HH.mm.ss.SSSZ` in UTC, safe for file names.
[[nodiscard]] std::string format_file_timestamp(Timestamp ts);

/// `yyyy-MM-ddTHH:mm:ss.SSSZ` in UTC; the persisted form.
[[nodiscard]] std::string format_iso8601(Timestamp ts);

/// Inverse of format_iso8601. Accepts an optional fractional part.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(std::string_view text);

/// `yyyy-MM-dd HH:mm:ss.SSS+0000`, used in manifests.
[[nodiscard]] std::string format_manifest_timestamp(Timestamp ts);

/**
 * @brief Human readable time span: "850 ms", "1.2 sec", "42 sec",
 *        "3 min 4 sec", "2 hr 5 min", "1 day 3 hr".
 */
[[nodiscard]] std::string format_time_span(Millis span);

[[nodiscard]] Timestamp to_timestamp(std::filesystem::file_time_type ftime);
[[nodiscard]] std::filesystem::file_time_type to_file_time(Timestamp ts);

/// Current process id as text.
[[nodiscard]] std::string process_id();

[[nodiscard]] std::string random_alphanumeric(std::size_t length);

/// Random (version 4) UUID in canonical 8-4-4-4-12 form.
[[nodiscard]] std::string generate_uuid();

/**
 * @brief Prepend prefix to every line of input. A trailing line break does
 *        not start a new prefixed line.
 */
[[nodiscard]] std::string prefix_lines(std::string_view prefix, std::string_view input);

}  // namespace diagnostics_engine
