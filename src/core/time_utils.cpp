/**
 * @file time_utils.cpp
 * @brief Timestamp formatting, identifier generation and text helpers.
 */

#include "core/time_utils.hpp"

#include <cstdio>
#include <ctime>
#include <iomanip>
#include <cctype>
#include <random>
#include <sstream>
#include <unistd.h>

namespace diagnostics_engine {

namespace {

std::tm utc_tm(Timestamp ts) {
    auto time_t_ts = std::chrono::system_clock::to_time_t(ts);
    std::tm utc{};
    gmtime_r(&time_t_ts, &utc);
    return utc;
}

long long millis_part(Timestamp ts) {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        ts.time_since_epoch()) % 1000;
    if (ms.count() < 0) ms += std::chrono::milliseconds{1000};
    return ms.count();
}

std::string format_with(Timestamp ts, const char* pattern, const char* suffix) {
    auto utc = utc_tm(ts);
    std::ostringstream oss;
    oss << std::put_time(&utc, pattern)
        << '.' << std::setfill('0') << std::setw(3) << millis_part(ts)
        << suffix;
    return oss.str();
}

std::mt19937_64& random_engine() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

}  // anonymous namespace

std::string format_file_timestamp(Timestamp ts) {
    return format_with(ts, "%Y-%m-%d_%H.%M.%S", "Z");
}

std::string format_iso8601(Timestamp ts) {
    return format_with(ts, "%Y-%m-%dT%H:%M:%S", "Z");
}

std::string format_manifest_timestamp(Timestamp ts) {
    return format_with(ts, "%Y-%m-%d %H:%M:%S", "+0000");
}

std::optional<Timestamp> parse_iso8601(std::string_view text) {
    std::tm tm{};
    std::istringstream iss{std::string{text}};
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) return std::nullopt;

    int millis = 0;
    if (iss.peek() == '.') {
        iss.get();
        std::string digits;
        while (std::isdigit(iss.peek())) {
            digits.push_back(static_cast<char>(iss.get()));
        }
        if (digits.empty()) return std::nullopt;
        digits.resize(3, '0');
        millis = std::stoi(digits);
    }
    if (iss.peek() != 'Z') return std::nullopt;

    auto seconds = timegm(&tm);
    if (seconds == static_cast<time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(seconds) + std::chrono::milliseconds{millis};
}

std::string format_time_span(Millis span) {
    using namespace std::chrono;
    auto total_ms = span.count() < 0 ? 0 : span.count();

    if (total_ms < 1000) {
        return std::to_string(total_ms) + " ms";
    }
    if (total_ms < 10'000) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.1f sec", static_cast<double>(total_ms) / 1000.0);
        return buf;
    }

    auto total_s = total_ms / 1000;
    if (total_s < 60) {
        return std::to_string(total_s) + " sec";
    }
    auto total_min = total_s / 60;
    if (total_min < 60) {
        return std::to_string(total_min) + " min " + std::to_string(total_s % 60) + " sec";
    }
    auto total_hr = total_min / 60;
    if (total_hr < 24) {
        return std::to_string(total_hr) + " hr " + std::to_string(total_min % 60) + " min";
    }
    auto days = total_hr / 24;
    return std::to_string(days) + (days == 1 ? " day " : " days ")
         + std::to_string(total_hr % 24) + " hr";
}

Timestamp to_timestamp(std::filesystem::file_time_type ftime) {
    return std::chrono::time_point_cast<std::chrono::system_clock::duration>(
        std::chrono::file_clock::to_sys(ftime));
}

std::filesystem::file_time_type to_file_time(Timestamp ts) {
    return std::chrono::time_point_cast<std::filesystem::file_time_type::duration>(
        std::chrono::file_clock::from_sys(ts));
}

std::string process_id() {
    return std::to_string(static_cast<long>(::getpid()));
}

std::string random_alphanumeric(std::size_t length) {
    static constexpr std::string_view alphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    std::uniform_int_distribution<std::size_t> pick(0, alphabet.size() - 1);

    std::string out;
    out.reserve(length);
    for (std::size_t i = 0; i < length; ++i) {
        out.push_back(alphabet[pick(random_engine())]);
    }
    return out;
}

std::string generate_uuid() {
    std::uniform_int_distribution<uint64_t> dist;
    uint64_t hi = dist(random_engine());
    uint64_t lo = dist(random_engine());

    hi = (hi & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;   // version 4
    lo = (lo & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;   // RFC 4122 variant

    char buf[37];
    std::snprintf(buf, sizeof(buf), "%08x-%04x-%04x-%04x-%012llx",
                  static_cast<unsigned>(hi >> 32),
                  static_cast<unsigned>((hi >> 16) & 0xFFFF),
                  static_cast<unsigned>(hi & 0xFFFF),
                  static_cast<unsigned>(lo >> 48),
                  static_cast<unsigned long long>(lo & 0xFFFFFFFFFFFFULL));
    return buf;
}

std::string prefix_lines(std::string_view prefix, std::string_view input) {
    std::string out{prefix};
    out.reserve(input.size() + prefix.size() * 4);

    for (std::size_t i = 0; i < input.size(); ++i) {
        char c = input[i];
        out.push_back(c);

        bool line_break = false;
        if (c == '\r') {
            if (i + 1 < input.size() && input[i + 1] == '\n') {
                out.push_back('\n');
                ++i;
            }
            line_break = true;
        } else if (c == '\n') {
            line_break = true;
        }

        if (line_break && i + 1 < input.size()) {
            out.append(prefix);
        }
    }
    return out;
}

}  // namespace diagnostics_engine
