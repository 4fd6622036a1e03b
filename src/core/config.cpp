/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include <toml++/toml.hpp>

#include <charconv>
#include <cstdlib>
#include <string_view>

namespace diagnostics_engine {

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::NotFound, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [engine]
        if (auto engine = tbl["engine"]; engine.is_table()) {
            config.engine.working_root =
                engine["working_root"].value_or(std::string{"./diagnostics"});
            config.engine.watchdog_interval_ms = static_cast<uint32_t>(
                engine["watchdog_interval_ms"].value_or(int64_t{500}));
            config.engine.default_user =
                engine["default_user"].value_or(std::string{"SYSTEM"});
        }

        // [pool]
        if (auto pool = tbl["pool"]; pool.is_table()) {
            config.pool.core_size = static_cast<uint32_t>(
                pool["core_size"].value_or(int64_t{10}));
            config.pool.keep_alive_ms = static_cast<uint32_t>(
                pool["keep_alive_ms"].value_or(int64_t{5000}));
        }

        // [persistence]
        if (auto persistence = tbl["persistence"]; persistence.is_table()) {
            config.persistence.state_file =
                persistence["state_file"].value_or(std::string{"diagnosticsSessions.toml"});
            config.persistence.lazy_save_min_delay_ms = static_cast<uint32_t>(
                persistence["lazy_save_min_delay_ms"].value_or(int64_t{1000}));
        }

        // [telemetry]
        if (auto telemetry = tbl["telemetry"]; telemetry.is_table()) {
            config.telemetry.log_dir = telemetry["log_dir"].value_or(std::string{"./logs"});
            config.telemetry.max_file_size_mb = static_cast<uint32_t>(
                telemetry["max_file_size_mb"].value_or(int64_t{50}));
            config.telemetry.rotate_count = static_cast<uint32_t>(
                telemetry["rotate_count"].value_or(int64_t{5}));
            config.telemetry.log_level = telemetry["log_level"].value_or(std::string{"info"});
        }

        if (config.pool.core_size == 0) {
            return Error{ErrorCode::InvalidArgument, "pool.core_size must be at least 1"};
        }
        if (config.engine.watchdog_interval_ms == 0) {
            return Error{ErrorCode::InvalidArgument, "engine.watchdog_interval_ms must be positive"};
        }

        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::Parse,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

Result<void> apply_environment(Config& config) {
    const char* raw = std::getenv(POOL_SIZE_ENV);
    if (raw == nullptr || *raw == '\0') return {};

    std::string_view text{raw};
    uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
        return Error{ErrorCode::InvalidArgument,
                     std::string{"Ignoring invalid "} + POOL_SIZE_ENV + "=" + std::string{text}};
    }
    config.pool.core_size = value;
    return {};
}

}  // namespace diagnostics_engine
