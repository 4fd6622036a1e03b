/**
 * @file config.hpp
 * @brief Engine configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace diagnostics_engine {

struct EngineConfig {
    std::filesystem::path working_root = "./diagnostics";
    uint32_t watchdog_interval_ms = 500;
    std::string default_user = "SYSTEM";
};

struct PoolConfig {
    uint32_t core_size = 10;
    uint32_t keep_alive_ms = 5000;      ///< Idle workers exit after this long
};

struct PersistenceConfig {
    std::string state_file = "diagnosticsSessions.toml";   ///< Relative to working_root
    uint32_t lazy_save_min_delay_ms = 1000;
};

struct TelemetryConfig {
    std::filesystem::path log_dir = "./logs";
    uint32_t max_file_size_mb = 50;
    uint32_t rotate_count = 5;
    std::string log_level = "info";
};

/**
 * @brief Top-level engine configuration.
 */
struct Config {
    EngineConfig engine;
    PoolConfig pool;
    PersistenceConfig persistence;
    TelemetryConfig telemetry;

    [[nodiscard]] std::filesystem::path state_file_path() const {
        return engine.working_root / persistence.state_file;
    }
};

/// Environment variable overriding pool.core_size.
inline constexpr const char* POOL_SIZE_ENV = "DIAGNOSTICS_POOL_SIZE";

/**
 * @brief Load configuration from a TOML file.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

/**
 * @brief Apply DIAGNOSTICS_POOL_SIZE when it holds a positive integer.
 *
 * @return an error describing a present but invalid value; the config is
 *         left untouched in that case.
 */
Result<void> apply_environment(Config& config);

}  // namespace diagnostics_engine
