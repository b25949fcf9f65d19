/**
 * @file config.hpp
 * @brief Repository configuration with TOML deserialization.
 */

#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

#include "core/result.hpp"

namespace wires {

struct RepositoryConfig {
    std::string dir_name = ".wires";
    std::string db_name = "wires.db";
};

struct StoreConfig {
    uint32_t busy_timeout_ms = 5000;    ///< SQLite lock wait before SQLITE_BUSY
    std::string journal_mode = "WAL";   ///< "WAL", "DELETE", "TRUNCATE"
    std::string synchronous = "NORMAL"; ///< "OFF", "NORMAL", "FULL"
};

struct IdConfig {
    uint32_t max_attempts = 8;          ///< Regenerations before IdSpaceExhausted
};

struct LoggingConfig {
    std::string level = "warn";
    std::filesystem::path file;         ///< Empty = stderr
    uint32_t max_file_size_kb = 1024;
    uint32_t rotate_count = 3;
};

struct OutputConfig {
    std::string format = "auto";        ///< "auto", "json", "table"
};

/**
 * @brief Top-level configuration.
 */
struct Config {
    RepositoryConfig repository;
    StoreConfig store;
    IdConfig ids;
    LoggingConfig logging;
    OutputConfig output;
};

/**
 * @brief Load configuration from a TOML file.
 *
 * Missing keys keep their defaults. Values outside their closed sets
 * (journal mode, log level, output format, ...) are rejected with
 * ErrorCode::ConfigError.
 */
Result<Config> load_config(const std::filesystem::path& path);

/**
 * @brief Create a default configuration.
 */
Config default_config();

}  // namespace wires
