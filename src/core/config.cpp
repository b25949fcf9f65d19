/**
 * @file config.cpp
 * @brief Configuration loading from TOML files using toml++.
 */

#include "core/config.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <limits>
#include <string_view>

#include <toml++/toml.hpp>

namespace wires {

namespace {

template <size_t N>
bool one_of(const std::string& value, const std::array<std::string_view, N>& allowed) {
    return std::find(allowed.begin(), allowed.end(), value) != allowed.end();
}

/// Integer setting in [minimum, INT32_MAX]; an absent key yields `fallback`.
Result<uint32_t> read_count(toml::node_view<toml::node> table, std::string_view section,
                            std::string_view key, uint32_t fallback, int64_t minimum) {
    constexpr int64_t kMax = std::numeric_limits<int32_t>::max();
    auto node = table[key];
    if (!node) return fallback;

    auto value = node.value_exact<int64_t>();
    if (!value || *value < minimum || *value > kMax) {
        return Error{ErrorCode::ConfigError,
                     std::string{section} + "." + std::string{key} + " must be an integer between "
                         + std::to_string(minimum) + " and " + std::to_string(kMax)};
    }
    return static_cast<uint32_t>(*value);
}

Result<void> validate(const Config& config) {
    static constexpr std::array<std::string_view, 3> kJournalModes{"WAL", "DELETE", "TRUNCATE"};
    static constexpr std::array<std::string_view, 3> kSyncModes{"OFF", "NORMAL", "FULL"};
    static constexpr std::array<std::string_view, 3> kFormats{"auto", "json", "table"};

    if (config.repository.dir_name.empty() || config.repository.db_name.empty()) {
        return Error{ErrorCode::ConfigError, "repository.dir_name and repository.db_name must be non-empty"};
    }
    if (!one_of(config.store.journal_mode, kJournalModes)) {
        return Error{ErrorCode::ConfigError, "Unsupported store.journal_mode: " + config.store.journal_mode};
    }
    if (!one_of(config.store.synchronous, kSyncModes)) {
        return Error{ErrorCode::ConfigError, "Unsupported store.synchronous: " + config.store.synchronous};
    }
    if (config.ids.max_attempts == 0) {
        return Error{ErrorCode::ConfigError, "ids.max_attempts must be at least 1"};
    }
    if (!log_level_from_string(config.logging.level)) {
        return Error{ErrorCode::ConfigError, "Unknown logging.level: " + config.logging.level};
    }
    if (!one_of(config.output.format, kFormats)) {
        return Error{ErrorCode::ConfigError, "Unknown output.format: " + config.output.format};
    }
    return {};
}

}  // namespace

Result<Config> load_config(const std::filesystem::path& path) {
    if (!std::filesystem::exists(path)) {
        return Error{ErrorCode::ConfigError, "Configuration file not found: " + path.string()};
    }

    try {
        auto tbl = toml::parse_file(path.string());
        Config config;

        // [repository]
        if (auto repository = tbl["repository"]; repository.is_table()) {
            config.repository.dir_name = repository["dir_name"].value_or(std::string{".wires"});
            config.repository.db_name = repository["db_name"].value_or(std::string{"wires.db"});
        }

        // [store]
        if (auto store = tbl["store"]; store.is_table()) {
            auto busy_timeout = read_count(store, "store", "busy_timeout_ms", 5000, 0);
            if (!busy_timeout) return busy_timeout.error();
            config.store.busy_timeout_ms = *busy_timeout;
            config.store.journal_mode = store["journal_mode"].value_or(std::string{"WAL"});
            config.store.synchronous = store["synchronous"].value_or(std::string{"NORMAL"});
        }

        // [ids]
        if (auto ids = tbl["ids"]; ids.is_table()) {
            auto attempts = read_count(ids, "ids", "max_attempts", 8, 1);
            if (!attempts) return attempts.error();
            config.ids.max_attempts = *attempts;
        }

        // [logging]
        if (auto logging = tbl["logging"]; logging.is_table()) {
            config.logging.level = logging["level"].value_or(std::string{"warn"});
            config.logging.file = logging["file"].value_or(std::string{});
            auto size_kb = read_count(logging, "logging", "max_file_size_kb", 1024, 1);
            if (!size_kb) return size_kb.error();
            config.logging.max_file_size_kb = *size_kb;

            // 0 truncates the log instead of keeping generations.
            auto rotations = read_count(logging, "logging", "rotate_count", 3, 0);
            if (!rotations) return rotations.error();
            config.logging.rotate_count = *rotations;
        }

        // [output]
        if (auto output = tbl["output"]; output.is_table()) {
            config.output.format = output["format"].value_or(std::string{"auto"});
        }

        if (auto valid = validate(config); !valid) {
            return valid.error();
        }
        return config;

    } catch (const toml::parse_error& err) {
        return Error{ErrorCode::ConfigError,
                     std::string{"TOML parse error: "} + std::string{err.description()}};
    }
}

Config default_config() {
    return Config{};
}

}  // namespace wires
