/**
 * @file schema.hpp
 * @brief Table layout of a wires database.
 */

#pragma once

#include "core/result.hpp"
#include "store/sqlite_db.hpp"

namespace wires {

/// Value of PRAGMA user_version written by create_schema().
inline constexpr int kSchemaVersion = 1;

/**
 * @brief Create the wires and dependencies tables and their indexes.
 *
 * Runs in its own transaction; fails if the tables already exist.
 */
Result<void> create_schema(SqliteDb& db);

/**
 * @brief Check that an opened database carries a schema this build understands.
 */
Result<void> verify_schema(SqliteDb& db);

}  // namespace wires
