/**
 * @file repository.cpp
 * @brief Repository discovery and initialisation.
 */

#include "repo/repository.hpp"

#include "store/schema.hpp"
#include "store/sqlite_db.hpp"

#include <system_error>

namespace wires {

namespace {

/// Create the database and schema; the connection is closed on return.
Result<void> create_store(const RepositoryHandle& handle, const StoreConfig& config) {
    auto db = SqliteDb::open(handle.db_path, config, SqliteDb::OpenMode::Create);
    if (!db) return db.error();
    return create_schema(**db);
}

}  // namespace

RepositoryHandle make_handle(const std::filesystem::path& root, const RepositoryConfig& config) {
    RepositoryHandle handle;
    handle.root = root;
    handle.data_dir = root / config.dir_name;
    handle.db_path = handle.data_dir / config.db_name;
    return handle;
}

Result<RepositoryHandle> init_repository(const std::filesystem::path& dir, const Config& config) {
    std::error_code ec;
    auto root = std::filesystem::absolute(dir, ec);
    if (ec) {
        return Error{ErrorCode::StoreFailure, "Cannot resolve " + dir.string() + ": " + ec.message()};
    }

    auto handle = make_handle(root, config.repository);
    if (std::filesystem::exists(handle.data_dir, ec)) {
        return Error{ErrorCode::AlreadyInitialized,
                     "Wires repository already initialized at " + handle.data_dir.string()};
    }

    std::filesystem::create_directories(handle.data_dir, ec);
    if (ec) {
        return Error{ErrorCode::StoreFailure,
                     "Cannot create " + handle.data_dir.string() + ": " + ec.message()};
    }

    // The data directory is new; remove it again if the store cannot be set up.
    if (auto populated = create_store(handle, config.store); !populated) {
        Error error = populated.error();
        std::filesystem::remove_all(handle.data_dir, ec);
        if (ec) {
            error.message += " (could not remove " + handle.data_dir.string() + ": "
                           + ec.message() + ")";
        }
        return error;
    }
    return handle;
}

Result<RepositoryHandle> discover_repository(const std::filesystem::path& start,
                                             const RepositoryConfig& config) {
    std::error_code ec;
    auto current = std::filesystem::absolute(start, ec);
    if (ec) {
        return Error{ErrorCode::RepositoryNotFound,
                     "Not a wires repository (or any parent directory): " + start.string()};
    }
    current = current.lexically_normal();

    while (true) {
        auto handle = make_handle(current, config);
        if (std::filesystem::is_regular_file(handle.db_path, ec)) {
            return handle;
        }
        auto parent = current.parent_path();
        if (parent.empty() || parent == current) break;
        current = std::move(parent);
    }

    return Error{ErrorCode::RepositoryNotFound,
                 "Not a wires repository (or any parent directory): " + start.string()};
}

std::filesystem::path config_path(const RepositoryHandle& handle) {
    return handle.data_dir / "config.toml";
}

}  // namespace wires
