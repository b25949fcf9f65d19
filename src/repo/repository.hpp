/**
 * @file repository.hpp
 * @brief Locating and creating wires repositories on disk.
 *
 * A repository is any directory holding `<dir_name>/<db_name>` (by default
 * `.wires/wires.db`). The engine receives a RepositoryHandle and never
 * looks at the current working directory itself.
 */

#pragma once

#include "core/config.hpp"
#include "core/result.hpp"

#include <filesystem>

namespace wires {

struct RepositoryHandle {
    std::filesystem::path root;       ///< Directory containing the data dir
    std::filesystem::path data_dir;   ///< root / dir_name
    std::filesystem::path db_path;    ///< data_dir / db_name
};

/// Handle for a repository rooted at `root`, without touching the disk.
[[nodiscard]] RepositoryHandle make_handle(const std::filesystem::path& root,
                                           const RepositoryConfig& config);

/**
 * @brief Create `<dir>/<dir_name>/<db_name>` with the wires schema.
 *
 * Fails with AlreadyInitialized when the data directory already exists.
 */
Result<RepositoryHandle> init_repository(const std::filesystem::path& dir, const Config& config);

/**
 * @brief Walk from `start` towards the filesystem root looking for a database.
 *
 * Fails with RepositoryNotFound if no ancestor (including `start`) has one.
 */
Result<RepositoryHandle> discover_repository(const std::filesystem::path& start,
                                             const RepositoryConfig& config);

/// Per-repository configuration file, `<data_dir>/config.toml`.
[[nodiscard]] std::filesystem::path config_path(const RepositoryHandle& handle);

}  // namespace wires
