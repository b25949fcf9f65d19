/**
 * @file test_repository.cpp
 * @brief Repository initialisation and discovery on a real filesystem.
 */

#include "repo/repository.hpp"
#include "store/schema.hpp"
#include "store/sqlite_db.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <unistd.h>

using namespace wires;

class RepositoryTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
             / ("wires_test_repo_" + std::to_string(::getpid()) + "_"
                + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(RepositoryTest, InitCreatesDatabase) {
    auto handle = init_repository(dir_, default_config());
    ASSERT_TRUE(handle.has_value()) << handle.error().message;
    EXPECT_EQ(handle->data_dir, handle->root / ".wires");
    EXPECT_EQ(handle->db_path, handle->data_dir / "wires.db");
    EXPECT_TRUE(std::filesystem::is_regular_file(handle->db_path));
    EXPECT_EQ(config_path(*handle), handle->data_dir / "config.toml");

    auto db = SqliteDb::open(handle->db_path, StoreConfig{}, SqliteDb::OpenMode::OpenExisting);
    ASSERT_TRUE(db.has_value());
    EXPECT_TRUE(verify_schema(**db).has_value());
}

TEST_F(RepositoryTest, InitTwiceFails) {
    ASSERT_TRUE(init_repository(dir_, default_config()).has_value());
    auto again = init_repository(dir_, default_config());
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, ErrorCode::AlreadyInitialized);
}

TEST_F(RepositoryTest, FailedStoreSetupLeavesNothingBehind) {
    Config broken = default_config();
    broken.store.journal_mode = "BOGUS;CREATE";

    auto first = init_repository(dir_, broken);
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::StoreFailure);
    EXPECT_FALSE(std::filesystem::exists(dir_ / ".wires"));

    auto found = discover_repository(dir_, RepositoryConfig{});
    ASSERT_FALSE(found.has_value());
    EXPECT_EQ(found.error().code, ErrorCode::RepositoryNotFound);

    auto second = init_repository(dir_, default_config());
    ASSERT_TRUE(second.has_value()) << second.error().message;
    EXPECT_TRUE(discover_repository(dir_, RepositoryConfig{}).has_value());
}

TEST_F(RepositoryTest, FailedOpenLeavesNothingBehind) {
    // SQLite does not create intermediate directories.
    Config broken = default_config();
    broken.repository.db_name = "missing/wires.db";

    auto first = init_repository(dir_, broken);
    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::StoreFailure);
    EXPECT_FALSE(std::filesystem::exists(dir_ / ".wires"));

    EXPECT_TRUE(init_repository(dir_, default_config()).has_value());
}

TEST_F(RepositoryTest, DiscoverFromNestedDirectory) {
    auto created = init_repository(dir_, default_config());
    ASSERT_TRUE(created.has_value());

    auto nested = dir_ / "src" / "deep" / "er";
    std::filesystem::create_directories(nested);

    auto found = discover_repository(nested, RepositoryConfig{});
    ASSERT_TRUE(found.has_value()) << found.error().message;
    EXPECT_EQ(found->db_path, created->db_path);
}

TEST_F(RepositoryTest, NearestRepositoryWins) {
    ASSERT_TRUE(init_repository(dir_, default_config()).has_value());
    auto inner_root = dir_ / "inner";
    std::filesystem::create_directories(inner_root);
    auto inner = init_repository(inner_root, default_config());
    ASSERT_TRUE(inner.has_value());

    auto found = discover_repository(inner_root / ".", RepositoryConfig{});
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->db_path, inner->db_path);
}

TEST_F(RepositoryTest, NotFound) {
    // A bare data directory without a database does not count.
    std::filesystem::create_directories(dir_ / "bare" / "nested");
    std::filesystem::create_directories(dir_ / "bare" / "nested" / ".wires-other");

    RepositoryConfig config;
    config.dir_name = ".wires-other";
    config.db_name = "absent.db";
    auto found = discover_repository(dir_ / "bare" / "nested", config);
    ASSERT_FALSE(found.has_value());
    EXPECT_EQ(found.error().code, ErrorCode::RepositoryNotFound);
    EXPECT_EQ(found.error().message.rfind("Not a wires repository (or any parent directory)", 0), 0u);
}

TEST_F(RepositoryTest, CustomNames) {
    Config config = default_config();
    config.repository.dir_name = ".tracker";
    config.repository.db_name = "graph.sqlite";

    auto handle = init_repository(dir_, config);
    ASSERT_TRUE(handle.has_value());
    EXPECT_TRUE(std::filesystem::is_regular_file(dir_ / ".tracker" / "graph.sqlite"));

    EXPECT_TRUE(discover_repository(dir_, config.repository).has_value());
}
