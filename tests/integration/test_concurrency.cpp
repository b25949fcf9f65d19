/**
 * @file test_concurrency.cpp
 * @brief Two connections racing to add opposite edges.
 *
 * Each thread owns its own WireEngine (and so its own SQLite connection).
 * Write transactions start with BEGIN IMMEDIATE, so the second writer waits
 * on busy_timeout and then sees the first writer's edge during its cycle
 * check. Exactly one of A->B and B->A may survive.
 */

#include "engine/wire_engine.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <atomic>
#include <filesystem>
#include <thread>
#include <unistd.h>

using namespace wires;

class ConcurrencyTest : public ::testing::Test {
protected:
    std::filesystem::path dir_;
    Config config_ = default_config();
    RepositoryHandle handle_;

    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path()
             / ("wires_test_concurrency_" + std::to_string(::getpid()) + "_"
                + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(dir_);
        std::filesystem::create_directories(dir_);

        config_.store.busy_timeout_ms = 10000;
        auto handle = init_repository(dir_, config_);
        ASSERT_TRUE(handle.has_value()) << handle.error().message;
        handle_ = *handle;
    }

    void TearDown() override {
        std::filesystem::remove_all(dir_);
    }
};

TEST_F(ConcurrencyTest, OppositeEdgesNeverBothCommit) {
    Logger logger(std::make_unique<NullSink>());

    WireId a;
    WireId b;
    {
        auto engine = WireEngine::open(handle_, config_, logger);
        ASSERT_TRUE(engine.has_value());
        auto wa = (*engine)->create("A");
        auto wb = (*engine)->create("B");
        ASSERT_TRUE(wa.has_value() && wb.has_value());
        a = wa->id;
        b = wb->id;
    }

    constexpr int kRounds = 20;
    for (int round = 0; round < kRounds; ++round) {
        std::atomic<int> added{0};
        std::atomic<int> rejected{0};
        std::atomic<int> failed{0};
        std::atomic<bool> go{false};

        auto racer = [&](const WireId& from, const WireId& to) {
            auto engine = WireEngine::open(handle_, config_, logger);
            if (!engine) {
                failed++;
                return;
            }
            while (!go.load()) std::this_thread::yield();
            auto result = (*engine)->add_dependency(from, to);
            if (result) {
                added++;
            } else if (result.error().code == ErrorCode::CircularDependency) {
                rejected++;
            } else {
                failed++;
            }
        };

        std::thread first(racer, a, b);
        std::thread second(racer, b, a);
        go = true;
        first.join();
        second.join();

        ASSERT_EQ(failed.load(), 0) << "round " << round;
        EXPECT_EQ(added.load(), 1) << "round " << round;
        EXPECT_EQ(rejected.load(), 1) << "round " << round;

        auto engine = WireEngine::open(handle_, config_, logger);
        ASSERT_TRUE(engine.has_value());
        auto graph = (*engine)->graph();
        ASSERT_TRUE(graph.has_value());
        ASSERT_EQ(graph->edges.size(), 1u);

        // Reset for the next round.
        const auto& edge = graph->edges.front();
        auto removed = (*engine)->remove_dependency(edge.wire_id, edge.depends_on);
        ASSERT_TRUE(removed.has_value() && *removed);
    }
}
