/**
 * @file test_thread_pool_adapter.cpp
 * @brief Unit tests for the task pool adapters
 */

#include <gtest/gtest.h>

#include <kcenon/vector_transfer/adapters/thread_pool_adapter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <vector>

namespace kcenon::vector_transfer::adapters::test {

class AsyncTaskPoolTest : public ::testing::Test {
protected:
    async_task_pool pool_;
};

TEST_F(AsyncTaskPoolTest, RunsSubmittedTasks) {
    std::atomic<int> runs{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 8; ++i) {
        futures.push_back(pool_.submit([&runs] { ++runs; }));
    }
    for (auto& f : futures) {
        f.get();
    }

    EXPECT_EQ(runs.load(), 8);
    EXPECT_EQ(pool_.pending_tasks(), 0u);
    EXPECT_TRUE(pool_.is_running());
    EXPECT_GT(pool_.worker_count(), 0u);
}

TEST_F(AsyncTaskPoolTest, TracksPendingTasksPerStage) {
    std::promise<void> release;
    auto gate = release.get_future().share();

    auto upload = pool_.submit_to_stage([gate] { gate.wait(); },
                                        std::string(task_stage::part_upload));

    EXPECT_EQ(pool_.pending_tasks(std::string(task_stage::part_upload)), 1u);
    EXPECT_EQ(pool_.pending_tasks(std::string(task_stage::prefetch)), 0u);
    EXPECT_EQ(pool_.pending_tasks(), 1u);

    release.set_value();
    upload.get();

    EXPECT_EQ(pool_.pending_tasks(std::string(task_stage::part_upload)), 0u);
    EXPECT_EQ(pool_.pending_tasks(), 0u);
}

TEST_F(AsyncTaskPoolTest, ExceptionReachesFutureAndCountsDrop) {
    auto failing = pool_.submit_to_stage([] { throw std::runtime_error("boom"); },
                                         std::string(task_stage::prefetch));

    EXPECT_THROW(failing.get(), std::runtime_error);
    EXPECT_EQ(pool_.pending_tasks(std::string(task_stage::prefetch)), 0u);
    EXPECT_EQ(pool_.pending_tasks(), 0u);
}

TEST_F(AsyncTaskPoolTest, TasksOutliveThePool) {
    std::promise<void> release;
    auto gate = release.get_future().share();
    std::future<void> pending;
    {
        async_task_pool scoped;
        pending = scoped.submit_to_stage([gate] { gate.wait(); },
                                         std::string(task_stage::prefetch));
    }

    release.set_value();
    EXPECT_NO_THROW(pending.get());
}

// ============================================================================
// task_pool_factory
// ============================================================================

TEST(TaskPoolFactoryTest, CreateReturnsRunningPool) {
    auto pool = task_pool_factory::create(2, "factory_test_pool");

    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());

    std::atomic<bool> ran{false};
    pool->submit([&ran] { ran = true; }).get();
    EXPECT_TRUE(ran.load());
}

TEST(TaskPoolFactoryTest, SharedDefaultIsSingleton) {
    auto first = task_pool_factory::shared_default();
    auto second = task_pool_factory::shared_default();

    ASSERT_NE(first, nullptr);
    EXPECT_EQ(first.get(), second.get());
}

TEST(TaskPoolFactoryTest, ReportsThreadSystemAvailability) {
#if KCENON_WITH_THREAD_SYSTEM
    EXPECT_TRUE(task_pool_factory::has_thread_system());
#else
    EXPECT_FALSE(task_pool_factory::has_thread_system());
#endif
}

}  // namespace kcenon::vector_transfer::adapters::test
