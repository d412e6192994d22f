/**
 * @file test_upload_pool.cpp
 * @brief Unit tests for the worker pool adapters
 */

#include <gtest/gtest.h>

#include <kcenon/chunk_upload/adapters/upload_pool.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::chunk_upload::adapters::test {

using namespace std::chrono_literals;

class UploadPoolTest : public ::testing::TestWithParam<std::string> {
protected:
    void SetUp() override {
        if (GetParam() == "thread_system") {
#if KCENON_WITH_THREAD_SYSTEM
            pool_ = thread_system_upload_pool::create_default(2, "test_pool");
#else
            GTEST_SKIP() << "thread_system not available";
#endif
        } else {
            pool_ = std::make_shared<async_upload_pool>();
        }
    }

    std::shared_ptr<upload_pool_interface> pool_;
};

TEST_P(UploadPoolTest, IsRunning) {
    EXPECT_TRUE(pool_->is_running());
    EXPECT_GT(pool_->worker_count(), 0u);
    EXPECT_EQ(pool_->pending_tasks(), 0u);
}

TEST_P(UploadPoolTest, SubmitRunsTask) {
    std::atomic<bool> ran{false};

    auto future = pool_->submit([&ran]() { ran = true; });

    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    future.get();
    EXPECT_TRUE(ran);
}

TEST_P(UploadPoolTest, ManyTasksComplete) {
    std::atomic<int> counter{0};
    std::vector<std::future<void>> futures;

    for (int i = 0; i < 20; ++i) {
        futures.push_back(pool_->submit([&counter]() { ++counter; }, "batch"));
    }
    for (auto& f : futures) {
        ASSERT_EQ(f.wait_for(10s), std::future_status::ready);
        f.get();
    }

    EXPECT_EQ(counter.load(), 20);
    EXPECT_EQ(pool_->pending_tasks("batch"), 0u);
}

TEST_P(UploadPoolTest, ExceptionIsStoredInFuture) {
    auto future = pool_->submit([]() { throw std::runtime_error("task failed"); });

    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    EXPECT_THROW(future.get(), std::runtime_error);
    EXPECT_EQ(pool_->pending_tasks(), 0u);
}

TEST_P(UploadPoolTest, PendingTasksPerTag) {
    std::promise<void> gate;
    auto released = gate.get_future().share();

    auto blocked = pool_->submit([released]() { released.wait(); }, "chunk");

    EXPECT_EQ(pool_->pending_tasks("chunk"), 1u);
    EXPECT_EQ(pool_->pending_tasks("batch"), 0u);
    EXPECT_EQ(pool_->pending_tasks(), 1u);

    gate.set_value();
    ASSERT_EQ(blocked.wait_for(10s), std::future_status::ready);
    blocked.get();

    EXPECT_EQ(pool_->pending_tasks("chunk"), 0u);
    EXPECT_EQ(pool_->pending_tasks(), 0u);
}

TEST_P(UploadPoolTest, SubmitForResultReturnsValue) {
    auto future = submit_for_result(*pool_, []() { return std::string("done"); }, "result");

    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(future.get(), "done");
}

TEST_P(UploadPoolTest, SubmitForResultPropagatesException) {
    auto future = submit_for_result(*pool_, []() -> int { throw std::logic_error("bad"); });

    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    EXPECT_THROW(future.get(), std::logic_error);
}

INSTANTIATE_TEST_SUITE_P(Pools,
                         UploadPoolTest,
                         ::testing::Values("thread_system", "async"),
                         [](const ::testing::TestParamInfo<std::string>& info) {
                             return info.param;
                         });

// ============================================================================
// Fallback Pool Tests
// ============================================================================

TEST(AsyncUploadPoolTest, DestructorWaitsForRunningTasks) {
    std::atomic<bool> finished{false};
    std::future<void> future;

    {
        async_upload_pool pool;
        future = pool.submit([&finished]() {
            std::this_thread::sleep_for(50ms);
            finished = true;
        });
    }

    EXPECT_TRUE(finished);
    ASSERT_EQ(future.wait_for(0s), std::future_status::ready);
    future.get();
}

TEST(AsyncUploadPoolTest, DroppedFutureDoesNotBlockSubmit) {
    async_upload_pool pool;
    std::promise<void> gate;
    auto released = gate.get_future().share();

    // Would deadlock if the discarded future joined the task
    (void)pool.submit([released]() { released.wait(); }, "chunk");
    EXPECT_EQ(pool.pending_tasks("chunk"), 1u);

    gate.set_value();
}

// ============================================================================
// Factory Tests
// ============================================================================

TEST(UploadPoolFactoryTest, CreatesRunningPool) {
    auto pool = upload_pool_factory::create(2, "factory_pool");

    ASSERT_NE(pool, nullptr);
    EXPECT_TRUE(pool->is_running());

    auto future = submit_for_result(*pool, []() { return 42; });
    ASSERT_EQ(future.wait_for(10s), std::future_status::ready);
    EXPECT_EQ(future.get(), 42);
}

TEST(UploadPoolFactoryTest, ReportsThreadSystemAvailability) {
#if KCENON_WITH_THREAD_SYSTEM
    EXPECT_TRUE(upload_pool_factory::has_thread_system());
#else
    EXPECT_FALSE(upload_pool_factory::has_thread_system());
#endif
}

}  // namespace kcenon::chunk_upload::adapters::test
