/**
 * @file test_chunk_planner.cpp
 * @brief Unit tests for chunk range planning
 */

#include <gtest/gtest.h>

#include <kcenon/chunk_upload/core/chunk_planner.h>

namespace kcenon::chunk_upload::test {

class ChunkPlannerTest : public ::testing::Test {
protected:
    static constexpr uint64_t kFileSize = 20000000;
    static constexpr uint64_t kChunk = 8388608;
};

TEST_F(ChunkPlannerTest, DefaultChunkSizeIsEightMebibytes) {
    EXPECT_EQ(default_chunk_size, 8388608u);
}

TEST_F(ChunkPlannerTest, FirstChunk) {
    auto plan = plan_chunk(kFileSize, kChunk, 0);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().offset, 0u);
    EXPECT_EQ(plan.value().length, kChunk);
    EXPECT_EQ(plan.value().end(), kChunk);
    EXPECT_FALSE(plan.value().is_final);
}

TEST_F(ChunkPlannerTest, MiddleChunk) {
    auto plan = plan_chunk(kFileSize, kChunk, kChunk);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().end(), 16777216u);
    EXPECT_FALSE(plan.value().is_final);
}

TEST_F(ChunkPlannerTest, LastChunkIsShort) {
    auto plan = plan_chunk(kFileSize, kChunk, 16777216);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().length, kFileSize - 16777216);
    EXPECT_EQ(plan.value().end(), kFileSize);
    EXPECT_TRUE(plan.value().is_final);
}

TEST_F(ChunkPlannerTest, ChunkLargerThanFile) {
    auto plan = plan_chunk(1000, kChunk, 0);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().length, 1000u);
    EXPECT_TRUE(plan.value().is_final);
}

TEST_F(ChunkPlannerTest, ExactMultipleEndsOnBoundary) {
    auto plan = plan_chunk(2 * kChunk, kChunk, kChunk);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().length, kChunk);
    EXPECT_TRUE(plan.value().is_final);
}

TEST_F(ChunkPlannerTest, OffsetAtEndYieldsEmptyFinalRange) {
    auto plan = plan_chunk(kFileSize, kChunk, kFileSize);

    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan.value().length, 0u);
    EXPECT_TRUE(plan.value().is_final);
}

TEST_F(ChunkPlannerTest, ZeroChunkSizeIsRejected) {
    auto plan = plan_chunk(kFileSize, 0, 0);

    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::invalid_chunk_size);
}

TEST_F(ChunkPlannerTest, EmptyFileIsRejected) {
    auto plan = plan_chunk(0, kChunk, 0);

    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::local_file_empty);
}

TEST_F(ChunkPlannerTest, OffsetPastEndIsRejected) {
    auto plan = plan_chunk(kFileSize, kChunk, kFileSize + 1);

    ASSERT_FALSE(plan.has_value());
    EXPECT_EQ(plan.error().code, error_code::invalid_offset);
}

TEST_F(ChunkPlannerTest, OneByteChunks) {
    uint64_t offset = 0;
    int calls = 0;
    while (true) {
        auto plan = plan_chunk(3, 1, offset);
        ASSERT_TRUE(plan.has_value());
        ++calls;
        offset = plan.value().end();
        if (plan.value().is_final) {
            break;
        }
    }

    EXPECT_EQ(calls, 3);
    EXPECT_EQ(offset, 3u);
}

TEST_F(ChunkPlannerTest, CompletionPercent) {
    EXPECT_DOUBLE_EQ(completion_percent(0, 200), 0.0);
    EXPECT_DOUBLE_EQ(completion_percent(50, 200), 25.0);
    EXPECT_DOUBLE_EQ(completion_percent(200, 200), 100.0);
    EXPECT_DOUBLE_EQ(completion_percent(300, 200), 100.0);
    EXPECT_DOUBLE_EQ(completion_percent(0, 0), 100.0);
}

TEST_F(ChunkPlannerTest, RemainingChunks) {
    EXPECT_EQ(remaining_chunks(kFileSize, kChunk, 0), 3u);
    EXPECT_EQ(remaining_chunks(kFileSize, kChunk, kChunk), 2u);
    EXPECT_EQ(remaining_chunks(kFileSize, kChunk, 16777216), 1u);
    EXPECT_EQ(remaining_chunks(kFileSize, kChunk, kFileSize), 0u);
    EXPECT_EQ(remaining_chunks(kFileSize, 0, 0), 0u);
}

}  // namespace kcenon::chunk_upload::test
