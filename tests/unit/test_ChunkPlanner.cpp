#include <gtest/gtest.h>
#include "sync/ChunkPlanner.hpp"

#include <cmath>
#include <limits>

using namespace es::sync;
using es::config::MiB;

class ChunkPlannerTest : public ::testing::Test {
protected:
    ChunkPlanner planner;
};

TEST_F(ChunkPlannerTest, SlowLinkUsesSmallChunks) {
    EXPECT_EQ(planner.chunkSizeFor(0.0), 5 * MiB);
    EXPECT_EQ(planner.chunkSizeFor(1.0), 5 * MiB);
    EXPECT_EQ(planner.chunkSizeFor(1.999), 5 * MiB);
}

TEST_F(ChunkPlannerTest, MediumTierIsInclusiveAtBothEnds) {
    EXPECT_EQ(planner.chunkSizeFor(2.0), 25 * MiB);
    EXPECT_EQ(planner.chunkSizeFor(5.0), 25 * MiB);
    EXPECT_EQ(planner.chunkSizeFor(10.0), 25 * MiB);
}

TEST_F(ChunkPlannerTest, FastLinkUsesLargeChunks) {
    EXPECT_EQ(planner.chunkSizeFor(10.001), 100 * MiB);
    EXPECT_EQ(planner.chunkSizeFor(1000.0), 100 * MiB);
}

TEST_F(ChunkPlannerTest, UntrustworthyReadingsPlanForTheWorstLink) {
    EXPECT_EQ(planner.chunkSizeFor(std::numeric_limits<double>::quiet_NaN()), 5 * MiB);
    EXPECT_EQ(planner.chunkSizeFor(-3.0), 5 * MiB);
    EXPECT_EQ(planner.chunkSizeFor(std::numeric_limits<double>::infinity()), 5 * MiB);
}

TEST_F(ChunkPlannerTest, TwelveMegabytesAtOneMbpsIsThreeChunks) {
    const auto plan = planner.plan(12 * MiB, 1.0);
    EXPECT_EQ(plan.chunk_size, 5 * MiB);
    EXPECT_EQ(plan.chunk_count, 3u);
}

TEST_F(ChunkPlannerTest, ChunkCountIsCeiling) {
    EXPECT_EQ(planner.plan(1, 50.0).chunk_count, 1u);
    EXPECT_EQ(planner.plan(100 * MiB, 50.0).chunk_count, 1u);
    EXPECT_EQ(planner.plan(100 * MiB + 1, 50.0).chunk_count, 2u);
    EXPECT_EQ(planner.plan(50 * MiB, 5.0).chunk_count, 2u);
}

TEST_F(ChunkPlannerTest, PlanCoversFileWithoutASpareChunk) {
    for (const double mbps : {0.5, 2.0, 7.5, 10.0, 12.0, 250.0}) {
        for (const uint64_t size : {uint64_t{1}, 5 * MiB - 1, 5 * MiB, 5 * MiB + 1, 3 * 1024 * MiB + 17}) {
            const auto plan = planner.plan(size, mbps);
            EXPECT_GE(plan.chunk_count * plan.chunk_size, size);
            EXPECT_LT((plan.chunk_count - 1) * plan.chunk_size, size);
        }
    }
}

TEST_F(ChunkPlannerTest, PlanIsDeterministic) {
    const auto a = planner.plan(777 * MiB + 3, 6.2);
    const auto b = planner.plan(777 * MiB + 3, 6.2);
    EXPECT_EQ(a.chunk_size, b.chunk_size);
    EXPECT_EQ(a.chunk_count, b.chunk_count);
}

TEST_F(ChunkPlannerTest, EmptyFileIsRejected) {
    EXPECT_THROW(planner.plan(0, 5.0), std::invalid_argument);
}

TEST_F(ChunkPlannerTest, TiersFollowConfiguration) {
    es::config::ChunkingConfig cfg;
    cfg.slow_link_mbps = 1.0;
    cfg.fast_link_mbps = 4.0;
    cfg.small_chunk_bytes = 1 * MiB;
    cfg.medium_chunk_bytes = 2 * MiB;
    cfg.large_chunk_bytes = 8 * MiB;
    const ChunkPlanner custom(cfg);

    EXPECT_EQ(custom.chunkSizeFor(0.5), 1 * MiB);
    EXPECT_EQ(custom.chunkSizeFor(4.0), 2 * MiB);
    EXPECT_EQ(custom.chunkSizeFor(4.5), 8 * MiB);
}

TEST_F(ChunkPlannerTest, InvertedThresholdsAreRejected) {
    es::config::ChunkingConfig cfg;
    cfg.slow_link_mbps = 20.0;
    cfg.fast_link_mbps = 10.0;
    EXPECT_THROW(ChunkPlanner{cfg}, std::invalid_argument);
}
