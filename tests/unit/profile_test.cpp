#include <gtest/gtest.h>

#include <sstream>

#include "reefsim/core/profile.hpp"

using Profiling::Profiler;

class ProfilerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Profiler::reset();
        Profiler::setEnabled(true);
    }

    void TearDown() override {
        Profiler::reset();
        Profiler::setEnabled(true);
    }
};

TEST_F(ProfilerTest, CountsCalls) {
    for (int i = 0; i < 3; ++i) {
        PROFILE_SCOPE("outer");
    }

    auto stats = Profiler::getStats("outer");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->call_count, 3u);
    EXPECT_TRUE(stats->parent_name.empty());
}

TEST_F(ProfilerTest, NestedScopesFormTree) {
    {
        PROFILE_SCOPE("frame");
        {
            PROFILE_SCOPE("physics");
        }
        {
            PROFILE_SCOPE("particles");
        }
    }

    auto frame = Profiler::getStats("frame");
    auto physics = Profiler::getStats("physics");
    ASSERT_TRUE(frame.has_value());
    ASSERT_TRUE(physics.has_value());

    EXPECT_EQ(physics->parent_name, "frame");
    ASSERT_EQ(frame->children.size(), 2u);
    EXPECT_EQ(frame->children[0], "physics");
    EXPECT_EQ(frame->children[1], "particles");
    EXPECT_GE(frame->total_time, physics->total_time);
    EXPECT_LE(frame->self_time, frame->total_time);
}

TEST_F(ProfilerTest, DisabledRecordsNothing) {
    Profiler::setEnabled(false);
    {
        PROFILE_SCOPE("hidden");
    }
    EXPECT_FALSE(Profiler::getStats("hidden").has_value());
}

TEST_F(ProfilerTest, MismatchedEndIsIgnored) {
    Profiler::startSection("a");
    Profiler::endSection("b");
    Profiler::endSection("a");

    auto stats = Profiler::getStats("a");
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->call_count, 1u);
    EXPECT_FALSE(Profiler::getStats("b").has_value());
}

TEST_F(ProfilerTest, PrintStatsListsScopes) {
    {
        PROFILE_SCOPE("PhysicsEngine::update");
    }

    std::ostringstream out;
    Profiler::printStats(out);
    EXPECT_NE(out.str().find("PhysicsEngine::update"), std::string::npos);
    EXPECT_NE(out.str().find("[1 calls]"), std::string::npos);
}

TEST_F(ProfilerTest, ResetClearsEverything) {
    {
        PROFILE_SCOPE("x");
    }
    Profiler::reset();
    EXPECT_FALSE(Profiler::getStats("x").has_value());
}
