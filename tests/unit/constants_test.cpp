#include <gtest/gtest.h>

#include <limits>
#include <sstream>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/debug.hpp"
#include "reefsim/core/system_config.hpp"

TEST(ConstantsTest, ClampFrameDeltaUsesDefaultBound) {
    EXPECT_DOUBLE_EQ(SimulatorConstants::clampFrameDelta(0.016), 0.016);
    EXPECT_DOUBLE_EQ(SimulatorConstants::clampFrameDelta(1.0), SimulatorConstants::MaxFrameDelta);
    EXPECT_DOUBLE_EQ(SimulatorConstants::clampFrameDelta(-0.5), 0.0);
}

TEST(ConstantsTest, ClampFrameDeltaHonoursGivenBound) {
    EXPECT_DOUBLE_EQ(SimulatorConstants::clampFrameDelta(1.0, 0.1), 0.1);
    EXPECT_DOUBLE_EQ(SimulatorConstants::clampFrameDelta(0.05, 0.1), 0.05);
}

TEST(ConstantsTest, ClampFrameDeltaMapsNaNToZero) {
    double const nan = std::numeric_limits<double>::quiet_NaN();
    EXPECT_DOUBLE_EQ(SimulatorConstants::clampFrameDelta(nan), 0.0);
    EXPECT_DOUBLE_EQ(SimulatorConstants::clampFrameDelta(nan, 0.1), 0.0);
}

TEST(ConstantsTest, SystemConfigDefaultsFollowConstants) {
    SystemConfig config;
    EXPECT_TRUE(config.Underwater);
    EXPECT_DOUBLE_EQ(config.Gravity.y, SimulatorConstants::GravityY);
    EXPECT_DOUBLE_EQ(config.CollisionVelocityScale, SimulatorConstants::CollisionVelocityScale);
    EXPECT_DOUBLE_EQ(config.MaxFrameDelta, SimulatorConstants::MaxFrameDelta);
}

TEST(DebugStatsTest, PrintsCountersWithoutDebugBuild) {
    DebugStats::reset();
    DebugStats::recordCollision(true);
    DebugStats::recordCollision(true);
    DebugStats::recordCollision(false);
    DebugStats::recordEmission(false);
    DebugStats::recordEmission(true);

    std::ostringstream collisions;
    DebugStats::printCollisionStats(collisions);
    EXPECT_NE(collisions.str().find("Blocking resolutions: 2"), std::string::npos);
    EXPECT_NE(collisions.str().find("Pass-through contacts: 1"), std::string::npos);

    std::ostringstream particles;
    DebugStats::printParticleStats(particles);
    EXPECT_NE(particles.str().find("Emitted: 1"), std::string::npos);
    EXPECT_NE(particles.str().find("Dropped (pool exhausted): 1"), std::string::npos);

    DebugStats::reset();
}
