#include <gtest/gtest.h>

#include <cmath>
#include <random>
#include <variant>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/physics_engine.hpp"
#include "reefsim/game/level_builder.hpp"

using namespace Game;

class LevelBuilderTest : public ::testing::Test {
protected:
    LevelBuilderTest() : rng(99u), builder(engine, rng) {}

    const std::string& nameOf(entt::entity body) const {
        return engine.getRegistry().get<Components::Name>(body).value;
    }

    Vector halfExtentsOf(entt::entity body) const {
        return std::get<Components::Box>(engine.getRegistry().get<Components::Shape>(body)).halfExtents;
    }

    PhysicsEngine engine;
    std::mt19937 rng;
    LevelBuilder builder;
};

TEST_F(LevelBuilderTest, EnvironmentBodyCounts) {
    LevelLayout layout = builder.buildEnvironment(10, 50.0);

    EXPECT_TRUE(engine.isRegistered(layout.floor));
    EXPECT_EQ(layout.walls.size(), 4u);
    EXPECT_EQ(layout.oceanObjects.size(), 10u);
    EXPECT_EQ(engine.bodyCount(), 15u);
    EXPECT_EQ(engine.getCollisionSystem().staticCount(), 15u);
    EXPECT_EQ(engine.getCollisionSystem().dynamicCount(), 0u);
}

TEST_F(LevelBuilderTest, FloorGeometry) {
    LevelLayout layout = builder.buildEnvironment(0, 50.0);

    EXPECT_EQ(nameOf(layout.floor), "Ocean Floor");
    EXPECT_EQ(engine.getCategory(layout.floor), SimulatorConstants::Categories::Environment);
    EXPECT_EQ(engine.tryGetPosition(layout.floor), Position(0.0, -15.0, 0.0));

    Vector const half = halfExtentsOf(layout.floor);
    EXPECT_DOUBLE_EQ(half.x, 50.0);
    EXPECT_DOUBLE_EQ(half.y, 0.05);
    EXPECT_DOUBLE_EQ(half.z, 50.0);
}

TEST_F(LevelBuilderTest, WallsEncloseLevel) {
    LevelLayout layout = builder.buildEnvironment(0, 50.0);
    ASSERT_EQ(layout.walls.size(), 4u);

    EXPECT_EQ(nameOf(layout.walls[0]), "North Wall");
    EXPECT_EQ(engine.tryGetPosition(layout.walls[0]), Position(0.0, -2.5, 50.0));
    EXPECT_EQ(nameOf(layout.walls[1]), "South Wall");
    EXPECT_EQ(engine.tryGetPosition(layout.walls[1]), Position(0.0, -2.5, -50.0));
    EXPECT_EQ(nameOf(layout.walls[2]), "East Wall");
    EXPECT_EQ(engine.tryGetPosition(layout.walls[2]), Position(50.0, -2.5, 0.0));
    EXPECT_EQ(nameOf(layout.walls[3]), "West Wall");
    EXPECT_EQ(engine.tryGetPosition(layout.walls[3]), Position(-50.0, -2.5, 0.0));

    Vector const north = halfExtentsOf(layout.walls[0]);
    EXPECT_DOUBLE_EQ(north.x, 50.0);
    EXPECT_DOUBLE_EQ(north.y, 7.5);
    EXPECT_DOUBLE_EQ(north.z, 1.0);

    Vector const east = halfExtentsOf(layout.walls[2]);
    EXPECT_DOUBLE_EQ(east.x, 1.0);
    EXPECT_DOUBLE_EQ(east.z, 50.0);

    for (auto wall : layout.walls) {
        EXPECT_TRUE(engine.isStatic(wall));
        EXPECT_EQ(engine.getCategory(wall), SimulatorConstants::Categories::Environment);
    }
}

TEST_F(LevelBuilderTest, PropsScatteredOnFloor) {
    LevelLayout layout = builder.buildEnvironment(50, 50.0);

    for (auto prop : layout.oceanObjects) {
        EXPECT_TRUE(engine.isStatic(prop));
        EXPECT_EQ(engine.getCategory(prop), SimulatorConstants::Categories::Environment);

        auto position = engine.tryGetPosition(prop);
        ASSERT_TRUE(position.has_value());
        EXPECT_LE(std::abs(position->x), 40.0);
        EXPECT_LE(std::abs(position->z), 40.0);
        EXPECT_GE(position->y, -14.0);
        EXPECT_LE(position->y, -12.0);

        const auto& shape = engine.getRegistry().get<Components::Shape>(prop);
        ASSERT_TRUE(std::holds_alternative<Components::Sphere>(shape));
        double const radius = std::get<Components::Sphere>(shape).radius;
        EXPECT_TRUE(radius == 0.3 || radius == 0.8 || radius == 1.0);
    }
}

TEST_F(LevelBuilderTest, StarsAreStaticCollectibles) {
    std::vector<entt::entity> stars = builder.spawnStars(5);
    ASSERT_EQ(stars.size(), 5u);

    for (auto star : stars) {
        EXPECT_TRUE(engine.isStatic(star));
        EXPECT_EQ(engine.getCategory(star), SimulatorConstants::Categories::Collectible);
        EXPECT_FALSE(engine.isCollected(star));
        EXPECT_EQ(nameOf(star), "Star");

        auto position = engine.tryGetPosition(star);
        ASSERT_TRUE(position.has_value());
        EXPECT_LE(std::abs(position->x), 10.0);
        EXPECT_LE(std::abs(position->z), 10.0);
        EXPECT_GE(position->y, -12.0);
        EXPECT_LE(position->y, -4.0);
    }
}

TEST_F(LevelBuilderTest, SameSeedSameLayout) {
    PhysicsEngine otherEngine;
    std::mt19937 otherRng(99u);
    LevelBuilder other(otherEngine, otherRng);

    LevelLayout a = builder.buildEnvironment(8, 50.0);
    LevelLayout b = other.buildEnvironment(8, 50.0);

    ASSERT_EQ(a.oceanObjects.size(), b.oceanObjects.size());
    for (std::size_t i = 0; i < a.oceanObjects.size(); ++i) {
        EXPECT_EQ(engine.tryGetPosition(a.oceanObjects[i]),
                  otherEngine.tryGetPosition(b.oceanObjects[i]));
        EXPECT_EQ(nameOf(a.oceanObjects[i]),
                  otherEngine.getRegistry().get<Components::Name>(b.oceanObjects[i]).value);
    }
}

TEST_F(LevelBuilderTest, ClearRemovesLayoutOnly) {
    LevelLayout layout = builder.buildEnvironment(5, 50.0);
    std::vector<entt::entity> stars = builder.spawnStars(3);

    builder.clear(layout);

    EXPECT_EQ(engine.bodyCount(), 3u);
    EXPECT_EQ(layout.floor, entt::entity{entt::null});
    EXPECT_TRUE(layout.walls.empty());
    EXPECT_TRUE(layout.oceanObjects.empty());
    for (auto star : stars) {
        EXPECT_TRUE(engine.isRegistered(star));
    }
}

TEST(OceanObjectTypeTest, NamesAndRadii) {
    EXPECT_EQ(toString(OceanObjectType::Coral), "coral");
    EXPECT_EQ(toString(OceanObjectType::Seaweed), "seaweed");
    EXPECT_EQ(toString(OceanObjectType::Rock), "rock");
    EXPECT_EQ(toString(OceanObjectType::Anemone), "anemone");
    EXPECT_EQ(toString(OceanObjectType::Kelp), "kelp");

    EXPECT_DOUBLE_EQ(collisionRadius(OceanObjectType::Kelp), 1.0);
    EXPECT_DOUBLE_EQ(collisionRadius(OceanObjectType::Seaweed), 0.3);
    EXPECT_DOUBLE_EQ(collisionRadius(OceanObjectType::Coral), 0.8);
    EXPECT_DOUBLE_EQ(collisionRadius(OceanObjectType::Rock), 0.8);
    EXPECT_DOUBLE_EQ(collisionRadius(OceanObjectType::Anemone), 0.8);
}
