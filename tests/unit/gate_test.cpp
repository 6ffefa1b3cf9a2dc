#include <gtest/gtest.h>

#include <cmath>
#include <variant>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/physics_engine.hpp"
#include "reefsim/game/gate.hpp"

using namespace Game;

TEST(GateTest, RegistersStaticBox) {
    PhysicsEngine engine;
    Gate gate(engine);

    entt::entity body = gate.getBody();
    ASSERT_TRUE(engine.isRegistered(body));
    EXPECT_TRUE(engine.isStatic(body));
    EXPECT_EQ(engine.getCategory(body), SimulatorConstants::Categories::Gate);
    EXPECT_EQ(engine.tryGetPosition(body), Position(0.0, -8.0, -15.0));

    const auto& shape = engine.getRegistry().get<Components::Shape>(body);
    ASSERT_TRUE(std::holds_alternative<Components::Box>(shape));
    Vector const half = std::get<Components::Box>(shape).halfExtents;
    EXPECT_DOUBLE_EQ(half.x, 4.0);
    EXPECT_DOUBLE_EQ(half.y, 3.0);
    EXPECT_DOUBLE_EQ(half.z, 0.25);
}

TEST(GateTest, StartsInactive) {
    PhysicsEngine engine;
    Gate gate(engine);

    EXPECT_FALSE(gate.getIsActivated());
    EXPECT_FALSE(gate.getIsCollected());
    EXPECT_DOUBLE_EQ(gate.getGlowIntensity(), 0.3);
    EXPECT_FALSE(gate.onPlayerEnter());
    EXPECT_FALSE(gate.getIsCollected());
}

TEST(GateTest, InactiveGateDoesNotAnimate) {
    PhysicsEngine engine;
    Gate gate(engine);

    gate.update(1.0);
    EXPECT_DOUBLE_EQ(gate.getTime(), 0.0);
    EXPECT_DOUBLE_EQ(gate.getGlowIntensity(), 0.3);
}

TEST(GateTest, ActivateIsIdempotent) {
    PhysicsEngine engine;
    Gate gate(engine);

    gate.activate();
    EXPECT_TRUE(gate.getIsActivated());
    EXPECT_DOUBLE_EQ(gate.getGlowIntensity(), 0.6);

    gate.update(1.0);
    double const glow = gate.getGlowIntensity();

    gate.activate();
    EXPECT_DOUBLE_EQ(gate.getGlowIntensity(), glow);
    EXPECT_DOUBLE_EQ(gate.getTime(), 1.0);
}

TEST(GateTest, GlowPulsesWhileActive) {
    PhysicsEngine engine;
    GateConfig config;
    config.pulseSpeed = 0.02;
    Gate gate(engine, config);

    gate.activate();
    gate.update(1.0);
    EXPECT_DOUBLE_EQ(gate.getGlowIntensity(), 0.3 + std::sin(0.2) * 0.2);

    gate.update(2.0);
    EXPECT_DOUBLE_EQ(gate.getTime(), 3.0);
    EXPECT_DOUBLE_EQ(gate.getGlowIntensity(), 0.3 + std::sin(3.0 * 0.2) * 0.2);
}

TEST(GateTest, EnterOncePerActivation) {
    PhysicsEngine engine;
    Gate gate(engine);

    gate.activate();
    EXPECT_TRUE(gate.onPlayerEnter());
    EXPECT_TRUE(gate.getIsCollected());
    EXPECT_DOUBLE_EQ(gate.getGlowIntensity(), 1.0);

    EXPECT_FALSE(gate.onPlayerEnter());
}

TEST(GateTest, ResetPreparesNextLevel) {
    PhysicsEngine engine;
    Gate gate(engine);

    gate.activate();
    gate.update(0.5);
    gate.onPlayerEnter();
    gate.reset();

    EXPECT_FALSE(gate.getIsActivated());
    EXPECT_FALSE(gate.getIsCollected());
    EXPECT_DOUBLE_EQ(gate.getTime(), 0.0);
    EXPECT_DOUBLE_EQ(gate.getGlowIntensity(), 0.3);
    EXPECT_TRUE(engine.isRegistered(gate.getBody()));

    gate.activate();
    EXPECT_TRUE(gate.onPlayerEnter());
}

TEST(GateTest, DisposeRemovesBody) {
    PhysicsEngine engine;
    Gate gate(engine);

    gate.dispose();
    EXPECT_EQ(engine.bodyCount(), 0u);
    EXPECT_EQ(engine.getCollisionSystem().staticCount(), 0u);

    gate.dispose();
    EXPECT_EQ(engine.bodyCount(), 0u);
}
