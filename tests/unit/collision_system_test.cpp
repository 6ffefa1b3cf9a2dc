#include <gtest/gtest.h>

#include <entt/entt.hpp>

#include "reefsim/components/basic.hpp"
#include "reefsim/systems/collision/collision_system.hpp"

using Collision::CollisionSystem;

class CollisionSystemTest : public ::testing::Test {
protected:
    entt::registry registry;
    CollisionSystem collisionSystem{registry};

    entt::entity createSphere(const Position& pos, double radius) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, pos);
        registry.emplace<Components::Velocity>(entity);
        registry.emplace<Components::Shape>(entity, Components::Sphere{radius});
        return entity;
    }

    entt::entity createBox(const Position& pos, const Vector& halfExtents) {
        auto entity = registry.create();
        registry.emplace<Components::Position>(entity, pos);
        registry.emplace<Components::Velocity>(entity);
        registry.emplace<Components::Shape>(entity, Components::Box{halfExtents});
        return entity;
    }
};

TEST_F(CollisionSystemTest, AddsToMatchingList) {
    auto dynamicBody = createSphere(Position(0, 0, 0), 1.0);
    auto staticBody = createBox(Position(5, 0, 0), Vector(1, 1, 1));

    collisionSystem.addCollider(dynamicBody, false);
    collisionSystem.addCollider(staticBody, true);

    EXPECT_EQ(collisionSystem.dynamicCount(), 1u);
    EXPECT_EQ(collisionSystem.staticCount(), 1u);
    EXPECT_TRUE(collisionSystem.contains(dynamicBody));
    EXPECT_TRUE(collisionSystem.contains(staticBody));
}

TEST_F(CollisionSystemTest, RemoveTwiceIsNoOp) {
    auto body = createSphere(Position(0, 0, 0), 1.0);
    collisionSystem.addCollider(body, false);

    EXPECT_TRUE(collisionSystem.removeCollider(body));
    EXPECT_FALSE(collisionSystem.removeCollider(body));
    EXPECT_EQ(collisionSystem.dynamicCount(), 0u);
}

TEST_F(CollisionSystemTest, RemoveUnknownIsNoOp) {
    auto known = createSphere(Position(0, 0, 0), 1.0);
    auto unknown = createSphere(Position(1, 0, 0), 1.0);
    collisionSystem.addCollider(known, true);

    EXPECT_FALSE(collisionSystem.removeCollider(unknown));
    EXPECT_FALSE(collisionSystem.removeCollider(entt::null));
    EXPECT_EQ(collisionSystem.staticCount(), 1u);
}

TEST_F(CollisionSystemTest, RemoveFromStaticList) {
    auto body = createBox(Position(0, 0, 0), Vector(1, 1, 1));
    collisionSystem.addCollider(body, true);

    EXPECT_TRUE(collisionSystem.removeCollider(body));
    EXPECT_EQ(collisionSystem.staticCount(), 0u);
    EXPECT_FALSE(collisionSystem.contains(body));
}

TEST_F(CollisionSystemTest, CheckCollisionsExcludesSelf) {
    auto body = createSphere(Position(0, 0, 0), 1.0);
    collisionSystem.addCollider(body, false);

    EXPECT_TRUE(collisionSystem.checkCollisions(body).empty());
}

TEST_F(CollisionSystemTest, CheckCollisionsOrdersDynamicThenStatic) {
    auto query = createSphere(Position(0, 0, 0), 1.0);
    auto wall = createBox(Position(1.5, 0, 0), Vector(1, 1, 1));
    auto first = createSphere(Position(0, 1, 0), 0.5);
    auto far = createSphere(Position(10, 0, 0), 0.5);
    auto second = createSphere(Position(0, -1, 0), 0.5);

    collisionSystem.addCollider(wall, true);
    collisionSystem.addCollider(query, false);
    collisionSystem.addCollider(first, false);
    collisionSystem.addCollider(far, false);
    collisionSystem.addCollider(second, false);

    auto hits = collisionSystem.checkCollisions(query);
    ASSERT_EQ(hits.size(), 3u);
    EXPECT_EQ(hits[0], first);
    EXPECT_EQ(hits[1], second);
    EXPECT_EQ(hits[2], wall);
}

TEST_F(CollisionSystemTest, QueryBodyNeedNotBeRegistered) {
    auto probe = createSphere(Position(0, 0, 0), 1.0);
    auto target = createSphere(Position(1, 0, 0), 1.0);
    collisionSystem.addCollider(target, true);

    auto hits = collisionSystem.checkCollisions(probe);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0], target);
}

TEST_F(CollisionSystemTest, PairwiseCheck) {
    auto a = createSphere(Position(0, 0, 0), 1.0);
    auto b = createSphere(Position(2, 0, 0), 1.0);
    auto c = createSphere(Position(2.5, 0, 0), 1.0);

    EXPECT_TRUE(collisionSystem.checkCollision(a, b));
    EXPECT_FALSE(collisionSystem.checkCollision(a, c));
}

TEST_F(CollisionSystemTest, ShapelessOrMissingBodiesNeverCollide) {
    auto sphere = createSphere(Position(0, 0, 0), 5.0);

    auto shapeless = registry.create();
    registry.emplace<Components::Position>(shapeless, 0.0, 0.0, 0.0);
    registry.emplace<Components::Shape>(shapeless);

    auto bare = registry.create();

    EXPECT_FALSE(collisionSystem.checkCollision(sphere, shapeless));
    EXPECT_FALSE(collisionSystem.checkCollision(sphere, bare));

    auto destroyed = createSphere(Position(0, 0, 0), 1.0);
    collisionSystem.addCollider(destroyed, false);
    registry.destroy(destroyed);
    EXPECT_TRUE(collisionSystem.checkCollisions(sphere).empty());
}

TEST_F(CollisionSystemTest, DegenerateRadiiAreTestedAsGiven) {
    auto query = createSphere(Position(0, 0, 0), 1.0);
    auto zeroInside = createSphere(Position(0.5, 0, 0), 0.0);
    auto zeroTouching = createSphere(Position(1, 0, 0), 0.0);
    auto zeroOutside = createSphere(Position(1.5, 0, 0), 0.0);
    auto negativeNear = createSphere(Position(0.5, 0, 0), -1.0);
    auto box = createBox(Position(0, 0, 0), Vector(1, 1, 1));

    collisionSystem.addCollider(zeroInside, false);
    collisionSystem.addCollider(zeroTouching, true);
    collisionSystem.addCollider(zeroOutside, true);
    collisionSystem.addCollider(negativeNear, false);
    EXPECT_EQ(collisionSystem.dynamicCount(), 2u);
    EXPECT_EQ(collisionSystem.staticCount(), 2u);

    // 0.5 <= 1 + 0 and 1 <= 1 + 0 hold; 1.5 <= 1 and 0.5 <= 1 - 1 do not
    auto hits = collisionSystem.checkCollisions(query);
    ASSERT_EQ(hits.size(), 2u);
    EXPECT_EQ(hits[0], zeroInside);
    EXPECT_EQ(hits[1], zeroTouching);

    // A negative-radius sphere inside a box never reaches the box
    EXPECT_FALSE(collisionSystem.checkCollision(negativeNear, box));
}

TEST_F(CollisionSystemTest, ClearEmptiesBothLists) {
    collisionSystem.addCollider(createSphere(Position(0, 0, 0), 1.0), false);
    collisionSystem.addCollider(createBox(Position(0, 0, 0), Vector(1, 1, 1)), true);

    collisionSystem.clear();
    EXPECT_EQ(collisionSystem.dynamicCount(), 0u);
    EXPECT_EQ(collisionSystem.staticCount(), 0u);
}
