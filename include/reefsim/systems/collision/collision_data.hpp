/**
 * @file collision_data.hpp
 * @brief Declaration of collision data structures
 */

#pragma once

#include <vector>

#include <entt/entt.hpp>

#include "reefsim/math/vector_math.hpp"

namespace Collision {

// One overlapping pair reported by PhysicsEngine::checkCollisions()
struct CollisionPair {
    entt::entity a;
    entt::entity b;
};

// World-space bounds of a box collider
struct AABB {
    Position min;
    Position max;
};

using CollisionList = std::vector<entt::entity>;

} // namespace Collision
