/**
 * @file collision_system.cpp
 * @brief Implementation of the collider lists and overlap queries
 */

#include "reefsim/systems/collision/collision_system.hpp"

#include <algorithm>

#include "reefsim/components/basic.hpp"
#include "reefsim/core/debug.hpp"
#include "reefsim/systems/collision/narrowphase.hpp"

namespace Collision {

namespace {

bool eraseFirst(std::vector<entt::entity> &list, entt::entity body)
{
    auto it = std::find(list.begin(), list.end(), body);
    if (it == list.end()) {
        return false;
    }
    list.erase(it);
    return true;
}

} // namespace

CollisionSystem::CollisionSystem(entt::registry &registry)
    : registry(registry)
{
}

void CollisionSystem::addCollider(entt::entity body, bool isStatic)
{
    auto &list = isStatic ? staticColliders : colliders;
    list.push_back(body);
}

bool CollisionSystem::removeCollider(entt::entity body)
{
    if (eraseFirst(colliders, body)) {
        return true;
    }
    return eraseFirst(staticColliders, body);
}

bool CollisionSystem::checkCollision(entt::entity a, entt::entity b) const
{
    if (!registry.valid(a) || !registry.valid(b)) {
        return false;
    }

    const auto *posA = registry.try_get<Components::Position>(a);
    const auto *posB = registry.try_get<Components::Position>(b);
    const auto *shapeA = registry.try_get<Components::Shape>(a);
    const auto *shapeB = registry.try_get<Components::Shape>(b);
    if (!posA || !posB || !shapeA || !shapeB) {
        return false;
    }

    return shapesOverlap(*posA, *shapeA, *posB, *shapeB);
}

CollisionList CollisionSystem::checkCollisions(entt::entity body) const
{
    CollisionList collisions;

    for (auto other : colliders) {
        if (other != body && checkCollision(body, other)) {
            collisions.push_back(other);
        }
    }

    for (auto other : staticColliders) {
        if (other != body && checkCollision(body, other)) {
            collisions.push_back(other);
        }
    }

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE,
        "checkCollisions(" << static_cast<uint32_t>(entt::to_integral(body)) << "): "
        << collisions.size() << " hit(s)\n");

    return collisions;
}

bool CollisionSystem::contains(entt::entity body) const
{
    return std::find(colliders.begin(), colliders.end(), body) != colliders.end() ||
           std::find(staticColliders.begin(), staticColliders.end(), body) != staticColliders.end();
}

void CollisionSystem::clear()
{
    colliders.clear();
    staticColliders.clear();
}

} // namespace Collision
