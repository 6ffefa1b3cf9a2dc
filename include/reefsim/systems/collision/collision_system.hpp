/**
 * @file collision_system.hpp
 * @brief Registry of collidable bodies and overlap queries against them
 *
 * Colliders are kept in two lists, dynamic and static, in registration
 * order. A query scans both lists linearly; scenes hold tens to low hundreds
 * of colliders, so there is no spatial partitioning.
 */

#pragma once

#include <cstddef>
#include <vector>

#include <entt/entt.hpp>

#include "reefsim/systems/collision/collision_data.hpp"

namespace Collision {

/**
 * @class CollisionSystem
 * @brief Dynamic and static collider lists over an EnTT registry
 *
 * Bodies are read through their Components::Position and Components::Shape.
 * A collider whose entity is gone, or which has no shape, never collides.
 */
class CollisionSystem {
public:
    /**
     * @param registry Registry holding the bodies; must outlive this object
     */
    explicit CollisionSystem(entt::registry &registry);

    /**
     * @brief Appends a body to the static or dynamic list
     *
     * No geometry validation is done and duplicates are not filtered.
     */
    void addCollider(entt::entity body, bool isStatic);

    /**
     * @brief Removes a body from whichever list holds it
     * @return false if the body was not registered (nothing changes)
     */
    bool removeCollider(entt::entity body);

    /**
     * @brief Tests two bodies for overlap (inclusive boundaries)
     */
    bool checkCollision(entt::entity a, entt::entity b) const;

    /**
     * @brief Finds every other registered body overlapping the given one
     *
     * @param body Query body; it does not need to be registered itself
     * @return Dynamic hits first, then static hits, each in registration order
     */
    CollisionList checkCollisions(entt::entity body) const;

    bool contains(entt::entity body) const;

    std::size_t dynamicCount() const { return colliders.size(); }
    std::size_t staticCount() const { return staticColliders.size(); }

    const std::vector<entt::entity>& getDynamicColliders() const { return colliders; }
    const std::vector<entt::entity>& getStaticColliders() const { return staticColliders; }

    void clear();

private:
    entt::registry &registry;
    std::vector<entt::entity> colliders;
    std::vector<entt::entity> staticColliders;
};

} // namespace Collision
