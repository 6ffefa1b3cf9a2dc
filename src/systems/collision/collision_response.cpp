/**
 * @file collision_response.cpp
 * @brief Implementation of the rollback collision response
 */

#include "reefsim/systems/collision/collision_response.hpp"

#include "reefsim/components/basic.hpp"
#include "reefsim/core/constants.hpp"
#include "reefsim/core/debug.hpp"

namespace Collision {

bool CollisionResponse::isBlocking(const entt::registry &registry, entt::entity other)
{
    if (!registry.valid(other)) {
        return true;
    }

    const auto *category = registry.try_get<Components::Category>(other);
    if (!category || category->tag != SimulatorConstants::Categories::Collectible) {
        return true;
    }

    const auto *collectible = registry.try_get<Components::Collectible>(other);
    return collectible && collectible->collected;
}

bool CollisionResponse::resolve(entt::registry &registry,
                                entt::entity body,
                                const CollisionList &collisions,
                                const Position &previousPosition,
                                const CollisionResponseConfig &config)
{
    if (collisions.empty() || !registry.valid(body)) {
        return false;
    }

    bool blocked = false;
    for (auto other : collisions) {
        bool const blocking = isBlocking(registry, other);
        DebugStats::recordCollision(blocking);
        blocked = blocked || blocking;
    }

    if (blocked) {
        if (auto *pos = registry.try_get<Components::Position>(body)) {
            *pos = previousPosition;
        }
        if (auto *vel = registry.try_get<Components::Velocity>(body)) {
            *vel *= config.velocityScale;
        }
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "Rolled back body "
            << static_cast<uint32_t>(entt::to_integral(body)) << "\n");
    }

    // Copied out first: the listener may remove this body
    const auto *listener = registry.try_get<Components::CollisionListener>(body);
    Components::ICollisionListener *target = listener ? listener->listener : nullptr;
    if (target) {
        target->onCollision(body, collisions);
    }

    return blocked;
}

} // namespace Collision
