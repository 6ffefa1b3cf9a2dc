/**
 * @file collision_response.hpp
 * @brief Resolution of a body's collision list after integration
 *
 * This system handles:
 * - Splitting contacts into blocking and pass-through
 * - Rolling a blocked body back to its pre-step position
 * - Damping the velocity of a blocked body
 * - Notifying the body's collision listener
 *
 * Required components:
 * - Position, Velocity (to modify)
 *
 * Optional components:
 * - Category, Collectible (on the contacts, to decide blocking)
 * - CollisionListener (to notify)
 */

#pragma once

#include <entt/entt.hpp>

#include "reefsim/core/constants.hpp"
#include "reefsim/systems/collision/collision_data.hpp"

namespace Collision {

/**
 * @struct CollisionResponseConfig
 * @brief Parameters of the rollback response
 */
struct CollisionResponseConfig {
    // Velocity multiplier applied after a blocking hit (0-1)
    double velocityScale = SimulatorConstants::CollisionVelocityScale;
};

/**
 * @class CollisionResponse
 * @brief Hard rollback response for blocking contacts
 *
 * The body is not pushed out along a contact normal and does not slide; it is
 * put back exactly where it started the step. Bodies therefore stop short of
 * static geometry and bounce off it at reduced speed.
 */
class CollisionResponse {
public:
    /**
     * @brief Whether a contact impedes motion
     *
     * Every contact blocks except an uncollected collectible.
     */
    static bool isBlocking(const entt::registry &registry, entt::entity other);

    /**
     * @brief Applies the response for one body
     *
     * @param registry Registry holding the bodies
     * @param body The body that moved this step
     * @param collisions Every body it overlaps after integration
     * @param previousPosition Position at the start of the step
     * @param config Response parameters
     * @return true if any contact was blocking
     */
    static bool resolve(entt::registry &registry,
                        entt::entity body,
                        const CollisionList &collisions,
                        const Position &previousPosition,
                        const CollisionResponseConfig &config);
};

} // namespace Collision
