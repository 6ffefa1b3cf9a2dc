/**
 * @file underwater.hpp
 * @brief System applying the underwater environment forces to a body
 *
 * This system handles, in this order:
 * - Buoyancy: constant upward acceleration
 * - Drag: constant per-step velocity decay
 * - Current: constant ambient flow, the same everywhere
 *
 * Only velocity is modified; integration is left to MovementSystem.
 *
 * Required components:
 * - Velocity (to modify)
 */

#pragma once

#include <entt/entt.hpp>
#include "reefsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct UnderwaterConfig
 * @brief Configuration parameters specific to the underwater system
 */
struct UnderwaterConfig {
    // Upward acceleration (m/s^2), independent of depth and volume
    double buoyancyForce = 2.0;

    // Velocity multiplier applied every step (0-1)
    double dragCoefficient = 0.95;

    // Direction and strength of the ambient current
    Vector currentDirection{0.1, 0.0, 0.05};
    double currentStrength = 0.02;
};

/**
 * @class UnderwaterSystem
 * @brief Applies buoyancy, drag and current to a body's velocity
 *
 * Per step: v' = (v + buoyancy) * drag + current
 */
class UnderwaterSystem : public ConfigurableSystem<UnderwaterConfig> {
public:
    UnderwaterSystem();
    ~UnderwaterSystem() override = default;

    /**
     * @brief Applies all three forces to one body
     */
    void update(entt::registry &registry, entt::entity entity, double dt) override;

    void applyBuoyancy(Vector &velocity, double dt) const;
    void applyDrag(Vector &velocity) const;

    /**
     * @brief Adds the ambient current
     * @param multiplier Extra scale on currentStrength (1.0 in update)
     */
    void applyCurrent(Vector &velocity, double dt, double multiplier = 1.0) const;

    /**
     * @brief Buoyancy, drag then current on a bare velocity
     */
    void applyUnderwaterEffects(Vector &velocity, double dt) const;
};

} // namespace Systems
