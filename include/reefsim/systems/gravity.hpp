/**
 * @file gravity.hpp
 * @brief Uniform gravity for bodies above the water
 *
 * Applies a constant acceleration to every dynamic body. The engine runs it
 * instead of UnderwaterSystem when SystemConfig::Underwater is false.
 *
 * Required components:
 * - Velocity (to modify)
 */

#pragma once

#include <entt/entt.hpp>
#include "reefsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct GravityConfig
 * @brief Configuration parameters specific to the gravity system
 */
struct GravityConfig {
    // Gravitational acceleration in m/s^2
    Vector gravity{0.0, -9.8, 0.0};
};

/**
 * @class BasicGravitySystem
 * @brief System that applies uniform gravitational acceleration
 */
class BasicGravitySystem : public ConfigurableSystem<GravityConfig> {
public:
    BasicGravitySystem();
    ~BasicGravitySystem() override = default;

    /**
     * @brief Adds gravity * dt to the body's velocity
     */
    void update(entt::registry &registry, entt::entity entity, double dt) override;
};

} // namespace Systems
