/**
 * @file movement.hpp
 * @brief System for updating body positions based on velocity
 *
 * Explicit Euler, one step per frame, no sub-stepping.
 *
 * Required components:
 * - Position (to modify)
 * - Velocity (to read)
 */

#pragma once

#include <entt/entt.hpp>
#include "reefsim/systems/i_system.hpp"

namespace Systems {

/**
 * @struct MovementConfig
 * @brief Configuration parameters specific to the movement system
 */
struct MovementConfig {
    // No specific configuration for now, kept for consistency with the
    // other systems
};

/**
 * @class MovementSystem
 * @brief Updates a body's position according to its velocity
 *
 * Static bodies are never moved, whatever velocity they carry.
 */
class MovementSystem : public ConfigurableSystem<MovementConfig> {
public:
    MovementSystem();
    ~MovementSystem() override = default;

    void update(entt::registry &registry, entt::entity entity, double dt) override;
};

} // namespace Systems
