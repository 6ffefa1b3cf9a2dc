#pragma once

/**
 * @brief Defines the per-body systems the physics engine can run.
 */
namespace Systems {

/**
 * @enum SystemType
 * @brief Force and integration systems applied to each dynamic body.
 */
enum class SystemType {
    UNDERWATER,
    BASIC_GRAVITY,
    MOVEMENT,
};

} // namespace Systems
