#pragma once

#include "reefsim/core/constants.hpp"
#include "reefsim/math/vector_math.hpp"

/**
 * @struct SystemConfig
 * @brief Engine-wide parameters shared by every physics system.
 */
struct SystemConfig {
    // Underwater forces when true, plain gravity when false
    bool Underwater = true;

    // Acceleration applied in the above-water branch (m/s^2)
    Vector Gravity{0.0, SimulatorConstants::GravityY, 0.0};

    // Velocity multiplier applied when a blocking collision rolls a body back
    double CollisionVelocityScale = SimulatorConstants::CollisionVelocityScale;

    // Frame deltas handed to the session are clamped to this (s)
    double MaxFrameDelta = SimulatorConstants::MaxFrameDelta;
};
