/**
 * @file particle.hpp
 * @brief Pooled visual particle
 */

#pragma once

#include "reefsim/math/vector_math.hpp"
#include "reefsim/particles/color.hpp"

namespace Particles {

/**
 * @struct Particle
 * @brief One reusable slot of the particle pool
 *
 * Slots start inactive and are only ever repurposed with reset(); a slot
 * returns to the pool by itself once its life runs out.
 */
struct Particle {
    Position position;
    Vector velocity;
    double life = 0.0;
    double maxLife = 0.0;
    double size = 1.0;
    Color color;
    double alpha = 0.0;
    bool active = false;

    void reset(const Position& newPosition, const Vector& newVelocity,
               double newLife, double newSize, const Color& newColor) {
        position = newPosition;
        velocity = newVelocity;
        life = newLife;
        maxLife = newLife;
        size = newSize;
        color = newColor;
        alpha = 1.0;
        active = true;
    }

    // Move, age, fade; deactivates once life reaches zero
    void update(double dt) {
        if (!active) {
            return;
        }

        position += velocity * dt;
        life -= dt;
        alpha = maxLife > 0.0 ? life / maxLife : 0.0;

        if (life <= 0.0) {
            active = false;
        }
    }
};

} // namespace Particles
