/**
 * @file emitter.hpp
 * @brief Continuous emitter and one-shot burst descriptions
 */

#pragma once

#include <cstddef>
#include <string>

#include "reefsim/math/vector_math.hpp"
#include "reefsim/particles/color.hpp"

namespace Particles {

struct SizeRange {
    double min = 1.0;
    double max = 1.0;
};

/**
 * @struct EmitterConfig
 * @brief Parameters of a continuous emitter
 */
struct EmitterConfig {
    std::string type;               ///< Tag used by setEmitterActive / findEmitter
    Position position;              ///< Centre of the emission box
    double rate = 1.0;              ///< Particles per second; <= 0 never emits
    double life = 1.0;              ///< Seconds each particle lives
    SizeRange size;
    Vector velocity;                ///< Base velocity
    Vector velocityVariation;       ///< Full spread per axis around the base
    Color color;
    double colorVariation = 0.0;    ///< Hue/lightness jitter, 0 disables it
    Vector area;                    ///< Full extents of the emission box
};

/**
 * @struct Emitter
 * @brief A registered emitter and its emission state
 */
struct Emitter {
    EmitterConfig config;
    double accumulator = 0.0;       ///< Seconds not yet turned into particles
    bool active = true;
};

/**
 * @struct BurstConfig
 * @brief Parameters of a one-shot burst
 */
struct BurstConfig {
    std::size_t count = 20;
    double life = 2.0;
    Vector velocity{0.0, 1.0, 0.0};
    Vector velocityVariation{2.0, 2.0, 2.0};
    Color color = Color::fromHex(0xffd700);
    SizeRange size{2.0, 8.0};
};

} // namespace Particles
