#ifndef REEFSIM_CONSTANTS_HPP
#define REEFSIM_CONSTANTS_HPP

#include <cstddef>
#include <string>

namespace SimulatorConstants {

    // Frame timing
    extern const double MaxFrameDelta;      // clamp for stalled frames (s)
    extern const double DefaultFrameDelta;  // first frame / fallback (s)
    extern const unsigned int StepsPerSecond;

    // Collision response: velocity scale applied on a blocking hit
    extern const double CollisionVelocityScale;

    // Default gravity used when the world is not underwater (m/s^2)
    extern const double GravityY;

    // Height of the water surface; depth readouts are measured from here
    extern const double WaterSurfaceY;

    // Particle pool sizes
    extern const std::size_t DefaultMaxParticles;
    extern const std::size_t GameMaxParticles;

    // Well-known body categories
    namespace Categories {
        extern const std::string Player;
        extern const std::string Collectible;
        extern const std::string Environment;
        extern const std::string Gate;
        extern const std::string Obstacle;
    }

    /**
     * @brief Clamps a measured frame delta into [0, maxDelta].
     * @param seconds Raw wall-clock delta; NaN is treated as 0
     * @param maxDelta Upper bound, normally SystemConfig::MaxFrameDelta
     * @return Delta safe to feed to the simulation
     */
    double clampFrameDelta(double seconds, double maxDelta = MaxFrameDelta);
}

#endif // REEFSIM_CONSTANTS_HPP
