#include "reefsim/core/constants.hpp"

#include <algorithm>
#include <cmath>

namespace SimulatorConstants {

    const double MaxFrameDelta     = 0.033;
    const double DefaultFrameDelta = 0.016;
    const unsigned int StepsPerSecond = 60;

    const double CollisionVelocityScale = 0.3;

    const double GravityY = -9.8;

    const double WaterSurfaceY = 5.0;

    const std::size_t DefaultMaxParticles = 1000;
    const std::size_t GameMaxParticles    = 500;

    namespace Categories {
        const std::string Player      = "player";
        const std::string Collectible = "collectible";
        const std::string Environment = "environment";
        const std::string Gate        = "gate";
        const std::string Obstacle    = "obstacle";
    }

    double clampFrameDelta(double seconds, double maxDelta) {
        if (std::isnan(seconds)) {
            return 0.0;
        }
        return std::clamp(seconds, 0.0, maxDelta);
    }

} // namespace SimulatorConstants
