/**
 * @file gate.hpp
 * @brief Level exit portal
 *
 * The gate is a static box that starts inactive. Once every star of the level
 * is collected it is activated, and the first player contact while active
 * completes the level.
 */

#pragma once

#include <entt/entt.hpp>

#include "reefsim/math/vector_math.hpp"

class PhysicsEngine;

namespace Game {

/**
 * @struct GateConfig
 * @brief Placement and animation parameters of the gate
 */
struct GateConfig {
    Position position{0.0, -8.0, -15.0};
    double width = 4.0;     // half the opening; the body is 2 * width wide
    double height = 6.0;
    double depth = 0.5;
    double pulseSpeed = 0.02;
};

/**
 * @class Gate
 * @brief Activation state and glow animation of the exit portal
 */
class Gate {
public:
    explicit Gate(PhysicsEngine& engine, const GateConfig& config = GateConfig{});
    ~Gate();

    Gate(const Gate&) = delete;
    Gate& operator=(const Gate&) = delete;

    // No-op when already active
    void activate();
    void deactivate();

    /**
     * @brief Registers the player passing through
     * @return true exactly once per activation, false when inactive
     */
    bool onPlayerEnter();

    /**
     * @brief Advances the glow animation; does nothing while inactive
     */
    void update(double dt);

    /**
     * @brief Prepares the gate for the next level
     */
    void reset();

    bool getIsActivated() const { return isActivated; }
    bool getIsCollected() const { return isCollected; }
    Position getPosition() const { return config.position; }
    entt::entity getBody() const { return body; }
    double getTime() const { return time; }
    double getGlowIntensity() const { return glowIntensity; }

    void dispose();

private:
    PhysicsEngine& engine;
    GateConfig config;
    entt::entity body = entt::null;
    bool isActivated = false;
    bool isCollected = false;
    double time = 0.0;
    double glowIntensity = 0.3;
};

} // namespace Game
