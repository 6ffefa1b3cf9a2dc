#include "reefsim/game/gate.hpp"

#include <cmath>
#include <iostream>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/physics_engine.hpp"

namespace Game {

namespace {

constexpr double IdleGlow = 0.3;
constexpr double ActiveGlow = 0.6;
constexpr double EnteredGlow = 1.0;

} // namespace

Gate::Gate(PhysicsEngine& engine, const GateConfig& config)
    : engine(engine)
    , config(config)
{
    Vector const size(config.width * 2.0, config.height, config.depth);
    RigidBody rigidBody = PhysicsEngine::createBoxBody(config.position, size, true);
    rigidBody.category = SimulatorConstants::Categories::Gate;
    rigidBody.name = "Gate";
    body = engine.addRigidBody(rigidBody);

    std::cout << "Gate created at (" << config.position.x << ", "
              << config.position.y << ", " << config.position.z << ")" << std::endl;
}

Gate::~Gate() {
    dispose();
}

void Gate::activate() {
    if (isActivated) {
        return;
    }

    isActivated = true;
    glowIntensity = ActiveGlow;
    std::cout << "Gate activated" << std::endl;
}

void Gate::deactivate() {
    isActivated = false;
    glowIntensity = IdleGlow;
}

bool Gate::onPlayerEnter() {
    if (!isActivated || isCollected) {
        return false;
    }

    isCollected = true;
    glowIntensity = EnteredGlow;
    return true;
}

void Gate::update(double dt) {
    if (!isActivated) {
        return;
    }

    time += dt;
    glowIntensity = IdleGlow + std::sin(time * config.pulseSpeed * 10.0) * 0.2;
}

void Gate::reset() {
    isCollected = false;
    deactivate();
    time = 0.0;
}

void Gate::dispose() {
    if (body == entt::null) {
        return;
    }
    engine.removeRigidBody(body);
    body = entt::null;
}

} // namespace Game
