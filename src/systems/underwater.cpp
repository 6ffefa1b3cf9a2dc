/**
 * @file underwater.cpp
 * @brief Implementation of the underwater force system
 */

#include "reefsim/systems/underwater.hpp"
#include "reefsim/components/basic.hpp"

namespace Systems {

UnderwaterSystem::UnderwaterSystem() {
    // Initialize with default configurations
}

void UnderwaterSystem::update(entt::registry &registry, entt::entity entity, double dt) {
    auto *vel = registry.try_get<Components::Velocity>(entity);
    if (!vel || registry.all_of<Components::Static>(entity)) {
        return;
    }

    applyUnderwaterEffects(*vel, dt);
}

void UnderwaterSystem::applyBuoyancy(Vector &velocity, double dt) const {
    velocity.y += specificConfig.buoyancyForce * dt;
}

void UnderwaterSystem::applyDrag(Vector &velocity) const {
    velocity *= specificConfig.dragCoefficient;
}

void UnderwaterSystem::applyCurrent(Vector &velocity, double dt, double multiplier) const {
    velocity += specificConfig.currentDirection *
                (specificConfig.currentStrength * multiplier * dt);
}

void UnderwaterSystem::applyUnderwaterEffects(Vector &velocity, double dt) const {
    applyBuoyancy(velocity, dt);
    applyDrag(velocity);
    applyCurrent(velocity, dt);
}

} // namespace Systems
