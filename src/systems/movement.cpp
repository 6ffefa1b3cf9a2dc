#include "reefsim/systems/movement.hpp"
#include "reefsim/components/basic.hpp"

namespace Systems {

MovementSystem::MovementSystem() {
    // Initialize with default configurations
}

void MovementSystem::update(entt::registry &registry, entt::entity entity, double dt) {
    if (registry.all_of<Components::Static>(entity)) {
        return;
    }

    auto *pos = registry.try_get<Components::Position>(entity);
    const auto *vel = registry.try_get<Components::Velocity>(entity);
    if (!pos || !vel) {
        return;
    }

    *pos += *vel * dt;
}

} // namespace Systems
