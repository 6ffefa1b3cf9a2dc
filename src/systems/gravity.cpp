#include "reefsim/systems/gravity.hpp"
#include "reefsim/components/basic.hpp"

namespace Systems {

BasicGravitySystem::BasicGravitySystem() {
    // Initialize with default configurations
}

void BasicGravitySystem::update(entt::registry &registry, entt::entity entity, double dt) {
    auto *vel = registry.try_get<Components::Velocity>(entity);
    if (!vel || registry.all_of<Components::Static>(entity)) {
        return;
    }

    *vel += specificConfig.gravity * dt;
}

} // namespace Systems
