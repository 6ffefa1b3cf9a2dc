/**
 * @file physics_engine.cpp
 * @brief Implementation of PhysicsEngine.
 */

#include "reefsim/core/physics_engine.hpp"

#include <algorithm>
#include <iostream>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/debug.hpp"
#include "reefsim/core/profile.hpp"
#include "reefsim/systems/collision/collision_response.hpp"

namespace {

// Marks a body removed while update() is iterating
struct PendingRemoval {};

} // namespace

PhysicsEngine::PhysicsEngine()
    : collisionSystem(registry)
    , underwater(std::make_unique<Systems::UnderwaterSystem>())
    , gravity(std::make_unique<Systems::BasicGravitySystem>())
    , movement(std::make_unique<Systems::MovementSystem>())
{
    applyConfig(currentConfig);
    std::cout << "PhysicsEngine::init() underwater=" << std::boolalpha
              << currentConfig.Underwater << std::noboolalpha << std::endl;
}

PhysicsEngine::~PhysicsEngine() = default;

RigidBody PhysicsEngine::createSphereBody(const Position& position, double radius, bool isStatic) {
    RigidBody body;
    body.position = position;
    body.shape = Components::Sphere{radius};
    body.isStatic = isStatic;
    return body;
}

RigidBody PhysicsEngine::createBoxBody(const Position& position, const Vector& size, bool isStatic) {
    RigidBody body;
    body.position = position;
    body.shape = Components::Box{size * 0.5};
    body.isStatic = isStatic;
    return body;
}

entt::entity PhysicsEngine::addRigidBody(const RigidBody& body) {
    auto entity = registry.create();

    registry.emplace<Components::Position>(entity, body.position);
    registry.emplace<Components::Velocity>(entity, body.velocity);
    registry.emplace<Components::Shape>(entity, body.shape);
    if (body.isStatic) {
        registry.emplace<Components::Static>(entity);
    }
    if (!body.category.empty()) {
        registry.emplace<Components::Category>(entity, body.category);
        if (body.category == SimulatorConstants::Categories::Collectible) {
            registry.emplace<Components::Collectible>(entity);
        }
    }
    if (!body.name.empty()) {
        registry.emplace<Components::Name>(entity, body.name);
    }
    if (body.listener) {
        registry.emplace<Components::CollisionListener>(entity, body.listener);
    }

    bodies.push_back(entity);

    if (!std::holds_alternative<std::monostate>(body.shape)) {
        collisionSystem.addCollider(entity, body.isStatic);
    }

    return entity;
}

bool PhysicsEngine::removeRigidBody(entt::entity body) {
    if (!isRegistered(body)) {
        return false;
    }

    bodies.erase(std::remove(bodies.begin(), bodies.end(), body), bodies.end());
    collisionSystem.removeCollider(body);

    DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "removeRigidBody("
        << static_cast<uint32_t>(entt::to_integral(body)) << ")"
        << (updating ? " deferred" : "") << "\n");

    if (updating) {
        registry.emplace<PendingRemoval>(body);
        pendingRemovals.push_back(body);
    } else {
        registry.destroy(body);
    }
    return true;
}

void PhysicsEngine::update(double dt) {
    PROFILE_SCOPE("PhysicsEngine::update");

    updating = true;

    // Listeners may add or remove bodies; iterate a copy
    const std::vector<entt::entity> snapshot = bodies;
    for (auto body : snapshot) {
        if (!isRegistered(body)) {
            continue;
        }
        updateBody(body, dt);
    }

    updating = false;
    flushRemovals();
}

void PhysicsEngine::updateBody(entt::entity body, double dt) {
    if (registry.all_of<Components::Static>(body)) {
        return;
    }

    Position const previousPosition = registry.get<Components::Position>(body);

    getSystem(currentConfig.Underwater ? Systems::SystemType::UNDERWATER
                                       : Systems::SystemType::BASIC_GRAVITY)
        .update(registry, body, dt);
    movement->update(registry, body, dt);

    const auto collisions = collisionSystem.checkCollisions(body);
    if (collisions.empty()) {
        return;
    }

    Collision::CollisionResponseConfig response;
    response.velocityScale = currentConfig.CollisionVelocityScale;
    Collision::CollisionResponse::resolve(registry, body, collisions, previousPosition, response);
}

void PhysicsEngine::flushRemovals() {
    for (auto body : pendingRemovals) {
        if (registry.valid(body)) {
            registry.destroy(body);
        }
    }
    pendingRemovals.clear();
}

std::vector<Collision::CollisionPair> PhysicsEngine::checkCollisions() const {
    PROFILE_SCOPE("PhysicsEngine::checkCollisions");

    std::vector<Collision::CollisionPair> pairs;
    for (auto bodyA : bodies) {
        for (auto bodyB : collisionSystem.checkCollisions(bodyA)) {
            pairs.push_back({bodyA, bodyB});
        }
    }
    return pairs;
}

std::optional<Position> PhysicsEngine::tryGetPosition(entt::entity body) const {
    if (!registry.valid(body)) {
        return std::nullopt;
    }
    if (const auto* pos = registry.try_get<Components::Position>(body)) {
        return *pos;
    }
    return std::nullopt;
}

std::optional<Vector> PhysicsEngine::tryGetVelocity(entt::entity body) const {
    if (!registry.valid(body)) {
        return std::nullopt;
    }
    if (const auto* vel = registry.try_get<Components::Velocity>(body)) {
        return *vel;
    }
    return std::nullopt;
}

bool PhysicsEngine::setPosition(entt::entity body, const Position& position) {
    if (!isRegistered(body)) {
        return false;
    }
    registry.replace<Components::Position>(body, position);
    return true;
}

bool PhysicsEngine::setVelocity(entt::entity body, const Vector& velocity) {
    if (!isRegistered(body)) {
        return false;
    }
    registry.replace<Components::Velocity>(body, velocity);
    return true;
}

std::string PhysicsEngine::getCategory(entt::entity body) const {
    if (!registry.valid(body)) {
        return {};
    }
    const auto* category = registry.try_get<Components::Category>(body);
    return category ? category->tag : std::string{};
}

bool PhysicsEngine::markCollected(entt::entity body) {
    if (!registry.valid(body)) {
        return false;
    }
    registry.emplace_or_replace<Components::Collectible>(body, true);
    return true;
}

bool PhysicsEngine::isCollected(entt::entity body) const {
    if (!registry.valid(body)) {
        return false;
    }
    const auto* collectible = registry.try_get<Components::Collectible>(body);
    return collectible && collectible->collected;
}

bool PhysicsEngine::isStatic(entt::entity body) const {
    return registry.valid(body) && registry.all_of<Components::Static>(body);
}

bool PhysicsEngine::setCollisionListener(entt::entity body, Components::ICollisionListener* listener) {
    if (!isRegistered(body)) {
        return false;
    }
    if (listener) {
        registry.emplace_or_replace<Components::CollisionListener>(body, listener);
    } else if (registry.all_of<Components::CollisionListener>(body)) {
        registry.remove<Components::CollisionListener>(body);
    }
    return true;
}

bool PhysicsEngine::isRegistered(entt::entity body) const {
    return registry.valid(body) && !registry.all_of<PendingRemoval>(body);
}

void PhysicsEngine::applyConfig(const SystemConfig& config) {
    currentConfig = config;

    underwater->setSystemConfig(currentConfig);
    gravity->setSystemConfig(currentConfig);
    movement->setSystemConfig(currentConfig);

    Systems::GravityConfig gravityConfig = gravity->getSpecificConfig();
    gravityConfig.gravity = currentConfig.Gravity;
    gravity->setSpecificConfig(gravityConfig);
}

void PhysicsEngine::setUnderwater(bool isUnderwater) {
    SystemConfig config = currentConfig;
    config.Underwater = isUnderwater;
    applyConfig(config);
}

Systems::ISystem& PhysicsEngine::getSystem(Systems::SystemType type) {
    switch (type) {
        case Systems::SystemType::UNDERWATER:
            return *underwater;
        case Systems::SystemType::BASIC_GRAVITY:
            return *gravity;
        case Systems::SystemType::MOVEMENT:
            break;
    }
    return *movement;
}
