/**
 * @file physics_engine.hpp
 * @brief Rigid-body world: registration, per-frame integration and collision resolution
 */

#ifndef REEFSIM_PHYSICS_ENGINE_HPP
#define REEFSIM_PHYSICS_ENGINE_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <entt/entt.hpp>

#include "reefsim/components/basic.hpp"
#include "reefsim/core/system_config.hpp"
#include "reefsim/systems/collision/collision_data.hpp"
#include "reefsim/systems/collision/collision_system.hpp"
#include "reefsim/systems/gravity.hpp"
#include "reefsim/systems/movement.hpp"
#include "reefsim/systems/systems.hpp"
#include "reefsim/systems/underwater.hpp"

/**
 * @struct RigidBody
 * @brief Value description of a body before it is registered
 *
 * Built by PhysicsEngine::createSphereBody / createBoxBody and adjusted by the
 * caller (category, name, listener) before addRigidBody turns it into an
 * entity.
 */
struct RigidBody {
    Components::Position position;
    Components::Velocity velocity;
    Components::Shape shape;
    bool isStatic = false;
    std::string category;
    std::string name;
    Components::ICollisionListener* listener = nullptr;
};

/**
 * @class PhysicsEngine
 * @brief Owns every rigid body and advances the dynamic ones each frame
 *
 * Per frame and per dynamic body, in registration order: snapshot the
 * position, apply underwater forces (or gravity), integrate, query
 * collisions, then resolve them and notify the body's listener.
 *
 * Listeners may add or remove bodies while update() runs. Bodies added
 * during a frame are first advanced on the next frame. A body removed during
 * a frame stops colliding at once, is skipped for the rest of the frame, and
 * its entity is destroyed once the frame's iteration has finished.
 */
class PhysicsEngine {
public:
    PhysicsEngine();
    ~PhysicsEngine();

    PhysicsEngine(const PhysicsEngine&) = delete;
    PhysicsEngine& operator=(const PhysicsEngine&) = delete;

    // Factories: zero velocity, not registered
    static RigidBody createSphereBody(const Position& position, double radius, bool isStatic = false);

    /**
     * @param size Full extents of the box; stored as half extents
     */
    static RigidBody createBoxBody(const Position& position, const Vector& size, bool isStatic = false);

    /**
     * @brief Registers a body, and its collider when it has a shape
     * @return Handle used by every other operation
     */
    entt::entity addRigidBody(const RigidBody& body);

    /**
     * @brief Deregisters a body and its collider
     * @return false if the body is not registered (nothing changes)
     */
    bool removeRigidBody(entt::entity body);

    /**
     * @brief Advances every dynamic body by dt seconds
     */
    void update(double dt);

    /**
     * @brief Collision pairs of every registered body against its collision set
     *
     * Each overlapping pair of dynamic bodies appears once per direction.
     */
    std::vector<Collision::CollisionPair> checkCollisions() const;

    std::optional<Position> tryGetPosition(entt::entity body) const;
    std::optional<Vector> tryGetVelocity(entt::entity body) const;
    bool setPosition(entt::entity body, const Position& position);
    bool setVelocity(entt::entity body, const Vector& velocity);

    /**
     * @return Category tag, empty for unknown or untagged bodies
     */
    std::string getCategory(entt::entity body) const;

    bool markCollected(entt::entity body);
    bool isCollected(entt::entity body) const;
    bool isStatic(entt::entity body) const;

    /**
     * @brief Replaces the body's listener; nullptr detaches it
     */
    bool setCollisionListener(entt::entity body, Components::ICollisionListener* listener);

    bool isRegistered(entt::entity body) const;
    std::size_t bodyCount() const { return bodies.size(); }
    const std::vector<entt::entity>& getBodies() const { return bodies; }

    /**
     * @brief Pushes engine-wide settings into every system
     */
    void applyConfig(const SystemConfig& config);
    const SystemConfig& getConfig() const { return currentConfig; }

    void setUnderwater(bool underwater);
    bool isUnderwater() const { return currentConfig.Underwater; }

    Systems::UnderwaterSystem& underwaterSystem() { return *underwater; }
    Systems::BasicGravitySystem& gravitySystem() { return *gravity; }
    Systems::ISystem& getSystem(Systems::SystemType type);

    Collision::CollisionSystem& getCollisionSystem() { return collisionSystem; }
    const Collision::CollisionSystem& getCollisionSystem() const { return collisionSystem; }

    entt::registry& getRegistry() { return registry; }
    const entt::registry& getRegistry() const { return registry; }

private:
    void updateBody(entt::entity body, double dt);
    void flushRemovals();

    entt::registry registry;
    std::vector<entt::entity> bodies;
    std::vector<entt::entity> pendingRemovals;
    bool updating = false;

    Collision::CollisionSystem collisionSystem;
    SystemConfig currentConfig;

    std::unique_ptr<Systems::UnderwaterSystem> underwater;
    std::unique_ptr<Systems::BasicGravitySystem> gravity;
    std::unique_ptr<Systems::MovementSystem> movement;
};

#endif // REEFSIM_PHYSICS_ENGINE_HPP
