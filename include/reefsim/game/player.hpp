/**
 * @file player.hpp
 * @brief The swimmer: a dynamic sphere steered by a movement intent
 */

#pragma once

#include <vector>

#include <entt/entt.hpp>

#include "reefsim/components/basic.hpp"
#include "reefsim/math/vector_math.hpp"

class PhysicsEngine;

namespace Game {

/**
 * @struct PlayerConfig
 * @brief Spawn point and swimming parameters of the player
 */
struct PlayerConfig {
    Position spawn{0.0, -8.0, 0.0};
    double radius = 1.0;

    // Scales the intent added to velocity each frame
    double moveSpeed = 8.0;

    // Speed cap while actively swimming (m/s)
    double maxVelocity = 5.0;

    // Velocity multiplier per frame when there is no input
    double idleDrag = 0.9;

    // Speed of the push away from an obstacle on contact
    double obstaclePush = 2.0;
};

/**
 * @class Player
 * @brief Owns the player's rigid body and listens for its collisions
 *
 * The body is registered on construction and deregistered by dispose() or
 * the destructor. Contacts reported by the engine are kept until
 * clearRecentContacts(), so gameplay can see bodies the rollback response
 * pushed the player out of.
 */
class Player : public Components::ICollisionListener {
public:
    explicit Player(PhysicsEngine& engine, const PlayerConfig& config = PlayerConfig{});
    ~Player() override;

    Player(const Player&) = delete;
    Player& operator=(const Player&) = delete;

    /**
     * @brief Sets the movement intent and applies it to the body
     *
     * Intents longer than 1 are normalized. Any non-zero component counts as
     * moving.
     */
    void handleInput(const Vector& intent);

    /**
     * @brief Adds the current intent to velocity, or slows an idle player
     */
    void applyMovement();

    void onCollision(entt::entity self, const std::vector<entt::entity>& others) override;

    Position getPosition() const;
    void setPosition(const Position& position);
    Vector getVelocity() const;

    // True while input is held or the body still drifts faster than 0.1 m/s
    bool getIsMoving() const;

    const Vector& getMovementVector() const { return movementVector; }
    entt::entity getBody() const { return body; }
    const PlayerConfig& getConfig() const { return config; }

    const std::vector<entt::entity>& getRecentContacts() const { return recentContacts; }
    void clearRecentContacts() { recentContacts.clear(); }

    void dispose();

private:
    PhysicsEngine& engine;
    PlayerConfig config;
    entt::entity body = entt::null;
    Vector movementVector;
    bool isMoving = false;
    std::vector<entt::entity> recentContacts;
};

} // namespace Game
