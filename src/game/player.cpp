#include "reefsim/game/player.hpp"

#include <algorithm>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/debug.hpp"
#include "reefsim/core/physics_engine.hpp"

namespace Game {

Player::Player(PhysicsEngine& engine, const PlayerConfig& config)
    : engine(engine)
    , config(config)
{
    RigidBody rigidBody = PhysicsEngine::createSphereBody(config.spawn, config.radius, false);
    rigidBody.category = SimulatorConstants::Categories::Player;
    rigidBody.name = "Player";
    rigidBody.listener = this;
    body = engine.addRigidBody(rigidBody);
}

Player::~Player() {
    dispose();
}

void Player::handleInput(const Vector& intent) {
    movementVector = intent;
    isMoving = intent.x != 0.0 || intent.y != 0.0 || intent.z != 0.0;

    // Diagonals are no faster than straight lines
    if (movementVector.length() > 1.0) {
        movementVector = movementVector.normalized();
    }

    applyMovement();
}

void Player::applyMovement() {
    auto velocity = engine.tryGetVelocity(body);
    if (!velocity) {
        return;
    }

    Vector v = *velocity;
    if (!isMoving) {
        v *= config.idleDrag;
        engine.setVelocity(body, v);
        return;
    }

    v += movementVector * (config.moveSpeed * 0.05);
    if (v.length() > config.maxVelocity) {
        v = v.normalized() * config.maxVelocity;
    }
    engine.setVelocity(body, v);
}

void Player::onCollision(entt::entity self, const std::vector<entt::entity>& others) {
    for (auto other : others) {
        if (std::find(recentContacts.begin(), recentContacts.end(), other) == recentContacts.end()) {
            recentContacts.push_back(other);
        }

        if (engine.getCategory(other) != SimulatorConstants::Categories::Obstacle) {
            continue;
        }

        auto selfPos = engine.tryGetPosition(self);
        auto otherPos = engine.tryGetPosition(other);
        auto velocity = engine.tryGetVelocity(self);
        if (!selfPos || !otherPos || !velocity) {
            continue;
        }

        Vector const away = Vector(*selfPos - *otherPos).normalized();
        engine.setVelocity(self, *velocity + away * config.obstaclePush);
        DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "Player pushed off obstacle\n");
    }
}

Position Player::getPosition() const {
    return engine.tryGetPosition(body).value_or(config.spawn);
}

void Player::setPosition(const Position& position) {
    engine.setPosition(body, position);
}

Vector Player::getVelocity() const {
    return engine.tryGetVelocity(body).value_or(Vector());
}

bool Player::getIsMoving() const {
    return isMoving || getVelocity().length() > 0.1;
}

void Player::dispose() {
    if (body == entt::null) {
        return;
    }
    engine.removeRigidBody(body);
    body = entt::null;
    recentContacts.clear();
}

} // namespace Game
