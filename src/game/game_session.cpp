/**
 * @file game_session.cpp
 * @brief Star collection, gate activation and level progression
 */

#include "reefsim/game/game_session.hpp"

#include <algorithm>
#include <iostream>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/profile.hpp"

namespace Game {

namespace {

Particles::ParticleSystemConfig particleConfig(const GameConfig& config, uint32_t seed) {
    Particles::ParticleSystemConfig particles;
    particles.maxParticles = config.maxParticles;
    particles.ambientEmitters = true;
    particles.seed = seed;
    return particles;
}

uint32_t sessionSeed(const GameConfig& config) {
    return config.seed ? *config.seed : std::random_device{}();
}

} // namespace

GameSession::GameSession(const GameConfig& config)
    : config(config)
    , rng(sessionSeed(config))
    , particleSystem(particleConfig(config, static_cast<uint32_t>(rng())))
    , builder(engine, rng)
{
    layout = builder.buildEnvironment(config.oceanObjectCount, config.levelHalfSize);
    gate = std::make_unique<Gate>(engine);
    player = std::make_unique<Player>(engine);
    startLevel();
}

GameSession::~GameSession() {
    player.reset();
    gate.reset();
    builder.clear(layout);
    for (auto star : stars) {
        engine.removeRigidBody(star);
    }
}

void GameSession::startLevel() {
    stars = builder.spawnStars(config.starsPerLevel);
    std::cout << "Level " << levelNumber << ": collect " << stars.size() << " stars" << std::endl;

    if (stars.empty()) {
        activateGate();
    }
}

void GameSession::update(double dt, const Vector& intent) {
    PROFILE_SCOPE("GameSession::update");

    double const step = SimulatorConstants::clampFrameDelta(dt, engine.getConfig().MaxFrameDelta);

    player->clearRecentContacts();
    engine.update(step);
    player->handleInput(intent);
    particleSystem.update(step);
    gate->update(step);

    checkStarCollection();
    checkGateCollision();
}

double GameSession::getDepth() const {
    return SimulatorConstants::WaterSurfaceY - player->getPosition().y;
}

std::vector<entt::entity> GameSession::playerContacts() const {
    std::vector<entt::entity> contacts =
        engine.getCollisionSystem().checkCollisions(player->getBody());

    // Blocking contacts the response rolled the player out of this frame
    for (auto contact : player->getRecentContacts()) {
        if (std::find(contacts.begin(), contacts.end(), contact) == contacts.end()) {
            contacts.push_back(contact);
        }
    }

    contacts.erase(std::remove_if(contacts.begin(), contacts.end(),
        [this](entt::entity e) { return !engine.isRegistered(e); }), contacts.end());
    return contacts;
}

void GameSession::checkStarCollection() {
    for (auto contact : playerContacts()) {
        if (engine.getCategory(contact) != SimulatorConstants::Categories::Collectible ||
            engine.isCollected(contact)) {
            continue;
        }
        collectStar(contact);
    }
}

void GameSession::collectStar(entt::entity star) {
    auto it = std::find(stars.begin(), stars.end(), star);
    if (it == stars.end()) {
        return;
    }

    engine.markCollected(star);
    Position const position = engine.tryGetPosition(star).value_or(player->getPosition());

    engine.removeRigidBody(star);
    stars.erase(it);
    starCount++;

    Particles::BurstConfig burst;
    burst.count = 15;
    burst.life = 1.5;
    burst.velocity = Vector(0.0, 2.0, 0.0);
    burst.velocityVariation = Vector(3.0, 3.0, 3.0);
    burst.color = Particles::Color::fromHex(0xffd700);
    burst.size = {3.0, 8.0};
    particleSystem.createBurst(position, burst);

    std::cout << "Star collected! Total: " << starCount << std::endl;

    if (stars.empty()) {
        activateGate();
    }
}

void GameSession::activateGate() {
    if (gate->getIsActivated()) {
        return;
    }
    gate->activate();
    std::cout << "Gate activated! Swim through to complete level " << levelNumber << std::endl;
}

void GameSession::checkGateCollision() {
    if (!gate->getIsActivated()) {
        return;
    }

    for (auto contact : playerContacts()) {
        if (contact != gate->getBody()) {
            continue;
        }
        if (gate->onPlayerEnter()) {
            levelComplete();
        }
        break;
    }
}

void GameSession::levelComplete() {
    std::cout << "Level " << levelNumber << " complete!" << std::endl;

    startPortalTransition();

    levelNumber++;
    gate->reset();
    startLevel();
}

void GameSession::startPortalTransition() {
    Position const gatePosition = gate->getPosition();

    Particles::BurstConfig swirl;
    swirl.count = 50;
    swirl.life = 2.25;
    swirl.velocity = Vector(0.0, 1.0, 0.0);
    swirl.velocityVariation = Vector(6.0, 4.0, 6.0);
    swirl.color = Particles::Color::fromHex(0x87ceeb);
    swirl.size = {4.0, 12.0};
    particleSystem.createBurst(gatePosition, swirl);

    Particles::BurstConfig sparkles;
    sparkles.count = 30;
    sparkles.life = 3.0;
    sparkles.velocity = Vector(0.0, 0.5, 0.0);
    sparkles.velocityVariation = Vector(4.0, 3.0, 4.0);
    sparkles.color = Particles::Color::fromHex(0xffd700);
    sparkles.size = {2.0, 6.0};
    particleSystem.createBurst(gatePosition, sparkles);
}

} // namespace Game
