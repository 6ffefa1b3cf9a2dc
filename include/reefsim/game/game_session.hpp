/**
 * @file game_session.hpp
 * @brief One play session: world, effects, player, gate and level progression
 */

#ifndef REEFSIM_GAME_SESSION_HPP
#define REEFSIM_GAME_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <vector>

#include <entt/entt.hpp>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/physics_engine.hpp"
#include "reefsim/game/gate.hpp"
#include "reefsim/game/level_builder.hpp"
#include "reefsim/game/player.hpp"
#include "reefsim/particles/particle_system.hpp"

namespace Game {

/**
 * @struct GameConfig
 * @brief Session-wide settings
 */
struct GameConfig {
    std::size_t maxParticles = SimulatorConstants::GameMaxParticles;
    std::size_t starsPerLevel = 5;
    std::size_t oceanObjectCount = 15;
    double levelHalfSize = 50.0;

    // Seeds both level layout and particle jitter; random when unset
    std::optional<uint32_t> seed;
};

/**
 * @class GameSession
 * @brief Owns every gameplay object and runs the per-frame order
 *
 * Frame order: clamp dt, physics, player input, particles, gate animation,
 * star collection, gate entry.
 */
class GameSession {
public:
    explicit GameSession(const GameConfig& config = GameConfig{});
    ~GameSession();

    GameSession(const GameSession&) = delete;
    GameSession& operator=(const GameSession&) = delete;

    /**
     * @brief Advances the session by one frame
     * @param dt Wall-clock delta; clamped to the engine's SystemConfig::MaxFrameDelta
     * @param intent Movement intent for the player
     */
    void update(double dt, const Vector& intent);

    int getStarCount() const { return starCount; }
    int getLevelNumber() const { return levelNumber; }
    std::size_t getStarsRemaining() const { return stars.size(); }

    // Metres below the water surface
    double getDepth() const;

    const std::vector<entt::entity>& getStars() const { return stars; }
    const LevelLayout& getLayout() const { return layout; }
    const GameConfig& getConfig() const { return config; }

    PhysicsEngine& getEngine() { return engine; }
    const PhysicsEngine& getEngine() const { return engine; }
    Particles::ParticleSystem& getParticleSystem() { return particleSystem; }
    const Particles::ParticleSystem& getParticleSystem() const { return particleSystem; }
    Player& getPlayer() { return *player; }
    const Player& getPlayer() const { return *player; }
    Gate& getGate() { return *gate; }
    const Gate& getGate() const { return *gate; }

private:
    void startLevel();
    std::vector<entt::entity> playerContacts() const;
    void checkStarCollection();
    void checkGateCollision();
    void collectStar(entt::entity star);
    void activateGate();
    void levelComplete();
    void startPortalTransition();

    GameConfig config;
    std::mt19937 rng;
    PhysicsEngine engine;
    Particles::ParticleSystem particleSystem;
    LevelBuilder builder;
    LevelLayout layout;
    std::unique_ptr<Player> player;
    std::unique_ptr<Gate> gate;
    std::vector<entt::entity> stars;

    int starCount = 0;
    int levelNumber = 1;
};

} // namespace Game

#endif // REEFSIM_GAME_SESSION_HPP
