/**
 * @file level_builder.hpp
 * @brief Populates the physics world with the static level geometry
 *
 * A level consists of:
 * - An ocean floor slab
 * - Four boundary walls around the play area
 * - Scattered static props (coral, seaweed, rock, anemone, kelp)
 * - A set of collectible stars, respawned every level
 */

#pragma once

#include <cstddef>
#include <random>
#include <string>
#include <vector>

#include <entt/entt.hpp>

class PhysicsEngine;

namespace Game {

enum class OceanObjectType {
    Coral,
    Seaweed,
    Rock,
    Anemone,
    Kelp,
};

std::string toString(OceanObjectType type);

// Radius of the collision sphere standing in for a prop
double collisionRadius(OceanObjectType type);

/**
 * @struct LevelLayout
 * @brief Bodies making up the persistent part of a level
 */
struct LevelLayout {
    entt::entity floor = entt::null;
    std::vector<entt::entity> walls;
    std::vector<entt::entity> oceanObjects;
};

/**
 * @class LevelBuilder
 * @brief Creates and registers level bodies with random placement
 */
class LevelBuilder {
public:
    LevelBuilder(PhysicsEngine& engine, std::mt19937& rng);

    /**
     * @brief Floor, walls and props
     * @param oceanObjectCount Number of props to scatter
     * @param levelHalfSize Distance from the centre to each wall
     */
    LevelLayout buildEnvironment(std::size_t oceanObjectCount, double levelHalfSize);

    /**
     * @brief Scatters static collectible stars near the level centre
     */
    std::vector<entt::entity> spawnStars(std::size_t count);

    // Deregisters every body of the layout
    void clear(LevelLayout& layout);

    static constexpr double FloorY = -15.0;
    static constexpr double WallHeight = 15.0;
    static constexpr double WallThickness = 2.0;
    static constexpr double StarRadius = 1.0;

private:
    entt::entity createFloor(double levelHalfSize);
    std::vector<entt::entity> createBoundaries(double levelHalfSize);
    entt::entity createOceanObject();

    double unit();

    PhysicsEngine& engine;
    std::mt19937& rng;
    std::uniform_real_distribution<double> unitDist{0.0, 1.0};
};

} // namespace Game
