/**
 * @file level_builder.cpp
 * @brief Level geometry: floor, boundary walls, props and stars
 */

#include "reefsim/game/level_builder.hpp"

#include <iostream>

#include "reefsim/core/constants.hpp"
#include "reefsim/core/physics_engine.hpp"

namespace Game {

namespace {

constexpr OceanObjectType OceanObjectTypes[] = {
    OceanObjectType::Coral,
    OceanObjectType::Seaweed,
    OceanObjectType::Rock,
    OceanObjectType::Anemone,
    OceanObjectType::Kelp,
};

// Props and stars are scattered inside these extents around the origin
constexpr double PropSpread = 80.0;
constexpr double StarSpread = 20.0;

} // namespace

std::string toString(OceanObjectType type) {
    switch (type) {
        case OceanObjectType::Coral:   return "coral";
        case OceanObjectType::Seaweed: return "seaweed";
        case OceanObjectType::Rock:    return "rock";
        case OceanObjectType::Anemone: return "anemone";
        case OceanObjectType::Kelp:    return "kelp";
    }
    return "unknown";
}

double collisionRadius(OceanObjectType type) {
    switch (type) {
        case OceanObjectType::Kelp:    return 1.0;
        case OceanObjectType::Seaweed: return 0.3;
        default:                       return 0.8;
    }
}

LevelBuilder::LevelBuilder(PhysicsEngine& engine, std::mt19937& rng)
    : engine(engine)
    , rng(rng)
{
}

LevelLayout LevelBuilder::buildEnvironment(std::size_t oceanObjectCount, double levelHalfSize) {
    LevelLayout layout;
    layout.floor = createFloor(levelHalfSize);
    layout.walls = createBoundaries(levelHalfSize);

    layout.oceanObjects.reserve(oceanObjectCount);
    for (std::size_t i = 0; i < oceanObjectCount; ++i) {
        layout.oceanObjects.push_back(createOceanObject());
    }

    std::cerr << "Created level: 1 floor, " << layout.walls.size() << " walls, "
              << layout.oceanObjects.size() << " ocean objects" << std::endl;
    return layout;
}

entt::entity LevelBuilder::createFloor(double levelHalfSize) {
    RigidBody floor = PhysicsEngine::createBoxBody(
        Position(0.0, FloorY, 0.0),
        Vector(levelHalfSize * 2.0, 0.1, levelHalfSize * 2.0),
        true);
    floor.category = SimulatorConstants::Categories::Environment;
    floor.name = "Ocean Floor";
    return engine.addRigidBody(floor);
}

std::vector<entt::entity> LevelBuilder::createBoundaries(double levelHalfSize) {
    struct WallSpec {
        Position position;
        Vector size;
        const char* name;
    };

    double const wallY = WallHeight / 2.0 - 10.0;
    double const span = levelHalfSize * 2.0;

    const WallSpec walls[] = {
        {Position(0.0, wallY, levelHalfSize),  Vector(span, WallHeight, WallThickness), "North Wall"},
        {Position(0.0, wallY, -levelHalfSize), Vector(span, WallHeight, WallThickness), "South Wall"},
        {Position(levelHalfSize, wallY, 0.0),  Vector(WallThickness, WallHeight, span), "East Wall"},
        {Position(-levelHalfSize, wallY, 0.0), Vector(WallThickness, WallHeight, span), "West Wall"},
    };

    std::vector<entt::entity> created;
    for (const auto& spec : walls) {
        RigidBody wall = PhysicsEngine::createBoxBody(spec.position, spec.size, true);
        wall.category = SimulatorConstants::Categories::Environment;
        wall.name = spec.name;
        created.push_back(engine.addRigidBody(wall));

        std::cout << "Created " << spec.name << " at (" << spec.position.x << ", "
                  << spec.position.y << ", " << spec.position.z << ")" << std::endl;
    }
    return created;
}

entt::entity LevelBuilder::createOceanObject() {
    constexpr std::size_t typeCount = sizeof(OceanObjectTypes) / sizeof(OceanObjectTypes[0]);
    auto index = static_cast<std::size_t>(unit() * typeCount);
    if (index >= typeCount) {
        index = typeCount - 1;
    }
    OceanObjectType const type = OceanObjectTypes[index];

    double const x = (unit() - 0.5) * PropSpread;
    double const y = -14.0 + unit() * 2.0;
    double const z = (unit() - 0.5) * PropSpread;

    RigidBody prop = PhysicsEngine::createSphereBody(Position(x, y, z), collisionRadius(type), true);
    prop.category = SimulatorConstants::Categories::Environment;
    prop.name = toString(type);
    return engine.addRigidBody(prop);
}

std::vector<entt::entity> LevelBuilder::spawnStars(std::size_t count) {
    std::vector<entt::entity> stars;
    stars.reserve(count);

    for (std::size_t i = 0; i < count; ++i) {
        double const x = (unit() - 0.5) * StarSpread;
        double const y = unit() * 8.0 - 12.0;
        double const z = (unit() - 0.5) * StarSpread;

        RigidBody star = PhysicsEngine::createSphereBody(Position(x, y, z), StarRadius, true);
        star.category = SimulatorConstants::Categories::Collectible;
        star.name = "Star";
        stars.push_back(engine.addRigidBody(star));
    }

    std::cerr << "Spawned " << stars.size() << " stars" << std::endl;
    return stars;
}

void LevelBuilder::clear(LevelLayout& layout) {
    engine.removeRigidBody(layout.floor);
    for (auto wall : layout.walls) {
        engine.removeRigidBody(wall);
    }
    for (auto prop : layout.oceanObjects) {
        engine.removeRigidBody(prop);
    }
    layout = LevelLayout{};
}

double LevelBuilder::unit() {
    return unitDist(rng);
}

} // namespace Game
