/**
 * @file main.cpp
 * @brief Headless entry point: plays a session on autopilot.
 *
 * Usage: reefsim [frames] [seed]
 *
 * The autopilot swims towards the nearest remaining star, then towards the
 * gate once it opens. Profiling and collision statistics are printed on exit.
 */

#include <cstdlib>
#include <iostream>
#include <limits>

#include "reefsim/core/debug.hpp"
#include "reefsim/core/profile.hpp"
#include "reefsim/core/sim_manager.hpp"
#include "reefsim/game/game_session.hpp"

namespace {

Vector autopilot(const Game::GameSession& session) {
    const PhysicsEngine& engine = session.getEngine();
    Position const here = session.getPlayer().getPosition();

    Position target = here;
    double best = std::numeric_limits<double>::max();
    for (auto star : session.getStars()) {
        auto pos = engine.tryGetPosition(star);
        if (pos && here.dist(*pos) < best) {
            best = here.dist(*pos);
            target = *pos;
        }
    }

    if (session.getStars().empty() && session.getGate().getIsActivated()) {
        target = session.getGate().getPosition();
    }

    return Vector(target - here).normalized();
}

} // namespace

int main(int argc, char* argv[]) {
    unsigned int frames = 600;
    Game::GameConfig config;

    if (argc > 1) {
        frames = static_cast<unsigned int>(std::strtoul(argv[1], nullptr, 10));
    }
    if (argc > 2) {
        config.seed = static_cast<uint32_t>(std::strtoul(argv[2], nullptr, 10));
    }

    Game::GameSession session(config);

    SimManager manager(session);
    manager.setInputProvider(autopilot);
    manager.setFrameLimit(frames);
    manager.run();

    std::cout << "Level " << session.getLevelNumber()
              << ", stars collected: " << session.getStarCount()
              << ", depth: " << session.getDepth() << " m"
              << ", particles: " << session.getParticleSystem().getActiveCount()
              << std::endl;

    DebugStats::printCollisionStats();
    DebugStats::printParticleStats();
    Profiling::Profiler::printStats();

    return 0;
}
