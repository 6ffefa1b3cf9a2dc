#pragma once

#include <cstdint>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef ENABLE_DEBUG
#define ENABLE_DEBUG 0
#endif

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#ifndef CURRENT_DEBUG_LEVEL
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC
#endif

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Running counters for the collision and particle paths
class DebugStats {
public:
    static void reset() {
        blocking_collisions = 0;
        passthrough_collisions = 0;
        particles_emitted = 0;
        particles_dropped = 0;
    }

    static void recordCollision(bool blocking) {
        if (blocking) {
            blocking_collisions++;
        } else {
            passthrough_collisions++;
        }
    }

    static void recordEmission(bool dropped) {
        if (dropped) {
            particles_dropped++;
        } else {
            particles_emitted++;
        }
    }

    static uint64_t blockingCollisions() { return blocking_collisions; }
    static uint64_t passthroughCollisions() { return passthrough_collisions; }
    static uint64_t particlesEmitted() { return particles_emitted; }
    static uint64_t particlesDropped() { return particles_dropped; }

    // Printed regardless of ENABLE_DEBUG
    static void printCollisionStats(std::ostream& os = std::cout) {
        os << "Collision stats:\n"
           << "  Blocking resolutions: " << blocking_collisions << "\n"
           << "  Pass-through contacts: " << passthrough_collisions << "\n";
    }

    static void printParticleStats(std::ostream& os = std::cout) {
        os << "Particle stats:\n"
           << "  Emitted: " << particles_emitted << "\n"
           << "  Dropped (pool exhausted): " << particles_dropped << "\n";
    }

private:
    static uint64_t blocking_collisions;
    static uint64_t passthrough_collisions;
    static uint64_t particles_emitted;
    static uint64_t particles_dropped;
};
