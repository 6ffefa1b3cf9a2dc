#include "reefsim/core/debug.hpp"

// Initialize static members
uint64_t DebugStats::blocking_collisions = 0;
uint64_t DebugStats::passthrough_collisions = 0;
uint64_t DebugStats::particles_emitted = 0;
uint64_t DebugStats::particles_dropped = 0;
