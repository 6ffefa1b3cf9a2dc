/**
 * @file particle_system.hpp
 * @brief Fixed-capacity particle pool with continuous emitters and bursts
 *
 * The pool is allocated once at construction and never grows. Emissions
 * that find no free slot are dropped. After each update the active
 * particles are packed into a RenderBuffer for drawing.
 */

#ifndef REEFSIM_PARTICLE_SYSTEM_HPP
#define REEFSIM_PARTICLE_SYSTEM_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

#include "reefsim/core/constants.hpp"
#include "reefsim/math/vector_math.hpp"
#include "reefsim/particles/emitter.hpp"
#include "reefsim/particles/particle.hpp"

namespace Particles {

/**
 * @struct ParticleSystemConfig
 * @brief Construction parameters of the particle system
 */
struct ParticleSystemConfig {
    std::size_t maxParticles = SimulatorConstants::DefaultMaxParticles;

    // Adds the bubbles, debris and lightRays emitters
    bool ambientEmitters = true;

    // Fixed RNG seed; a random one is drawn when unset
    std::optional<uint32_t> seed;
};

/**
 * @struct RenderBuffer
 * @brief Packed attributes of the active particles, in pool order
 *
 * Arrays are sized for the whole pool; only the first activeCount entries
 * (times 3 for positions and colors) are meaningful.
 */
struct RenderBuffer {
    std::vector<float> positions;
    std::vector<float> colors;
    std::vector<float> sizes;
    std::vector<float> alphas;
    std::size_t activeCount = 0;
};

/**
 * @class ParticleSystem
 * @brief Object pool of particles driven by emitters and bursts
 */
class ParticleSystem {
public:
    explicit ParticleSystem(const ParticleSystemConfig& config = ParticleSystemConfig{});

    /**
     * @brief Runs emitters, advances particles, refreshes the render buffer
     *
     * Each active emitter emits one particle per whole 1/rate interval of
     * accumulated time, so large frame gaps lose no emissions.
     */
    void update(double dt);

    /**
     * @brief Emits one particle from an emitter into the first free slot
     * @return false if the pool is exhausted (the emission is dropped)
     */
    bool emitParticle(const Emitter& emitter);

    /**
     * @brief Emits up to config.count particles at one point
     * @return Number of particles actually emitted
     */
    std::size_t createBurst(const Position& position, const BurstConfig& config = BurstConfig{});

    /**
     * @brief Appends an active emitter with an empty accumulator
     *
     * Emitters are addressed by type through findEmitter() and
     * setEmitterActive(); pointers from findEmitter() are invalidated by the
     * next addEmitter().
     */
    void addEmitter(const EmitterConfig& config);

    /**
     * @brief Toggles the first emitter with the given type
     * @return false if no emitter has that type
     */
    bool setEmitterActive(const std::string& type, bool active);

    /**
     * @brief Deactivates every particle; emitters are untouched
     */
    void clear();

    // Adds the three ambient underwater emitters
    void createUnderwaterEmitters();

    std::size_t getActiveCount() const;
    std::size_t getMaxParticles() const { return particles.size(); }
    const std::vector<Particle>& getParticles() const { return particles; }
    const std::vector<Emitter>& getEmitters() const { return emitters; }

    Emitter* findEmitter(const std::string& type);
    const Emitter* findEmitter(const std::string& type) const;

    const RenderBuffer& getRenderBuffer() const { return renderBuffer; }
    double getElapsedTime() const { return elapsedTime; }

private:
    Particle* findFreeParticle();
    Vector randomSpread(const Vector& variation);
    double randomSize(const SizeRange& range);
    void refreshRenderBuffer();

    // Uniform in [0, 1)
    double unit();

    std::vector<Particle> particles;
    std::vector<Emitter> emitters;
    RenderBuffer renderBuffer;
    double elapsedTime = 0.0;

    std::mt19937 rng;
    std::uniform_real_distribution<double> unitDist{0.0, 1.0};
};

} // namespace Particles

#endif // REEFSIM_PARTICLE_SYSTEM_HPP
