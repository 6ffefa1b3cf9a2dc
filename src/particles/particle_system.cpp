/**
 * @file particle_system.cpp
 * @brief Implementation of the particle pool and emitters
 */

#include "reefsim/particles/particle_system.hpp"

#include <algorithm>
#include <iostream>

#include "reefsim/core/debug.hpp"
#include "reefsim/core/profile.hpp"

namespace Particles {

ParticleSystem::ParticleSystem(const ParticleSystemConfig& config)
    : particles(config.maxParticles)
    , rng(config.seed ? *config.seed : std::random_device{}())
{
    renderBuffer.positions.assign(config.maxParticles * 3, 0.0f);
    renderBuffer.colors.assign(config.maxParticles * 3, 0.0f);
    renderBuffer.sizes.assign(config.maxParticles, 0.0f);
    renderBuffer.alphas.assign(config.maxParticles, 0.0f);

    if (config.ambientEmitters) {
        createUnderwaterEmitters();
    }

    std::cerr << "ParticleSystem: " << particles.size() << " slots, "
              << emitters.size() << " emitters" << std::endl;
}

void ParticleSystem::createUnderwaterEmitters()
{
    EmitterConfig bubbles;
    bubbles.type = "bubbles";
    bubbles.position = Position(0.0, -10.0, 0.0);
    bubbles.rate = 5.0;
    bubbles.life = 8.0;
    bubbles.size = {2.0, 6.0};
    bubbles.velocity = Vector(0.0, 2.0, 0.0);
    bubbles.velocityVariation = Vector(0.5, 0.5, 0.5);
    bubbles.color = Color::fromHex(0x87ceeb);
    bubbles.colorVariation = 0.1;
    bubbles.area = Vector(20.0, 2.0, 20.0);
    addEmitter(bubbles);

    // Plankton and debris, slow and wide
    EmitterConfig debris;
    debris.type = "debris";
    debris.position = Position(0.0, 0.0, 0.0);
    debris.rate = 3.0;
    debris.life = 15.0;
    debris.size = {1.0, 3.0};
    debris.velocity = Vector(0.1, 0.05, 0.1);
    debris.velocityVariation = Vector(0.3, 0.2, 0.3);
    debris.color = Color::fromHex(0xffffff);
    debris.colorVariation = 0.2;
    debris.area = Vector(40.0, 20.0, 40.0);
    addEmitter(debris);

    EmitterConfig lightRays;
    lightRays.type = "lightRays";
    lightRays.position = Position(0.0, 15.0, 0.0);
    lightRays.rate = 0.5;
    lightRays.life = 20.0;
    lightRays.size = {8.0, 15.0};
    lightRays.velocity = Vector(0.0, -0.5, 0.0);
    lightRays.velocityVariation = Vector(0.1, 0.2, 0.1);
    lightRays.color = Color::fromHex(0xffd700);
    lightRays.colorVariation = 0.1;
    lightRays.area = Vector(30.0, 5.0, 30.0);
    addEmitter(lightRays);
}

void ParticleSystem::update(double dt)
{
    PROFILE_SCOPE("ParticleSystem::update");

    {
        PROFILE_SCOPE("ParticleSystem::emit");
        for (auto& emitter : emitters) {
            if (!emitter.active || emitter.config.rate <= 0.0) {
                continue;
            }

            emitter.accumulator += dt;
            double const interval = 1.0 / emitter.config.rate;

            while (emitter.accumulator >= interval) {
                emitParticle(emitter);
                emitter.accumulator -= interval;
            }
        }
    }

    for (auto& particle : particles) {
        particle.update(dt);
    }

    refreshRenderBuffer();
    elapsedTime += dt;
}

bool ParticleSystem::emitParticle(const Emitter& emitter)
{
    Particle* particle = findFreeParticle();
    if (!particle) {
        DebugStats::recordEmission(true);
        return false;
    }

    const EmitterConfig& cfg = emitter.config;

    Position const position = cfg.position + randomSpread(cfg.area);
    Vector const velocity = cfg.velocity + randomSpread(cfg.velocityVariation);
    double const size = randomSize(cfg.size);

    Color color = cfg.color;
    if (cfg.colorVariation > 0.0) {
        double const dh = (unit() - 0.5) * cfg.colorVariation;
        double const dl = (unit() - 0.5) * cfg.colorVariation * 0.5;
        color.offsetHSL(dh, 0.0, dl);
    }

    particle->reset(position, velocity, cfg.life, size, color);
    DebugStats::recordEmission(false);
    return true;
}

std::size_t ParticleSystem::createBurst(const Position& position, const BurstConfig& config)
{
    std::size_t emitted = 0;
    for (; emitted < config.count; ++emitted) {
        Particle* particle = findFreeParticle();
        if (!particle) {
            DEBUG_MSG(DEBUG_LEVEL_VERBOSE, "Burst truncated at " << emitted
                      << " of " << config.count << "\n");
            break;
        }

        Vector const velocity = config.velocity + randomSpread(config.velocityVariation);
        particle->reset(position, velocity, config.life, randomSize(config.size), config.color);
        DebugStats::recordEmission(false);
    }
    return emitted;
}

void ParticleSystem::addEmitter(const EmitterConfig& config)
{
    Emitter emitter;
    emitter.config = config;
    emitter.accumulator = 0.0;
    emitter.active = true;
    emitters.push_back(emitter);
}

bool ParticleSystem::setEmitterActive(const std::string& type, bool active)
{
    Emitter* emitter = findEmitter(type);
    if (!emitter) {
        return false;
    }
    emitter->active = active;
    return true;
}

void ParticleSystem::clear()
{
    for (auto& particle : particles) {
        particle.active = false;
    }
    refreshRenderBuffer();
}

std::size_t ParticleSystem::getActiveCount() const
{
    return static_cast<std::size_t>(std::count_if(particles.begin(), particles.end(),
        [](const Particle& p) { return p.active; }));
}

Emitter* ParticleSystem::findEmitter(const std::string& type)
{
    auto it = std::find_if(emitters.begin(), emitters.end(),
        [&type](const Emitter& e) { return e.config.type == type; });
    return it == emitters.end() ? nullptr : &*it;
}

const Emitter* ParticleSystem::findEmitter(const std::string& type) const
{
    auto it = std::find_if(emitters.begin(), emitters.end(),
        [&type](const Emitter& e) { return e.config.type == type; });
    return it == emitters.end() ? nullptr : &*it;
}

Particle* ParticleSystem::findFreeParticle()
{
    auto it = std::find_if(particles.begin(), particles.end(),
        [](const Particle& p) { return !p.active; });
    return it == particles.end() ? nullptr : &*it;
}

Vector ParticleSystem::randomSpread(const Vector& variation)
{
    double const x = (unit() - 0.5) * variation.x;
    double const y = (unit() - 0.5) * variation.y;
    double const z = (unit() - 0.5) * variation.z;
    return {x, y, z};
}

double ParticleSystem::randomSize(const SizeRange& range)
{
    return range.min + unit() * (range.max - range.min);
}

double ParticleSystem::unit()
{
    return unitDist(rng);
}

void ParticleSystem::refreshRenderBuffer()
{
    std::size_t count = 0;
    for (const auto& particle : particles) {
        if (!particle.active) {
            continue;
        }

        std::size_t const i3 = count * 3;
        renderBuffer.positions[i3] = static_cast<float>(particle.position.x);
        renderBuffer.positions[i3 + 1] = static_cast<float>(particle.position.y);
        renderBuffer.positions[i3 + 2] = static_cast<float>(particle.position.z);

        renderBuffer.colors[i3] = particle.color.r;
        renderBuffer.colors[i3 + 1] = particle.color.g;
        renderBuffer.colors[i3 + 2] = particle.color.b;

        renderBuffer.sizes[count] = static_cast<float>(particle.size);
        renderBuffer.alphas[count] = static_cast<float>(particle.alpha);
        ++count;
    }
    renderBuffer.activeCount = count;
}

} // namespace Particles
