#include "ParticleField.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace lg {

ParticleField::ParticleField(u32 seed) : rng_(seed) {
}

u32 ParticleField::clampDensity(u32 density) {
    return std::clamp(density, kMinParticles, kMaxParticles);
}

void ParticleField::reseed(u32 density, f32 width, f32 height) {
    width_ = width;
    height_ = height;

    const u32 count = clampDensity(density);
    particles_.clear();
    particles_.reserve(count);
    for (u32 i = 0; i < count; ++i) {
        Particle p;
        p.x = unit_(rng_) * width;
        p.y = unit_(rng_) * height;
        p.vx = (unit_(rng_) - 0.5f) * 0.3f;
        p.vy = (unit_(rng_) - 0.5f) * 0.3f;
        p.r = unit_(rng_) * 2.0f + 0.5f;
        particles_.push_back(p);
    }
    LOG_DEBUG("ParticleField: reseeded {} particles on {}x{}",
              count,
              width,
              height);
}

void ParticleField::resize(f32 width, f32 height) {
    width_ = width;
    height_ = height;
}

void ParticleField::step(f32 energy) {
    const f32 jitter = 0.2f * energy;
    for (auto& p : particles_) {
        p.x += p.vx + (unit_(rng_) - 0.5f) * jitter;
        p.y += p.vy + (unit_(rng_) - 0.5f) * jitter;
        wrap(p, width_, height_);
    }
}

void ParticleField::wrap(Particle& p, f32 width, f32 height) {
    if (p.x < 0.0f)
        p.x = width;
    if (p.x > width)
        p.x = 0.0f;
    if (p.y < 0.0f)
        p.y = height;
    if (p.y > height)
        p.y = 0.0f;
}

} // namespace lg
