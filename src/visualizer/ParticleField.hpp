/**
 * @file ParticleField.hpp
 * @brief Drifting glow particles on a toroidal canvas.
 *
 * Particle state survives ordinary frames and canvas resizes; only
 * reseed() regenerates it. Each step adds the particle velocity plus a
 * random jitter scaled by energy, then wraps at the canvas edges.
 */

#pragma once
#include <random>
#include <vector>
#include "util/Types.hpp"

namespace lg {

struct Particle {
    f32 x{0.0f};
    f32 y{0.0f};
    f32 vx{0.0f};
    f32 vy{0.0f};
    f32 r{1.0f}; // base radius
};

class ParticleField {
public:
    static constexpr u32 kMinParticles = 10;
    static constexpr u32 kMaxParticles = 400;

    explicit ParticleField(u32 seed = std::random_device{}());

    static u32 clampDensity(u32 density);

    // Full regeneration: clamp(density) particles spread over the canvas.
    void reseed(u32 density, f32 width, f32 height);

    // Later wrapping uses the new bounds; positions are left alone.
    void resize(f32 width, f32 height);

    void step(f32 energy);

    // x < 0 -> width, x > width -> 0 (same for y / height)
    static void wrap(Particle& p, f32 width, f32 height);

    // Glow radius before the 8x falloff: r * (1 + 2 * energy)
    static f32 glowRadius(const Particle& p, f32 energy) {
        return p.r * (1.0f + 2.0f * energy);
    }

    const std::vector<Particle>& particles() const {
        return particles_;
    }
    std::vector<Particle>& particles() {
        return particles_;
    }
    usize size() const {
        return particles_.size();
    }
    f32 width() const {
        return width_;
    }
    f32 height() const {
        return height_;
    }

private:
    std::vector<Particle> particles_;
    f32 width_{0.0f};
    f32 height_{0.0f};
    std::mt19937 rng_;
    std::uniform_real_distribution<f32> unit_{0.0f, 1.0f};
};

} // namespace lg
