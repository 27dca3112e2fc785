/**
 * @file BackdropRenderer.hpp
 * @brief Paints the animated stage background into an offscreen image.
 *
 * Per frame: linear gradient (bgFrom top-left -> bgTo bottom-right),
 * fog blobs in accentA, then additive particle glows in accentB, then an
 * optional soft blur. Particle state lives in the owned ParticleField and
 * is only regenerated when density or theme colors change.
 *
 * @section Dependencies
 * - ParticleField
 * - FogLayer
 * - Qt Gui (QImage, QPainter)
 */

#pragma once
#include <QImage>
#include <QLinearGradient>
#include <random>
#include "FogLayer.hpp"
#include "ParticleField.hpp"
#include "core/ConfigData.hpp"

namespace lg {

class BackdropRenderer {
public:
    explicit BackdropRenderer(u32 seed = std::random_device{}());

    // Reseeds the particles when density or theme colors differ from the
    // current ones. Returns true if a reseed happened.
    bool configure(const ThemeConfig& theme, u32 density);
    void setFogCount(u32 count) {
        fogCount_ = count;
    }
    void setBlur(u32 radius) {
        blur_ = radius;
    }

    // Reallocates the canvas and rebuilds the gradient; particles persist.
    void resize(int width, int height);

    void renderFrame(f32 energy, f64 nowMs);

    const QImage& frame() const {
        return canvas_;
    }
    const ThemeConfig& theme() const {
        return theme_;
    }
    u32 density() const {
        return density_;
    }
    const ParticleField& particles() const {
        return field_;
    }

private:
    void rebuildGradient();
    void drawFog(QPainter& painter, f32 energy, f64 nowMs);
    void drawParticles(QPainter& painter, f32 energy);
    void applyBlur();

    QImage canvas_;
    QLinearGradient gradient_;
    ThemeConfig theme_;
    u32 density_{0};
    u32 fogCount_{FogLayer::kDefaultCount};
    u32 blur_{0};
    bool configured_{false};
    ParticleField field_;
};

} // namespace lg
