#include "BackdropRenderer.hpp"
#include <QPainter>
#include <QRadialGradient>
#include <algorithm>
#include "core/Logger.hpp"

namespace lg {

namespace {

QColor toQColor(const Color& c) {
    return QColor(c.r, c.g, c.b, c.a);
}

} // namespace

BackdropRenderer::BackdropRenderer(u32 seed) : field_(seed) {
}

bool BackdropRenderer::configure(const ThemeConfig& theme, u32 density) {
    density = ParticleField::clampDensity(density);
    if (configured_ && theme == theme_ && density == density_)
        return false;

    theme_ = theme;
    density_ = density;
    configured_ = true;

    rebuildGradient();
    field_.reseed(density_,
                  static_cast<f32>(canvas_.width()),
                  static_cast<f32>(canvas_.height()));
    return true;
}

void BackdropRenderer::resize(int width, int height) {
    width = std::max(width, 1);
    height = std::max(height, 1);
    if (canvas_.width() == width && canvas_.height() == height)
        return;

    const bool firstCanvas = canvas_.isNull();
    canvas_ = QImage(width, height, QImage::Format_ARGB32_Premultiplied);
    canvas_.fill(Qt::black);
    rebuildGradient();

    // Particles configured before the first canvas were seeded on 0x0
    if (firstCanvas && configured_)
        field_.reseed(density_, static_cast<f32>(width), static_cast<f32>(height));
    else
        field_.resize(static_cast<f32>(width), static_cast<f32>(height));
    LOG_DEBUG("BackdropRenderer: canvas {}x{}", width, height);
}

void BackdropRenderer::rebuildGradient() {
    gradient_ = QLinearGradient(0, 0, canvas_.width(), canvas_.height());
    gradient_.setColorAt(0.0, toQColor(theme_.bgFrom));
    gradient_.setColorAt(1.0, toQColor(theme_.bgTo));
}

void BackdropRenderer::renderFrame(f32 energy, f64 nowMs) {
    if (canvas_.isNull())
        return;

    energy = std::clamp(energy, 0.0f, 1.0f);
    field_.step(energy);

    {
        QPainter painter(&canvas_);
        painter.setRenderHint(QPainter::Antialiasing);
        painter.setPen(Qt::NoPen);

        painter.fillRect(canvas_.rect(), gradient_);
        drawFog(painter, energy, nowMs);
        drawParticles(painter, energy);
    }

    if (blur_ > 0)
        applyBlur();
}

void BackdropRenderer::drawFog(QPainter& painter, f32 energy, f64 nowMs) {
    const QColor inner = toQColor(theme_.accentA.withAlpha(0x10));
    const QColor outer = toQColor(theme_.accentA.withAlpha(0x00));

    for (const auto& blob : FogLayer::layout(fogCount_,
                                             static_cast<f32>(canvas_.width()),
                                             static_cast<f32>(canvas_.height()),
                                             nowMs,
                                             energy)) {
        QRadialGradient g(blob.x, blob.y, blob.radius);
        g.setColorAt(0.0, inner);
        g.setColorAt(1.0, outer);
        painter.setBrush(g);
        painter.drawEllipse(QPointF(blob.x, blob.y), blob.radius, blob.radius);
    }
}

void BackdropRenderer::drawParticles(QPainter& painter, f32 energy) {
    const QColor inner = toQColor(theme_.accentB.withAlpha(0x80));
    const QColor outer = toQColor(theme_.accentB.withAlpha(0x00));

    painter.setCompositionMode(QPainter::CompositionMode_Plus);
    for (const auto& p : field_.particles()) {
        f32 glow = ParticleField::glowRadius(p, energy) * 8.0f;
        QRadialGradient g(p.x, p.y, glow);
        g.setColorAt(0.0, inner);
        g.setColorAt(1.0, outer);
        painter.setBrush(g);
        painter.drawEllipse(QPointF(p.x, p.y), glow, glow);
    }
    painter.setCompositionMode(QPainter::CompositionMode_SourceOver);
}

// Cheap box-ish blur: shrink then scale back up with smooth filtering.
void BackdropRenderer::applyBlur() {
    const f32 factor = 1.0f + static_cast<f32>(blur_) / 4.0f;
    const int w = std::max(1, static_cast<int>(canvas_.width() / factor));
    const int h = std::max(1, static_cast<int>(canvas_.height() / factor));

    canvas_ = canvas_.scaled(w, h, Qt::IgnoreAspectRatio, Qt::SmoothTransformation)
                      .scaled(canvas_.width(),
                              canvas_.height(),
                              Qt::IgnoreAspectRatio,
                              Qt::SmoothTransformation);
}

} // namespace lg
