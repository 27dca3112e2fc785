#include "LyricOverlay.hpp"
#include <QFontMetricsF>
#include <QLinearGradient>
#include <QPainter>
#include <QPainterPath>
#include <QSize>
#include <algorithm>
#include "core/Logger.hpp"

namespace lg {

namespace {

constexpr const char* kLinePlaceholder = "Your lyrics will appear here.";
constexpr const char* kArtistPlaceholder = "Artist";
constexpr const char* kTitlePlaceholder = "Title";
constexpr const char* kBadge = "Live Visual";

constexpr qreal kMargin = 24.0;

QString qstr(const std::string& s) {
    return QString::fromStdString(s);
}

QColor whiteAt(int alpha) {
    return QColor(255, 255, 255, alpha);
}

} // namespace

f64 LineTransition::progress(f64 nowMs) const {
    if (!active_ || durationMs_ <= 0.0)
        return 1.0;
    f64 t = std::clamp((nowMs - startMs_) / durationMs_, 0.0, 1.0);
    return easeOut(t);
}

f64 LineTransition::easeOut(f64 t) {
    f64 inv = 1.0 - t;
    return 1.0 - inv * inv * inv;
}

const std::vector<FontPreset>& LyricOverlay::fontPresets() {
    static const std::vector<FontPreset> presets = {
            {"Inter", "Inter", QFont::SansSerif},
            {"Serif", "serif", QFont::Serif},
            {"Mono", "monospace", QFont::Monospace},
            {"Cinematic", "Georgia", QFont::Serif},
            {"Grotesk", "Space Grotesk", QFont::SansSerif},
    };
    return presets;
}

const FontPreset& LyricOverlay::fontPreset(const std::string& name) {
    const auto& presets = fontPresets();
    auto it = std::find_if(presets.begin(), presets.end(), [&](const FontPreset& p) {
        return p.name == name;
    });
    return it != presets.end() ? *it : presets.front();
}

std::string LyricOverlay::nextFont(const std::string& current) {
    const auto& presets = fontPresets();
    auto it = std::find_if(presets.begin(), presets.end(), [&](const FontPreset& p) {
        return p.name == current;
    });
    if (it == presets.end() || ++it == presets.end())
        return presets.front().name;
    return it->name;
}

std::string LyricOverlay::modeText(const lyrics::LyricTrack& track) {
    if (track.empty())
        return "No lyrics yet";
    return track.isSynced() ? "Synced via .lrc" : "Auto-timed (even spread)";
}

void LyricOverlay::setFont(const std::string& name, u32 pixelSize) {
    const auto& preset = fontPreset(name);
    lyricFont_ = QFont(preset.family);
    lyricFont_.setStyleHint(preset.hint);
    lyricFont_.setPixelSize(static_cast<int>(pixelSize));
    lyricFont_.setWeight(QFont::DemiBold);
    LOG_DEBUG("LyricOverlay: font '{}' ({}px)", preset.name, pixelSize);
}

void LyricOverlay::update(const lyrics::LyricFrame& frame, f64 nowMs) {
    if (hasFrame_ && frame.index == frame_.index) {
        frame_ = frame;
        return;
    }
    outgoing_ = hasFrame_ ? frame_.current : std::string{};
    frame_ = frame;
    if (hasFrame_)
        transition_.start(nowMs, transitionMs_);
    hasFrame_ = true;
}

void LyricOverlay::paint(QPainter& painter, const QSize& size, f64 nowMs) const {
    painter.save();
    painter.setRenderHint(QPainter::Antialiasing);
    painter.setRenderHint(QPainter::TextAntialiasing);

    paintHeader(painter, size);
    paintLines(painter, size, nowMs);
    paintStatusBar(painter, size);

    painter.restore();
}

void LyricOverlay::paintHeader(QPainter& painter, const QSize& size) const {
    QFont small = painter.font();
    small.setPixelSize(13);
    small.setCapitalization(QFont::AllUppercase);
    small.setLetterSpacing(QFont::AbsoluteSpacing, 2.0);

    QFont large = painter.font();
    large.setPixelSize(28);
    large.setWeight(QFont::DemiBold);

    const QString artist = song_.artist.empty() ? kArtistPlaceholder : qstr(song_.artist);
    const QString title = song_.title.empty() ? kTitlePlaceholder : qstr(song_.title);
    const qreal textWidth = size.width() * 0.7;

    painter.setFont(small);
    painter.setPen(whiteAt(184));
    QFontMetricsF smallMetrics(small);
    painter.drawText(QPointF(kMargin, kMargin + smallMetrics.ascent()),
                     smallMetrics.elidedText(artist, Qt::ElideRight, textWidth));

    painter.setFont(large);
    painter.setPen(whiteAt(230));
    QFontMetricsF largeMetrics(large);
    qreal titleY = kMargin + smallMetrics.height() + 4.0 + largeMetrics.ascent();
    painter.drawText(QPointF(kMargin, titleY),
                     largeMetrics.elidedText(title, Qt::ElideRight, textWidth));

    // Badge, top right
    QFont badgeFont = painter.font();
    badgeFont.setPixelSize(12);
    badgeFont.setCapitalization(QFont::MixedCase);
    badgeFont.setLetterSpacing(QFont::PercentageSpacing, 100.0);
    QFontMetricsF badgeMetrics(badgeFont);
    QRectF badge(0, 0, badgeMetrics.horizontalAdvance(kBadge) + 24.0, badgeMetrics.height() + 8.0);
    badge.moveTopRight(QPointF(size.width() - kMargin, kMargin));

    painter.setPen(Qt::NoPen);
    painter.setBrush(whiteAt(26));
    painter.drawRoundedRect(badge, badge.height() / 2, badge.height() / 2);
    painter.setFont(badgeFont);
    painter.setPen(whiteAt(178));
    painter.drawText(badge, Qt::AlignCenter, kBadge);
}

void LyricOverlay::drawLine(QPainter& painter,
                            const QRectF& box,
                            const QString& text,
                            f64 opacity) const {
    if (opacity <= 0.0)
        return;

    const int flags = Qt::AlignHCenter | Qt::AlignVCenter | Qt::TextWordWrap;
    painter.setFont(lyricFont_);

    if (shadow_) {
        // Accent glow, then a dark drop shadow
        QColor glow(accent_.r, accent_.g, accent_.b, 0x55);
        glow.setAlphaF(glow.alphaF() * opacity * 0.5);
        painter.setPen(glow);
        for (int dx = -2; dx <= 2; dx += 2) {
            for (int dy = 6; dy <= 14; dy += 4)
                painter.drawText(box.translated(dx, dy), flags, text);
        }
        painter.setPen(QColor(0, 0, 0, static_cast<int>(153 * opacity)));
        painter.drawText(box.translated(0, 5), flags, text);
    }

    painter.setPen(whiteAt(static_cast<int>(255 * opacity)));
    painter.drawText(box, flags, text);
}

void LyricOverlay::paintLines(QPainter& painter, const QSize& size, f64 nowMs) const {
    const qreal maxWidth = std::min<qreal>(size.width() - 2 * kMargin, 896.0);
    QFontMetricsF metrics(lyricFont_);
    const qreal lineHeight = metrics.height() * 2.5;

    QRectF box(0, 0, maxWidth, lineHeight);
    box.moveCenter(QPointF(size.width() / 2.0, size.height() / 2.0));

    const f64 p = transition_.progress(nowMs);
    const QString current = frame_.current.empty() ? kLinePlaceholder : qstr(frame_.current);

    if (p < 1.0) {
        const QString outgoing = outgoing_.empty() ? kLinePlaceholder : qstr(outgoing_);
        drawLine(painter, box.translated(0, -kSlideDistance * p), outgoing, 1.0 - p);
    }
    drawLine(painter, box.translated(0, kSlideDistance * (1.0 - p)), current, p);

    // Ghost lines
    QFont ghost = painter.font();
    ghost.setPixelSize(18);
    ghost.setCapitalization(QFont::MixedCase);
    ghost.setLetterSpacing(QFont::PercentageSpacing, 100.0);
    QFontMetricsF ghostMetrics(ghost);

    painter.setFont(ghost);
    painter.setPen(whiteAt(153));
    qreal y = box.bottom() + 24.0;
    for (const auto& text : {frame_.previous, frame_.next}) {
        QRectF row(box.left(), y, box.width(), ghostMetrics.height());
        painter.drawText(row,
                         Qt::AlignHCenter | Qt::AlignVCenter,
                         ghostMetrics.elidedText(qstr(text), Qt::ElideRight, row.width()));
        y += ghostMetrics.height();
    }
}

void LyricOverlay::paintStatusBar(QPainter& painter, const QSize& size) const {
    const qreal barHeight = 64.0;
    QRectF bar(0, size.height() - barHeight, size.width(), barHeight);

    QLinearGradient shade(bar.bottomLeft(), bar.topLeft());
    shade.setColorAt(0.0, QColor(0, 0, 0, 128));
    shade.setColorAt(1.0, QColor(0, 0, 0, 0));
    painter.fillRect(bar, shade);

    QFont font = painter.font();
    font.setPixelSize(12);
    font.setCapitalization(QFont::MixedCase);
    font.setLetterSpacing(QFont::PercentageSpacing, 100.0);
    painter.setFont(font);
    painter.setPen(whiteAt(204));

    QRectF inner = bar.adjusted(kMargin, 0, -kMargin, 0);
    painter.drawText(inner, Qt::AlignLeft | Qt::AlignVCenter, qstr(mode_));
    painter.drawText(inner, Qt::AlignRight | Qt::AlignVCenter, qstr(progress_));
}

} // namespace lg
