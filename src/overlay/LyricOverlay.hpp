/**
 * @file LyricOverlay.hpp
 * @brief Text layer painted over the backdrop.
 *
 * Shows artist and title, the active lyric line with a slide/fade
 * transition whenever the line index changes, the neighbor lines as
 * ghosts, and a bottom bar with the sync mode and playback progress.
 *
 * @section Dependencies
 * - LyricSync (LyricFrame)
 * - Qt Gui (QPainter, QFont)
 */

#pragma once
#include <QFont>
#include <QString>
#include <string>
#include <utility>
#include <vector>
#include "lyrics/LyricSync.hpp"
#include "util/Types.hpp"

class QPainter;
class QRectF;
class QSize;

namespace lg {

struct FontPreset {
    std::string name;
    QString family;
    QFont::StyleHint hint;
};

// Progress of the line change animation, eased out over `durationMs`.
class LineTransition {
public:
    void start(f64 nowMs, f64 durationMs) {
        startMs_ = nowMs;
        durationMs_ = durationMs;
        active_ = true;
    }

    // 0 at start, 1 when finished (and always 1 when idle)
    f64 progress(f64 nowMs) const;
    bool isRunning(f64 nowMs) const {
        return active_ && progress(nowMs) < 1.0;
    }

    static f64 easeOut(f64 t);

private:
    f64 startMs_{0.0};
    f64 durationMs_{0.0};
    bool active_{false};
};

class LyricOverlay {
public:
    static constexpr f32 kSlideDistance = 20.0f;

    static const std::vector<FontPreset>& fontPresets();
    // Unknown names resolve to the first preset.
    static const FontPreset& fontPreset(const std::string& name);
    static std::string nextFont(const std::string& current);

    static std::string modeText(const lyrics::LyricTrack& track);

    void setFont(const std::string& name, u32 pixelSize);
    void setShadow(bool enabled) {
        shadow_ = enabled;
    }
    void setAccent(const Color& accent) {
        accent_ = accent;
    }
    void setTransitionMs(u32 ms) {
        transitionMs_ = ms;
    }
    void setSongInfo(const lyrics::SongInfo& song) {
        song_ = song;
    }
    void setStatus(std::string mode, std::string progress) {
        mode_ = std::move(mode);
        progress_ = std::move(progress);
    }

    // Starts a transition when the index differs from the last frame.
    void update(const lyrics::LyricFrame& frame, f64 nowMs);

    void paint(QPainter& painter, const QSize& size, f64 nowMs) const;

    const lyrics::LyricFrame& frame() const {
        return frame_;
    }
    const std::string& outgoingText() const {
        return outgoing_;
    }
    const LineTransition& transition() const {
        return transition_;
    }

private:
    void paintHeader(QPainter& painter, const QSize& size) const;
    void paintLines(QPainter& painter, const QSize& size, f64 nowMs) const;
    void paintStatusBar(QPainter& painter, const QSize& size) const;
    void drawLine(QPainter& painter,
                  const QRectF& box,
                  const QString& text,
                  f64 opacity) const;

    QFont lyricFont_;
    bool shadow_{true};
    Color accent_{Color::white()};
    u32 transitionMs_{450};

    lyrics::SongInfo song_;
    lyrics::LyricFrame frame_;
    std::string outgoing_;
    bool hasFrame_{false};
    LineTransition transition_;

    std::string mode_;
    std::string progress_;
};

} // namespace lg
