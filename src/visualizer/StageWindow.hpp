/**
 * @file StageWindow.hpp
 * @brief Top-level window: animated backdrop plus lyric overlay.
 *
 * Three loops run on the window's FrameClock, each with its own handle:
 * the redraw loop (backdrop), the time-polling loop (playback clock ->
 * lyric frame) and the sampling loop (analysis graph), which only runs
 * while audio is playing. The clock is ticked from the window's
 * UpdateRequest, so frames follow the platform's vsync pacing.
 *
 * @section Dependencies
 * - FrameClock, BackdropRenderer, ThemeRegistry
 * - LyricOverlay
 * - AudioPlayer, AnalysisGraph, EnergyExtractor
 */

#pragma once
#include <QElapsedTimer>
#include <QRasterWindow>
#include <string>
#include "BackdropRenderer.hpp"
#include "FrameClock.hpp"
#include "Theme.hpp"
#include "audio/EnergyExtractor.hpp"
#include "lyrics/LyricTrack.hpp"
#include "overlay/LyricOverlay.hpp"
#include "util/Signal.hpp"

namespace lg {

namespace audio {
class AudioPlayer;
}

class StageWindow : public QRasterWindow {
    Q_OBJECT

public:
    static constexpr int kDensityStep = 10;

    StageWindow(audio::AudioPlayer& player,
                lyrics::LyricTrack& track,
                lyrics::SongInfo song,
                QWindow* parent = nullptr);
    ~StageWindow() override;

    // Starts the redraw and time-polling loops.
    void start();
    // Cancels every loop and detaches from the player. Idempotent.
    void teardown();

    void toggleFullscreen();
    void nextTheme();
    void nextFont();
    void changeDensity(int delta);
    void exportLyrics();

    FrameClock& frameClock() {
        return frameClock_;
    }
    const std::string& themeName() const {
        return themeName_;
    }
    u32 density() const {
        return density_;
    }
    const std::string& fontName() const {
        return fontName_;
    }
    // True while the analysis sampling loop is scheduled
    bool isSampling() const {
        return samplingHandle_ != kNoFrame;
    }

protected:
    bool event(QEvent* event) override;
    void paintEvent(QPaintEvent* event) override;
    void resizeEvent(QResizeEvent* event) override;
    void keyPressEvent(QKeyEvent* event) override;
    void mouseDoubleClickEvent(QMouseEvent* event) override;

private:
    void renderLoop(f64 nowMs);
    void clockLoop(f64 nowMs);
    void samplingLoop(f64 nowMs);
    void onPlayed();
    void applyStage();

    audio::AudioPlayer& player_;
    lyrics::LyricTrack& track_;
    lyrics::SongInfo song_;

    FrameClock frameClock_;
    FrameHandle renderHandle_{kNoFrame};
    FrameHandle clockHandle_{kNoFrame};
    FrameHandle samplingHandle_{kNoFrame};
    QElapsedTimer elapsed_;

    ThemeRegistry themes_;
    std::string themeName_;
    u32 density_{60};
    std::string fontName_;
    BackdropRenderer backdrop_;
    LyricOverlay overlay_;
    audio::EnergyExtractor energy_;

    Signal<>::SlotId playedSlot_{0};
    bool running_{false};
    bool fullscreen_{false};
    QRect normalGeometry_;
};

} // namespace lg
