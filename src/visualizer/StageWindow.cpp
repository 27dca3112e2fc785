#include "StageWindow.hpp"
#include "audio/AnalysisGraph.hpp"
#include "audio/AudioPlayer.hpp"
#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "lyrics/LyricExporter.hpp"
#include "util/TimeFormat.hpp"

#include <QGuiApplication>
#include <QKeyEvent>
#include <QKeySequence>
#include <QMouseEvent>
#include <QPainter>
#include <QScreen>
#include <algorithm>

namespace lg {

StageWindow::StageWindow(audio::AudioPlayer& player,
                         lyrics::LyricTrack& track,
                         lyrics::SongInfo song,
                         QWindow* parent)
    : QRasterWindow(parent),
      player_(player),
      track_(track),
      song_(std::move(song)),
      themes_(CONFIG.themes()) {
    const auto& stage = CONFIG.stage();
    const auto& lyricsCfg = CONFIG.lyrics();

    setTitle(song_.title.empty() ? QStringLiteral("lyricglow")
                                 : QString::fromStdString(song_.title));
    resize(static_cast<int>(stage.width), static_cast<int>(stage.height));

    themeName_ = themes_.contains(stage.theme) ? stage.theme
                                               : ThemeRegistry::kDefaultTheme;
    density_ = ParticleField::clampDensity(stage.density);

    backdrop_.resize(width(), height());
    backdrop_.setFogCount(stage.fogCount);
    backdrop_.setBlur(stage.blur);

    fontName_ = LyricOverlay::fontPreset(lyricsCfg.font).name;
    overlay_.setFont(fontName_, lyricsCfg.size);
    overlay_.setShadow(lyricsCfg.shadow);
    overlay_.setTransitionMs(lyricsCfg.transitionMs);
    overlay_.setSongInfo(song_);
    applyStage();

    frameClock_.frameRequested.connect([this]() { requestUpdate(); });
    playedSlot_ = player_.played.connect([this]() { onPlayed(); });

    elapsed_.start();
}

StageWindow::~StageWindow() {
    teardown();
}

void StageWindow::start() {
    if (running_)
        return;
    running_ = true;

    renderHandle_ = frameClock_.request([this](f64 now) { renderLoop(now); });
    clockHandle_ = frameClock_.request([this](f64 now) { clockLoop(now); });

    // Playback may already be running (autoplay)
    if (player_.isPlaying())
        onPlayed();

    LOG_INFO("StageWindow: started with theme '{}', {} particles",
             themeName_,
             density_);
}

void StageWindow::teardown() {
    if (playedSlot_ != 0) {
        player_.played.disconnect(playedSlot_);
        playedSlot_ = 0;
    }
    frameClock_.cancel(renderHandle_);
    frameClock_.cancel(clockHandle_);
    frameClock_.cancel(samplingHandle_);
    renderHandle_ = clockHandle_ = samplingHandle_ = kNoFrame;
    frameClock_.cancelAll();
    energy_.detach();

    if (running_)
        LOG_DEBUG("StageWindow: loops cancelled");
    running_ = false;
}

void StageWindow::applyStage() {
    const auto& theme = themes_.resolve(themeName_);
    backdrop_.configure(theme, density_);
    overlay_.setAccent(theme.accentA);
}

void StageWindow::renderLoop(f64 nowMs) {
    backdrop_.renderFrame(energy_.energy(), nowMs);
    update();
    renderHandle_ = frameClock_.request([this](f64 now) { renderLoop(now); });
}

void StageWindow::clockLoop(f64 nowMs) {
    const f64 time = player_.currentTime();
    const auto duration = player_.duration();
    track_.setDuration(duration);

    overlay_.update(lyrics::LyricSync::frame(time, track_), nowMs);
    overlay_.setStatus(LyricOverlay::modeText(track_),
                       formatProgress(time, duration));

    clockHandle_ = frameClock_.request([this](f64 now) { clockLoop(now); });
}

void StageWindow::samplingLoop(f64 nowMs) {
    (void)nowMs;
    if (!player_.isPlaying()) {
        samplingHandle_ = kNoFrame;
        LOG_DEBUG("StageWindow: playback inactive, sampling stopped");
        return;
    }
    audio::AnalysisGraph::instance().sample();
    samplingHandle_ = frameClock_.request([this](f64 now) { samplingLoop(now); });
}

void StageWindow::onPlayed() {
    if (!running_)
        return;

    auto& graph = audio::AnalysisGraph::instance();
    const auto& cfg = CONFIG.audio();
    audio::SpectrumSettings settings;
    settings.fftSize = cfg.fftSize;
    settings.smoothing = cfg.smoothing;
    settings.minDecibels = cfg.minDecibels;
    settings.maxDecibels = cfg.maxDecibels;

    if (auto res = graph.build(player_, settings); !res) {
        LOG_WARN("StageWindow: analysis unavailable, staying at baseline: {}",
                 res.error().message);
        return;
    }
    energy_.attach(&graph);

    if (samplingHandle_ == kNoFrame)
        samplingHandle_ =
                frameClock_.request([this](f64 now) { samplingLoop(now); });
}

bool StageWindow::event(QEvent* event) {
    if (event->type() == QEvent::UpdateRequest) {
        frameClock_.tick(static_cast<f64>(elapsed_.nsecsElapsed()) / 1.0e6);
        if (frameClock_.hasPending())
            requestUpdate();
    }
    return QRasterWindow::event(event);
}

void StageWindow::paintEvent(QPaintEvent* event) {
    Q_UNUSED(event);
    QPainter painter(this);
    painter.drawImage(0, 0, backdrop_.frame());
    overlay_.paint(painter,
                   size(),
                   static_cast<f64>(elapsed_.nsecsElapsed()) / 1.0e6);
}

void StageWindow::resizeEvent(QResizeEvent* event) {
    Q_UNUSED(event);
    backdrop_.resize(width(), height());
}

void StageWindow::toggleFullscreen() {
    if (fullscreen_) {
        showNormal();
        setGeometry(normalGeometry_);
        fullscreen_ = false;
    } else {
        normalGeometry_ = geometry();
        auto* screen = QGuiApplication::primaryScreen();
        if (screen)
            setGeometry(screen->geometry());
        showFullScreen();
        fullscreen_ = true;
    }
}

void StageWindow::nextTheme() {
    themeName_ = themes_.next(themeName_);
    applyStage();
    LOG_INFO("StageWindow: theme '{}'", themeName_);
}

void StageWindow::nextFont() {
    fontName_ = LyricOverlay::nextFont(fontName_);
    overlay_.setFont(fontName_, CONFIG.lyrics().size);
    LOG_INFO("StageWindow: font '{}'", fontName_);
}

void StageWindow::changeDensity(int delta) {
    int target = static_cast<int>(density_) + delta;
    density_ = ParticleField::clampDensity(
            static_cast<u32>(std::max(target, 0)));
    applyStage();
    LOG_INFO("StageWindow: density {}", density_);
}

void StageWindow::exportLyrics() {
    auto res = lyrics::LyricExporter::write(
            CONFIG.exporting().directory, song_, track_);
    if (!res)
        LOG_ERROR("StageWindow: export failed: {}", res.error().message);
}

void StageWindow::keyPressEvent(QKeyEvent* event) {
    const auto& keys = CONFIG.keyboard();
    std::string key = QKeySequence(event->key()).toString().toStdString();

    if (key == keys.playPause) {
        player_.togglePlayPause();
    } else if (key == keys.seekForward) {
        player_.seek(player_.currentTime() + keys.seekStep);
    } else if (key == keys.seekBackward) {
        player_.seek(std::max(0.0, player_.currentTime() - keys.seekStep));
    } else if (key == keys.toggleFullscreen || event->key() == Qt::Key_F11) {
        toggleFullscreen();
    } else if (key == keys.nextTheme) {
        nextTheme();
    } else if (key == keys.nextFont) {
        nextFont();
    } else if (key == keys.densityUp) {
        changeDensity(kDensityStep);
    } else if (key == keys.densityDown) {
        changeDensity(-kDensityStep);
    } else if (key == keys.exportText) {
        exportLyrics();
    } else if (key == keys.quit) {
        close();
    } else if (event->key() == Qt::Key_Escape && fullscreen_) {
        toggleFullscreen();
    } else {
        QRasterWindow::keyPressEvent(event);
    }
}

void StageWindow::mouseDoubleClickEvent(QMouseEvent* event) {
    if (event->button() == Qt::LeftButton)
        toggleFullscreen();
    QRasterWindow::mouseDoubleClickEvent(event);
}

} // namespace lg
