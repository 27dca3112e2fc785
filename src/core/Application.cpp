#include "Application.hpp"
#include "Config.hpp"
#include "Logger.hpp"
#include "audio/AnalysisGraph.hpp"
#include "lyrics/LrcParser.hpp"
#include "lyrics/LyricExporter.hpp"
#include "util/FileUtils.hpp"
#include "visualizer/ParticleField.hpp"
#include "visualizer/StageWindow.hpp"

#include <QCommandLineParser>
#include <QGuiApplication>

#ifndef LYRICGLOW_VERSION
#define LYRICGLOW_VERSION "0.0.0"
#endif

namespace lg {

namespace {

std::filesystem::path toPath(const QString& s) {
    return file::expandHome(s.toStdString());
}

void configureParser(QCommandLineParser& parser) {
    parser.setApplicationDescription("Audio-reactive lyric visualizer");
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addPositionalArgument("audio", "Audio file to play", "[audio]");
    parser.addOptions({
            {{"a", "audio"}, "Audio file", "file"},
            {{"l", "lyrics"}, "Lyric text or .lrc file", "file"},
            {{"t", "title"}, "Song title", "text"},
            {{"r", "artist"}, "Artist name", "text"},
            {"theme", "Theme preset or custom theme name", "name"},
            {"density", "Particle count (10-400)", "n"},
            {"font", "Lyric font preset", "name"},
            {{"c", "config"}, "Config file path", "file"},
            {{"e", "export"}, "Write the plain-text export and exit", "file"},
            {"fullscreen", "Start fullscreen"},
            {{"d", "debug"}, "Enable debug logging"},
    });
}

std::optional<std::string> stringValue(const QCommandLineParser& parser,
                                       const QString& name) {
    if (!parser.isSet(name))
        return std::nullopt;
    return parser.value(name).toStdString();
}

std::optional<std::filesystem::path> pathValue(const QCommandLineParser& parser,
                                               const QString& name) {
    if (!parser.isSet(name))
        return std::nullopt;
    return toPath(parser.value(name));
}

Result<AppOptions> readOptions(const QCommandLineParser& parser) {
    const QStringList positional = parser.positionalArguments();
    if (positional.size() > 1)
        return Result<AppOptions>::err("Only one audio file may be given");

    AppOptions opts;
    opts.audioFile = pathValue(parser, "audio");
    if (!opts.audioFile && !positional.isEmpty())
        opts.audioFile = toPath(positional.first());

    opts.lyricsFile = pathValue(parser, "lyrics");
    opts.configFile = pathValue(parser, "config");
    opts.exportFile = pathValue(parser, "export");
    opts.title = stringValue(parser, "title");
    opts.artist = stringValue(parser, "artist");
    opts.theme = stringValue(parser, "theme");
    opts.font = stringValue(parser, "font");

    if (parser.isSet("density")) {
        bool ok = false;
        uint density = parser.value("density").toUInt(&ok);
        if (!ok)
            return Result<AppOptions>::err("Invalid --density value: " +
                                           parser.value("density").toStdString());
        opts.density = ParticleField::clampDensity(density);
    }

    opts.fullscreen = parser.isSet("fullscreen");
    opts.debug = parser.isSet("debug");
    return Result<AppOptions>::ok(std::move(opts));
}

} // namespace

Application::Application(int& argc, char** argv)
    : app_(std::make_unique<QGuiApplication>(argc, argv)) {
    QGuiApplication::setApplicationName("lyricglow");
    QGuiApplication::setApplicationVersion(LYRICGLOW_VERSION);
}

Application::~Application() {
    teardown();
}

Result<AppOptions> Application::parseArgs() {
    QCommandLineParser parser;
    configureParser(parser);
    if (!parser.parse(app_->arguments()))
        return Result<AppOptions>::err(parser.errorText().toStdString());

    // Both print and exit
    if (parser.isSet("help"))
        parser.showHelp(0);
    if (parser.isSet("version"))
        parser.showVersion();

    return readOptions(parser);
}

Result<AppOptions> Application::parseArgs(const QStringList& args) {
    QCommandLineParser parser;
    configureParser(parser);
    if (!parser.parse(args))
        return Result<AppOptions>::err(parser.errorText().toStdString());
    return readOptions(parser);
}

lyrics::SongInfo Application::resolveSongInfo(const AppOptions& opts,
                                              const lyrics::LrcMetadata& meta) {
    lyrics::SongInfo song;
    song.title = opts.title.value_or(meta.title.value_or(""));
    song.artist = opts.artist.value_or(meta.artist.value_or(""));
    return song;
}

Result<void> Application::init(const AppOptions& opts) {
    Logger::init("lyricglow", opts.debug);

    if (auto res = loadConfig(opts); !res)
        return res;

    if (CONFIG.debug() && !opts.debug)
        Logger::setDebug(true);

    applyOverrides(opts);
    loadLyrics(opts);

    if (opts.exportFile)
        return exportAndExit(*opts.exportFile);

    initAudio(opts);

    window_ = std::make_unique<StageWindow>(player_, track_, song_);
    QObject::connect(app_.get(), &QGuiApplication::aboutToQuit, [this]() {
        teardown();
    });

    window_->show();
    if (CONFIG.stage().fullscreen)
        window_->toggleFullscreen();
    window_->start();

    if (CONFIG.audio().autoplay && player_.hasMedia())
        player_.play();

    return Result<void>::ok();
}

Result<void> Application::loadConfig(const AppOptions& opts) {
    auto res = CONFIG.resolve(opts.configFile);
    if (!res)
        return Result<void>::err(res.error().message);
    LOG_INFO("Using {}", toString(res.value()));
    return Result<void>::ok();
}

void Application::applyOverrides(const AppOptions& opts) {
    auto& stage = CONFIG.stage();
    if (opts.theme)
        stage.theme = *opts.theme;
    if (opts.density)
        stage.density = *opts.density;
    if (opts.fullscreen)
        stage.fullscreen = true;
    if (opts.font)
        CONFIG.lyrics().font = *opts.font;
}

void Application::loadLyrics(const AppOptions& opts) {
    lyrics::LrcMetadata meta;
    if (opts.lyricsFile) {
        auto text = file::readText(*opts.lyricsFile);
        if (text) {
            track_ = lyrics::LyricTrack::fromText(*text);
            meta = lyrics::LrcParser::parseMetadata(*text);
            LOG_INFO("Lyrics: {} lines ({})",
                     track_.size(),
                     track_.isSynced() ? "synced" : "unsynced");
        } else {
            LOG_ERROR("Lyrics unavailable: {}", text.error().message);
        }
    }
    song_ = resolveSongInfo(opts, meta);
}

Result<void> Application::exportAndExit(const std::filesystem::path& target) {
    exportOnly_ = true;
    auto res = file::writeText(target, lyrics::LyricExporter::toText(song_, track_));
    if (!res)
        return res;
    LOG_INFO("Exported lyrics to {}", target.string());
    return Result<void>::ok();
}

void Application::initAudio(const AppOptions& opts) {
    const auto& cfg = CONFIG.audio();
    if (auto res = player_.init(cfg.sampleRate, cfg.bufferSize); !res) {
        LOG_ERROR("Audio disabled: {}", res.error().message);
        return;
    }
    player_.setVolume(cfg.volume);

    if (!opts.audioFile) {
        LOG_INFO("No audio file given; backdrop runs at baseline energy");
        return;
    }
    if (auto res = player_.load(*opts.audioFile); !res) {
        LOG_ERROR("{}", res.error().message);
        return;
    }
    track_.setDuration(player_.duration());
}

int Application::exec() {
    if (exportOnly_) {
        teardown();
        return 0;
    }
    int rc = app_->exec();
    teardown();
    return rc;
}

void Application::teardown() {
    if (tornDown_)
        return;
    tornDown_ = true;

    if (window_)
        window_->teardown();
    // Detach the tap before the player closes the device
    audio::AnalysisGraph::instance().teardown();
    player_.shutdown();

    LOG_INFO("Shutting down");
    Logger::shutdown();
}

} // namespace lg
