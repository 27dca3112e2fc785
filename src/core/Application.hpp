/**
 * @file Application.hpp
 * @brief Startup, wiring and shutdown.
 *
 * Parses the command line, loads the configuration, reads the lyric file,
 * opens audio output and shows the stage. Audio failures are logged and
 * the stage still runs at baseline energy.
 *
 * @section Dependencies
 * - Config, Logger
 * - AudioPlayer, AnalysisGraph
 * - LyricTrack, LrcParser, LyricExporter
 * - StageWindow
 */

#pragma once
#include <QStringList>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include "audio/AudioPlayer.hpp"
#include "lyrics/LyricTrack.hpp"
#include "util/Result.hpp"

class QGuiApplication;

namespace lg {

class StageWindow;

struct AppOptions {
    std::optional<std::filesystem::path> audioFile;
    std::optional<std::filesystem::path> lyricsFile;
    std::optional<std::filesystem::path> configFile;
    std::optional<std::filesystem::path> exportFile;
    std::optional<std::string> title;
    std::optional<std::string> artist;
    std::optional<std::string> theme;
    std::optional<std::string> font;
    std::optional<u32> density;
    bool fullscreen{false};
    bool debug{false};
};

class Application {
public:
    Application(int& argc, char** argv);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Handles --help and --version itself (prints and exits).
    Result<AppOptions> parseArgs();
    static Result<AppOptions> parseArgs(const QStringList& args);

    // Command line wins over LRC ID tags; missing values stay empty.
    static lyrics::SongInfo resolveSongInfo(const AppOptions& opts,
                                            const lyrics::LrcMetadata& meta);

    Result<void> init(const AppOptions& opts);
    int exec();

private:
    Result<void> loadConfig(const AppOptions& opts);
    void applyOverrides(const AppOptions& opts);
    void loadLyrics(const AppOptions& opts);
    Result<void> exportAndExit(const std::filesystem::path& target);
    void initAudio(const AppOptions& opts);
    void teardown();

    std::unique_ptr<QGuiApplication> app_;
    audio::AudioPlayer player_;
    lyrics::LyricTrack track_;
    lyrics::SongInfo song_;
    std::unique_ptr<StageWindow> window_;

    bool exportOnly_{false};
    bool tornDown_{false};
};

} // namespace lg
