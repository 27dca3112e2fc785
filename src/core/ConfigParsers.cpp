#include "ConfigParsers.hpp"
#include <algorithm>
#include <bit>
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace lg {

namespace {
template <typename T>
T get(const toml::table& tbl, std::string_view key, T defaultVal) {
    if (auto node = tbl[key]) {
        if constexpr (std::is_same_v<T, std::string>) {
            if (auto val = node.value<std::string>())
                return *val;
        } else if constexpr (std::is_same_v<T, bool>) {
            if (auto val = node.value<bool>())
                return *val;
        } else if constexpr (std::is_same_v<T, f32>) {
            if (auto val = node.value<double>())
                return static_cast<f32>(*val);
        } else if constexpr (std::is_integral_v<T>) {
            if (auto val = node.value<i64>())
                return static_cast<T>(std::max<i64>(*val, 0));
        }
    }
    return defaultVal;
}

Color getColor(const toml::table& tbl, std::string_view key, Color defaultVal) {
    auto hex = get(tbl, key, std::string());
    return hex.empty() ? defaultVal : Color::fromHex(hex);
}
} // namespace

void ConfigParsers::parseAudio(const toml::table& tbl, AudioConfig& cfg) {
    if (auto audio = tbl["audio"].as_table()) {
        cfg.sampleRate =
                std::clamp(get(*audio, "sample_rate", 44100u), 8000u, 192000u);
        cfg.bufferSize =
                std::clamp(get(*audio, "buffer_size", 2048u), 256u, 16384u);
        cfg.volume = std::clamp(get(*audio, "volume", 1.0f), 0.0f, 1.0f);
        cfg.fftSize = std::bit_floor(
                std::clamp(get(*audio, "fft_size", 512u), 32u, 32768u));
        cfg.smoothing = std::clamp(get(*audio, "smoothing", 0.8f), 0.0f, 1.0f);
        cfg.minDecibels = get(*audio, "min_decibels", -100.0f);
        cfg.maxDecibels = get(*audio, "max_decibels", -30.0f);
        if (cfg.maxDecibels <= cfg.minDecibels) {
            LOG_WARN("Config: max_decibels must exceed min_decibels, "
                     "using -100/-30");
            cfg.minDecibels = -100.0f;
            cfg.maxDecibels = -30.0f;
        }
        cfg.autoplay = get(*audio, "autoplay", false);
    }
}

void ConfigParsers::parseStage(const toml::table& tbl, StageConfig& cfg) {
    if (auto stage = tbl["stage"].as_table()) {
        cfg.theme = get(*stage, "theme", std::string("Midnight Neon"));
        cfg.density = std::clamp(get(*stage, "density", 60u), 10u, 400u);
        cfg.fogCount = std::clamp(get(*stage, "fog_count", 6u), 0u, 32u);
        cfg.blur = std::clamp(get(*stage, "blur", 24u), 0u, 40u);
        cfg.width = std::clamp(get(*stage, "width", 1280u), 320u, 7680u);
        cfg.height = std::clamp(get(*stage, "height", 720u), 200u, 4320u);
        cfg.fullscreen = get(*stage, "fullscreen", false);
    }
}

void ConfigParsers::parseLyrics(const toml::table& tbl, LyricsConfig& cfg) {
    if (auto lyrics = tbl["lyrics"].as_table()) {
        cfg.font = get(*lyrics, "font", std::string("Inter"));
        cfg.size = std::clamp(get(*lyrics, "size", 72u), 28u, 120u);
        cfg.shadow = get(*lyrics, "shadow", true);
        cfg.transitionMs =
                std::clamp(get(*lyrics, "transition_ms", 450u), 0u, 5000u);
    }
}

void ConfigParsers::parseExport(const toml::table& tbl, ExportConfig& cfg) {
    if (auto exp = tbl["export"].as_table()) {
        cfg.directory = file::expandHome(get(*exp, "directory", std::string(".")));
    }
}

void ConfigParsers::parseKeyboard(const toml::table& tbl, KeyboardConfig& cfg) {
    if (auto kb = tbl["keyboard"].as_table()) {
        cfg.playPause = get(*kb, "play_pause", std::string("Space"));
        cfg.seekForward = get(*kb, "seek_forward", std::string("Right"));
        cfg.seekBackward = get(*kb, "seek_backward", std::string("Left"));
        cfg.seekStep = std::clamp(get(*kb, "seek_step", 5.0f), 0.5f, 120.0f);
        cfg.toggleFullscreen =
                get(*kb, "toggle_fullscreen", std::string("F"));
        cfg.nextTheme = get(*kb, "next_theme", std::string("T"));
        cfg.nextFont = get(*kb, "next_font", std::string("N"));
        cfg.densityUp = get(*kb, "density_up", std::string("]"));
        cfg.densityDown = get(*kb, "density_down", std::string("["));
        cfg.exportText = get(*kb, "export_text", std::string("E"));
        cfg.quit = get(*kb, "quit", std::string("Q"));
    }
}

void ConfigParsers::parseThemes(const toml::table& tbl, ThemeMap& themes) {
    themes.clear();
    auto themesTbl = tbl["themes"].as_table();
    if (!themesTbl)
        return;

    for (const auto& [key, node] : *themesTbl) {
        auto themeTbl = node.as_table();
        if (!themeTbl) {
            LOG_WARN("Config: theme '{}' is not a table, skipped", key.str());
            continue;
        }
        ThemeConfig theme;
        theme.bgFrom = getColor(*themeTbl, "bg_from", Color::black());
        theme.bgTo = getColor(*themeTbl, "bg_to", theme.bgFrom);
        theme.accentA = getColor(*themeTbl, "accent_a", Color::white());
        theme.accentB = getColor(*themeTbl, "accent_b", theme.accentA);
        themes[std::string(key.str())] = theme;
    }
}

toml::table ConfigParsers::serialize(const AudioConfig& audio,
                                     const StageConfig& stage,
                                     const LyricsConfig& lyrics,
                                     const ExportConfig& exporting,
                                     const KeyboardConfig& keyboard,
                                     const ThemeMap& themes,
                                     bool debug) {
    toml::table root;
    root.insert("general", toml::table{{"debug", debug}});
    root.insert("audio",
                toml::table{{"sample_rate", (i64)audio.sampleRate},
                            {"buffer_size", (i64)audio.bufferSize},
                            {"volume", (double)audio.volume},
                            {"fft_size", (i64)audio.fftSize},
                            {"smoothing", (double)audio.smoothing},
                            {"min_decibels", (double)audio.minDecibels},
                            {"max_decibels", (double)audio.maxDecibels},
                            {"autoplay", audio.autoplay}});

    root.insert("stage",
                toml::table{{"theme", stage.theme},
                            {"density", (i64)stage.density},
                            {"fog_count", (i64)stage.fogCount},
                            {"blur", (i64)stage.blur},
                            {"width", (i64)stage.width},
                            {"height", (i64)stage.height},
                            {"fullscreen", stage.fullscreen}});

    root.insert("lyrics",
                toml::table{{"font", lyrics.font},
                            {"size", (i64)lyrics.size},
                            {"shadow", lyrics.shadow},
                            {"transition_ms", (i64)lyrics.transitionMs}});

    root.insert("export",
                toml::table{{"directory", exporting.directory.string()}});

    root.insert("keyboard",
                toml::table{{"play_pause", keyboard.playPause},
                            {"seek_forward", keyboard.seekForward},
                            {"seek_backward", keyboard.seekBackward},
                            {"seek_step", (double)keyboard.seekStep},
                            {"toggle_fullscreen", keyboard.toggleFullscreen},
                            {"next_theme", keyboard.nextTheme},
                            {"next_font", keyboard.nextFont},
                            {"density_up", keyboard.densityUp},
                            {"density_down", keyboard.densityDown},
                            {"export_text", keyboard.exportText},
                            {"quit", keyboard.quit}});

    toml::table themesTbl;
    for (const auto& [name, theme] : themes) {
        themesTbl.insert(name,
                         toml::table{{"bg_from", theme.bgFrom.toHex()},
                                     {"bg_to", theme.bgTo.toHex()},
                                     {"accent_a", theme.accentA.toHex()},
                                     {"accent_b", theme.accentB.toHex()}});
    }
    root.insert("themes", themesTbl);

    return root;
}

} // namespace lg
