/**
 * @file ConfigData.hpp
 * @brief One struct per config.toml section.
 *
 * Defaults here are the built-in settings used when no config file exists
 * and for keys a file leaves out. Range limits are applied by ConfigParsers,
 * not by these structs. Key bindings are QKeySequence strings ("Space", "]").
 */

#pragma once
#include <filesystem>
#include <map>
#include <string>
#include "util/Types.hpp"

namespace lg {

namespace fs = std::filesystem;

// Background and accent colors for the stage
struct ThemeConfig {
    Color bgFrom;
    Color bgTo;
    Color accentA;
    Color accentB;

    bool operator==(const ThemeConfig&) const = default;
};

// Playback and analysis settings
struct AudioConfig {
    u32 sampleRate{44100};
    u32 bufferSize{2048};
    f32 volume{1.0f};
    u32 fftSize{512};
    f32 smoothing{0.8f};
    f32 minDecibels{-100.0f};
    f32 maxDecibels{-30.0f};
    bool autoplay{false};
};

// Animated backdrop
struct StageConfig {
    std::string theme{"Midnight Neon"};
    u32 density{60};
    u32 fogCount{6};
    u32 blur{24};
    u32 width{1280};
    u32 height{720};
    bool fullscreen{false};
};

// Lyric typography
struct LyricsConfig {
    std::string font{"Inter"};
    u32 size{72};
    bool shadow{true};
    u32 transitionMs{450};
};

struct ExportConfig {
    fs::path directory{"."};
};

// Keyboard shortcuts
struct KeyboardConfig {
    std::string playPause{"Space"};
    std::string seekForward{"Right"};
    std::string seekBackward{"Left"};
    f32 seekStep{5.0f};
    std::string toggleFullscreen{"F"};
    std::string nextTheme{"T"};
    std::string nextFont{"N"};
    std::string densityUp{"]"};
    std::string densityDown{"["};
    std::string exportText{"E"};
    std::string quit{"Q"};
};

using ThemeMap = std::map<std::string, ThemeConfig>;

} // namespace lg
