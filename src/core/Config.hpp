/**
 * @file Config.hpp
 * @brief Process-wide settings read once at startup.
 *
 * Holds every TOML section the stage, audio graph and lyric overlay read.
 * ConfigLoader fills it; command-line overrides are written straight into
 * the mutable section accessors before the stage window is created. Nothing
 * is persisted back after startup.
 */

#pragma once
#include <mutex>
#include <optional>
#include "ConfigData.hpp"
#include "ConfigLoader.hpp"
#include "util/Result.hpp"

namespace lg {

class Config {
public:
    static Config& instance();

    // Walks the lookup order once; see ConfigLoader::resolve
    Result<ConfigSource> resolve(const std::optional<fs::path>& explicitPath);

    // Restores built-in defaults (used by tests between cases)
    void reset();

    ConfigSource source() const {
        return source_;
    }
    // Empty when running on built-in defaults
    const fs::path& path() const {
        return path_;
    }
    bool debug() const {
        return debug_;
    }

    const AudioConfig& audio() const {
        return audio_;
    }
    const StageConfig& stage() const {
        return stage_;
    }
    const LyricsConfig& lyrics() const {
        return lyrics_;
    }
    const ExportConfig& exporting() const {
        return export_;
    }
    const KeyboardConfig& keyboard() const {
        return keyboard_;
    }
    const ThemeMap& themes() const {
        return themes_;
    }

    // Command-line overrides
    StageConfig& stage() {
        return stage_;
    }
    LyricsConfig& lyrics() {
        return lyrics_;
    }

private:
    friend class ConfigLoader;

    Config() = default;

    ConfigSource source_{ConfigSource::BuiltIn};
    fs::path path_;
    bool debug_{false};

    AudioConfig audio_;
    StageConfig stage_;
    LyricsConfig lyrics_;
    ExportConfig export_;
    KeyboardConfig keyboard_;
    ThemeMap themes_;

    std::mutex mutex_;
};

#define CONFIG lg::Config::instance()

} // namespace lg
