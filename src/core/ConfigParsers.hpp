/**
 * @file ConfigParsers.hpp
 * @brief TOML parsing and serialization logic.
 *
 * This file defines the ConfigParsers class which handles the conversion
 * between TOML data structures and the application's C++ configuration structs.
 *
 * @section Dependencies
 * - toml++
 * - ConfigData
 */

#pragma once
#include <toml++/toml.h>
#include "ConfigData.hpp"

namespace lg {

class ConfigParsers {
public:
    static void parseAudio(const toml::table& tbl, AudioConfig& cfg);
    static void parseStage(const toml::table& tbl, StageConfig& cfg);
    static void parseLyrics(const toml::table& tbl, LyricsConfig& cfg);
    static void parseExport(const toml::table& tbl, ExportConfig& cfg);
    static void parseKeyboard(const toml::table& tbl, KeyboardConfig& cfg);
    static void parseThemes(const toml::table& tbl, ThemeMap& themes);

    static toml::table serialize(const AudioConfig& audio,
                                 const StageConfig& stage,
                                 const LyricsConfig& lyrics,
                                 const ExportConfig& exporting,
                                 const KeyboardConfig& keyboard,
                                 const ThemeMap& themes,
                                 bool debug);
};

} // namespace lg
