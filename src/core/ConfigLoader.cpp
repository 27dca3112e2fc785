#include "ConfigLoader.hpp"
#include <fstream>
#include "Config.hpp"
#include "ConfigParsers.hpp"
#include "Logger.hpp"
#include "util/FileUtils.hpp"

namespace lg {

const char* toString(ConfigSource source) {
    switch (source) {
    case ConfigSource::Explicit:
        return "command line";
    case ConfigSource::User:
        return "user config";
    case ConfigSource::System:
        return "system default";
    case ConfigSource::BuiltIn:
        break;
    }
    return "built-in defaults";
}

fs::path ConfigLoader::userConfigPath() {
    return file::configDir() / "config.toml";
}

fs::path ConfigLoader::systemDefaultPath() {
    return "/usr/share/lyricglow/config/default.toml";
}

std::vector<ConfigCandidate> ConfigLoader::candidates(
        const std::optional<fs::path>& explicitPath) {
    if (explicitPath)
        return {{*explicitPath, ConfigSource::Explicit}};
    return {{userConfigPath(), ConfigSource::User},
            {systemDefaultPath(), ConfigSource::System}};
}

Result<ConfigSource> ConfigLoader::resolve(
        Config& config, const std::optional<fs::path>& explicitPath) {
    for (const auto& candidate : candidates(explicitPath)) {
        if (!fs::exists(candidate.path)) {
            if (candidate.source == ConfigSource::Explicit)
                return Result<ConfigSource>::err("Config file not found: " +
                                                 candidate.path.string());
            LOG_DEBUG("No {} at {}",
                      toString(candidate.source),
                      candidate.path.string());
            continue;
        }

        fs::path target = candidate.path;
        if (candidate.source == ConfigSource::System) {
            if (auto res = seedFromSystem(candidate.path, userConfigPath()))
                target = userConfigPath();
            else
                LOG_WARN("{}", res.error().message);
        }

        if (auto res = read(config, target); !res) {
            if (candidate.source == ConfigSource::Explicit)
                return Result<ConfigSource>::err(res.error().message);
            LOG_WARN("Ignoring {}: {}",
                     toString(candidate.source),
                     res.error().message);
            continue;
        }
        config.source_ = candidate.source;
        config.path_ = target;
        return Result<ConfigSource>::ok(candidate.source);
    }

    LOG_WARN("No config file found, using built-in defaults");
    config.source_ = ConfigSource::BuiltIn;
    config.path_.clear();
    auto userPath = userConfigPath();
    if (!fs::exists(userPath) && file::ensureDir(userPath.parent_path())) {
        if (auto res = write(config, userPath); !res)
            LOG_WARN("{}", res.error().message);
    }
    return Result<ConfigSource>::ok(ConfigSource::BuiltIn);
}

Result<void> ConfigLoader::read(Config& config, const fs::path& path) {
    try {
        auto tbl = toml::parse_file(path.string());

        if (auto general = tbl["general"].as_table())
            config.debug_ = (*general)["debug"].value_or(false);

        ConfigParsers::parseAudio(tbl, config.audio_);
        ConfigParsers::parseStage(tbl, config.stage_);
        ConfigParsers::parseLyrics(tbl, config.lyrics_);
        ConfigParsers::parseExport(tbl, config.export_);
        ConfigParsers::parseKeyboard(tbl, config.keyboard_);
        ConfigParsers::parseThemes(tbl, config.themes_);

        LOG_INFO("Config loaded from: {}", path.string());
        return Result<void>::ok();
    } catch (const toml::parse_error& err) {
        return Result<void>::err(fmt::format("Config parse error in {} ({}:{}): {}",
                                             path.string(),
                                             err.source().begin.line,
                                             err.source().begin.column,
                                             err.description()));
    }
}

Result<void> ConfigLoader::write(const Config& config, const fs::path& path) {
    auto tbl = ConfigParsers::serialize(config.audio_,
                                        config.stage_,
                                        config.lyrics_,
                                        config.export_,
                                        config.keyboard_,
                                        config.themes_,
                                        config.debug_);
    fs::path tempPath = path;
    tempPath += ".tmp";
    {
        std::ofstream out(tempPath);
        if (!out)
            return Result<void>::err("Cannot write " + tempPath.string());
        out << tbl << '\n';
    }
    std::error_code ec;
    fs::rename(tempPath, path, ec);
    if (ec)
        return Result<void>::err("Cannot move config into place: " +
                                 ec.message());
    LOG_INFO("Wrote default config to: {}", path.string());
    return Result<void>::ok();
}

Result<void> ConfigLoader::seedFromSystem(const fs::path& from,
                                          const fs::path& to) {
    if (!file::ensureDir(to.parent_path()))
        return Result<void>::err("Cannot create " + to.parent_path().string());
    std::error_code ec;
    fs::copy_file(from, to, ec);
    if (ec)
        return Result<void>::err("Could not copy " + from.string() + ": " +
                                 ec.message());
    LOG_INFO("Copied {} to {}", from.string(), to.string());
    return Result<void>::ok();
}

} // namespace lg
