// ConfigLoader.hpp - Locates and reads config.toml
#pragma once
#include <filesystem>
#include <optional>
#include <vector>
#include "util/Result.hpp"

namespace lg {

class Config;

// Where the active settings came from
enum class ConfigSource { BuiltIn, Explicit, User, System };

const char* toString(ConfigSource source);

struct ConfigCandidate {
    std::filesystem::path path;
    ConfigSource source;
};

class ConfigLoader {
public:
    static std::filesystem::path userConfigPath();
    static std::filesystem::path systemDefaultPath();

    // Lookup order: --config, user config, system default
    static std::vector<ConfigCandidate> candidates(
            const std::optional<std::filesystem::path>& explicitPath);

    // Reads the first existing candidate. A missing or broken --config file
    // is an error; anything else degrades to built-in defaults. A system
    // default is copied into the user dir before it is read.
    static Result<ConfigSource> resolve(
            Config& config,
            const std::optional<std::filesystem::path>& explicitPath);

    static Result<void> read(Config& config, const std::filesystem::path& path);

    // First-run seeding of the user dir; never called on a found file
    static Result<void> write(const Config& config,
                              const std::filesystem::path& path);

private:
    static Result<void> seedFromSystem(const std::filesystem::path& from,
                                       const std::filesystem::path& to);
};

} // namespace lg
