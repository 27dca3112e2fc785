#pragma once
// FileUtils.hpp - XDG directories and whole-file text I/O

#include <filesystem>
#include <string>
#include <string_view>
#include "util/Result.hpp"

namespace lg::file {

namespace fs = std::filesystem;

// $XDG_CONFIG_HOME/lyricglow (falls back to ~/.config/lyricglow)
fs::path configDir();
// $XDG_CACHE_HOME/lyricglow (falls back to ~/.cache/lyricglow)
fs::path cacheDir();

bool ensureDir(const fs::path& dir);

// Expands a leading "~/" against $HOME.
fs::path expandHome(std::string_view path);

Result<std::string> readText(const fs::path& path);
Result<void> writeText(const fs::path& path, std::string_view content);

} // namespace lg::file
