#include "FileUtils.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace lg::file {

namespace {

constexpr const char* kAppDir = "lyricglow";

fs::path homeDir() {
    if (const char* home = std::getenv("HOME"))
        return fs::path(home);
    return fs::temp_directory_path();
}

fs::path xdgDir(const char* envName, const char* fallback) {
    if (const char* dir = std::getenv(envName); dir && *dir)
        return fs::path(dir) / kAppDir;
    return homeDir() / fallback / kAppDir;
}

} // namespace

fs::path configDir() {
    return xdgDir("XDG_CONFIG_HOME", ".config");
}

fs::path cacheDir() {
    return xdgDir("XDG_CACHE_HOME", ".cache");
}

bool ensureDir(const fs::path& dir) {
    std::error_code ec;
    if (fs::is_directory(dir, ec))
        return true;
    return fs::create_directories(dir, ec) && !ec;
}

fs::path expandHome(std::string_view path) {
    std::string p(path);
    if (p.starts_with("~/"))
        p = homeDir().string() + p.substr(1);
    return fs::path(p);
}

Result<std::string> readText(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Result<std::string>::err("Cannot open file: " + path.string());

    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad())
        return Result<std::string>::err("Failed to read file: " +
                                        path.string());
    return Result<std::string>::ok(ss.str());
}

Result<void> writeText(const fs::path& path, std::string_view content) {
    if (path.has_parent_path() && !ensureDir(path.parent_path()))
        return Result<void>::err("Cannot create directory: " +
                                 path.parent_path().string());

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        return Result<void>::err("Cannot open file for writing: " +
                                 path.string());
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out)
        return Result<void>::err("Failed to write file: " + path.string());
    return Result<void>::ok();
}

} // namespace lg::file
