#include "Config.hpp"
#include "Logger.hpp"

namespace lg {

Config& Config::instance() {
    static Config instance;
    return instance;
}

Result<ConfigSource> Config::resolve(const std::optional<fs::path>& explicitPath) {
    std::lock_guard lock(mutex_);
    auto res = ConfigLoader::resolve(*this, explicitPath);
    if (res)
        LOG_DEBUG("Settings from {}", toString(res.value()));
    return res;
}

void Config::reset() {
    std::lock_guard lock(mutex_);
    source_ = ConfigSource::BuiltIn;
    path_.clear();
    debug_ = false;
    audio_ = {};
    stage_ = {};
    lyrics_ = {};
    export_ = {};
    keyboard_ = {};
    themes_.clear();
}

} // namespace lg
