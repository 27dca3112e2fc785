#include "Theme.hpp"
#include <algorithm>
#include "core/Logger.hpp"

namespace lg {

const std::vector<std::pair<std::string, ThemeConfig>>& ThemeRegistry::presets() {
    static const std::vector<std::pair<std::string, ThemeConfig>> list = {
            {"Midnight Neon",
             {Color::fromHex("#0f1023"),
              Color::fromHex("#1a1b3a"),
              Color::fromHex("#7f5af0"),
              Color::fromHex("#2cb67d")}},
            {"Aurora",
             {Color::fromHex("#0b1220"),
              Color::fromHex("#102a43"),
              Color::fromHex("#5eead4"),
              Color::fromHex("#93c5fd")}},
            {"Sunset",
             {Color::fromHex("#1b0f1a"),
              Color::fromHex("#2a172b"),
              Color::fromHex("#f59e0b"),
              Color::fromHex("#ef4444")}},
            {"Blossom",
             {Color::fromHex("#1a1020"),
              Color::fromHex("#2a1a2f"),
              Color::fromHex("#fb7185"),
              Color::fromHex("#a78bfa")}},
    };
    return list;
}

ThemeRegistry::ThemeRegistry(const ThemeMap& custom) {
    for (const auto& [name, theme] : presets()) {
        names_.push_back(name);
        themes_[name] = theme;
    }
    for (const auto& [name, theme] : custom) {
        if (!themes_.contains(name))
            names_.push_back(name);
        themes_[name] = theme;
    }
    LOG_DEBUG("ThemeRegistry: {} themes ({} custom)", names_.size(), custom.size());
}

bool ThemeRegistry::contains(const std::string& name) const {
    return themes_.contains(name);
}

const ThemeConfig& ThemeRegistry::resolve(const std::string& name) const {
    if (auto it = themes_.find(name); it != themes_.end())
        return it->second;
    LOG_WARN("ThemeRegistry: unknown theme '{}', using '{}'", name, kDefaultTheme);
    return themes_.at(kDefaultTheme);
}

std::string ThemeRegistry::next(const std::string& current) const {
    auto it = std::find(names_.begin(), names_.end(), current);
    if (it == names_.end() || ++it == names_.end())
        return names_.front();
    return *it;
}

} // namespace lg
