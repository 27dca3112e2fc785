#pragma once
// Theme.hpp - Built-in color presets plus themes declared in the config

#include <string>
#include <vector>
#include "core/ConfigData.hpp"

namespace lg {

class ThemeRegistry {
public:
    static constexpr const char* kDefaultTheme = "Midnight Neon";

    // Presets, then custom themes. A custom theme with a preset's name
    // replaces the preset colors.
    explicit ThemeRegistry(const ThemeMap& custom = {});

    static const std::vector<std::pair<std::string, ThemeConfig>>& presets();

    bool contains(const std::string& name) const;

    // Unknown names fall back to the default theme.
    const ThemeConfig& resolve(const std::string& name) const;

    // Name following `current` in names(), wrapping at the end.
    std::string next(const std::string& current) const;

    const std::vector<std::string>& names() const {
        return names_;
    }

private:
    std::vector<std::string> names_;
    ThemeMap themes_;
};

} // namespace lg
