#include "TimeFormat.hpp"
#include <algorithm>
#include <cmath>
#include <spdlog/fmt/fmt.h>

namespace lg {

std::string formatClock(f64 seconds) {
    if (!std::isfinite(seconds))
        return "--:--";
    seconds = std::max(0.0, seconds);
    auto minutes = static_cast<i64>(std::floor(seconds / 60.0));
    auto secs = static_cast<i64>(std::floor(std::fmod(seconds, 60.0)));
    return fmt::format("{:02}:{:02}", minutes, secs);
}

std::string formatProgress(f64 elapsed, std::optional<f64> duration) {
    auto total = normalizeDuration(duration.value_or(0.0));
    return formatClock(elapsed) + " / " +
           (total ? formatClock(*total) : std::string("--:--"));
}

std::optional<f64> normalizeDuration(f64 seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0)
        return std::nullopt;
    return seconds;
}

} // namespace lg
