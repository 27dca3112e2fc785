#pragma once
// TimeFormat.hpp - Elapsed/total clock strings for the status bar

#include <optional>
#include <string>
#include "util/Types.hpp"

namespace lg {

// "MM:SS" with minutes zero-padded to two digits; "--:--" when not finite.
std::string formatClock(f64 seconds);

// "MM:SS / MM:SS"; the total reads "--:--" when the duration is unknown,
// non-finite or not positive.
std::string formatProgress(f64 elapsed, std::optional<f64> duration);

// Maps unknown, NaN, infinite or non-positive durations to nullopt.
std::optional<f64> normalizeDuration(f64 seconds);

} // namespace lg
