#include "LineSpreader.hpp"
#include <algorithm>
#include <cmath>
#include "LyricTypes.hpp"
#include "util/TimeFormat.hpp"

namespace lg::lyrics {

int LineSpreader::indexAt(f64 time,
                          usize lineCount,
                          std::optional<f64> duration) {
    if (lineCount == 0 || !duration)
        return kNoLine;
    auto total = normalizeDuration(*duration);
    if (!total)
        return kNoLine;
    if (std::isnan(time))
        time = 0.0;

    const f64 perLine = *total / static_cast<f64>(lineCount);
    const f64 last = static_cast<f64>(lineCount - 1);
    return static_cast<int>(std::clamp(std::floor(time / perLine), 0.0, last));
}

} // namespace lg::lyrics
