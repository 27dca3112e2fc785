#pragma once
// LineSpreader.hpp - Even time division for lyrics without timestamps

#include <optional>
#include "util/Types.hpp"

namespace lg::lyrics {

class LineSpreader {
public:
    // clamp(floor(time / (duration / lineCount)), 0, lineCount - 1).
    // Returns kNoLine when there are no lines or the duration is unknown,
    // non-finite or not positive.
    static int indexAt(f64 time, usize lineCount, std::optional<f64> duration);
};

} // namespace lg::lyrics
