#pragma once

#include <optional>
#include "util/Types.hpp"

namespace lg::audio {

// Read-only view of the playback position. Time is monotonic while
// playing and may jump either way on seek.
class PlaybackClock {
public:
    virtual ~PlaybackClock() = default;
    virtual f64 currentTime() const = 0;
    virtual std::optional<f64> duration() const = 0;
    virtual bool isPlaying() const = 0;
};

} // namespace lg::audio
