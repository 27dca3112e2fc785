#pragma once

#include <functional>
#include <span>
#include "util/Types.hpp"

namespace lg::audio {

// Receives interleaved float PCM. May be invoked on the audio thread.
using PcmTap = std::function<void(std::span<const f32> samples, u32 channels)>;

// Playback backends that can mirror their mixed output to a tap
class PcmTapHost {
public:
    virtual ~PcmTapHost() = default;
    virtual void setPcmTap(PcmTap tap) = 0;
    virtual void clearPcmTap() = 0;
};

} // namespace lg::audio
