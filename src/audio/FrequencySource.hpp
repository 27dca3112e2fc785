#pragma once

#include <span>
#include "util/Types.hpp"

namespace lg::audio {

// Anything that can hand out the latest byte-range frequency bins
class FrequencySource {
public:
    virtual ~FrequencySource() = default;
    virtual std::span<const u8> frequencyData() const = 0;
};

} // namespace lg::audio
