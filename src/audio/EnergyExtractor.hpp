#pragma once
// EnergyExtractor.hpp - One loudness scalar per frame for the backdrop
// energy = mean(bins) / 255, clamped to [0, 1]. With no source attached the
// baseline keeps the scene moving before playback has ever started.

#include <span>
#include "FrequencySource.hpp"

namespace lg::audio {

inline constexpr f32 kBaselineEnergy = 0.1f;

class EnergyExtractor {
public:
    static f32 fromBins(std::span<const u8> bins);

    void attach(const FrequencySource* source) {
        source_ = source;
    }
    void detach() {
        source_ = nullptr;
    }
    bool isAttached() const {
        return source_ != nullptr;
    }

    f32 energy() const;

private:
    const FrequencySource* source_{nullptr};
};

} // namespace lg::audio
