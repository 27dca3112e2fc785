#include "audio/EnergyExtractor.hpp"
#include <algorithm>
#include <numeric>

namespace lg::audio {

f32 EnergyExtractor::fromBins(std::span<const u8> bins) {
    if (bins.empty())
        return 0.0f;
    u64 sum = std::accumulate(bins.begin(), bins.end(), u64{0});
    f32 energy = static_cast<f32>(sum) /
                 (static_cast<f32>(bins.size()) * 255.0f);
    return std::clamp(energy, 0.0f, 1.0f);
}

f32 EnergyExtractor::energy() const {
    if (!source_)
        return kBaselineEnergy;
    return fromBins(source_->frequencyData());
}

} // namespace lg::audio
