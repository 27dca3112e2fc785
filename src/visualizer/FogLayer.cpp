#include "FogLayer.hpp"
#include <algorithm>
#include <cmath>

namespace lg {

f32 FogLayer::radiusFor(f32 width, f32 height, f32 energy) {
    return std::max(width, height) * (0.3f + 0.5f * energy);
}

std::vector<FogBlob> FogLayer::layout(u32 count,
                                      f32 width,
                                      f32 height,
                                      f64 nowMs,
                                      f32 energy) {
    std::vector<FogBlob> blobs;
    blobs.reserve(count);
    const f32 radius = radiusFor(width, height, energy);
    for (u32 i = 0; i < count; ++i) {
        f64 t = static_cast<f64>(i) / count;
        FogBlob b;
        b.x = static_cast<f32>(t * width + std::sin(i + nowMs / 20000.0) * kOrbit);
        b.y = static_cast<f32>(t * height + std::cos(i + nowMs / 15000.0) * kOrbit);
        b.radius = radius;
        blobs.push_back(b);
    }
    return blobs;
}

} // namespace lg
