#pragma once
// FogLayer.hpp - Slowly orbiting radial fog blobs sized by energy

#include <vector>
#include "util/Types.hpp"

namespace lg {

struct FogBlob {
    f32 x{0.0f};
    f32 y{0.0f};
    f32 radius{0.0f};
};

class FogLayer {
public:
    static constexpr u32 kDefaultCount = 6;
    static constexpr f32 kOrbit = 80.0f;

    // Blob i of count sits on the canvas diagonal at i / count, offset by
    // sin(i + now / 20000) and cos(i + now / 15000) times kOrbit. All share
    // radius (0.3 + 0.5 * energy) * max(width, height).
    static std::vector<FogBlob> layout(u32 count,
                                       f32 width,
                                       f32 height,
                                       f64 nowMs,
                                       f32 energy);

    static f32 radiusFor(f32 width, f32 height, f32 energy);
};

} // namespace lg
