#pragma once
// SpectrumAnalyzer.hpp - Byte-scaled frequency bins from raw PCM
// Windowed real FFT (KissFFT), temporal smoothing, then decibels mapped
// onto 0..255 per bin. fftSize samples in, fftSize / 2 bins out.

#include <memory>
#include <span>
#include <vector>
#include "util/Types.hpp"

// Forward declaration for the KissFFT real-transform state
struct kiss_fftr_state;

namespace lg::audio {

struct SpectrumSettings {
    usize fftSize{512};
    f32 smoothing{0.8f};
    f32 minDecibels{-100.0f};
    f32 maxDecibels{-30.0f};
};

class SpectrumAnalyzer {
public:
    explicit SpectrumAnalyzer(SpectrumSettings settings = {});
    ~SpectrumAnalyzer();

    SpectrumAnalyzer(const SpectrumAnalyzer&) = delete;
    SpectrumAnalyzer& operator=(const SpectrumAnalyzer&) = delete;

    // False when KissFFT could not allocate a plan for fftSize.
    bool isValid() const {
        return static_cast<bool>(cfg_);
    }

    // Interleaved samples; channels are averaged to mono.
    void pushSamples(std::span<const f32> interleaved, u32 channels);

    // Recomputes byteBins() from the newest fftSize samples.
    void analyze();

    std::span<const u8> byteBins() const {
        return bytes_;
    }
    usize binCount() const {
        return settings_.fftSize / 2;
    }
    const SpectrumSettings& settings() const {
        return settings_;
    }

    void reset();

private:
    struct FftrDeleter {
        void operator()(kiss_fftr_state* cfg) const;
    };

    SpectrumSettings settings_;
    std::unique_ptr<kiss_fftr_state, FftrDeleter> cfg_;

    // Ring of the newest fftSize mono samples
    std::vector<f32> history_;
    usize writePos_{0};

    std::vector<f32> window_;
    std::vector<f32> frame_;
    std::vector<f32> smoothed_;
    std::vector<u8> bytes_;
};

} // namespace lg::audio
