#include "audio/SpectrumAnalyzer.hpp"
#include "kiss_fftr.h"
#include "core/Logger.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

namespace lg::audio {

void SpectrumAnalyzer::FftrDeleter::operator()(kiss_fftr_state* cfg) const {
    kiss_fftr_free(cfg);
}

SpectrumAnalyzer::SpectrumAnalyzer(SpectrumSettings settings)
    : settings_(settings) {
    const usize n = settings_.fftSize;

    // kiss_fftr needs an even size
    if (n >= 2 && n % 2 == 0) {
        cfg_.reset(kiss_fftr_alloc(static_cast<int>(n), 0, nullptr, nullptr));
    }
    if (!cfg_) {
        LOG_ERROR("SpectrumAnalyzer: kiss_fftr_alloc failed for size {}", n);
    }

    history_.assign(n, 0.0f);
    frame_.assign(n, 0.0f);
    smoothed_.assign(n / 2, 0.0f);
    bytes_.assign(n / 2, 0);

    // Blackman window, alpha = 0.16
    window_.resize(n);
    constexpr f64 a0 = 0.42, a1 = 0.5, a2 = 0.08;
    for (usize i = 0; i < n; ++i) {
        f64 x = static_cast<f64>(i) / static_cast<f64>(n);
        window_[i] = static_cast<f32>(
                a0 - a1 * std::cos(2.0 * std::numbers::pi * x) +
                a2 * std::cos(4.0 * std::numbers::pi * x));
    }
}

SpectrumAnalyzer::~SpectrumAnalyzer() = default;

void SpectrumAnalyzer::reset() {
    std::fill(history_.begin(), history_.end(), 0.0f);
    std::fill(smoothed_.begin(), smoothed_.end(), 0.0f);
    std::fill(bytes_.begin(), bytes_.end(), u8{0});
    writePos_ = 0;
}

void SpectrumAnalyzer::pushSamples(std::span<const f32> interleaved,
                                   u32 channels) {
    if (channels == 0 || history_.empty())
        return;

    const usize frames = interleaved.size() / channels;
    for (usize i = 0; i < frames; ++i) {
        f32 sum = 0.0f;
        for (u32 c = 0; c < channels; ++c)
            sum += interleaved[i * channels + c];

        history_[writePos_] = sum / static_cast<f32>(channels);
        writePos_ = (writePos_ + 1) % history_.size();
    }
}

void SpectrumAnalyzer::analyze() {
    if (!cfg_)
        return;

    const usize n = settings_.fftSize;
    for (usize i = 0; i < n; ++i) {
        frame_[i] = history_[(writePos_ + i) % n] * window_[i];
    }

    std::vector<kiss_fft_cpx> out(n / 2 + 1);
    kiss_fftr(cfg_.get(), frame_.data(), out.data());

    const f32 tau = settings_.smoothing;
    const f32 range = settings_.maxDecibels - settings_.minDecibels;
    const f32 scale = 1.0f / static_cast<f32>(n);

    for (usize k = 0; k < n / 2; ++k) {
        f32 mag = std::sqrt(out[k].r * out[k].r + out[k].i * out[k].i) * scale;
        smoothed_[k] = tau * smoothed_[k] + (1.0f - tau) * mag;

        if (smoothed_[k] <= 0.0f) {
            bytes_[k] = 0;
            continue;
        }
        f32 db = 20.0f * std::log10(smoothed_[k]);
        f32 scaled = 255.0f * (db - settings_.minDecibels) / range;
        bytes_[k] = static_cast<u8>(std::clamp(scaled, 0.0f, 255.0f));
    }
}

} // namespace lg::audio
