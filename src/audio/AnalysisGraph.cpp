#include "audio/AnalysisGraph.hpp"
#include "core/Logger.hpp"

namespace lg::audio {

AnalysisGraph& AnalysisGraph::instance() {
    static AnalysisGraph instance;
    return instance;
}

AnalysisGraph::~AnalysisGraph() {
    teardown();
}

Result<void> AnalysisGraph::build(PcmTapHost& host,
                                  const SpectrumSettings& settings) {
    if (analyzer_)
        return Result<void>::ok();

    auto analyzer = std::make_unique<SpectrumAnalyzer>(settings);
    if (!analyzer->isValid()) {
        return Result<void>::err("Spectrum analyzer unavailable for FFT size " +
                                 std::to_string(settings.fftSize));
    }

    {
        std::lock_guard lock(tapMutex_);
        pending_.clear();
        pendingLimit_ = settings.fftSize * 4;
    }
    analyzer_ = std::move(analyzer);

    host.setPcmTap([this](std::span<const f32> samples, u32 channels) {
        push(samples, channels);
    });
    host_ = &host;
    ++buildCount_;

    LOG_INFO("AnalysisGraph: built ({} bins, smoothing {})",
             analyzer_->binCount(),
             settings.smoothing);
    return Result<void>::ok();
}

void AnalysisGraph::teardown() {
    if (host_) {
        host_->clearPcmTap();
        host_ = nullptr;
    }
    {
        std::lock_guard lock(tapMutex_);
        pending_.clear();
    }
    if (analyzer_) {
        analyzer_.reset();
        LOG_DEBUG("AnalysisGraph: torn down");
    }
}

void AnalysisGraph::push(std::span<const f32> samples, u32 channels) {
    if (channels == 0)
        return;

    std::lock_guard lock(tapMutex_);
    if (channels != pendingChannels_) {
        pending_.clear();
        pendingChannels_ = channels;
    }
    pending_.insert(pending_.end(), samples.begin(), samples.end());

    // Keep only the newest frames; the analyzer never looks further back.
    const usize limit = pendingLimit_ * channels;
    if (limit > 0 && pending_.size() > limit) {
        usize excess = pending_.size() - limit;
        excess -= excess % channels;
        pending_.erase(pending_.begin(),
                       pending_.begin() + static_cast<std::ptrdiff_t>(excess));
    }
}

void AnalysisGraph::sample() {
    if (!analyzer_)
        return;

    u32 channels;
    {
        std::lock_guard lock(tapMutex_);
        drained_.swap(pending_);
        channels = pendingChannels_;
    }
    analyzer_->pushSamples(drained_, channels);
    drained_.clear();
    analyzer_->analyze();
}

usize AnalysisGraph::pendingFrames() const {
    std::lock_guard lock(tapMutex_);
    return pendingChannels_ ? pending_.size() / pendingChannels_ : 0;
}

std::span<const u8> AnalysisGraph::frequencyData() const {
    if (!analyzer_)
        return {};
    return analyzer_->byteBins();
}

} // namespace lg::audio
