/**
 * @file AnalysisGraph.hpp
 * @brief Process-wide audio analysis chain: player tap -> spectrum bins.
 *
 * Built once, lazily, on the first play event. Later build() calls are
 * no-ops that report success. teardown() detaches from the player and
 * releases the analyzer; a later build() may start over.
 *
 * The player's audio thread only appends to pending_ under tapMutex_.
 * sample() runs on the GUI thread inside the sampling loop and moves the
 * pending PCM into the analyzer.
 *
 * @section Dependencies
 * - SpectrumAnalyzer (KissFFT)
 * - PcmTapHost
 */

#pragma once
#include <memory>
#include <mutex>
#include <vector>
#include "FrequencySource.hpp"
#include "PcmTap.hpp"
#include "SpectrumAnalyzer.hpp"
#include "util/Result.hpp"

namespace lg::audio {

class AnalysisGraph : public FrequencySource {
public:
    static AnalysisGraph& instance();

    AnalysisGraph() = default;
    ~AnalysisGraph() override;

    AnalysisGraph(const AnalysisGraph&) = delete;
    AnalysisGraph& operator=(const AnalysisGraph&) = delete;

    Result<void> build(PcmTapHost& host, const SpectrumSettings& settings);
    void teardown();

    bool isBuilt() const {
        return analyzer_ != nullptr;
    }
    u32 buildCount() const {
        return buildCount_;
    }

    // Drains tapped PCM and refreshes the bins. No-op until built.
    void sample();

    std::span<const u8> frequencyData() const override;

    // Entry point for the tap; safe from any thread.
    void push(std::span<const f32> samples, u32 channels);

    // Frames waiting for the next sample(), at most fftSize * 4
    usize pendingFrames() const;

private:
    std::unique_ptr<SpectrumAnalyzer> analyzer_;
    PcmTapHost* host_{nullptr};
    u32 buildCount_{0};

    mutable std::mutex tapMutex_;
    std::vector<f32> pending_;
    std::vector<f32> drained_;
    u32 pendingChannels_{2};
    usize pendingLimit_{0};
};

} // namespace lg::audio
