#include <QtTest>
#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>
#include "audio/AnalysisGraph.hpp"

using namespace lg;
using namespace lg::audio;

namespace {

class FakeTapHost : public PcmTapHost {
public:
    void setPcmTap(PcmTap tap) override {
        tap_ = std::move(tap);
        ++setCount;
    }
    void clearPcmTap() override {
        tap_ = nullptr;
        ++clearCount;
    }

    bool hasTap() const {
        return static_cast<bool>(tap_);
    }
    void feed(const std::vector<f32>& samples, u32 channels) {
        if (tap_)
            tap_(samples, channels);
    }

    int setCount{0};
    int clearCount{0};

private:
    PcmTap tap_;
};

std::vector<f32> stereoSine(usize frames) {
    std::vector<f32> out;
    out.reserve(frames * 2);
    for (usize i = 0; i < frames; ++i) {
        f32 v = static_cast<f32>(std::sin(2.0 * std::numbers::pi * 32.0 *
                                          static_cast<f64>(i) / 512.0));
        out.push_back(v);
        out.push_back(v);
    }
    return out;
}

} // namespace

class TestAnalysisGraph : public QObject {
    Q_OBJECT

private slots:
    void testBuildOnce() {
        FakeTapHost host;
        AnalysisGraph graph;

        QVERIFY(!graph.isBuilt());
        QVERIFY(graph.build(host, {}).isOk());
        QVERIFY(graph.isBuilt());
        QVERIFY(host.hasTap());
        QCOMPARE(graph.buildCount(), 1u);

        // Later play events are no-ops
        QVERIFY(graph.build(host, {}).isOk());
        QVERIFY(graph.build(host, {}).isOk());
        QCOMPARE(graph.buildCount(), 1u);
        QCOMPARE(host.setCount, 1);
    }

    void testFrequencyData() {
        FakeTapHost host;
        AnalysisGraph graph;
        QVERIFY(graph.frequencyData().empty());

        QVERIFY(graph.build(host, {}).isOk());
        QCOMPARE(graph.frequencyData().size(), usize(256));
    }

    void testTapFeedsAnalyzer() {
        FakeTapHost host;
        AnalysisGraph graph;
        SpectrumSettings settings;
        settings.smoothing = 0.0f;
        // Main lobe stays below the 255 ceiling
        settings.maxDecibels = 0.0f;
        QVERIFY(graph.build(host, settings).isOk());

        host.feed(stereoSine(512), 2);
        QCOMPARE(graph.pendingFrames(), usize(512));

        graph.sample();
        QCOMPARE(graph.pendingFrames(), usize(0));

        auto bins = graph.frequencyData();
        auto peak = std::max_element(bins.begin(), bins.end());
        QCOMPARE(static_cast<usize>(std::distance(bins.begin(), peak)), usize(32));
    }

    void testPendingIsBounded() {
        FakeTapHost host;
        AnalysisGraph graph;
        QVERIFY(graph.build(host, {}).isOk());

        for (int i = 0; i < 10; ++i)
            host.feed(stereoSine(1000), 2);
        QCOMPARE(graph.pendingFrames(), usize(512 * 4));
    }

    void testTeardown() {
        FakeTapHost host;
        AnalysisGraph graph;
        QVERIFY(graph.build(host, {}).isOk());

        graph.teardown();
        QVERIFY(!graph.isBuilt());
        QVERIFY(!host.hasTap());
        QCOMPARE(host.clearCount, 1);
        QVERIFY(graph.frequencyData().empty());

        // Sampling after teardown does nothing
        graph.sample();
        QVERIFY(graph.frequencyData().empty());

        // Idempotent
        graph.teardown();
        QCOMPARE(host.clearCount, 1);
    }

    void testBuildFailure() {
        FakeTapHost host;
        AnalysisGraph graph;
        SpectrumSettings settings;
        settings.fftSize = 3;

        auto res = graph.build(host, settings);
        QVERIFY(res.isErr());
        QVERIFY(!graph.isBuilt());
        QVERIFY(!host.hasTap());
        QCOMPARE(graph.buildCount(), 0u);
    }
};

QTEST_GUILESS_MAIN(TestAnalysisGraph)
#include "test_AnalysisGraph.moc"
