#include <QtTest>
#include <cmath>
#include "visualizer/FogLayer.hpp"

using namespace lg;

class TestFogLayer : public QObject {
    Q_OBJECT

private slots:
    void testCount() {
        QCOMPARE(FogLayer::layout(6, 1280, 720, 0.0, 0.1f).size(), usize(6));
        QVERIFY(FogLayer::layout(0, 1280, 720, 0.0, 0.1f).empty());
    }

    void testRadiusFollowsEnergy() {
        QCOMPARE(FogLayer::radiusFor(1200, 600, 0.0f), 360.0f);
        QCOMPARE(FogLayer::radiusFor(1200, 600, 1.0f), 960.0f);
        QCOMPARE(FogLayer::radiusFor(400, 900, 0.0f), 270.0f);

        auto blobs = FogLayer::layout(6, 1200, 600, 0.0, 1.0f);
        for (const auto& b : blobs)
            QCOMPARE(b.radius, 960.0f);
    }

    void testPositions() {
        auto blobs = FogLayer::layout(6, 1200, 600, 0.0, 0.0f);
        QCOMPARE(blobs[0].x, 0.0f);
        QCOMPARE(blobs[0].y, 80.0f);

        QCOMPARE(blobs[3].x, static_cast<f32>(600.0 + std::sin(3.0) * 80.0));
        QCOMPARE(blobs[3].y, static_cast<f32>(300.0 + std::cos(3.0) * 80.0));
    }

    void testDriftOverTime() {
        const f64 now = 31400.0;
        auto blobs = FogLayer::layout(4, 800, 400, now, 0.0f);
        QCOMPARE(blobs[1].x,
                 static_cast<f32>(200.0 + std::sin(1.0 + now / 20000.0) * 80.0));
        QCOMPARE(blobs[1].y,
                 static_cast<f32>(100.0 + std::cos(1.0 + now / 15000.0) * 80.0));
    }
};

QTEST_GUILESS_MAIN(TestFogLayer)
#include "test_FogLayer.moc"
