#include <QtTest>
#include "visualizer/BackdropRenderer.hpp"
#include "visualizer/Theme.hpp"

using namespace lg;

namespace {

bool samePositions(const std::vector<Particle>& a, const std::vector<Particle>& b) {
    if (a.size() != b.size())
        return false;
    for (usize i = 0; i < a.size(); ++i) {
        if (a[i].x != b[i].x || a[i].y != b[i].y || a[i].vx != b[i].vx ||
            a[i].vy != b[i].vy || a[i].r != b[i].r)
            return false;
    }
    return true;
}

const ThemeConfig& theme(const char* name) {
    static const ThemeRegistry registry;
    return registry.resolve(name);
}

} // namespace

class TestBackdropRenderer : public QObject {
    Q_OBJECT

private slots:
    void testSameSettingsKeepParticles() {
        BackdropRenderer backdrop(7);
        backdrop.resize(640, 360);
        QVERIFY(backdrop.configure(theme("Aurora"), 80));
        auto before = backdrop.particles().particles();

        QVERIFY(!backdrop.configure(theme("Aurora"), 80));
        QVERIFY(samePositions(before, backdrop.particles().particles()));
    }

    void testDensityChangeReseeds() {
        BackdropRenderer backdrop(7);
        backdrop.resize(640, 360);
        QVERIFY(backdrop.configure(theme("Aurora"), 80));
        QCOMPARE(backdrop.particles().size(), usize(80));

        QVERIFY(backdrop.configure(theme("Aurora"), 120));
        QCOMPARE(backdrop.particles().size(), usize(120));
        QCOMPARE(backdrop.density(), u32(120));
    }

    void testDensityIsClampedBeforeCompare() {
        BackdropRenderer backdrop(7);
        backdrop.resize(640, 360);
        QVERIFY(backdrop.configure(theme("Aurora"), 1000));
        QCOMPARE(backdrop.particles().size(), usize(400));
        // 900 clamps to the same 400
        QVERIFY(!backdrop.configure(theme("Aurora"), 900));
    }

    void testThemeChangeReseeds() {
        BackdropRenderer backdrop(7);
        backdrop.resize(640, 360);
        QVERIFY(backdrop.configure(theme("Aurora"), 80));
        auto before = backdrop.particles().particles();

        QVERIFY(backdrop.configure(theme("Sunset"), 80));
        QVERIFY(backdrop.theme() == theme("Sunset"));
        QCOMPARE(backdrop.particles().size(), usize(80));
        QVERIFY(!samePositions(before, backdrop.particles().particles()));
    }

    void testResizeKeepsParticles() {
        BackdropRenderer backdrop(7);
        backdrop.resize(640, 360);
        backdrop.configure(theme("Blossom"), 60);
        auto before = backdrop.particles().particles();

        backdrop.resize(1280, 720);
        QVERIFY(samePositions(before, backdrop.particles().particles()));
        QCOMPARE(backdrop.particles().width(), 1280.0f);
        QCOMPARE(backdrop.particles().height(), 720.0f);
        QCOMPARE(backdrop.frame().size(), QSize(1280, 720));
    }

    void testFirstCanvasSeedsConfiguredParticles() {
        BackdropRenderer backdrop(7);
        backdrop.configure(theme("Aurora"), 50);
        backdrop.resize(800, 600);
        QCOMPARE(backdrop.particles().size(), usize(50));
        for (const auto& p : backdrop.particles().particles()) {
            QVERIFY(p.x >= 0.0f && p.x <= 800.0f);
            QVERIFY(p.y >= 0.0f && p.y <= 600.0f);
        }
    }

    void testRenderFrame() {
        BackdropRenderer backdrop(7);
        backdrop.resize(320, 200);
        backdrop.configure(theme("Midnight Neon"), 40);
        backdrop.setBlur(8);

        backdrop.renderFrame(0.5f, 1000.0);
        QVERIFY(!backdrop.frame().isNull());
        QCOMPARE(backdrop.frame().size(), QSize(320, 200));
        QCOMPARE(backdrop.particles().size(), usize(40));
    }

    void testRenderWithoutCanvasIsNoop() {
        BackdropRenderer backdrop(7);
        backdrop.configure(theme("Aurora"), 40);
        backdrop.renderFrame(1.0f, 0.0);
        QVERIFY(backdrop.frame().isNull());
    }
};

QTEST_GUILESS_MAIN(TestBackdropRenderer)
#include "test_BackdropRenderer.moc"
