#include <QtTest>
#include "visualizer/ParticleField.hpp"

using namespace lg;

class TestParticleField : public QObject {
    Q_OBJECT

private slots:
    void testDensityClamp() {
        ParticleField field(1);
        field.reseed(5, 800, 600);
        QCOMPARE(field.size(), usize(10));
        field.reseed(1000, 800, 600);
        QCOMPARE(field.size(), usize(400));
        field.reseed(60, 800, 600);
        QCOMPARE(field.size(), usize(60));
    }

    void testInitialRanges() {
        ParticleField field(42);
        field.reseed(400, 800, 600);
        for (const auto& p : field.particles()) {
            QVERIFY(p.x >= 0.0f && p.x <= 800.0f);
            QVERIFY(p.y >= 0.0f && p.y <= 600.0f);
            QVERIFY(p.vx >= -0.15f && p.vx <= 0.15f);
            QVERIFY(p.vy >= -0.15f && p.vy <= 0.15f);
            QVERIFY(p.r >= 0.5f && p.r <= 2.5f);
        }
    }

    void testSeedIsDeterministic() {
        ParticleField a(7);
        ParticleField b(7);
        a.reseed(50, 640, 480);
        b.reseed(50, 640, 480);
        QCOMPARE(a.particles()[10].x, b.particles()[10].x);
        QCOMPARE(a.particles()[10].r, b.particles()[10].r);
    }

    void testWrap() {
        Particle p{-1.0f, 10.0f, 0, 0, 1};
        ParticleField::wrap(p, 100.0f, 50.0f);
        QCOMPARE(p.x, 100.0f);

        p = {101.0f, 10.0f, 0, 0, 1};
        ParticleField::wrap(p, 100.0f, 50.0f);
        QCOMPARE(p.x, 0.0f);

        p = {10.0f, -0.5f, 0, 0, 1};
        ParticleField::wrap(p, 100.0f, 50.0f);
        QCOMPARE(p.y, 50.0f);

        p = {10.0f, 51.0f, 0, 0, 1};
        ParticleField::wrap(p, 100.0f, 50.0f);
        QCOMPARE(p.y, 0.0f);

        // Inside the canvas nothing moves
        p = {100.0f, 50.0f, 0, 0, 1};
        ParticleField::wrap(p, 100.0f, 50.0f);
        QCOMPARE(p.x, 100.0f);
        QCOMPARE(p.y, 50.0f);
    }

    void testStepWithoutEnergyFollowsVelocity() {
        ParticleField field(3);
        field.reseed(10, 100, 100);
        field.particles()[0] = {50.0f, 50.0f, 0.1f, -0.1f, 1.0f};

        field.step(0.0f);
        QCOMPARE(field.particles()[0].x, 50.1f);
        QCOMPARE(field.particles()[0].y, 49.9f);
    }

    void testStepWrapsSameFrame() {
        ParticleField field(3);
        field.reseed(10, 100, 100);
        field.particles()[0] = {0.05f, 50.0f, -0.1f, 0.0f, 1.0f};

        field.step(0.0f);
        QCOMPARE(field.particles()[0].x, 100.0f);
    }

    void testJitterBoundedByEnergy() {
        ParticleField field(9);
        field.reseed(10, 1000, 1000);
        field.particles()[0] = {500.0f, 500.0f, 0.0f, 0.0f, 1.0f};

        for (int i = 0; i < 100; ++i) {
            f32 before = field.particles()[0].x;
            field.step(1.0f);
            QVERIFY(std::abs(field.particles()[0].x - before) <= 0.1f + 1e-5f);
        }
    }

    void testResizeKeepsParticles() {
        ParticleField field(5);
        field.reseed(20, 800, 600);
        auto before = field.particles();

        field.resize(1920, 1080);
        QCOMPARE(field.width(), 1920.0f);
        QCOMPARE(field.height(), 1080.0f);
        QCOMPARE(field.size(), before.size());
        QCOMPARE(field.particles()[3].x, before[3].x);
        QCOMPARE(field.particles()[3].y, before[3].y);
    }

    void testGlowRadius() {
        Particle p{0, 0, 0, 0, 1.0f};
        QCOMPARE(ParticleField::glowRadius(p, 0.0f), 1.0f);
        QCOMPARE(ParticleField::glowRadius(p, 0.5f), 2.0f);
        QCOMPARE(ParticleField::glowRadius(p, 1.0f), 3.0f);
    }
};

QTEST_GUILESS_MAIN(TestParticleField)
#include "test_ParticleField.moc"
