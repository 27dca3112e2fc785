#include <QtTest>
#include <vector>
#include "visualizer/FrameClock.hpp"

using namespace lg;

class TestFrameClock : public QObject {
    Q_OBJECT

private slots:
    void testCallbackRunsOnce() {
        FrameClock clock;
        int calls = 0;
        f64 seen = 0.0;
        clock.request([&](f64 now) {
            ++calls;
            seen = now;
        });
        QVERIFY(clock.hasPending());

        clock.tick(16.0);
        QCOMPARE(calls, 1);
        QCOMPARE(seen, 16.0);
        QVERIFY(!clock.hasPending());

        clock.tick(32.0);
        QCOMPARE(calls, 1);
    }

    void testHandlesAreUnique() {
        FrameClock clock;
        auto a = clock.request([](f64) {});
        auto b = clock.request([](f64) {});
        QVERIFY(a != kNoFrame);
        QVERIFY(b != kNoFrame);
        QVERIFY(a != b);
        QCOMPARE(clock.pendingCount(), usize(2));
    }

    void testCancelledHandleNeverFires() {
        FrameClock clock;
        bool fired = false;
        auto handle = clock.request([&](f64) { fired = true; });
        clock.cancel(handle);
        clock.tick(1.0);
        QVERIFY(!fired);

        // Unknown and empty handles are ignored
        clock.cancel(kNoFrame);
        clock.cancel(9999);
    }

    void testRequestDuringTickRunsNextTick() {
        FrameClock clock;
        std::vector<f64> frames;
        std::function<void(f64)> loop = [&](f64 now) {
            frames.push_back(now);
            if (frames.size() < 3)
                clock.request(loop);
        };
        clock.request(loop);

        clock.tick(10.0);
        QCOMPARE(frames.size(), usize(1));
        clock.tick(20.0);
        QCOMPARE(frames.size(), usize(2));
        clock.tick(30.0);
        clock.tick(40.0);
        QCOMPARE(frames.size(), usize(3));
        QCOMPARE(frames.back(), 30.0);
    }

    void testCancelDuringTick() {
        FrameClock clock;
        bool secondFired = false;
        FrameHandle second = kNoFrame;
        clock.request([&](f64) { clock.cancel(second); });
        second = clock.request([&](f64) { secondFired = true; });

        clock.tick(1.0);
        QVERIFY(!secondFired);
    }

    void testCancelAll() {
        FrameClock clock;
        int calls = 0;
        clock.request([&](f64) { ++calls; });
        clock.request([&](f64) { ++calls; });
        clock.cancelAll();
        QVERIFY(!clock.hasPending());
        clock.tick(1.0);
        QCOMPARE(calls, 0);
    }

    void testFrameRequestedSignal() {
        FrameClock clock;
        int wakeups = 0;
        clock.frameRequested.connect([&]() { ++wakeups; });

        clock.request([](f64) {});
        clock.request([](f64) {});
        QCOMPARE(wakeups, 1);

        clock.tick(1.0);
        clock.request([](f64) {});
        QCOMPARE(wakeups, 2);
    }

    void testOrderPreserved() {
        FrameClock clock;
        std::vector<int> order;
        clock.request([&](f64) { order.push_back(1); });
        clock.request([&](f64) { order.push_back(2); });
        clock.request([&](f64) { order.push_back(3); });
        clock.tick(0.0);
        QCOMPARE(order, (std::vector<int>{1, 2, 3}));
    }
};

QTEST_GUILESS_MAIN(TestFrameClock)
#include "test_FrameClock.moc"
