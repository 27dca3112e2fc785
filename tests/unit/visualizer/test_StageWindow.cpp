#include <QtTest>
#include "audio/AnalysisGraph.hpp"
#include "audio/AudioPlayer.hpp"
#include "core/Config.hpp"
#include "visualizer/StageWindow.hpp"

using namespace lg;

// Runs against an AudioPlayer that was never initialized, so nothing plays.
class TestStageWindow : public QObject {
    Q_OBJECT

private:
    audio::AudioPlayer player_;
    lyrics::LyricTrack track_ = lyrics::LyricTrack::fromText("[00:01.00] one\n[00:03.00] two");
    lyrics::SongInfo song_{"Song", "Band"};

private slots:
    void init() {
        CONFIG.reset();
    }

    void cleanup() {
        audio::AnalysisGraph::instance().teardown();
    }

    void testStartSchedulesRedrawAndClock() {
        StageWindow window(player_, track_, song_);
        window.start();
        // No sampling loop while nothing is playing
        QCOMPARE(window.frameClock().pendingCount(), usize(2));
        QVERIFY(!window.isSampling());

        window.frameClock().tick(16.0);
        QCOMPARE(window.frameClock().pendingCount(), usize(2));
        window.frameClock().tick(32.0);
        QCOMPARE(window.frameClock().pendingCount(), usize(2));
    }

    void testStartTwiceIsNoop() {
        StageWindow window(player_, track_, song_);
        window.start();
        window.start();
        QCOMPARE(window.frameClock().pendingCount(), usize(2));
    }

    void testTeardownCancelsEverything() {
        StageWindow window(player_, track_, song_);
        window.start();
        window.frameClock().tick(16.0);

        window.teardown();
        QVERIFY(!window.frameClock().hasPending());

        window.teardown();
        QVERIFY(!window.frameClock().hasPending());

        // Nothing left to run
        window.frameClock().tick(48.0);
        QVERIFY(!window.frameClock().hasPending());
    }

    void testSamplingStopsWhenNotPlaying() {
        StageWindow window(player_, track_, song_);
        window.start();

        // A play event starts sampling; the loop sees inactive playback on
        // its first tick and stops itself.
        player_.played();
        QVERIFY(window.isSampling());
        QCOMPARE(window.frameClock().pendingCount(), usize(3));
        QVERIFY(audio::AnalysisGraph::instance().isBuilt());

        window.frameClock().tick(16.0);
        QVERIFY(!window.isSampling());
        QCOMPARE(window.frameClock().pendingCount(), usize(2));

        window.teardown();
        QVERIFY(!window.frameClock().hasPending());
    }

    void testPlayedAfterTeardownIsIgnored() {
        StageWindow window(player_, track_, song_);
        window.start();
        window.teardown();

        player_.played();
        QVERIFY(!window.isSampling());
        QVERIFY(!window.frameClock().hasPending());
    }

    void testStageControls() {
        StageWindow window(player_, track_, song_);
        QCOMPARE(QString::fromStdString(window.themeName()),
                 QString(ThemeRegistry::kDefaultTheme));
        QCOMPARE(QString::fromStdString(window.fontName()), QString("Inter"));

        window.nextTheme();
        QVERIFY(window.themeName() != ThemeRegistry::kDefaultTheme);

        window.nextFont();
        QCOMPARE(QString::fromStdString(window.fontName()), QString("Serif"));

        const u32 density = window.density();
        window.changeDensity(StageWindow::kDensityStep);
        QCOMPARE(window.density(), density + StageWindow::kDensityStep);
        window.changeDensity(-10000);
        QCOMPARE(window.density(), ParticleField::kMinParticles);
    }
};

QTEST_MAIN(TestStageWindow)
#include "test_StageWindow.moc"
