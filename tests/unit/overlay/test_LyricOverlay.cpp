#include <QImage>
#include <QPainter>
#include <QtTest>
#include "overlay/LyricOverlay.hpp"

using namespace lg;
using namespace lg::lyrics;

class TestLyricOverlay : public QObject {
    Q_OBJECT

private slots:
    void testModeText() {
        QCOMPARE(LyricOverlay::modeText(LyricTrack()), std::string("No lyrics yet"));
        QCOMPARE(LyricOverlay::modeText(LyricTrack::fromText("[00:01.00] a")),
                 std::string("Synced via .lrc"));
        QCOMPARE(LyricOverlay::modeText(LyricTrack::fromText("a\nb")),
                 std::string("Auto-timed (even spread)"));
    }

    void testFontPresets() {
        QCOMPARE(LyricOverlay::fontPresets().size(), usize(5));
        QCOMPARE(LyricOverlay::fontPreset("Cinematic").family, QString("Georgia"));
        QCOMPARE(LyricOverlay::fontPreset("Grotesk").family, QString("Space Grotesk"));
        QCOMPARE(LyricOverlay::fontPreset("missing").name, std::string("Inter"));
        QCOMPARE(LyricOverlay::nextFont("Inter"), std::string("Serif"));
        QCOMPARE(LyricOverlay::nextFont("Grotesk"), std::string("Inter"));
    }

    void testEaseOut() {
        QCOMPARE(LineTransition::easeOut(0.0), 0.0);
        QCOMPARE(LineTransition::easeOut(1.0), 1.0);
        QVERIFY(LineTransition::easeOut(0.5) > 0.5);
    }

    void testTransitionProgress() {
        LineTransition t;
        QCOMPARE(t.progress(0.0), 1.0);

        t.start(1000.0, 450.0);
        QCOMPARE(t.progress(1000.0), 0.0);
        QVERIFY(t.isRunning(1200.0));
        QCOMPARE(t.progress(1450.0), 1.0);
        QVERIFY(!t.isRunning(2000.0));
    }

    void testIndexChangeStartsTransition() {
        LyricOverlay overlay;
        overlay.setTransitionMs(450);

        // First frame shows immediately
        overlay.update({0, "one", "", "two"}, 0.0);
        QVERIFY(!overlay.transition().isRunning(0.0));
        QCOMPARE(overlay.frame().current, std::string("one"));

        // Same index: no transition
        overlay.update({0, "one", "", "two"}, 100.0);
        QVERIFY(!overlay.transition().isRunning(100.0));

        overlay.update({1, "two", "one", "three"}, 200.0);
        QVERIFY(overlay.transition().isRunning(250.0));
        QCOMPARE(overlay.outgoingText(), std::string("one"));
        QCOMPARE(overlay.frame().current, std::string("two"));
        QVERIFY(!overlay.transition().isRunning(700.0));
    }

    void testPaintDoesNotCrash() {
        LyricOverlay overlay;
        overlay.setFont("Serif", 48);
        overlay.setAccent(Color::fromHex("#7f5af0"));
        overlay.setSongInfo({"Night Drive", "Lofi Vision"});
        overlay.setStatus("Synced via .lrc", "00:01 / 03:20");
        overlay.update({0, "hello", "", "world"}, 0.0);
        overlay.update({1, "world", "hello", ""}, 10.0);

        QImage image(640, 360, QImage::Format_ARGB32_Premultiplied);
        image.fill(Qt::black);
        QPainter painter(&image);
        overlay.paint(painter, image.size(), 100.0);
        painter.end();

        // Something was drawn
        QVERIFY(image != [] {
            QImage blank(640, 360, QImage::Format_ARGB32_Premultiplied);
            blank.fill(Qt::black);
            return blank;
        }());
    }
};

QTEST_MAIN(TestLyricOverlay)
#include "test_LyricOverlay.moc"
