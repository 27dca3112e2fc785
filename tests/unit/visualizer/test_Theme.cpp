#include <QtTest>
#include "visualizer/Theme.hpp"

using namespace lg;

class TestTheme : public QObject {
    Q_OBJECT

private slots:
    void testPresets() {
        ThemeRegistry themes;
        QCOMPARE(themes.names().size(), usize(4));
        QCOMPARE(themes.names()[0], std::string("Midnight Neon"));
        QCOMPARE(themes.names()[3], std::string("Blossom"));

        const auto& aurora = themes.resolve("Aurora");
        QCOMPARE(aurora.bgFrom.toHex(), std::string("#0b1220"));
        QCOMPARE(aurora.bgTo.toHex(), std::string("#102a43"));
        QCOMPARE(aurora.accentA.toHex(), std::string("#5eead4"));
        QCOMPARE(aurora.accentB.toHex(), std::string("#93c5fd"));
    }

    void testUnknownFallsBackToDefault() {
        ThemeRegistry themes;
        QVERIFY(!themes.contains("Nope"));
        QVERIFY(themes.resolve("Nope") == themes.resolve("Midnight Neon"));
        QCOMPARE(themes.resolve("Nope").accentA.toHex(), std::string("#7f5af0"));
    }

    void testCustomThemes() {
        ThemeMap custom;
        custom["Ember"] = {Color::fromHex("#140b08"),
                           Color::fromHex("#2b1408"),
                           Color::fromHex("#fb923c"),
                           Color::fromHex("#fde68a")};
        custom["Sunset"] = {Color::black(), Color::black(), Color::white(), Color::white()};

        ThemeRegistry themes(custom);
        QCOMPARE(themes.names().size(), usize(5));
        QCOMPARE(themes.names().back(), std::string("Ember"));
        QVERIFY(themes.contains("Ember"));
        QCOMPARE(themes.resolve("Ember").accentA.toHex(), std::string("#fb923c"));
        QVERIFY(themes.resolve("Sunset").accentA == Color::white());
    }

    void testNextCycles() {
        ThemeRegistry themes;
        QCOMPARE(themes.next("Midnight Neon"), std::string("Aurora"));
        QCOMPARE(themes.next("Sunset"), std::string("Blossom"));
        QCOMPARE(themes.next("Blossom"), std::string("Midnight Neon"));
        QCOMPARE(themes.next("unknown"), std::string("Midnight Neon"));
    }

    void testColorHex() {
        QVERIFY(Color::fromHex("#fff") == Color::white());
        QCOMPARE(Color::fromHex("#7f5af080").a, u8(0x80));
        QVERIFY(Color::fromHex("bogus") == Color::black());
        QCOMPARE(Color::fromHex("#2CB67D").toHex(), std::string("#2cb67d"));
    }
};

QTEST_GUILESS_MAIN(TestTheme)
#include "test_Theme.moc"
