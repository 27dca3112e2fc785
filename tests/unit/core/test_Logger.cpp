#include <QtTest>
#include <spdlog/sinks/null_sink.h>
#include "core/Logger.hpp"

class TestLogger : public QObject {
    Q_OBJECT

private slots:
    void initTestCase() {
        // Ensure clean state
        lg::Logger::shutdown();
    }

    void testInitialization() {
        lg::Logger::init("lyricglow_test", true);
        QVERIFY(lg::Logger::get() != nullptr);
        QVERIFY(lg::Logger::get()->level() == spdlog::level::debug);

        LOG_DEBUG("Test debug message");
        LOG_INFO("Test info message");
        LOG_WARN("Test warn message");
        LOG_ERROR("Test error message");

        lg::Logger::shutdown();
    }

    void testInfoLevelByDefault() {
        lg::Logger::init("lyricglow_test", false);
        QVERIFY(lg::Logger::get()->level() == spdlog::level::info);
        lg::Logger::shutdown();
    }

    void testDoubleInit() {
        lg::Logger::init("lyricglow_test", true);
        lg::Logger::init("lyricglow_test", true);
        QVERIFY(lg::Logger::get() != nullptr);
        lg::Logger::shutdown();
    }

    void testSetDebugAfterInit() {
        lg::Logger::init("lyricglow_test", false);
        lg::Logger::setDebug(true);
        QVERIFY(lg::Logger::get()->level() == spdlog::level::debug);
        lg::Logger::setDebug(false);
        QVERIFY(lg::Logger::get()->level() == spdlog::level::info);
        lg::Logger::shutdown();
    }

    void testLogFileUnderCache() {
        lg::Logger::init("lyricglow_test", false);
        // XDG_CACHE_HOME points into the build tree for tests
        if (lg::Logger::logFile().empty())
            QSKIP("Cache directory not writable");
        QCOMPARE(QString::fromStdString(lg::Logger::logFile().filename().string()),
                 QString("lyricglow_test.log"));
        QCOMPARE(QString::fromStdString(
                         lg::Logger::logFile().parent_path().filename().string()),
                 QString("logs"));
        lg::Logger::shutdown();
    }

    void testQuietAfterShutdown() {
        lg::Logger::init("lyricglow_test", true);
        lg::Logger::shutdown();

        // Late log calls must not bring the console or file sinks back
        auto& logger = lg::Logger::get();
        QVERIFY(logger != nullptr);
        QVERIFY(logger->level() == spdlog::level::off);
        QCOMPARE(logger->sinks().size(), size_t(1));
        QVERIFY(std::dynamic_pointer_cast<spdlog::sinks::null_sink_mt>(
                        logger->sinks().front()) != nullptr);
        QVERIFY(lg::Logger::logFile().empty());
        LOG_ERROR("Dropped after shutdown");

        // A fresh init replaces the quiet logger
        lg::Logger::init("lyricglow_test", false);
        QVERIFY(lg::Logger::get()->level() == spdlog::level::info);
        QVERIFY(lg::Logger::get()->sinks().size() >= 1);
        lg::Logger::shutdown();
    }
};

QTEST_GUILESS_MAIN(TestLogger)
#include "test_Logger.moc"
