#include <QtTest/QtTest>
#include "core/common/Config.hpp"
#include "utils/TestUtils.hpp"

using namespace Scribe;
using namespace Scribe::Test;

class TestConfig : public QObject {
    Q_OBJECT

private slots:
    void init() {
        tempDir_ = TestUtils::createTempDirectory("config_test");
        QVERIFY(!tempDir_.isEmpty());
        Config::instance().initializeFromFile(tempDir_ + "/scribe.ini");
        Config::instance().setStorageSettings({20, tempDir_ + "/work", tempDir_ + "/keywords"});
    }

    void cleanup() {
        TestUtils::cleanupTempDirectory(tempDir_);
    }

    void testDefaults() {
        auto& config = Config::instance();
        QVERIFY(config.isInitialized());

        const auto chunking = config.getChunkingSettings();
        QCOMPARE(chunking.defaultSeconds, 300);
        QCOMPARE(chunking.minSeconds, 60);
        QCOMPARE(chunking.maxSeconds, 600);
        QCOMPARE(chunking.shortMediaChunkCap, 180);
        QCOMPARE(chunking.longMediaChunkCap, 420);
        QCOMPARE(chunking.extractionPoolCap, 4);
        QCOMPARE(chunking.videoCodec, QString("libx264"));

        const auto workers = config.getWorkerPoolConfig();
        QCOMPARE(workers.minWorkers, 2);
        QCOMPARE(workers.maxWorkersCap, 6);
        QCOMPARE(workers.memoryPerWorkerGb, 0.6);
        QCOMPARE(workers.systemReserveGb, 2.0);
        QCOMPARE(workers.memoryPressureThresholdPercent, 75.0);

        const auto transcription = config.getTranscriptionSettings();
        QCOMPARE(transcription.sampleRate, 16000);
        QCOMPARE(transcription.channels, 1);
        QCOMPARE(transcription.audioCodec, QString("pcm_s16le"));
        QCOMPARE(transcription.chunkTimeoutSeconds, 600);

        const auto analysis = config.getAnalysisSettings();
        QCOMPARE(analysis.contextWindowChars, 50);
        QCOMPARE(analysis.questionPatterns.first(), QString(R"(\?)"));
        QCOMPARE(analysis.emphasisPatterns.size(), 7);

        QVERIFY(config.validate().hasValue());
    }

    void testSettingsRoundTrip() {
        auto& config = Config::instance();

        Config::WorkerPoolConfig workers;
        workers.minWorkers = 1;
        workers.maxWorkersCap = 3;
        workers.memoryPerWorkerGb = 1.5;
        config.setWorkerPoolConfig(workers);
        config.sync();

        const auto loaded = config.getWorkerPoolConfig();
        QCOMPARE(loaded.minWorkers, 1);
        QCOMPARE(loaded.maxWorkersCap, 3);
        QCOMPARE(loaded.memoryPerWorkerGb, 1.5);

        Config::LoggingSettings logging;
        logging.filePath = "custom.log";
        logging.level = Logger::Level::Debug;
        config.setLoggingSettings(logging);
        QCOMPARE(config.getLoggingSettings().level, Logger::Level::Debug);
        QCOMPARE(config.getLoggingSettings().filePath, QString("custom.log"));
    }

    void testRejectsInconsistentChunking() {
        auto& config = Config::instance();
        auto chunking = config.getChunkingSettings();
        chunking.minSeconds = 600;
        chunking.maxSeconds = 60;
        config.setChunkingSettings(chunking);

        auto result = config.validate();
        QVERIFY(result.hasError());
        QCOMPARE(result.error(), ConfigError::InvalidChunking);
    }

    void testRejectsInvalidWorkerPool() {
        auto& config = Config::instance();
        auto workers = config.getWorkerPoolConfig();
        workers.minWorkers = 0;
        config.setWorkerPoolConfig(workers);
        QCOMPARE(config.validate().error(), ConfigError::InvalidWorkerPool);

        workers.minWorkers = 8;
        workers.maxWorkersCap = 4;
        config.setWorkerPoolConfig(workers);
        QCOMPARE(config.validate().error(), ConfigError::InvalidWorkerPool);
    }

    void testRejectsPressureThresholdOutOfRange() {
        auto& config = Config::instance();
        auto workers = config.getWorkerPoolConfig();
        workers.memoryPressureThresholdPercent = 120.0;
        config.setWorkerPoolConfig(workers);
        QCOMPARE(config.validate().error(), ConfigError::InvalidMemoryThreshold);
    }

    void testRejectsInvalidPattern() {
        auto& config = Config::instance();
        auto analysis = config.getAnalysisSettings();
        analysis.questionPatterns << "(unclosed";
        config.setAnalysisSettings(analysis);
        QCOMPARE(config.validate().error(), ConfigError::InvalidPattern);
    }

    void testLevelFromName() {
        QCOMPARE(Logger::levelFromName("warn"), Logger::Level::Warn);
        QCOMPARE(Logger::levelFromName("TRACE"), Logger::Level::Trace);
        QCOMPARE(Logger::levelFromName("nonsense", Logger::Level::Error), Logger::Level::Error);
    }

private:
    QString tempDir_;
};

int runTestConfig(int argc, char** argv) {
    TestConfig test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_config.moc"
