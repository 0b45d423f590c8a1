#pragma once

#include <QtCore/QSettings>
#include <QtCore/QStandardPaths>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <QtCore/QVariant>
#include <memory>

#include "Expected.hpp"
#include "Logger.hpp"

namespace Scribe {

enum class ConfigError {
    NotInitialized,
    InvalidChunking,
    InvalidWorkerPool,
    InvalidMemoryThreshold,
    InvalidTranscription,
    InvalidAnalysis,
    InvalidPattern,
    InvalidStorage
};

QString configErrorToString(ConfigError error);

class Config {
public:
    static Config& instance();

    void initialize(const QString& organizationName = "Scribe",
                    const QString& applicationName = "ScribePipeline");

    // INI file backend, used by the CLI --config option and by tests.
    void initializeFromFile(const QString& iniPath);

    bool isInitialized() const;

    QVariant getValue(const QString& key, const QVariant& defaultValue = QVariant()) const;
    void setValue(const QString& key, const QVariant& value);
    void remove(const QString& key);

    QString getString(const QString& key, const QString& defaultValue = QString()) const;
    int getInt(const QString& key, int defaultValue = 0) const;
    bool getBool(const QString& key, bool defaultValue = false) const;
    double getDouble(const QString& key, double defaultValue = 0.0) const;
    QStringList getStringList(const QString& key, const QStringList& defaultValue = QStringList()) const;

    struct ChunkingSettings {
        int defaultSeconds = 300;
        int minSeconds = 60;
        int maxSeconds = 600;
        double shortMediaThreshold = 600.0;   // media shorter than this uses shortMediaChunkCap
        double longMediaThreshold = 3600.0;   // media longer than this uses longMediaChunkCap
        int shortMediaChunkCap = 180;
        int longMediaChunkCap = 420;
        int extractionPoolCap = 4;
        QString videoCodec = "libx264";
        QString audioCodec = "aac";
    };

    struct WorkerPoolConfig {
        int minWorkers = 2;
        int maxWorkersCap = 6;
        double memoryPerWorkerGb = 0.6;
        double systemReserveGb = 2.0;
        double memoryPressureThresholdPercent = 75.0;
    };

    struct TranscriptionSettings {
        QString modelPath;
        QString language = "auto";
        int threadsPerWorker = 0;       // 0 = derive from core count and worker count
        int chunkTimeoutSeconds = 600;
        int sampleRate = 16000;
        int channels = 1;
        QString audioCodec = "pcm_s16le";
    };

    struct AnalysisSettings {
        int contextWindowChars = 50;
        int maxMatchesPerKeyword = 100;
        int maxKeywords = 1000;
        int minKeywordLength = 2;
        int maxKeywordLength = 100;
        // Ordered, case-insensitive; the first matching pattern wins.
        QStringList questionPatterns = {
            R"(\?)", R"(\bwhat\b)", R"(\bhow\b)", R"(\bwhy\b)",
            R"(\bwhen\b)", R"(\bwhere\b)", R"(\bwho\b)"
        };
        QStringList emphasisPatterns = {
            R"(\bmake sure\b)", R"(\bdon't forget\b)", R"(\bremember\b)",
            R"(\bimportant\b)", R"(\bnote that\b)", R"(\bpay attention\b)",
            R"(\bkeep in mind\b)"
        };
    };

    struct StorageSettings {
        int maxTempFiles = 20;
        QString workPath;
        QString keywordsPath;
    };

    struct LoggingSettings {
        QString filePath = "scribe.log";
        Logger::Level level = Logger::Level::Info;
    };

    ChunkingSettings getChunkingSettings() const;
    WorkerPoolConfig getWorkerPoolConfig() const;
    TranscriptionSettings getTranscriptionSettings() const;
    AnalysisSettings getAnalysisSettings() const;
    StorageSettings getStorageSettings() const;
    LoggingSettings getLoggingSettings() const;

    void setChunkingSettings(const ChunkingSettings& settings);
    void setWorkerPoolConfig(const WorkerPoolConfig& config);
    void setTranscriptionSettings(const TranscriptionSettings& settings);
    void setAnalysisSettings(const AnalysisSettings& settings);
    void setStorageSettings(const StorageSettings& settings);
    void setLoggingSettings(const LoggingSettings& settings);

    Expected<void, ConfigError> validate() const;

    QString getDataPath() const;
    QString getWorkPath() const;
    QString getKeywordsPath() const;

    void sync();

private:
    Config() = default;
    std::unique_ptr<QSettings> settings_;

    void ensureDirectoriesExist();
};

using WorkerPoolConfig = Config::WorkerPoolConfig;

} // namespace Scribe
