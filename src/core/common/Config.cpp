#include "Config.hpp"

#include <QtCore/QDir>
#include <QtCore/QRegularExpression>

namespace Scribe {

QString configErrorToString(ConfigError error) {
    switch (error) {
        case ConfigError::NotInitialized:
            return "Configuration has not been initialized";
        case ConfigError::InvalidChunking:
            return "Chunk sizing settings are inconsistent";
        case ConfigError::InvalidWorkerPool:
            return "Worker pool settings are inconsistent";
        case ConfigError::InvalidMemoryThreshold:
            return "Memory pressure threshold must be within (0, 100]";
        case ConfigError::InvalidTranscription:
            return "Transcription settings are invalid";
        case ConfigError::InvalidAnalysis:
            return "Analysis limits are invalid";
        case ConfigError::InvalidPattern:
            return "Analysis pattern is not a valid regular expression";
        case ConfigError::InvalidStorage:
            return "Storage settings are invalid";
    }
    return "Unknown configuration error";
}

Config& Config::instance() {
    static Config instance;
    return instance;
}

void Config::initialize(const QString& organizationName, const QString& applicationName) {
    settings_ = std::make_unique<QSettings>(organizationName, applicationName);
    ensureDirectoriesExist();
    SCRIBE_INFO("Config initialized for {}/{}",
                organizationName.toStdString(), applicationName.toStdString());
}

void Config::initializeFromFile(const QString& iniPath) {
    settings_ = std::make_unique<QSettings>(iniPath, QSettings::IniFormat);
    ensureDirectoriesExist();
    SCRIBE_INFO("Config initialized from {}", iniPath.toStdString());
}

bool Config::isInitialized() const {
    return settings_ != nullptr;
}

QVariant Config::getValue(const QString& key, const QVariant& defaultValue) const {
    if (!settings_) return defaultValue;
    return settings_->value(key, defaultValue);
}

void Config::setValue(const QString& key, const QVariant& value) {
    if (settings_) {
        settings_->setValue(key, value);
    }
}

void Config::remove(const QString& key) {
    if (settings_) {
        settings_->remove(key);
    }
}

QString Config::getString(const QString& key, const QString& defaultValue) const {
    return getValue(key, defaultValue).toString();
}

int Config::getInt(const QString& key, int defaultValue) const {
    bool ok = false;
    const int value = getValue(key, defaultValue).toInt(&ok);
    return ok ? value : defaultValue;
}

bool Config::getBool(const QString& key, bool defaultValue) const {
    return getValue(key, defaultValue).toBool();
}

double Config::getDouble(const QString& key, double defaultValue) const {
    bool ok = false;
    const double value = getValue(key, defaultValue).toDouble(&ok);
    return ok ? value : defaultValue;
}

QStringList Config::getStringList(const QString& key, const QStringList& defaultValue) const {
    return getValue(key, defaultValue).toStringList();
}

Config::ChunkingSettings Config::getChunkingSettings() const {
    const ChunkingSettings defaults;
    ChunkingSettings settings;
    settings.defaultSeconds = getInt("chunking/defaultSeconds", defaults.defaultSeconds);
    settings.minSeconds = getInt("chunking/minSeconds", defaults.minSeconds);
    settings.maxSeconds = getInt("chunking/maxSeconds", defaults.maxSeconds);
    settings.shortMediaThreshold = getDouble("chunking/shortMediaThreshold", defaults.shortMediaThreshold);
    settings.longMediaThreshold = getDouble("chunking/longMediaThreshold", defaults.longMediaThreshold);
    settings.shortMediaChunkCap = getInt("chunking/shortMediaChunkCap", defaults.shortMediaChunkCap);
    settings.longMediaChunkCap = getInt("chunking/longMediaChunkCap", defaults.longMediaChunkCap);
    settings.extractionPoolCap = getInt("chunking/extractionPoolCap", defaults.extractionPoolCap);
    settings.videoCodec = getString("chunking/videoCodec", defaults.videoCodec);
    settings.audioCodec = getString("chunking/audioCodec", defaults.audioCodec);
    return settings;
}

Config::WorkerPoolConfig Config::getWorkerPoolConfig() const {
    const WorkerPoolConfig defaults;
    WorkerPoolConfig config;
    config.minWorkers = getInt("workers/min", defaults.minWorkers);
    config.maxWorkersCap = getInt("workers/maxCap", defaults.maxWorkersCap);
    config.memoryPerWorkerGb = getDouble("workers/memoryPerWorkerGb", defaults.memoryPerWorkerGb);
    config.systemReserveGb = getDouble("workers/systemReserveGb", defaults.systemReserveGb);
    config.memoryPressureThresholdPercent =
        getDouble("memory/pressureThresholdPercent", defaults.memoryPressureThresholdPercent);
    return config;
}

Config::TranscriptionSettings Config::getTranscriptionSettings() const {
    const TranscriptionSettings defaults;
    TranscriptionSettings settings;
    settings.modelPath = getString("transcription/modelPath",
        getDataPath() + "/models/ggml-base.bin");
    settings.language = getString("transcription/language", defaults.language);
    settings.threadsPerWorker = getInt("transcription/threadsPerWorker", defaults.threadsPerWorker);
    settings.chunkTimeoutSeconds = getInt("transcription/chunkTimeoutSeconds", defaults.chunkTimeoutSeconds);
    settings.sampleRate = getInt("audio/sampleRate", defaults.sampleRate);
    settings.channels = getInt("audio/channels", defaults.channels);
    settings.audioCodec = getString("audio/codec", defaults.audioCodec);
    return settings;
}

Config::AnalysisSettings Config::getAnalysisSettings() const {
    const AnalysisSettings defaults;
    AnalysisSettings settings;
    settings.contextWindowChars = getInt("analysis/contextWindowChars", defaults.contextWindowChars);
    settings.maxMatchesPerKeyword = getInt("analysis/maxMatchesPerKeyword", defaults.maxMatchesPerKeyword);
    settings.maxKeywords = getInt("analysis/maxKeywords", defaults.maxKeywords);
    settings.minKeywordLength = getInt("analysis/minKeywordLength", defaults.minKeywordLength);
    settings.maxKeywordLength = getInt("analysis/maxKeywordLength", defaults.maxKeywordLength);
    settings.questionPatterns = getStringList("analysis/questionPatterns", defaults.questionPatterns);
    settings.emphasisPatterns = getStringList("analysis/emphasisPatterns", defaults.emphasisPatterns);
    return settings;
}

Config::StorageSettings Config::getStorageSettings() const {
    const StorageSettings defaults;
    StorageSettings settings;
    settings.maxTempFiles = getInt("storage/maxTempFiles", defaults.maxTempFiles);
    settings.workPath = getString("storage/workPath", getWorkPath());
    settings.keywordsPath = getString("storage/keywordsPath", getKeywordsPath());
    return settings;
}

Config::LoggingSettings Config::getLoggingSettings() const {
    const LoggingSettings defaults;
    LoggingSettings settings;
    settings.filePath = getString("logging/file", defaults.filePath);
    settings.level = Logger::levelFromName(
        getString("logging/level", "info").toStdString(), defaults.level);
    return settings;
}

void Config::setChunkingSettings(const ChunkingSettings& settings) {
    setValue("chunking/defaultSeconds", settings.defaultSeconds);
    setValue("chunking/minSeconds", settings.minSeconds);
    setValue("chunking/maxSeconds", settings.maxSeconds);
    setValue("chunking/shortMediaThreshold", settings.shortMediaThreshold);
    setValue("chunking/longMediaThreshold", settings.longMediaThreshold);
    setValue("chunking/shortMediaChunkCap", settings.shortMediaChunkCap);
    setValue("chunking/longMediaChunkCap", settings.longMediaChunkCap);
    setValue("chunking/extractionPoolCap", settings.extractionPoolCap);
    setValue("chunking/videoCodec", settings.videoCodec);
    setValue("chunking/audioCodec", settings.audioCodec);
}

void Config::setWorkerPoolConfig(const WorkerPoolConfig& config) {
    setValue("workers/min", config.minWorkers);
    setValue("workers/maxCap", config.maxWorkersCap);
    setValue("workers/memoryPerWorkerGb", config.memoryPerWorkerGb);
    setValue("workers/systemReserveGb", config.systemReserveGb);
    setValue("memory/pressureThresholdPercent", config.memoryPressureThresholdPercent);
}

void Config::setTranscriptionSettings(const TranscriptionSettings& settings) {
    setValue("transcription/modelPath", settings.modelPath);
    setValue("transcription/language", settings.language);
    setValue("transcription/threadsPerWorker", settings.threadsPerWorker);
    setValue("transcription/chunkTimeoutSeconds", settings.chunkTimeoutSeconds);
    setValue("audio/sampleRate", settings.sampleRate);
    setValue("audio/channels", settings.channels);
    setValue("audio/codec", settings.audioCodec);
}

void Config::setAnalysisSettings(const AnalysisSettings& settings) {
    setValue("analysis/contextWindowChars", settings.contextWindowChars);
    setValue("analysis/maxMatchesPerKeyword", settings.maxMatchesPerKeyword);
    setValue("analysis/maxKeywords", settings.maxKeywords);
    setValue("analysis/minKeywordLength", settings.minKeywordLength);
    setValue("analysis/maxKeywordLength", settings.maxKeywordLength);
    setValue("analysis/questionPatterns", settings.questionPatterns);
    setValue("analysis/emphasisPatterns", settings.emphasisPatterns);
}

void Config::setStorageSettings(const StorageSettings& settings) {
    setValue("storage/maxTempFiles", settings.maxTempFiles);
    setValue("storage/workPath", settings.workPath);
    setValue("storage/keywordsPath", settings.keywordsPath);
}

void Config::setLoggingSettings(const LoggingSettings& settings) {
    static const char* const names[] = {
        "trace", "debug", "info", "warn", "error", "critical", "off"
    };
    setValue("logging/file", settings.filePath);
    setValue("logging/level", QString::fromLatin1(names[static_cast<int>(settings.level)]));
}

Expected<void, ConfigError> Config::validate() const {
    if (!settings_) {
        return makeUnexpected(ConfigError::NotInitialized);
    }

    const auto chunking = getChunkingSettings();
    if (chunking.minSeconds <= 0 || chunking.minSeconds >= chunking.maxSeconds ||
        chunking.defaultSeconds < chunking.minSeconds ||
        chunking.defaultSeconds > chunking.maxSeconds ||
        chunking.shortMediaChunkCap <= 0 || chunking.longMediaChunkCap <= 0 ||
        chunking.shortMediaThreshold > chunking.longMediaThreshold ||
        chunking.extractionPoolCap < 1) {
        SCRIBE_ERROR("Invalid chunking settings: default={} min={} max={}",
                     chunking.defaultSeconds, chunking.minSeconds, chunking.maxSeconds);
        return makeUnexpected(ConfigError::InvalidChunking);
    }

    const auto workers = getWorkerPoolConfig();
    if (workers.minWorkers < 1 || workers.minWorkers > workers.maxWorkersCap ||
        workers.memoryPerWorkerGb <= 0.0 || workers.systemReserveGb < 0.0) {
        SCRIBE_ERROR("Invalid worker pool settings: min={} cap={} perWorker={}GB reserve={}GB",
                     workers.minWorkers, workers.maxWorkersCap,
                     workers.memoryPerWorkerGb, workers.systemReserveGb);
        return makeUnexpected(ConfigError::InvalidWorkerPool);
    }
    if (workers.memoryPressureThresholdPercent <= 0.0 ||
        workers.memoryPressureThresholdPercent > 100.0) {
        SCRIBE_ERROR("Invalid memory pressure threshold: {}", workers.memoryPressureThresholdPercent);
        return makeUnexpected(ConfigError::InvalidMemoryThreshold);
    }

    const auto transcription = getTranscriptionSettings();
    if (transcription.chunkTimeoutSeconds <= 0 || transcription.sampleRate <= 0 ||
        transcription.channels < 1 || transcription.threadsPerWorker < 0) {
        SCRIBE_ERROR("Invalid transcription settings: timeout={}s rate={} channels={}",
                     transcription.chunkTimeoutSeconds, transcription.sampleRate,
                     transcription.channels);
        return makeUnexpected(ConfigError::InvalidTranscription);
    }

    const auto analysis = getAnalysisSettings();
    if (analysis.contextWindowChars < 0 || analysis.maxMatchesPerKeyword < 1 ||
        analysis.maxKeywords < 1 || analysis.minKeywordLength < 1 ||
        analysis.minKeywordLength > analysis.maxKeywordLength) {
        SCRIBE_ERROR("Invalid analysis limits");
        return makeUnexpected(ConfigError::InvalidAnalysis);
    }
    for (const QString& pattern : analysis.questionPatterns + analysis.emphasisPatterns) {
        const QRegularExpression regex(pattern);
        if (!regex.isValid()) {
            SCRIBE_ERROR("Invalid analysis pattern '{}': {}",
                         pattern.toStdString(), regex.errorString().toStdString());
            return makeUnexpected(ConfigError::InvalidPattern);
        }
    }

    const auto storage = getStorageSettings();
    if (storage.maxTempFiles < 1 || storage.workPath.isEmpty()) {
        SCRIBE_ERROR("Invalid storage settings: maxTempFiles={}", storage.maxTempFiles);
        return makeUnexpected(ConfigError::InvalidStorage);
    }

    return {};
}

QString Config::getDataPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
}

QString Config::getWorkPath() const {
    return QStandardPaths::writableLocation(QStandardPaths::TempLocation) + "/Scribe";
}

QString Config::getKeywordsPath() const {
    return getDataPath() + "/config";
}

void Config::sync() {
    if (settings_) {
        settings_->sync();
    }
}

void Config::ensureDirectoriesExist() {
    const QStringList paths = {
        getString("storage/workPath", getWorkPath()),
        getString("storage/keywordsPath", getKeywordsPath())
    };

    for (const QString& path : paths) {
        QDir dir;
        if (!dir.mkpath(path)) {
            SCRIBE_WARN("Failed to create directory: {}", path.toStdString());
        }
    }
}

} // namespace Scribe
