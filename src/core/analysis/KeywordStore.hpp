#pragma once

#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <optional>
#include <vector>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"

namespace Scribe {

enum class KeywordStoreError {
    DirectoryUnavailable,
    WriteFailed
};

struct KeywordScenario {
    QString id;
    QString name;
    QString description;
    QStringList keywords;
};

// Keyword list handed to one analysis run. Never changes after creation.
struct KeywordSnapshot {
    QStringList keywords;
    QString source;     // "custom" or the scenario id
};

/**
 * @brief Keyword list and named keyword scenarios stored as JSON files.
 *
 * keywords_config.json holds {"keywords": [...]} and keyword_scenarios.json
 * holds {"scenarios": [{"id", "name", "description", "keywords"}]}. Writes
 * replace the file atomically. Unreadable or malformed files read as empty.
 */
class KeywordStore {
public:
    KeywordStore(QString directory, Config::AnalysisSettings limits = Config::AnalysisSettings());

    QStringList loadKeywords();
    Expected<void, KeywordStoreError> saveKeywords(const QStringList& keywords);

    std::vector<KeywordScenario> loadScenarios();
    Expected<void, KeywordStoreError> saveScenarios(const std::vector<KeywordScenario>& scenarios);
    std::optional<KeywordScenario> scenarioById(const QString& id);

    // The scenario's keywords when it exists and has any, else the custom list.
    KeywordSnapshot snapshot(const QString& scenarioId = QString());

    // Trims, drops blanks and out-of-range lengths, de-duplicates
    // case-insensitively (first spelling wins) and truncates at maxKeywords.
    QStringList normalize(const QStringList& keywords) const;

    QString keywordsFile() const;
    QString scenariosFile() const;

private:
    Expected<void, KeywordStoreError> writeJson(const QString& path, const QByteArray& json);

    QString directory_;
    Config::AnalysisSettings limits_;
    QMutex mutex_;
};

} // namespace Scribe
