#include "KeywordStore.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>
#include <QtCore/QSet>

namespace Scribe {

namespace {

QStringList toStringList(const QJsonArray& array) {
    QStringList list;
    for (const auto& value : array) {
        if (value.isString()) {
            list << value.toString();
        }
    }
    return list;
}

} // namespace

KeywordStore::KeywordStore(QString directory, Config::AnalysisSettings limits)
    : directory_(std::move(directory))
    , limits_(std::move(limits)) {
}

QString KeywordStore::keywordsFile() const {
    return directory_ + "/keywords_config.json";
}

QString KeywordStore::scenariosFile() const {
    return directory_ + "/keyword_scenarios.json";
}

QStringList KeywordStore::loadKeywords() {
    QMutexLocker locker(&mutex_);
    const QString path = keywordsFile();

    QFile file(path);
    if (!file.exists()) {
        if (auto written = writeJson(path, QJsonDocument(QJsonObject{{"keywords", QJsonArray()}}).toJson());
            written.hasError()) {
            SCRIBE_WARN("Could not create keywords file {}", path.toStdString());
        }
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        SCRIBE_ERROR("Unable to read keywords file {}: {}", path.toStdString(),
                     file.errorString().toStdString());
        return {};
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        SCRIBE_WARN("Invalid JSON in keywords file {}: {}", path.toStdString(),
                    parseError.errorString().toStdString());
        if (auto written = writeJson(path, QJsonDocument(QJsonObject{{"keywords", QJsonArray()}}).toJson());
            written.hasError()) {
            SCRIBE_WARN("Could not reset keywords file {}", path.toStdString());
        }
        return {};
    }

    return toStringList(document.object().value("keywords").toArray());
}

Expected<void, KeywordStoreError> KeywordStore::saveKeywords(const QStringList& keywords) {
    const QStringList normalized = normalize(keywords);
    QMutexLocker locker(&mutex_);
    const QJsonObject root{{"keywords", QJsonArray::fromStringList(normalized)}};
    return writeJson(keywordsFile(), QJsonDocument(root).toJson(QJsonDocument::Indented));
}

std::vector<KeywordScenario> KeywordStore::loadScenarios() {
    QMutexLocker locker(&mutex_);
    const QString path = scenariosFile();

    QFile file(path);
    if (!file.exists()) {
        if (auto written = writeJson(path, QJsonDocument(QJsonObject{{"scenarios", QJsonArray()}}).toJson());
            written.hasError()) {
            SCRIBE_WARN("Could not create scenarios file {}", path.toStdString());
        }
        return {};
    }
    if (!file.open(QIODevice::ReadOnly)) {
        SCRIBE_ERROR("Unable to read scenarios file {}: {}", path.toStdString(),
                     file.errorString().toStdString());
        return {};
    }

    QJsonParseError parseError;
    const QJsonDocument document = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !document.isObject()) {
        SCRIBE_WARN("Invalid JSON in scenarios file {}: {}", path.toStdString(),
                    parseError.errorString().toStdString());
        return {};
    }

    std::vector<KeywordScenario> scenarios;
    for (const auto& value : document.object().value("scenarios").toArray()) {
        const QJsonObject object = value.toObject();
        KeywordScenario scenario;
        scenario.id = object.value("id").toString();
        scenario.name = object.value("name").toString();
        scenario.description = object.value("description").toString();
        scenario.keywords = toStringList(object.value("keywords").toArray());
        if (!scenario.id.isEmpty()) {
            scenarios.push_back(std::move(scenario));
        }
    }
    return scenarios;
}

Expected<void, KeywordStoreError> KeywordStore::saveScenarios(const std::vector<KeywordScenario>& scenarios) {
    QJsonArray array;
    for (const auto& scenario : scenarios) {
        QJsonObject object;
        object["id"] = scenario.id;
        object["name"] = scenario.name;
        object["description"] = scenario.description;
        object["keywords"] = QJsonArray::fromStringList(normalize(scenario.keywords));
        array.append(object);
    }

    QMutexLocker locker(&mutex_);
    return writeJson(scenariosFile(), QJsonDocument(QJsonObject{{"scenarios", array}}).toJson());
}

std::optional<KeywordScenario> KeywordStore::scenarioById(const QString& id) {
    for (auto& scenario : loadScenarios()) {
        if (scenario.id == id) {
            return scenario;
        }
    }
    return std::nullopt;
}

KeywordSnapshot KeywordStore::snapshot(const QString& scenarioId) {
    if (!scenarioId.isEmpty()) {
        if (auto scenario = scenarioById(scenarioId); scenario && !scenario->keywords.isEmpty()) {
            return KeywordSnapshot{normalize(scenario->keywords), scenario->id};
        }
        SCRIBE_WARN("Keyword scenario '{}' not found or empty, using custom keywords",
                    scenarioId.toStdString());
    }
    return KeywordSnapshot{normalize(loadKeywords()), QStringLiteral("custom")};
}

QStringList KeywordStore::normalize(const QStringList& keywords) const {
    QStringList normalized;
    QSet<QString> seen;
    for (const QString& raw : keywords) {
        const QString keyword = raw.trimmed();
        if (keyword.isEmpty()) {
            continue;
        }
        if (keyword.size() < limits_.minKeywordLength || keyword.size() > limits_.maxKeywordLength) {
            SCRIBE_WARN("Ignoring keyword of length {} (allowed {}-{})", keyword.size(),
                        limits_.minKeywordLength, limits_.maxKeywordLength);
            continue;
        }
        const QString folded = keyword.toCaseFolded();
        if (seen.contains(folded)) {
            continue;
        }
        if (normalized.size() >= limits_.maxKeywords) {
            SCRIBE_WARN("Keyword list truncated at {} entries", limits_.maxKeywords);
            break;
        }
        seen.insert(folded);
        normalized << keyword;
    }
    return normalized;
}

Expected<void, KeywordStoreError> KeywordStore::writeJson(const QString& path, const QByteArray& json) {
    if (!QDir().mkpath(directory_)) {
        SCRIBE_ERROR("Cannot create keyword directory {}", directory_.toStdString());
        return makeUnexpected(KeywordStoreError::DirectoryUnavailable);
    }

    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly) || file.write(json) != json.size() || !file.commit()) {
        SCRIBE_ERROR("Failed to write {}: {}", path.toStdString(), file.errorString().toStdString());
        return makeUnexpected(KeywordStoreError::WriteFailed);
    }
    return {};
}

} // namespace Scribe
