#include <QtTest/QtTest>
#include <QtCore/QFile>
#include <QtCore/QJsonArray>
#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include "core/analysis/KeywordStore.hpp"
#include "utils/TestUtils.hpp"

using namespace Scribe;
using namespace Scribe::Test;

namespace {

QJsonObject readJson(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return {};
    }
    return QJsonDocument::fromJson(file.readAll()).object();
}

} // namespace

class TestKeywordStore : public QObject {
    Q_OBJECT

private slots:
    void init() {
        dir_ = TestUtils::createTempDirectory("keywords");
        QVERIFY(!dir_.isEmpty());
    }

    void cleanup() {
        TestUtils::cleanupTempDirectory(dir_);
    }

    void testMissingFileIsCreatedEmpty() {
        KeywordStore store(dir_ + "/nested");
        QVERIFY(store.loadKeywords().isEmpty());
        ASSERT_FILE_EXISTS(store.keywordsFile());
        QVERIFY(readJson(store.keywordsFile())["keywords"].toArray().isEmpty());
    }

    void testInvalidJsonIsReset() {
        KeywordStore store(dir_);
        TestUtils::createTestTextFile(dir_, "{ not json", "keywords_config.json");

        QVERIFY(store.loadKeywords().isEmpty());
        const QJsonObject repaired = readJson(store.keywordsFile());
        QVERIFY(repaired.contains("keywords"));
        QVERIFY(repaired["keywords"].toArray().isEmpty());
    }

    void testSaveAndLoad() {
        KeywordStore store(dir_);
        ASSERT_EXPECTED_VALUE(store.saveKeywords({"deadline", "budget"}));
        QCOMPARE(store.loadKeywords(), QStringList({"deadline", "budget"}));

        // A second store over the same directory sees the same data.
        KeywordStore other(dir_);
        QCOMPARE(other.loadKeywords(), QStringList({"deadline", "budget"}));
    }

    void testSaveNormalizes() {
        KeywordStore store(dir_);
        ASSERT_EXPECTED_VALUE(store.saveKeywords({"  Deadline ", "deadline", "", "x", "Budget", "BUDGET"}));
        QCOMPARE(store.loadKeywords(), QStringList({"Deadline", "Budget"}));
    }

    void testNormalizeLimits() {
        Config::AnalysisSettings limits;
        limits.maxKeywords = 2;
        limits.minKeywordLength = 3;
        limits.maxKeywordLength = 6;
        KeywordStore store(dir_, limits);

        QCOMPARE(store.normalize({"ab", "abcdefg", "alpha", "ALPHA", "beta", "gamma"}),
                 QStringList({"alpha", "beta"}));
    }

    void testWriteFailureReported() {
        const QString blocker = TestUtils::createTestTextFile(dir_, "file", "blocker");
        KeywordStore store(blocker + "/sub");
        ASSERT_EXPECTED_ERROR(store.saveKeywords({"deadline"}), KeywordStoreError::DirectoryUnavailable);
        QVERIFY(store.loadKeywords().isEmpty());
    }

    void testScenarios() {
        KeywordStore store(dir_);
        QVERIFY(store.loadScenarios().empty());
        ASSERT_FILE_EXISTS(store.scenariosFile());

        KeywordScenario lecture{"lecture", "Lecture", "Course material", {"exam", "Exam", "homework"}};
        KeywordScenario meeting{"meeting", "Meeting", "", {"action item"}};
        ASSERT_EXPECTED_VALUE(store.saveScenarios({lecture, meeting}));

        const auto scenarios = store.loadScenarios();
        QCOMPARE(scenarios.size(), size_t(2));
        QCOMPARE(scenarios[0].id, QString("lecture"));
        QCOMPARE(scenarios[0].keywords, QStringList({"exam", "homework"}));

        auto found = store.scenarioById("meeting");
        QVERIFY(found.has_value());
        QCOMPARE(found->name, QString("Meeting"));
        QVERIFY(!store.scenarioById("missing").has_value());
    }

    void testScenariosWithoutIdAreSkipped() {
        KeywordStore store(dir_);
        TestUtils::createTestTextFile(dir_,
            R"({"scenarios": [{"name": "No id", "keywords": ["a"]}, {"id": "ok", "keywords": ["fine"]}]})",
            "keyword_scenarios.json");
        const auto scenarios = store.loadScenarios();
        QCOMPARE(scenarios.size(), size_t(1));
        QCOMPARE(scenarios[0].id, QString("ok"));
    }

    void testSnapshotPrefersScenario() {
        KeywordStore store(dir_);
        ASSERT_EXPECTED_VALUE(store.saveKeywords({"custom word"}));
        ASSERT_EXPECTED_VALUE(store.saveScenarios({{"lecture", "Lecture", "", {"exam"}},
                                                   {"empty", "Empty", "", {}}}));

        const KeywordSnapshot scenario = store.snapshot("lecture");
        QCOMPARE(scenario.source, QString("lecture"));
        QCOMPARE(scenario.keywords, QStringList({"exam"}));

        const KeywordSnapshot empty = store.snapshot("empty");
        QCOMPARE(empty.source, QString("custom"));
        QCOMPARE(empty.keywords, QStringList({"custom word"}));

        const KeywordSnapshot unknown = store.snapshot("unknown");
        QCOMPARE(unknown.source, QString("custom"));

        const KeywordSnapshot plain = store.snapshot();
        QCOMPARE(plain.source, QString("custom"));
        QCOMPARE(plain.keywords, QStringList({"custom word"}));
    }

    void testSnapshotIsUnaffectedByLaterSaves() {
        KeywordStore store(dir_);
        ASSERT_EXPECTED_VALUE(store.saveKeywords({"first"}));
        const KeywordSnapshot snapshot = store.snapshot();
        ASSERT_EXPECTED_VALUE(store.saveKeywords({"second"}));
        QCOMPARE(snapshot.keywords, QStringList({"first"}));
    }

private:
    QString dir_;
};

int runTestKeywordStore(int argc, char** argv) {
    TestKeywordStore test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_keyword_store.moc"
