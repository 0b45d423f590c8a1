#include <QtTest/QtTest>
#include <cmath>
#include <limits>
#include "core/media/ChunkPlanner.hpp"

using namespace Scribe;

class TestChunkPlanner : public QObject {
    Q_OBJECT

private:
    static void verifyCoverage(const std::vector<ChunkSpec>& specs, double duration) {
        QVERIFY(!specs.empty());
        QCOMPARE(specs.front().startTime, 0.0);
        for (size_t i = 0; i < specs.size(); ++i) {
            QCOMPARE(specs[i].index, static_cast<int>(i));
            QVERIFY(specs[i].duration > 0.0);
            if (i + 1 < specs.size()) {
                QCOMPARE(specs[i].end(), specs[i + 1].startTime);
            }
        }
        QVERIFY(std::abs(specs.back().end() - duration) < 1e-9);
    }

private slots:
    void testExampleScenario() {
        ChunkPlanner planner;
        auto plan = planner.plan(650.0, "/media/lecture.mp4", "/work");
        QVERIFY(plan.hasValue());

        const auto& specs = plan.value();
        QCOMPARE(specs.size(), size_t(3));
        QCOMPARE(specs[0].startTime, 0.0);
        QCOMPARE(specs[0].duration, 300.0);
        QCOMPARE(specs[1].startTime, 300.0);
        QCOMPARE(specs[2].startTime, 600.0);
        QCOMPARE(specs[2].duration, 50.0);
        QCOMPARE(specs[1].name, QString("lecture_part_001.mp4"));
        QCOMPARE(specs[1].outputPath, QString("/work/lecture_part_001.mp4"));
    }

    void testEffectiveChunkSeconds_data() {
        QTest::addColumn<double>("duration");
        QTest::addColumn<int>("requested");
        QTest::addColumn<int>("expected");

        QTest::newRow("short media capped") << 300.0 << 300 << 180;
        QTest::newRow("short media below cap") << 300.0 << 90 << 90;
        QTest::newRow("medium uses configured") << 1800.0 << 300 << 300;
        QTest::newRow("long media capped") << 7200.0 << 600 << 420;
        QTest::newRow("request clamped to min") << 1800.0 << 10 << 60;
        QTest::newRow("request clamped to max") << 1800.0 << 900 << 600;
        QTest::newRow("threshold itself is not short") << 600.0 << 300 << 300;
        QTest::newRow("threshold itself is not long") << 3600.0 << 600 << 600;
    }

    void testEffectiveChunkSeconds() {
        QFETCH(double, duration);
        QFETCH(int, requested);
        QFETCH(int, expected);

        ChunkPlanner planner;
        QCOMPARE(planner.effectiveChunkSeconds(duration, requested), expected);
    }

    void testCoverage_data() {
        QTest::addColumn<double>("duration");
        QTest::newRow("tiny") << 0.25;
        QTest::newRow("exact multiple") << 900.0;
        QTest::newRow("fractional") << 1234.567;
        QTest::newRow("short") << 59.9;
        QTest::newRow("long") << 10000.0;
    }

    void testCoverage() {
        QFETCH(double, duration);

        ChunkPlanner planner;
        auto plan = planner.plan(duration, "clip.mkv", QString());
        QVERIFY(plan.hasValue());
        verifyCoverage(plan.value(), duration);

        const int chunkSeconds = planner.effectiveChunkSeconds(duration);
        QCOMPARE(static_cast<int>(plan.value().size()),
                 static_cast<int>(std::ceil(duration / chunkSeconds)));
    }

    void testInvalidDurations() {
        ChunkPlanner planner;
        QCOMPARE(planner.plan(0.0, "a.mp4", "/w").error(), PlanError::DurationUnknown);
        QCOMPARE(planner.plan(-5.0, "a.mp4", "/w").error(), PlanError::DurationUnknown);
        QCOMPARE(planner.plan(std::numeric_limits<double>::quiet_NaN(), "a.mp4", "/w").error(),
                 PlanError::DurationUnknown);
        QCOMPARE(planner.plan(std::numeric_limits<double>::infinity(), "a.mp4", "/w").error(),
                 PlanError::DurationUnknown);
    }

    void testAbsurdDurationIsRejected() {
        ChunkPlanner planner;
        QCOMPARE(planner.plan(1e300, "a.mp4", "/w").error(), PlanError::TooManyChunks);

        const double limit = static_cast<double>(ChunkPlanner::kMaxChunks) * 120.0;
        auto plan = planner.plan(limit, "a.mp4", "/w", 120);
        QVERIFY(plan.hasValue());
        QCOMPARE(static_cast<int>(plan.value().size()), ChunkPlanner::kMaxChunks);
        QCOMPARE(planner.plan(limit + 1.0, "a.mp4", "/w", 120).error(), PlanError::TooManyChunks);
    }

    void testSwappedBoundsAreTolerated() {
        Config::ChunkingSettings settings;
        settings.minSeconds = 600;
        settings.maxSeconds = 60;
        settings.defaultSeconds = 300;
        settings.shortMediaThreshold = 0.0;
        settings.longMediaThreshold = 1e9;
        ChunkPlanner planner(settings);

        QCOMPARE(planner.effectiveChunkSeconds(3600.0), 300);
        QCOMPARE(planner.effectiveChunkSeconds(3600.0, 10), 60);
        QCOMPARE(planner.effectiveChunkSeconds(3600.0, 5000), 600);
        QVERIFY(planner.plan(3600.0, "a.mp4", "/w").hasValue());
    }

    void testRequestedOverride() {
        ChunkPlanner planner;
        auto plan = planner.plan(1800.0, "talk.wav", "/w", 120);
        QVERIFY(plan.hasValue());
        QCOMPARE(plan.value().size(), size_t(15));
    }

    void testChunkFileName() {
        QCOMPARE(ChunkPlanner::chunkFileName("show", 7), QString("show_part_007.mp4"));
        QCOMPARE(ChunkPlanner::chunkFileName("show", 1234), QString("show_part_1234.mp4"));
    }
};

int runTestChunkPlanner(int argc, char** argv) {
    TestChunkPlanner test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_chunk_planner.moc"
