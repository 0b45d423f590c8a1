#include <QtTest/QtTest>
#include <algorithm>
#include <limits>
#include "core/storage/MemoryManager.hpp"
#include "core/storage/WorkerPoolSizer.hpp"
#include "utils/MockComponents.hpp"

using namespace Scribe;
using namespace Scribe::Test;

class TestMemoryManager : public QObject {
    Q_OBJECT

private slots:
    void testSizingFormula_data() {
        QTest::addColumn<double>("availableGb");
        QTest::addColumn<int>("cpus");
        QTest::addColumn<int>("expected");

        // budget = floor((available - 2.0) / 0.6), cap 6, floor 2
        QTest::newRow("plenty of memory, cpu bound") << 32.0 << 4 << 4;
        QTest::newRow("plenty of memory, cap bound") << 32.0 << 16 << 6;
        QTest::newRow("memory bound") << 4.0 << 16 << 3;
        QTest::newRow("below reserve uses min") << 1.0 << 16 << 2;
        QTest::newRow("zero memory uses min") << 0.0 << 16 << 2;
        QTest::newRow("single cpu still min") << 32.0 << 1 << 2;
    }

    void testSizingFormula() {
        QFETCH(double, availableGb);
        QFETCH(int, cpus);
        QFETCH(int, expected);

        QCOMPARE(computeOptimalWorkers(availableGb, cpus, WorkerPoolConfig()), expected);
    }

    void testWorkerBoundHoldsForAnyInput() {
        const double memoryInputs[] = {
            0.0, 0.1, 1.9, 2.0, 2.6, 5.0, 64.0, 1e9, -3.0,
            std::numeric_limits<double>::quiet_NaN(),
            std::numeric_limits<double>::infinity()
        };
        WorkerPoolConfig config;
        for (int cpus : {0, 1, 2, 3, 8, 64}) {
            for (double memory : memoryInputs) {
                const int workers = computeOptimalWorkers(memory, cpus, config);
                QVERIFY(workers >= config.minWorkers);
                QVERIFY(workers <= std::max(cpus, config.maxWorkersCap));
            }
        }
    }

    void testNonFiniteMemoryTreatedAsZero() {
        WorkerPoolConfig config;
        QCOMPARE(computeOptimalWorkers(std::numeric_limits<double>::quiet_NaN(), 8, config), 2);
        QCOMPARE(computeOptimalWorkers(-10.0, 8, config), 2);
    }

    void testMemoryPressure() {
        WorkerPoolConfig config;
        QVERIFY(!isUnderMemoryPressure(75.0, config));
        QVERIFY(isUnderMemoryPressure(75.5, config));

        auto telemetry = std::make_shared<FakeMemoryTelemetry>(8.0, 4, 50.0);
        MemoryManager manager(telemetry, config);
        QVERIFY(!manager.checkMemoryPressure());
        telemetry->setUsedPercent(90.0);
        QVERIFY(manager.checkMemoryPressure());
    }

    void testOptimalWorkersUsesFreshTelemetry() {
        auto telemetry = std::make_shared<FakeMemoryTelemetry>(32.0, 8, 30.0);
        MemoryManager manager(telemetry);

        QCOMPARE(manager.getOptimalWorkers(), 6);
        telemetry->setAvailableGb(3.3);
        QCOMPARE(manager.getOptimalWorkers(), 2);
        QCOMPARE(telemetry->snapshots(), 2);
    }

    void testRecommendations() {
        auto telemetry = std::make_shared<FakeMemoryTelemetry>(1.5, 8, 95.0);
        MemoryManager manager(telemetry);

        const auto recommendations = manager.getMemoryRecommendations();
        QStringList keys;
        for (const auto& recommendation : recommendations) {
            keys << memoryRecommendationKey(recommendation.type);
            QVERIFY(!recommendation.message.isEmpty());
        }
        QCOMPARE(keys, QStringList({"critical", "low_memory", "worker_limit"}));

        telemetry->setAvailableGb(20.0);
        telemetry->setUsedPercent(85.0);
        telemetry->setCpuCount(4);
        QStringList relaxed;
        for (const auto& recommendation : manager.getMemoryRecommendations()) {
            relaxed << memoryRecommendationKey(recommendation.type);
        }
        QCOMPARE(relaxed, QStringList({"warning"}));
    }

    void testProcTelemetryIsSane() {
        ProcMemoryTelemetry telemetry;
        const MemoryInfo info = telemetry.snapshot();
        QVERIFY(info.systemTotalGb > 0.0);
        QVERIFY(info.systemAvailableGb >= 0.0);
        QVERIFY(info.systemUsedPercent >= 0.0 && info.systemUsedPercent <= 100.0);
        QVERIFY(telemetry.cpuCount() >= 1);
    }
};

int runTestMemoryManager(int argc, char** argv) {
    TestMemoryManager test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_memory_manager.moc"
