#include <QtTest/QtTest>
#include <QtConcurrent/QtConcurrent>
#include <algorithm>
#include <limits>
#include "core/transcription/ResultAggregator.hpp"
#include "utils/TestUtils.hpp"

using namespace Scribe;
using namespace Scribe::Test;

namespace {

ChunkResult makeResult(int index, double start, const QString& text) {
    ChunkResult result;
    result.chunkIndex = index;
    result.chunkName = QString("lecture_part_%1.mp4").arg(index, 3, 10, QChar('0'));
    result.startTime = start;
    result.duration = 300.0;
    result.transcriptText = text;
    result.language = "en";

    Segment segment;
    segment.start = start + 1.0;
    segment.end = start + 4.0;
    segment.text = text;
    segment.displayTimestamp = formatTimestamp(segment.start);
    result.segments.push_back(segment);
    return result;
}

ChunkError makeFailure(int index, double start) {
    ChunkError error;
    error.chunkIndex = index;
    error.chunkName = QString("lecture_part_%1.mp4").arg(index, 3, 10, QChar('0'));
    error.startTime = start;
    error.duration = 300.0;
    error.stage = ChunkStage::Transcription;
    error.message = "inference failed";
    return error;
}

} // namespace

class TestResultAggregator : public QObject {
    Q_OBJECT

private slots:
    void testMergeIsIndependentOfCompletionOrder() {
        const std::vector<ChunkResult> results = {
            makeResult(0, 0.0, "first part"),
            makeResult(1, 300.0, "second part"),
            makeResult(2, 600.0, "third part")
        };

        std::vector<int> order = {0, 1, 2};
        QString reference;
        int permutations = 0;
        do {
            ResultAggregator aggregator;
            for (int index : order) {
                aggregator.add(results[index]);
            }
            auto merged = aggregator.merge();
            ASSERT_EXPECTED_VALUE(merged);
            if (reference.isEmpty()) {
                reference = merged->transcript;
            }
            QCOMPARE(merged->transcript, reference);
            QCOMPARE(merged->chunks.front().chunkIndex, 0);
            QCOMPARE(merged->chunks.back().chunkIndex, 2);
            QCOMPARE(merged->segments.size(), size_t(3));
            QCOMPARE(merged->segments[1].start, 301.0);
            ++permutations;
        } while (std::next_permutation(order.begin(), order.end()));

        QCOMPARE(permutations, 6);
        QVERIFY(reference.indexOf("first part") < reference.indexOf("second part"));
        QVERIFY(reference.indexOf("second part") < reference.indexOf("third part"));
    }

    void testBlockFormat() {
        ResultAggregator aggregator;
        aggregator.add(makeResult(1, 300.0, "second"));
        aggregator.add(makeResult(0, 0.0, "first"));

        auto merged = aggregator.merge();
        ASSERT_EXPECTED_VALUE(merged);
        const QString expected =
            QString("\n\n--- lecture_part_000.mp4 [00:00:00] ---\n\nfirst") + "\n" +
            QString("\n\n--- lecture_part_001.mp4 [00:05:00] ---\n\nsecond");
        QCOMPARE(merged->transcript, expected);
        QCOMPARE(merged->totalWords, ResultAggregator::countWords(expected));
    }

    void testEqualStartTimesOrderByIndex() {
        ResultAggregator aggregator;
        aggregator.add(makeResult(4, 0.0, "later index"));
        aggregator.add(makeResult(2, 0.0, "earlier index"));

        auto merged = aggregator.merge();
        ASSERT_EXPECTED_VALUE(merged);
        QCOMPARE(merged->chunks[0].chunkIndex, 2);
        QCOMPARE(merged->chunks[1].chunkIndex, 4);
    }

    void testFailuresAreExcludedFromMerge() {
        ResultAggregator aggregator;
        aggregator.add(makeResult(0, 0.0, "chunk zero"));
        aggregator.add(makeUnexpected(makeFailure(1, 300.0)));
        aggregator.add(makeResult(2, 600.0, "chunk two"));

        QCOMPARE(aggregator.successCount(), 2);
        QCOMPARE(aggregator.failureCount(), 1);

        auto merged = aggregator.merge();
        ASSERT_EXPECTED_VALUE(merged);
        QVERIFY(merged->transcript.contains("chunk zero"));
        QVERIFY(merged->transcript.contains("chunk two"));
        QVERIFY(!merged->transcript.contains("lecture_part_001"));
        QVERIFY(merged->transcript.indexOf("chunk zero") < merged->transcript.indexOf("chunk two"));

        const auto failures = aggregator.failures();
        QCOMPARE(failures.size(), size_t(1));
        QCOMPARE(failures[0].chunkIndex, 1);

        const ChunkResult reported = failures[0].toResult();
        QVERIFY(!reported.success);
        QCOMPARE(reported.error, QString("transcription: inference failed"));
    }

    void testFailuresSortedByIndex() {
        ResultAggregator aggregator;
        aggregator.add(makeUnexpected(makeFailure(3, 900.0)));
        aggregator.add(makeUnexpected(makeFailure(1, 300.0)));
        const auto failures = aggregator.failures();
        QCOMPARE(failures[0].chunkIndex, 1);
        QCOMPARE(failures[1].chunkIndex, 3);
    }

    void testMalformedSegmentRejected_data() {
        QTest::addColumn<double>("start");
        QTest::addColumn<double>("end");

        QTest::newRow("end before start") << 10.0 << 5.0;
        QTest::newRow("negative start") << -1.0 << 2.0;
        QTest::newRow("nan") << std::numeric_limits<double>::quiet_NaN() << 2.0;
        QTest::newRow("infinite end") << 1.0 << std::numeric_limits<double>::infinity();
    }

    void testMalformedSegmentRejected() {
        QFETCH(double, start);
        QFETCH(double, end);

        ChunkResult result = makeResult(0, 0.0, "broken");
        result.segments[0].start = start;
        result.segments[0].end = end;

        ResultAggregator aggregator;
        aggregator.add(result);
        ASSERT_EXPECTED_ERROR(aggregator.merge(), AggregationError::MalformedSegment);
    }

    void testEmptyMerge() {
        ResultAggregator aggregator;
        auto merged = aggregator.merge();
        ASSERT_EXPECTED_VALUE(merged);
        QVERIFY(merged->transcript.isEmpty());
        QCOMPARE(merged->totalWords, 0);
    }

    void testConcurrentAdd() {
        ResultAggregator aggregator;
        QList<QFuture<void>> futures;
        for (int i = 0; i < 16; ++i) {
            futures << QtConcurrent::run([&aggregator, i]() {
                aggregator.add(makeResult(i, i * 300.0, QString("part %1").arg(i)));
            });
        }
        for (auto& future : futures) {
            future.waitForFinished();
        }

        auto merged = aggregator.merge();
        ASSERT_EXPECTED_VALUE(merged);
        QCOMPARE(merged->chunks.size(), size_t(16));
        for (size_t i = 0; i < merged->chunks.size(); ++i) {
            QCOMPARE(merged->chunks[i].chunkIndex, static_cast<int>(i));
        }
    }

    void testCountWords() {
        QCOMPARE(ResultAggregator::countWords(""), 0);
        QCOMPARE(ResultAggregator::countWords("  one\ttwo\n\nthree  "), 3);
        QCOMPARE(ResultAggregator::countWords("--- a [00:00:00] ---"), 4);
    }

    void testFormatTimestamp() {
        QCOMPARE(formatTimestamp(0.0), QString("00:00:00"));
        QCOMPARE(formatTimestamp(600.0), QString("00:10:00"));
        QCOMPARE(formatTimestamp(3725.9), QString("01:02:05"));
        QCOMPARE(formatTimestamp(90000.0), QString("25:00:00"));
    }
};

int runTestResultAggregator(int argc, char** argv) {
    TestResultAggregator test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_result_aggregator.moc"
