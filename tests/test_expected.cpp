#include <QtTest/QtTest>
#include <memory>
#include "core/common/Expected.hpp"
#include "utils/TestUtils.hpp"

using namespace Scribe;
using namespace Scribe::Test;

namespace {

enum class ParseError { Empty, NotANumber };

struct DetailedError {
    int code = 0;
    QString message;
};

Expected<int, ParseError> parseNumber(const QString& text) {
    if (text.isEmpty()) {
        return makeUnexpected(ParseError::Empty);
    }
    bool ok = false;
    const int value = text.toInt(&ok);
    if (!ok) {
        return makeUnexpected(ParseError::NotANumber);
    }
    return value;
}

} // namespace

class TestExpected : public QObject {
    Q_OBJECT

private slots:
    void testValueConstruction() {
        Expected<int, QString> result(42);

        QVERIFY(result.hasValue());
        QVERIFY(!result.hasError());
        QVERIFY(static_cast<bool>(result));
        QCOMPARE(result.value(), 42);
    }

    void testErrorConstruction() {
        Expected<int, QString> result = makeUnexpected(QString("Error occurred"));

        QVERIFY(!result.hasValue());
        QVERIFY(result.hasError());
        QCOMPARE(result.error(), QString("Error occurred"));
    }

    void testStringValueIsNotAnError() {
        // Same type for value and error: only makeUnexpected produces an error.
        Expected<QString, QString> result(QString("payload"));
        QVERIFY(result.hasValue());
        QCOMPARE(result.value(), QString("payload"));
    }

    void testWrongAccessThrows() {
        Expected<int, QString> success(1);
        QVERIFY_EXCEPTION_THROWN(success.error(), BadExpectedAccess);

        Expected<int, QString> failure = makeUnexpected(QString("bad"));
        QVERIFY_EXCEPTION_THROWN(failure.value(), BadExpectedAccess);
    }

    void testMonadicOperations() {
        Expected<int, QString> success(10);

        auto doubled = success.transform([](int x) { return x * 2; });
        QVERIFY(doubled.hasValue());
        QCOMPARE(doubled.value(), 20);

        Expected<int, QString> failure = makeUnexpected(QString("Failed"));
        auto failedTransform = failure.transform([](int x) { return x * 2; });
        QVERIFY(failedTransform.hasError());
        QCOMPARE(failedTransform.error(), QString("Failed"));
    }

    void testAndThenChains() {
        auto chained = parseNumber("21").andThen([](int value) -> Expected<int, ParseError> {
            return value * 2;
        });
        QCOMPARE(chained.value(), 42);

        auto stopped = parseNumber("abc").andThen([](int value) -> Expected<int, ParseError> {
            return value * 2;
        });
        QVERIFY(stopped.hasError());
        QCOMPARE(stopped.error(), ParseError::NotANumber);
    }

    void testTransformError() {
        auto mapped = parseNumber("").transformError([](ParseError error) {
            return error == ParseError::Empty ? QString("empty") : QString("other");
        });
        QVERIFY(mapped.hasError());
        QCOMPARE(mapped.error(), QString("empty"));
    }

    void testValueOr() {
        Expected<int, QString> success(42);
        QCOMPARE(success.valueOr(0), 42);

        Expected<int, QString> failure = makeUnexpected(QString("Error"));
        QCOMPARE(failure.valueOr(99), 99);
    }

    void testVoidSpecialization() {
        Expected<void, ParseError> ok;
        QVERIFY(ok.hasValue());

        Expected<void, ParseError> failed = makeUnexpected(ParseError::Empty);
        QVERIFY(failed.hasError());
        QCOMPARE(failed.error(), ParseError::Empty);

        failed = ok;
        QVERIFY(failed.hasValue());
    }

    void testMoveOnlyValue() {
        Expected<std::unique_ptr<int>, QString> owned(std::make_unique<int>(7));
        QVERIFY(owned.hasValue());
        std::unique_ptr<int> taken = std::move(owned).value();
        QCOMPARE(*taken, 7);
    }

    void testCopySemantics() {
        Expected<int, QString> original(123);
        Expected<int, QString> copy = original;

        QVERIFY(copy.hasValue());
        QCOMPARE(copy.value(), 123);

        // Original should still be valid
        QVERIFY(original.hasValue());
        QCOMPARE(original.value(), 123);

        Expected<int, QString> error = makeUnexpected(QString("x"));
        copy = error;
        QVERIFY(copy.hasError());
        QCOMPARE(copy.error(), QString("x"));
    }

    void testDescribeEnumAndStructErrors() {
        QCOMPARE(TestUtils::describeError(ParseError::NotANumber), QString("error code 1"));
        QCOMPARE(TestUtils::describeError(DetailedError{7, "disk full"}), QString("error: disk full"));

        Expected<int, DetailedError> ok(5);
        ASSERT_EXPECTED_VALUE(ok);
        Expected<void, DetailedError> done;
        ASSERT_EXPECTED_VALUE(done);
        ASSERT_EXPECTED_ERROR(parseNumber("abc"), ParseError::NotANumber);
    }
};

int runTestExpected(int argc, char** argv) {
    TestExpected test;
    return QTest::qExec(&test, argc, argv);
}

#include "test_expected.moc"
