#include "TestUtils.hpp"
#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QRandomGenerator>
#include <QtCore/QTextStream>
#include <QtTest/QTest>

namespace Scribe {
namespace Test {

QTemporaryDir* TestUtils::tempDir_ = nullptr;

TestUtils::TestUtils(QObject* parent) : QObject(parent) {
}

TestUtils::~TestUtils() = default;

void TestUtils::initializeTestEnvironment() {
    if (!tempDir_) {
        tempDir_ = new QTemporaryDir();
        if (!tempDir_->isValid()) {
            qFatal("Failed to create temporary directory for tests");
        }
    }

    qputenv("SCRIBE_TEST_MODE", "1");
    logMessage("Test environment initialized");
}

void TestUtils::cleanupTestEnvironment() {
    if (tempDir_) {
        delete tempDir_;
        tempDir_ = nullptr;
    }
}

QString TestUtils::createTempDirectory(const QString& prefix) {
    if (!tempDir_) {
        initializeTestEnvironment();
    }

    const QString dirName = QString("%1_%2_%3")
                           .arg(prefix)
                           .arg(QDateTime::currentMSecsSinceEpoch())
                           .arg(QRandomGenerator::global()->generate());
    const QString fullPath = tempDir_->path() + "/" + dirName;

    QDir dir;
    if (!dir.mkpath(fullPath)) {
        return QString();
    }
    return fullPath;
}

void TestUtils::cleanupTempDirectory(const QString& path) {
    QDir dir(path);
    if (dir.exists()) {
        dir.removeRecursively();
    }
}

QString TestUtils::createTestTextFile(const QString& directory, const QString& content, const QString& filename) {
    const QString filePath = directory + "/" + filename;

    QFile file(filePath);
    if (file.open(QIODevice::WriteOnly | QIODevice::Text)) {
        QTextStream stream(&file);
        stream << content;
        file.close();
    }
    return filePath;
}

QString TestUtils::createSizedFile(const QString& path, qint64 bytes) {
    QFile file(path);
    if (file.open(QIODevice::WriteOnly)) {
        file.write(QByteArray(static_cast<int>(bytes), 'x'));
        file.close();
    }
    return path;
}

bool TestUtils::waitForCondition(std::function<bool()> condition, int timeoutMs, int checkIntervalMs) {
    QElapsedTimer timer;
    timer.start();

    while (timer.elapsed() < timeoutMs) {
        if (condition()) {
            return true;
        }
        QTest::qWait(checkIntervalMs);
    }
    return condition();
}

void TestUtils::assertFileExists(const QString& filePath, const QString& context) {
    if (!QFileInfo::exists(filePath)) {
        QString message = QString("File does not exist: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" (context: %1)").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

void TestUtils::assertFileNotExists(const QString& filePath, const QString& context) {
    if (QFileInfo::exists(filePath)) {
        QString message = QString("File should not exist: %1").arg(filePath);
        if (!context.isEmpty()) {
            message += QString(" (context: %1)").arg(context);
        }
        QFAIL(qPrintable(message));
    }
}

void TestUtils::logMessage(const QString& message) {
    SCRIBE_DEBUG("[test] {}", message.toStdString());
}

} // namespace Test
} // namespace Scribe
