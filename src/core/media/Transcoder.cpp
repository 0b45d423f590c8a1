#include "Transcoder.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QProcess>
#include <QtCore/QStringList>

namespace Scribe {

namespace {

constexpr int kStartTimeoutMs = 10000;
constexpr int kPollIntervalMs = 200;

QString formatSeconds(double seconds) {
    return QString::number(seconds, 'f', 3);
}

} // namespace

FFmpegTranscoder::FFmpegTranscoder(QString ffmpegProgram)
    : program_(std::move(ffmpegProgram)) {
}

QStringList FFmpegTranscoder::buildArguments(const QString& inputPath,
                                             double start,
                                             std::optional<double> duration,
                                             const QString& outputPath,
                                             const EncodingOptions& options) {
    QStringList arguments;
    arguments << "-hide_banner" << "-loglevel" << "error" << "-nostdin";
    if (start > 0.0) {
        arguments << "-ss" << formatSeconds(start);
    }
    arguments << "-i" << inputPath;
    if (duration) {
        arguments << "-t" << formatSeconds(*duration);
    }

    if (options.audioOnly) {
        arguments << "-vn";
    } else if (!options.videoCodec.isEmpty()) {
        arguments << "-c:v" << options.videoCodec;
    }
    if (!options.audioCodec.isEmpty()) {
        arguments << "-c:a" << options.audioCodec;
    }
    if (options.sampleRate > 0) {
        arguments << "-ar" << QString::number(options.sampleRate);
    }
    if (options.channels > 0) {
        arguments << "-ac" << QString::number(options.channels);
    }

    arguments << "-y" << outputPath;
    return arguments;
}

Expected<void, MediaError> FFmpegTranscoder::extract(const QString& inputPath,
                                                     double start,
                                                     std::optional<double> duration,
                                                     const QString& outputPath,
                                                     const EncodingOptions& options,
                                                     const WorkLimit& limit) {
    if (!QFileInfo::exists(inputPath)) {
        SCRIBE_ERROR("Transcoder input not found: {}", inputPath.toStdString());
        return makeUnexpected(MediaError::FileNotFound);
    }
    if (limit.cancelled()) {
        return makeUnexpected(MediaError::Cancelled);
    }

    const QStringList arguments = buildArguments(inputPath, start, duration, outputPath, options);

    QProcess ffmpeg;
    ffmpeg.setProcessChannelMode(QProcess::SeparateChannels);
    ffmpeg.start(program_, arguments);

    if (!ffmpeg.waitForStarted(kStartTimeoutMs)) {
        SCRIBE_ERROR("Failed to start {}: {}", program_.toStdString(),
                     ffmpeg.errorString().toStdString());
        return makeUnexpected(MediaError::TranscoderNotFound);
    }

    // Poll so that a deadline or a cancellation can kill a long encode.
    while (!ffmpeg.waitForFinished(kPollIntervalMs)) {
        if (ffmpeg.state() == QProcess::NotRunning) {
            break;
        }
        if (limit.stopRequested()) {
            const bool cancelled = limit.cancelled();
            ffmpeg.kill();
            ffmpeg.waitForFinished(kStartTimeoutMs);
            QFile::remove(outputPath);
            SCRIBE_WARN("ffmpeg {} for {} [{:.1f}s]", cancelled ? "cancelled" : "timed out",
                        inputPath.toStdString(), start);
            return makeUnexpected(cancelled ? MediaError::Cancelled : MediaError::Timeout);
        }
    }

    if (ffmpeg.exitStatus() != QProcess::NormalExit || ffmpeg.exitCode() != 0) {
        const QString error = QString::fromUtf8(ffmpeg.readAllStandardError()).trimmed();
        SCRIBE_ERROR("ffmpeg failed for {} [{:.1f}s]: {}", inputPath.toStdString(), start,
                     error.toStdString());
        QFile::remove(outputPath);
        return makeUnexpected(MediaError::TranscodeFailed);
    }

    const QFileInfo output(outputPath);
    if (!output.exists() || output.size() == 0) {
        SCRIBE_ERROR("ffmpeg produced no output at {}", outputPath.toStdString());
        QFile::remove(outputPath);
        return makeUnexpected(MediaError::OutputMissing);
    }

    SCRIBE_DEBUG("Transcoded {} -> {}", inputPath.toStdString(), outputPath.toStdString());
    return {};
}

} // namespace Scribe
