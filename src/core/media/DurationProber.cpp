#include "DurationProber.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <algorithm>

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace Scribe {

Expected<double, MediaError> FFmpegDurationProber::probe(const QString& mediaPath) {
    QFileInfo fileInfo(mediaPath);
    if (!fileInfo.exists() || !fileInfo.isFile()) {
        SCRIBE_ERROR("Media file not found: {}", mediaPath.toStdString());
        return makeUnexpected(MediaError::FileNotFound);
    }

    AVFormatContext* formatContext = nullptr;
    int ret = avformat_open_input(&formatContext, mediaPath.toUtf8().constData(), nullptr, nullptr);
    if (ret < 0) {
        SCRIBE_ERROR("Failed to open input file: {} ({})",
                     mediaPath.toStdString(), avErrorString(ret).toStdString());
        return makeUnexpected(MediaError::ProbeFailed);
    }

    ret = avformat_find_stream_info(formatContext, nullptr);
    if (ret < 0) {
        avformat_close_input(&formatContext);
        SCRIBE_ERROR("Failed to find stream info: {}", avErrorString(ret).toStdString());
        return makeUnexpected(MediaError::ProbeFailed);
    }

    // Some containers only carry per-stream durations.
    double duration = -1.0;
    if (formatContext->duration != AV_NOPTS_VALUE) {
        duration = static_cast<double>(formatContext->duration) / AV_TIME_BASE;
    } else {
        for (unsigned int i = 0; i < formatContext->nb_streams; ++i) {
            const AVStream* stream = formatContext->streams[i];
            if (stream->duration != AV_NOPTS_VALUE) {
                duration = std::max(duration, stream->duration * av_q2d(stream->time_base));
            }
        }
    }
    avformat_close_input(&formatContext);

    if (!(duration > 0.0)) {
        SCRIBE_ERROR("Could not determine duration of {}", mediaPath.toStdString());
        return makeUnexpected(MediaError::DurationUnavailable);
    }

    SCRIBE_DEBUG("Probed {}: {:.2f}s", mediaPath.toStdString(), duration);
    return duration;
}

QString FFmpegDurationProber::avErrorString(int averror) {
    char errorBuffer[AV_ERROR_MAX_STRING_SIZE];
    av_strerror(averror, errorBuffer, AV_ERROR_MAX_STRING_SIZE);
    return QString::fromUtf8(errorBuffer);
}

} // namespace Scribe
