#pragma once

#include <QtCore/QString>

namespace Scribe {

enum class MediaError {
    FileNotFound,
    ProbeFailed,
    DurationUnavailable,
    TranscoderNotFound,
    TranscodeFailed,
    OutputMissing,
    Timeout,
    Cancelled
};

QString mediaErrorToString(MediaError error);

/**
 * @brief One contiguous slice of the source media.
 *
 * Specs produced for a file are contiguous and cover [0, duration) exactly.
 */
struct ChunkSpec {
    int index = 0;
    double startTime = 0.0;
    double duration = 0.0;
    QString name;        // e.g. lecture_part_002.mp4, used in transcript markers
    QString outputPath;

    double end() const { return startTime + duration; }
};

// Codec settings for one transcoder invocation.
struct EncodingOptions {
    bool audioOnly = false;
    QString videoCodec;
    QString audioCodec;
    int sampleRate = 0;     // 0 keeps the source rate
    int channels = 0;       // 0 keeps the source layout

    static EncodingOptions chunkVideo(const QString& videoCodec, const QString& audioCodec) {
        EncodingOptions options;
        options.videoCodec = videoCodec;
        options.audioCodec = audioCodec;
        return options;
    }

    static EncodingOptions speechAudio(const QString& audioCodec, int sampleRate, int channels) {
        EncodingOptions options;
        options.audioOnly = true;
        options.audioCodec = audioCodec;
        options.sampleRate = sampleRate;
        options.channels = channels;
        return options;
    }
};

} // namespace Scribe
