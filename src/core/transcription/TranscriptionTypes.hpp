#pragma once

#include <QtCore/QJsonObject>
#include <QtCore/QString>
#include <vector>

#include "core/common/Expected.hpp"
#include "core/media/MediaTypes.hpp"

namespace Scribe {

// HH:MM:SS, hours not wrapped at 24.
QString formatTimestamp(double seconds);

// A transcribed span with absolute timestamps in seconds.
struct Segment {
    double start = 0.0;
    double end = 0.0;
    QString text;
    QString displayTimestamp;   // formatTimestamp(start)
    float confidence = 0.0f;

    bool isWellFormed() const;
    QJsonObject toJson() const;
};

struct ChunkResult {
    int chunkIndex = 0;
    QString chunkName;
    double startTime = 0.0;     // equals the ChunkSpec start time
    double duration = 0.0;
    std::vector<Segment> segments;
    QString transcriptText;
    QString language;
    double processingSeconds = 0.0;
    bool success = true;
    QString error;

    QJsonObject toJson() const;
};

enum class ChunkStage {
    Extraction,
    Audio,
    Transcription,
    Timeout,
    Cancelled
};

QString chunkStageName(ChunkStage stage);

struct ChunkError {
    int chunkIndex = 0;
    QString chunkName;
    double startTime = 0.0;
    double duration = 0.0;
    ChunkStage stage = ChunkStage::Transcription;
    QString message;

    // Failed ChunkResult for reporting.
    ChunkResult toResult() const;
};

using ChunkOutcome = Expected<ChunkResult, ChunkError>;

ChunkError makeChunkError(const ChunkSpec& chunk, ChunkStage stage, const QString& message);

enum class ModelError {
    ModelNotFound,
    ModelLoadFailed,
    AudioLoadFailed,
    InvalidAudio,
    InferenceFailed,
    Timeout,
    Cancelled
};

QString modelErrorToString(ModelError error);

// Segment relative to the start of the audio it came from.
struct ModelSegment {
    double start = 0.0;
    double end = 0.0;
    QString text;
    float confidence = 0.0f;
};

struct ModelTranscript {
    QString text;
    QString language;
    std::vector<ModelSegment> segments;
};

struct TranscribeOptions {
    QString language = "auto";
    bool wordTimestamps = true;
    int threads = 0;            // 0 = model default
};

} // namespace Scribe
