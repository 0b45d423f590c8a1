#include "TranscriptionTypes.hpp"

#include <cmath>

namespace Scribe {

QString formatTimestamp(double seconds) {
    if (!std::isfinite(seconds) || seconds < 0.0) {
        seconds = 0.0;
    }
    const auto total = static_cast<qint64>(seconds);
    const qint64 hours = total / 3600;
    const qint64 minutes = (total % 3600) / 60;
    const qint64 secs = total % 60;
    return QString("%1:%2:%3")
        .arg(hours, 2, 10, QChar('0'))
        .arg(minutes, 2, 10, QChar('0'))
        .arg(secs, 2, 10, QChar('0'));
}

bool Segment::isWellFormed() const {
    return std::isfinite(start) && std::isfinite(end) && start >= 0.0 && end >= start;
}

QJsonObject Segment::toJson() const {
    QJsonObject json;
    json["start"] = start;
    json["end"] = end;
    json["text"] = text;
    json["timestamp"] = displayTimestamp;
    json["confidence"] = static_cast<double>(confidence);
    return json;
}

QJsonObject ChunkResult::toJson() const {
    QJsonObject json;
    json["chunk_index"] = chunkIndex;
    json["chunk_name"] = chunkName;
    json["start_time"] = startTime;
    json["duration"] = duration;
    json["success"] = success;
    json["segment_count"] = static_cast<int>(segments.size());
    json["processing_seconds"] = processingSeconds;
    if (!language.isEmpty()) {
        json["language"] = language;
    }
    if (!success) {
        json["error"] = error;
    }
    return json;
}

QString chunkStageName(ChunkStage stage) {
    switch (stage) {
        case ChunkStage::Extraction: return "extraction";
        case ChunkStage::Audio: return "audio";
        case ChunkStage::Transcription: return "transcription";
        case ChunkStage::Timeout: return "timeout";
        case ChunkStage::Cancelled: return "cancelled";
    }
    return "transcription";
}

ChunkResult ChunkError::toResult() const {
    ChunkResult result;
    result.chunkIndex = chunkIndex;
    result.chunkName = chunkName;
    result.startTime = startTime;
    result.duration = duration;
    result.success = false;
    result.error = QString("%1: %2").arg(chunkStageName(stage), message);
    return result;
}

ChunkError makeChunkError(const ChunkSpec& chunk, ChunkStage stage, const QString& message) {
    ChunkError error;
    error.chunkIndex = chunk.index;
    error.chunkName = chunk.name;
    error.startTime = chunk.startTime;
    error.duration = chunk.duration;
    error.stage = stage;
    error.message = message;
    return error;
}

QString modelErrorToString(ModelError error) {
    switch (error) {
        case ModelError::ModelNotFound: return "Model file not found";
        case ModelError::ModelLoadFailed: return "Failed to load model";
        case ModelError::AudioLoadFailed: return "Failed to read audio";
        case ModelError::InvalidAudio: return "Audio is not 16-bit PCM WAV";
        case ModelError::InferenceFailed: return "Speech recognition failed";
        case ModelError::Timeout: return "Speech recognition timed out";
        case ModelError::Cancelled: return "Speech recognition cancelled";
    }
    return "Unknown model error";
}

} // namespace Scribe
