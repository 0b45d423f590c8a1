#include "ChunkTranscriber.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDeadlineTimer>
#include <QtCore/QElapsedTimer>
#include <QtCore/QFileInfo>
#include <exception>

namespace Scribe {

ChunkTranscriber::ChunkTranscriber(std::shared_ptr<Transcoder> transcoder,
                                   std::shared_ptr<TempFileManager> tempFiles,
                                   Config::TranscriptionSettings settings)
    : transcoder_(std::move(transcoder))
    , tempFiles_(std::move(tempFiles))
    , settings_(std::move(settings)) {
}

QString ChunkTranscriber::audioPathFor(const ChunkSpec& chunk) {
    const QFileInfo info(chunk.outputPath);
    return info.path() + '/' + info.completeBaseName() + ".wav";
}

ChunkOutcome ChunkTranscriber::transcribe(const ChunkSpec& chunk,
                                          SpeechModel& model,
                                          const CancellationToken& cancellation,
                                          int threads) const {
    WorkLimit limit;
    limit.deadline = QDeadlineTimer(static_cast<qint64>(settings_.chunkTimeoutSeconds) * 1000);
    limit.cancellation = cancellation;

    ChunkOutcome outcome = [&]() -> ChunkOutcome {
        try {
            return runChunk(chunk, model, limit, threads);
        } catch (const std::exception& ex) {
            return makeUnexpected(makeChunkError(chunk, ChunkStage::Transcription,
                QString("exception: %1").arg(QString::fromUtf8(ex.what()))));
        }
    }();

    tempFiles_->release(audioPathFor(chunk));

    if (outcome.hasError()) {
        const ChunkError& error = outcome.error();
        SCRIBE_ERROR("Chunk {} ({}) failed at {}: {}", chunk.index, chunk.name.toStdString(),
                     chunkStageName(error.stage).toStdString(), error.message.toStdString());
    }
    return outcome;
}

ChunkOutcome ChunkTranscriber::runChunk(const ChunkSpec& chunk,
                                        SpeechModel& model,
                                        const WorkLimit& limit,
                                        int threads) const {
    QElapsedTimer timer;
    timer.start();

    if (limit.cancelled()) {
        return makeUnexpected(makeChunkError(chunk, ChunkStage::Cancelled, "session cancelled"));
    }

    const QString audioPath = audioPathFor(chunk);
    // Pinned so eviction never removes audio a worker is still reading.
    tempFiles_->addTempFile(audioPath, TempFileKind::Audio, true);

    const auto options = EncodingOptions::speechAudio(settings_.audioCodec,
                                                      settings_.sampleRate,
                                                      settings_.channels);
    auto audio = transcoder_->extract(chunk.outputPath, 0.0, std::nullopt, audioPath, options, limit);
    if (audio.hasError()) {
        const MediaError error = audio.error();
        const ChunkStage stage = error == MediaError::Timeout ? ChunkStage::Timeout
                               : error == MediaError::Cancelled ? ChunkStage::Cancelled
                               : ChunkStage::Audio;
        return makeUnexpected(makeChunkError(chunk, stage, mediaErrorToString(error)));
    }
    // Re-register so the recorded size is the real one.
    tempFiles_->addTempFile(audioPath, TempFileKind::Audio, true);

    TranscribeOptions transcribeOptions;
    transcribeOptions.language = settings_.language;
    transcribeOptions.wordTimestamps = true;
    transcribeOptions.threads = threads;

    auto transcript = model.transcribe(audioPath, transcribeOptions, limit);
    if (transcript.hasError()) {
        const ModelError error = transcript.error();
        const ChunkStage stage = error == ModelError::Timeout ? ChunkStage::Timeout
                               : error == ModelError::Cancelled ? ChunkStage::Cancelled
                               : ChunkStage::Transcription;
        return makeUnexpected(makeChunkError(chunk, stage, modelErrorToString(error)));
    }
    // A model that ignores the deadline still fails the chunk.
    if (limit.expired()) {
        return makeUnexpected(makeChunkError(chunk, ChunkStage::Timeout,
            QString("exceeded %1s").arg(settings_.chunkTimeoutSeconds)));
    }

    ChunkResult result;
    result.chunkIndex = chunk.index;
    result.chunkName = chunk.name;
    result.startTime = chunk.startTime;
    result.duration = chunk.duration;
    result.language = transcript.value().language;
    result.transcriptText = transcript.value().text.trimmed();
    result.segments.reserve(transcript.value().segments.size());
    for (const ModelSegment& raw : transcript.value().segments) {
        Segment segment;
        segment.start = raw.start + chunk.startTime;
        segment.end = raw.end + chunk.startTime;
        segment.text = raw.text.trimmed();
        segment.displayTimestamp = formatTimestamp(segment.start);
        segment.confidence = raw.confidence;
        result.segments.push_back(std::move(segment));
    }
    result.processingSeconds = timer.elapsed() / 1000.0;

    SCRIBE_INFO("Chunk {} ({}) transcribed in {:.1f}s, {} segments", chunk.index,
                chunk.name.toStdString(), result.processingSeconds, result.segments.size());
    return result;
}

} // namespace Scribe
