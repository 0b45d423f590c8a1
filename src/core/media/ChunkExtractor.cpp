#include "ChunkExtractor.hpp"
#include "core/common/Logger.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QFuture>
#include <QtCore/QThreadPool>
#include <algorithm>
#include <exception>

namespace Scribe {

ChunkExtractor::ChunkExtractor(std::shared_ptr<Transcoder> transcoder,
                               std::shared_ptr<TempFileManager> tempFiles,
                               Config::ChunkingSettings settings)
    : transcoder_(std::move(transcoder))
    , tempFiles_(std::move(tempFiles))
    , settings_(std::move(settings)) {
}

int ChunkExtractor::poolSizeFor(int chunkCount) const {
    return std::max(1, std::min(settings_.extractionPoolCap, chunkCount));
}

ExtractionReport ChunkExtractor::extract(const QString& mediaPath,
                                         const std::vector<ChunkSpec>& chunks,
                                         const CancellationToken& cancellation) const {
    ExtractionReport report;
    if (chunks.empty()) {
        return report;
    }

    QThreadPool pool;
    pool.setMaxThreadCount(poolSizeFor(static_cast<int>(chunks.size())));
    SCRIBE_INFO("Extracting {} chunks with {} threads", chunks.size(), pool.maxThreadCount());

    QList<QFuture<Expected<ChunkSpec, ChunkError>>> futures;
    futures.reserve(static_cast<qsizetype>(chunks.size()));
    for (const ChunkSpec& chunk : chunks) {
        futures.append(QtConcurrent::run(&pool, [this, mediaPath, chunk, cancellation]() {
            return extractOne(mediaPath, chunk, cancellation);
        }));
    }

    // Barrier: every extraction resolves before transcription may start.
    for (auto& future : futures) {
        auto outcome = future.result();
        if (outcome.hasValue()) {
            report.extracted.push_back(outcome.value());
        } else {
            report.dropped.push_back(outcome.error());
        }
    }
    pool.waitForDone();

    const auto byIndex = [](const auto& lhs, const auto& rhs) { return lhs.index < rhs.index; };
    std::sort(report.extracted.begin(), report.extracted.end(), byIndex);
    std::sort(report.dropped.begin(), report.dropped.end(),
              [](const ChunkError& lhs, const ChunkError& rhs) { return lhs.chunkIndex < rhs.chunkIndex; });

    if (!report.dropped.empty()) {
        SCRIBE_WARN("{} of {} chunks could not be extracted and are skipped",
                    report.dropped.size(), chunks.size());
    }
    return report;
}

Expected<ChunkSpec, ChunkError> ChunkExtractor::extractOne(const QString& mediaPath,
                                                           const ChunkSpec& chunk,
                                                           const CancellationToken& cancellation) const {
    if (cancellation.isCancelled()) {
        return makeUnexpected(makeChunkError(chunk, ChunkStage::Cancelled, "session cancelled"));
    }

    WorkLimit limit;
    limit.cancellation = cancellation;
    const auto options = EncodingOptions::chunkVideo(settings_.videoCodec, settings_.audioCodec);

    Expected<void, MediaError> written;
    try {
        written = transcoder_->extract(mediaPath, chunk.startTime, chunk.duration,
                                       chunk.outputPath, options, limit);
    } catch (const std::exception& ex) {
        SCRIBE_ERROR("Extraction of chunk {} threw: {}", chunk.index, ex.what());
        tempFiles_->release(chunk.outputPath);
        return makeUnexpected(makeChunkError(chunk, ChunkStage::Extraction,
            QString("exception: %1").arg(QString::fromUtf8(ex.what()))));
    }

    if (written.hasError()) {
        const MediaError error = written.error();
        SCRIBE_ERROR("Error extracting chunk {} ({}): {}", chunk.index,
                     chunk.name.toStdString(), mediaErrorToString(error).toStdString());
        // A failed encode can leave a partial file behind.
        tempFiles_->release(chunk.outputPath);
        return makeUnexpected(makeChunkError(chunk,
            error == MediaError::Cancelled ? ChunkStage::Cancelled : ChunkStage::Extraction,
            mediaErrorToString(error)));
    }

    tempFiles_->addTempFile(chunk.outputPath, TempFileKind::Chunk, true);
    SCRIBE_DEBUG("Extracted chunk {}: {:.1f}s-{:.1f}s", chunk.index, chunk.startTime, chunk.end());
    return chunk;
}

} // namespace Scribe
