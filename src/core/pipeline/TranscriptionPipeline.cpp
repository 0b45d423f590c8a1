#include "TranscriptionPipeline.hpp"
#include "core/common/Logger.hpp"
#include "core/media/ChunkExtractor.hpp"
#include "core/media/ChunkPlanner.hpp"
#include "core/transcription/ChunkTranscriber.hpp"
#include "core/transcription/ResultAggregator.hpp"
#include "core/transcription/TranscriptionWorkerPool.hpp"

#include <QtConcurrent/QtConcurrent>
#include <QtCore/QDateTime>
#include <QtCore/QDir>
#include <QtCore/QElapsedTimer>
#include <QtCore/QJsonArray>
#include <QtCore/QStandardPaths>
#include <algorithm>
#include <exception>

namespace Scribe {

QString pipelineErrorToString(PipelineError error) {
    switch (error) {
        case PipelineError::DurationUnknown: return "Media duration unknown";
        case PipelineError::ProbeFailed: return "Media probe failed";
        case PipelineError::TranscodeFailed: return "No chunk could be extracted";
        case PipelineError::NoChunksTranscribed: return "No chunk was transcribed";
        case PipelineError::Cancelled: return "Processing cancelled";
        case PipelineError::AggregationFailed: return "Combining results failed";
        case PipelineError::AnalysisFailed: return "Content analysis failed";
        case PipelineError::InvalidConfiguration: return "Invalid configuration";
        case PipelineError::WorkDirUnavailable: return "Work directory unavailable";
        case PipelineError::SessionAlreadyRunning: return "Session already running";
        case PipelineError::InternalError: return "Internal error";
    }
    return "Unknown pipeline error";
}

QJsonObject CoverageGap::toJson() const {
    QJsonObject json;
    json["start"] = start;
    json["end"] = end;
    json["chunk_index"] = chunkIndex;
    json["reason"] = reason;
    return json;
}

QJsonObject PipelineResult::toJson() const {
    QJsonArray segmentArray;
    for (const auto& segment : segments) {
        segmentArray.append(segment.toJson());
    }
    QJsonArray chunkArray;
    for (const auto& chunk : chunkResults) {
        chunkArray.append(chunk.toJson());
    }
    QJsonArray gapArray;
    for (const auto& gap : coverageGaps) {
        gapArray.append(gap.toJson());
    }

    QJsonObject json;
    json["session_id"] = sessionId;
    json["transcript"] = transcript;
    json["segments"] = segmentArray;
    json["analysis"] = analysis.toJson();
    json["chunk_results"] = chunkArray;
    json["coverage_gaps"] = gapArray;
    json["keyword_source"] = keywordSource;
    json["chunks_total"] = chunksTotal;
    json["chunks_completed"] = chunksCompleted;
    json["chunks_failed"] = chunksFailed;
    json["worker_count"] = workerCount;
    json["media_duration"] = mediaDuration;
    json["processing_seconds"] = processingSeconds;
    json["bytes_reclaimed"] = bytesReclaimed;
    return json;
}

PipelineSettings PipelineSettings::fromConfig(const Config& config) {
    PipelineSettings settings;
    settings.chunking = config.getChunkingSettings();
    settings.workers = config.getWorkerPoolConfig();
    settings.transcription = config.getTranscriptionSettings();
    settings.analysis = config.getAnalysisSettings();
    settings.storage = config.getStorageSettings();
    return settings;
}

TranscriptionPipeline::TranscriptionPipeline(PipelineCollaborators collaborators, PipelineSettings settings)
    : collaborators_(std::move(collaborators))
    , settings_(std::move(settings))
    , tracker_(collaborators_.tracker ? collaborators_.tracker : std::make_shared<ProgressTracker>()) {
    if (!collaborators_.telemetry) {
        collaborators_.telemetry = std::make_shared<ProcMemoryTelemetry>();
    }
}

QString TranscriptionPipeline::generateSessionId(const QString& name) {
    const QString stamp = QDateTime::currentDateTime().toString("yyyyMMdd_HHmmss");
    const QString trimmed = name.trimmed();
    return trimmed.isEmpty() ? stamp : trimmed + '_' + stamp;
}

QString TranscriptionPipeline::workDirFor(const PipelineRequest& request, const QString& sessionId) const {
    if (!request.workDir.isEmpty()) {
        return request.workDir;
    }
    QString base = settings_.storage.workPath;
    if (base.isEmpty()) {
        base = QStandardPaths::writableLocation(QStandardPaths::TempLocation) + "/Scribe";
    }
    return base + '/' + sessionId;
}

std::optional<CancellationToken> TranscriptionPipeline::registerSession(const QString& sessionId) {
    QMutexLocker locker(&sessionsMutex_);
    if (running_.count(sessionId) > 0) {
        return std::nullopt;
    }
    CancellationToken token;
    running_.emplace(sessionId, token);
    return token;
}

void TranscriptionPipeline::unregisterSession(const QString& sessionId) {
    QMutexLocker locker(&sessionsMutex_);
    running_.erase(sessionId);
}

bool TranscriptionPipeline::cancel(const QString& sessionId) {
    QMutexLocker locker(&sessionsMutex_);
    auto it = running_.find(sessionId);
    if (it == running_.end()) {
        return false;
    }
    SCRIBE_INFO("Cancellation requested for session {}", sessionId.toStdString());
    it->second.cancel();
    return true;
}

QFuture<TranscriptionPipeline::Result> TranscriptionPipeline::processAsync(const QString& mediaPath,
                                                                           PipelineRequest& request) {
    if (request.sessionId.isEmpty()) {
        request.sessionId = generateSessionId(request.sessionName);
    }
    return QtConcurrent::run([this, mediaPath, request]() {
        return process(mediaPath, request);
    });
}

TranscriptionPipeline::Result TranscriptionPipeline::process(const QString& mediaPath, PipelineRequest request) {
    if (request.sessionId.isEmpty()) {
        request.sessionId = generateSessionId(request.sessionName);
    }

    if (!collaborators_.prober || !collaborators_.transcoder || !collaborators_.modelFactory) {
        SCRIBE_ERROR("Pipeline is missing a prober, transcoder or model factory");
        return makeUnexpected(SessionError{PipelineError::InvalidConfiguration,
                                           pipelineErrorToString(PipelineError::InvalidConfiguration)});
    }

    auto token = registerSession(request.sessionId);
    if (!token) {
        SCRIBE_ERROR("Session {} is already running", request.sessionId.toStdString());
        return makeUnexpected(SessionError{PipelineError::SessionAlreadyRunning,
                                           pipelineErrorToString(PipelineError::SessionAlreadyRunning)});
    }

    SessionContext session;
    session.sessionId = request.sessionId;
    session.workDir = workDirFor(request, request.sessionId);
    session.cancellation = *token;
    session.tempFiles = std::make_shared<TempFileManager>(settings_.storage.maxTempFiles);

    SCRIBE_INFO("Session {} started for {}", session.sessionId.toStdString(), mediaPath.toStdString());

    Result result = [&]() -> Result {
        try {
            return run(mediaPath, request, session);
        } catch (const std::exception& e) {
            return fail(session, PipelineError::InternalError,
                        QString("Processing failed: %1").arg(QString::fromUtf8(e.what())));
        }
    }();

    const CleanupReport cleanup = session.tempFiles->cleanupAll();
    if (cleanup.filesRemoved > 0) {
        SCRIBE_INFO("Session {} removed {} temp files ({} bytes)", session.sessionId.toStdString(),
                    cleanup.filesRemoved, cleanup.bytesReclaimed);
    }
    if (request.workDir.isEmpty()) {
        QDir().rmdir(session.workDir);
    }
    if (result.hasValue()) {
        result.value().bytesReclaimed = cleanup.bytesReclaimed;
    }

    unregisterSession(session.sessionId);
    return result;
}

TranscriptionPipeline::Result TranscriptionPipeline::fail(const SessionContext& session,
                                                          PipelineError code,
                                                          const QString& message) {
    SCRIBE_ERROR("Session {} failed: {}", session.sessionId.toStdString(), message.toStdString());
    tracker_->completeSession(session.sessionId, false, message);
    return makeUnexpected(SessionError{code, message});
}

TranscriptionPipeline::Result TranscriptionPipeline::cancelled(const SessionContext& session) {
    return fail(session, PipelineError::Cancelled, pipelineErrorToString(PipelineError::Cancelled));
}

TranscriptionPipeline::Result TranscriptionPipeline::run(const QString& mediaPath,
                                                         const PipelineRequest& request,
                                                         SessionContext& session) {
    QElapsedTimer timer;
    timer.start();
    const QString& sessionId = session.sessionId;

    if (!tracker_->startSession(sessionId, 0, 0.0)) {
        return makeUnexpected(SessionError{PipelineError::SessionAlreadyRunning,
                                           pipelineErrorToString(PipelineError::SessionAlreadyRunning)});
    }

    ProgressUpdate analysing;
    analysing.stage = SessionStage::Analysis;
    analysing.progress = 5.0;
    analysing.currentTask = "Analyzing media file...";
    tracker_->updateProgress(sessionId, analysing);

    if (!QDir().mkpath(session.workDir)) {
        return fail(session, PipelineError::WorkDirUnavailable,
                    QString("Cannot create work directory %1").arg(session.workDir));
    }

    // Planning
    auto duration = collaborators_.prober->probe(mediaPath);
    if (duration.hasError()) {
        const PipelineError code = duration.error() == MediaError::DurationUnavailable
            ? PipelineError::DurationUnknown
            : PipelineError::ProbeFailed;
        return fail(session, code, QString("Could not determine media duration: %1")
                                       .arg(mediaErrorToString(duration.error())));
    }
    const double mediaDuration = duration.value();

    const ChunkPlanner planner(settings_.chunking);
    auto plan = planner.plan(mediaDuration, mediaPath, session.workDir, request.chunkSeconds);
    if (plan.hasError()) {
        const QString message = plan.error() == PlanError::TooManyChunks
            ? QString("Media duration %1s needs more than %2 chunks").arg(mediaDuration).arg(ChunkPlanner::kMaxChunks)
            : QString("Could not determine media duration: %1").arg(mediaDuration);
        return fail(session, PipelineError::DurationUnknown, message);
    }
    const std::vector<ChunkSpec>& chunks = plan.value();
    const int chunksTotal = static_cast<int>(chunks.size());
    SCRIBE_INFO("Planned {} chunks of {}s for {:.1f}s of media", chunksTotal,
                planner.effectiveChunkSeconds(mediaDuration, request.chunkSeconds), mediaDuration);

    ProgressUpdate preparing;
    preparing.stage = SessionStage::Preparation;
    preparing.progress = 10.0;
    preparing.chunksTotal = chunksTotal;
    preparing.mediaDuration = mediaDuration;
    preparing.currentTask = QString("Splitting media into %1 chunks...").arg(chunksTotal);
    tracker_->updateProgress(sessionId, preparing);

    if (session.cancellation.isCancelled()) {
        return cancelled(session);
    }

    // Extraction, a barrier before transcription
    const ChunkExtractor extractor(collaborators_.transcoder, session.tempFiles, settings_.chunking);
    const ExtractionReport extraction = extractor.extract(mediaPath, chunks, session.cancellation);
    if (session.cancellation.isCancelled()) {
        return cancelled(session);
    }
    if (extraction.extracted.empty()) {
        return fail(session, PipelineError::TranscodeFailed,
                    QString("Failed to extract any of %1 chunks").arg(chunksTotal));
    }

    ProgressUpdate split;
    split.progress = 15.0;
    split.currentTask = QString("Split into %1 chunks").arg(extraction.extracted.size());
    tracker_->updateProgress(sessionId, split);

    // Worker count from fresh telemetry
    const MemoryManager memory(collaborators_.telemetry, settings_.workers);
    const int optimalWorkers = memory.getOptimalWorkers();
    const int workerCount = std::min(optimalWorkers, static_cast<int>(extraction.extracted.size()));
    const int threadsPerWorker = settings_.transcription.threadsPerWorker > 0
        ? settings_.transcription.threadsPerWorker
        : std::max(1, memory.cpuCount() / std::max(1, workerCount));
    for (const auto& recommendation : memory.getMemoryRecommendations()) {
        SCRIBE_INFO("Memory recommendation ({}): {}",
                    memoryRecommendationKey(recommendation.type).toStdString(),
                    recommendation.message.toStdString());
    }

    std::map<int, QString> chunkPaths;
    for (const auto& chunk : extraction.extracted) {
        chunkPaths.emplace(chunk.index, chunk.outputPath);
    }

    // Transcription
    ResultAggregator aggregator;
    const ChunkTranscriber transcriber(collaborators_.transcoder, session.tempFiles, settings_.transcription);
    TranscriptionWorkerPool pool(workerCount, collaborators_.modelFactory);

    const int dropped = static_cast<int>(extraction.dropped.size());
    const int pressureInterval = std::max(1, static_cast<int>(extraction.extracted.size()) / 4);
    QMutex progressMutex;
    int completed = 0;
    int failed = 0;

    auto job = [&](const ChunkSpec& chunk, SpeechModel& model) {
        return transcriber.transcribe(chunk, model, session.cancellation, threadsPerWorker);
    };

    auto onComplete = [&](const ChunkOutcome& outcome) {
        aggregator.add(outcome);

        const int index = outcome.hasValue() ? outcome.value().chunkIndex : outcome.error().chunkIndex;
        const QString label = outcome.hasValue() ? outcome.value().chunkName : outcome.error().chunkName;
        auto path = chunkPaths.find(index);
        if (path != chunkPaths.end()) {
            session.tempFiles->unpin(path->second);
        }

        if (outcome.hasValue()) {
            SCRIBE_INFO("Chunk {} ({}) transcribed in {:.1f}s", index, label.toStdString(),
                        outcome.value().processingSeconds);
        }

        int resolved = 0;
        {
            // The tracker only queues the snapshot, so holding the lock keeps
            // chunk counts in order without waiting on observers.
            QMutexLocker locker(&progressMutex);
            if (outcome.hasValue()) {
                ++completed;
            } else {
                ++failed;
            }
            resolved = completed + failed;
            tracker_->updateChunkProgress(sessionId, completed, chunksTotal, label, failed + dropped);
        }

        if (resolved % pressureInterval == 0 && memory.checkMemoryPressure()) {
            SCRIBE_WARN("Memory pressure during session {} after {} chunks",
                        sessionId.toStdString(), resolved);
        }
    };

    pool.run(extraction.extracted, job, onComplete, session.cancellation);
    const WorkerPoolStats stats = pool.lastRunStats();

    if (session.cancellation.isCancelled()) {
        return cancelled(session);
    }
    if (aggregator.successCount() == 0) {
        return fail(session, PipelineError::NoChunksTranscribed,
                    QString("All %1 chunks failed to transcribe").arg(extraction.extracted.size()));
    }

    // Merge
    ProgressUpdate combining;
    combining.stage = SessionStage::PostProcessing;
    combining.progress = 90.0;
    combining.currentTask = "Combining transcription results...";
    tracker_->updateProgress(sessionId, combining);

    MergedTranscript merged;
    try {
        auto mergedResult = aggregator.merge();
        if (mergedResult.hasError()) {
            return fail(session, PipelineError::AggregationFailed,
                        "Combining transcription results failed: malformed segment data");
        }
        merged = std::move(mergedResult).value();
    } catch (const std::exception& e) {
        return fail(session, PipelineError::AggregationFailed,
                    QString("Combining transcription results failed: %1").arg(QString::fromUtf8(e.what())));
    }

    // Analysis
    ProgressUpdate analysingContent;
    analysingContent.progress = 93.0;
    analysingContent.currentTask = "Analyzing content...";
    tracker_->updateProgress(sessionId, analysingContent);

    AnalysisResult analysis;
    try {
        const ContentAnalyzer analyzer(settings_.analysis);
        auto analysed = analyzer.analyze(merged.transcript, merged.segments, request.keywords.keywords);
        if (analysed.hasError()) {
            return fail(session, PipelineError::AnalysisFailed,
                        "Content analysis failed: invalid question or emphasis pattern");
        }
        analysis = std::move(analysed).value();
    } catch (const std::exception& e) {
        return fail(session, PipelineError::AnalysisFailed,
                    QString("Content analysis failed: %1").arg(QString::fromUtf8(e.what())));
    }

    ProgressUpdate finalizing;
    finalizing.stage = SessionStage::Finalization;
    finalizing.progress = 95.0;
    finalizing.currentTask = "Finalizing results...";
    tracker_->updateProgress(sessionId, finalizing);

    PipelineResult result;
    result.sessionId = sessionId;
    result.transcript = merged.transcript;
    result.segments = std::move(merged.segments);
    result.analysis = std::move(analysis);
    result.keywordSource = request.keywords.source;
    result.chunksTotal = chunksTotal;
    result.chunksCompleted = aggregator.successCount();
    result.chunksFailed = aggregator.failureCount() + dropped;
    result.workerCount = stats.workers;
    result.mediaDuration = mediaDuration;

    std::vector<ChunkError> problems = extraction.dropped;
    const std::vector<ChunkError> failures = aggregator.failures();
    problems.insert(problems.end(), failures.begin(), failures.end());
    std::sort(problems.begin(), problems.end(), [](const ChunkError& a, const ChunkError& b) {
        return a.chunkIndex < b.chunkIndex;
    });

    result.chunkResults = merged.chunks;
    for (const auto& problem : problems) {
        result.chunkResults.push_back(problem.toResult());
        CoverageGap gap;
        gap.start = problem.startTime;
        gap.end = problem.startTime + problem.duration;
        gap.chunkIndex = problem.chunkIndex;
        gap.reason = QString("%1: %2").arg(chunkStageName(problem.stage), problem.message);
        result.coverageGaps.push_back(gap);
        SCRIBE_WARN("Transcript has no coverage for {} - {} (chunk {})",
                    formatTimestamp(gap.start).toStdString(), formatTimestamp(gap.end).toStdString(),
                    gap.chunkIndex);
    }
    std::stable_sort(result.chunkResults.begin(), result.chunkResults.end(),
                     [](const ChunkResult& a, const ChunkResult& b) { return a.chunkIndex < b.chunkIndex; });

    result.processingSeconds = timer.elapsed() / 1000.0;

    tracker_->completeSession(sessionId, true,
        QString("Processing complete! Transcribed %1 chunks, found %2 words.")
            .arg(result.chunksCompleted)
            .arg(result.analysis.totalWords));
    SCRIBE_INFO("Session {} completed in {:.1f}s: {}/{} chunks, {} words", sessionId.toStdString(),
                result.processingSeconds, result.chunksCompleted, chunksTotal, result.analysis.totalWords);
    return result;
}

} // namespace Scribe
