#pragma once

#include <QtCore/QFuture>
#include <QtCore/QJsonObject>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <map>
#include <memory>
#include <optional>
#include <vector>

#include "core/analysis/ContentAnalyzer.hpp"
#include "core/analysis/KeywordStore.hpp"
#include "core/common/CancellationToken.hpp"
#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "core/media/DurationProber.hpp"
#include "core/media/Transcoder.hpp"
#include "core/progress/ProgressTracker.hpp"
#include "core/storage/MemoryManager.hpp"
#include "core/storage/TempFileManager.hpp"
#include "core/transcription/SpeechModel.hpp"
#include "core/transcription/TranscriptionTypes.hpp"

namespace Scribe {

enum class PipelineError {
    DurationUnknown,
    ProbeFailed,
    TranscodeFailed,
    NoChunksTranscribed,
    Cancelled,
    AggregationFailed,
    AnalysisFailed,
    InvalidConfiguration,
    WorkDirUnavailable,
    SessionAlreadyRunning,
    InternalError
};

QString pipelineErrorToString(PipelineError error);

struct SessionError {
    PipelineError code = PipelineError::InvalidConfiguration;
    QString message;
};

struct PipelineRequest {
    QString sessionId;                  // generated when empty
    QString sessionName;                // prefix for a generated id
    KeywordSnapshot keywords;
    std::optional<int> chunkSeconds;
    QString workDir;                    // defaults to <storage work path>/<session id>
};

// Time range missing from the transcript.
struct CoverageGap {
    double start = 0.0;
    double end = 0.0;
    int chunkIndex = 0;
    QString reason;

    QJsonObject toJson() const;
};

struct PipelineResult {
    QString sessionId;
    QString transcript;
    std::vector<Segment> segments;
    AnalysisResult analysis;
    std::vector<ChunkResult> chunkResults;      // successful and failed, index order
    std::vector<CoverageGap> coverageGaps;      // index order
    QString keywordSource;
    int chunksTotal = 0;
    int chunksCompleted = 0;
    int chunksFailed = 0;
    int workerCount = 0;
    double mediaDuration = 0.0;
    double processingSeconds = 0.0;
    qint64 bytesReclaimed = 0;

    QJsonObject toJson() const;
};

// Settings snapshot for one pipeline instance.
struct PipelineSettings {
    Config::ChunkingSettings chunking;
    WorkerPoolConfig workers;
    Config::TranscriptionSettings transcription;
    Config::AnalysisSettings analysis;
    Config::StorageSettings storage;

    static PipelineSettings fromConfig(const Config& config);
};

struct PipelineCollaborators {
    std::shared_ptr<DurationProber> prober;
    std::shared_ptr<Transcoder> transcoder;
    SpeechModelFactory modelFactory;
    std::shared_ptr<MemoryTelemetry> telemetry;
    std::shared_ptr<ProgressTracker> tracker;       // created when null
};

/**
 * @brief Runs one transcription session from media file to analysed transcript.
 *
 * probe -> plan -> extract (barrier) -> size worker pool -> transcribe ->
 * merge -> analyse. Chunk failures are recorded and reported as coverage
 * gaps; probe/plan failures, zero usable chunks, cancellation and any
 * exception while merging or analysing end the session in error. Every
 * session owns its temp files and deletes them when it ends.
 */
class TranscriptionPipeline {
public:
    using Result = Expected<PipelineResult, SessionError>;

    TranscriptionPipeline(PipelineCollaborators collaborators, PipelineSettings settings);

    TranscriptionPipeline(const TranscriptionPipeline&) = delete;
    TranscriptionPipeline& operator=(const TranscriptionPipeline&) = delete;

    Result process(const QString& mediaPath, PipelineRequest request = PipelineRequest());

    // The request's session id is filled in before the task starts so that
    // callers can cancel it.
    QFuture<Result> processAsync(const QString& mediaPath, PipelineRequest& request);

    // Returns false when no session with this id is running.
    bool cancel(const QString& sessionId);

    ProgressTracker& tracker() { return *tracker_; }
    std::shared_ptr<ProgressTracker> trackerPtr() const { return tracker_; }
    const PipelineSettings& settings() const { return settings_; }

    // YYYYMMDD_HHMMSS, or <name>_YYYYMMDD_HHMMSS
    static QString generateSessionId(const QString& name = QString());

private:
    struct SessionContext {
        QString sessionId;
        QString workDir;
        CancellationToken cancellation;
        std::shared_ptr<TempFileManager> tempFiles;
    };

    Result run(const QString& mediaPath, const PipelineRequest& request, SessionContext& session);
    Result fail(const SessionContext& session, PipelineError code, const QString& message);
    Result cancelled(const SessionContext& session);

    std::optional<CancellationToken> registerSession(const QString& sessionId);
    void unregisterSession(const QString& sessionId);
    QString workDirFor(const PipelineRequest& request, const QString& sessionId) const;

    PipelineCollaborators collaborators_;
    PipelineSettings settings_;
    std::shared_ptr<ProgressTracker> tracker_;

    QMutex sessionsMutex_;
    std::map<QString, CancellationToken> running_;
};

} // namespace Scribe
