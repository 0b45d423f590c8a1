#include "ProgressTracker.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QDeadlineTimer>

#include <algorithm>
#include <exception>
#include <vector>

namespace Scribe {

QString sessionStatusName(SessionStatus status) {
    switch (status) {
        case SessionStatus::Starting: return "starting";
        case SessionStatus::Processing: return "processing";
        case SessionStatus::Completed: return "completed";
        case SessionStatus::Error: return "error";
    }
    return "unknown";
}

QString sessionStageName(SessionStage stage) {
    switch (stage) {
        case SessionStage::Initialization: return "initialization";
        case SessionStage::Analysis: return "analysis";
        case SessionStage::Preparation: return "preparation";
        case SessionStage::Transcription: return "transcription";
        case SessionStage::PostProcessing: return "post_processing";
        case SessionStage::Finalization: return "finalization";
        case SessionStage::Completed: return "completed";
        case SessionStage::Error: return "error";
    }
    return "unknown";
}

QJsonObject SessionProgress::toJson() const {
    QJsonObject json;
    json["session_id"] = sessionId;
    json["status"] = sessionStatusName(status);
    json["stage"] = sessionStageName(stage);
    json["progress"] = progress;
    json["current_task"] = currentTask;
    json["current_chunk"] = currentChunk;
    json["chunks_total"] = chunksTotal;
    json["chunks_completed"] = chunksCompleted;
    json["chunks_failed"] = chunksFailed;
    json["media_duration"] = mediaDuration;
    json["stage_progress"] = stageProgress;
    json["message"] = message;
    json["start_time"] = startTime.toString(Qt::ISODateWithMs);
    json["updated_at"] = updatedAt.toString(Qt::ISODateWithMs);
    if (estimatedTimeRemaining) {
        json["estimated_time_remaining"] = *estimatedTimeRemaining;
    } else {
        json["estimated_time_remaining"] = QJsonValue::Null;
    }
    json["revision"] = static_cast<qint64>(revision);
    return json;
}

ProgressTracker::ProgressTracker(std::shared_ptr<ProgressObserver> observer, QObject* parent)
    : QObject(parent)
    , observer_(std::move(observer)) {
    qRegisterMetaType<Scribe::SessionProgress>();
    deliveryThread_.reset(QThread::create([this]() { deliveryLoop(); }));
    deliveryThread_->setObjectName("progress-delivery");
    deliveryThread_->start();
}

ProgressTracker::~ProgressTracker() {
    {
        QMutexLocker locker(&deliveryMutex_);
        stopping_ = true;
        deliveryReady_.wakeAll();
    }
    deliveryThread_->wait();
}

void ProgressTracker::setObserver(std::shared_ptr<ProgressObserver> observer) {
    QMutexLocker locker(&registryMutex_);
    observer_ = std::move(observer);
}

int ProgressTracker::stageRank(SessionStage stage) {
    return static_cast<int>(stage);
}

bool ProgressTracker::startSession(const QString& sessionId, int totalChunks, double mediaDuration) {
    auto state = std::make_shared<SessionState>();
    const QDateTime now = QDateTime::currentDateTimeUtc();
    state->progress.sessionId = sessionId;
    state->progress.currentTask = "Initializing...";
    state->progress.chunksTotal = std::max(0, totalChunks);
    state->progress.mediaDuration = std::max(0.0, mediaDuration);
    state->progress.startTime = now;
    state->progress.updatedAt = now;

    {
        QMutexLocker locker(&registryMutex_);
        auto it = sessions_.find(sessionId);
        if (it != sessions_.end()) {
            QMutexLocker sessionLocker(&it->second->mutex);
            if (!it->second->progress.isTerminal()) {
                SCRIBE_WARN("Session {} is already running", sessionId.toStdString());
                return false;
            }
        }
        sessions_[sessionId] = state;
        enqueue(state->progress);
    }

    SCRIBE_INFO("Started progress tracking for session {}", sessionId.toStdString());
    return true;
}

bool ProgressTracker::updateProgress(const QString& sessionId, const ProgressUpdate& update) {
    auto state = find(sessionId);
    if (!state) {
        SCRIBE_WARN("Attempted to update non-existent session: {}", sessionId.toStdString());
        return false;
    }

    SessionProgress snapshot;
    {
        QMutexLocker locker(&state->mutex);
        SessionProgress& progress = state->progress;
        if (progress.isTerminal()) {
            SCRIBE_WARN("Ignoring update for finished session {}", sessionId.toStdString());
            return false;
        }
        applyUpdate(progress, update);
        snapshot = progress;
        enqueue(snapshot);
    }

    SCRIBE_DEBUG("Progress update for {}: {} ({:.1f}%)", sessionId.toStdString(),
                 snapshot.currentTask.toStdString(), snapshot.progress);
    return true;
}

bool ProgressTracker::updateChunkProgress(const QString& sessionId,
                                          int completed,
                                          int total,
                                          const QString& label,
                                          int failed) {
    const int resolved = std::max(0, completed) + std::max(0, failed);
    const double ratio = total > 0 ? std::min(1.0, static_cast<double>(resolved) / total) : 0.0;
    const double chunkProgress = ratio * 70.0;

    QString task = QString("Processing chunk %1/%2").arg(resolved).arg(total);
    if (!label.isEmpty()) {
        task += " - " + label;
    }

    ProgressUpdate update;
    update.stage = SessionStage::Transcription;
    update.progress = 20.0 + chunkProgress;
    update.stageProgress = ratio * 100.0;
    update.currentChunk = resolved;
    update.chunksTotal = std::max(0, total);
    update.chunksCompleted = std::max(0, completed);
    update.chunksFailed = std::max(0, failed);
    update.currentTask = task;
    return updateProgress(sessionId, update);
}

bool ProgressTracker::completeSession(const QString& sessionId, bool success, const QString& message) {
    auto state = find(sessionId);
    if (!state) {
        SCRIBE_WARN("Attempted to complete non-existent session: {}", sessionId.toStdString());
        return false;
    }

    {
        QMutexLocker locker(&state->mutex);
        SessionProgress& progress = state->progress;
        if (progress.isTerminal()) {
            SCRIBE_WARN("Session {} is already finished", sessionId.toStdString());
            return false;
        }
        const QString text = message.isEmpty()
            ? QString(success ? "Processing complete!" : "Processing failed")
            : message;
        progress.status = success ? SessionStatus::Completed : SessionStatus::Error;
        progress.stage = success ? SessionStage::Completed : SessionStage::Error;
        if (success) {
            progress.progress = 100.0;
            progress.stageProgress = 100.0;
            progress.estimatedTimeRemaining = 0.0;
        } else {
            progress.estimatedTimeRemaining.reset();
        }
        progress.currentTask = text;
        progress.message = text;
        progress.updatedAt = QDateTime::currentDateTimeUtc();
        ++progress.revision;
        enqueue(progress);
    }

    SCRIBE_INFO("Session {} marked as {}", sessionId.toStdString(), success ? "completed" : "failed");
    return true;
}

std::optional<SessionProgress> ProgressTracker::getSessionProgress(const QString& sessionId) const {
    auto state = find(sessionId);
    if (!state) {
        return std::nullopt;
    }
    QMutexLocker locker(&state->mutex);
    return state->progress;
}

std::map<QString, SessionProgress> ProgressTracker::activeSessions() const {
    std::vector<std::shared_ptr<SessionState>> states;
    {
        QMutexLocker locker(&registryMutex_);
        for (const auto& [id, state] : sessions_) {
            states.push_back(state);
        }
    }

    std::map<QString, SessionProgress> result;
    for (const auto& state : states) {
        QMutexLocker locker(&state->mutex);
        result.emplace(state->progress.sessionId, state->progress);
    }
    return result;
}

bool ProgressTracker::cleanupSession(const QString& sessionId) {
    QMutexLocker locker(&registryMutex_);
    if (sessions_.erase(sessionId) == 0) {
        return false;
    }
    SCRIBE_DEBUG("Cleaned up progress tracking for session {}", sessionId.toStdString());
    return true;
}

int ProgressTracker::cleanupStaleSessions(qint64 maxAgeSeconds) {
    const QDateTime now = QDateTime::currentDateTimeUtc();
    int removed = 0;
    {
        QMutexLocker locker(&registryMutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            qint64 ageMs = 0;
            {
                QMutexLocker sessionLocker(&it->second->mutex);
                ageMs = it->second->progress.startTime.msecsTo(now);
            }
            if (ageMs > maxAgeSeconds * 1000) {
                it = sessions_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
    }

    if (removed > 0) {
        SCRIBE_INFO("Cleaned up {} stale progress sessions", removed);
    }
    return removed;
}

std::shared_ptr<ProgressTracker::SessionState> ProgressTracker::find(const QString& sessionId) const {
    QMutexLocker locker(&registryMutex_);
    auto it = sessions_.find(sessionId);
    return it == sessions_.end() ? nullptr : it->second;
}

void ProgressTracker::applyUpdate(SessionProgress& progress, const ProgressUpdate& update) {
    progress.status = SessionStatus::Processing;

    if (update.stage) {
        const SessionStage stage = *update.stage;
        if (stage == SessionStage::Completed || stage == SessionStage::Error) {
            SCRIBE_WARN("Session {} can only finish through completeSession",
                        progress.sessionId.toStdString());
        } else if (stageRank(stage) < stageRank(progress.stage)) {
            SCRIBE_DEBUG("Session {} stays in stage {} (requested {})",
                         progress.sessionId.toStdString(),
                         sessionStageName(progress.stage).toStdString(),
                         sessionStageName(stage).toStdString());
        } else {
            progress.stage = stage;
        }
    }

    if (update.progress) {
        const double requested = std::clamp(*update.progress, 0.0, 100.0);
        progress.progress = std::max(progress.progress, requested);
    }
    if (update.currentTask) {
        progress.currentTask = *update.currentTask;
    }
    if (update.currentChunk) {
        progress.currentChunk = *update.currentChunk;
    }
    if (update.chunksTotal) {
        progress.chunksTotal = *update.chunksTotal;
    }
    if (update.chunksCompleted) {
        progress.chunksCompleted = *update.chunksCompleted;
    }
    if (update.chunksFailed) {
        progress.chunksFailed = *update.chunksFailed;
    }
    if (update.mediaDuration) {
        progress.mediaDuration = *update.mediaDuration;
    }
    if (update.stageProgress) {
        progress.stageProgress = std::clamp(*update.stageProgress, 0.0, 100.0);
    }
    if (update.message) {
        progress.message = *update.message;
    }

    progress.updatedAt = QDateTime::currentDateTimeUtc();
    refreshEstimate(progress);
    ++progress.revision;
}

void ProgressTracker::refreshEstimate(SessionProgress& progress) {
    const double p = progress.progress;
    if (p > 0.0 && p < 100.0) {
        const double elapsed = progress.startTime.msecsTo(progress.updatedAt) / 1000.0;
        progress.estimatedTimeRemaining = std::max(0.0, elapsed * (100.0 - p) / p);
    }
}

bool ProgressTracker::waitForDelivery(int timeoutMs) const {
    QDeadlineTimer deadline(timeoutMs);
    QMutexLocker locker(&deliveryMutex_);
    while (!pending_.empty() || delivering_) {
        if (!deliveryIdle_.wait(&deliveryMutex_, deadline)) {
            return pending_.empty() && !delivering_;
        }
    }
    return true;
}

int ProgressTracker::pendingDeliveries() const {
    QMutexLocker locker(&deliveryMutex_);
    return static_cast<int>(pending_.size()) + (delivering_ ? 1 : 0);
}

void ProgressTracker::enqueue(const SessionProgress& snapshot) {
    QMutexLocker locker(&deliveryMutex_);
    pending_.push_back(Delivery{snapshot.sessionId, snapshot});
    deliveryReady_.wakeOne();
}

void ProgressTracker::deliveryLoop() {
    for (;;) {
        Delivery delivery;
        {
            QMutexLocker locker(&deliveryMutex_);
            while (pending_.empty() && !stopping_) {
                deliveryReady_.wait(&deliveryMutex_);
            }
            if (pending_.empty()) {
                return;
            }
            delivery = std::move(pending_.front());
            pending_.pop_front();
            delivering_ = true;
        }

        deliver(delivery);

        QMutexLocker locker(&deliveryMutex_);
        delivering_ = false;
        if (pending_.empty()) {
            deliveryIdle_.wakeAll();
        }
    }
}

void ProgressTracker::deliver(const Delivery& delivery) {
    std::shared_ptr<ProgressObserver> observer;
    {
        QMutexLocker locker(&registryMutex_);
        observer = observer_;
    }

    if (observer) {
        try {
            observer->onProgress(delivery.sessionId, delivery.snapshot);
        } catch (const std::exception& e) {
            SCRIBE_WARN("Failed to emit progress for session {}: {}",
                        delivery.sessionId.toStdString(), e.what());
        }
    }

    emit progressUpdated(delivery.sessionId, delivery.snapshot);
}

} // namespace Scribe
