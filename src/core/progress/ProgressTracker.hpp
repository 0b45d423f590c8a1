#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QJsonObject>
#include <QtCore/QMetaType>
#include <QtCore/QMutex>
#include <QtCore/QObject>
#include <QtCore/QString>
#include <QtCore/QThread>
#include <QtCore/QWaitCondition>
#include <deque>
#include <map>
#include <memory>
#include <optional>

namespace Scribe {

enum class SessionStatus {
    Starting,
    Processing,
    Completed,
    Error
};

// Declaration order is the forward order of a session.
enum class SessionStage {
    Initialization,
    Analysis,
    Preparation,
    Transcription,
    PostProcessing,
    Finalization,
    Completed,
    Error
};

QString sessionStatusName(SessionStatus status);
QString sessionStageName(SessionStage stage);

struct SessionProgress {
    QString sessionId;
    SessionStatus status = SessionStatus::Starting;
    SessionStage stage = SessionStage::Initialization;
    double progress = 0.0;              // 0-100, never decreases
    QString currentTask;
    int currentChunk = 0;
    int chunksTotal = 0;
    int chunksCompleted = 0;            // successful chunks only
    int chunksFailed = 0;
    double mediaDuration = 0.0;
    double stageProgress = 0.0;
    QString message;
    QDateTime startTime;
    QDateTime updatedAt;
    std::optional<double> estimatedTimeRemaining;   // seconds
    quint64 revision = 0;

    bool isTerminal() const {
        return status == SessionStatus::Completed || status == SessionStatus::Error;
    }

    QJsonObject toJson() const;
};

// Fields left empty keep their current value.
struct ProgressUpdate {
    std::optional<SessionStage> stage;
    std::optional<double> progress;
    std::optional<QString> currentTask;
    std::optional<int> currentChunk;
    std::optional<int> chunksTotal;
    std::optional<int> chunksCompleted;
    std::optional<int> chunksFailed;
    std::optional<double> mediaDuration;
    std::optional<double> stageProgress;
    std::optional<QString> message;
};

class ProgressObserver {
public:
    virtual ~ProgressObserver() = default;

    // Called on the tracker's delivery thread, one snapshot at a time.
    virtual void onProgress(const QString& sessionId, const SessionProgress& progress) = 0;
};

/**
 * @brief Per-session progress state machine.
 *
 * Each session has its own mutex; the registry mutex only guards the session
 * map. Every accepted change is queued while its session lock is held, so a
 * session's snapshots are delivered in revision order. A dedicated delivery
 * thread hands them to the observer (exceptions are logged, never propagated)
 * and emits progressUpdated(); callers never wait for either. Terminal
 * sessions reject further updates and the stage only moves forward.
 * Completed and Error are reached through completeSession() alone.
 */
class ProgressTracker : public QObject {
    Q_OBJECT

public:
    explicit ProgressTracker(std::shared_ptr<ProgressObserver> observer = nullptr,
                             QObject* parent = nullptr);
    // Delivers whatever is still queued before returning.
    ~ProgressTracker() override;

    void setObserver(std::shared_ptr<ProgressObserver> observer);

    // Fails for an id that is still live; a terminal id is replaced.
    bool startSession(const QString& sessionId, int totalChunks = 0, double mediaDuration = 0.0);

    bool updateProgress(const QString& sessionId, const ProgressUpdate& update);

    // progress = 20 + ((completed + failed) / total) * 70
    bool updateChunkProgress(const QString& sessionId,
                             int completed,
                             int total,
                             const QString& label = QString(),
                             int failed = 0);

    bool completeSession(const QString& sessionId, bool success, const QString& message = QString());

    std::optional<SessionProgress> getSessionProgress(const QString& sessionId) const;
    std::map<QString, SessionProgress> activeSessions() const;

    bool cleanupSession(const QString& sessionId);
    int cleanupStaleSessions(qint64 maxAgeSeconds = 3600);

    // Blocks until every queued snapshot has been delivered. False on timeout.
    bool waitForDelivery(int timeoutMs = 5000) const;
    int pendingDeliveries() const;

    static int stageRank(SessionStage stage);

signals:
    void progressUpdated(const QString& sessionId, const Scribe::SessionProgress& progress);

private:
    struct SessionState {
        QMutex mutex;
        SessionProgress progress;
    };

    struct Delivery {
        QString sessionId;
        SessionProgress snapshot;
    };

    std::shared_ptr<SessionState> find(const QString& sessionId) const;
    void enqueue(const SessionProgress& snapshot);
    void deliveryLoop();
    void deliver(const Delivery& delivery);
    static void applyUpdate(SessionProgress& progress, const ProgressUpdate& update);
    static void refreshEstimate(SessionProgress& progress);

    mutable QMutex registryMutex_;
    std::map<QString, std::shared_ptr<SessionState>> sessions_;
    std::shared_ptr<ProgressObserver> observer_;

    mutable QMutex deliveryMutex_;
    QWaitCondition deliveryReady_;
    mutable QWaitCondition deliveryIdle_;
    std::deque<Delivery> pending_;
    bool delivering_ = false;
    bool stopping_ = false;
    std::unique_ptr<QThread> deliveryThread_;
};

} // namespace Scribe

Q_DECLARE_METATYPE(Scribe::SessionProgress)
