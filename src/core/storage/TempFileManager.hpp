#pragma once

#include <QtCore/QDateTime>
#include <QtCore/QMutex>
#include <QtCore/QString>
#include <map>
#include <vector>

namespace Scribe {

enum class TempFileKind {
    Chunk,
    Audio,
    Other
};

QString tempFileKindName(TempFileKind kind);

struct TempFileEntry {
    QString path;
    TempFileKind kind = TempFileKind::Other;
    QDateTime createdAt;
    qint64 size = 0;
    bool pinned = false;
    quint64 sequence = 0;
};

struct CleanupReport {
    int filesRemoved = 0;
    int filesTracked = 0;       // still tracked after the cleanup
    qint64 bytesReclaimed = 0;
};

struct CleanupStats {
    int count = 0;
    qint64 totalBytes = 0;
    std::map<TempFileKind, int> countsByKind;
};

/**
 * @brief Bounded registry of temporary files created during a session.
 *
 * Registering past the cap deletes the oldest unpinned files. Pinned files
 * (chunks still waiting for transcription) are never evicted, so the registry
 * may exceed the cap until they are unpinned. Deletion failures are logged as
 * warnings and never propagate. Thread-safe.
 */
class TempFileManager {
public:
    explicit TempFileManager(int maxFiles = 20);
    ~TempFileManager() = default;

    TempFileManager(const TempFileManager&) = delete;
    TempFileManager& operator=(const TempFileManager&) = delete;

    // Re-registering a tracked path refreshes its entry.
    CleanupReport addTempFile(const QString& path, TempFileKind kind, bool pinned = false);

    // Returns false when the path is not tracked.
    bool unpin(const QString& path);

    // Deletes one file now, tracked or not, and drops it from the registry.
    CleanupReport release(const QString& path);

    CleanupReport cleanupOldest();
    CleanupReport cleanupAll();
    CleanupReport cleanupByKind(TempFileKind kind);

    CleanupStats getCleanupStats() const;
    int trackedCount() const;
    bool isTracked(const QString& path) const;
    int maxFiles() const { return maxFiles_; }

private:
    std::vector<TempFileEntry> takeEvictableLocked();
    CleanupReport deleteEntries(const std::vector<TempFileEntry>& entries);
    static bool deleteFile(const QString& path, qint64& bytesReclaimed);

    const int maxFiles_;
    mutable QMutex mutex_;
    std::vector<TempFileEntry> entries_;
    quint64 nextSequence_ = 0;
};

} // namespace Scribe
