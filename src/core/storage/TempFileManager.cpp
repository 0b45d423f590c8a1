#include "TempFileManager.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <algorithm>
#include <functional>

namespace Scribe {

QString tempFileKindName(TempFileKind kind) {
    switch (kind) {
        case TempFileKind::Chunk: return "chunk";
        case TempFileKind::Audio: return "audio";
        case TempFileKind::Other: return "other";
    }
    return "other";
}

TempFileManager::TempFileManager(int maxFiles)
    : maxFiles_(std::max(1, maxFiles)) {
}

CleanupReport TempFileManager::addTempFile(const QString& path, TempFileKind kind, bool pinned) {
    std::vector<TempFileEntry> evicted;
    {
        QMutexLocker locker(&mutex_);

        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&path](const TempFileEntry& entry) { return entry.path == path; });
        if (it != entries_.end()) {
            entries_.erase(it);
        }

        TempFileEntry entry;
        entry.path = path;
        entry.kind = kind;
        entry.createdAt = QDateTime::currentDateTimeUtc();
        entry.size = QFileInfo(path).size();
        entry.pinned = pinned;
        entry.sequence = nextSequence_++;
        entries_.push_back(std::move(entry));

        evicted = takeEvictableLocked();
    }

    if (evicted.empty()) {
        CleanupReport report;
        report.filesTracked = trackedCount();
        return report;
    }

    SCRIBE_INFO("Temp file registry over limit ({}), evicting {} oldest files",
                maxFiles_, evicted.size());
    return deleteEntries(evicted);
}

bool TempFileManager::unpin(const QString& path) {
    std::vector<TempFileEntry> evicted;
    {
        QMutexLocker locker(&mutex_);
        auto it = std::find_if(entries_.begin(), entries_.end(),
                               [&path](const TempFileEntry& entry) { return entry.path == path; });
        if (it == entries_.end()) {
            return false;
        }
        it->pinned = false;
        evicted = takeEvictableLocked();
    }

    if (!evicted.empty()) {
        deleteEntries(evicted);
    }
    return true;
}

CleanupReport TempFileManager::release(const QString& path) {
    {
        QMutexLocker locker(&mutex_);
        entries_.erase(std::remove_if(entries_.begin(), entries_.end(),
                                      [&path](const TempFileEntry& entry) { return entry.path == path; }),
                       entries_.end());
    }

    TempFileEntry entry;
    entry.path = path;
    return deleteEntries({entry});
}

CleanupReport TempFileManager::cleanupOldest() {
    std::vector<TempFileEntry> evicted;
    {
        QMutexLocker locker(&mutex_);
        evicted = takeEvictableLocked();
    }
    return deleteEntries(evicted);
}

CleanupReport TempFileManager::cleanupAll() {
    std::vector<TempFileEntry> all;
    {
        QMutexLocker locker(&mutex_);
        all.swap(entries_);
    }

    CleanupReport report = deleteEntries(all);
    if (report.filesRemoved > 0) {
        SCRIBE_INFO("Cleaned up {} temp files, reclaimed {:.2f} MB",
                    report.filesRemoved, report.bytesReclaimed / (1024.0 * 1024.0));
    }
    return report;
}

CleanupReport TempFileManager::cleanupByKind(TempFileKind kind) {
    std::vector<TempFileEntry> matching;
    {
        QMutexLocker locker(&mutex_);
        auto split = std::stable_partition(entries_.begin(), entries_.end(),
                                           [kind](const TempFileEntry& entry) { return entry.kind != kind; });
        matching.assign(split, entries_.end());
        entries_.erase(split, entries_.end());
    }

    CleanupReport report = deleteEntries(matching);
    SCRIBE_DEBUG("Cleaned up {} {} files", report.filesRemoved, tempFileKindName(kind).toStdString());
    return report;
}

CleanupStats TempFileManager::getCleanupStats() const {
    QMutexLocker locker(&mutex_);
    CleanupStats stats;
    stats.count = static_cast<int>(entries_.size());
    for (const auto& entry : entries_) {
        stats.totalBytes += entry.size;
        ++stats.countsByKind[entry.kind];
    }
    return stats;
}

int TempFileManager::trackedCount() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(entries_.size());
}

bool TempFileManager::isTracked(const QString& path) const {
    QMutexLocker locker(&mutex_);
    return std::any_of(entries_.begin(), entries_.end(),
                       [&path](const TempFileEntry& entry) { return entry.path == path; });
}

std::vector<TempFileEntry> TempFileManager::takeEvictableLocked() {
    std::vector<TempFileEntry> evicted;
    auto excess = static_cast<int>(entries_.size()) - maxFiles_;
    if (excess <= 0) {
        return evicted;
    }

    std::vector<size_t> candidates;
    for (size_t i = 0; i < entries_.size(); ++i) {
        if (!entries_[i].pinned) {
            candidates.push_back(i);
        }
    }
    std::sort(candidates.begin(), candidates.end(), [this](size_t a, size_t b) {
        const auto& lhs = entries_[a];
        const auto& rhs = entries_[b];
        if (lhs.createdAt != rhs.createdAt) {
            return lhs.createdAt < rhs.createdAt;
        }
        return lhs.sequence < rhs.sequence;
    });
    if (static_cast<int>(candidates.size()) > excess) {
        candidates.resize(static_cast<size_t>(excess));
    }

    // Erase back to front so earlier indices stay valid.
    std::sort(candidates.begin(), candidates.end(), std::greater<size_t>());
    for (size_t index : candidates) {
        evicted.push_back(entries_[index]);
        entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(index));
    }
    return evicted;
}

CleanupReport TempFileManager::deleteEntries(const std::vector<TempFileEntry>& entries) {
    CleanupReport report;
    for (const auto& entry : entries) {
        qint64 bytes = 0;
        if (deleteFile(entry.path, bytes)) {
            ++report.filesRemoved;
            report.bytesReclaimed += bytes;
        }
    }
    report.filesTracked = trackedCount();
    return report;
}

bool TempFileManager::deleteFile(const QString& path, qint64& bytesReclaimed) {
    bytesReclaimed = 0;
    QFileInfo info(path);
    if (!info.exists()) {
        return true;
    }

    const qint64 size = info.size();
    if (!QFile::remove(path)) {
        SCRIBE_WARN("Failed to delete temp file: {}", path.toStdString());
        return false;
    }
    bytesReclaimed = size;
    SCRIBE_DEBUG("Deleted temp file: {} ({} bytes)", path.toStdString(), size);
    return true;
}

} // namespace Scribe
