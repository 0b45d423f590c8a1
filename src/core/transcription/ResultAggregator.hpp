#pragma once

#include <QtCore/QMutex>
#include <QtCore/QString>
#include <vector>

#include "core/common/Expected.hpp"
#include "TranscriptionTypes.hpp"

namespace Scribe {

enum class AggregationError {
    MalformedSegment
};

struct MergedTranscript {
    QString transcript;
    std::vector<Segment> segments;       // time-ordered union of all chunk segments
    std::vector<ChunkResult> chunks;     // successful chunks, ordered by start time
    int totalWords = 0;
};

/**
 * @brief Collects chunk outcomes in any order and merges them by start time.
 *
 * Only successful outcomes take part in the merge; failures are kept for
 * reporting. The merge is a stable sort by start time (ties by chunk index),
 * so the result does not depend on completion order. add() is thread-safe.
 */
class ResultAggregator {
public:
    ResultAggregator() = default;

    void add(const ChunkOutcome& outcome);

    Expected<MergedTranscript, AggregationError> merge() const;

    std::vector<ChunkError> failures() const;
    int successCount() const;
    int failureCount() const;

    // "\n\n--- <name> [HH:MM:SS] ---\n\n<text>"
    static QString chunkBlock(const ChunkResult& result);
    static int countWords(const QString& text);

private:
    mutable QMutex mutex_;
    std::vector<ChunkResult> results_;
    std::vector<ChunkError> failures_;
};

} // namespace Scribe
