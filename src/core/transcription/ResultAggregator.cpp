#include "ResultAggregator.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QRegularExpression>
#include <QtCore/QStringList>
#include <algorithm>

namespace Scribe {

void ResultAggregator::add(const ChunkOutcome& outcome) {
    QMutexLocker locker(&mutex_);
    if (outcome.hasValue()) {
        results_.push_back(outcome.value());
    } else {
        failures_.push_back(outcome.error());
    }
}

Expected<MergedTranscript, AggregationError> ResultAggregator::merge() const {
    std::vector<ChunkResult> ordered;
    {
        QMutexLocker locker(&mutex_);
        ordered = results_;
    }

    std::stable_sort(ordered.begin(), ordered.end(), [](const ChunkResult& lhs, const ChunkResult& rhs) {
        if (lhs.startTime != rhs.startTime) {
            return lhs.startTime < rhs.startTime;
        }
        return lhs.chunkIndex < rhs.chunkIndex;
    });

    MergedTranscript merged;
    QStringList blocks;
    for (const ChunkResult& result : ordered) {
        for (const Segment& segment : result.segments) {
            if (!segment.isWellFormed()) {
                SCRIBE_ERROR("Malformed segment in chunk {}: start={} end={}",
                             result.chunkIndex, segment.start, segment.end);
                return makeUnexpected(AggregationError::MalformedSegment);
            }
            merged.segments.push_back(segment);
        }
        blocks << chunkBlock(result);
    }

    // Chunks are disjoint, so this only reorders segments a model emitted out of order.
    std::stable_sort(merged.segments.begin(), merged.segments.end(),
                     [](const Segment& lhs, const Segment& rhs) { return lhs.start < rhs.start; });

    merged.transcript = blocks.join('\n');
    merged.totalWords = countWords(merged.transcript);
    merged.chunks = std::move(ordered);
    return merged;
}

std::vector<ChunkError> ResultAggregator::failures() const {
    QMutexLocker locker(&mutex_);
    std::vector<ChunkError> sorted = failures_;
    std::sort(sorted.begin(), sorted.end(),
              [](const ChunkError& lhs, const ChunkError& rhs) { return lhs.chunkIndex < rhs.chunkIndex; });
    return sorted;
}

int ResultAggregator::successCount() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(results_.size());
}

int ResultAggregator::failureCount() const {
    QMutexLocker locker(&mutex_);
    return static_cast<int>(failures_.size());
}

QString ResultAggregator::chunkBlock(const ChunkResult& result) {
    return QString("\n\n--- %1 [%2] ---\n\n%3")
        .arg(result.chunkName, formatTimestamp(result.startTime), result.transcriptText);
}

int ResultAggregator::countWords(const QString& text) {
    static const QRegularExpression whitespace(R"(\s+)");
    return static_cast<int>(text.split(whitespace, Qt::SkipEmptyParts).size());
}

} // namespace Scribe
