#pragma once

#include <QtCore/QMutex>
#include <atomic>
#include <functional>
#include <vector>

#include "core/common/CancellationToken.hpp"
#include "core/media/MediaTypes.hpp"
#include "SpeechModel.hpp"
#include "TranscriptionTypes.hpp"

namespace Scribe {

struct WorkerPoolStats {
    int workers = 0;
    int modelLoads = 0;
    int peakConcurrency = 0;
    int chunksProcessed = 0;
};

/**
 * @brief Runs chunk jobs on a fixed set of dedicated worker threads.
 *
 * Each worker builds its own SpeechModel with the factory the first time it
 * takes a chunk and keeps it for every later chunk. A failed model load
 * fails that chunk only; the worker tries again on its next chunk. Chunks
 * complete in any order. After cancellation queued chunks are reported as
 * cancelled without running and in-flight chunks finish.
 */
class TranscriptionWorkerPool {
public:
    using ChunkJob = std::function<ChunkOutcome(const ChunkSpec&, SpeechModel&)>;
    // Called on the worker thread once per chunk, in completion order.
    using CompletionCallback = std::function<void(const ChunkOutcome&)>;

    TranscriptionWorkerPool(int workerCount, SpeechModelFactory factory);

    TranscriptionWorkerPool(const TranscriptionWorkerPool&) = delete;
    TranscriptionWorkerPool& operator=(const TranscriptionWorkerPool&) = delete;

    // Blocks until every chunk has an outcome. Outcomes are in completion order.
    std::vector<ChunkOutcome> run(const std::vector<ChunkSpec>& chunks,
                                  const ChunkJob& job,
                                  const CompletionCallback& onComplete,
                                  const CancellationToken& cancellation);

    int workerCount() const { return workerCount_; }
    WorkerPoolStats lastRunStats() const;

private:
    void workerLoop(const std::vector<ChunkSpec>& chunks,
                    const ChunkJob& job,
                    const CompletionCallback& onComplete,
                    const CancellationToken& cancellation);
    ChunkOutcome runOne(const ChunkSpec& chunk,
                        std::unique_ptr<SpeechModel>& model,
                        const ChunkJob& job);
    void record(ChunkOutcome outcome, const CompletionCallback& onComplete);

    const int workerCount_;
    SpeechModelFactory factory_;

    mutable QMutex mutex_;
    size_t nextChunk_ = 0;
    std::vector<ChunkOutcome> outcomes_;
    WorkerPoolStats stats_;
    std::atomic<int> active_{0};
};

} // namespace Scribe
