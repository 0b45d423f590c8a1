#include "TranscriptionWorkerPool.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QThread>
#include <algorithm>
#include <exception>
#include <memory>

namespace Scribe {

TranscriptionWorkerPool::TranscriptionWorkerPool(int workerCount, SpeechModelFactory factory)
    : workerCount_(std::max(1, workerCount))
    , factory_(std::move(factory)) {
}

WorkerPoolStats TranscriptionWorkerPool::lastRunStats() const {
    QMutexLocker locker(&mutex_);
    return stats_;
}

std::vector<ChunkOutcome> TranscriptionWorkerPool::run(const std::vector<ChunkSpec>& chunks,
                                                       const ChunkJob& job,
                                                       const CompletionCallback& onComplete,
                                                       const CancellationToken& cancellation) {
    const int threadCount = static_cast<int>(std::min<size_t>(workerCount_, chunks.size()));
    {
        QMutexLocker locker(&mutex_);
        nextChunk_ = 0;
        outcomes_.clear();
        outcomes_.reserve(chunks.size());
        stats_ = WorkerPoolStats();
        stats_.workers = threadCount;
    }
    active_ = 0;

    if (chunks.empty()) {
        return {};
    }

    SCRIBE_INFO("Starting {} transcription workers for {} chunks", threadCount, chunks.size());

    std::vector<std::unique_ptr<QThread>> threads;
    threads.reserve(static_cast<size_t>(threadCount));
    for (int i = 0; i < threadCount; ++i) {
        std::unique_ptr<QThread> thread(QThread::create([this, &chunks, &job, &onComplete, &cancellation]() {
            workerLoop(chunks, job, onComplete, cancellation);
        }));
        thread->setObjectName(QString("transcriber-%1").arg(i));
        thread->start();
        threads.push_back(std::move(thread));
    }
    for (auto& thread : threads) {
        thread->wait();
    }

    QMutexLocker locker(&mutex_);
    SCRIBE_INFO("Transcription workers finished: {} chunks, {} model loads, peak concurrency {}",
                stats_.chunksProcessed, stats_.modelLoads, stats_.peakConcurrency);
    return std::move(outcomes_);
}

void TranscriptionWorkerPool::workerLoop(const std::vector<ChunkSpec>& chunks,
                                         const ChunkJob& job,
                                         const CompletionCallback& onComplete,
                                         const CancellationToken& cancellation) {
    // One model per worker, built lazily and reused for every chunk it takes.
    std::unique_ptr<SpeechModel> model;

    for (;;) {
        size_t index = 0;
        {
            QMutexLocker locker(&mutex_);
            if (nextChunk_ >= chunks.size()) {
                return;
            }
            index = nextChunk_++;
        }
        const ChunkSpec& chunk = chunks[index];

        if (cancellation.isCancelled()) {
            record(makeUnexpected(makeChunkError(chunk, ChunkStage::Cancelled, "session cancelled")),
                   onComplete);
            continue;
        }

        const int running = ++active_;
        {
            QMutexLocker locker(&mutex_);
            stats_.peakConcurrency = std::max(stats_.peakConcurrency, running);
        }
        ChunkOutcome outcome = runOne(chunk, model, job);
        --active_;

        record(std::move(outcome), onComplete);
    }
}

ChunkOutcome TranscriptionWorkerPool::runOne(const ChunkSpec& chunk,
                                             std::unique_ptr<SpeechModel>& model,
                                             const ChunkJob& job) {
    try {
        if (!model) {
            auto created = factory_();
            if (created.hasError()) {
                return makeUnexpected(makeChunkError(chunk, ChunkStage::Transcription,
                    modelErrorToString(created.error())));
            }
            model = std::move(created).value();
            QMutexLocker locker(&mutex_);
            ++stats_.modelLoads;
        }
        return job(chunk, *model);
    } catch (const std::exception& ex) {
        return makeUnexpected(makeChunkError(chunk, ChunkStage::Transcription,
            QString("exception: %1").arg(QString::fromUtf8(ex.what()))));
    }
}

void TranscriptionWorkerPool::record(ChunkOutcome outcome, const CompletionCallback& onComplete) {
    if (onComplete) {
        try {
            onComplete(outcome);
        } catch (const std::exception& ex) {
            SCRIBE_WARN("Chunk completion callback failed: {}", ex.what());
        }
    }

    QMutexLocker locker(&mutex_);
    ++stats_.chunksProcessed;
    outcomes_.push_back(std::move(outcome));
}

} // namespace Scribe
