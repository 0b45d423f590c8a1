#pragma once

#include <QtCore/QMutex>
#include <QtCore/QString>
#include <QtCore/QStringList>
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <vector>

#include "core/common/Expected.hpp"
#include "core/media/DurationProber.hpp"
#include "core/media/Transcoder.hpp"
#include "core/progress/ProgressTracker.hpp"
#include "core/storage/MemoryManager.hpp"
#include "core/transcription/SpeechModel.hpp"

namespace Scribe {
namespace Test {

/**
 * @brief Duration prober returning a fixed duration or error
 */
class FakeDurationProber : public DurationProber {
public:
    explicit FakeDurationProber(double duration = 650.0) : duration_(duration) {}

    void setDuration(double duration) { duration_ = duration; error_.reset(); }
    void setError(MediaError error) { error_ = error; }

    Expected<double, MediaError> probe(const QString& mediaPath) override;

    int probeCount() const { return probes_; }
    QString lastPath() const;

private:
    double duration_;
    std::optional<MediaError> error_;
    std::atomic<int> probes_{0};
    mutable QMutex mutex_;
    QString lastPath_;
};

/**
 * @brief Transcoder that writes placeholder files instead of running ffmpeg
 *
 * Chunk extractions can be failed by start time and audio extractions by a
 * fragment of the output path. A delay makes calls overlap and honours the
 * WorkLimit the way the real adapter does.
 */
class FakeTranscoder : public Transcoder {
public:
    Expected<void, MediaError> extract(const QString& inputPath,
                                       double start,
                                       std::optional<double> duration,
                                       const QString& outputPath,
                                       const EncodingOptions& options,
                                       const WorkLimit& limit) override;

    void failChunkAt(double startTime, MediaError error = MediaError::TranscodeFailed);
    void failAudioFor(const QString& pathFragment, MediaError error = MediaError::TranscodeFailed);
    void setDelayMs(int delayMs) { delayMs_ = delayMs; }
    void setOutputBytes(int bytes) { outputBytes_ = bytes; }
    // Failing calls still write half a file first, like an aborted encode.
    void setPartialOutputOnFailure(bool enabled) { partialOnFailure_ = enabled; }
    // Run this on the calling thread before every chunk extraction.
    void setChunkHook(std::function<void(double startTime)> hook);

    int chunkCalls() const { return chunkCalls_; }
    int audioCalls() const { return audioCalls_; }
    int peakConcurrency() const { return peak_; }
    QStringList outputs() const;
    std::vector<EncodingOptions> optionsSeen() const;

private:
    mutable QMutex mutex_;
    std::map<double, MediaError> chunkFailures_;
    std::map<QString, MediaError> audioFailures_;
    std::function<void(double)> chunkHook_;
    QStringList outputs_;
    std::vector<EncodingOptions> options_;
    std::atomic<int> delayMs_{0};
    std::atomic<int> outputBytes_{64};
    std::atomic<bool> partialOnFailure_{false};
    std::atomic<int> chunkCalls_{0};
    std::atomic<int> audioCalls_{0};
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

/**
 * @brief Shared script for FakeSpeechModel instances
 *
 * Keyed by a fragment of the audio path (e.g. "part_001"). Thread-safe.
 */
class FakeSpeechScript {
public:
    void setTranscript(const QString& fragment, const ModelTranscript& transcript);
    void setText(const QString& fragment, const QString& text);
    void failFor(const QString& fragment, ModelError error = ModelError::InferenceFailed);
    void throwFor(const QString& fragment);
    // Blocks until the WorkLimit stops the call.
    void hangFor(const QString& fragment);
    void setDelayMs(int delayMs) { delayMs_ = delayMs; }

    Expected<ModelTranscript, ModelError> run(const QString& audioPath, const WorkLimit& limit);

    int calls() const { return calls_; }
    int peakConcurrency() const { return peak_; }
    QStringList audioPaths() const;

private:
    std::optional<QString> matchLocked(const std::map<QString, ModelError>& map, const QString& path) const;

    mutable QMutex mutex_;
    std::map<QString, ModelTranscript> transcripts_;
    std::map<QString, ModelError> failures_;
    std::set<QString> throws_;
    std::set<QString> hangs_;
    QStringList audioPaths_;
    std::atomic<int> delayMs_{0};
    std::atomic<int> calls_{0};
    std::atomic<int> active_{0};
    std::atomic<int> peak_{0};
};

class FakeSpeechModel : public SpeechModel {
public:
    explicit FakeSpeechModel(std::shared_ptr<FakeSpeechScript> script) : script_(std::move(script)) {}

    Expected<ModelTranscript, ModelError> transcribe(const QString& audioPath,
                                                     const TranscribeOptions& options,
                                                     const WorkLimit& limit) override;

    int lastThreads() const { return lastThreads_; }

private:
    std::shared_ptr<FakeSpeechScript> script_;
    int lastThreads_ = 0;
};

/**
 * @brief Builds FakeSpeechModels and counts how often a model was loaded
 */
class FakeSpeechModelFactory {
public:
    explicit FakeSpeechModelFactory(std::shared_ptr<FakeSpeechScript> script = std::make_shared<FakeSpeechScript>())
        : script_(std::move(script)) {}

    SpeechModelFactory factory();

    // The next `count` loads fail with ModelLoadFailed.
    void failNextLoads(int count) { failLoads_ = count; }

    int loads() const { return loads_; }
    int attempts() const { return attempts_; }
    std::shared_ptr<FakeSpeechScript> script() const { return script_; }

private:
    std::shared_ptr<FakeSpeechScript> script_;
    std::atomic<int> failLoads_{0};
    std::atomic<int> loads_{0};
    std::atomic<int> attempts_{0};
};

class FakeMemoryTelemetry : public MemoryTelemetry {
public:
    FakeMemoryTelemetry(double availableGb = 16.0, int cpus = 8, double usedPercent = 40.0);

    MemoryInfo snapshot() override;
    int cpuCount() const override { return cpus_; }

    void setAvailableGb(double availableGb);
    void setUsedPercent(double usedPercent);
    void setCpuCount(int cpus) { cpus_ = cpus; }

    int snapshots() const { return snapshots_; }

private:
    mutable QMutex mutex_;
    MemoryInfo info_;
    std::atomic<int> cpus_;
    std::atomic<int> snapshots_{0};
};

/**
 * @brief Records every progress emission in arrival order
 */
class RecordingProgressObserver : public ProgressObserver {
public:
    void onProgress(const QString& sessionId, const SessionProgress& progress) override;

    void setThrowOnEmit(bool enabled) { throwOnEmit_ = enabled; }
    void setCallback(std::function<void(const QString&, const SessionProgress&)> callback);

    std::vector<SessionProgress> snapshots() const;
    std::vector<SessionProgress> snapshotsFor(const QString& sessionId) const;
    int count() const;

private:
    mutable QMutex mutex_;
    std::vector<SessionProgress> snapshots_;
    std::function<void(const QString&, const SessionProgress&)> callback_;
    std::atomic<bool> throwOnEmit_{false};
};

} // namespace Test
} // namespace Scribe
