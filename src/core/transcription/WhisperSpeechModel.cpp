#include "WhisperSpeechModel.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QStringList>
#include <QtCore/QThread>
#include <QtCore/QtEndian>

#include <whisper.h>
#include <algorithm>
#include <cstring>
#include <mutex>
#include <string>

namespace Scribe {

namespace {

constexpr quint32 kWhisperSampleRate = 16000;
constexpr qint64 kMinModelBytes = 1024 * 1024;

bool shouldAbort(void* userData) {
    return static_cast<const WorkLimit*>(userData)->stopRequested();
}

quint16 readU16(const char* data) {
    return qFromLittleEndian<quint16>(reinterpret_cast<const uchar*>(data));
}

quint32 readU32(const char* data) {
    return qFromLittleEndian<quint32>(reinterpret_cast<const uchar*>(data));
}

} // namespace

WhisperSpeechModel::WhisperSpeechModel(whisper_context* ctx)
    : ctx_(ctx) {
}

WhisperSpeechModel::~WhisperSpeechModel() {
    if (ctx_) {
        whisper_free(ctx_);
        ctx_ = nullptr;
    }
}

void WhisperSpeechModel::installLogHandler() {
    static std::once_flag once;
    std::call_once(once, [] {
        whisper_log_set([](enum ggml_log_level level, const char* text, void* userData) {
            Q_UNUSED(userData)
            const std::string message = QString::fromUtf8(text).trimmed().toStdString();
            if (message.empty()) {
                return;
            }
            switch (level) {
                case GGML_LOG_LEVEL_ERROR:
                    SCRIBE_ERROR("whisper: {}", message);
                    break;
                case GGML_LOG_LEVEL_WARN:
                    SCRIBE_WARN("whisper: {}", message);
                    break;
                default:
                    SCRIBE_TRACE("whisper: {}", message);
                    break;
            }
        }, nullptr);
    });
}

Expected<std::unique_ptr<SpeechModel>, ModelError> WhisperSpeechModel::load(const QString& modelPath) {
    installLogHandler();

    QFileInfo modelFile(modelPath);
    if (!modelFile.exists() || !modelFile.isFile()) {
        SCRIBE_ERROR("Model file not found: {}", modelPath.toStdString());
        return makeUnexpected(ModelError::ModelNotFound);
    }
    if (modelFile.size() < kMinModelBytes) {
        SCRIBE_ERROR("Model file too small: {}", modelPath.toStdString());
        return makeUnexpected(ModelError::ModelLoadFailed);
    }

    QElapsedTimer timer;
    timer.start();

    whisper_context_params cparams = whisper_context_default_params();
    const std::string path = modelPath.toStdString();
    whisper_context* ctx = whisper_init_from_file_with_params(path.c_str(), cparams);
    if (!ctx) {
        SCRIBE_ERROR("Failed to load model: {}", path);
        return makeUnexpected(ModelError::ModelLoadFailed);
    }

    SCRIBE_INFO("Loaded model {} in {}ms on thread {}", path, timer.elapsed(),
                reinterpret_cast<quintptr>(QThread::currentThreadId()));
    return std::unique_ptr<SpeechModel>(new WhisperSpeechModel(ctx));
}

SpeechModelFactory WhisperSpeechModel::factory(const QString& modelPath) {
    return [modelPath]() { return WhisperSpeechModel::load(modelPath); };
}

Expected<ModelTranscript, ModelError> WhisperSpeechModel::transcribe(const QString& audioPath,
                                                                     const TranscribeOptions& options,
                                                                     const WorkLimit& limit) {
    if (limit.cancelled()) {
        return makeUnexpected(ModelError::Cancelled);
    }

    auto audio = loadWavFile(audioPath);
    if (audio.hasError()) {
        return makeUnexpected(audio.error());
    }
    const std::vector<float>& samples = audio.value();
    if (samples.empty()) {
        return ModelTranscript{};
    }

    // whisper keeps the pointer, so the string must outlive whisper_full.
    const std::string language = options.language.isEmpty() ? std::string("auto")
                                                             : options.language.toStdString();

    whisper_full_params params = whisper_full_default_params(WHISPER_SAMPLING_GREEDY);
    params.language = language.c_str();
    params.n_threads = options.threads > 0 ? options.threads : std::max(1, QThread::idealThreadCount());
    params.token_timestamps = options.wordTimestamps;
    params.print_progress = false;
    params.print_realtime = false;
    params.print_timestamps = false;
    params.print_special = false;
    params.abort_callback = shouldAbort;
    params.abort_callback_user_data = const_cast<WorkLimit*>(&limit);

    QElapsedTimer timer;
    timer.start();
    const int ret = whisper_full(ctx_, params, samples.data(), static_cast<int>(samples.size()));
    if (ret != 0) {
        if (limit.cancelled()) {
            return makeUnexpected(ModelError::Cancelled);
        }
        if (limit.expired()) {
            return makeUnexpected(ModelError::Timeout);
        }
        SCRIBE_ERROR("whisper_full failed with code {} for {}", ret, audioPath.toStdString());
        return makeUnexpected(ModelError::InferenceFailed);
    }

    ModelTranscript transcript = extractTranscript();
    SCRIBE_DEBUG("Transcribed {} ({} samples) in {}ms, {} segments", audioPath.toStdString(),
                 samples.size(), timer.elapsed(), transcript.segments.size());
    return transcript;
}

ModelTranscript WhisperSpeechModel::extractTranscript() const {
    ModelTranscript transcript;

    const int segmentCount = whisper_full_n_segments(ctx_);
    transcript.segments.reserve(static_cast<size_t>(std::max(segmentCount, 0)));

    QStringList texts;
    for (int i = 0; i < segmentCount; ++i) {
        ModelSegment segment;
        // t0/t1 are in centiseconds.
        segment.start = whisper_full_get_segment_t0(ctx_, i) / 100.0;
        segment.end = whisper_full_get_segment_t1(ctx_, i) / 100.0;

        const char* text = whisper_full_get_segment_text(ctx_, i);
        segment.text = text ? QString::fromUtf8(text).trimmed() : QString();

        const int tokenCount = whisper_full_n_tokens(ctx_, i);
        double probabilitySum = 0.0;
        for (int j = 0; j < tokenCount; ++j) {
            probabilitySum += whisper_full_get_token_p(ctx_, i, j);
        }
        segment.confidence = tokenCount > 0 ? static_cast<float>(probabilitySum / tokenCount) : 0.0f;

        if (!segment.text.isEmpty()) {
            texts << segment.text;
        }
        transcript.segments.push_back(std::move(segment));
    }

    transcript.text = texts.join(' ');

    const int langId = whisper_full_lang_id(ctx_);
    const char* lang = langId >= 0 ? whisper_lang_str(langId) : nullptr;
    transcript.language = lang ? QString::fromUtf8(lang) : QString("unknown");
    return transcript;
}

Expected<std::vector<float>, ModelError> WhisperSpeechModel::loadWavFile(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        SCRIBE_ERROR("Cannot open WAV file: {}", filePath.toStdString());
        return makeUnexpected(ModelError::AudioLoadFailed);
    }

    const QByteArray bytes = file.readAll();
    const char* data = bytes.constData();
    const qint64 size = bytes.size();

    if (size < 12 || std::strncmp(data, "RIFF", 4) != 0 || std::strncmp(data + 8, "WAVE", 4) != 0) {
        SCRIBE_ERROR("Not a valid WAV file: {}", filePath.toStdString());
        return makeUnexpected(ModelError::InvalidAudio);
    }

    // Walk the RIFF chunks; ffmpeg may emit LIST metadata before "data".
    quint16 audioFormat = 0;
    quint16 channels = 0;
    quint32 sampleRate = 0;
    quint16 bitsPerSample = 0;
    const char* pcm = nullptr;
    qint64 pcmBytes = 0;

    qint64 offset = 12;
    while (offset + 8 <= size) {
        const char* chunkId = data + offset;
        const qint64 chunkSize = readU32(data + offset + 4);
        const qint64 body = offset + 8;

        if (std::strncmp(chunkId, "fmt ", 4) == 0 && chunkSize >= 16 && body + 16 <= size) {
            audioFormat = readU16(data + body);
            channels = readU16(data + body + 2);
            sampleRate = readU32(data + body + 4);
            bitsPerSample = readU16(data + body + 14);
        } else if (std::strncmp(chunkId, "data", 4) == 0) {
            pcm = data + body;
            pcmBytes = std::min(chunkSize, size - body);
            break;
        }
        offset = body + chunkSize + (chunkSize & 1);
    }

    if (audioFormat != 1 || bitsPerSample != 16 || channels == 0 || sampleRate == 0 || !pcm) {
        SCRIBE_ERROR("Unsupported WAV layout in {}: format={} bits={} channels={} rate={}",
                     filePath.toStdString(), audioFormat, bitsPerSample, channels, sampleRate);
        return makeUnexpected(ModelError::InvalidAudio);
    }

    // Interleaved 16-bit frames, downmixed to mono.
    const qint64 frameCount = pcmBytes / (2 * channels);
    std::vector<float> mono;
    mono.reserve(static_cast<size_t>(frameCount));
    for (qint64 frame = 0; frame < frameCount; ++frame) {
        float sum = 0.0f;
        for (quint16 c = 0; c < channels; ++c) {
            const auto sample = static_cast<qint16>(readU16(pcm + (frame * channels + c) * 2));
            sum += static_cast<float>(sample) / 32768.0f;
        }
        mono.push_back(sum / channels);
    }

    if (sampleRate == kWhisperSampleRate || mono.size() < 2) {
        return mono;
    }

    // Linear resampling to 16 kHz.
    SCRIBE_DEBUG("Resampling {} from {}Hz to {}Hz", filePath.toStdString(), sampleRate, kWhisperSampleRate);
    const double ratio = static_cast<double>(kWhisperSampleRate) / sampleRate;
    const auto outCount = static_cast<size_t>(mono.size() * ratio);
    std::vector<float> resampled;
    resampled.reserve(outCount);
    for (size_t i = 0; i < outCount; ++i) {
        const double source = i / ratio;
        const auto index = static_cast<size_t>(source);
        if (index + 1 < mono.size()) {
            const auto frac = static_cast<float>(source - index);
            resampled.push_back(mono[index] * (1.0f - frac) + mono[index + 1] * frac);
        } else {
            resampled.push_back(mono.back());
        }
    }
    return resampled;
}

} // namespace Scribe
