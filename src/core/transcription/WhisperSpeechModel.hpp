#pragma once

#include <QtCore/QString>
#include <memory>
#include <vector>

#include "SpeechModel.hpp"

struct whisper_context;

namespace Scribe {

/**
 * @brief whisper.cpp backed speech model.
 *
 * Each instance owns its own whisper context, so instances may run on
 * different threads at the same time; one instance must not.
 */
class WhisperSpeechModel : public SpeechModel {
public:
    ~WhisperSpeechModel() override;

    WhisperSpeechModel(const WhisperSpeechModel&) = delete;
    WhisperSpeechModel& operator=(const WhisperSpeechModel&) = delete;

    static Expected<std::unique_ptr<SpeechModel>, ModelError> load(const QString& modelPath);

    // Factory for TranscriptionWorkerPool.
    static SpeechModelFactory factory(const QString& modelPath);

    Expected<ModelTranscript, ModelError> transcribe(const QString& audioPath,
                                                     const TranscribeOptions& options,
                                                     const WorkLimit& limit) override;

    static Expected<std::vector<float>, ModelError> loadWavFile(const QString& filePath);

private:
    explicit WhisperSpeechModel(whisper_context* ctx);

    static void installLogHandler();
    ModelTranscript extractTranscript() const;

    whisper_context* ctx_;
};

} // namespace Scribe
