#pragma once

#include <QtCore/QString>
#include <functional>
#include <memory>

#include "core/common/CancellationToken.hpp"
#include "core/common/Expected.hpp"
#include "TranscriptionTypes.hpp"

namespace Scribe {

class SpeechModel {
public:
    virtual ~SpeechModel() = default;

    /**
     * @brief Transcribes one 16 kHz mono WAV file.
     * @return Segments relative to the start of the audio
     */
    virtual Expected<ModelTranscript, ModelError> transcribe(const QString& audioPath,
                                                             const TranscribeOptions& options,
                                                             const WorkLimit& limit) = 0;
};

// Builds one model per worker; called on the worker's own thread.
using SpeechModelFactory = std::function<Expected<std::unique_ptr<SpeechModel>, ModelError>()>;

} // namespace Scribe
