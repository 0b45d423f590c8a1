#pragma once

#include <QtCore/QString>
#include <memory>

#include "core/common/CancellationToken.hpp"
#include "core/common/Config.hpp"
#include "core/media/MediaTypes.hpp"
#include "core/media/Transcoder.hpp"
#include "core/storage/TempFileManager.hpp"
#include "SpeechModel.hpp"
#include "TranscriptionTypes.hpp"

namespace Scribe {

/**
 * @brief Turns one extracted chunk file into a ChunkOutcome.
 *
 * Extracts mono 16 kHz audio next to the chunk, runs the speech model and
 * shifts every segment by the chunk start so timestamps are absolute. The
 * audio file is deleted afterwards whatever the outcome. All failures,
 * including exceptions from the model, come back as ChunkError.
 */
class ChunkTranscriber {
public:
    ChunkTranscriber(std::shared_ptr<Transcoder> transcoder,
                     std::shared_ptr<TempFileManager> tempFiles,
                     Config::TranscriptionSettings settings);

    ChunkOutcome transcribe(const ChunkSpec& chunk,
                            SpeechModel& model,
                            const CancellationToken& cancellation,
                            int threads) const;

    static QString audioPathFor(const ChunkSpec& chunk);

private:
    ChunkOutcome runChunk(const ChunkSpec& chunk,
                          SpeechModel& model,
                          const WorkLimit& limit,
                          int threads) const;

    std::shared_ptr<Transcoder> transcoder_;
    std::shared_ptr<TempFileManager> tempFiles_;
    Config::TranscriptionSettings settings_;
};

} // namespace Scribe
