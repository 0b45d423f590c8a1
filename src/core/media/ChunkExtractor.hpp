#pragma once

#include <QtCore/QString>
#include <memory>
#include <vector>

#include "core/common/CancellationToken.hpp"
#include "core/common/Config.hpp"
#include "core/storage/TempFileManager.hpp"
#include "core/transcription/TranscriptionTypes.hpp"
#include "MediaTypes.hpp"
#include "Transcoder.hpp"

namespace Scribe {

struct ExtractionReport {
    std::vector<ChunkSpec> extracted;   // index order
    std::vector<ChunkError> dropped;    // index order
};

/**
 * @brief Writes every planned chunk to its own file.
 *
 * Runs on a private thread pool of min(extractionPoolCap, chunk count)
 * threads and returns only after every submitted chunk has resolved. A
 * failed chunk is logged and dropped, never retried. Extracted files are
 * registered pinned with the TempFileManager; the caller unpins each one
 * once it has been transcribed.
 */
class ChunkExtractor {
public:
    ChunkExtractor(std::shared_ptr<Transcoder> transcoder,
                   std::shared_ptr<TempFileManager> tempFiles,
                   Config::ChunkingSettings settings);

    ExtractionReport extract(const QString& mediaPath,
                             const std::vector<ChunkSpec>& chunks,
                             const CancellationToken& cancellation) const;

    int poolSizeFor(int chunkCount) const;

private:
    Expected<ChunkSpec, ChunkError> extractOne(const QString& mediaPath,
                                               const ChunkSpec& chunk,
                                               const CancellationToken& cancellation) const;

    std::shared_ptr<Transcoder> transcoder_;
    std::shared_ptr<TempFileManager> tempFiles_;
    Config::ChunkingSettings settings_;
};

} // namespace Scribe
