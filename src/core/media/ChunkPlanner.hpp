#pragma once

#include <QtCore/QString>
#include <optional>
#include <vector>

#include "core/common/Config.hpp"
#include "core/common/Expected.hpp"
#include "MediaTypes.hpp"

namespace Scribe {

enum class PlanError {
    DurationUnknown,
    TooManyChunks       // more than ChunkPlanner::kMaxChunks
};

/**
 * @brief Splits a media duration into contiguous chunk specifications.
 *
 * The configured chunk length is clamped to [minSeconds, maxSeconds], then
 * short media (below shortMediaThreshold) is capped at shortMediaChunkCap and
 * long media (above longMediaThreshold) at longMediaChunkCap. Pure: no I/O.
 */
class ChunkPlanner {
public:
    static constexpr int kMaxChunks = 100000;

    explicit ChunkPlanner(Config::ChunkingSettings settings = Config::ChunkingSettings());

    // Chunk length in seconds that plan() would use for this duration.
    int effectiveChunkSeconds(double duration,
                              std::optional<int> requestedSeconds = std::nullopt) const;

    Expected<std::vector<ChunkSpec>, PlanError> plan(double duration,
                                                     const QString& mediaPath,
                                                     const QString& outputDir,
                                                     std::optional<int> requestedSeconds = std::nullopt) const;

    // <base>_part_<NNN>.mp4
    static QString chunkFileName(const QString& baseName, int index);

    const Config::ChunkingSettings& settings() const { return settings_; }

private:
    Config::ChunkingSettings settings_;
};

} // namespace Scribe
