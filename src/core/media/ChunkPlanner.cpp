#include "ChunkPlanner.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFileInfo>
#include <algorithm>
#include <cmath>

namespace Scribe {

ChunkPlanner::ChunkPlanner(Config::ChunkingSettings settings)
    : settings_(std::move(settings)) {
}

int ChunkPlanner::effectiveChunkSeconds(double duration, std::optional<int> requestedSeconds) const {
    // Unvalidated settings may have the bounds swapped.
    const int lower = std::max(1, std::min(settings_.minSeconds, settings_.maxSeconds));
    const int upper = std::max(lower, std::max(settings_.minSeconds, settings_.maxSeconds));
    int chunkSeconds = requestedSeconds.value_or(settings_.defaultSeconds);
    chunkSeconds = std::clamp(chunkSeconds, lower, upper);

    if (duration < settings_.shortMediaThreshold) {
        chunkSeconds = std::min(chunkSeconds, settings_.shortMediaChunkCap);
    } else if (duration > settings_.longMediaThreshold) {
        chunkSeconds = std::min(chunkSeconds, settings_.longMediaChunkCap);
    }
    return std::max(chunkSeconds, 1);
}

Expected<std::vector<ChunkSpec>, PlanError> ChunkPlanner::plan(double duration,
                                                                const QString& mediaPath,
                                                                const QString& outputDir,
                                                                std::optional<int> requestedSeconds) const {
    if (!std::isfinite(duration) || duration <= 0.0) {
        return makeUnexpected(PlanError::DurationUnknown);
    }

    const int chunkSeconds = effectiveChunkSeconds(duration, requestedSeconds);
    const double exactCount = std::ceil(duration / chunkSeconds);
    if (exactCount > kMaxChunks) {
        SCRIBE_ERROR("{:.0f}s of media would need {:.0f} chunks of {}s", duration, exactCount, chunkSeconds);
        return makeUnexpected(PlanError::TooManyChunks);
    }
    const auto count = static_cast<int>(exactCount);
    const QString baseName = QFileInfo(mediaPath).completeBaseName();

    std::vector<ChunkSpec> specs;
    specs.reserve(static_cast<size_t>(count));
    for (int i = 0; i < count; ++i) {
        const double start = static_cast<double>(i) * chunkSeconds;
        if (start >= duration) {
            break;
        }
        ChunkSpec spec;
        spec.index = i;
        spec.startTime = start;
        spec.duration = std::min(static_cast<double>(chunkSeconds), duration - start);
        spec.name = chunkFileName(baseName, i);
        spec.outputPath = outputDir.isEmpty() ? spec.name : outputDir + '/' + spec.name;
        specs.push_back(std::move(spec));
    }

    SCRIBE_DEBUG("Planned {} chunks of {}s for {:.2f}s of media", specs.size(), chunkSeconds, duration);
    return specs;
}

QString ChunkPlanner::chunkFileName(const QString& baseName, int index) {
    return QString("%1_part_%2.mp4").arg(baseName).arg(index, 3, 10, QChar('0'));
}

} // namespace Scribe
