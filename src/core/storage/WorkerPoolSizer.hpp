#pragma once

#include "core/common/Config.hpp"

namespace Scribe {

/**
 * @brief Number of transcription workers that fit in memory.
 *
 * budget  = max(floor((availableGb - systemReserveGb) / memoryPerWorkerGb), minWorkers)
 * workers = max(minWorkers, min(cpuCount, maxWorkersCap, budget))
 *
 * Non-finite or negative memory counts as zero; cpuCount below 1 counts as 1.
 * Recompute before every transcription run; memory changes between runs.
 */
int computeOptimalWorkers(double availableGb, int cpuCount, const WorkerPoolConfig& config);

// Advisory only: usedPercent above the configured threshold.
bool isUnderMemoryPressure(double usedPercent, const WorkerPoolConfig& config);

} // namespace Scribe
