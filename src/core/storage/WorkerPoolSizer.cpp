#include "WorkerPoolSizer.hpp"

#include <algorithm>
#include <cmath>

namespace Scribe {

int computeOptimalWorkers(double availableGb, int cpuCount, const WorkerPoolConfig& config) {
    const int minWorkers = std::max(1, config.minWorkers);
    const int maxWorkersCap = std::max(1, config.maxWorkersCap);
    const int cpus = std::max(1, cpuCount);

    if (!std::isfinite(availableGb) || availableGb < 0.0) {
        availableGb = 0.0;
    }

    double memoryBudget = static_cast<double>(minWorkers);
    if (config.memoryPerWorkerGb > 0.0) {
        const double workersInMemory =
            std::floor((availableGb - config.systemReserveGb) / config.memoryPerWorkerGb);
        if (std::isfinite(workersInMemory)) {
            memoryBudget = std::max(workersInMemory, memoryBudget);
        }
    }

    const double optimal = std::min({static_cast<double>(cpus),
                                     static_cast<double>(maxWorkersCap),
                                     memoryBudget});
    return std::max(minWorkers, static_cast<int>(optimal));
}

bool isUnderMemoryPressure(double usedPercent, const WorkerPoolConfig& config) {
    return usedPercent > config.memoryPressureThresholdPercent;
}

} // namespace Scribe
