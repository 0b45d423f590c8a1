#pragma once

#include <QtCore/QString>
#include <memory>
#include <vector>

#include "core/common/Config.hpp"
#include "WorkerPoolSizer.hpp"

namespace Scribe {

struct MemoryInfo {
    // Defaults are the conservative values used when telemetry is unreadable.
    double systemTotalGb = 8.0;
    double systemAvailableGb = 4.0;
    double systemUsedPercent = 50.0;
    double processRssMb = 100.0;
    double processVmsMb = 200.0;
    bool live = false;
};

class MemoryTelemetry {
public:
    virtual ~MemoryTelemetry() = default;

    virtual MemoryInfo snapshot() = 0;
    virtual int cpuCount() const = 0;
};

// Linux /proc reader; other platforms get the conservative defaults.
class ProcMemoryTelemetry : public MemoryTelemetry {
public:
    MemoryInfo snapshot() override;
    int cpuCount() const override;
};

enum class MemoryRecommendationType {
    Critical,       // more than 90% used
    Warning,        // more than 80% used
    LowMemory,      // less than 2 GB available
    WorkerLimit     // memory keeps workers below the core count
};

struct MemoryRecommendation {
    MemoryRecommendationType type;
    QString message;
};

QString memoryRecommendationKey(MemoryRecommendationType type);

class MemoryManager {
public:
    explicit MemoryManager(std::shared_ptr<MemoryTelemetry> telemetry,
                           WorkerPoolConfig config = WorkerPoolConfig());

    MemoryInfo getMemoryInfo() const;

    // Fresh telemetry on every call.
    int getOptimalWorkers() const;
    int cpuCount() const;

    bool checkMemoryPressure() const;
    std::vector<MemoryRecommendation> getMemoryRecommendations() const;

    const WorkerPoolConfig& config() const { return config_; }

private:
    std::shared_ptr<MemoryTelemetry> telemetry_;
    WorkerPoolConfig config_;
};

} // namespace Scribe
