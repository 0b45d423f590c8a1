#include "MemoryManager.hpp"
#include "core/common/Logger.hpp"

#include <QtCore/QFile>
#include <QtCore/QRegularExpression>
#include <QtCore/QThread>

namespace Scribe {

namespace {

constexpr double kKbPerGb = 1024.0 * 1024.0;
constexpr double kKbPerMb = 1024.0;

// Value in kB of "<field>:   123 kB" or -1.
double readKbField(const QString& content, const QString& field) {
    const QRegularExpression regex(QRegularExpression::escape(field) + R"(:\s+(\d+)\s+kB)");
    const auto match = regex.match(content);
    if (!match.hasMatch()) {
        return -1.0;
    }
    bool ok = false;
    const double value = match.captured(1).toDouble(&ok);
    return ok ? value : -1.0;
}

QString readProcFile(const QString& path) {
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        return QString();
    }
    // /proc files report size 0, so read until EOF.
    return QString::fromUtf8(file.readAll());
}

} // namespace

MemoryInfo ProcMemoryTelemetry::snapshot() {
    MemoryInfo info;

    const QString meminfo = readProcFile("/proc/meminfo");
    const double totalKb = readKbField(meminfo, "MemTotal");
    const double availableKb = readKbField(meminfo, "MemAvailable");
    if (totalKb <= 0.0 || availableKb < 0.0) {
        SCRIBE_DEBUG("System memory telemetry unavailable, using conservative values");
        return info;
    }

    info.systemTotalGb = totalKb / kKbPerGb;
    info.systemAvailableGb = availableKb / kKbPerGb;
    info.systemUsedPercent = (totalKb - availableKb) / totalKb * 100.0;
    info.live = true;

    const QString status = readProcFile("/proc/self/status");
    const double rssKb = readKbField(status, "VmRSS");
    const double vmsKb = readKbField(status, "VmSize");
    if (rssKb >= 0.0) {
        info.processRssMb = rssKb / kKbPerMb;
    }
    if (vmsKb >= 0.0) {
        info.processVmsMb = vmsKb / kKbPerMb;
    }
    return info;
}

int ProcMemoryTelemetry::cpuCount() const {
    return QThread::idealThreadCount();
}

QString memoryRecommendationKey(MemoryRecommendationType type) {
    switch (type) {
        case MemoryRecommendationType::Critical: return "critical";
        case MemoryRecommendationType::Warning: return "warning";
        case MemoryRecommendationType::LowMemory: return "low_memory";
        case MemoryRecommendationType::WorkerLimit: return "worker_limit";
    }
    return "unknown";
}

MemoryManager::MemoryManager(std::shared_ptr<MemoryTelemetry> telemetry, WorkerPoolConfig config)
    : telemetry_(std::move(telemetry))
    , config_(config) {
    if (!telemetry_) {
        telemetry_ = std::make_shared<ProcMemoryTelemetry>();
    }
}

MemoryInfo MemoryManager::getMemoryInfo() const {
    return telemetry_->snapshot();
}

int MemoryManager::cpuCount() const {
    return telemetry_->cpuCount();
}

int MemoryManager::getOptimalWorkers() const {
    const MemoryInfo info = getMemoryInfo();
    const int cpus = cpuCount();
    const int workers = computeOptimalWorkers(info.systemAvailableGb, cpus, config_);

    SCRIBE_INFO("Memory analysis: {:.1f}GB available ({:.0f}% used), {} cores, optimal workers: {} (cap: {})",
                info.systemAvailableGb, info.systemUsedPercent, cpus, workers, config_.maxWorkersCap);
    return workers;
}

bool MemoryManager::checkMemoryPressure() const {
    return isUnderMemoryPressure(getMemoryInfo().systemUsedPercent, config_);
}

std::vector<MemoryRecommendation> MemoryManager::getMemoryRecommendations() const {
    const MemoryInfo info = getMemoryInfo();
    std::vector<MemoryRecommendation> recommendations;

    if (info.systemUsedPercent > 90.0) {
        recommendations.push_back({MemoryRecommendationType::Critical,
            "System memory critically low - consider stopping other applications"});
    } else if (info.systemUsedPercent > 80.0) {
        recommendations.push_back({MemoryRecommendationType::Warning,
            "High memory usage - monitor for performance impact"});
    }

    if (info.systemAvailableGb < 2.0) {
        recommendations.push_back({MemoryRecommendationType::LowMemory,
            "Less than 2GB available - processing may be slow"});
    }

    const int cpus = cpuCount();
    const int workers = computeOptimalWorkers(info.systemAvailableGb, cpus, config_);
    if (workers < cpus) {
        recommendations.push_back({MemoryRecommendationType::WorkerLimit,
            QString("Memory constrains workers to %1 (CPU has %2 cores)").arg(workers).arg(cpus)});
    }

    return recommendations;
}

} // namespace Scribe
