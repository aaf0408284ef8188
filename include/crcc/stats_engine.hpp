#pragma once

#include <QJsonObject>
#include <QPair>
#include <QString>

#include "crcc/engine_error.hpp"

namespace crcc {

// Point-in-time usage derived from cumulative counters. Recomputed per request.
struct StatsSample {
    double cpuUsagePercent = 0.0;
    quint64 memoryUsage = 0;
    quint64 memoryLimit = 0;
    double memoryUsagePercent = 0.0;
    quint64 networkRxBytes = 0;
    quint64 networkTxBytes = 0;
    quint64 blockReadBytes = 0;
    quint64 blockWriteBytes = 0;

    [[nodiscard]] QJsonObject toJson() const;
};

class StatsEngine {
public:
    static constexpr int kCliFieldCount = 5;

    static double cpuPercent(
        quint64 cpuTotal,
        quint64 previousCpuTotal,
        quint64 systemTotal,
        quint64 previousSystemTotal,
        int onlineCpus);
    static double memoryPercent(quint64 usage, quint64 limit);

    // One stats document from the engine API (cpu_stats and precpu_stats).
    static StatsSample fromApi(const QJsonObject& stats);
    // Output of `stats --no-stream` with the
    // CPUPerc|MemUsage|MemPerc|NetIO|BlockIO template.
    static Result<StatsSample> fromCli(const QString& output, const QString& containerId);

    static double parsePercent(const QString& text);
    // "10MiB / 1GiB" -> (10485760, 1073741824)
    static QPair<quint64, quint64> parseSizePair(const QString& text);
};

}  // namespace crcc
