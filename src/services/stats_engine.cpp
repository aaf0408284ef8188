#include "crcc/stats_engine.hpp"

#include <QJsonArray>
#include <QStringList>

#include "crcc/human_units.hpp"

namespace crcc {

namespace {

quint64 counterValue(const QJsonValue& value) {
    return static_cast<quint64>(qMax<qint64>(0, value.toInteger()));
}

QPair<quint64, quint64> sumNetworks(const QJsonObject& networks) {
    quint64 rx = 0;
    quint64 tx = 0;
    for (auto it = networks.constBegin(); it != networks.constEnd(); ++it) {
        const QJsonObject iface = it.value().toObject();
        rx += counterValue(iface.value("rx_bytes"));
        tx += counterValue(iface.value("tx_bytes"));
    }
    return {rx, tx};
}

// cgroup v1 reports "Read"/"Write", cgroup v2 "read"/"write".
QPair<quint64, quint64> sumBlockIo(const QJsonArray& entries) {
    quint64 read = 0;
    quint64 write = 0;
    for (const QJsonValue& value : entries) {
        const QJsonObject entry = value.toObject();
        const QString op = entry.value("op").toString();
        if (op.compare("Read", Qt::CaseInsensitive) == 0) {
            read += counterValue(entry.value("value"));
        } else if (op.compare("Write", Qt::CaseInsensitive) == 0) {
            write += counterValue(entry.value("value"));
        }
    }
    return {read, write};
}

}  // namespace

QJsonObject StatsSample::toJson() const {
    return {
        {"cpu_usage_percent", cpuUsagePercent},
        {"memory_usage", static_cast<double>(memoryUsage)},
        {"memory_limit", static_cast<double>(memoryLimit)},
        {"memory_usage_percent", memoryUsagePercent},
        {"network_rx_bytes", static_cast<double>(networkRxBytes)},
        {"network_tx_bytes", static_cast<double>(networkTxBytes)},
        {"block_read_bytes", static_cast<double>(blockReadBytes)},
        {"block_write_bytes", static_cast<double>(blockWriteBytes)},
    };
}

double StatsEngine::cpuPercent(
    quint64 cpuTotal,
    quint64 previousCpuTotal,
    quint64 systemTotal,
    quint64 previousSystemTotal,
    int onlineCpus) {
    const quint64 cpuDelta = cpuTotal > previousCpuTotal ? cpuTotal - previousCpuTotal : 0;
    const quint64 systemDelta = systemTotal > previousSystemTotal ? systemTotal - previousSystemTotal : 0;
    if (cpuDelta == 0 || systemDelta == 0) {
        return 0.0;
    }
    const int cpus = onlineCpus > 0 ? onlineCpus : 1;
    return (static_cast<double>(cpuDelta) / static_cast<double>(systemDelta)) * cpus * 100.0;
}

double StatsEngine::memoryPercent(quint64 usage, quint64 limit) {
    if (limit == 0) {
        return 0.0;
    }
    return static_cast<double>(usage) / static_cast<double>(limit) * 100.0;
}

StatsSample StatsEngine::fromApi(const QJsonObject& stats) {
    const QJsonObject cpu = stats.value("cpu_stats").toObject();
    const QJsonObject precpu = stats.value("precpu_stats").toObject();
    const QJsonObject memory = stats.value("memory_stats").toObject();

    StatsSample sample;
    sample.cpuUsagePercent = cpuPercent(
        counterValue(cpu.value("cpu_usage").toObject().value("total_usage")),
        counterValue(precpu.value("cpu_usage").toObject().value("total_usage")),
        counterValue(cpu.value("system_cpu_usage")),
        counterValue(precpu.value("system_cpu_usage")),
        cpu.value("online_cpus").toInt(1));

    sample.memoryUsage = counterValue(memory.value("usage"));
    sample.memoryLimit = counterValue(memory.value("limit"));
    sample.memoryUsagePercent = memoryPercent(sample.memoryUsage, sample.memoryLimit);

    const auto [rx, tx] = sumNetworks(stats.value("networks").toObject());
    sample.networkRxBytes = rx;
    sample.networkTxBytes = tx;

    const auto [read, write] = sumBlockIo(
        stats.value("blkio_stats").toObject().value("io_service_bytes_recursive").toArray());
    sample.blockReadBytes = read;
    sample.blockWriteBytes = write;
    return sample;
}

Result<StatsSample> StatsEngine::fromCli(const QString& output, const QString& containerId) {
    QString line;
    for (const QString& candidate : output.split('\n', Qt::SkipEmptyParts)) {
        if (!candidate.trimmed().isEmpty()) {
            line = candidate.trimmed();
            break;
        }
    }
    if (line.isEmpty()) {
        return Result<StatsSample>::fail(
            EngineError::notFound(QString("No stats found for container %1").arg(containerId)));
    }

    const QStringList fields = line.split('|');
    if (fields.size() < kCliFieldCount) {
        return Result<StatsSample>::fail(EngineError::operation(
            QString("Unparsable stats output for container %1: %2").arg(containerId, line.left(120))));
    }

    StatsSample sample;
    sample.cpuUsagePercent = parsePercent(fields[0]);
    const auto [usage, limit] = parseSizePair(fields[1]);
    sample.memoryUsage = usage;
    sample.memoryLimit = limit;
    sample.memoryUsagePercent = parsePercent(fields[2]);
    const auto [rx, tx] = parseSizePair(fields[3]);
    sample.networkRxBytes = rx;
    sample.networkTxBytes = tx;
    const auto [read, write] = parseSizePair(fields[4]);
    sample.blockReadBytes = read;
    sample.blockWriteBytes = write;
    return Result<StatsSample>::ok(sample);
}

double StatsEngine::parsePercent(const QString& text) {
    QString value = text.trimmed();
    if (value.endsWith('%')) {
        value.chop(1);
    }
    bool ok = false;
    const double parsed = value.trimmed().toDouble(&ok);
    return ok ? parsed : 0.0;
}

QPair<quint64, quint64> StatsEngine::parseSizePair(const QString& text) {
    const int slash = text.indexOf('/');
    if (slash < 0) {
        return {parseSize(text), 0};
    }
    return {parseSize(text.left(slash)), parseSize(text.mid(slash + 1))};
}

}  // namespace crcc
