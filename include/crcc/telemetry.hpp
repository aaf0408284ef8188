#pragma once

#include <QJsonArray>
#include <QJsonObject>
#include <QMutex>
#include <QString>

namespace crcc {

struct EngineError;

// Process-wide counters, durations and a bounded event log. This is the
// project's logging facility; snapshots are exported as JSON.
class Telemetry final {
public:
    static constexpr int kMaxEvents = 1000;

    static Telemetry& instance();

    void incrementCounter(const QString& key, qint64 delta = 1);
    void recordDurationMs(const QString& key, qint64 durationMs);
    void recordEvent(const QString& type, const QJsonObject& payload = {});
    void recordError(const QString& type, const EngineError& error, const QJsonObject& payload = {});

    [[nodiscard]] qint64 counter(const QString& key) const;
    [[nodiscard]] QJsonArray eventsOfType(const QString& type) const;
    [[nodiscard]] QJsonObject snapshot() const;
    QJsonObject exportToFile(const QString& filePath) const;
    void clear();

private:
    Telemetry() = default;

    mutable QMutex mutex_;
    QJsonObject counters_;
    QJsonObject durations_;
    QJsonArray events_;
    qint64 nextSequence_ = 0;
    qint64 eventsDropped_ = 0;
};

}  // namespace crcc
