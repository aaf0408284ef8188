#include "crcc/telemetry.hpp"

#include <QDateTime>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QMutexLocker>

#include "crcc/engine_error.hpp"

namespace crcc {

Telemetry& Telemetry::instance() {
    static Telemetry singleton;
    return singleton;
}

void Telemetry::incrementCounter(const QString& key, qint64 delta) {
    QMutexLocker lock(&mutex_);
    counters_.insert(key, static_cast<double>(counters_.value(key).toInteger() + delta));
}

void Telemetry::recordDurationMs(const QString& key, qint64 durationMs) {
    QMutexLocker lock(&mutex_);
    const QJsonObject previous = durations_.value(key).toObject();
    const qint64 count = previous.value("count").toInteger() + 1;
    const qint64 total = previous.value("total_ms").toInteger() + durationMs;
    durations_.insert(key, QJsonObject{
        {"count", static_cast<double>(count)},
        {"total_ms", static_cast<double>(total)},
        {"max_ms", static_cast<double>(qMax(previous.value("max_ms").toInteger(), durationMs))},
        {"avg_ms", static_cast<double>(total) / static_cast<double>(count)},
    });
}

void Telemetry::recordEvent(const QString& type, const QJsonObject& payload) {
    QMutexLocker lock(&mutex_);
    QJsonObject row = payload;
    row.insert("type", type);
    row.insert("seq", static_cast<double>(nextSequence_++));
    row.insert("timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODateWithMs));
    events_.append(row);
    // Oldest events go first once the log is full.
    while (events_.size() > kMaxEvents) {
        events_.removeFirst();
        ++eventsDropped_;
    }
}

void Telemetry::recordError(const QString& type, const EngineError& error, const QJsonObject& payload) {
    QJsonObject row = payload;
    row.insert("error_kind", error.kindName());
    row.insert("error", error.message);
    recordEvent(type, row);
}

qint64 Telemetry::counter(const QString& key) const {
    QMutexLocker lock(&mutex_);
    return counters_.value(key).toInteger();
}

QJsonArray Telemetry::eventsOfType(const QString& type) const {
    QMutexLocker lock(&mutex_);
    QJsonArray out;
    for (const QJsonValue& value : events_) {
        if (value.toObject().value("type").toString() == type) {
            out.append(value);
        }
    }
    return out;
}

QJsonObject Telemetry::snapshot() const {
    QMutexLocker lock(&mutex_);
    return {
        {"counters", counters_},
        {"durations", durations_},
        {"events", events_},
        {"events_dropped", static_cast<double>(eventsDropped_)},
        {"timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate)},
    };
}

QJsonObject Telemetry::exportToFile(const QString& filePath) const {
    const QFileInfo info(filePath);
    if (!QDir().mkpath(info.absolutePath())) {
        return {
            {"success", false},
            {"error", "Failed to create telemetry export directory."},
            {"path", filePath},
        };
    }

    QFile file(filePath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return {
            {"success", false},
            {"error", "Failed to open telemetry export path."},
            {"path", filePath},
        };
    }
    file.write(QJsonDocument(snapshot()).toJson(QJsonDocument::Indented));
    file.close();
    return {
        {"success", true},
        {"path", filePath},
    };
}

void Telemetry::clear() {
    QMutexLocker lock(&mutex_);
    counters_ = QJsonObject{};
    durations_ = QJsonObject{};
    events_ = QJsonArray{};
    eventsDropped_ = 0;
}

}  // namespace crcc
