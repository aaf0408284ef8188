#include "crcc/runtime_worker.hpp"

#include <QCryptographicHash>
#include <QDateTime>
#include <QDir>
#include <QElapsedTimer>
#include <QJsonArray>
#include <QJsonDocument>

#include "crcc/telemetry.hpp"

namespace crcc {

namespace {

QString compactHash(const QJsonObject& value) {
    const QByteArray payload = QJsonDocument(value).toJson(QJsonDocument::Compact);
    return QString::fromLatin1(QCryptographicHash::hash(payload, QCryptographicHash::Sha1).toHex());
}

}  // namespace

RuntimeWorker::RuntimeWorker(CommandFacade& facade, QObject* parent)
    : QObject(parent),
      facade_(facade) {}

void RuntimeWorker::poll(const QJsonObject& request) {
    request_ = request;
    if (busy_) {
        pending_ = true;
        return;
    }
    pollNow();
}

void RuntimeWorker::pollNow() {
    QElapsedTimer pollTimer;
    pollTimer.start();
    busy_ = true;
    Telemetry::instance().incrementCounter("sync.poll_count");

    const bool includeStats = request_.value("include_stats").toBool(false);
    const qint64 sinceVersion = request_.value("since_version").toInteger(-1);

    const QJsonObject status = facade_.status();
    const QJsonObject containers = facade_.listContainers();
    const QJsonObject images = facade_.listImages();

    // Stats are sampled one container at a time; skipped for stopped ones.
    QJsonObject stats;
    if (includeStats && containers.value("success").toBool()) {
        for (const QJsonValue& value : containers.value("containers").toArray()) {
            const QJsonObject container = value.toObject();
            if (container.value("state").toString() != "running") {
                continue;
            }
            const QString id = container.value("id").toString();
            const QJsonObject sample = facade_.containerStats(id);
            if (sample.value("success").toBool()) {
                stats.insert(id, sample.value("stats"));
            }
        }
    }

    QJsonObject response;
    response.insert("timestamp_utc", QDateTime::currentDateTimeUtc().toString(Qt::ISODate));
    response.insert("backend", facade_.backendName());
    response.insert("status", status.value("status"));
    response.insert("containers", containers);
    response.insert("images", images);
    if (includeStats) {
        response.insert("stats", stats);
    }

    const QJsonObject sectionHashes = {
        {"status", compactHash(status)},
        {"containers", compactHash(containers)},
        {"images", compactHash(images)},
        {"stats", compactHash(stats)},
    };
    const QString fingerprint = compactHash(sectionHashes);
    const bool changed = (fingerprint != lastSyncFingerprint_);
    if (changed) {
        syncVersion_++;
        lastSyncFingerprint_ = fingerprint;
    }
    response.insert("sync_version", static_cast<double>(syncVersion_));
    response.insert("etag", fingerprint);
    response.insert("changed", changed);

    if (!changed && sinceVersion == static_cast<qint64>(syncVersion_)) {
        response.remove("containers");
        response.remove("images");
        response.remove("stats");
        response.insert("heartbeat_only", true);
    }

    emit snapshotReady(response);
    Telemetry::instance().recordDurationMs("sync.duration_ms", pollTimer.elapsed());

    busy_ = false;
    if (pending_) {
        pending_ = false;
        pollNow();
    }
}

void RuntimeWorker::runAction(const QString& action, const QJsonObject& payload) {
    QElapsedTimer actionTimer;
    actionTimer.start();
    Telemetry::instance().incrementCounter("actions.count");

    const QString id = payload.value("id").toString();
    QJsonObject result;
    if (action == "start") {
        result = facade_.startContainer(id);
    } else if (action == "stop") {
        result = facade_.stopContainer(id);
    } else if (action == "remove") {
        result = facade_.removeContainer(id);
    } else if (action == "remove_image") {
        result = facade_.removeImage(id);
    } else if (action == "create") {
        result = facade_.createContainer(payload);
    } else if (action == "pull") {
        result = facade_.pullImage(payload.value("image").toString());
    } else if (action == "logs") {
        result = facade_.containerLogs(id, payload.value("tail").toInt(-1));
    } else if (action == "stats") {
        result = facade_.containerStats(id);
    } else if (action == "inspect") {
        result = facade_.containerConfig(id);
    } else if (action == "reset_connection") {
        result = facade_.resetClient();
    } else if (action == "export_telemetry") {
        const QString path = payload.value("path").toString(
            QDir(QDir::currentPath()).filePath("logs/telemetry_snapshot.json"));
        result = Telemetry::instance().exportToFile(path);
    } else {
        result = EngineError::operation(QString("Unknown action: %1").arg(action)).toJson();
    }
    result.insert("action", action);

    if (!result.value("success").toBool()) {
        Telemetry::instance().incrementCounter("actions.failed");
    }
    emit actionFinished(result);
    Telemetry::instance().recordDurationMs("actions.duration_ms", actionTimer.elapsed());
}

}  // namespace crcc
