#include "crcc/api_backend.hpp"

#include <QJsonArray>
#include <QJsonObject>
#include <QUrl>

#include "crcc/cli_backend.hpp"
#include "crcc/http_response_parser.hpp"
#include "crcc/resource_normalizer.hpp"
#include "crcc/settings.hpp"

namespace crcc {

namespace {

QString encoded(const QString& value) {
    return QString::fromLatin1(QUrl::toPercentEncoding(value));
}

}  // namespace

QSharedPointer<RuntimeBackend> makeRuntimeBackend(const Settings& settings, ConnectionManager& connections) {
    if (settings.mode == BackendMode::Cli) {
        return QSharedPointer<RuntimeBackend>(new CliBackend(settings));
    }
    return QSharedPointer<RuntimeBackend>(new ApiBackend(connections));
}

ApiBackend::ApiBackend(ConnectionManager& connections)
    : connections_(connections) {}

Result<QJsonDocument> ApiBackend::getJson(const QString& path) {
    const Result<EngineHandle> handle = connections_.ensureConnected();
    if (!handle.success()) {
        return Result<QJsonDocument>::fail(handle.error);
    }
    EngineRequest request;
    request.path = path;
    return handle.value->sendJson(request);
}

Result<bool> ApiBackend::command(const QByteArray& method, const QString& path) {
    const Result<EngineHandle> handle = connections_.ensureConnected();
    if (!handle.success()) {
        return Result<bool>::fail(handle.error);
    }
    EngineRequest request;
    request.method = method;
    request.path = path;
    return handle.value->sendCommand(request);
}

Result<QVector<ContainerRecord>> ApiBackend::listContainers() {
    const Result<QJsonDocument> doc = getJson("/containers/json?all=1");
    if (!doc.success()) {
        return Result<QVector<ContainerRecord>>::fail(doc.error);
    }
    return Result<QVector<ContainerRecord>>::ok(ResourceNormalizer::containersFromApi(doc.value.array()));
}

Result<QVector<ImageRecord>> ApiBackend::listImages() {
    const Result<QJsonDocument> doc = getJson("/images/json");
    if (!doc.success()) {
        return Result<QVector<ImageRecord>>::fail(doc.error);
    }
    return Result<QVector<ImageRecord>>::ok(ResourceNormalizer::imagesFromApi(doc.value.array()));
}

Result<ContainerDetail> ApiBackend::inspectContainer(const QString& id) {
    const Result<QJsonDocument> doc = getJson(QString("/containers/%1/json").arg(encoded(id)));
    if (!doc.success()) {
        return Result<ContainerDetail>::fail(doc.error);
    }
    ContainerDetail detail = ResourceNormalizer::detailFromInspect(doc.value.object());
    if (detail.summary.id.isEmpty()) {
        detail.summary.id = id;
    }
    return Result<ContainerDetail>::ok(detail);
}

Result<StatsSample> ApiBackend::containerStats(const QString& id) {
    const Result<QJsonDocument> doc = getJson(QString("/containers/%1/stats?stream=false").arg(encoded(id)));
    if (!doc.success()) {
        return Result<StatsSample>::fail(doc.error);
    }
    if (!doc.value.isObject() || doc.value.object().isEmpty()) {
        return Result<StatsSample>::fail(
            EngineError::notFound(QString("No stats found for container %1").arg(id)));
    }
    return Result<StatsSample>::ok(StatsEngine::fromApi(doc.value.object()));
}

Result<QString> ApiBackend::containerLogs(const QString& id, int tail, const CancellationToken& cancel) {
    const Result<EngineHandle> handle = connections_.ensureConnected();
    if (!handle.success()) {
        return Result<QString>::fail(handle.error);
    }
    EngineRequest request;
    request.path = QString("/containers/%1/logs?stdout=1&stderr=1&tail=%2").arg(encoded(id)).arg(tail);
    const Result<EngineReply> reply = handle.value->send(request, cancel);
    if (!reply.success()) {
        return Result<QString>::fail(reply.error);
    }
    if (!reply.value.isSuccess()) {
        return Result<QString>::fail(errorFromReply(reply.value));
    }
    const bool raw = reply.value.contentType.contains("raw-stream");
    const QByteArray text = raw ? reply.value.body : demultiplexLogStream(reply.value.body);
    return Result<QString>::ok(QString::fromUtf8(text));
}

Result<bool> ApiBackend::startContainer(const QString& id) {
    return command("POST", QString("/containers/%1/start").arg(encoded(id)));
}

Result<bool> ApiBackend::stopContainer(const QString& id) {
    return command("POST", QString("/containers/%1/stop").arg(encoded(id)));
}

Result<bool> ApiBackend::removeContainer(const QString& id) {
    return command("DELETE", QString("/containers/%1").arg(encoded(id)));
}

Result<bool> ApiBackend::removeImage(const QString& id) {
    return command("DELETE", QString("/images/%1").arg(encoded(id)));
}

Result<QString> ApiBackend::createContainer(const QString& image, const QString& name) {
    const Result<EngineHandle> handle = connections_.ensureConnected();
    if (!handle.success()) {
        return Result<QString>::fail(handle.error);
    }
    EngineRequest request;
    request.method = "POST";
    request.path = name.isEmpty() ? QString("/containers/create")
                                  : QString("/containers/create?name=%1").arg(encoded(name));
    request.body = QJsonDocument(QJsonObject{{"Image", image}}).toJson(QJsonDocument::Compact);
    const Result<QJsonDocument> doc = handle.value->sendJson(request);
    if (!doc.success()) {
        return Result<QString>::fail(doc.error);
    }
    const QString id = doc.value.object().value("Id").toString();
    if (id.isEmpty()) {
        return Result<QString>::fail(EngineError::operation("Engine did not return a container id"));
    }
    return Result<QString>::ok(id);
}

}  // namespace crcc
