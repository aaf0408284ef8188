#include "crcc/engine_client.hpp"

#include <QJsonObject>
#include <QJsonParseError>

namespace crcc {

EngineError errorFromReply(const EngineReply& reply) {
    QString message = QString::fromUtf8(reply.body).trimmed();
    const QJsonDocument doc = QJsonDocument::fromJson(reply.body);
    if (doc.isObject() && doc.object().contains("message")) {
        message = doc.object().value("message").toString();
    }
    if (message.isEmpty()) {
        message = QString("HTTP %1").arg(reply.statusCode);
    }
    return EngineError::fromHttpStatus(reply.statusCode, message);
}

Result<bool> EngineClient::ping(const CancellationToken& cancel) {
    EngineRequest request;
    request.path = "/_ping";
    return sendCommand(request, cancel);
}

Result<QJsonDocument> EngineClient::sendJson(const EngineRequest& request, const CancellationToken& cancel) {
    const Result<EngineReply> reply = send(request, cancel);
    if (!reply.success()) {
        return Result<QJsonDocument>::fail(reply.error);
    }
    if (!reply.value.isSuccess()) {
        return Result<QJsonDocument>::fail(errorFromReply(reply.value));
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(reply.value.body, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return Result<QJsonDocument>::fail(EngineError::operation(
            QString("Malformed engine response for %1: %2").arg(request.path, parseError.errorString())));
    }
    return Result<QJsonDocument>::ok(doc);
}

Result<bool> EngineClient::sendCommand(const EngineRequest& request, const CancellationToken& cancel) {
    const Result<EngineReply> reply = send(request, cancel);
    if (!reply.success()) {
        return Result<bool>::fail(reply.error);
    }
    if (!reply.value.isSuccess()) {
        return Result<bool>::fail(errorFromReply(reply.value));
    }
    return Result<bool>::ok(true);
}

}  // namespace crcc
