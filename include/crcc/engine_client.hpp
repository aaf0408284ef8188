#pragma once

#include <QByteArray>
#include <QJsonDocument>
#include <QSharedPointer>
#include <QString>

#include "crcc/cancellation.hpp"
#include "crcc/engine_error.hpp"

namespace crcc {

struct EngineRequest {
    QByteArray method = "GET";
    QString path;
    QByteArray body;
    QByteArray contentType = "application/json";
};

struct EngineReply {
    int statusCode = 0;
    QByteArray body;
    QByteArray contentType;

    [[nodiscard]] bool isSuccess() const { return statusCode >= 200 && statusCode < 400; }
};

// A continuous newline-delimited stream of engine items (events, pull progress).
class EngineStream {
public:
    virtual ~EngineStream() = default;

    // Blocks until the next item arrives. Returns false at end of stream, on
    // cancellation, or on a stream-level error (reported through error).
    virtual bool next(QByteArray* item, EngineError* error) = 0;
    virtual void close() = 0;
};

// One live connection to the engine API. Implementations must be usable from
// several threads at once; each call is independent.
class EngineClient {
public:
    virtual ~EngineClient() = default;

    virtual Result<EngineReply> send(const EngineRequest& request, const CancellationToken& cancel) = 0;
    virtual Result<QSharedPointer<EngineStream>> openStream(
        const EngineRequest& request,
        const CancellationToken& cancel) = 0;

    Result<bool> ping(const CancellationToken& cancel = CancellationToken());
    // Sends the request and decodes a JSON body, mapping error statuses.
    Result<QJsonDocument> sendJson(
        const EngineRequest& request,
        const CancellationToken& cancel = CancellationToken());
    // Sends the request and only checks its status.
    Result<bool> sendCommand(
        const EngineRequest& request,
        const CancellationToken& cancel = CancellationToken());
};

using EngineHandle = QSharedPointer<EngineClient>;

class EngineConnector {
public:
    virtual ~EngineConnector() = default;

    virtual Result<EngineHandle> connect() = 0;
};

EngineError errorFromReply(const EngineReply& reply);

}  // namespace crcc
