#include "crcc/engine_error.hpp"

namespace crcc {

QString EngineError::kindName() const {
    switch (kind) {
    case ErrorKind::None:
        return "None";
    case ErrorKind::Connection:
        return "ConnectionError";
    case ErrorKind::Operation:
        return "OperationError";
    case ErrorKind::NotFound:
        return "NotFound";
    case ErrorKind::PermissionDenied:
        return "PermissionDenied";
    case ErrorKind::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

QString EngineError::toString() const {
    switch (kind) {
    case ErrorKind::None:
        return {};
    case ErrorKind::Connection:
        return QString("Connection error: %1").arg(message);
    case ErrorKind::Operation:
        return QString("Operation error: %1").arg(message);
    case ErrorKind::NotFound:
        return QString("Not found: %1").arg(message);
    case ErrorKind::PermissionDenied:
        return QString("Permission denied: %1").arg(message);
    case ErrorKind::Unknown:
        break;
    }
    return QString("Unknown error: %1").arg(message);
}

QJsonObject EngineError::toJson() const {
    return {
        {"success", false},
        {"error_kind", kindName()},
        {"error", toString()},
    };
}

EngineError EngineError::connection(const QString& message) {
    return {ErrorKind::Connection, message};
}

EngineError EngineError::operation(const QString& message) {
    return {ErrorKind::Operation, message};
}

EngineError EngineError::notFound(const QString& message) {
    return {ErrorKind::NotFound, message};
}

EngineError EngineError::permissionDenied(const QString& message) {
    return {ErrorKind::PermissionDenied, message};
}

EngineError EngineError::unknown(const QString& message) {
    return {ErrorKind::Unknown, message};
}

EngineError EngineError::fromHttpStatus(int statusCode, const QString& message) {
    switch (statusCode) {
    case 404:
        return notFound(message);
    case 403:
        return permissionDenied(message);
    default:
        return operation(QString("Server error (%1): %2").arg(statusCode).arg(message));
    }
}

EngineError EngineError::fromTransportError(const QString& message) {
    if (message.contains("connection", Qt::CaseInsensitive)) {
        return connection(message);
    }
    return unknown(message);
}

}  // namespace crcc
