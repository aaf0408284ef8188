#pragma once

#include <QJsonObject>
#include <QString>

#include <utility>

namespace crcc {

enum class ErrorKind {
    None,
    Connection,
    Operation,
    NotFound,
    PermissionDenied,
    Unknown,
};

struct EngineError {
    ErrorKind kind = ErrorKind::None;
    QString message;

    [[nodiscard]] bool isError() const { return kind != ErrorKind::None; }
    [[nodiscard]] QString kindName() const;
    [[nodiscard]] QString toString() const;
    [[nodiscard]] QJsonObject toJson() const;

    static EngineError connection(const QString& message);
    static EngineError operation(const QString& message);
    static EngineError notFound(const QString& message);
    static EngineError permissionDenied(const QString& message);
    static EngineError unknown(const QString& message);

    // 404 -> NotFound, 403 -> PermissionDenied, anything else -> Operation.
    static EngineError fromHttpStatus(int statusCode, const QString& message);
    static EngineError fromTransportError(const QString& message);
};

template <typename T>
struct Result {
    T value{};
    EngineError error;

    [[nodiscard]] bool success() const { return !error.isError(); }

    static Result ok(T v) {
        Result r;
        r.value = std::move(v);
        return r;
    }

    static Result fail(EngineError e) {
        Result r;
        r.error = std::move(e);
        return r;
    }
};

}  // namespace crcc
