#pragma once

#include <QByteArray>
#include <QMap>
#include <QString>

#include "crcc/engine_error.hpp"

namespace crcc {

// Incremental HTTP/1.1 response decoder. Bytes are fed as they arrive from the
// socket; decoded body bytes accumulate until taken.
class HttpResponseParser {
public:
    void feed(const QByteArray& data);
    // The peer closed the connection. Completes close-delimited bodies and
    // flags truncated ones as errors.
    void finishOnClose();

    [[nodiscard]] bool headersComplete() const { return state_ > State::Headers; }
    [[nodiscard]] bool isComplete() const { return state_ == State::Done; }
    [[nodiscard]] bool hasError() const { return state_ == State::Error; }
    [[nodiscard]] QString errorString() const { return error_; }
    // The engine was reached but spoke broken HTTP: an Operation error naming
    // what was being read ("response" or "stream").
    [[nodiscard]] EngineError protocolError(const QString& what) const;

    [[nodiscard]] int statusCode() const { return statusCode_; }
    [[nodiscard]] QByteArray header(const QByteArray& name) const;

    QByteArray takeBody();

private:
    enum class State {
        StatusLine,
        Headers,
        Body,
        ChunkSize,
        ChunkData,
        ChunkDataEnd,
        Trailers,
        Done,
        Error,
    };

    bool takeLine(QByteArray* line);
    void parseStatusLine(const QByteArray& line);
    void parseHeaderLine(const QByteArray& line);
    void beginBody();
    void fail(const QString& message);

    State state_ = State::StatusLine;
    QByteArray buffer_;
    QByteArray body_;
    QMap<QByteArray, QByteArray> headers_;
    int statusCode_ = 0;
    qint64 remaining_ = -1;
    bool untilClose_ = false;
    QString error_;
};

// Splits the engine's multiplexed log framing (8-byte headers) into plain text.
// Payloads without valid framing are returned unchanged.
QByteArray demultiplexLogStream(const QByteArray& raw);

}  // namespace crcc
