#include "crcc/http_response_parser.hpp"

#include <QList>

namespace crcc {

namespace {

constexpr int kMaxHeaderBytes = 64 * 1024;

bool noBodyStatus(int status) {
    return (status >= 100 && status < 200) || status == 204 || status == 304;
}

}  // namespace

bool HttpResponseParser::takeLine(QByteArray* line) {
    const int idx = buffer_.indexOf("\r\n");
    if (idx < 0) {
        if (buffer_.size() > kMaxHeaderBytes) {
            fail("HTTP header line too long");
        }
        return false;
    }
    *line = buffer_.left(idx);
    buffer_.remove(0, idx + 2);
    return true;
}

void HttpResponseParser::fail(const QString& message) {
    state_ = State::Error;
    error_ = message;
}

void HttpResponseParser::parseStatusLine(const QByteArray& line) {
    // HTTP/1.1 200 OK
    const QList<QByteArray> parts = line.split(' ');
    if (parts.size() < 2 || !parts[0].startsWith("HTTP/")) {
        fail(QString("Malformed HTTP status line: %1").arg(QString::fromLatin1(line.left(80))));
        return;
    }
    bool ok = false;
    statusCode_ = parts[1].toInt(&ok);
    if (!ok) {
        fail("Malformed HTTP status code");
        return;
    }
    state_ = State::Headers;
}

void HttpResponseParser::parseHeaderLine(const QByteArray& line) {
    const int idx = line.indexOf(':');
    if (idx <= 0) {
        fail("Malformed HTTP header");
        return;
    }
    headers_.insert(line.left(idx).trimmed().toLower(), line.mid(idx + 1).trimmed());
}

void HttpResponseParser::beginBody() {
    if (noBodyStatus(statusCode_)) {
        state_ = State::Done;
        return;
    }
    if (header("transfer-encoding").toLower().contains("chunked")) {
        state_ = State::ChunkSize;
        return;
    }
    const QByteArray length = header("content-length");
    if (!length.isEmpty()) {
        bool ok = false;
        remaining_ = length.toLongLong(&ok);
        if (!ok || remaining_ < 0) {
            fail("Malformed Content-Length");
            return;
        }
        state_ = remaining_ == 0 ? State::Done : State::Body;
        return;
    }
    untilClose_ = true;
    state_ = State::Body;
}

EngineError HttpResponseParser::protocolError(const QString& what) const {
    return EngineError::operation(QString("Engine connection returned a malformed %1: %2").arg(what, error_));
}

void HttpResponseParser::feed(const QByteArray& data) {
    if (state_ == State::Done || state_ == State::Error) {
        return;
    }
    buffer_.append(data);

    bool progressed = true;
    while (progressed && state_ != State::Done && state_ != State::Error) {
        progressed = false;
        QByteArray line;
        switch (state_) {
        case State::StatusLine:
            if (takeLine(&line)) {
                parseStatusLine(line);
                progressed = true;
            }
            break;
        case State::Headers:
            if (takeLine(&line)) {
                if (line.isEmpty()) {
                    beginBody();
                } else {
                    parseHeaderLine(line);
                }
                progressed = true;
            }
            break;
        case State::Body:
            if (!buffer_.isEmpty()) {
                if (untilClose_) {
                    body_.append(buffer_);
                    buffer_.clear();
                } else {
                    const qint64 n = qMin<qint64>(remaining_, buffer_.size());
                    body_.append(buffer_.left(static_cast<int>(n)));
                    buffer_.remove(0, static_cast<int>(n));
                    remaining_ -= n;
                    if (remaining_ == 0) {
                        state_ = State::Done;
                    }
                }
                progressed = true;
            }
            break;
        case State::ChunkSize:
            if (takeLine(&line)) {
                const int ext = line.indexOf(';');
                const QByteArray sizeText = (ext >= 0 ? line.left(ext) : line).trimmed();
                bool ok = false;
                remaining_ = sizeText.toLongLong(&ok, 16);
                if (!ok || remaining_ < 0) {
                    fail("Malformed chunk size");
                    break;
                }
                state_ = remaining_ == 0 ? State::Trailers : State::ChunkData;
                progressed = true;
            }
            break;
        case State::ChunkData:
            if (!buffer_.isEmpty()) {
                const qint64 n = qMin<qint64>(remaining_, buffer_.size());
                body_.append(buffer_.left(static_cast<int>(n)));
                buffer_.remove(0, static_cast<int>(n));
                remaining_ -= n;
                if (remaining_ == 0) {
                    state_ = State::ChunkDataEnd;
                }
                progressed = true;
            }
            break;
        case State::ChunkDataEnd:
            if (takeLine(&line)) {
                if (!line.isEmpty()) {
                    fail("Missing CRLF after chunk data");
                    break;
                }
                state_ = State::ChunkSize;
                progressed = true;
            }
            break;
        case State::Trailers:
            if (takeLine(&line)) {
                if (line.isEmpty()) {
                    state_ = State::Done;
                }
                progressed = true;
            }
            break;
        case State::Done:
        case State::Error:
            break;
        }
    }
}

void HttpResponseParser::finishOnClose() {
    if (state_ == State::Done || state_ == State::Error) {
        return;
    }
    if (state_ == State::Body && untilClose_) {
        state_ = State::Done;
        return;
    }
    fail("Connection closed before the response was complete");
}

QByteArray HttpResponseParser::header(const QByteArray& name) const {
    return headers_.value(name.toLower());
}

QByteArray HttpResponseParser::takeBody() {
    QByteArray out;
    out.swap(body_);
    return out;
}

QByteArray demultiplexLogStream(const QByteArray& raw) {
    QByteArray out;
    int pos = 0;
    while (pos < raw.size()) {
        if (raw.size() - pos < 8) {
            return raw;
        }
        const auto type = static_cast<unsigned char>(raw[pos]);
        if (type > 2 || raw[pos + 1] != 0 || raw[pos + 2] != 0 || raw[pos + 3] != 0) {
            return raw;
        }
        const quint32 length = (static_cast<quint32>(static_cast<unsigned char>(raw[pos + 4])) << 24)
            | (static_cast<quint32>(static_cast<unsigned char>(raw[pos + 5])) << 16)
            | (static_cast<quint32>(static_cast<unsigned char>(raw[pos + 6])) << 8)
            | static_cast<quint32>(static_cast<unsigned char>(raw[pos + 7]));
        pos += 8;
        if (static_cast<qint64>(length) > raw.size() - pos) {
            return raw;
        }
        out.append(raw.mid(pos, static_cast<int>(length)));
        pos += static_cast<int>(length);
    }
    return out;
}

}  // namespace crcc
