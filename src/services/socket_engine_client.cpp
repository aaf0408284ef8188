#include "crcc/socket_engine_client.hpp"

#include <QElapsedTimer>
#include <QFileInfo>
#include <QList>
#include <QLocalSocket>

#include <memory>

#include "crcc/http_response_parser.hpp"
#include "crcc/telemetry.hpp"

namespace crcc {

namespace {

constexpr int kConnectTimeoutMs = 3000;
constexpr int kWaitSliceMs = 200;

enum class WaitOutcome {
    Ready,
    Closed,
    Cancelled,
    TimedOut,
};

// Waits for readable bytes in short slices so cancellation and the optional
// request deadline are honoured.
WaitOutcome waitForBytes(
    QLocalSocket& socket,
    const CancellationToken& cancel,
    const QElapsedTimer& elapsed,
    int timeoutMs) {
    while (true) {
        if (socket.bytesAvailable() > 0) {
            return WaitOutcome::Ready;
        }
        if (cancel.isCancelled()) {
            return WaitOutcome::Cancelled;
        }
        if (timeoutMs > 0 && elapsed.elapsed() >= timeoutMs) {
            return WaitOutcome::TimedOut;
        }
        if (socket.waitForReadyRead(kWaitSliceMs)) {
            return WaitOutcome::Ready;
        }
        if (socket.state() != QLocalSocket::ConnectedState) {
            return socket.bytesAvailable() > 0 ? WaitOutcome::Ready : WaitOutcome::Closed;
        }
    }
}

EngineError transportError(const QString& socketPath, const QString& detail) {
    return EngineError::fromTransportError(
        QString("Engine connection failed at %1: %2").arg(socketPath, detail));
}

Result<bool> openSocket(
    QLocalSocket& socket,
    const QString& socketPath,
    const QByteArray& payload) {
    socket.connectToServer(socketPath);
    if (!socket.waitForConnected(kConnectTimeoutMs)) {
        return Result<bool>::fail(transportError(socketPath, socket.errorString()));
    }
    socket.write(payload);
    while (socket.bytesToWrite() > 0) {
        if (!socket.waitForBytesWritten(kConnectTimeoutMs)) {
            return Result<bool>::fail(transportError(socketPath, socket.errorString()));
        }
    }
    return Result<bool>::ok(true);
}

class SocketEngineStream final : public EngineStream {
public:
    SocketEngineStream(
        std::unique_ptr<QLocalSocket> socket,
        std::unique_ptr<HttpResponseParser> parser,
        CancellationToken cancel)
        : socket_(std::move(socket)),
          parser_(std::move(parser)),
          cancel_(std::move(cancel)) {
        pending_.append(parser_->takeBody());
    }

    ~SocketEngineStream() override { close(); }

    bool next(QByteArray* item, EngineError* error) override {
        while (true) {
            if (takeItem(item)) {
                return true;
            }
            if (finished_) {
                return false;
            }
            if (parser_->isComplete()) {
                finished_ = true;
                if (!pending_.trimmed().isEmpty()) {
                    *item = pending_.trimmed();
                    pending_.clear();
                    return true;
                }
                return false;
            }
            if (!socket_) {
                return false;
            }

            QElapsedTimer elapsed;
            elapsed.start();
            const WaitOutcome outcome = waitForBytes(*socket_, cancel_, elapsed, 0);
            if (outcome == WaitOutcome::Cancelled) {
                close();
                return false;
            }
            if (outcome == WaitOutcome::Closed) {
                parser_->finishOnClose();
                if (parser_->hasError()) {
                    finished_ = true;
                    *error = EngineError::connection(
                        QString("Engine stream connection lost: %1").arg(parser_->errorString()));
                    return false;
                }
                continue;
            }
            parser_->feed(socket_->readAll());
            if (parser_->hasError()) {
                finished_ = true;
                *error = EngineError::operation(parser_->errorString());
                return false;
            }
            pending_.append(parser_->takeBody());
        }
    }

    void close() override {
        if (socket_) {
            socket_->abort();
            socket_.reset();
        }
        finished_ = true;
    }

private:
    bool takeItem(QByteArray* item) {
        while (true) {
            const int idx = pending_.indexOf('\n');
            if (idx < 0) {
                return false;
            }
            const QByteArray line = pending_.left(idx).trimmed();
            pending_.remove(0, idx + 1);
            if (!line.isEmpty()) {
                *item = line;
                return true;
            }
        }
    }

    std::unique_ptr<QLocalSocket> socket_;
    std::unique_ptr<HttpResponseParser> parser_;
    CancellationToken cancel_;
    QByteArray pending_;
    bool finished_ = false;
};

}  // namespace

SocketEngineClient::SocketEngineClient(QString socketPath, QString apiVersion, int requestTimeoutMs)
    : socketPath_(std::move(socketPath)),
      apiVersion_(std::move(apiVersion)),
      requestTimeoutMs_(requestTimeoutMs) {}

QByteArray SocketEngineClient::buildRequest(const EngineRequest& request) const {
    QString path = request.path;
    if (!apiVersion_.isEmpty()) {
        path = "/" + apiVersion_ + path;
    }
    QByteArray out;
    out.append(request.method);
    out.append(' ');
    out.append(path.toUtf8());
    out.append(" HTTP/1.1\r\n");
    out.append("Host: docker\r\n");
    out.append("User-Agent: DockScope\r\n");
    out.append("Connection: close\r\n");
    if (!request.body.isEmpty() || request.method == "POST") {
        out.append("Content-Type: ");
        out.append(request.contentType);
        out.append("\r\n");
        out.append("Content-Length: ");
        out.append(QByteArray::number(request.body.size()));
        out.append("\r\n");
    }
    out.append("\r\n");
    out.append(request.body);
    return out;
}

Result<EngineReply> SocketEngineClient::send(const EngineRequest& request, const CancellationToken& cancel) {
    QElapsedTimer elapsed;
    elapsed.start();
    Telemetry::instance().incrementCounter("engine.requests");

    auto failWith = [&](const EngineError& error) {
        Telemetry::instance().incrementCounter("engine.request_failures");
        Telemetry::instance().recordDurationMs("engine.duration_ms", elapsed.elapsed());
        return Result<EngineReply>::fail(error);
    };

    QLocalSocket socket;
    const Result<bool> opened = openSocket(socket, socketPath_, buildRequest(request));
    if (!opened.success()) {
        return failWith(opened.error);
    }

    HttpResponseParser parser;
    while (!parser.isComplete() && !parser.hasError()) {
        const WaitOutcome outcome = waitForBytes(socket, cancel, elapsed, requestTimeoutMs_);
        if (outcome == WaitOutcome::Cancelled) {
            socket.abort();
            return failWith(EngineError::operation("cancelled"));
        }
        if (outcome == WaitOutcome::TimedOut) {
            socket.abort();
            return failWith(EngineError::operation(
                QString("Engine request %1 timed out after %2 ms").arg(request.path).arg(requestTimeoutMs_)));
        }
        if (outcome == WaitOutcome::Closed) {
            parser.finishOnClose();
            break;
        }
        parser.feed(socket.readAll());
    }
    socket.abort();

    if (parser.hasError()) {
        return failWith(parser.protocolError("response"));
    }

    EngineReply reply;
    reply.statusCode = parser.statusCode();
    reply.contentType = parser.header("content-type");
    reply.body = parser.takeBody();
    Telemetry::instance().recordDurationMs("engine.duration_ms", elapsed.elapsed());
    return Result<EngineReply>::ok(reply);
}

Result<QSharedPointer<EngineStream>> SocketEngineClient::openStream(
    const EngineRequest& request,
    const CancellationToken& cancel) {
    using StreamResult = Result<QSharedPointer<EngineStream>>;
    Telemetry::instance().incrementCounter("engine.streams");

    auto socket = std::make_unique<QLocalSocket>();
    const Result<bool> opened = openSocket(*socket, socketPath_, buildRequest(request));
    if (!opened.success()) {
        return StreamResult::fail(opened.error);
    }

    QElapsedTimer elapsed;
    elapsed.start();
    auto parser = std::make_unique<HttpResponseParser>();
    while (!parser->headersComplete() && !parser->hasError()) {
        const WaitOutcome outcome = waitForBytes(*socket, cancel, elapsed, requestTimeoutMs_);
        if (outcome == WaitOutcome::Cancelled) {
            return StreamResult::fail(EngineError::operation("cancelled"));
        }
        if (outcome == WaitOutcome::TimedOut) {
            return StreamResult::fail(EngineError::operation(
                QString("Engine stream %1 did not respond within %2 ms").arg(request.path).arg(requestTimeoutMs_)));
        }
        if (outcome == WaitOutcome::Closed) {
            parser->finishOnClose();
            break;
        }
        parser->feed(socket->readAll());
    }
    if (parser->hasError()) {
        return StreamResult::fail(parser->protocolError("stream"));
    }

    if (parser->statusCode() < 200 || parser->statusCode() >= 300) {
        // Error bodies are short; read the rest before mapping.
        while (!parser->isComplete() && !parser->hasError()) {
            const WaitOutcome outcome = waitForBytes(*socket, cancel, elapsed, kConnectTimeoutMs);
            if (outcome != WaitOutcome::Ready) {
                parser->finishOnClose();
                break;
            }
            parser->feed(socket->readAll());
        }
        EngineReply reply;
        reply.statusCode = parser->statusCode();
        reply.body = parser->takeBody();
        return StreamResult::fail(errorFromReply(reply));
    }

    return StreamResult::ok(QSharedPointer<EngineStream>(
        new SocketEngineStream(std::move(socket), std::move(parser), cancel)));
}

SocketEngineConnector::SocketEngineConnector(Settings settings)
    : settings_(std::move(settings)) {}

Result<EngineHandle> SocketEngineConnector::connect() {
    if (!settings_.dockerHost.isEmpty() && !settings_.dockerHost.startsWith("unix://")) {
        return Result<EngineHandle>::fail(EngineError::connection(
            QString("Failed to connect to Docker: unsupported DOCKER_HOST %1").arg(settings_.dockerHost)));
    }
    const QFileInfo info(settings_.socketPath);
    if (!info.exists()) {
        return Result<EngineHandle>::fail(EngineError::connection(
            QString("Failed to connect to Docker: socket %1 not found").arg(settings_.socketPath)));
    }
    return Result<EngineHandle>::ok(EngineHandle(
        new SocketEngineClient(settings_.socketPath, settings_.apiVersion, settings_.requestTimeoutMs)));
}

}  // namespace crcc
