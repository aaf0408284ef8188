#pragma once

#include <QString>

#include "crcc/engine_client.hpp"
#include "crcc/settings.hpp"

namespace crcc {

// Engine API over the daemon's Unix-domain socket. Every call opens its own
// QLocalSocket, so one instance is safe to share between threads.
class SocketEngineClient final : public EngineClient {
public:
    SocketEngineClient(QString socketPath, QString apiVersion, int requestTimeoutMs);

    Result<EngineReply> send(const EngineRequest& request, const CancellationToken& cancel) override;
    Result<QSharedPointer<EngineStream>> openStream(
        const EngineRequest& request,
        const CancellationToken& cancel) override;

    [[nodiscard]] QString socketPath() const { return socketPath_; }

private:
    [[nodiscard]] QByteArray buildRequest(const EngineRequest& request) const;

    QString socketPath_;
    QString apiVersion_;
    int requestTimeoutMs_ = 0;
};

class SocketEngineConnector final : public EngineConnector {
public:
    explicit SocketEngineConnector(Settings settings);

    Result<EngineHandle> connect() override;

private:
    Settings settings_;
};

}  // namespace crcc
