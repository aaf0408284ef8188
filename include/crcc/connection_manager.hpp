#pragma once

#include <QJsonObject>
#include <QMutex>
#include <QSharedPointer>
#include <QString>
#include <QWaitCondition>

#include "crcc/engine_client.hpp"

namespace crcc {

enum class ConnectionState {
    Uninitialized,
    Connected,
    Disconnected,
    Error,
};

struct ConnectionStatus {
    ConnectionState state = ConnectionState::Uninitialized;
    QString reason;

    [[nodiscard]] QString stateName() const;
    [[nodiscard]] QJsonObject toJson() const;
};

// Owns the single engine handle. The mutex guards only reads and replacement
// of the handle; engine calls (connect, ping) always run outside it. Concurrent
// initializers wait for the one in flight and observe its outcome, including
// the exact error it failed with.
//
// status() connects when there is no handle yet (or the last attempt failed)
// and pings an existing one. A failed ping leaves a sticky Error until reset().
class ConnectionManager {
public:
    explicit ConnectionManager(QSharedPointer<EngineConnector> connector);

    Result<EngineHandle> ensureConnected();
    ConnectionStatus status(const CancellationToken& cancel = CancellationToken());
    Result<EngineHandle> reset();

    // State as last observed, without contacting the engine.
    [[nodiscard]] ConnectionStatus currentStatus() const;

private:
    Result<EngineHandle> connectOnce(QMutexLocker<QMutex>& lock);
    void waitForInitialization();
    Result<EngineHandle> awaitInitialization();

    QSharedPointer<EngineConnector> connector_;

    mutable QMutex mutex_;
    QWaitCondition initDone_;
    EngineHandle handle_;
    ConnectionStatus status_;
    EngineError lastError_;
    bool initializing_ = false;
    quint64 generation_ = 0;
};

}  // namespace crcc
