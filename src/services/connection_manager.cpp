#include "crcc/connection_manager.hpp"

#include <QJsonObject>

#include "crcc/telemetry.hpp"

namespace crcc {

QString ConnectionStatus::stateName() const {
    switch (state) {
    case ConnectionState::Uninitialized:
        return "Uninitialized";
    case ConnectionState::Connected:
        return "Connected";
    case ConnectionState::Disconnected:
        return "Disconnected";
    case ConnectionState::Error:
        return "Error";
    }
    return "Error";
}

QJsonObject ConnectionStatus::toJson() const {
    QJsonObject out;
    // Uninitialized is internal; callers see Disconnected.
    out.insert("state", state == ConnectionState::Uninitialized ? QString("Disconnected") : stateName());
    if (state == ConnectionState::Error) {
        out.insert("reason", reason);
    }
    return out;
}

ConnectionManager::ConnectionManager(QSharedPointer<EngineConnector> connector)
    : connector_(std::move(connector)) {}

Result<EngineHandle> ConnectionManager::connectOnce(QMutexLocker<QMutex>& lock) {
    initializing_ = true;
    const quint64 generation = generation_;
    lock.unlock();

    Telemetry::instance().incrementCounter("connection.attempts");
    Result<EngineHandle> result = connector_->connect();
    if (result.success() && result.value.isNull()) {
        result = Result<EngineHandle>::fail(EngineError::connection("Connector returned no engine handle"));
    }

    lock.relock();
    initializing_ = false;
    if (generation == generation_) {
        if (result.success()) {
            handle_ = result.value;
            status_ = {ConnectionState::Connected, {}};
            lastError_ = EngineError{};
        } else {
            status_ = {ConnectionState::Error, result.error.message};
            lastError_ = result.error;
        }
    }
    initDone_.wakeAll();

    if (result.success()) {
        Telemetry::instance().incrementCounter("connection.established");
    } else {
        Telemetry::instance().incrementCounter("connection.failures");
        Telemetry::instance().recordError("connection_error", result.error);
    }
    return result;
}

// Caller holds mutex_.
void ConnectionManager::waitForInitialization() {
    while (initializing_) {
        initDone_.wait(&mutex_);
    }
}

Result<EngineHandle> ConnectionManager::awaitInitialization() {
    waitForInitialization();
    if (!handle_.isNull()) {
        return Result<EngineHandle>::ok(handle_);
    }
    if (lastError_.isError()) {
        return Result<EngineHandle>::fail(lastError_);
    }
    return Result<EngineHandle>::fail(EngineError::connection("Docker client not initialized"));
}

Result<EngineHandle> ConnectionManager::ensureConnected() {
    QMutexLocker<QMutex> lock(&mutex_);
    if (initializing_) {
        return awaitInitialization();
    }
    if (!handle_.isNull()) {
        return Result<EngineHandle>::ok(handle_);
    }
    return connectOnce(lock);
}

ConnectionStatus ConnectionManager::status(const CancellationToken& cancel) {
    EngineHandle handle;
    quint64 generation = 0;
    {
        QMutexLocker<QMutex> lock(&mutex_);
        if (initializing_) {
            waitForInitialization();
            return status_;
        }
        if (handle_.isNull()) {
            // A freshly connected handle is reported without a further ping.
            const Result<EngineHandle> connected = connectOnce(lock);
            return connected.success() ? ConnectionStatus{ConnectionState::Connected, {}}
                                       : ConnectionStatus{ConnectionState::Error, connected.error.message};
        }
        if (status_.state == ConnectionState::Error) {
            return status_;
        }
        handle = handle_;
        generation = generation_;
    }

    const Result<bool> ping = handle->ping(cancel);

    QMutexLocker<QMutex> lock(&mutex_);
    if (generation != generation_) {
        // A reset replaced the handle while pinging; report the new state.
        return status_;
    }
    if (!ping.success()) {
        status_ = {ConnectionState::Error, QString("Docker is not responding: %1").arg(ping.error.message)};
        Telemetry::instance().recordError("status_error", ping.error);
    } else if (status_.state != ConnectionState::Error) {
        status_ = {ConnectionState::Connected, {}};
    }
    return status_;
}

Result<EngineHandle> ConnectionManager::reset() {
    QMutexLocker<QMutex> lock(&mutex_);
    waitForInitialization();
    handle_.reset();
    status_ = {ConnectionState::Disconnected, {}};
    lastError_ = EngineError{};
    ++generation_;
    Telemetry::instance().recordEvent("connection_reset");
    return connectOnce(lock);
}

ConnectionStatus ConnectionManager::currentStatus() const {
    QMutexLocker<QMutex> lock(&mutex_);
    return status_;
}

}  // namespace crcc
