#pragma once

#include <QAtomicInt>
#include <QByteArray>
#include <QMap>
#include <QMutex>
#include <QSharedPointer>
#include <QStringList>
#include <QThread>
#include <QVector>

#include "crcc/engine_client.hpp"
#include "crcc/event_relay.hpp"

namespace crcc {

// Scripted stream: yields items in order, then either ends, fails with
// endError, or stays open until cancelled.
struct FakeStreamScript {
    QVector<QByteArray> items;
    EngineError openError;
    EngineError endError;
    bool holdOpen = false;
};

class FakeEngineStream final : public EngineStream {
public:
    FakeEngineStream(FakeStreamScript script, CancellationToken cancel)
        : script_(std::move(script)),
          cancel_(std::move(cancel)) {}

    bool next(QByteArray* item, EngineError* error) override {
        if (cancel_.isCancelled() || closed_.loadAcquire() != 0) {
            return false;
        }
        if (index_ < script_.items.size()) {
            *item = script_.items.at(index_++);
            return true;
        }
        while (script_.holdOpen && !cancel_.isCancelled() && closed_.loadAcquire() == 0) {
            QThread::msleep(5);
        }
        if (!cancel_.isCancelled() && script_.endError.isError()) {
            *error = script_.endError;
        }
        return false;
    }

    void close() override { closed_.storeRelease(1); }

private:
    FakeStreamScript script_;
    CancellationToken cancel_;
    int index_ = 0;
    QAtomicInt closed_;
};

// Engine keyed by "METHOD path". Unscripted routes answer 404.
class FakeEngineClient final : public EngineClient {
public:
    void setReply(const QByteArray& method, const QString& path, int status, const QByteArray& body) {
        QMutexLocker lock(&mutex_);
        replies_.insert(key(method, path), EngineReply{status, body, "application/json"});
    }

    void setStream(const QByteArray& method, const QString& path, FakeStreamScript script) {
        QMutexLocker lock(&mutex_);
        streams_.insert(key(method, path), std::move(script));
    }

    void setTransportError(const EngineError& error) {
        QMutexLocker lock(&mutex_);
        transportError_ = error;
    }

    QStringList requests() const {
        QMutexLocker lock(&mutex_);
        return requests_;
    }

    Result<EngineReply> send(const EngineRequest& request, const CancellationToken& cancel) override {
        QMutexLocker lock(&mutex_);
        requests_.append(key(request.method, request.path));
        if (cancel.isCancelled()) {
            return Result<EngineReply>::fail(EngineError::operation("cancelled"));
        }
        if (transportError_.isError()) {
            return Result<EngineReply>::fail(transportError_);
        }
        return Result<EngineReply>::ok(replies_.value(
            key(request.method, request.path),
            EngineReply{404, R"({"message":"no such route"})", "application/json"}));
    }

    Result<QSharedPointer<EngineStream>> openStream(
        const EngineRequest& request,
        const CancellationToken& cancel) override {
        FakeStreamScript script;
        {
            QMutexLocker lock(&mutex_);
            requests_.append(key(request.method, request.path));
            if (transportError_.isError()) {
                return Result<QSharedPointer<EngineStream>>::fail(transportError_);
            }
            const QString routeKey = key(request.method, request.path);
            if (!streams_.contains(routeKey)) {
                return Result<QSharedPointer<EngineStream>>::fail(EngineError::notFound("no such route"));
            }
            script = streams_.value(routeKey);
        }
        if (script.openError.isError()) {
            return Result<QSharedPointer<EngineStream>>::fail(script.openError);
        }
        return Result<QSharedPointer<EngineStream>>::ok(
            QSharedPointer<EngineStream>(new FakeEngineStream(script, cancel)));
    }

private:
    static QString key(const QByteArray& method, const QString& path) {
        return QString::fromLatin1(method) + " " + path;
    }

    mutable QMutex mutex_;
    QMap<QString, EngineReply> replies_;
    QMap<QString, FakeStreamScript> streams_;
    QStringList requests_;
    EngineError transportError_;
};

// Hands out a fixed client (or a fixed error), counting attempts.
class FakeConnector final : public EngineConnector {
public:
    explicit FakeConnector(QSharedPointer<FakeEngineClient> client, int delayMs = 0)
        : client_(std::move(client)),
          delayMs_(delayMs) {}

    void setFailure(const EngineError& error) {
        QMutexLocker lock(&mutex_);
        failure_ = error;
    }

    int attempts() const { return attempts_.loadAcquire(); }

    Result<EngineHandle> connect() override {
        attempts_.fetchAndAddOrdered(1);
        if (delayMs_ > 0) {
            QThread::msleep(static_cast<unsigned long>(delayMs_));
        }
        QMutexLocker lock(&mutex_);
        if (failure_.isError()) {
            return Result<EngineHandle>::fail(failure_);
        }
        return Result<EngineHandle>::ok(client_);
    }

private:
    QSharedPointer<FakeEngineClient> client_;
    int delayMs_ = 0;
    QAtomicInt attempts_;
    mutable QMutex mutex_;
    EngineError failure_;
};

class RecordingSink final : public NotificationSink {
public:
    void deliver(const Notification& notification) override {
        QMutexLocker lock(&mutex_);
        received_.append(notification);
    }

    QVector<Notification> received() const {
        QMutexLocker lock(&mutex_);
        return received_;
    }

private:
    mutable QMutex mutex_;
    QVector<Notification> received_;
};

}  // namespace crcc
