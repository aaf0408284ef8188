#pragma once

#include <QByteArray>
#include <QMutex>
#include <QPair>
#include <QSharedPointer>
#include <QString>
#include <QWaitCondition>

#include <memory>

#include "crcc/cancellation.hpp"
#include "crcc/connection_manager.hpp"

class QThread;

namespace crcc {

namespace channels {
constexpr const char* kEvent = "docker-event";
constexpr const char* kEventError = "docker-event-error";
constexpr const char* kPullProgress = "pull-progress";
constexpr const char* kPullError = "pull-error";
constexpr const char* kPullComplete = "pull-complete";
}  // namespace channels

struct Notification {
    QString channel;
    QByteArray payload;
    bool isError = false;
};

// Downstream consumer of one subscription. deliver() runs on the relay thread.
class NotificationSink {
public:
    virtual ~NotificationSink() = default;

    virtual void deliver(const Notification& notification) = 0;
};

enum class SubscriptionState {
    Subscribing,
    Active,
    Completed,
    Failed,
    Cancelled,
};

QString subscriptionStateName(SubscriptionState state);

// Owned handle to one relay task. Dropping it cancels the stream and joins
// the task, so no relay outlives its owner.
class Subscription {
public:
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    void cancel();
    [[nodiscard]] SubscriptionState state() const;
    [[nodiscard]] EngineError lastError() const;
    [[nodiscard]] qint64 deliveredCount() const;
    // Blocks until the relay reaches a terminal state. timeoutMs < 0 waits forever.
    bool waitForFinished(int timeoutMs = -1);

private:
    friend class EventRelay;

    struct Channels {
        QString item;
        QString error;
        QString complete;
        bool inBandErrors = false;
    };

    Subscription(EngineHandle handle, EngineRequest request, Channels channels, QSharedPointer<NotificationSink> sink);

    void start();
    void run();
    void finish(SubscriptionState state, const EngineError& error = {});
    void fail(const EngineError& error);

    EngineHandle handle_;
    EngineRequest request_;
    Channels channels_;
    QSharedPointer<NotificationSink> sink_;
    CancellationToken cancel_;
    std::unique_ptr<QThread> thread_;

    mutable QMutex mutex_;
    QWaitCondition stateChanged_;
    SubscriptionState state_ = SubscriptionState::Subscribing;
    bool opened_ = false;
    EngineError lastError_;
    qint64 delivered_ = 0;
};

class EventRelay {
public:
    explicit EventRelay(ConnectionManager& connections);

    // Both return once the engine stream is open; relaying continues on the
    // subscription's own thread.
    Result<QSharedPointer<Subscription>> subscribeEvents(QSharedPointer<NotificationSink> sink);
    Result<QSharedPointer<Subscription>> subscribePullProgress(
        const QString& image,
        QSharedPointer<NotificationSink> sink);

    // Pulls without a sink, draining progress until the engine finishes.
    Result<bool> pullImage(const QString& image, const CancellationToken& cancel = CancellationToken());

    // "registry:5000/app:1.2" -> ("registry:5000/app", "1.2"); tag defaults to "latest".
    static QPair<QString, QString> splitImageReference(const QString& image);
    // In-band failure reported inside a pull progress item, if any.
    static QString progressError(const QByteArray& item);

private:
    Result<QSharedPointer<Subscription>> subscribe(
        EngineRequest request,
        Subscription::Channels channels,
        QSharedPointer<NotificationSink> sink);
    static EngineRequest pullRequest(const QString& image);

    ConnectionManager& connections_;
};

}  // namespace crcc
