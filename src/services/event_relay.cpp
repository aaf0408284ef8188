#include "crcc/event_relay.hpp"

#include <QDeadlineTimer>
#include <QJsonDocument>
#include <QJsonObject>
#include <QThread>
#include <QUrl>

#include "crcc/telemetry.hpp"

namespace crcc {

QString subscriptionStateName(SubscriptionState state) {
    switch (state) {
    case SubscriptionState::Subscribing:
        return "subscribing";
    case SubscriptionState::Active:
        return "active";
    case SubscriptionState::Completed:
        return "completed";
    case SubscriptionState::Failed:
        return "failed";
    case SubscriptionState::Cancelled:
        return "cancelled";
    }
    return "failed";
}

Subscription::Subscription(
    EngineHandle handle,
    EngineRequest request,
    Channels channels,
    QSharedPointer<NotificationSink> sink)
    : handle_(std::move(handle)),
      request_(std::move(request)),
      channels_(std::move(channels)),
      sink_(std::move(sink)) {}

Subscription::~Subscription() {
    cancel();
    if (thread_) {
        thread_->wait();
    }
}

void Subscription::start() {
    thread_.reset(QThread::create([this]() { run(); }));
    thread_->setObjectName("crcc-relay");
    thread_->start();
}

void Subscription::cancel() {
    cancel_.cancel();
}

SubscriptionState Subscription::state() const {
    QMutexLocker lock(&mutex_);
    return state_;
}

EngineError Subscription::lastError() const {
    QMutexLocker lock(&mutex_);
    return lastError_;
}

qint64 Subscription::deliveredCount() const {
    QMutexLocker lock(&mutex_);
    return delivered_;
}

bool Subscription::waitForFinished(int timeoutMs) {
    const QDeadlineTimer deadline =
        timeoutMs < 0 ? QDeadlineTimer(QDeadlineTimer::Forever) : QDeadlineTimer(timeoutMs);
    QMutexLocker lock(&mutex_);
    while (state_ == SubscriptionState::Subscribing || state_ == SubscriptionState::Active) {
        if (!stateChanged_.wait(&mutex_, deadline)) {
            return false;
        }
    }
    return true;
}

void Subscription::finish(SubscriptionState state, const EngineError& error) {
    QMutexLocker lock(&mutex_);
    state_ = state;
    lastError_ = error;
    stateChanged_.wakeAll();
}

void Subscription::fail(const EngineError& error) {
    sink_->deliver({channels_.error, QString("Error: %1").arg(error.message).toUtf8(), true});
    Telemetry::instance().incrementCounter("relay.failures");
    Telemetry::instance().recordError("relay_failed", error, {{"path", request_.path}});
    finish(SubscriptionState::Failed, error);
}

void Subscription::run() {
    const Result<QSharedPointer<EngineStream>> opened = handle_->openStream(request_, cancel_);
    if (!opened.success()) {
        finish(cancel_.isCancelled() ? SubscriptionState::Cancelled : SubscriptionState::Failed, opened.error);
        return;
    }
    {
        QMutexLocker lock(&mutex_);
        state_ = SubscriptionState::Active;
        opened_ = true;
        stateChanged_.wakeAll();
    }

    const QSharedPointer<EngineStream> stream = opened.value;
    while (true) {
        QByteArray item;
        EngineError error;
        if (stream->next(&item, &error)) {
            if (channels_.inBandErrors) {
                const QString inBand = EventRelay::progressError(item);
                if (!inBand.isEmpty()) {
                    fail(EngineError::operation(inBand));
                    break;
                }
            }
            sink_->deliver({channels_.item, item, false});
            Telemetry::instance().incrementCounter("relay.items");
            QMutexLocker lock(&mutex_);
            ++delivered_;
            continue;
        }

        if (cancel_.isCancelled()) {
            Telemetry::instance().recordEvent("relay_cancelled", {{"path", request_.path}});
            finish(SubscriptionState::Cancelled);
        } else if (error.isError()) {
            fail(error);
        } else {
            if (!channels_.complete.isEmpty()) {
                sink_->deliver({channels_.complete, {}, false});
            }
            finish(SubscriptionState::Completed);
        }
        break;
    }
    stream->close();
}

EventRelay::EventRelay(ConnectionManager& connections)
    : connections_(connections) {}

Result<QSharedPointer<Subscription>> EventRelay::subscribe(
    EngineRequest request,
    Subscription::Channels channels,
    QSharedPointer<NotificationSink> sink) {
    using SubscriptionResult = Result<QSharedPointer<Subscription>>;
    if (sink.isNull()) {
        return SubscriptionResult::fail(EngineError::operation("Subscription requires a notification sink"));
    }
    const Result<EngineHandle> handle = connections_.ensureConnected();
    if (!handle.success()) {
        return SubscriptionResult::fail(handle.error);
    }

    QSharedPointer<Subscription> subscription(
        new Subscription(handle.value, std::move(request), std::move(channels), std::move(sink)));
    subscription->start();

    {
        QMutexLocker lock(&subscription->mutex_);
        while (subscription->state_ == SubscriptionState::Subscribing) {
            subscription->stateChanged_.wait(&subscription->mutex_);
        }
        if (!subscription->opened_) {
            const EngineError error = subscription->lastError_;
            lock.unlock();
            subscription->thread_->wait();
            return SubscriptionResult::fail(error);
        }
    }
    Telemetry::instance().incrementCounter("relay.subscriptions");
    return SubscriptionResult::ok(subscription);
}

Result<QSharedPointer<Subscription>> EventRelay::subscribeEvents(QSharedPointer<NotificationSink> sink) {
    EngineRequest request;
    request.path = "/events";
    return subscribe(request, {channels::kEvent, channels::kEventError, QString(), false}, std::move(sink));
}

Result<QSharedPointer<Subscription>> EventRelay::subscribePullProgress(
    const QString& image,
    QSharedPointer<NotificationSink> sink) {
    return subscribe(
        pullRequest(image),
        {channels::kPullProgress, channels::kPullError, channels::kPullComplete, true},
        std::move(sink));
}

Result<bool> EventRelay::pullImage(const QString& image, const CancellationToken& cancel) {
    const Result<EngineHandle> handle = connections_.ensureConnected();
    if (!handle.success()) {
        return Result<bool>::fail(handle.error);
    }
    const Result<QSharedPointer<EngineStream>> opened = handle.value->openStream(pullRequest(image), cancel);
    if (!opened.success()) {
        return Result<bool>::fail(opened.error.kind == ErrorKind::Operation
            ? EngineError::operation(QString("Failed to pull image: %1").arg(opened.error.message))
            : opened.error);
    }

    const QSharedPointer<EngineStream> stream = opened.value;
    Result<bool> result = Result<bool>::ok(true);
    QByteArray item;
    EngineError error;
    while (stream->next(&item, &error)) {
        const QString inBand = progressError(item);
        if (!inBand.isEmpty()) {
            error = EngineError::operation(inBand);
            break;
        }
    }
    if (cancel.isCancelled()) {
        result = Result<bool>::fail(EngineError::operation("cancelled"));
    } else if (error.isError()) {
        result = Result<bool>::fail(EngineError::operation(QString("Failed to pull image: %1").arg(error.message)));
    }
    stream->close();
    return result;
}

QPair<QString, QString> EventRelay::splitImageReference(const QString& image) {
    const QString trimmed = image.trimmed();
    if (trimmed.contains('@')) {
        return {trimmed, QString()};
    }
    const int slash = trimmed.lastIndexOf('/');
    const int colon = trimmed.lastIndexOf(':');
    if (colon > slash && colon + 1 < trimmed.size()) {
        return {trimmed.left(colon), trimmed.mid(colon + 1)};
    }
    return {colon > slash ? trimmed.left(colon) : trimmed, "latest"};
}

QString EventRelay::progressError(const QByteArray& item) {
    const QJsonObject object = QJsonDocument::fromJson(item).object();
    if (!object.contains("error")) {
        return {};
    }
    const QString message = object.value("errorDetail").toObject().value("message").toString();
    return message.isEmpty() ? object.value("error").toString() : message;
}

EngineRequest EventRelay::pullRequest(const QString& image) {
    const auto [repository, tag] = splitImageReference(image);
    EngineRequest request;
    request.method = "POST";
    request.path = QString("/images/create?fromImage=%1")
                       .arg(QString::fromLatin1(QUrl::toPercentEncoding(repository)));
    if (!tag.isEmpty()) {
        request.path += QString("&tag=%1").arg(QString::fromLatin1(QUrl::toPercentEncoding(tag)));
    }
    return request;
}

}  // namespace crcc
