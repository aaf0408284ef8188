#include "crcc/command_facade.hpp"

#include <QElapsedTimer>
#include <QJsonArray>

#include "crcc/telemetry.hpp"

namespace crcc {

namespace {

QJsonObject successResult() {
    return {{"success", true}};
}

}  // namespace

CommandFacade::CommandFacade(
    ConnectionManager& connections,
    QSharedPointer<RuntimeBackend> backend,
    EventRelay& relay,
    Settings settings)
    : connections_(connections),
      backend_(std::move(backend)),
      relay_(relay),
      settings_(std::move(settings)) {}

CommandFacade::~CommandFacade() {
    cancelSubscriptions();
}

QString CommandFacade::backendName() const {
    return backend_->name();
}

QJsonObject CommandFacade::failure(const QString& command, const EngineError& error) const {
    Telemetry::instance().incrementCounter("facade.failed." + command);
    Telemetry::instance().recordError("command_failed", error, {{"command", command}});
    return error.toJson();
}

QJsonObject CommandFacade::lifecycle(const QString& command, const QString& id, const Result<bool>& result) const {
    if (!result.success()) {
        return failure(command, result.error);
    }
    Telemetry::instance().incrementCounter("facade.ok." + command);
    QJsonObject out = successResult();
    out.insert("id", id);
    return out;
}

QJsonObject CommandFacade::initializeClient() {
    const Result<EngineHandle> handle = connections_.ensureConnected();
    QJsonObject out = successResult();
    out.insert("status", connections_.currentStatus().toJson());
    if (!handle.success()) {
        out.insert("error", handle.error.toString());
    }
    return out;
}

QJsonObject CommandFacade::status() {
    QJsonObject out = successResult();
    out.insert("status", connections_.status().toJson());
    out.insert("backend", backend_->name());
    return out;
}

QJsonObject CommandFacade::resetClient() {
    const Result<EngineHandle> handle = connections_.reset();
    QJsonObject out = successResult();
    out.insert("status", connections_.currentStatus().toJson());
    if (!handle.success()) {
        out.insert("error", handle.error.toString());
    }
    return out;
}

QJsonObject CommandFacade::listContainers() {
    QElapsedTimer timer;
    timer.start();
    const Result<QVector<ContainerRecord>> result = backend_->listContainers();
    Telemetry::instance().recordDurationMs("facade.list_containers_ms", timer.elapsed());
    if (!result.success()) {
        return failure("list_containers", result.error);
    }
    QJsonArray containers;
    for (const ContainerRecord& container : result.value) {
        containers.append(toJson(container));
    }
    QJsonObject out = successResult();
    out.insert("containers", containers);
    return out;
}

QJsonObject CommandFacade::listImages() {
    const Result<QVector<ImageRecord>> result = backend_->listImages();
    if (!result.success()) {
        return failure("list_images", result.error);
    }
    QJsonArray images;
    for (const ImageRecord& image : result.value) {
        images.append(toJson(image));
    }
    QJsonObject out = successResult();
    out.insert("images", images);
    return out;
}

QJsonObject CommandFacade::startContainer(const QString& containerId) {
    if (containerId.trimmed().isEmpty()) {
        return failure("start_container", EngineError::operation("Container id is required"));
    }
    return lifecycle("start_container", containerId, backend_->startContainer(containerId));
}

QJsonObject CommandFacade::stopContainer(const QString& containerId) {
    if (containerId.trimmed().isEmpty()) {
        return failure("stop_container", EngineError::operation("Container id is required"));
    }
    return lifecycle("stop_container", containerId, backend_->stopContainer(containerId));
}

QJsonObject CommandFacade::removeContainer(const QString& containerId) {
    if (containerId.trimmed().isEmpty()) {
        return failure("remove_container", EngineError::operation("Container id is required"));
    }
    return lifecycle("remove_container", containerId, backend_->removeContainer(containerId));
}

QJsonObject CommandFacade::removeImage(const QString& imageId) {
    if (imageId.trimmed().isEmpty()) {
        return failure("remove_image", EngineError::operation("Image id is required"));
    }
    return lifecycle("remove_image", imageId, backend_->removeImage(imageId));
}

QJsonObject CommandFacade::createContainer(const QJsonObject& options) {
    const QString image = options.value("image").toString().trimmed();
    const QString name = options.value("name").toString().trimmed();
    const bool start = options.value("start").toBool(true);
    if (image.isEmpty()) {
        return failure("create_container", EngineError::operation("Image is required"));
    }

    const Result<QString> created = backend_->createContainer(image, name);
    if (!created.success()) {
        return failure("create_container", created.error);
    }
    Telemetry::instance().recordEvent("container_created", {{"id", created.value}, {"image", image}});

    if (start) {
        const Result<bool> started = backend_->startContainer(created.value);
        if (!started.success()) {
            // Keeps the start failure's kind so the display string carries one prefix.
            const EngineError error{
                started.error.kind,
                QString("Container created (ID: %1), but failed to start: %2").arg(created.value, started.error.message)};
            QJsonObject out = failure("create_container", error);
            out.insert("id", created.value);
            return out;
        }
    }

    QJsonObject out = successResult();
    out.insert("id", created.value);
    out.insert("started", start);
    return out;
}

QJsonObject CommandFacade::pullImage(const QString& imageName, const CancellationToken& cancel) {
    if (imageName.trimmed().isEmpty()) {
        return failure("pull_image", EngineError::operation("Image name is required"));
    }
    const Result<bool> result = relay_.pullImage(imageName, cancel);
    if (!result.success()) {
        return failure("pull_image", result.error);
    }
    QJsonObject out = successResult();
    out.insert("image", imageName);
    return out;
}

QJsonObject CommandFacade::containerLogs(const QString& containerId, int tailLines, const CancellationToken& cancel) {
    const int tail = tailLines < 0 ? settings_.logsTail : tailLines;
    const Result<QString> result = backend_->containerLogs(containerId, tail, cancel);
    if (!result.success()) {
        return failure("container_logs", result.error);
    }
    QJsonObject out = successResult();
    out.insert("logs", result.value);
    return out;
}

QJsonObject CommandFacade::containerStats(const QString& containerId) {
    const Result<StatsSample> result = backend_->containerStats(containerId);
    if (!result.success()) {
        return failure("container_stats", result.error);
    }
    QJsonObject out = successResult();
    out.insert("stats", result.value.toJson());
    return out;
}

QJsonObject CommandFacade::containerConfig(const QString& containerId) {
    const Result<ContainerDetail> result = backend_->inspectContainer(containerId);
    if (!result.success()) {
        return failure("container_config", result.error);
    }
    QJsonObject out = successResult();
    out.insert("config", toJson(result.value));
    return out;
}

QJsonObject CommandFacade::subscribeEvents(QSharedPointer<NotificationSink> sink) {
    const Result<QSharedPointer<Subscription>> result = relay_.subscribeEvents(std::move(sink));
    if (!result.success()) {
        return failure("subscribe_events", result.error);
    }
    QSharedPointer<Subscription> previous;
    {
        QMutexLocker lock(&subscriptionsMutex_);
        previous = eventsSubscription_;
        eventsSubscription_ = result.value;
    }
    if (previous) {
        previous->cancel();
    }
    QJsonObject out = successResult();
    out.insert("state", subscriptionStateName(result.value->state()));
    return out;
}

QJsonObject CommandFacade::pullImageWithProgress(const QString& imageName, QSharedPointer<NotificationSink> sink) {
    if (imageName.trimmed().isEmpty()) {
        return failure("pull_image_with_progress", EngineError::operation("Image name is required"));
    }
    const Result<QSharedPointer<Subscription>> result = relay_.subscribePullProgress(imageName, std::move(sink));
    if (!result.success()) {
        return failure("pull_image_with_progress", result.error);
    }
    {
        QMutexLocker lock(&subscriptionsMutex_);
        pruneFinishedPulls();
        pullSubscriptions_.append(result.value);
    }
    QJsonObject out = successResult();
    out.insert("image", imageName);
    out.insert("state", subscriptionStateName(result.value->state()));
    return out;
}

void CommandFacade::pruneFinishedPulls() {
    for (int i = pullSubscriptions_.size() - 1; i >= 0; --i) {
        const SubscriptionState state = pullSubscriptions_[i]->state();
        if (state != SubscriptionState::Subscribing && state != SubscriptionState::Active) {
            pullSubscriptions_.removeAt(i);
        }
    }
}

void CommandFacade::cancelSubscriptions() {
    QSharedPointer<Subscription> events;
    QVector<QSharedPointer<Subscription>> pulls;
    {
        QMutexLocker lock(&subscriptionsMutex_);
        events.swap(eventsSubscription_);
        pulls.swap(pullSubscriptions_);
    }
    if (events) {
        events->cancel();
    }
    for (const QSharedPointer<Subscription>& pull : pulls) {
        pull->cancel();
    }
}

}  // namespace crcc
