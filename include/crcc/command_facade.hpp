#pragma once

#include <QJsonObject>
#include <QMutex>
#include <QSharedPointer>
#include <QString>
#include <QVector>

#include "crcc/connection_manager.hpp"
#include "crcc/event_relay.hpp"
#include "crcc/runtime_backend.hpp"
#include "crcc/settings.hpp"

namespace crcc {

// One entry point per upstream command. Every result is a JSON object with
// "success"; failures add "error_kind" and "error".
class CommandFacade {
public:
    CommandFacade(
        ConnectionManager& connections,
        QSharedPointer<RuntimeBackend> backend,
        EventRelay& relay,
        Settings settings);
    ~CommandFacade();

    QJsonObject initializeClient();
    QJsonObject status();
    QJsonObject resetClient();

    QJsonObject listContainers();
    QJsonObject listImages();
    QJsonObject startContainer(const QString& containerId);
    QJsonObject stopContainer(const QString& containerId);
    QJsonObject removeContainer(const QString& containerId);
    QJsonObject removeImage(const QString& imageId);
    // options: {"image": required, "name": optional, "start": default true}
    QJsonObject createContainer(const QJsonObject& options);
    QJsonObject pullImage(const QString& imageName, const CancellationToken& cancel = CancellationToken());
    // tailLines < 0 uses the configured default.
    QJsonObject containerLogs(
        const QString& containerId,
        int tailLines = -1,
        const CancellationToken& cancel = CancellationToken());
    QJsonObject containerStats(const QString& containerId);
    QJsonObject containerConfig(const QString& containerId);

    // Replaces any previous events subscription.
    QJsonObject subscribeEvents(QSharedPointer<NotificationSink> sink);
    QJsonObject pullImageWithProgress(const QString& imageName, QSharedPointer<NotificationSink> sink);
    void cancelSubscriptions();

    [[nodiscard]] QString backendName() const;

private:
    QJsonObject failure(const QString& command, const EngineError& error) const;
    QJsonObject lifecycle(const QString& command, const QString& id, const Result<bool>& result) const;
    void pruneFinishedPulls();

    ConnectionManager& connections_;
    QSharedPointer<RuntimeBackend> backend_;
    EventRelay& relay_;
    Settings settings_;

    QMutex subscriptionsMutex_;
    QSharedPointer<Subscription> eventsSubscription_;
    QVector<QSharedPointer<Subscription>> pullSubscriptions_;
};

}  // namespace crcc
