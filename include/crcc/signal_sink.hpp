#pragma once

#include <QByteArray>
#include <QObject>
#include <QString>

#include "crcc/event_relay.hpp"

namespace crcc {

// Bridges relay notifications onto the Qt event loop. deliver() runs on the
// relay thread; receivers connected with a queued connection get each
// notification in delivery order.
class SignalSink final : public QObject, public NotificationSink {
    Q_OBJECT

public:
    explicit SignalSink(QObject* parent = nullptr);

    void deliver(const Notification& notification) override;

signals:
    void notificationReady(const QString& channel, const QByteArray& payload, bool isError);
};

}  // namespace crcc
