#include "crcc/signal_sink.hpp"

namespace crcc {

SignalSink::SignalSink(QObject* parent)
    : QObject(parent) {}

void SignalSink::deliver(const Notification& notification) {
    emit notificationReady(notification.channel, notification.payload, notification.isError);
}

}  // namespace crcc
