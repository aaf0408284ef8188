#pragma once

#include <QJsonObject>
#include <QObject>
#include <QString>

#include "crcc/command_facade.hpp"

namespace crcc {

// Background worker that polls engine state and executes container actions.
class RuntimeWorker final : public QObject {
    Q_OBJECT

public:
    explicit RuntimeWorker(CommandFacade& facade, QObject* parent = nullptr);

public slots:
    void poll(const QJsonObject& request);
    void runAction(const QString& action, const QJsonObject& payload);

signals:
    void snapshotReady(const QJsonObject& snapshot);
    void actionFinished(const QJsonObject& result);

private:
    void pollNow();

    CommandFacade& facade_;
    QJsonObject request_;

    bool busy_ = false;
    bool pending_ = false;
    quint64 syncVersion_ = 0;
    QString lastSyncFingerprint_;
};

}  // namespace crcc
