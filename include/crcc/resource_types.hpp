#pragma once

#include <QJsonObject>
#include <QMap>
#include <QString>
#include <QStringList>
#include <QVector>

namespace crcc {

struct PortBinding {
    QString hostIp;
    int containerPort = 0;
    int hostPort = 0;
    QString protocol = "tcp";

    bool operator==(const PortBinding& other) const {
        return hostIp == other.hostIp && containerPort == other.containerPort
            && hostPort == other.hostPort && protocol == other.protocol;
    }
};

// Snapshot of one container from a single list query. Never updated in place.
struct ContainerRecord {
    QString id;
    QStringList names;
    QString image;
    QString state;
    QString status;
    QMap<QString, QString> labels;
    QVector<PortBinding> ports;
    qint64 created = 0;
    bool createdEstimated = false;
};

struct ImageRecord {
    QString id;
    QStringList repoTags;
    quint64 size = 0;
    qint64 created = 0;
    bool createdEstimated = false;
};

struct VolumeMount {
    QString hostPath;
    QString containerPath;
    QString mode;
};

struct ContainerDetail {
    ContainerRecord summary;
    QString createdText;
    QString command;
    QVector<VolumeMount> volumes;
    QStringList env;
    QString networkMode;
    QString restartPolicy = "no";
};

QJsonObject toJson(const PortBinding& port);
QJsonObject toJson(const ContainerRecord& container);
QJsonObject toJson(const ImageRecord& image);
QJsonObject toJson(const ContainerDetail& detail);

}  // namespace crcc
