#include "crcc/resource_types.hpp"

#include <QJsonArray>

namespace crcc {

namespace {

QJsonObject labelsToJson(const QMap<QString, QString>& labels) {
    QJsonObject out;
    for (auto it = labels.constBegin(); it != labels.constEnd(); ++it) {
        out.insert(it.key(), it.value());
    }
    return out;
}

QJsonArray portsToJson(const QVector<PortBinding>& ports) {
    QJsonArray out;
    for (const PortBinding& port : ports) {
        out.append(toJson(port));
    }
    return out;
}

}  // namespace

QJsonObject toJson(const PortBinding& port) {
    return {
        {"ip", port.hostIp},
        {"private_port", port.containerPort},
        {"public_port", port.hostPort},
        {"type", port.protocol},
    };
}

QJsonObject toJson(const ContainerRecord& container) {
    return {
        {"id", container.id},
        {"names", QJsonArray::fromStringList(container.names)},
        {"image", container.image},
        {"state", container.state},
        {"status", container.status},
        {"labels", labelsToJson(container.labels)},
        {"ports", portsToJson(container.ports)},
        {"created", static_cast<double>(container.created)},
        {"created_estimated", container.createdEstimated},
    };
}

QJsonObject toJson(const ImageRecord& image) {
    return {
        {"id", image.id},
        {"repo_tags", QJsonArray::fromStringList(image.repoTags)},
        {"size", static_cast<double>(image.size)},
        {"created", static_cast<double>(image.created)},
        {"created_estimated", image.createdEstimated},
    };
}

QJsonObject toJson(const ContainerDetail& detail) {
    QJsonArray ports;
    for (const PortBinding& port : detail.summary.ports) {
        ports.append(QJsonObject{
            {"host_ip", port.hostIp},
            {"host_port", port.hostPort > 0 ? QString::number(port.hostPort) : QString()},
            {"container_port", QString::number(port.containerPort)},
            {"protocol", port.protocol},
        });
    }
    QJsonArray volumes;
    for (const VolumeMount& mount : detail.volumes) {
        volumes.append(QJsonObject{
            {"host_path", mount.hostPath},
            {"container_path", mount.containerPath},
            {"mode", mount.mode},
        });
    }

    return {
        {"id", detail.summary.id},
        {"name", detail.summary.names.value(0)},
        {"image", detail.summary.image},
        {"command", detail.command},
        {"created", detail.createdText},
        {"created_unix", static_cast<double>(detail.summary.created)},
        {"status", detail.summary.status},
        {"ports", ports},
        {"volumes", volumes},
        {"env_vars", QJsonArray::fromStringList(detail.env)},
        {"labels", labelsToJson(detail.summary.labels)},
        {"network_mode", detail.networkMode},
        {"restart_policy", detail.restartPolicy},
    };
}

}  // namespace crcc
