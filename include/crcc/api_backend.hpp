#pragma once

#include "crcc/connection_manager.hpp"
#include "crcc/runtime_backend.hpp"

namespace crcc {

class ApiBackend final : public RuntimeBackend {
public:
    explicit ApiBackend(ConnectionManager& connections);

    [[nodiscard]] QString name() const override { return "api"; }

    Result<QVector<ContainerRecord>> listContainers() override;
    Result<QVector<ImageRecord>> listImages() override;
    Result<ContainerDetail> inspectContainer(const QString& id) override;
    Result<StatsSample> containerStats(const QString& id) override;
    Result<QString> containerLogs(const QString& id, int tail, const CancellationToken& cancel) override;

    Result<bool> startContainer(const QString& id) override;
    Result<bool> stopContainer(const QString& id) override;
    Result<bool> removeContainer(const QString& id) override;
    Result<bool> removeImage(const QString& id) override;
    Result<QString> createContainer(const QString& image, const QString& name) override;

private:
    Result<QJsonDocument> getJson(const QString& path);
    Result<bool> command(const QByteArray& method, const QString& path);

    ConnectionManager& connections_;
};

}  // namespace crcc
