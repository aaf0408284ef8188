#pragma once

#include <QSharedPointer>
#include <QString>
#include <QVector>

#include "crcc/cancellation.hpp"
#include "crcc/engine_error.hpp"
#include "crcc/resource_types.hpp"
#include "crcc/stats_engine.hpp"

namespace crcc {

class ConnectionManager;
struct Settings;

// Query and lifecycle operations with one implementation per data source:
// the engine API (structured) and the companion CLI tool (text).
class RuntimeBackend {
public:
    virtual ~RuntimeBackend() = default;

    [[nodiscard]] virtual QString name() const = 0;

    virtual Result<QVector<ContainerRecord>> listContainers() = 0;
    virtual Result<QVector<ImageRecord>> listImages() = 0;
    virtual Result<ContainerDetail> inspectContainer(const QString& id) = 0;
    virtual Result<StatsSample> containerStats(const QString& id) = 0;
    virtual Result<QString> containerLogs(const QString& id, int tail, const CancellationToken& cancel) = 0;

    virtual Result<bool> startContainer(const QString& id) = 0;
    virtual Result<bool> stopContainer(const QString& id) = 0;
    virtual Result<bool> removeContainer(const QString& id) = 0;
    virtual Result<bool> removeImage(const QString& id) = 0;
    // Returns the new container id.
    virtual Result<QString> createContainer(const QString& image, const QString& name) = 0;
};

// Picks the implementation named by settings.mode.
QSharedPointer<RuntimeBackend> makeRuntimeBackend(const Settings& settings, ConnectionManager& connections);

}  // namespace crcc
