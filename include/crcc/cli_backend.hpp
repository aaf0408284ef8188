#pragma once

#include <QStringList>

#include <functional>

#include "crcc/command_runner.hpp"
#include "crcc/runtime_backend.hpp"
#include "crcc/settings.hpp"

namespace crcc {

// Runs the engine's companion tool with fixed --format templates and parses
// its text output.
class CliBackend final : public RuntimeBackend {
public:
    using Executor = std::function<CommandResult(const QStringList& args, const CancellationToken& cancel)>;

    static const QString kImagesFormat;
    static const QString kContainersFormat;
    static const QString kStatsFormat;

    explicit CliBackend(Settings settings, Executor executor = {});

    [[nodiscard]] QString name() const override { return "cli"; }

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

    // Maps a failed tool invocation onto the error taxonomy.
    static EngineError classifyFailure(const CommandResult& result, const QString& what);

private:
    Result<QString> execute(
        const QStringList& args,
        const QString& what,
        const CancellationToken& cancel = CancellationToken());
    Result<bool> simple(const QStringList& args, const QString& what);

    Settings settings_;
    Executor executor_;
};

}  // namespace crcc
