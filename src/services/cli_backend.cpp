#include "crcc/cli_backend.hpp"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>

#include "crcc/resource_normalizer.hpp"

namespace crcc {

const QString CliBackend::kImagesFormat = "{{.ID}}|{{.Repository}}:{{.Tag}}|{{.Size}}|{{.CreatedAt}}";
const QString CliBackend::kContainersFormat =
    "{{.ID}}|{{.Names}}|{{.Image}}|{{.State}}|{{.Status}}|{{.CreatedAt}}|{{.Labels}}|{{.Ports}}";
const QString CliBackend::kStatsFormat = "{{.CPUPerc}}|{{.MemUsage}}|{{.MemPerc}}|{{.NetIO}}|{{.BlockIO}}";

CliBackend::CliBackend(Settings settings, Executor executor)
    : settings_(std::move(settings)),
      executor_(std::move(executor)) {
    if (!executor_) {
        const QString program = settings_.cliProgram;
        const int timeoutMs = settings_.commandTimeoutMs;
        executor_ = [program, timeoutMs](const QStringList& args, const CancellationToken& cancel) {
            return CommandRunner::run(program, args, timeoutMs, cancel);
        };
    }
}

EngineError CliBackend::classifyFailure(const CommandResult& result, const QString& what) {
    if (!result.started) {
        return EngineError::connection(QString("Failed to execute command: %1").arg(result.stderrText));
    }
    if (result.cancelled) {
        return EngineError::operation("cancelled");
    }
    if (result.timedOut) {
        return EngineError::operation(QString("Failed to %1: command timed out").arg(what));
    }

    const QString detail = result.stderrText.trimmed().isEmpty()
        ? QString("exit code %1").arg(result.exitCode)
        : result.stderrText.trimmed();
    if (detail.contains("No such container", Qt::CaseInsensitive)
        || detail.contains("No such image", Qt::CaseInsensitive)
        || detail.contains("No such object", Qt::CaseInsensitive)) {
        return EngineError::notFound(detail);
    }
    if (detail.contains("permission denied", Qt::CaseInsensitive)) {
        return EngineError::permissionDenied(detail);
    }
    if (detail.contains("Cannot connect to the Docker daemon", Qt::CaseInsensitive)) {
        return EngineError::connection(detail);
    }
    return EngineError::operation(QString("Failed to %1: %2").arg(what, detail));
}

Result<QString> CliBackend::execute(const QStringList& args, const QString& what, const CancellationToken& cancel) {
    const CommandResult result = executor_(args, cancel);
    if (!result.success()) {
        return Result<QString>::fail(classifyFailure(result, what));
    }
    return Result<QString>::ok(result.stdoutText);
}

Result<bool> CliBackend::simple(const QStringList& args, const QString& what) {
    const Result<QString> output = execute(args, what);
    if (!output.success()) {
        return Result<bool>::fail(output.error);
    }
    return Result<bool>::ok(true);
}

Result<QVector<ContainerRecord>> CliBackend::listContainers() {
    const Result<QString> output =
        execute({"ps", "-a", "--no-trunc", "--format", kContainersFormat}, "list containers");
    if (!output.success()) {
        return Result<QVector<ContainerRecord>>::fail(output.error);
    }
    return Result<QVector<ContainerRecord>>::ok(ResourceNormalizer::containersFromCli(output.value));
}

Result<QVector<ImageRecord>> CliBackend::listImages() {
    const Result<QString> output =
        execute({"images", "--no-trunc", "--format", kImagesFormat}, "list images");
    if (!output.success()) {
        return Result<QVector<ImageRecord>>::fail(output.error);
    }
    return Result<QVector<ImageRecord>>::ok(ResourceNormalizer::imagesFromCli(output.value));
}

Result<ContainerDetail> CliBackend::inspectContainer(const QString& id) {
    const Result<QString> output = execute({"inspect", "--type", "container", id}, "inspect container");
    if (!output.success()) {
        return Result<ContainerDetail>::fail(output.error);
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(output.value.toUtf8(), &parseError);
    const QJsonArray entries = doc.array();
    if (parseError.error != QJsonParseError::NoError || entries.isEmpty()) {
        return Result<ContainerDetail>::fail(
            EngineError::operation(QString("Unparsable inspect output for container %1").arg(id)));
    }
    ContainerDetail detail = ResourceNormalizer::detailFromInspect(entries.first().toObject());
    if (detail.summary.id.isEmpty()) {
        detail.summary.id = id;
    }
    return Result<ContainerDetail>::ok(detail);
}

Result<StatsSample> CliBackend::containerStats(const QString& id) {
    const Result<QString> output =
        execute({"stats", "--no-stream", "--format", kStatsFormat, id}, "get container stats");
    if (!output.success()) {
        return Result<StatsSample>::fail(output.error);
    }
    return StatsEngine::fromCli(output.value, id);
}

Result<QString> CliBackend::containerLogs(const QString& id, int tail, const CancellationToken& cancel) {
    const CommandResult result = executor_({"logs", "--tail", QString::number(tail), id}, cancel);
    if (!result.success()) {
        return Result<QString>::fail(classifyFailure(result, "get logs"));
    }
    // The tool replays the container's stderr on its own stderr.
    return Result<QString>::ok(result.stdoutText + result.stderrText);
}

Result<bool> CliBackend::startContainer(const QString& id) {
    return simple({"start", id}, "start container");
}

Result<bool> CliBackend::stopContainer(const QString& id) {
    return simple({"stop", id}, "stop container");
}

Result<bool> CliBackend::removeContainer(const QString& id) {
    return simple({"rm", id}, "remove container");
}

Result<bool> CliBackend::removeImage(const QString& id) {
    return simple({"rmi", id}, "remove image");
}

Result<QString> CliBackend::createContainer(const QString& image, const QString& name) {
    QStringList args = {"create"};
    if (!name.isEmpty()) {
        args << "--name" << name;
    }
    args << image;
    const Result<QString> output = execute(args, "create container");
    if (!output.success()) {
        return output;
    }
    const QStringList lines = output.value.split('\n', Qt::SkipEmptyParts);
    const QString id = lines.isEmpty() ? QString() : lines.last().trimmed();
    if (id.isEmpty()) {
        return Result<QString>::fail(EngineError::operation("Tool did not report a container id"));
    }
    return Result<QString>::ok(id);
}

}  // namespace crcc
