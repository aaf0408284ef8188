#include "crcc/command_runner.hpp"

#include <QElapsedTimer>
#include <QProcess>
#include <QProcessEnvironment>

#include "crcc/telemetry.hpp"

namespace crcc {

namespace {

constexpr int kWaitSliceMs = 100;

void stopProcess(QProcess& process) {
    process.kill();
    process.waitForFinished(500);
}

}  // namespace

CommandResult CommandRunner::run(
    const QString& program,
    const QStringList& args,
    int timeoutMs,
    const CancellationToken& cancel,
    const QMap<QString, QString>& extraEnv) {
    QProcess process;
    QElapsedTimer elapsed;
    elapsed.start();
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    for (auto it = extraEnv.constBegin(); it != extraEnv.constEnd(); ++it) {
        env.insert(it.key(), it.value());
    }

    process.setProcessEnvironment(env);
    process.start(program, args);

    CommandResult result;
    if (!process.waitForStarted(5000)) {
        result.started = false;
        result.stderrText = QString("Failed to start %1: %2").arg(program, process.errorString());
        Telemetry::instance().incrementCounter("commands.start_failures");
        Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
        return result;
    }

    while (!process.waitForFinished(kWaitSliceMs)) {
        if (process.state() == QProcess::NotRunning) {
            break;
        }
        if (cancel.isCancelled()) {
            stopProcess(process);
            result.cancelled = true;
            result.stderrText = "Command cancelled.";
            Telemetry::instance().incrementCounter("commands.cancelled");
            Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
            return result;
        }
        if (timeoutMs > 0 && elapsed.elapsed() >= timeoutMs) {
            stopProcess(process);
            result.timedOut = true;
            result.stderrText = "Command timed out.";
            Telemetry::instance().incrementCounter("commands.timeouts");
            Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
            return result;
        }
    }

    result.exitCode = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    result.stdoutText = QString::fromUtf8(process.readAllStandardOutput());
    result.stderrText = QString::fromUtf8(process.readAllStandardError());
    Telemetry::instance().incrementCounter("commands.count");
    if (result.exitCode != 0) {
        Telemetry::instance().incrementCounter("commands.non_zero_exit");
    }
    Telemetry::instance().recordDurationMs("commands.duration_ms", elapsed.elapsed());
    return result;
}

}  // namespace crcc
