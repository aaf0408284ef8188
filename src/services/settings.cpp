#include "crcc/settings.hpp"

#include <QFile>
#include <QJsonDocument>
#include <QtGlobal>

namespace crcc {

namespace {

void applyObject(Settings& settings, const QJsonObject& object) {
    const QString mode = object.value("mode").toString().trimmed().toLower();
    if (mode == "cli" || mode == "text") {
        settings.mode = BackendMode::Cli;
    } else if (mode == "api" || mode == "structured") {
        settings.mode = BackendMode::Api;
    }
    settings.socketPath = object.value("socket_path").toString(settings.socketPath);
    settings.apiVersion = object.value("api_version").toString(settings.apiVersion);
    settings.cliProgram = object.value("cli_program").toString(settings.cliProgram);
    settings.commandTimeoutMs =
        qMax(0, object.value("command_timeout_ms").toInt(settings.commandTimeoutMs));
    settings.requestTimeoutMs =
        qMax(0, object.value("request_timeout_ms").toInt(settings.requestTimeoutMs));
    settings.logsTail = qMax(0, object.value("logs_tail").toInt(settings.logsTail));
    settings.pollIntervalMs = qBound(250, object.value("poll_interval_ms").toInt(settings.pollIntervalMs), 60000);
}

}  // namespace

Settings Settings::defaults() {
    return Settings{};
}

Settings Settings::fromJson(const QJsonObject& object) {
    Settings settings;
    applyObject(settings, object);
    return settings;
}

QJsonObject Settings::toJson() const {
    return {
        {"mode", modeName(mode)},
        {"socket_path", socketPath},
        {"docker_host", dockerHost},
        {"api_version", apiVersion},
        {"cli_program", cliProgram},
        {"command_timeout_ms", commandTimeoutMs},
        {"request_timeout_ms", requestTimeoutMs},
        {"logs_tail", logsTail},
        {"poll_interval_ms", pollIntervalMs},
    };
}

QJsonObject Settings::loadFromFile(const QString& filePath) {
    QFile file(filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return {
            {"success", false},
            {"error", "Failed to open settings file."},
            {"path", filePath},
        };
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    file.close();
    if (!doc.isObject()) {
        return {
            {"success", false},
            {"error", parseError.error == QJsonParseError::NoError
                          ? QString("Settings file must contain a JSON object.")
                          : parseError.errorString()},
            {"path", filePath},
        };
    }

    applyObject(*this, doc.object());
    return {
        {"success", true},
        {"path", filePath},
    };
}

void Settings::applyEnvironment() {
    dockerHost = qEnvironmentVariable("DOCKER_HOST").trimmed();
    if (dockerHost.startsWith("unix://")) {
        socketPath = dockerHost.mid(QString("unix://").size());
    }
}

QString Settings::modeName(BackendMode mode) {
    return mode == BackendMode::Cli ? QString("cli") : QString("api");
}

}  // namespace crcc
