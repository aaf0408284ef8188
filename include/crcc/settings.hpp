#pragma once

#include <QJsonObject>
#include <QString>

namespace crcc {

enum class BackendMode {
    Api,
    Cli,
};

struct Settings {
    BackendMode mode = BackendMode::Api;
    QString socketPath = "/var/run/docker.sock";
    QString dockerHost;
    QString apiVersion;
    QString cliProgram = "docker";
    int commandTimeoutMs = 15000;
    int requestTimeoutMs = 0;
    int logsTail = 100;
    int pollIntervalMs = 2000;

    static Settings defaults();
    static Settings fromJson(const QJsonObject& object);
    [[nodiscard]] QJsonObject toJson() const;

    // Reads a JSON object from filePath on top of the current values.
    QJsonObject loadFromFile(const QString& filePath);
    // DOCKER_HOST overrides socket_path when it names a unix socket.
    void applyEnvironment();

    [[nodiscard]] static QString modeName(BackendMode mode);
};

}  // namespace crcc
