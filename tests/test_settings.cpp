#include "doctest/doctest.h"

#include <QDir>
#include <QFile>
#include <QJsonObject>
#include <QTemporaryDir>

#include "crcc/settings.hpp"

using namespace crcc;

DOCTEST_TEST_CASE("defaults match the documented values") {
    const Settings settings = Settings::defaults();
    DOCTEST_CHECK(settings.mode == BackendMode::Api);
    DOCTEST_CHECK_EQ(settings.socketPath, QString("/var/run/docker.sock"));
    DOCTEST_CHECK_EQ(settings.commandTimeoutMs, 15000);
    DOCTEST_CHECK_EQ(settings.requestTimeoutMs, 0);
    DOCTEST_CHECK_EQ(settings.logsTail, 100);
}

DOCTEST_TEST_CASE("fromJson accepts mode aliases and clamps the poll interval") {
    const Settings text = Settings::fromJson({{"mode", "Text"}, {"poll_interval_ms", 10}});
    DOCTEST_CHECK(text.mode == BackendMode::Cli);
    DOCTEST_CHECK_EQ(text.pollIntervalMs, 250);

    const Settings structured = Settings::fromJson({{"mode", "structured"}, {"logs_tail", 20}});
    DOCTEST_CHECK(structured.mode == BackendMode::Api);
    DOCTEST_CHECK_EQ(structured.logsTail, 20);
    DOCTEST_CHECK_EQ(structured.toJson().value("mode").toString(), QString("api"));
}

DOCTEST_TEST_CASE("loadFromFile reports unreadable and malformed files") {
    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());

    Settings settings;
    DOCTEST_CHECK_FALSE(settings.loadFromFile(dir.filePath("missing.json")).value("success").toBool());

    QFile broken(dir.filePath("broken.json"));
    DOCTEST_REQUIRE(broken.open(QIODevice::WriteOnly));
    broken.write("[1, 2]");
    broken.close();
    DOCTEST_CHECK_FALSE(settings.loadFromFile(broken.fileName()).value("success").toBool());

    QFile good(dir.filePath("dockscope.json"));
    DOCTEST_REQUIRE(good.open(QIODevice::WriteOnly));
    good.write(R"({"mode": "cli", "cli_program": "podman"})");
    good.close();
    DOCTEST_CHECK(settings.loadFromFile(good.fileName()).value("success").toBool());
    DOCTEST_CHECK(settings.mode == BackendMode::Cli);
    DOCTEST_CHECK_EQ(settings.cliProgram, QString("podman"));
}

DOCTEST_TEST_CASE("DOCKER_HOST overrides the socket path") {
    const QByteArray previous = qgetenv("DOCKER_HOST");
    qputenv("DOCKER_HOST", "unix:///run/user/1000/docker.sock");
    Settings settings;
    settings.applyEnvironment();
    DOCTEST_CHECK_EQ(settings.socketPath, QString("/run/user/1000/docker.sock"));

    qputenv("DOCKER_HOST", "tcp://10.0.0.2:2375");
    Settings remote;
    remote.applyEnvironment();
    DOCTEST_CHECK_EQ(remote.socketPath, QString("/var/run/docker.sock"));
    DOCTEST_CHECK_EQ(remote.dockerHost, QString("tcp://10.0.0.2:2375"));

    if (previous.isEmpty()) {
        qunsetenv("DOCKER_HOST");
    } else {
        qputenv("DOCKER_HOST", previous);
    }
}
