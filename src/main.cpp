#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QThread>
#include <QTimer>

#include <cstdio>

#include "crcc/command_facade.hpp"
#include "crcc/connection_manager.hpp"
#include "crcc/event_relay.hpp"
#include "crcc/runtime_backend.hpp"
#include "crcc/runtime_worker.hpp"
#include "crcc/settings.hpp"
#include "crcc/signal_sink.hpp"
#include "crcc/socket_engine_client.hpp"
#include "crcc/telemetry.hpp"

namespace {

void printLine(const QJsonObject& object) {
    const QByteArray line = QJsonDocument(object).toJson(QJsonDocument::Compact);
    std::fwrite(line.constData(), 1, static_cast<size_t>(line.size()), stdout);
    std::fputc('\n', stdout);
    std::fflush(stdout);
}

QJsonObject notificationLine(const QString& channel, const QByteArray& payload, bool isError) {
    QJsonObject line{{"channel", channel}, {"error", isError}};
    const QJsonDocument doc = QJsonDocument::fromJson(payload);
    if (doc.isObject()) {
        line.insert("payload", doc.object());
    } else {
        line.insert("payload", QString::fromUtf8(payload));
    }
    return line;
}

}  // namespace

int main(int argc, char* argv[]) {
    QCoreApplication app(argc, argv);
    app.setApplicationName("DockScope");

    QCommandLineParser parser;
    parser.setApplicationDescription("Headless container engine monitor.");
    parser.addHelpOption();
    const QCommandLineOption configOption(
        "config", "Settings file.", "path", QDir(QDir::currentPath()).filePath("dockscope.json"));
    const QCommandLineOption onceOption("once", "Print one snapshot and exit.");
    const QCommandLineOption statsOption("stats", "Include stats for running containers.");
    const QCommandLineOption noEventsOption("no-events", "Do not subscribe to engine events.");
    const QCommandLineOption actionOption("action", "Run one action and exit.", "name");
    const QCommandLineOption payloadOption("payload", "JSON payload for --action.", "json", "{}");
    const QCommandLineOption pullOption("pull", "Pull an image with progress and exit.", "image");
    parser.addOptions({configOption, onceOption, statsOption, noEventsOption, actionOption, payloadOption, pullOption});
    parser.process(app);

    crcc::Settings settings = crcc::Settings::defaults();
    const QString configPath = parser.value(configOption);
    if (QFile::exists(configPath)) {
        const QJsonObject loaded = settings.loadFromFile(configPath);
        if (!loaded.value("success").toBool()) {
            printLine(loaded);
        }
    }
    settings.applyEnvironment();
    crcc::Telemetry::instance().recordEvent("settings_loaded", settings.toJson());

    crcc::ConnectionManager connections(QSharedPointer<crcc::SocketEngineConnector>::create(settings));
    crcc::EventRelay relay(connections);
    crcc::CommandFacade facade(connections, crcc::makeRuntimeBackend(settings, connections), relay, settings);

    auto* workerThread = new QThread(&app);
    auto* worker = new crcc::RuntimeWorker(facade);
    worker->moveToThread(workerThread);
    QObject::connect(workerThread, &QThread::finished, worker, &QObject::deleteLater);
    workerThread->start();

    QObject::connect(&app, &QCoreApplication::aboutToQuit, [&facade, workerThread]() {
        facade.cancelSubscriptions();
        workerThread->quit();
        workerThread->wait(3000);
        const QString path = QDir(QDir::currentPath()).filePath("logs/telemetry_last_exit.json");
        crcc::Telemetry::instance().exportToFile(path);
    });

    printLine(facade.initializeClient());

    QSharedPointer<crcc::SignalSink> sink(new crcc::SignalSink());
    QObject::connect(
        sink.data(),
        &crcc::SignalSink::notificationReady,
        &app,
        [](const QString& channel, const QByteArray& payload, bool isError) {
            printLine(notificationLine(channel, payload, isError));
            if (channel == crcc::channels::kPullComplete || channel == crcc::channels::kPullError) {
                QCoreApplication::quit();
            }
        },
        Qt::QueuedConnection);

    if (parser.isSet(pullOption)) {
        const QJsonObject started = facade.pullImageWithProgress(parser.value(pullOption), sink);
        if (!started.value("success").toBool()) {
            printLine(started);
            QTimer::singleShot(0, &app, &QCoreApplication::quit);
        }
        return QCoreApplication::exec();
    }

    if (parser.isSet(actionOption)) {
        const QString action = parser.value(actionOption);
        const QJsonObject payload = QJsonDocument::fromJson(parser.value(payloadOption).toUtf8()).object();
        QObject::connect(worker, &crcc::RuntimeWorker::actionFinished, &app, [](const QJsonObject& result) {
            printLine(result);
            QCoreApplication::quit();
        });
        QMetaObject::invokeMethod(worker, [worker, action, payload]() {
            worker->runAction(action, payload);
        }, Qt::QueuedConnection);
        return QCoreApplication::exec();
    }

    const bool once = parser.isSet(onceOption);
    QObject::connect(worker, &crcc::RuntimeWorker::snapshotReady, &app, [once](const QJsonObject& snapshot) {
        printLine(snapshot);
        if (once) {
            QCoreApplication::quit();
        }
    });

    if (!once && !parser.isSet(noEventsOption)) {
        const QJsonObject subscribed = facade.subscribeEvents(sink);
        if (!subscribed.value("success").toBool()) {
            printLine(subscribed);
        }
    }

    const QJsonObject pollRequest{{"include_stats", parser.isSet(statsOption)}};
    auto requestPoll = [worker, pollRequest]() {
        QMetaObject::invokeMethod(worker, [worker, pollRequest]() {
            worker->poll(pollRequest);
        }, Qt::QueuedConnection);
    };
    requestPoll();
    if (!once) {
        auto* timer = new QTimer(&app);
        QObject::connect(timer, &QTimer::timeout, &app, requestPoll);
        timer->start(settings.pollIntervalMs);
    }

    return QCoreApplication::exec();
}
