#include "doctest/doctest.h"

#include <QFile>
#include <QJsonDocument>
#include <QTemporaryDir>

#include "crcc/engine_error.hpp"
#include "crcc/telemetry.hpp"

using namespace crcc;

DOCTEST_TEST_CASE("counters accumulate until cleared") {
    Telemetry& telemetry = Telemetry::instance();
    telemetry.clear();
    telemetry.incrementCounter("unit.counter");
    telemetry.incrementCounter("unit.counter", 4);
    DOCTEST_CHECK_EQ(telemetry.counter("unit.counter"), 5);

    telemetry.clear();
    DOCTEST_CHECK_EQ(telemetry.counter("unit.counter"), 0);
}

DOCTEST_TEST_CASE("event log keeps the newest entries and counts the dropped ones") {
    Telemetry& telemetry = Telemetry::instance();
    telemetry.clear();
    for (int i = 0; i < Telemetry::kMaxEvents + 5; ++i) {
        telemetry.recordEvent("unit_tick", QJsonObject{{"n", i}});
    }

    const QJsonArray ticks = telemetry.eventsOfType("unit_tick");
    DOCTEST_REQUIRE_EQ(ticks.size(), Telemetry::kMaxEvents);
    DOCTEST_CHECK_EQ(ticks.first().toObject().value("n").toInt(), 5);
    DOCTEST_CHECK_EQ(ticks.last().toObject().value("n").toInt(), Telemetry::kMaxEvents + 4);

    const QJsonObject snapshot = telemetry.snapshot();
    DOCTEST_CHECK_EQ(snapshot.value("events_dropped").toInteger(), 5);
    DOCTEST_CHECK_FALSE(snapshot.contains("requests_per_minute"));
    telemetry.clear();
}

DOCTEST_TEST_CASE("recordError stores the error kind and message") {
    Telemetry& telemetry = Telemetry::instance();
    telemetry.clear();
    telemetry.recordError("unit_failure", EngineError::notFound("No such container: web"), {{"id", "web"}});

    const QJsonArray rows = telemetry.eventsOfType("unit_failure");
    DOCTEST_REQUIRE_EQ(rows.size(), 1);
    const QJsonObject row = rows.first().toObject();
    DOCTEST_CHECK_EQ(row.value("error_kind").toString(), QString("NotFound"));
    DOCTEST_CHECK_EQ(row.value("error").toString(), QString("No such container: web"));
    DOCTEST_CHECK_EQ(row.value("id").toString(), QString("web"));
    telemetry.clear();
}

DOCTEST_TEST_CASE("exportToFile writes the snapshot as json") {
    Telemetry& telemetry = Telemetry::instance();
    telemetry.clear();
    telemetry.incrementCounter("unit.exported", 2);
    telemetry.recordDurationMs("unit.op", 30);
    telemetry.recordDurationMs("unit.op", 10);

    QTemporaryDir dir;
    DOCTEST_REQUIRE(dir.isValid());
    const QString path = dir.filePath("nested/telemetry.json");
    const QJsonObject result = telemetry.exportToFile(path);
    DOCTEST_CHECK(result.value("success").toBool());

    QFile file(path);
    DOCTEST_REQUIRE(file.open(QIODevice::ReadOnly));
    const QJsonObject written = QJsonDocument::fromJson(file.readAll()).object();
    DOCTEST_CHECK_EQ(written.value("counters").toObject().value("unit.exported").toInteger(), 2);
    const QJsonObject op = written.value("durations").toObject().value("unit.op").toObject();
    DOCTEST_CHECK_EQ(op.value("count").toInteger(), 2);
    DOCTEST_CHECK_EQ(op.value("max_ms").toInteger(), 30);
    DOCTEST_CHECK_EQ(op.value("avg_ms").toDouble(), doctest::Approx(20.0));
    telemetry.clear();
}
