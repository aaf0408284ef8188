#include "doctest/doctest.h"

#include "crcc/engine_client.hpp"
#include "crcc/engine_error.hpp"

using namespace crcc;

DOCTEST_TEST_CASE("error kinds render with their prefixes") {
    DOCTEST_CHECK_EQ(EngineError::connection("x").toString(), QString("Connection error: x"));
    DOCTEST_CHECK_EQ(EngineError::operation("x").toString(), QString("Operation error: x"));
    DOCTEST_CHECK_EQ(EngineError::notFound("x").toString(), QString("Not found: x"));
    DOCTEST_CHECK_EQ(EngineError::permissionDenied("x").toString(), QString("Permission denied: x"));
    DOCTEST_CHECK_EQ(EngineError::unknown("x").toString(), QString("Unknown error: x"));
    DOCTEST_CHECK_FALSE(EngineError{}.isError());
}

DOCTEST_TEST_CASE("toJson carries the failure contract") {
    const QJsonObject json = EngineError::notFound("No such container: web").toJson();
    DOCTEST_CHECK_FALSE(json.value("success").toBool(true));
    DOCTEST_CHECK_EQ(json.value("error_kind").toString(), QString("NotFound"));
    DOCTEST_CHECK_EQ(json.value("error").toString(), QString("Not found: No such container: web"));
}

DOCTEST_TEST_CASE("http statuses map onto kinds") {
    DOCTEST_CHECK(EngineError::fromHttpStatus(404, "gone").kind == ErrorKind::NotFound);
    DOCTEST_CHECK(EngineError::fromHttpStatus(403, "no").kind == ErrorKind::PermissionDenied);

    const EngineError conflict = EngineError::fromHttpStatus(409, "name in use");
    DOCTEST_CHECK(conflict.kind == ErrorKind::Operation);
    DOCTEST_CHECK_EQ(conflict.message, QString("Server error (409): name in use"));
}

DOCTEST_TEST_CASE("transport errors mentioning the connection are connection errors") {
    DOCTEST_CHECK(EngineError::fromTransportError("Connection refused").kind == ErrorKind::Connection);
    DOCTEST_CHECK(EngineError::fromTransportError("socket exploded").kind == ErrorKind::Unknown);
}

DOCTEST_TEST_CASE("errorFromReply prefers the engine message field") {
    const EngineError json = errorFromReply(EngineReply{404, R"({"message":"No such image: ghost"})", {}});
    DOCTEST_CHECK(json.kind == ErrorKind::NotFound);
    DOCTEST_CHECK_EQ(json.message, QString("No such image: ghost"));

    const EngineError text = errorFromReply(EngineReply{500, "daemon panic\n", {}});
    DOCTEST_CHECK_EQ(text.message, QString("Server error (500): daemon panic"));

    const EngineError empty = errorFromReply(EngineReply{502, {}, {}});
    DOCTEST_CHECK_EQ(empty.message, QString("Server error (502): HTTP 502"));
}
