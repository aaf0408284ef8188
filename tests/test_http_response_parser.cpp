#include "doctest/doctest.h"

#include "crcc/http_response_parser.hpp"

using namespace crcc;

DOCTEST_TEST_CASE("content-length body split across reads") {
    HttpResponseParser parser;
    parser.feed("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Len");
    DOCTEST_CHECK_FALSE(parser.headersComplete());
    parser.feed("gth: 11\r\n\r\n{\"ok\":");
    DOCTEST_CHECK(parser.headersComplete());
    DOCTEST_CHECK_FALSE(parser.isComplete());
    parser.feed("true}");

    DOCTEST_REQUIRE(parser.isComplete());
    DOCTEST_CHECK_EQ(parser.statusCode(), 200);
    DOCTEST_CHECK_EQ(parser.header("CONTENT-TYPE"), QByteArray("application/json"));
    DOCTEST_CHECK_EQ(parser.takeBody(), QByteArray("{\"ok\":true}"));
}

DOCTEST_TEST_CASE("chunked body with extensions and trailers") {
    HttpResponseParser parser;
    parser.feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n");
    parser.feed("5;name=x\r\nhello\r\n");
    DOCTEST_CHECK_EQ(parser.takeBody(), QByteArray("hello"));
    parser.feed("6\r\n world\r\n0\r\nX-Trailer: 1\r\n\r\n");

    DOCTEST_REQUIRE(parser.isComplete());
    DOCTEST_CHECK_EQ(parser.takeBody(), QByteArray(" world"));
}

DOCTEST_TEST_CASE("close-delimited body completes on close") {
    HttpResponseParser parser;
    parser.feed("HTTP/1.0 200 OK\r\n\r\npartial");
    DOCTEST_CHECK_FALSE(parser.isComplete());
    parser.feed(" data");
    parser.finishOnClose();
    DOCTEST_REQUIRE(parser.isComplete());
    DOCTEST_CHECK_EQ(parser.takeBody(), QByteArray("partial data"));
}

DOCTEST_TEST_CASE("truncated content-length body is an error") {
    HttpResponseParser parser;
    parser.feed("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc");
    parser.finishOnClose();
    DOCTEST_CHECK(parser.hasError());
    DOCTEST_CHECK_FALSE(parser.errorString().isEmpty());
}

DOCTEST_TEST_CASE("no-content statuses have no body") {
    HttpResponseParser parser;
    parser.feed("HTTP/1.1 304 Not Modified\r\nContent-Length: 0\r\n\r\n");
    DOCTEST_CHECK(parser.isComplete());
    DOCTEST_CHECK_EQ(parser.statusCode(), 304);

    HttpResponseParser noContent;
    noContent.feed("HTTP/1.1 204 No Content\r\n\r\n");
    DOCTEST_CHECK(noContent.isComplete());
    DOCTEST_CHECK(noContent.takeBody().isEmpty());
}

DOCTEST_TEST_CASE("garbage status line is rejected") {
    HttpResponseParser parser;
    parser.feed("SSH-2.0-OpenSSH\r\n");
    DOCTEST_CHECK(parser.hasError());
}

DOCTEST_TEST_CASE("broken replies are operation errors, not connection errors") {
    HttpResponseParser parser;
    parser.feed("HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n");
    DOCTEST_REQUIRE(parser.hasError());

    // "connection" in the text must not turn this into a connection error.
    const EngineError error = parser.protocolError("stream");
    DOCTEST_CHECK(error.kind == ErrorKind::Operation);
    DOCTEST_CHECK_EQ(error.message, QString("Engine connection returned a malformed stream: Malformed chunk size"));
    DOCTEST_CHECK(parser.protocolError("response").message.contains("malformed response"));
}

DOCTEST_TEST_CASE("demultiplexLogStream joins framed payloads") {
    QByteArray raw;
    raw.append(QByteArray("\x01\x00\x00\x00\x00\x00\x00\x06", 8)).append("hello\n");
    raw.append(QByteArray("\x02\x00\x00\x00\x00\x00\x00\x05", 8)).append("oops\n");
    DOCTEST_CHECK_EQ(demultiplexLogStream(raw), QByteArray("hello\noops\n"));
}

DOCTEST_TEST_CASE("demultiplexLogStream passes unframed text through") {
    const QByteArray plain("plain tty output\n");
    DOCTEST_CHECK_EQ(demultiplexLogStream(plain), plain);

    QByteArray truncated("\x01\x00\x00\x00\x00\x00\x00\x40", 8);
    truncated.append("short");
    DOCTEST_CHECK_EQ(demultiplexLogStream(truncated), truncated);
}
