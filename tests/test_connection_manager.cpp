#include "doctest/doctest.h"

#include <QThread>

#include <memory>
#include <vector>

#include "crcc/connection_manager.hpp"
#include "fake_engine.hpp"

using namespace crcc;

DOCTEST_TEST_CASE("status before initialization connects") {
    auto client = QSharedPointer<FakeEngineClient>::create();
    auto connector = QSharedPointer<FakeConnector>::create(client);
    ConnectionManager manager(connector);

    DOCTEST_CHECK(manager.currentStatus().state == ConnectionState::Uninitialized);
    DOCTEST_CHECK_EQ(manager.currentStatus().toJson().value("state").toString(), QString("Disconnected"));

    const ConnectionStatus status = manager.status();
    DOCTEST_CHECK(status.state == ConnectionState::Connected);
    DOCTEST_CHECK_EQ(status.toJson().value("state").toString(), QString("Connected"));
    DOCTEST_CHECK_EQ(connector->attempts(), 1);
    // The fresh handle is not pinged.
    DOCTEST_CHECK(client->requests().isEmpty());
    DOCTEST_CHECK(manager.ensureConnected().success());
    DOCTEST_CHECK_EQ(connector->attempts(), 1);
}

DOCTEST_TEST_CASE("status reports a failed first connection as an error") {
    auto client = QSharedPointer<FakeEngineClient>::create();
    auto connector = QSharedPointer<FakeConnector>::create(client);
    connector->setFailure(EngineError::connection("Failed to connect to Docker: permission denied"));
    ConnectionManager manager(connector);

    const ConnectionStatus status = manager.status();
    DOCTEST_CHECK(status.state == ConnectionState::Error);
    DOCTEST_CHECK_EQ(status.reason, QString("Failed to connect to Docker: permission denied"));
    DOCTEST_CHECK_EQ(connector->attempts(), 1);
}

DOCTEST_TEST_CASE("status retries the connection after an earlier failure") {
    auto client = QSharedPointer<FakeEngineClient>::create();
    auto connector = QSharedPointer<FakeConnector>::create(client);
    connector->setFailure(EngineError::connection("Failed to connect to Docker: daemon not running"));
    ConnectionManager manager(connector);

    DOCTEST_REQUIRE_FALSE(manager.ensureConnected().success());
    DOCTEST_CHECK(manager.status().state == ConnectionState::Error);

    connector->setFailure(EngineError{});
    DOCTEST_CHECK(manager.status().state == ConnectionState::Connected);
    DOCTEST_CHECK_EQ(connector->attempts(), 3);
    DOCTEST_CHECK(manager.ensureConnected().success());
}

DOCTEST_TEST_CASE("concurrent first use connects exactly once") {
    auto client = QSharedPointer<FakeEngineClient>::create();
    auto connector = QSharedPointer<FakeConnector>::create(client, 50);
    ConnectionManager manager(connector);

    constexpr int kCallers = 8;
    std::vector<int> succeeded(kCallers, 0);
    std::vector<std::unique_ptr<QThread>> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back(QThread::create([&manager, &succeeded, i]() {
            succeeded[i] = manager.ensureConnected().success() ? 1 : 0;
        }));
        threads.back()->start();
    }
    for (auto& thread : threads) {
        thread->wait();
    }

    DOCTEST_CHECK_EQ(connector->attempts(), 1);
    for (int ok : succeeded) {
        DOCTEST_CHECK_EQ(ok, 1);
    }
    DOCTEST_CHECK(manager.currentStatus().state == ConnectionState::Connected);
}

DOCTEST_TEST_CASE("concurrent callers share one failed connection attempt") {
    auto client = QSharedPointer<FakeEngineClient>::create();
    auto connector = QSharedPointer<FakeConnector>::create(client, 200);
    connector->setFailure(EngineError::connection("Failed to connect to Docker: socket /nope not found"));
    ConnectionManager manager(connector);

    constexpr int kCallers = 8;
    std::vector<EngineError> errors(kCallers);
    std::vector<int> succeeded(kCallers, 1);
    std::vector<std::unique_ptr<QThread>> threads;
    for (int i = 0; i < kCallers; ++i) {
        threads.emplace_back(QThread::create([&manager, &errors, &succeeded, i]() {
            const Result<EngineHandle> result = manager.ensureConnected();
            succeeded[i] = result.success() ? 1 : 0;
            errors[i] = result.error;
        }));
        threads.back()->start();
    }
    for (auto& thread : threads) {
        thread->wait();
    }

    DOCTEST_CHECK_EQ(connector->attempts(), 1);
    for (int i = 0; i < kCallers; ++i) {
        DOCTEST_CHECK_EQ(succeeded[i], 0);
        DOCTEST_CHECK(errors[i].kind == ErrorKind::Connection);
        DOCTEST_CHECK_EQ(errors[i].message, QString("Failed to connect to Docker: socket /nope not found"));
    }
    DOCTEST_CHECK(manager.currentStatus().state == ConnectionState::Error);
}

DOCTEST_TEST_CASE("later callers reuse the established handle") {
    auto client = QSharedPointer<FakeEngineClient>::create();
    auto connector = QSharedPointer<FakeConnector>::create(client);
    ConnectionManager manager(connector);

    const Result<EngineHandle> first = manager.ensureConnected();
    const Result<EngineHandle> second = manager.ensureConnected();
    DOCTEST_REQUIRE(first.success());
    DOCTEST_REQUIRE(second.success());
    DOCTEST_CHECK(first.value == second.value);
    DOCTEST_CHECK_EQ(connector->attempts(), 1);
}

DOCTEST_TEST_CASE("failed connection is reported with its reason") {
    auto client = QSharedPointer<FakeEngineClient>::create();
    auto connector = QSharedPointer<FakeConnector>::create(client);
    connector->setFailure(EngineError::connection("Failed to connect to Docker: socket /nope not found"));
    ConnectionManager manager(connector);

    const Result<EngineHandle> handle = manager.ensureConnected();
    DOCTEST_REQUIRE_FALSE(handle.success());
    DOCTEST_CHECK(handle.error.kind == ErrorKind::Connection);
    DOCTEST_CHECK(manager.currentStatus().state == ConnectionState::Error);

    const ConnectionStatus status = manager.status();
    DOCTEST_CHECK(status.state == ConnectionState::Error);
    DOCTEST_CHECK(status.reason.contains("socket /nope not found"));
    DOCTEST_CHECK_EQ(status.toJson().value("reason").toString(), status.reason);
}

DOCTEST_TEST_CASE("status pings the engine and records a failed ping") {
    auto client = QSharedPointer<FakeEngineClient>::create();
    client->setReply("GET", "/_ping", 200, "OK");
    auto connector = QSharedPointer<FakeConnector>::create(client);
    ConnectionManager manager(connector);

    DOCTEST_REQUIRE(manager.ensureConnected().success());
    DOCTEST_CHECK(manager.status().state == ConnectionState::Connected);

    client->setReply("GET", "/_ping", 500, "down");
    const ConnectionStatus failed = manager.status();
    DOCTEST_CHECK(failed.state == ConnectionState::Error);
    DOCTEST_CHECK(failed.reason.startsWith("Docker is not responding: "));

    // Error persists even once the engine answers again.
    client->setReply("GET", "/_ping", 200, "OK");
    DOCTEST_CHECK(manager.status().state == ConnectionState::Error);
}

DOCTEST_TEST_CASE("reset replaces the handle and clears the error") {
    auto client = QSharedPointer<FakeEngineClient>::create();
    client->setReply("GET", "/_ping", 500, "down");
    auto connector = QSharedPointer<FakeConnector>::create(client);
    ConnectionManager manager(connector);

    DOCTEST_REQUIRE(manager.ensureConnected().success());
    DOCTEST_CHECK(manager.status().state == ConnectionState::Error);

    client->setReply("GET", "/_ping", 200, "OK");
    DOCTEST_REQUIRE(manager.reset().success());
    DOCTEST_CHECK_EQ(connector->attempts(), 2);
    DOCTEST_CHECK(manager.status().state == ConnectionState::Connected);
}
