//===----------------------------------------------------------------------===//
//                         IOM Client - Unit Tests
//
// tests/unit/session/test_session.cpp
//
// Unit tests for the session lifecycle
//===----------------------------------------------------------------------===//

#include "session/session.hpp"
#include "support/fake_broker.hpp"
#include <cassert>
#include <iostream>

using namespace iomclient;
using fake::FakeBroker;

static SessionConfig RemoteConfig() {
    SessionConfig config;
    config.host = "sas.example.com";
    config.port = 8591;
    config.class_id = "440196d4-90f0-11d0-9f41-00a024bb830c";
    config.user = "analyst";
    config.password = "secret";
    return config;
}

//===----------------------------------------------------------------------===//
// Open
//===----------------------------------------------------------------------===//

void TestOpenLocal() {
    std::cout << "  Testing local open..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    Session session(broker, SessionConfig{});
    assert(session.GetState() == SessionState::UNOPENED);
    assert(!session.IsOpen());

    const std::string& id = session.Open();
    assert(id == "ws-1");
    assert(session.IsOpen());
    assert(session.GetState() == SessionState::OPEN);

    assert(broker->last_logical_name == "SASApp");
    assert(broker->last_server.machine_dns_name == "127.0.0.1");
    assert(broker->last_server.port == 0);
    assert(broker->last_server.protocol == broker::Protocol::COM);
    assert(!broker->last_user && !broker->last_password);
    assert(broker->kept_workspaces.count("ws-1") == 1);
    assert(broker->engine->last_connection_string == "Provider=sas.iomprovider; Data Source=iom-id://ws-1");

    std::cout << "    PASSED" << std::endl;
}

void TestOpenRemote() {
    std::cout << "  Testing remote open..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    Session session(broker, RemoteConfig());
    session.Open();

    assert(broker->last_server.machine_dns_name == "sas.example.com");
    assert(broker->last_server.port == 8591);
    assert(broker->last_server.protocol == broker::Protocol::IOM);
    assert(broker->last_server.class_identifier == "440196d4-90f0-11d0-9f41-00a024bb830c");
    assert(*broker->last_user == "analyst");
    assert(*broker->last_password == "secret");

    std::cout << "    PASSED" << std::endl;
}

void TestOpenIsIdempotent() {
    std::cout << "  Testing repeated open reuses the workspace..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    Session session(broker, SessionConfig{});
    std::string first = session.Open();
    std::string second = session.Open();
    assert(first == second);
    assert(broker->workspaces_created == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestOpenFailurePropagates() {
    std::cout << "  Testing broker failure on open..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    broker->fail_create = true;
    Session session(broker, SessionConfig{});
    bool threw = false;
    try {
        session.Open();
    } catch (const ConnectionError& e) {
        threw = true;
        assert(std::string(e.what()).find("object exporter") != std::string::npos);
    }
    assert(threw);
    assert(!session.IsOpen());
    assert(broker->workspaces_created == 0);

    std::cout << "    PASSED" << std::endl;
}

void TestConnectionFailureReleasesWorkspace() {
    std::cout << "  Testing connection failure tears down the workspace..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    broker->fail_connection_open = true;
    Session session(broker, SessionConfig{});
    bool threw = false;
    try {
        session.Open();
    } catch (const ConnectionError&) {
        threw = true;
    }
    assert(threw);
    assert(!session.IsOpen());
    assert(broker->kept_workspaces.empty());
    auto& events = broker->engine->events;
    assert(events.back() == "workspace.close");

    std::cout << "    PASSED" << std::endl;
}

void TestInvalidConfigRejected() {
    std::cout << "  Testing invalid configuration..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    SessionConfig config;
    config.host = "sas.example.com";   // no port, no class id
    Session session(broker, config);
    bool threw = false;
    try {
        session.Open();
    } catch (const ConnectionError&) {
        threw = true;
    }
    assert(threw);
    assert(broker->workspaces_created == 0);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Close
//===----------------------------------------------------------------------===//

void TestCloseOrder() {
    std::cout << "  Testing close order..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    Session session(broker, SessionConfig{});
    session.Open();
    broker->engine->events.clear();

    session.Close();
    auto& events = broker->engine->events;
    assert(events.size() == 3);
    assert(events[0] == "connection.close");
    assert(events[1] == "release");
    assert(events[2] == "workspace.close");
    assert(session.GetState() == SessionState::CLOSED);

    // Second close is a no-op
    session.Close();
    assert(events.size() == 3);

    // Closed is terminal
    bool threw = false;
    try {
        session.Open();
    } catch (const SessionStateError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

void TestDestructorCloses() {
    std::cout << "  Testing destructor closes the session..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    {
        Session session(broker, SessionConfig{});
        session.Open();
    }
    assert(broker->kept_workspaces.empty());
    assert(broker->engine->events.back() == "workspace.close");

    std::cout << "    PASSED" << std::endl;
}

void TestCloseFailureStillReleases() {
    std::cout << "  Testing a failed connection close still releases the workspace..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    broker->fail_connection_close = true;
    Session session(broker, SessionConfig{});
    session.Open();
    broker->engine->events.clear();

    bool threw = false;
    try {
        session.Close();
    } catch (const std::runtime_error& e) {
        threw = std::string(e.what()) == "connection drop";
    }
    assert(threw);

    auto& events = broker->engine->events;
    assert(events.size() == 3);
    assert(events[0] == "connection.close");
    assert(events[1] == "release");
    assert(events[2] == "workspace.close");
    assert(broker->kept_workspaces.empty());
    assert(session.GetState() == SessionState::CLOSED);
    assert(!session.IsOpen());

    // Nothing is left to retry
    session.Close();
    assert(events.size() == 3);

    std::cout << "    PASSED" << std::endl;
}

void TestDestructorCloseFailureStillReleases() {
    std::cout << "  Testing destructor releases after a failed connection close..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    broker->fail_connection_close = true;
    {
        Session session(broker, SessionConfig{});
        session.Open();
    }
    assert(broker->kept_workspaces.empty());
    assert(broker->engine->events.back() == "workspace.close");

    std::cout << "    PASSED" << std::endl;
}

void TestOperationsRequireOpen() {
    std::cout << "  Testing operations on an unopened session..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    Session session(broker, SessionConfig{});
    bool threw = false;
    try {
        session.Submit("%put hi;");
    } catch (const SessionStateError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        session.OpenTableCursor("class");
    } catch (const SessionStateError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Delegated services
//===----------------------------------------------------------------------===//

void TestLogAccumulates() {
    std::cout << "  Testing log retrieval in small chunks..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    SessionConfig config;
    config.log_buffer = 3;
    Session session(broker, config);
    session.Open();

    session.Submit("%put first line;");
    std::string first = session.FlushLog();
    assert(first == "first line\n");

    session.Submit("%put second line;");
    std::string second = session.FlushLog();
    assert(second == "second line\n");

    assert(session.GetSessionLog() == "first line\nsecond line\n");
    assert(session.FlushLog().empty());

    std::cout << "    PASSED" << std::endl;
}

void TestErrorStateClearedByReset() {
    std::cout << "  Testing error state transitions..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    Session session(broker, SessionConfig{});
    session.Open();

    session.MarkError();
    assert(session.GetState() == SessionState::ERROR);
    session.ResetParser();
    assert(session.GetState() == SessionState::OPEN);
    assert(broker->engine->resets == 1);

    std::cout << "    PASSED" << std::endl;
}

void TestRemoteFileRoundTrip() {
    std::cout << "  Testing remote file write and read..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    broker->engine->max_chunk = 5;
    Session session(broker, SessionConfig{});
    session.Open();

    std::string bytes("binary\0payload\xff", 15);
    session.WriteRemoteFile("/data/blob.bin", bytes, "PERMISSION='A::u::rw-'");
    assert(broker->engine->files["/data/blob.bin"] == bytes);
    assert(broker->engine->write_options["/data/blob.bin"] == "PERMISSION='A::u::rw-'");

    assert(session.ReadRemoteFile("/data/blob.bin") == bytes);
    assert(broker->engine->assigned_filerefs.empty());

    // Missing file surfaces the broker error and still deassigns the fileref
    bool threw = false;
    try {
        session.ReadRemoteFile("/data/missing.bin");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    assert(broker->engine->assigned_filerefs.empty());

    std::cout << "    PASSED" << std::endl;
}

void TestCursorOptions() {
    std::cout << "  Testing table cursor options..." << std::endl;

    auto broker = std::make_shared<FakeBroker>();
    SessionConfig config;
    config.max_open_rows = 250;
    config.page_size = 20;
    config.cache_size = 3;
    Session session(broker, config);
    session.Open();

    fake::FakeTable table;
    table.columns.push_back({"x", false, 8, "", 0, 0});
    table.rows.push_back({1.0});
    broker->engine->PutTable("work.t", table);

    auto cursor = session.OpenTableCursor("t");
    const auto& options = broker->engine->last_cursor_options;
    assert(options.cursor_type == broker::CursorType::FORWARD_ONLY);
    assert(options.lock_type == broker::LockType::READ_ONLY);
    assert(options.command_type == broker::CommandType::TABLE_DIRECT);
    assert(options.max_open_rows == 250);
    assert(options.page_size == 20);
    assert(options.cache_size == 3);
    assert(!cursor->IsEof());
    cursor->Close();

    std::cout << "    PASSED" << std::endl;
}

//===----------------------------------------------------------------------===//
// Main
//===----------------------------------------------------------------------===//

int main() {
    std::cout << "=== Session Unit Tests ===" << std::endl;

    std::cout << "\n1. Open:" << std::endl;
    TestOpenLocal();
    TestOpenRemote();
    TestOpenIsIdempotent();
    TestOpenFailurePropagates();
    TestConnectionFailureReleasesWorkspace();
    TestInvalidConfigRejected();

    std::cout << "\n2. Close:" << std::endl;
    TestCloseOrder();
    TestDestructorCloses();
    TestCloseFailureStillReleases();
    TestDestructorCloseFailureStillReleases();
    TestOperationsRequireOpen();

    std::cout << "\n3. Delegated Services:" << std::endl;
    TestLogAccumulates();
    TestErrorStateClearedByReset();
    TestRemoteFileRoundTrip();
    TestCursorOptions();

    std::cout << "\n=== All tests PASSED ===" << std::endl;
    return 0;
}
