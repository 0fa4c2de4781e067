#include <doctest/doctest.h>

#include <vector>

#include "pushwire/session.hpp"
#include "fakes.hpp"

using namespace pushwire;

namespace {

SessionConfig test_config() {
    SessionConfig cfg;
    cfg.push_url = "wss://relay.test/push";
    cfg.backoff_min_ms = 1000;
    cfg.backoff_max_ms = 300000;
    cfg.backoff_jitter = 0.0;
    cfg.backoff_seed = 1;
    cfg.recv_wait_ms = 0;
    return cfg;
}

template <typename Exec>
struct Rig {
    fakes::FakeRelayApi api;
    fakes::MemoryCredentialStore creds;
    Ledger ledger;
    MessageFetcher fetcher{api, creds, ledger};
    fakes::FakeConnection conn;
    Exec exec;
    Session session{conn, creds, fetcher, exec, test_config()};

    std::vector<Event> events;
    std::vector<int64_t> delivered;

    Rig() {
        creds.token = Token{"dev1", "sec"};
        session.set_event_callback([this](const Event& e) { events.push_back(e); });
        session.set_message_handler([this](const std::vector<MessagePtr>& batch) {
            for (const auto& m : batch) delivered.push_back(m->id);
        });
    }

    /// Connect and get past authentication with a keep-alive.
    void authenticate(uint64_t now) {
        conn.push_frames("#");
        session.tick(now);
    }
};

using InlineRig = Rig<fakes::InlineExecutor>;
using ManualRig = Rig<fakes::ManualExecutor>;

} // namespace

TEST_CASE("First tick connects and identifies with the stored token") {
    InlineRig rig;
    rig.session.tick(0);
    CHECK(rig.conn.opens == 1);
    REQUIRE(rig.conn.sent.size() == 1);
    CHECK(rig.conn.sent[0] == "login:dev1:sec\n");
    CHECK(rig.session.state() == SessionState::Connecting);
}

TEST_CASE("Keep-alive while connecting authenticates and runs the initial sync") {
    InlineRig rig;
    rig.api.queue = {fakes::make_msg(1), fakes::make_msg(2)};
    rig.authenticate(0);
    CHECK(rig.api.fetch_calls == 1);
    CHECK(rig.delivered == std::vector<int64_t>{1, 2});
    CHECK(rig.session.state() == SessionState::Idle);
}

TEST_CASE("Silence through the grace period counts as authenticated") {
    InlineRig rig;
    rig.session.tick(0);
    rig.session.tick(2999);
    CHECK(rig.session.state() == SessionState::Connecting);
    rig.session.tick(3000);
    CHECK(rig.api.fetch_calls == 1);
    CHECK(rig.session.state() == SessionState::Idle);
}

TEST_CASE("Session superseded while connecting: one event, no reconnect") {
    InlineRig rig;
    rig.conn.push_frames("A");
    rig.session.tick(0);

    CHECK(rig.session.state() == SessionState::Disconnected);
    CHECK(rig.session.halted());
    REQUIRE(rig.events.size() == 1);
    CHECK(rig.events[0].kind == EventKind::SessionSuperseded);

    for (uint64_t t = 1000; t <= 600000; t += 1000) rig.session.tick(t);
    CHECK(rig.conn.opens == 1);
    CHECK(rig.events.size() == 1);
    CHECK(rig.creds.token.has_value());   // superseded, not revoked
}

TEST_CASE("Credential reload after authentication revokes the token") {
    InlineRig rig;
    rig.authenticate(0);
    rig.conn.push_frames("E");
    rig.session.tick(1000);

    CHECK(rig.session.state() == SessionState::Disconnected);
    CHECK_FALSE(rig.creds.token.has_value());
    REQUIRE(rig.events.size() == 1);
    CHECK(rig.events[0].kind == EventKind::CredentialsRevoked);

    rig.session.tick(400000);
    CHECK(rig.conn.opens == 1);
}

TEST_CASE("Credential reload in answer to the identification is an auth rejection") {
    InlineRig rig;
    rig.conn.push_frames("E");
    rig.session.tick(0);
    REQUIRE(rig.events.size() == 1);
    CHECK(rig.events[0].kind == EventKind::AuthRejected);
    CHECK_FALSE(rig.creds.token.has_value());
}

TEST_CASE("Handshake refused with AuthError halts without retrying") {
    InlineRig rig;
    rig.conn.open_results = {ErrorCode::AuthError};
    rig.session.tick(0);
    CHECK(rig.session.halted());
    REQUIRE(rig.events.size() == 1);
    CHECK(rig.events[0].kind == EventKind::AuthRejected);
    CHECK(rig.creds.clears == 1);

    rig.session.tick(500000);
    CHECK(rig.conn.opens == 1);
}

TEST_CASE("No stored token means no connection attempt") {
    InlineRig rig;
    rig.creds.token.reset();
    rig.session.tick(0);
    CHECK(rig.conn.opens == 0);
    REQUIRE(rig.events.size() == 1);
    CHECK(rig.events[0].kind == EventKind::AuthRejected);
}

TEST_CASE("Missed keep-alives drop the link and schedule a reconnect") {
    InlineRig rig;
    rig.authenticate(0);
    rig.session.tick(59999);
    CHECK(rig.session.state() == SessionState::Idle);

    rig.session.tick(60000);
    CHECK(rig.session.state() == SessionState::Disconnected);
    CHECK(rig.conn.closes == 1);
    CHECK(rig.session.retry_count() == 1);

    rig.session.tick(60999);
    CHECK(rig.conn.opens == 1);
    rig.session.tick(61000);
    CHECK(rig.conn.opens == 2);
    CHECK(rig.session.state() == SessionState::Connecting);
}

TEST_CASE("Network failures back off exponentially and reset once authenticated") {
    InlineRig rig;
    rig.conn.open_results = {ErrorCode::NetworkError, ErrorCode::NetworkError};

    rig.session.tick(0);                   // fail, next at 1000
    CHECK(rig.session.retry_count() == 1);
    rig.session.tick(999);
    CHECK(rig.conn.opens == 1);
    rig.session.tick(1000);                // fail, next at 3000
    CHECK(rig.session.retry_count() == 2);
    rig.session.tick(2999);
    CHECK(rig.conn.opens == 2);
    rig.session.tick(3000);                // ok
    CHECK(rig.session.state() == SessionState::Connecting);
    CHECK(rig.session.retry_count() == 2);

    rig.session.tick(6000);                // grace period over
    CHECK(rig.session.retry_count() == 0);

    rig.conn.push_close();
    rig.session.tick(7000);                // back to the minimum delay
    CHECK(rig.session.state() == SessionState::Disconnected);
    rig.session.tick(7999);
    CHECK(rig.conn.opens == 3);
    rig.session.tick(8000);
    CHECK(rig.conn.opens == 4);
}

TEST_CASE("Reload reconnects on the next tick without touching the backoff") {
    InlineRig rig;
    rig.authenticate(0);
    rig.conn.push_frames("R");
    rig.session.tick(1000);
    CHECK(rig.session.state() == SessionState::Disconnected);
    CHECK_FALSE(rig.session.halted());

    rig.session.tick(1001);
    CHECK(rig.conn.opens == 2);
    CHECK(rig.session.retry_count() == 0);
    CHECK(rig.events.empty());
}

TEST_CASE("Signals during a fetch collapse into one follow-up fetch") {
    ManualRig rig;
    rig.api.queue = {fakes::make_msg(1)};
    rig.authenticate(0);
    CHECK(rig.exec.jobs.size() == 1);
    CHECK(rig.session.state() == SessionState::Authenticated);

    rig.conn.push_frames("!");
    rig.session.tick(100);
    rig.conn.push_frames("!!");
    rig.session.tick(200);
    CHECK(rig.session.state() == SessionState::Signaled);
    CHECK(rig.exec.jobs.size() == 1);

    rig.exec.run_all();
    CHECK(rig.api.fetch_calls == 1);
    rig.session.tick(300);                 // collects, then issues the follow-up
    CHECK(rig.exec.jobs.size() == 1);

    rig.exec.run_all();
    rig.session.tick(400);
    CHECK(rig.api.fetch_calls == 2);
    CHECK(rig.exec.jobs.empty());
    CHECK(rig.session.state() == SessionState::Idle);
    CHECK(rig.delivered == std::vector<int64_t>{1});
}

TEST_CASE("A failed fetch is retried with its own backoff") {
    InlineRig rig;
    rig.api.fetch_fail = ErrorCode::NetworkError;
    rig.authenticate(0);
    CHECK(rig.api.fetch_calls == 1);

    rig.session.tick(999);
    CHECK(rig.api.fetch_calls == 1);
    rig.session.tick(1000);
    CHECK(rig.api.fetch_calls == 2);

    rig.api.fetch_fail = ErrorCode::Ok;
    rig.api.queue = {fakes::make_msg(5)};
    rig.session.tick(3000);
    CHECK(rig.api.fetch_calls == 3);
    CHECK(rig.delivered == std::vector<int64_t>{5});
    CHECK(rig.session.state() == SessionState::Idle);
    CHECK(rig.conn.opens == 1);            // the link was never dropped
}

TEST_CASE("Logout drops the link and clears the token; resume reconnects") {
    InlineRig rig;
    rig.authenticate(0);
    rig.session.request_logout();
    rig.session.tick(1000);

    CHECK(rig.session.state() == SessionState::Disconnected);
    CHECK(rig.session.halted());
    CHECK_FALSE(rig.creds.token.has_value());
    CHECK(rig.conn.closes == 1);
    CHECK(rig.events.empty());

    rig.creds.token = Token{"dev2", "sec2"};
    rig.session.resume();
    rig.session.tick(2000);
    CHECK(rig.conn.opens == 2);
    CHECK(rig.conn.sent.back() == "login:dev2:sec2\n");
}
