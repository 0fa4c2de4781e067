#include <doctest/doctest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <thread>
#include <vector>

#include "pushwire/emergency_loop.hpp"
#include "fakes.hpp"

using namespace pushwire;

namespace {

MessagePtr emergency(int64_t id, const std::string& receipt, uint32_t retry_ms, uint64_t expires_at_ms) {
    auto m = std::make_shared<Message>(*fakes::make_msg(id, Priority::Emergency, receipt));
    m->retry_interval_ms = retry_ms;
    m->expires_at_ms = expires_at_ms;
    return m;
}

struct Rig {
    fakes::RecordingSink sink;
    fakes::FakeRelayApi api;
    fakes::MemoryCredentialStore creds;
    EmergencyLoop loop{sink, api, creds};
    std::vector<Event> events;

    Rig() {
        creds.token = Token{"dev1", "sec"};
        loop.set_event_callback([this](const Event& e) { events.push_back(e); });
    }
};

} // namespace

TEST_CASE("Unacknowledged emergency re-alerts every interval until it expires") {
    Rig rig;
    REQUIRE(rig.loop.track(emergency(1, "r1", 60000, 300000), 0));
    CHECK(rig.sink.count() == 1);

    for (uint64_t t = 1000; t <= 400000; t += 1000) rig.loop.tick(t);

    // t = 0, 60, 120, 180, 240 s
    CHECK(rig.sink.count() == 5);
    CHECK_FALSE(rig.loop.is_tracked("r1"));
    REQUIRE(rig.events.size() == 1);
    CHECK(rig.events[0].kind == EventKind::EmergencyExpired);
    CHECK(rig.events[0].detail == "r1");
}

TEST_CASE("Acknowledgment stops re-alerts") {
    Rig rig;
    REQUIRE(rig.loop.track(emergency(1, "r1", 60000, 300000), 0));
    rig.loop.tick(60000);
    CHECK(rig.sink.count() == 2);

    Error err;
    REQUIRE(rig.loop.acknowledge("r1", err));
    CHECK(rig.api.acks == std::vector<std::string>{"r1"});
    CHECK(rig.loop.pending() == 0);

    for (uint64_t t = 61000; t <= 400000; t += 1000) rig.loop.tick(t);
    CHECK(rig.sink.count() == 2);
    CHECK(rig.events.empty());
}

TEST_CASE("Failed acknowledgment keeps the alert going") {
    Rig rig;
    REQUIRE(rig.loop.track(emergency(1, "r1", 60000, 300000), 0));
    rig.api.ack_fail = ErrorCode::NetworkError;

    Error err;
    CHECK_FALSE(rig.loop.acknowledge("r1", err));
    CHECK(err.code == ErrorCode::AckError);
    CHECK(rig.loop.is_tracked("r1"));

    rig.loop.tick(60000);
    CHECK(rig.sink.count() == 2);
}

TEST_CASE("A late tick fires once and catches the schedule up") {
    Rig rig;
    REQUIRE(rig.loop.track(emergency(1, "r1", 60000, 1000000), 0));
    rig.loop.tick(250000);
    CHECK(rig.sink.count() == 2);
    const auto snap = rig.loop.snapshot();
    REQUIRE(snap.size() == 1);
    CHECK(snap[0].next_retry_at_ms == 300000u);
}

TEST_CASE("Tracking is per receipt and ignores non-emergencies") {
    Rig rig;
    CHECK_FALSE(rig.loop.track(fakes::make_msg(1, Priority::High, "r"), 0));
    CHECK(rig.loop.track(emergency(2, "r2", 60000, 300000), 0));
    CHECK_FALSE(rig.loop.track(emergency(2, "r2", 60000, 300000), 0));
    CHECK(rig.loop.pending() == 1);
    CHECK(rig.sink.count() == 1);
}

TEST_CASE("Retry interval has a floor and expiry defaults from received time") {
    Rig rig;
    auto m = std::make_shared<Message>(*fakes::make_msg(3, Priority::Emergency, "r3"));
    m->retry_interval_ms = 10;
    m->received_at_ms = 5000;
    REQUIRE(rig.loop.track(m, 5000));
    const auto snap = rig.loop.snapshot();
    REQUIRE(snap.size() == 1);
    CHECK(snap[0].retry_interval_ms == 1000u);
    CHECK(snap[0].expires_at_ms == 5000u + 10800000u);
}

TEST_CASE("An alert already past expiry is shown once and reported expired") {
    Rig rig;
    CHECK_FALSE(rig.loop.track(emergency(4, "r4", 60000, 1000), 2000));
    CHECK(rig.sink.count() == 1);
    CHECK(rig.loop.pending() == 0);
    REQUIRE(rig.events.size() == 1);
    CHECK(rig.events[0].kind == EventKind::EmergencyExpired);
}

TEST_CASE("Acknowledging an untracked receipt is still sent upstream") {
    Rig rig;
    Error err;
    CHECK(rig.loop.acknowledge("elsewhere", err));
    CHECK(rig.api.acks == std::vector<std::string>{"elsewhere"});
}

TEST_CASE("Restore drops expired entries and keeps the schedule of the rest") {
    Rig rig;
    PersistedAck live;
    live.message = *fakes::make_msg(5, Priority::Emergency, "live");
    live.next_retry_at_ms = 70000;
    live.expires_at_ms = 500000;
    live.retry_interval_ms = 60000;
    PersistedAck dead = live;
    dead.message.receipt_id = "dead";
    dead.expires_at_ms = 10000;

    rig.loop.restore({live, dead}, 60000);
    CHECK(rig.loop.is_tracked("live"));
    CHECK_FALSE(rig.loop.is_tracked("dead"));

    rig.loop.tick(65000);
    CHECK(rig.sink.count() == 0);
    rig.loop.tick(70000);
    CHECK(rig.sink.count() == 1);
}

TEST_CASE("No display happens after acknowledge() returns, even while ticking") {
    for (int round = 0; round < 20; ++round) {
        Rig rig;
        REQUIRE(rig.loop.track(emergency(1, "r1", 1000, 100000000), 0));

        std::atomic<bool> stop{false};
        std::thread ticker([&] {
            uint64_t t = 0;
            while (!stop.load()) {
                t += 1000;
                rig.loop.tick(t);
            }
        });

        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        Error err;
        REQUIRE(rig.loop.acknowledge("r1", err));
        const size_t shown_at_ack = rig.sink.count();
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        stop.store(true);
        ticker.join();

        CHECK(rig.sink.count() == shown_at_ack);
    }
}

TEST_CASE("The alert thread starts and stops cleanly") {
    Rig rig;
    rig.loop.start();
    rig.loop.start();
    rig.loop.stop();
    rig.loop.stop();
    CHECK(rig.loop.pending() == 0);
}
