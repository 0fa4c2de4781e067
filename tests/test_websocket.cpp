#include <doctest/doctest.h>

#include <algorithm>
#include <cstddef>
#include <deque>
#include <memory>
#include <string>
#include <vector>

#include "pushwire/transport/transport_websocket.hpp"
#include "pushwire/transport/ws_frame.hpp"

using namespace pushwire;
using transport::RxResult;

namespace {

// In-memory byte stream standing in for the relay. Answers the upgrade request
// once the request's blank line has been written, then plays back `incoming`
// one chunk per read. Frames written after the upgrade land in `sent`.
struct ScriptedStream : transport::IByteStream {
    int                  status = 101;
    bool                 corrupt_accept = false;
    std::vector<uint8_t> after_upgrade;          // frame bytes sent in the same read as the 101
    std::deque<std::vector<uint8_t>> incoming;
    bool                 eof = false;

    std::string          request;
    bool                 upgraded = false;
    std::vector<uint8_t> sent;
    bool                 open_ = false;

    bool connect(const transport::Url&, uint32_t, Error&) override {
        open_ = true;
        return true;
    }

    bool write_all(const uint8_t* data, size_t len, uint32_t, Error& err) override {
        if (!open_) { err.set(ErrorCode::NetworkError, "closed"); return false; }
        if (upgraded) {
            sent.insert(sent.end(), data, data + len);
            return true;
        }
        request.append(reinterpret_cast<const char*>(data), len);
        if (request.find("\r\n\r\n") != std::string::npos) answer_upgrade();
        return true;
    }

    RxResult read_some(uint8_t* out, size_t cap, size_t& n, uint32_t, Error&) override {
        n = 0;
        if (incoming.empty()) return eof ? RxResult::Closed : RxResult::None;
        std::vector<uint8_t>& chunk = incoming.front();
        n = std::min(cap, chunk.size());
        std::copy(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n), out);
        chunk.erase(chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
        if (chunk.empty()) incoming.pop_front();
        return RxResult::Ok;
    }

    void close() override { open_ = false; }
    bool is_open() const override { return open_; }

    void answer_upgrade() {
        upgraded = true;
        const std::string marker = "Sec-WebSocket-Key: ";
        const auto at = request.find(marker) + marker.size();
        const std::string key = request.substr(at, request.find("\r\n", at) - at);
        std::string accept = transport::websocket_accept_key(key);
        if (corrupt_accept) accept[0] = accept[0] == 'A' ? 'B' : 'A';

        std::string head = "HTTP/1.1 " + std::to_string(status) + (status == 101 ? " Switching Protocols" : " Unauthorized") + "\r\n";
        if (status == 101) {
            head += "Upgrade: websocket\r\nConnection: Upgrade\r\n";
            head += "Sec-WebSocket-Accept: " + accept + "\r\n";
        }
        head += "\r\n";
        std::vector<uint8_t> chunk(head.begin(), head.end());
        chunk.insert(chunk.end(), after_upgrade.begin(), after_upgrade.end());
        incoming.push_front(std::move(chunk));
    }

    std::vector<ws::Frame> sent_frames() const {
        std::vector<ws::Frame> out;
        ws::decoder dec;
        ws::Frame f;
        for (uint8_t b : sent)
            if (dec.feed(b, f) == ws::FeedResult::Frame) out.push_back(f);
        return out;
    }
};

struct Harness {
    ScriptedStream* stream;
    transport::WebSocketConnection conn;

    Harness() : Harness(std::make_unique<ScriptedStream>()) {}
    explicit Harness(std::unique_ptr<ScriptedStream> s) : stream(s.get()), conn(std::move(s)) {}
};

std::vector<uint8_t> bytes(const std::string& s) { return {s.begin(), s.end()}; }

} // namespace

TEST_CASE("Upgrade sends a versioned key and accepts the matching reply") {
    Harness h;
    Error err;
    REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));
    CHECK(h.conn.is_open());
    CHECK(h.stream->request.rfind("GET /push HTTP/1.1\r\n", 0) == 0);
    CHECK(h.stream->request.find("Host: relay.test\r\n") != std::string::npos);
    CHECK(h.stream->request.find("Upgrade: websocket\r\n") != std::string::npos);
    CHECK(h.stream->request.find("Sec-WebSocket-Version: 13\r\n") != std::string::npos);
}

TEST_CASE("Handshake refusals map to auth and protocol errors") {
    {
        auto s = std::make_unique<ScriptedStream>();
        s->status = 401;
        Harness h(std::move(s));
        Error err;
        CHECK_FALSE(h.conn.open("ws://relay.test/push", 1000, err));
        CHECK(err.code == ErrorCode::AuthError);
        CHECK_FALSE(h.conn.is_open());
    }
    {
        auto s = std::make_unique<ScriptedStream>();
        s->corrupt_accept = true;
        Harness h(std::move(s));
        Error err;
        CHECK_FALSE(h.conn.open("ws://relay.test/push", 1000, err));
        CHECK(err.code == ErrorCode::ProtocolError);
        CHECK(err.reason == "ws_bad_accept_key");
        CHECK_FALSE(h.conn.is_open());
    }
}

TEST_CASE("Frames that arrive with the upgrade reply are delivered first") {
    auto s = std::make_unique<ScriptedStream>();
    s->after_upgrade = {0x82, 0x01, '#', 0x81, 0x01, '!'};
    Harness h(std::move(s));
    Error err;
    REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));

    std::vector<uint8_t> payload;
    REQUIRE(h.conn.recv(payload, 10, err) == RxResult::Ok);
    CHECK(payload == bytes("#"));
    REQUIRE(h.conn.recv(payload, 10, err) == RxResult::Ok);
    CHECK(payload == bytes("!"));
    CHECK(h.conn.recv(payload, 10, err) == RxResult::None);
}

TEST_CASE("Identification text goes out as one masked text frame") {
    Harness h;
    Error err;
    REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));
    REQUIRE(h.conn.send_text("login:dev1:s3cret\n", err));

    REQUIRE(h.stream->sent.size() > 2);
    CHECK((h.stream->sent[1] & 0x80) != 0);
    auto frames = h.stream->sent_frames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].opcode == ws::Opcode::Text);
    CHECK(frames[0].fin);
    CHECK(frames[0].payload == bytes("login:dev1:s3cret\n"));
}

TEST_CASE("A fragmented message is reassembled around an interleaved ping") {
    Harness h;
    Error err;
    REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));

    h.stream->incoming.push_back({0x01, 0x01, '!'});            // text, FIN clear
    h.stream->incoming.push_back({0x89, 0x02, 'h', 'i'});       // ping mid-message
    h.stream->incoming.push_back({0x80, 0x01, '#'});            // final continuation

    std::vector<uint8_t> payload;
    REQUIRE(h.conn.recv(payload, 1000, err) == RxResult::Ok);
    CHECK(payload == bytes("!#"));

    auto frames = h.stream->sent_frames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].opcode == ws::Opcode::Pong);
    CHECK(frames[0].payload == bytes("hi"));
}

TEST_CASE("Fragmentation violations drop the connection") {
    SUBCASE("continuation without a started message") {
        Harness h;
        Error err;
        REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));
        h.stream->incoming.push_back({0x80, 0x01, '#'});
        std::vector<uint8_t> payload;
        CHECK(h.conn.recv(payload, 100, err) == RxResult::Error);
        CHECK(err.reason == "ws_orphan_continuation");
        CHECK_FALSE(h.conn.is_open());
    }
    SUBCASE("new data frame while a message is unfinished") {
        Harness h;
        Error err;
        REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));
        h.stream->incoming.push_back({0x01, 0x01, 'a', 0x81, 0x01, 'b'});
        std::vector<uint8_t> payload;
        CHECK(h.conn.recv(payload, 100, err) == RxResult::Error);
        CHECK(err.reason == "ws_unfinished_fragment");
        CHECK_FALSE(h.conn.is_open());
    }
}

TEST_CASE("A close frame is echoed and reported as Closed") {
    Harness h;
    Error err;
    REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));
    h.stream->incoming.push_back({0x88, 0x02, 0x03, 0xE8});

    std::vector<uint8_t> payload;
    CHECK(h.conn.recv(payload, 100, err) == RxResult::Closed);
    CHECK_FALSE(h.conn.is_open());

    auto frames = h.stream->sent_frames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].opcode == ws::Opcode::Close);
    CHECK(frames[0].payload == std::vector<uint8_t>{0x03, 0xE8});
}

TEST_CASE("Stream EOF is reported as Closed") {
    Harness h;
    Error err;
    REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));
    h.stream->eof = true;
    std::vector<uint8_t> payload;
    CHECK(h.conn.recv(payload, 100, err) == RxResult::Closed);
    CHECK_FALSE(h.conn.is_open());
}

TEST_CASE("Ready queue overflow is a protocol error") {
    Harness h;
    Error err;
    REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));

    std::vector<uint8_t> burst;
    for (size_t i = 0; i < transport::WebSocketConnection::READY_CAPACITY + 1; ++i) {
        burst.push_back(0x82);
        burst.push_back(0x01);
        burst.push_back('#');
    }
    h.stream->incoming.push_back(burst);

    std::vector<uint8_t> payload;
    CHECK(h.conn.recv(payload, 100, err) == RxResult::Error);
    CHECK(err.reason == "ws_ready_queue_full");
    CHECK_FALSE(h.conn.is_open());
}

TEST_CASE("Closing sends a normal-closure frame once") {
    Harness h;
    Error err;
    REQUIRE(h.conn.open("ws://relay.test/push", 1000, err));
    h.conn.close();
    h.conn.close();
    CHECK_FALSE(h.conn.is_open());

    auto frames = h.stream->sent_frames();
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].opcode == ws::Opcode::Close);
    CHECK(frames[0].payload == std::vector<uint8_t>{0x03, 0xE8});
}
