// tests/fakes.hpp - scripted stand-ins for the relay, the socket, the
// credential store and the notification sink.
#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "pushwire/credentials.hpp"
#include "pushwire/message.hpp"
#include "pushwire/notification_sink.hpp"
#include "pushwire/relay_api.hpp"
#include "pushwire/transport/transport_base.hpp"
#include "pushwire/work_queue.hpp"

namespace fakes {

using namespace pushwire;

inline MessagePtr make_msg(int64_t id, Priority p = Priority::Normal, const std::string& receipt = {}) {
    auto m = std::make_shared<Message>();
    m->id = id;
    m->priority = p;
    m->title = "title " + std::to_string(id);
    m->body = "body " + std::to_string(id);
    m->app = "test";
    if (!receipt.empty()) m->receipt_id = receipt;
    return m;
}

struct MemoryCredentialStore : ICredentialStore {
    std::optional<Token> token;
    int clears = 0;

    std::optional<Token> get_token() const override { return token; }
    bool set_token(const Token& t, Error&) override { token = t; return true; }
    bool clear_token(Error&) override { token.reset(); ++clears; return true; }
};

struct RecordingSink : INotificationSink {
    mutable std::mutex mu;
    std::vector<int64_t> shown;

    void display(const Message& m) override {
        std::lock_guard<std::mutex> lock(mu);
        shown.push_back(m.id);
    }
    size_t count() const {
        std::lock_guard<std::mutex> lock(mu);
        return shown.size();
    }
};

struct InlineExecutor : IExecutor {
    int posted = 0;
    bool post(Job job) override { ++posted; job(); return true; }
};

/// Holds jobs until run_all(); lets tests observe "fetch in flight".
struct ManualExecutor : IExecutor {
    std::deque<Job> jobs;
    bool post(Job job) override { jobs.push_back(std::move(job)); return true; }
    void run_all() {
        while (!jobs.empty()) {
            Job j = std::move(jobs.front());
            jobs.pop_front();
            j();
        }
    }
};

struct FakeRelayApi : IRelayApi {
    mutable std::mutex mu;

    std::vector<MessagePtr> queue;          // what the relay still holds
    ErrorCode fetch_fail{ErrorCode::Ok};
    ErrorCode receipt_fail{ErrorCode::Ok};
    ErrorCode ack_fail{ErrorCode::Ok};

    int fetch_calls = 0;
    std::vector<int64_t> receipts;          // update_highest_message ids
    std::vector<std::string> acks;

    // hold_fetches() parks every fetch_messages() call until release_fetches().
    std::mutex gate_mu;
    std::condition_variable gate_cv;
    bool gate_closed = false;
    int parked = 0;

    void hold_fetches() {
        std::lock_guard<std::mutex> lock(gate_mu);
        gate_closed = true;
    }
    void release_fetches() {
        {
            std::lock_guard<std::mutex> lock(gate_mu);
            gate_closed = false;
        }
        gate_cv.notify_all();
    }
    bool wait_parked(int ms) {
        std::unique_lock<std::mutex> lock(gate_mu);
        return gate_cv.wait_for(lock, std::chrono::milliseconds(ms), [this] { return parked > 0; });
    }

    bool fetch_messages(const Token&, std::vector<MessagePtr>& out, Error& err) override {
        {
            std::unique_lock<std::mutex> gate(gate_mu);
            if (gate_closed) {
                ++parked;
                gate_cv.notify_all();
                gate_cv.wait(gate, [this] { return !gate_closed; });
                --parked;
            }
        }
        std::lock_guard<std::mutex> lock(mu);
        ++fetch_calls;
        if (fetch_fail != ErrorCode::Ok) { err.set(fetch_fail, "scripted"); return false; }
        out = queue;
        return true;
    }

    bool update_highest_message(const Token&, int64_t id, Error& err) override {
        std::lock_guard<std::mutex> lock(mu);
        receipts.push_back(id);
        if (receipt_fail != ErrorCode::Ok) { err.set(receipt_fail, "scripted"); return false; }
        // Relay drops everything up to id.
        std::vector<MessagePtr> keep;
        for (const auto& m : queue) if (m->id > id) keep.push_back(m);
        queue.swap(keep);
        return true;
    }

    bool acknowledge(const Token&, const std::string& receipt, Error& err) override {
        std::lock_guard<std::mutex> lock(mu);
        if (ack_fail != ErrorCode::Ok) { err.set(ack_fail, "scripted"); return false; }
        acks.push_back(receipt);
        return true;
    }

    bool login(const std::string&, const std::string& password, const std::string& twofa,
               LoginResult& out, Error& err) override {
        if (password != "right") { err.set(ErrorCode::AuthError, "invalid credentials"); return false; }
        if (twofa == "need") { err.set(ErrorCode::AuthError, "twofa_required"); return false; }
        out.user_key = "ukey";
        out.secret = "sec";
        return true;
    }

    bool register_device(const std::string&, const std::string&, std::string& device_id, Error&) override {
        device_id = "dev1";
        return true;
    }
};

/// Socket script: each recv() pops the next step; an empty script reads as silence.
struct FakeConnection : transport::IConnection {
    struct Step {
        transport::RxResult result{transport::RxResult::None};
        std::string payload;
    };

    std::deque<ErrorCode> open_results;     // consumed per open(); empty = Ok
    std::deque<Step> script;
    std::vector<std::string> sent;
    int opens = 0;
    int closes = 0;
    bool open_{false};

    void push_frames(const std::string& bytes) { script.push_back({transport::RxResult::Ok, bytes}); }
    void push_close() { script.push_back({transport::RxResult::Closed, {}}); }

    bool open(const std::string&, uint32_t, Error& err) override {
        ++opens;
        ErrorCode c = ErrorCode::Ok;
        if (!open_results.empty()) { c = open_results.front(); open_results.pop_front(); }
        if (c != ErrorCode::Ok) { err.set(c, "scripted"); return false; }
        open_ = true;
        return true;
    }
    bool send_text(const std::string& text, Error&) override { sent.push_back(text); return true; }
    transport::RxResult recv(std::vector<uint8_t>& payload, uint32_t, Error& err) override {
        payload.clear();
        if (script.empty()) return transport::RxResult::None;
        Step s = script.front();
        script.pop_front();
        if (s.result == transport::RxResult::Error) err.set(ErrorCode::NetworkError, "scripted");
        payload.assign(s.payload.begin(), s.payload.end());
        if (s.result == transport::RxResult::Closed || s.result == transport::RxResult::Error) open_ = false;
        return s.result;
    }
    void close() override { if (open_) ++closes; open_ = false; }
    bool is_open() const override { return open_; }
    const char* name() const override { return "fake"; }
};

} // namespace fakes
