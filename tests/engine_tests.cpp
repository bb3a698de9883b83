// NetworkEngine behaviour against the scripted MockTransport.
#include "test_support.hpp"
#include "../common/logger.hpp"
#include "../engine/mock_transport.hpp"
#include "../engine/network_engine.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>

using namespace testing_support;

namespace {

const std::string kBase = "https://api.example.com/services/data/v28.0/";

EngineConfig base_config() {
    EngineConfig cfg;
    cfg.initial_session.host         = "api.example.com";
    cfg.initial_session.api_path     = "/services/data/v28.0";
    cfg.initial_session.access_token = "tok-1";
    cfg.watchdog_interval_ms         = 10;
    cfg.callback_threads             = 1;
    return cfg;
}

EngineConfig cellular_config(int cap) {
    EngineConfig cfg = base_config();
    cfg.initial_network_status  = NetworkStatus::REACHABLE_VIA_WWAN;
    cfg.cellular_max_concurrent = cap;
    return cfg;
}

// Records "<name>:done", "<name>:error:<kind name>" and "<name>:cancel"
void track(const OperationPtr& op, Recorder& rec, const std::string& name) {
    op->add_completion_handler(
        [&rec, name](const OperationPtr&) { rec.add(name + ":done"); },
        [&rec, name](const NetworkError& e) { rec.add(name + ":error:" + error_kind_name(e.kind)); });
    op->add_cancel_handler([&rec, name](const OperationPtr&) { rec.add(name + ":cancel"); });
}

const char* event_name(EngineEventType t) {
    switch (t) {
        case EngineEventType::REACHABILITY_CHANGED: return "reachability";
        case EngineEventType::CANCELLED_ALL:        return "cancelled_all";
        case EngineEventType::SUSPENDED:            return "suspended";
        case EngineEventType::RESUMED:              return "resumed";
    }
    return "?";
}

std::string header_of(const TransportRequest& req, const std::string& name) {
    auto it = req.headers.find(name);
    return it == req.headers.end() ? "" : it->second;
}

class XorEncryptor : public FileEncryptor {
public:
    std::vector<u8> encrypt(const std::vector<u8>& plain) override { return apply(plain); }
    std::vector<u8> decrypt(const std::vector<u8>& cipher) override { return apply(cipher); }
private:
    static std::vector<u8> apply(std::vector<u8> data) {
        for (auto& b : data) b ^= 0x5A;
        return data;
    }
};

// Blocks inside encrypt() until opened, holding the worker mid-store
class GatedEncryptor : public FileEncryptor {
public:
    std::vector<u8> encrypt(const std::vector<u8>& plain) override {
        std::unique_lock<std::mutex> lk(mutex_);
        entered_ = true;
        cv_.notify_all();
        cv_.wait(lk, [this] { return open_; });
        return plain;
    }
    std::vector<u8> decrypt(const std::vector<u8>& cipher) override { return cipher; }

    bool wait_entered() {
        std::unique_lock<std::mutex> lk(mutex_);
        return cv_.wait_for(lk, std::chrono::milliseconds(2000), [this] { return entered_; });
    }
    void open() {
        std::lock_guard<std::mutex> lk(mutex_);
        open_ = true;
        cv_.notify_all();
    }
private:
    std::mutex              mutex_;
    std::condition_variable cv_;
    bool                    entered_{false};
    bool                    open_{false};
};

class RecordingObserver : public OperationObserver {
public:
    explicit RecordingObserver(Recorder& rec) : rec_(rec) {}
    void did_finish(NetworkOperation&) override { rec_.add("observer:finish"); }
    void did_fail(NetworkOperation&, const NetworkError&) override { rec_.add("observer:fail"); }
    void did_cancel(NetworkOperation&) override { rec_.add("observer:cancel"); }
    void did_timeout(NetworkOperation&) override { rec_.add("observer:timeout"); }
private:
    Recorder& rec_;
};

// ---------------------------------------------------------------
// Deduplication and ordering
// ---------------------------------------------------------------

void test_dedup_shares_one_request(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "sobjects", {MockResponse::ok("{\"n\":1}")});
    mock->hold(kBase + "sobjects");
    NetworkEngine engine(mock, base_config());

    auto a = engine.get("sobjects");
    auto b = engine.get("sobjects");
    std::string body_a;
    std::string body_b;
    a->add_completion_handler([&](const OperationPtr& op) {
        body_a = op->response_string().value_or("");
        rec.add("a");
    }, nullptr);
    b->add_completion_handler([&](const OperationPtr& op) {
        body_b = op->response_string().value_or("");
        rec.add("b");
    }, nullptr);

    auto ra = engine.enqueue(a);
    t.check(mock->wait_for_in_flight(1, std::chrono::milliseconds(2000)), "first request in flight");
    auto rb = engine.enqueue(b);
    t.check(ra == a, "first enqueue returns the operation itself");
    t.check(rb == a, "identical enqueue returns the in-flight operation");
    t.check(engine.active_operation("sobjects") == a, "active_operation finds the live operation");

    mock->release_all();
    t.check(rec.wait_for_size(2), "both completion handlers run");
    t.check(mock->call_count(kBase + "sobjects") == 1, "one transport call for duplicates");
    t.check(body_a == "{\"n\":1}" && body_b == "{\"n\":1}", "both handlers see the same body");
    t.check(engine.active_operation("sobjects") == nullptr, "finished operation leaves the index");
    t.check(b->state() == OperationState::PENDING, "the absorbed duplicate is never run");
}

void test_cellular_cap_serializes(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    for (const char* name : {"a", "b", "c"}) {
        MockResponse r = MockResponse::ok(name);
        r.delay_ms = 20;
        mock->script(kBase + name, {r});
    }
    NetworkEngine engine(mock, cellular_config(1));
    t.check(engine.current_cap() == 1, "cellular cap in force");

    for (const char* name : {"a", "b", "c"}) {
        auto op = engine.get(name);
        track(op, rec, name);
        engine.enqueue(op);
    }
    t.check(rec.wait_for_size(3), "three operations complete");
    auto e = rec.entries();
    t.check(e.size() == 3 && e[0] == "a:done" && e[1] == "b:done" && e[2] == "c:done",
            "operations complete in FIFO order");
    t.check(mock->max_concurrent() == 1, "never more than one request in flight");
}

void test_priority_order(TestContext& t) {
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::ok("x"));
    mock->hold(kBase + "first");
    NetworkEngine engine(mock, cellular_config(1));

    engine.enqueue(engine.get("first"));
    t.check(mock->wait_for_in_flight(1, std::chrono::milliseconds(2000)), "slot occupied");

    auto low = engine.get("low");
    low->set_priority(OperationPriority::VERY_LOW);
    auto normal = engine.get("normal");
    auto high = engine.get("high");
    high->set_priority(OperationPriority::HIGH);
    engine.enqueue(low);
    engine.enqueue(normal);
    engine.enqueue(high);
    t.check(engine.pending_count() == 3, "three operations waiting for the slot");

    mock->release_all();
    t.check(mock->wait_for_calls(4, std::chrono::milliseconds(3000)), "all four ran");
    auto reqs = mock->requests();
    t.check(reqs.size() == 4 && reqs[1].url == kBase + "high" && reqs[2].url == kBase + "normal" &&
            reqs[3].url == kBase + "low", "higher priority is admitted first");
}

// ---------------------------------------------------------------
// Access token handling
// ---------------------------------------------------------------

void test_auth_refresh_and_replay(TestContext& t) {
    Recorder rec;
    std::atomic<int> refreshes{0};
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "me", {MockResponse::http_error(401), MockResponse::ok("{\"id\":7}")});
    NetworkEngine engine(mock, base_config());
    engine.set_session_refresh_handler([&](NetworkEngine&) { ++refreshes; });

    auto op = engine.get("me");
    track(op, rec, "me");
    engine.enqueue(op);

    t.check(wait_until([&] { return refreshes.load() == 1; }), "refresh requested after 401");
    t.check(engine.waiting_for_token_count() == 1, "operation parked for a token");
    t.check(engine.active_operation("me") == op, "parked operation stays visible to dedup");
    t.check(rec.size() == 0, "no callbacks while waiting for a token");

    SessionContext fresh = *engine.session();
    fresh.access_token = "tok-2";
    engine.session_refreshed(fresh);

    t.check(rec.wait_for_size(1), "replayed operation completes");
    t.check(rec.entries()[0] == "me:done", "replay succeeds");
    auto reqs = mock->requests();
    t.check(reqs.size() == 2, "one original request and one replay");
    t.check(reqs.size() == 2 && header_of(reqs[0], "Authorization") == "Bearer tok-1",
            "first attempt used the old token");
    t.check(reqs.size() == 2 && header_of(reqs[1], "Authorization") == "Bearer tok-2",
            "replay used the refreshed token");
    t.check(op->response_json().has_value() && (*op->response_json())["id"].asInt() == 7,
            "replayed response is parsed");
    t.check(op->retry_count() == 0, "token replay is not a network retry");
}

void test_auth_burst_signals_once(TestContext& t) {
    Recorder rec;
    std::atomic<int> refreshes{0};
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::http_error(401));
    NetworkEngine engine(mock, base_config());
    engine.set_session_refresh_handler([&](NetworkEngine&) { ++refreshes; });

    for (const char* name : {"one", "two", "three"}) {
        auto op = engine.get(name);
        track(op, rec, name);
        engine.enqueue(op);
    }
    t.check(wait_until([&] { return engine.waiting_for_token_count() == 3; }),
            "every rejected operation waits");
    settle_for(50);
    t.check(refreshes.load() == 1, "one refresh for the whole burst");

    engine.fail_operations_waiting_for_access_token(
        NetworkError{ErrorKind::AUTH, 401, "login required", ""});
    t.check(rec.wait_for_size(3), "all waiting operations fail");
    t.check(rec.count("one:error:AuthError") == 1 && rec.count("three:error:AuthError") == 1,
            "waiting operations fail with the auth error");
    t.check(engine.waiting_for_token_count() == 0, "waiting queue drained");

    engine.enqueue(engine.get("four"));
    t.check(wait_until([&] { return refreshes.load() == 2; }), "a new burst signals again");
    engine.session_refresh_failed(NetworkError{ErrorKind::AUTH, 401, "still no", ""});
    t.check(wait_until([&] { return engine.waiting_for_token_count() == 0; }),
            "refresh failure drains the queue");
}

void test_missing_token_waits_for_session(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "limits", {MockResponse::ok("{}")});
    EngineConfig cfg = base_config();
    cfg.initial_session.access_token.clear();
    NetworkEngine engine(mock, cfg);
    engine.set_session_refresh_handler([](NetworkEngine& e) {
        SessionContext s = *e.session();
        s.access_token = "from-refresh";
        e.session_refreshed(s);
    });

    auto op = engine.get("limits");
    track(op, rec, "limits");
    engine.enqueue(op);

    t.check(rec.wait_for_size(1), "operation completes once a token arrives");
    t.check(rec.entries()[0] == "limits:done", "missing token resolved by refresh");
    auto reqs = mock->requests();
    t.check(reqs.size() == 1, "no request was sent without a token");
    t.check(!reqs.empty() && header_of(reqs[0], "Authorization") == "Bearer from-refresh",
            "request carries the refreshed token");
}

void test_remote_host_is_tokenless(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->script("https://files.example.net/blob/1", {MockResponse::ok("blob")});
    EngineConfig cfg;
    cfg.remote_host = "files.example.net";
    cfg.watchdog_interval_ms = 10;
    NetworkEngine engine(mock, cfg);

    auto op = engine.get("/blob/1");
    t.check(op->url() == "https://files.example.net/blob/1", "relative url resolved against remote host");
    t.check(!op->requires_access_token(), "remote host operations need no token");
    track(op, rec, "blob");
    engine.enqueue(op);
    t.check(rec.wait_for_size(1) && rec.entries()[0] == "blob:done", "remote operation completes");
    auto reqs = mock->requests();
    t.check(!reqs.empty() && reqs[0].headers.count("Authorization") == 0, "no Authorization header");
}

// ---------------------------------------------------------------
// Failures and retries
// ---------------------------------------------------------------

void test_retry_then_fail(TestContext& t) {
    Recorder rec;
    NetworkError seen;
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "flaky", {MockResponse::failure(TransportStatus::CONNECT_FAILED)});
    NetworkEngine engine(mock, base_config());

    auto op = engine.get("flaky");
    op->set_retry_policy(RetryPolicy{true, 2});
    op->add_completion_handler(nullptr, [&](const NetworkError& e) {
        seen = e;
        rec.add("error");
    });
    engine.enqueue(op);

    t.check(rec.wait_for_size(1), "error delivered after retries");
    settle_for(30);
    t.check(rec.size() == 1, "error handler runs exactly once");
    t.check(mock->call_count(kBase + "flaky") == 3, "one call plus two retries");
    t.check(op->retry_count() == 2, "retry count recorded");
    t.check(op->state() == OperationState::FAILED, "operation failed");
    t.check(seen.kind == ErrorKind::NETWORK && seen.code == ERR_TRANSPORT, "network error reported");
}

void test_5xx_retry_behaviour(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "busy", {MockResponse::http_error(503)});
    mock->script(kBase + "recovers", {MockResponse::http_error(502), MockResponse::ok("fine")});
    NetworkEngine engine(mock, base_config());

    auto busy = engine.get("busy");
    track(busy, rec, "busy");
    engine.enqueue(busy);

    auto recovers = engine.get("recovers");
    recovers->set_retry_policy(RetryPolicy{true, 3});
    track(recovers, rec, "recovers");
    engine.enqueue(recovers);

    t.check(rec.wait_for_size(2), "both settle");
    t.check(rec.count("busy:error:NetworkError") == 1, "5xx without retry fails as a network error");
    t.check(busy->error() && busy->error()->code == 503, "5xx status kept on the error");
    t.check(mock->call_count(kBase + "busy") == 1, "no retry by default");
    t.check(rec.count("recovers:done") == 1, "retry recovers from a 5xx");
    t.check(recovers->retry_count() == 1 && recovers->status_code() == 200, "one retry then 200");
}

void test_unlimited_retry_ceiling(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    MockResponse down = MockResponse::failure(TransportStatus::DNS_FAILED);
    down.delay_ms = 40;
    mock->script(kBase + "down", {down});
    EngineConfig cfg = base_config();
    cfg.retry = RetryPolicy{true, 0};
    cfg.unlimited_retry_ceiling_secs = 1;
    NetworkEngine engine(mock, cfg);

    auto op = engine.get("down");
    track(op, rec, "down");
    engine.enqueue(op);

    t.check(rec.wait_for_size(1, 6000), "unlimited retries stop at the ceiling");
    t.check(rec.count("down:error:NetworkError") == 1, "ceiling reports the network error");
    t.check(mock->call_count(kBase + "down") >= 3, "retried repeatedly before giving up");
}

void test_server_error_payload(TestContext& t) {
    Recorder rec;
    NetworkError seen;
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "query",
                 {MockResponse::http_error(400, "[{\"errorCode\":\"MALFORMED_QUERY\",\"message\":\"bad\"}]")});
    NetworkEngine engine(mock, base_config());

    auto op = engine.get("query", {{"q", "SELECT"}});
    op->set_retry_policy(RetryPolicy{true, 5});
    op->add_completion_handler(nullptr, [&](const NetworkError& e) {
        seen = e;
        rec.add("error");
    });
    engine.enqueue(op);

    t.check(rec.wait_for_size(1), "server error delivered");
    t.check(seen.kind == ErrorKind::SERVER, "server error kind");
    t.check(seen.server_error_code == "MALFORMED_QUERY", "server error code surfaced");
    t.check(mock->call_count(kBase + "query") == 1, "server errors are never retried");
    t.check(op->status_code() == 400, "status code kept after failure");
    t.check(op->response_string().value_or("").find("MALFORMED_QUERY") != std::string::npos,
            "failed operation keeps its body");
}

void test_transport_timeout_and_exception(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "slow", {MockResponse::failure(TransportStatus::TIMED_OUT)});
    MockResponse boom;
    boom.throw_error = true;
    mock->script(kBase + "boom", {boom});
    NetworkEngine engine(mock, base_config());

    auto slow = engine.get("slow");
    track(slow, rec, "slow");
    engine.enqueue(slow);
    auto broken = engine.get("boom");
    track(broken, rec, "boom");
    engine.enqueue(broken);

    t.check(rec.wait_for_size(2), "both settle");
    t.check(rec.count("slow:error:TimeoutError") == 1, "transport timeout reported as timeout");
    t.check(slow->state() == OperationState::TIMED_OUT, "transport timeout state");
    t.check(rec.count("boom:error:NetworkError") == 1, "transport exception becomes a network error");
    t.check(broken->state() == OperationState::FAILED, "transport exception fails the operation");
}

void test_watchdog_timeout(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->hold(kBase + "stuck");
    NetworkEngine engine(mock, base_config());
    auto observer = std::make_shared<RecordingObserver>(rec);

    auto op = engine.get("stuck");
    op->set_timeout_ms(60);
    track(op, rec, "stuck");
    op->add_observer(observer);
    engine.enqueue(op);

    t.check(rec.wait_for_size(2), "timeout delivered to handler and observer");
    t.check(rec.count("stuck:error:TimeoutError") == 1, "error handler sees a timeout");
    t.check(rec.count("observer:timeout") == 1, "observer sees a timeout");
    t.check(op->state() == OperationState::TIMED_OUT, "operation timed out");
    t.check(op->error() && op->error()->code == ERR_TIMED_OUT, "timeout error code");
    t.check(mock->wait_for_in_flight(0, std::chrono::milliseconds(2000)),
            "timed out request is aborted");
    t.check(engine.running_count() == 0, "slot released");
}

// ---------------------------------------------------------------
// Cancellation, suspension, cleanup
// ---------------------------------------------------------------

void test_cancel_by_tag(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::ok("ok"));
    for (const char* name : {"s1", "s2", "o1"}) mock->hold(kBase + name);
    NetworkEngine engine(mock, base_config());

    for (const char* name : {"s1", "s2", "o1"}) {
        auto op = engine.get(name);
        op->set_tag(name[0] == 's' ? "sync" : "other");
        track(op, rec, name);
        engine.enqueue(op);
    }
    t.check(engine.has_pending_operations_with_tag("sync"), "tagged operations visible");
    t.check(engine.operations_with_tag("sync").size() == 2, "two operations tagged sync");

    engine.cancel_all_operations_with_tag("sync");
    t.check(rec.wait_for_size(2), "cancel handlers run");
    t.check(rec.count("s1:cancel") == 1 && rec.count("s2:cancel") == 1, "both tagged ops cancelled");
    t.check(!engine.has_pending_operations_with_tag("sync"), "no sync operations left");
    t.check(engine.has_pending_operations_with_tag("other"), "other tag untouched");

    auto again = engine.get("s1");
    track(again, rec, "again");
    t.check(engine.enqueue(again) == again, "cancelled operation does not absorb a new one");

    mock->release_all();
    t.check(rec.wait_for_size(4), "remaining operations finish");
    t.check(rec.count("o1:done") == 1 && rec.count("again:done") == 1, "survivors complete");
    t.check(rec.count("s1:done") == 0, "cancelled operation never completes");
}

void test_cancel_all_while_suspended(TestContext& t) {
    Recorder rec;
    Recorder events;
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::ok("ok"));
    NetworkEngine engine(mock, base_config());
    engine.suspend_all_operations();
    engine.subscribe([&](const EngineEvent& ev) { events.add(event_name(ev.type)); });

    auto op = engine.get("queued");
    track(op, rec, "queued");
    engine.enqueue(op);
    settle_for(30);
    t.check(mock->total_calls() == 0, "suspended engine admits nothing");
    t.check(engine.pending_count() == 1, "operation stays pending");

    engine.cancel_all_operations();
    t.check(rec.wait_for_size(1) && rec.entries()[0] == "queued:cancel", "pending operation cancelled");
    t.check(events.wait_for_size(1) && events.entries()[0] == "cancelled_all", "cancel-all event");
    t.check(op->state() == OperationState::CANCELLED, "cancelled state");
    t.check(op->error() && op->error()->kind == ErrorKind::CANCELLED, "cancel error recorded");
    t.check(engine.pending_count() == 0, "queue empty");

    bool threw = false;
    try {
        engine.enqueue(op);
    } catch (const std::logic_error&) {
        threw = true;
    }
    t.check(threw, "finished operations cannot be enqueued again");
}

void test_suspend_resume_and_background(TestContext& t) {
    Recorder rec;
    Recorder events;
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::ok("ok"));
    NetworkEngine engine(mock, base_config());
    u64 id = engine.subscribe([&](const EngineEvent& ev) { events.add(event_name(ev.type)); });

    engine.suspend_all_operations();
    engine.suspend_all_operations();
    auto op = engine.get("later");
    track(op, rec, "later");
    engine.enqueue(op);
    settle_for(30);
    t.check(rec.size() == 0, "nothing runs while suspended");
    engine.resume_all_operations();
    t.check(rec.wait_for_size(1), "resumed operation completes");
    t.check(events.wait_for_size(2), "suspend and resume events");
    auto e = events.entries();
    t.check(e.size() == 2 && e[0] == "suspended" && e[1] == "resumed",
            "repeated suspend emits a single event");

    engine.application_did_enter_background();
    t.check(engine.is_suspended(), "background suspends");
    engine.application_will_enter_foreground();
    t.check(!engine.is_suspended(), "foreground resumes a background suspension");

    engine.suspend_all_operations();
    engine.application_will_enter_foreground();
    t.check(engine.is_suspended(), "explicit suspension survives foregrounding");
    engine.resume_all_operations();

    t.check(events.wait_for_size(6), "background cycle events");
    engine.unsubscribe(id);
    engine.suspend_all_operations();
    settle_for(30);
    t.check(events.size() == 6, "unsubscribed listener hears nothing");

    EngineConfig cfg = base_config();
    cfg.suspend_on_background = false;
    NetworkEngine stays(mock, cfg);
    stays.application_did_enter_background();
    t.check(!stays.is_suspended(), "background suspension can be disabled");
}

void test_cleanup_is_silent(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::ok("ok"));
    mock->hold(kBase + "running");
    NetworkEngine engine(mock, base_config());

    auto running = engine.get("running");
    track(running, rec, "running");
    engine.enqueue(running);
    t.check(mock->wait_for_in_flight(1, std::chrono::milliseconds(2000)), "one request running");

    engine.suspend_all_operations();
    auto pending = engine.get("pending");
    track(pending, rec, "pending");
    engine.enqueue(pending);

    engine.cleanup();
    t.check(engine.pending_count() == 0 && engine.running_count() == 0, "queues emptied");
    t.check(running->state() == OperationState::CANCELLED, "running op marked cancelled");
    t.check(pending->state() == OperationState::CANCELLED, "pending op marked cancelled");
    t.check(mock->wait_for_in_flight(0, std::chrono::milliseconds(2000)), "running request aborted");
    settle_for(40);
    t.check(rec.size() == 0, "cleanup fires no callbacks");
}

void test_non_abortable_late_result_discarded(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->set_supports_abort(false);
    mock->script(kBase + "late", {MockResponse::ok("too late")});
    mock->hold(kBase + "late");
    NetworkEngine engine(mock, base_config());

    auto op = engine.get("late");
    track(op, rec, "late");
    engine.enqueue(op);
    t.check(mock->wait_for_in_flight(1, std::chrono::milliseconds(2000)), "request in flight");

    engine.cancel_all_operations();
    t.check(rec.wait_for_size(1) && rec.entries()[0] == "late:cancel", "cancel delivered at once");

    mock->release_all();
    t.check(mock->wait_for_in_flight(0, std::chrono::milliseconds(2000)), "transport returned");
    settle_for(40);
    t.check(rec.size() == 1, "late response triggers no completion");
    t.check(op->state() == OperationState::CANCELLED, "operation stays cancelled");
    t.check(op->status_code() == 0, "late response is not stored");
}

void test_abandoned_call_frees_a_worker(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->set_supports_abort(false);
    mock->set_default(MockResponse::ok("fresh"));
    mock->hold(kBase + "stuck");
    mock->hold(kBase + "slow");
    NetworkEngine engine(mock, cellular_config(1));

    auto stuck = engine.get("stuck");
    track(stuck, rec, "stuck");
    engine.enqueue(stuck);
    t.check(mock->wait_for_in_flight(1, std::chrono::milliseconds(2000)), "first call blocked");
    engine.cancel_all_operations();
    t.check(rec.wait_for_size(1) && rec.entries()[0] == "stuck:cancel", "cancel delivered");

    auto next = engine.get("next");
    next->set_timeout_ms(2000);
    track(next, rec, "next");
    engine.enqueue(next);
    t.check(rec.wait_for_size(2) && rec.count("next:done") == 1,
            "next operation runs while the cancelled call is still blocked");
    t.check(mock->call_count(kBase + "next") == 1, "next reached the transport");

    auto slow = engine.get("slow");
    slow->set_timeout_ms(50);
    track(slow, rec, "slow");
    engine.enqueue(slow);
    t.check(rec.wait_for_size(3) && rec.count("slow:error:TimeoutError") == 1, "slow call timed out");

    auto after = engine.get("after");
    after->set_timeout_ms(2000);
    track(after, rec, "after");
    engine.enqueue(after);
    t.check(rec.wait_for_size(4) && rec.count("after:done") == 1,
            "a timed-out call does not hold up the next admission");
    t.check(mock->in_flight() == 2, "both abandoned calls are still inside the transport");

    mock->release_all();
    t.check(mock->wait_for_in_flight(0, std::chrono::milliseconds(2000)), "abandoned calls returned");
    settle_for(40);
    t.check(rec.size() == 4, "abandoned results are discarded");
    t.check(engine.running_count() == 0 && engine.pending_count() == 0, "queue drained");
}

// ---------------------------------------------------------------
// Reachability
// ---------------------------------------------------------------

void test_reachability_gates_admission(TestContext& t) {
    Recorder rec;
    Recorder handler;
    Recorder events;
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::ok("ok"));
    EngineConfig cfg = base_config();
    cfg.initial_network_status = NetworkStatus::NOT_REACHABLE;
    NetworkEngine engine(mock, cfg);
    engine.set_reachability_changed_handler([&](NetworkStatus s) { handler.add(status_name(s)); });
    engine.subscribe([&](const EngineEvent& ev) { events.add(event_name(ev.type)); });

    t.check(!engine.is_reachable() && engine.current_cap() == 0, "offline engine has no capacity");
    auto op = engine.get("offline");
    track(op, rec, "offline");
    engine.enqueue(op);
    settle_for(30);
    t.check(mock->total_calls() == 0 && engine.pending_count() == 1, "queued while offline");

    engine.set_network_status(NetworkStatus::REACHABLE_VIA_WIFI);
    t.check(rec.wait_for_size(1) && rec.entries()[0] == "offline:done", "admitted once online");
    t.check(handler.wait_for_size(1), "reachability handler notified");
    t.check(events.wait_for_size(1) && events.entries()[0] == "reachability", "reachability event");

    engine.set_network_status(NetworkStatus::REACHABLE_VIA_WIFI);
    settle_for(30);
    t.check(handler.size() == 1, "unchanged status is not reported");
}

void test_cap_grows_with_better_network(TestContext& t) {
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::ok("ok"));
    EngineConfig cfg = cellular_config(2);
    cfg.wifi_max_concurrent = 4;
    for (int i = 0; i < 6; ++i) mock->hold(kBase + "item" + std::to_string(i));
    NetworkEngine engine(mock, cfg);

    for (int i = 0; i < 6; ++i) engine.enqueue(engine.get("item" + std::to_string(i)));
    t.check(mock->wait_for_in_flight(2, std::chrono::milliseconds(2000)), "two in flight on cellular");
    settle_for(40);
    t.check(mock->in_flight() == 2 && engine.pending_count() == 4, "cellular cap holds");

    engine.set_network_status(NetworkStatus::REACHABLE_VIA_WIFI);
    t.check(mock->wait_for_in_flight(4, std::chrono::milliseconds(2000)), "wifi admits up to four");
    t.check(engine.running_count() == 4, "four running");

    mock->release_all();
    t.check(mock->wait_for_calls(6, std::chrono::milliseconds(3000)), "every item ran");
    t.check(mock->max_concurrent() == 4, "never above the wifi cap");
}

// ---------------------------------------------------------------
// Requests, responses, files
// ---------------------------------------------------------------

void test_url_resolution(TestContext& t) {
    auto mock = std::make_shared<MockTransport>();
    NetworkEngine engine(mock, base_config());

    t.check(engine.get("sobjects")->url() == kBase + "sobjects", "relative url gets the api path");
    t.check(engine.get("/id/1")->url() == "https://api.example.com/id/1", "rooted url skips the api path");
    t.check(engine.operation("query", {}, HttpMethod::HTTP_GET, false)->url() ==
            "http://api.example.com/services/data/v28.0/query", "plain http when ssl is off");
    t.check(engine.get("https://other.example.org/x")->url() == "https://other.example.org/x",
            "absolute url kept");
    t.check(engine.post("sobjects")->method() == HttpMethod::HTTP_POST, "post builder");
    t.check(engine.del("sobjects")->method() == HttpMethod::HTTP_DELETE, "delete builder");

    bool empty_threw = false;
    try {
        engine.get("");
    } catch (const std::invalid_argument&) {
        empty_threw = true;
    }
    t.check(empty_threw, "empty url rejected");

    EngineConfig bare;
    bare.watchdog_interval_ms = 10;
    NetworkEngine hostless(mock, bare);
    bool relative_threw = false;
    try {
        hostless.get("sobjects");
    } catch (const std::invalid_argument&) {
        relative_threw = true;
    }
    t.check(relative_threw, "relative url without a host rejected");

    bool null_threw = false;
    try {
        NetworkEngine broken(nullptr, base_config());
    } catch (const std::invalid_argument&) {
        null_threw = true;
    }
    t.check(null_threw, "engine requires a transport");
}

void test_request_headers_and_response(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    MockResponse created = MockResponse::ok("{\"id\":\"001\"}", 201);
    created.headers["Location"] = "/sobjects/Account/001";
    mock->script(kBase + "sobjects/Account", {created});
    EngineConfig cfg = base_config();
    cfg.custom_headers["X-App"] = "engine";
    NetworkEngine engine(mock, cfg);
    engine.set_header_value("X-Env", "prod");
    engine.set_header_value("X-Drop", "1");
    engine.set_header_value("X-Drop", "");

    auto op = engine.post("sobjects/Account", {{"Name", "Acme Inc"}});
    op->set_header_value("X-App", "operation");
    track(op, rec, "create");
    engine.enqueue(op);
    t.check(rec.wait_for_size(1) && rec.entries()[0] == "create:done", "post completes");

    auto reqs = mock->requests();
    t.check(reqs.size() == 1, "one request sent");
    if (reqs.size() == 1) {
        const TransportRequest& r = reqs[0];
        t.check(r.method == HttpMethod::HTTP_POST, "method forwarded");
        t.check(header_of(r, "User-Agent").rfind("netqueue/1.0", 0) == 0, "default user agent");
        t.check(header_of(r, "authorization") == "Bearer tok-1", "bearer token attached");
        t.check(header_of(r, "X-Env") == "prod", "engine header attached");
        t.check(r.headers.count("X-Drop") == 0, "removed engine header absent");
        t.check(header_of(r, "X-App") == "operation", "operation header wins");
        t.check(header_of(r, "Content-Type") == "application/x-www-form-urlencoded; charset=utf-8",
                "form content type");
        t.check(r.body == "Name=Acme%20Inc", "form body");
        t.check(r.timeout_ms == 180000, "default timeout forwarded");
    }
    t.check(op->status_code() == 201, "status code stored");
    t.check(op->response_headers().count("location") == 1, "response headers stored");
    t.check(op->response_json() && (*op->response_json())["id"].asString() == "001", "json body");
}

void test_progress_reaches_one(TestContext& t) {
    Recorder up;
    Recorder down;
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "upload", {MockResponse::ok("0123456789")});
    NetworkEngine engine(mock, base_config());

    auto op = engine.post("upload", {{"k", "v"}});
    op->add_upload_progress_handler([&](double f) { up.add(std::to_string(f)); });
    op->add_download_progress_handler([&](double f) { down.add(std::to_string(f)); });
    track(op, rec, "upload");
    engine.enqueue(op);

    t.check(rec.wait_for_size(1), "upload completes");
    auto d = down.entries();
    auto u = up.entries();
    t.check(d.size() == 2 && d[0] == std::to_string(0.5) && d[1] == std::to_string(1.0),
            "download progress climbs to 1.0");
    t.check(!u.empty() && u.back() == std::to_string(1.0), "upload progress reaches 1.0");
}

void test_local_test_data(TestContext& t) {
    TempDir dir("local_data");
    dir.write("accounts.json", "{\"local\":true}");
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "remote", {MockResponse::ok("{\"local\":false}")});
    EngineConfig cfg = base_config();
    cfg.support_local_test_data = true;
    NetworkEngine engine(mock, cfg);

    auto local = engine.get("accounts");
    local->set_local_test_data_path(dir.file("accounts.json"));
    track(local, rec, "local");
    engine.enqueue(local);

    auto missing = engine.get("missing");
    missing->set_local_test_data_path(dir.file("nope.json"));
    track(missing, rec, "missing");
    engine.enqueue(missing);

    t.check(rec.wait_for_size(2), "local operations settle");
    t.check(rec.count("local:done") == 1, "local file served");
    t.check(local->response_json() && (*local->response_json())["local"].asBool(), "local body used");
    t.check(rec.count("missing:error:ServerError") == 1, "missing local file is a server error");
    t.check(missing->error() && missing->error()->code == ERR_LOCAL_TEST_DATA, "local data error code");
    t.check(mock->total_calls() == 0, "transport untouched");

    Recorder rec2;
    NetworkEngine disabled(mock, base_config());
    auto remote = disabled.get("remote");
    remote->set_local_test_data_path(dir.file("accounts.json"));
    track(remote, rec2, "remote");
    disabled.enqueue(remote);
    t.check(rec2.wait_for_size(1) && rec2.entries()[0] == "remote:done", "disabled local data");
    t.check(remote->response_string().value_or("") == "{\"local\":false}", "transport used instead");
}

void test_download_to_file(TestContext& t) {
    TempDir dir("downloads");
    dir.write("blocker", "not a directory");
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::ok("secret-body"));
    NetworkEngine engine(mock, base_config());
    engine.set_file_encryptor(std::make_shared<XorEncryptor>());

    auto enc = engine.get("files/1");
    enc->set_download_destination(dir.file("dl/one.bin"));
    track(enc, rec, "enc");
    engine.enqueue(enc);

    auto plain = engine.get("files/2");
    plain->set_encrypt_downloaded_file(false);
    plain->set_download_destination(dir.file("dl/two.bin"));
    track(plain, rec, "plain");
    engine.enqueue(plain);

    auto blocked = engine.get("files/3");
    blocked->set_download_destination(dir.file("blocker/three.bin"));
    track(blocked, rec, "blocked");
    engine.enqueue(blocked);

    t.check(rec.wait_for_size(3), "downloads settle");
    t.check(rec.count("enc:done") == 1 && rec.count("plain:done") == 1, "downloads complete");

    std::string on_disk = read_text(dir.file("dl/one.bin"));
    t.check(on_disk.size() == 11 && on_disk != "secret-body", "encrypted file on disk");
    t.check(enc->response_string().value_or("") == "secret-body", "response decrypted on read");
    t.check(read_text(dir.file("dl/two.bin")) == "secret-body", "unencrypted file on disk");
    t.check(plain->response_string().value_or("") == "secret-body", "plain response read back");

    t.check(rec.count("blocked:error:ServerError") == 1, "unwritable destination fails");
    t.check(blocked->error() && blocked->error()->code == ERR_STORAGE, "storage error code");
}

void test_cancel_while_storing_leaves_no_file(TestContext& t) {
    TempDir dir("late_download");
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->set_default(MockResponse::ok("body"));
    NetworkEngine engine(mock, base_config());
    auto gate = std::make_shared<GatedEncryptor>();
    engine.set_file_encryptor(gate);

    std::string dest = dir.file("dl/late.bin");
    auto op = engine.get("files/late");
    op->set_download_destination(dest);
    track(op, rec, "late");
    engine.enqueue(op);

    t.check(gate->wait_entered(), "worker is storing the download");
    engine.cancel_all_operations();
    t.check(rec.wait_for_size(1) && rec.entries()[0] == "late:cancel", "cancel delivered");
    gate->open();

    settle_for(60);
    t.check(!std::filesystem::exists(dest), "cancelled download never reaches its destination");
    t.check(!std::filesystem::exists(dest + ".part"), "staged file removed");
    t.check(rec.size() == 1 && op->state() == OperationState::CANCELLED, "operation stays cancelled");
}

// ---------------------------------------------------------------
// Callbacks
// ---------------------------------------------------------------

void test_observers_and_throwing_callbacks(TestContext& t) {
    Recorder rec;
    auto mock = std::make_shared<MockTransport>();
    mock->script(kBase + "shared", {MockResponse::ok("ok")});
    mock->hold(kBase + "shared");
    NetworkEngine engine(mock, base_config());
    auto observer = std::make_shared<RecordingObserver>(rec);

    auto first = engine.get("shared");
    first->add_completion_handler([](const OperationPtr&) {
        throw std::runtime_error("handler failure");
    }, nullptr);
    first->add_completion_handler([&](const OperationPtr&) { rec.add("after-throw"); }, nullptr);
    engine.enqueue(first);
    t.check(mock->wait_for_in_flight(1, std::chrono::milliseconds(2000)), "request in flight");

    auto second = engine.get("shared");
    second->add_observer(observer);
    engine.enqueue(second);

    mock->release_all();
    t.check(rec.wait_for_size(2), "remaining callbacks run");
    t.check(rec.count("after-throw") == 1, "a throwing handler does not stop later handlers");
    t.check(rec.count("observer:finish") == 1, "observer adopted through dedup");

    first->add_completion_handler([&](const OperationPtr&) { rec.add("too-late"); }, nullptr);
    settle_for(30);
    t.check(rec.count("too-late") == 0, "handlers added after completion never run");
}

} // namespace

int main() {
    TempDir logs("engine_logs");
    Logger::get().set_level(LogLevel::WARN);
    Logger::get().set_level_from_env("NETQUEUE_LOG_LEVEL");
    Logger::get().set_operation_error_file(logs.file("errors.log"));
    TestContext t;
    test_dedup_shares_one_request(t);
    test_cellular_cap_serializes(t);
    test_priority_order(t);
    test_auth_refresh_and_replay(t);
    test_auth_burst_signals_once(t);
    test_missing_token_waits_for_session(t);
    test_remote_host_is_tokenless(t);
    test_retry_then_fail(t);
    test_5xx_retry_behaviour(t);
    test_unlimited_retry_ceiling(t);
    test_server_error_payload(t);
    test_transport_timeout_and_exception(t);
    test_watchdog_timeout(t);
    test_cancel_by_tag(t);
    test_cancel_all_while_suspended(t);
    test_suspend_resume_and_background(t);
    test_cleanup_is_silent(t);
    test_non_abortable_late_result_discarded(t);
    test_abandoned_call_frees_a_worker(t);
    test_reachability_gates_admission(t);
    test_cap_grows_with_better_network(t);
    test_url_resolution(t);
    test_request_headers_and_response(t);
    test_progress_reaches_one(t);
    test_local_test_data(t);
    test_download_to_file(t);
    test_cancel_while_storing_leaves_no_file(t);
    test_observers_and_throwing_callbacks(t);
    return report(t, "engine_tests");
}
