#pragma once

// ============================================================
// mock_transport.hpp -- Scripted in-process transport
//
// Responses are looked up by the request url, first exactly,
// then with the query string removed, then the default. A url
// scripted with several responses serves them in order and
// repeats the last one.
//
// hold(url) parks matching requests inside perform() until
// release(url); parked requests still honour should_abort when
// abort support is on.
// ============================================================

#include "transport.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

struct MockResponse {
    TransportStatus status{TransportStatus::OK};
    int             http_status{200};
    Headers         headers;
    std::string     body;
    u32             delay_ms{0};
    bool            throw_error{false};   // perform() throws std::runtime_error

    static MockResponse ok(const std::string& body, int http = 200) {
        MockResponse r;
        r.http_status = http;
        r.body        = body;
        return r;
    }
    static MockResponse http_error(int http, const std::string& body = "") {
        MockResponse r;
        r.http_status = http;
        r.body        = body;
        return r;
    }
    static MockResponse failure(TransportStatus s) {
        MockResponse r;
        r.status      = s;
        r.http_status = 0;
        return r;
    }
};

class MockTransport : public Transport {
public:
    MockTransport();

    void script(const std::string& url, std::vector<MockResponse> responses);
    void set_default(MockResponse r);

    void hold(const std::string& url);
    void release(const std::string& url);
    void release_all();

    void set_supports_abort(bool v);
    bool supports_abort() const override;

    TransportResult perform(const TransportRequest& request,
                            const TransportProgress& progress,
                            const AbortCheck& should_abort) override;

    // ---- Observation ----
    size_t call_count(const std::string& url) const;   // same matching as script()
    size_t total_calls() const;
    int in_flight() const;
    int max_concurrent() const;
    std::vector<TransportRequest> requests() const;

    bool wait_for_calls(size_t n, std::chrono::milliseconds timeout) const;
    bool wait_for_in_flight(int n, std::chrono::milliseconds timeout) const;

private:
    std::string key_for_locked(const std::string& url) const;
    bool is_held_locked(const std::string& url) const;

    mutable std::mutex                                  mutex_;
    mutable std::condition_variable                     cv_;
    std::map<std::string, std::deque<MockResponse>>     scripts_;
    MockResponse                                        default_;
    std::set<std::string>                               held_;
    bool                                                supports_abort_{true};

    std::vector<TransportRequest>                       requests_;
    std::map<std::string, size_t>                       calls_;
    int                                                 in_flight_{0};
    int                                                 max_concurrent_{0};
};
