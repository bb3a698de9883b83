// ============================================================
// mock_transport.cpp
// ============================================================

#include "mock_transport.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <stdexcept>
#include <thread>

static std::string strip_query(const std::string& url) {
    auto q = url.find('?');
    return q == std::string::npos ? url : url.substr(0, q);
}

MockTransport::MockTransport() {
    default_ = MockResponse::http_error(404, "");
}

void MockTransport::script(const std::string& url, std::vector<MockResponse> responses) {
    if (responses.empty()) throw std::invalid_argument("MockTransport::script: no responses");
    std::lock_guard<std::mutex> lk(mutex_);
    scripts_[url] = std::deque<MockResponse>(responses.begin(), responses.end());
}

void MockTransport::set_default(MockResponse r) {
    std::lock_guard<std::mutex> lk(mutex_);
    default_ = std::move(r);
}

void MockTransport::hold(const std::string& url) {
    std::lock_guard<std::mutex> lk(mutex_);
    held_.insert(url);
}

void MockTransport::release(const std::string& url) {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        held_.erase(url);
    }
    cv_.notify_all();
}

void MockTransport::release_all() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        held_.clear();
    }
    cv_.notify_all();
}

void MockTransport::set_supports_abort(bool v) {
    std::lock_guard<std::mutex> lk(mutex_);
    supports_abort_ = v;
}

bool MockTransport::supports_abort() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return supports_abort_;
}

std::string MockTransport::key_for_locked(const std::string& url) const {
    if (scripts_.count(url)) return url;
    std::string base = strip_query(url);
    if (scripts_.count(base)) return base;
    return "";
}

bool MockTransport::is_held_locked(const std::string& url) const {
    return held_.count(url) > 0 || held_.count(strip_query(url)) > 0;
}

TransportResult MockTransport::perform(const TransportRequest& request,
                                       const TransportProgress& progress,
                                       const AbortCheck& should_abort)
{
    MockResponse resp;
    bool abortable = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        requests_.push_back(request);
        ++calls_[request.url];
        ++in_flight_;
        max_concurrent_ = std::max(max_concurrent_, in_flight_);

        std::string key = key_for_locked(request.url);
        if (key.empty()) {
            resp = default_;
        } else {
            auto& q = scripts_[key];
            resp = q.front();
            if (q.size() > 1) q.pop_front();
        }
        abortable = supports_abort_;
    }
    cv_.notify_all();

    auto aborted = [&]() { return abortable && should_abort && should_abort(); };
    auto finish = [&](TransportResult r) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            --in_flight_;
        }
        cv_.notify_all();
        return r;
    };
    auto abort_result = []() {
        TransportResult r;
        r.status = TransportStatus::ABORTED;
        r.error  = "aborted";
        return r;
    };

    {
        std::unique_lock<std::mutex> lk(mutex_);
        while (is_held_locked(request.url)) {
            cv_.wait_for(lk, std::chrono::milliseconds(5));
            if (!is_held_locked(request.url)) break;
            lk.unlock();
            bool stop = aborted();
            lk.lock();
            if (stop) {
                lk.unlock();
                return finish(abort_result());
            }
        }
    }

    u64 deadline = utils::steady_ms() + resp.delay_ms;
    while (utils::steady_ms() < deadline) {
        if (aborted()) return finish(abort_result());
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    if (aborted()) return finish(abort_result());

    if (resp.throw_error) {
        finish(TransportResult{});
        throw std::runtime_error("MockTransport: scripted exception for " + request.url);
    }

    TransportResult r;
    r.status      = resp.status;
    r.http_status = resp.status == TransportStatus::OK ? resp.http_status : 0;
    r.headers     = resp.headers;
    if (resp.status == TransportStatus::OK) {
        r.body.assign(resp.body.begin(), resp.body.end());
        if (progress && !r.body.empty()) {
            progress(ProgressDirection::DOWNLOAD, r.body.size() / 2, r.body.size());
            progress(ProgressDirection::DOWNLOAD, r.body.size(), r.body.size());
        }
        if (progress && !request.body.empty()) {
            progress(ProgressDirection::UPLOAD, request.body.size(), request.body.size());
        }
    } else {
        r.error = std::string("scripted ") + transport_status_name(resp.status);
    }
    return finish(std::move(r));
}

size_t MockTransport::call_count(const std::string& url) const {
    std::lock_guard<std::mutex> lk(mutex_);
    size_t n = 0;
    for (auto& kv : calls_) {
        if (kv.first == url || strip_query(kv.first) == url) n += kv.second;
    }
    return n;
}

size_t MockTransport::total_calls() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return requests_.size();
}

int MockTransport::in_flight() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return in_flight_;
}

int MockTransport::max_concurrent() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return max_concurrent_;
}

std::vector<TransportRequest> MockTransport::requests() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return requests_;
}

bool MockTransport::wait_for_calls(size_t n, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [&] { return requests_.size() >= n; });
}

bool MockTransport::wait_for_in_flight(int n, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lk(mutex_);
    return cv_.wait_for(lk, timeout, [&] { return in_flight_ == n; });
}
