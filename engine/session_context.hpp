#pragma once

// ============================================================
// session_context.hpp -- Where to connect, as whom, with what
//   access token
// ============================================================

#include "../common/platform.hpp"
#include <memory>
#include <mutex>
#include <string>

struct SessionContext {
    std::string host;
    std::string organization_id;
    std::string user_id;
    u16         port{80};
    u16         ssl_port{443};
    std::string api_path;        // e.g. "/services/data/v28.0"
    std::string access_token;

    bool has_host() const { return !host.empty(); }

    // "https://host" or "http://host:8080"; default ports are omitted
    std::string instance_url(bool use_ssl) const;
};

// Holds the current session as an immutable snapshot. Readers keep the
// snapshot they took for the whole request, so a concurrent replace()
// is never observed half-applied.
class SessionStore {
public:
    SessionStore() : current_(std::make_shared<const SessionContext>()) {}

    std::shared_ptr<const SessionContext> snapshot() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return current_;
    }

    void replace(SessionContext ctx) {
        auto next = std::make_shared<const SessionContext>(std::move(ctx));
        std::lock_guard<std::mutex> lk(mutex_);
        current_ = std::move(next);
    }

    void clear() { replace(SessionContext{}); }

private:
    mutable std::mutex                    mutex_;
    std::shared_ptr<const SessionContext> current_;
};
