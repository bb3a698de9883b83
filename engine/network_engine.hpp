#pragma once

// ============================================================
// network_engine.hpp -- Operation queue engine
//
// Flow:
//   operation() builds -> enqueue() dedups or queues ->
//   admission under the reachability cap -> worker runs the
//   transport call -> classification -> terminal transition ->
//   callbacks on the callback executor -> next admission
//
// All queue state lives behind one mutex. Transport I/O and user
// callbacks always run with it released. Lock order is engine
// mutex, then an operation's own mutex, never the reverse.
// ============================================================

#include "concurrency_controller.hpp"
#include "dedup_index.hpp"
#include "engine_config.hpp"
#include "file_encryptor.hpp"
#include "network_operation.hpp"
#include "reachability_monitor.hpp"
#include "response_classifier.hpp"
#include "session_context.hpp"
#include "transport.hpp"
#include "../common/thread_pool.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

enum class EngineEventType {
    REACHABILITY_CHANGED,
    CANCELLED_ALL,
    SUSPENDED,
    RESUMED,
};

struct EngineEvent {
    EngineEventType type;
    NetworkStatus   status;   // status at the time of the event
};

class NetworkEngine;

using EngineListener          = std::function<void(const EngineEvent&)>;
using SessionRefreshHandler   = std::function<void(NetworkEngine&)>;
using ReachabilityHandler     = std::function<void(NetworkStatus)>;

class NetworkEngine {
public:
    NetworkEngine(std::shared_ptr<Transport> transport, EngineConfig config = EngineConfig{});
    ~NetworkEngine();

    NetworkEngine(const NetworkEngine&) = delete;
    NetworkEngine& operator=(const NetworkEngine&) = delete;

    // ---- Builders (construction only, nothing is queued) ----
    // Throws std::invalid_argument for an empty url or a relative url
    // with neither a session host nor a remote host to resolve it.
    OperationPtr operation(const std::string& url, const Params& params = {},
                           HttpMethod method = HttpMethod::HTTP_GET, bool use_ssl = true);
    OperationPtr get(const std::string& url, const Params& params = {});
    OperationPtr post(const std::string& url, const Params& params = {});
    OperationPtr put(const std::string& url, const Params& params = {});
    OperationPtr del(const std::string& url, const Params& params = {});
    OperationPtr patch(const std::string& url, const Params& params = {});
    OperationPtr head(const std::string& url, const Params& params = {});

    // ---- Queue ----
    // Returns the operation that will deliver op's callbacks: op itself,
    // or an identical non-terminal one that adopted op's handlers.
    // Throws std::logic_error if op is not Pending.
    OperationPtr enqueue(const OperationPtr& op);

    OperationPtr active_operation(const std::string& url, const Params& params = {},
                                  HttpMethod method = HttpMethod::HTTP_GET,
                                  bool use_ssl = true) const;
    std::vector<OperationPtr> operations_with_tag(const std::string& tag) const;
    bool has_pending_operations_with_tag(const std::string& tag) const;

    void cancel_all_operations();
    void cancel_all_operations_with_tag(const std::string& tag);

    void suspend_all_operations();
    void resume_all_operations();
    bool is_suspended() const;

    void application_did_enter_background();
    void application_will_enter_foreground();

    // Drops every operation without invoking any callback
    void cleanup();

    size_t pending_count() const;
    size_t running_count() const;
    size_t waiting_for_token_count() const;

    // ---- Session and access token ----
    void set_session(SessionContext ctx);
    std::shared_ptr<const SessionContext> session() const { return session_.snapshot(); }

    // Signalled once per burst of operations that need a new token
    void set_session_refresh_handler(SessionRefreshHandler handler);
    void session_refreshed(SessionContext ctx);
    void session_refresh_failed(const NetworkError& error);

    void fail_operations_waiting_for_access_token(const NetworkError& error);
    void replay_operations_waiting_for_access_token();

    // ---- Requests ----
    // Applied to every request after the built-in headers; empty value removes
    void set_header_value(const std::string& key, const std::string& value);
    void set_file_encryptor(std::shared_ptr<FileEncryptor> encryptor);

    // ---- Reachability ----
    void set_network_status(NetworkStatus status);
    void start_reachability_polling(std::unique_ptr<ReachabilityProbe> probe,
                                    std::chrono::milliseconds interval);
    NetworkStatus network_status() const { return reachability_.current(); }
    bool is_reachable() const { return network_status() != NetworkStatus::NOT_REACHABLE; }
    int current_cap() const { return concurrency_.current_cap(); }
    void set_reachability_changed_handler(ReachabilityHandler handler);
    ReachabilityMonitor& reachability() { return reachability_; }

    // ---- Events ----
    u64 subscribe(EngineListener listener);
    void unsubscribe(u64 id);

    const EngineConfig& config() const { return config_; }

private:
    struct PendingKey {
        int neg_priority;   // higher priority sorts first
        u64 seq;
        bool operator<(const PendingKey& o) const {
            return neg_priority != o.neg_priority ? neg_priority < o.neg_priority : seq < o.seq;
        }
    };

    // Callbacks owed to the caller for one terminal transition
    struct Delivery {
        OperationPtr                     op;
        OperationState                   terminal{OperationState::COMPLETED};
        std::optional<NetworkError>      error;
        NetworkOperation::CallbackSet    callbacks;
    };

    // Download written next to its destination, committed only by settle()
    struct StagedDownload {
        std::string                     part_path;
        std::string                     dest;
        std::shared_ptr<FileEncryptor>  encryptor;
    };

    std::string resolve_url(const std::string& url, bool use_ssl) const;
    TransportRequest build_request(NetworkOperation& op, const SessionContext& session) const;

    // Worker side
    void execute(const OperationPtr& op, u64 attempt);
    void complete(const OperationPtr& op, u64 attempt, TransportResult result);
    void settle(const OperationPtr& op, u64 attempt, Classification c,
                const TransportResult* result, StagedDownload staged);

    // Require mutex_ held
    void admit_locked();
    void abandon_locked(const OperationPtr& op);
    void resize_workers_locked();
    PendingKey key_for(const NetworkOperation& op) const;
    void remove_everywhere_locked(const OperationPtr& op);
    Delivery terminate_locked(const OperationPtr& op, OperationState terminal,
                              std::optional<NetworkError> error);
    bool request_refresh_locked();
    std::vector<Delivery> cancel_locked(const std::vector<OperationPtr>& ops);
    std::vector<Delivery> expire_locked(u64 now_ms);

    // Require mutex_ released
    void dispatch(Delivery d);
    void signal_refresh();
    void emit(EngineEventType type);
    void on_reachability_changed(NetworkStatus status);
    void watchdog_loop();

    static void run_callbacks(const Delivery& d);

    const EngineConfig          config_;
    std::shared_ptr<Transport>  transport_;
    SessionStore                session_;
    ConcurrencyController       concurrency_;
    ReachabilityMonitor         reachability_;

    mutable std::mutex                          mutex_;
    std::map<PendingKey, OperationPtr>          pending_;
    std::unordered_map<std::string, OperationPtr> running_;   // fingerprint -> op
    std::vector<OperationPtr>                   waiting_for_token_;
    // Left running() while their worker may still be inside perform()
    std::set<const NetworkOperation*>           abandoned_;
    DedupIndex                                  index_;
    u64                                         next_seq_{0};
    bool                                        suspended_{false};
    bool                                        background_suspended_{false};
    bool                                        refresh_requested_{false};
    Headers                                     headers_;
    std::shared_ptr<FileEncryptor>              encryptor_;
    SessionRefreshHandler                       refresh_handler_;
    ReachabilityHandler                         reachability_handler_;
    std::map<u64, EngineListener>               listeners_;
    u64                                         next_listener_id_{1};

    std::atomic<bool>        stopping_{false};
    std::condition_variable  watchdog_cv_;
    std::thread              watchdog_;

    ThreadPool workers_;
    ThreadPool callbacks_;
};
