// ============================================================
// network_engine.cpp
// ============================================================

#include "network_engine.hpp"
#include "../common/file_io.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <stdexcept>

static EngineConfig validated(EngineConfig cfg) {
    validate_engine_config(cfg);
    return cfg;
}

static std::string describe_op(const NetworkOperation& op) {
    return std::string(method_name(op.method())) + " " + op.url();
}

// ---------------------------------------------------------------
// Construction / teardown
// ---------------------------------------------------------------

NetworkEngine::NetworkEngine(std::shared_ptr<Transport> transport, EngineConfig config)
    : config_(validated(std::move(config)))
    , transport_(std::move(transport))
    , concurrency_(config_.wifi_max_concurrent, config_.cellular_max_concurrent,
                   config_.initial_network_status)
    , reachability_(config_.initial_network_status)
    , headers_(config_.custom_headers)
    , workers_((size_t)std::max(1, concurrency_.current_cap()))
    , callbacks_((size_t)config_.callback_threads)
{
    if (!transport_) throw std::invalid_argument("NetworkEngine requires a transport");

    if (!config_.log_level.empty()) Logger::get().set_level_name(config_.log_level);
    if (!config_.log_file.empty())  Logger::get().set_log_file(config_.log_file);
    if (!config_.operation_error_log.empty()) {
        Logger::get().set_operation_error_file(config_.operation_error_log);
    }

    if (config_.initial_session.has_host() || !config_.initial_session.access_token.empty()) {
        session_.replace(config_.initial_session);
    }

    reachability_.set_listener([this](NetworkStatus s) { on_reachability_changed(s); });
    watchdog_ = std::thread([this]() { watchdog_loop(); });

    LOG_DEBUG(std::string("NetworkEngine started (") + status_name(concurrency_.status()) +
              ", cap " + std::to_string(concurrency_.current_cap()) + ")");
}

NetworkEngine::~NetworkEngine() {
    reachability_.stop_polling();
    reachability_.set_listener(nullptr);
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stopping_ = true;
    }
    watchdog_cv_.notify_all();
    if (watchdog_.joinable()) watchdog_.join();

    // Queued executions see stopping_ and return without touching the queue
    workers_.shutdown();
    callbacks_.shutdown();
}

// ---------------------------------------------------------------
// Builders
// ---------------------------------------------------------------

std::string NetworkEngine::resolve_url(const std::string& url, bool use_ssl) const {
    if (url.empty()) throw std::invalid_argument("Operation url is empty");

    std::string lower = utils::to_lower(url);
    if (utils::starts_with(lower, "http://") || utils::starts_with(lower, "https://")) {
        return url;
    }

    if (!config_.remote_host.empty()) {
        std::string base = config_.remote_host;
        std::string lb   = utils::to_lower(base);
        if (!utils::starts_with(lb, "http://") && !utils::starts_with(lb, "https://")) {
            base = (use_ssl ? "https://" : "http://") + base;
        }
        while (!base.empty() && base.back() == '/') base.pop_back();
        return base + (url[0] == '/' ? "" : "/") + url;
    }

    auto s = session_.snapshot();
    if (!s->has_host()) {
        throw std::invalid_argument("Cannot resolve relative url without a host: " + url);
    }
    std::string base = s->instance_url(use_ssl);
    if (url[0] == '/') return base + url;

    std::string api = s->api_path;
    if (!api.empty() && api[0] != '/') api = "/" + api;
    while (!api.empty() && api.back() == '/') api.pop_back();
    return base + api + "/" + url;
}

OperationPtr NetworkEngine::operation(const std::string& url, const Params& params,
                                      HttpMethod method, bool use_ssl)
{
    auto op = std::make_shared<NetworkOperation>(method, resolve_url(url, use_ssl), params, use_ssl);
    op->set_timeout_ms(config_.operation_timeout_ms);
    op->set_retry_policy(config_.retry);
    op->set_cache_policy(config_.cache_policy);
    op->set_encrypt_downloaded_file(config_.encrypt_downloaded_file);
    op->set_requires_access_token(config_.remote_host.empty());
    return op;
}

OperationPtr NetworkEngine::get(const std::string& url, const Params& params) {
    return operation(url, params, HttpMethod::HTTP_GET);
}

OperationPtr NetworkEngine::post(const std::string& url, const Params& params) {
    return operation(url, params, HttpMethod::HTTP_POST);
}

OperationPtr NetworkEngine::put(const std::string& url, const Params& params) {
    return operation(url, params, HttpMethod::HTTP_PUT);
}

OperationPtr NetworkEngine::del(const std::string& url, const Params& params) {
    return operation(url, params, HttpMethod::HTTP_DELETE);
}

OperationPtr NetworkEngine::patch(const std::string& url, const Params& params) {
    return operation(url, params, HttpMethod::HTTP_PATCH);
}

OperationPtr NetworkEngine::head(const std::string& url, const Params& params) {
    return operation(url, params, HttpMethod::HTTP_HEAD);
}

// ---------------------------------------------------------------
// Queue
// ---------------------------------------------------------------

OperationPtr NetworkEngine::enqueue(const OperationPtr& op) {
    if (!op) throw std::invalid_argument("Cannot enqueue a null operation");
    if (op->state() != OperationState::PENDING) {
        throw std::logic_error(std::string("Cannot enqueue operation in state ") +
                               state_name(op->state()) + ": " + describe_op(*op));
    }

    std::lock_guard<std::mutex> lk(mutex_);
    if (stopping_) {
        LOG_WARN("Engine is shutting down, not enqueueing " + describe_op(*op));
        return op;
    }

    if (auto existing = index_.find(op->unique_identifier())) {
        if (existing != op) {
            existing->adopt_handlers_from(*op);
            LOG_DEBUG("Attached to in-flight " + describe_op(*existing));
        }
        return existing;
    }

    op->queue_seq_ = next_seq_++;
    index_.insert(op);
    pending_.emplace(key_for(*op), op);
    LOG_DEBUG("Queued " + describe_op(*op) + " [" + op->unique_identifier() + "]");
    admit_locked();
    return op;
}

OperationPtr NetworkEngine::active_operation(const std::string& url, const Params& params,
                                             HttpMethod method, bool use_ssl) const
{
    std::string fp = NetworkOperation::compute_fingerprint(method, resolve_url(url, use_ssl), params);
    std::lock_guard<std::mutex> lk(mutex_);
    return index_.find(fp);
}

std::vector<OperationPtr> NetworkEngine::operations_with_tag(const std::string& tag) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return index_.with_tag(tag);
}

bool NetworkEngine::has_pending_operations_with_tag(const std::string& tag) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return index_.has_tag(tag);
}

size_t NetworkEngine::pending_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return pending_.size();
}

size_t NetworkEngine::running_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return running_.size();
}

size_t NetworkEngine::waiting_for_token_count() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return waiting_for_token_.size();
}

NetworkEngine::PendingKey NetworkEngine::key_for(const NetworkOperation& op) const {
    return PendingKey{-(int)op.priority(), op.queue_seq_};
}

void NetworkEngine::admit_locked() {
    if (suspended_ || stopping_) return;

    int cap = concurrency_.current_cap();
    while (!pending_.empty() && (int)running_.size() < cap) {
        auto it = pending_.begin();
        OperationPtr op = it->second;
        pending_.erase(it);

        u64 attempt = op->begin_execution(utils::steady_ms());
        running_[op->unique_identifier()] = op;
        LOG_DEBUG("Admitted " + describe_op(*op) + " (attempt " + std::to_string(attempt) +
                  ", running " + std::to_string(running_.size()) + "/" + std::to_string(cap) + ")");
        try {
            workers_.post([this, op, attempt]() {
                execute(op, attempt);
                std::lock_guard<std::mutex> lk(mutex_);
                if (abandoned_.erase(op.get()) > 0) resize_workers_locked();
            });
        } catch (const std::exception& e) {
            LOG_ERROR("Cannot schedule " + describe_op(*op) + ": " + e.what());
            running_.erase(op->unique_identifier());
            op->return_to_pending(false);
            pending_.emplace(key_for(*op), op);
            return;
        }
    }
}

// A worker stuck in a transport call that nobody waits for any more still
// holds a pool thread, so the pool grows by one until that call returns.
void NetworkEngine::abandon_locked(const OperationPtr& op) {
    if (abandoned_.insert(op.get()).second) resize_workers_locked();
}

void NetworkEngine::resize_workers_locked() {
    if (stopping_) return;
    workers_.resize((size_t)std::max(1, concurrency_.current_cap()) + abandoned_.size());
}

void NetworkEngine::remove_everywhere_locked(const OperationPtr& op) {
    for (auto it = pending_.begin(); it != pending_.end(); ++it) {
        if (it->second == op) {
            pending_.erase(it);
            break;
        }
    }
    auto r = running_.find(op->unique_identifier());
    if (r != running_.end() && r->second == op) {
        running_.erase(r);
        abandon_locked(op);
    }

    waiting_for_token_.erase(
        std::remove(waiting_for_token_.begin(), waiting_for_token_.end(), op),
        waiting_for_token_.end());
    index_.erase(op);
}

NetworkEngine::Delivery NetworkEngine::terminate_locked(const OperationPtr& op,
                                                        OperationState terminal,
                                                        std::optional<NetworkError> error)
{
    index_.erase(op);

    if (error && (terminal == OperationState::FAILED || terminal == OperationState::TIMED_OUT)) {
        Logger::get().operation_error(describe_op(*op) + " -> " + state_name(terminal) +
                                      ": " + describe(*error));
    }

    Delivery d;
    d.op        = op;
    d.terminal  = terminal;
    d.error     = error;
    d.callbacks = op->finish(terminal, std::move(error));
    return d;
}

// ---------------------------------------------------------------
// Execution
// ---------------------------------------------------------------

TransportRequest NetworkEngine::build_request(NetworkOperation& op,
                                              const SessionContext& session) const
{
    TransportRequest req;
    req.method       = op.method();
    req.url          = op.request_url();
    req.timeout_ms   = op.timeout_ms();
    req.cache_policy = op.cache_policy();

    req.headers["User-Agent"] = config_.user_agent.empty() ? default_user_agent()
                                                           : config_.user_agent;
    if (op.requires_access_token() && !session.access_token.empty()) {
        req.headers["Authorization"] = "Bearer " + session.access_token;
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& kv : headers_) req.headers[kv.first] = kv.second;
    }
    for (auto& kv : op.custom_headers()) req.headers[kv.first] = kv.second;

    std::string content_type;
    req.body = op.encoded_body(content_type);
    if (!content_type.empty() && !req.headers.count("Content-Type")) {
        req.headers["Content-Type"] = content_type;
    }
    return req;
}

void NetworkEngine::execute(const OperationPtr& op, u64 attempt) {
    if (stopping_ || !op->is_current_attempt(attempt)) return;

    auto session = session_.snapshot();
    if (op->requires_access_token() && session->access_token.empty()) {
        Classification c;
        c.outcome = Outcome::AUTH_ERROR;
        c.error   = NetworkError{ErrorKind::AUTH, ERR_MISSING_TOKEN, "No access token", ""};
        LOG_INFO("No access token for " + describe_op(*op) + ", waiting for a session refresh");
        settle(op, attempt, std::move(c), nullptr, StagedDownload{});
        return;
    }

    std::string test_path = op->local_test_data_path();
    if (config_.support_local_test_data && !test_path.empty()) {
        TransportResult result;
        try {
            result.body        = file_io::read_small_file(test_path);
            result.status      = TransportStatus::OK;
            result.http_status = 200;
        } catch (const std::exception& e) {
            Classification c;
            c.outcome = Outcome::SERVER_ERROR;
            c.error   = NetworkError{ErrorKind::SERVER, ERR_LOCAL_TEST_DATA, e.what(), ""};
            settle(op, attempt, std::move(c), nullptr, StagedDownload{});
            return;
        }
        LOG_DEBUG("Serving " + describe_op(*op) + " from " + test_path);
        complete(op, attempt, std::move(result));
        return;
    }

    TransportRequest req = build_request(*op, *session);
    TransportProgress progress = [op](ProgressDirection dir, u64 done, u64 total) {
        op->notify_progress(dir, done, total);
    };
    AbortCheck should_abort = [this, op, attempt]() {
        return stopping_.load() || !op->is_current_attempt(attempt);
    };

    TransportResult result;
    try {
        result = transport_->perform(req, progress, should_abort);
    } catch (const std::exception& e) {
        result = TransportResult{};
        result.status = TransportStatus::IO_ERROR;
        result.error  = e.what();
    }
    complete(op, attempt, std::move(result));
}

void NetworkEngine::complete(const OperationPtr& op, u64 attempt, TransportResult result) {
    Classification c = classify_response(result, op->requires_access_token(),
                                         config_.auth_error_codes);
    LOG_DEBUG(describe_op(*op) + " -> HTTP " + std::to_string(result.http_status) + " " +
              outcome_name(c.outcome));

    StagedDownload staged;
    std::string dest = op->download_destination();
    if (c.outcome == Outcome::COMPLETED && !dest.empty() && op->is_current_attempt(attempt)) {
        std::shared_ptr<FileEncryptor> encryptor;
        if (op->encrypt_downloaded_file()) {
            std::lock_guard<std::mutex> lk(mutex_);
            encryptor = encryptor_;
        }
        try {
            if (encryptor) {
                staged.part_path = file_io::write_part_file(dest, encryptor->encrypt(result.body));
            } else {
                staged.part_path = file_io::write_part_file(dest, result.body);
            }
            staged.dest      = dest;
            staged.encryptor = std::move(encryptor);
        } catch (const std::exception& e) {
            c.outcome = Outcome::SERVER_ERROR;
            c.error   = NetworkError{ErrorKind::SERVER, ERR_STORAGE,
                                     std::string("Cannot store download: ") + e.what(), ""};
        }
    }

    settle(op, attempt, std::move(c), &result, std::move(staged));
}

void NetworkEngine::settle(const OperationPtr& op, u64 attempt, Classification c,
                           const TransportResult* result, StagedDownload staged)
{
    Delivery delivery;
    bool refresh = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto it = running_.find(op->unique_identifier());
        if (stopping_ || it == running_.end() || it->second != op ||
            !op->is_current_attempt(attempt)) {
            if (!staged.part_path.empty()) file_io::discard_part_file(staged.part_path);
            if (!stopping_) LOG_DEBUG("Discarding late result for " + describe_op(*op));
            return;
        }
        running_.erase(it);
        if (result) op->store_response(*result);

        // A download reaches dest only for the attempt that is still current
        if (!staged.part_path.empty()) {
            try {
                file_io::commit_part_file(staged.part_path, staged.dest);
                op->store_downloaded_file(staged.dest, std::move(staged.encryptor));
            } catch (const std::exception& e) {
                c.outcome = Outcome::SERVER_ERROR;
                c.error   = NetworkError{ErrorKind::SERVER, ERR_STORAGE,
                                         std::string("Cannot store download: ") + e.what(), ""};
            }
        }

        if (c.outcome == Outcome::ABORTED) {
            // Transport gave up on its own while the attempt was still wanted
            c.outcome = Outcome::NETWORK_ERROR;
            c.error   = NetworkError{ErrorKind::NETWORK, ERR_TRANSPORT, "Transfer aborted", ""};
        }

        switch (c.outcome) {
            case Outcome::NETWORK_ERROR: {
                u64 ceiling = (u64)config_.unlimited_retry_ceiling_secs * 1000;
                if (op->retry_allowed(utils::steady_ms(), ceiling)) {
                    op->return_to_pending(true);
                    pending_.emplace(key_for(*op), op);
                    LOG_INFO("Retrying " + describe_op(*op) + " (retry " +
                             std::to_string(op->retry_count()) + "): " + describe(*c.error));
                } else {
                    delivery = terminate_locked(op, OperationState::FAILED, std::move(c.error));
                }
                break;
            }
            case Outcome::AUTH_ERROR:
                op->return_to_pending(false);
                waiting_for_token_.push_back(op);
                refresh = request_refresh_locked();
                break;
            case Outcome::SERVER_ERROR:
                delivery = terminate_locked(op, OperationState::FAILED, std::move(c.error));
                break;
            case Outcome::TIMED_OUT:
                delivery = terminate_locked(op, OperationState::TIMED_OUT, std::move(c.error));
                break;
            case Outcome::COMPLETED:
            case Outcome::ABORTED:
                delivery = terminate_locked(op, OperationState::COMPLETED, std::nullopt);
                break;
        }

        admit_locked();
    }

    dispatch(std::move(delivery));
    if (refresh) signal_refresh();
}

// ---------------------------------------------------------------
// Callback delivery
// ---------------------------------------------------------------

void NetworkEngine::run_callbacks(const Delivery& d) {
    NetworkOperation& op = *d.op;
    auto guarded = [&op](const char* what, const std::function<void()>& fn) {
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR(std::string(what) + " for " + describe_op(op) + " threw: " + e.what());
        }
    };

    switch (d.terminal) {
        case OperationState::COMPLETED:
            for (auto& cb : d.callbacks.completions) {
                guarded("Completion handler", [&] { cb(d.op); });
            }
            break;
        case OperationState::FAILED:
        case OperationState::TIMED_OUT:
            for (auto& cb : d.callbacks.errors) {
                guarded("Error handler", [&] { cb(*d.error); });
            }
            break;
        case OperationState::CANCELLED:
            for (auto& cb : d.callbacks.cancels) {
                guarded("Cancel handler", [&] { cb(d.op); });
            }
            break;
        default:
            break;
    }

    for (auto& weak : d.callbacks.observers) {
        auto obs = weak.lock();
        if (!obs) continue;
        guarded("Observer", [&] {
            switch (d.terminal) {
                case OperationState::COMPLETED: obs->did_finish(op); break;
                case OperationState::FAILED:    obs->did_fail(op, *d.error); break;
                case OperationState::TIMED_OUT: obs->did_timeout(op); break;
                case OperationState::CANCELLED: obs->did_cancel(op); break;
                default: break;
            }
        });
    }
}

void NetworkEngine::dispatch(Delivery d) {
    if (!d.op) return;
    try {
        callbacks_.post([d = std::move(d)]() { run_callbacks(d); });
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Dropping callbacks: ") + e.what());
    }
}

void NetworkEngine::signal_refresh() {
    SessionRefreshHandler handler;
    size_t waiting = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        handler = refresh_handler_;
        waiting = waiting_for_token_.size();
    }
    if (!handler) {
        LOG_WARN("Access token needed but no session refresh handler is set (" +
                 std::to_string(waiting) + " operation(s) waiting)");
        return;
    }
    LOG_INFO("Requesting session refresh (" + std::to_string(waiting) + " operation(s) waiting)");
    try {
        callbacks_.post([this, handler]() {
            try {
                handler(*this);
            } catch (const std::exception& e) {
                LOG_ERROR(std::string("Session refresh handler threw: ") + e.what());
            }
        });
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Cannot signal session refresh: ") + e.what());
    }
}

void NetworkEngine::emit(EngineEventType type) {
    std::vector<EngineListener> targets;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto& kv : listeners_) targets.push_back(kv.second);
    }
    if (targets.empty()) return;

    EngineEvent ev{type, reachability_.current()};
    try {
        callbacks_.post([targets, ev]() {
            for (auto& fn : targets) {
                try {
                    fn(ev);
                } catch (const std::exception& e) {
                    LOG_ERROR(std::string("Engine event listener threw: ") + e.what());
                }
            }
        });
    } catch (const std::exception& e) {
        LOG_WARN(std::string("Dropping engine event: ") + e.what());
    }
}

u64 NetworkEngine::subscribe(EngineListener listener) {
    std::lock_guard<std::mutex> lk(mutex_);
    u64 id = next_listener_id_++;
    listeners_[id] = std::move(listener);
    return id;
}

void NetworkEngine::unsubscribe(u64 id) {
    std::lock_guard<std::mutex> lk(mutex_);
    listeners_.erase(id);
}

// ---------------------------------------------------------------
// Cancellation
// ---------------------------------------------------------------

std::vector<NetworkEngine::Delivery> NetworkEngine::cancel_locked(const std::vector<OperationPtr>& ops) {
    std::vector<Delivery> out;
    for (auto& op : ops) {
        if (op->is_finished()) continue;
        remove_everywhere_locked(op);
        out.push_back(terminate_locked(op, OperationState::CANCELLED,
                                       NetworkError{ErrorKind::CANCELLED, ERR_CANCELLED,
                                                    "Operation cancelled", ""}));
    }
    admit_locked();
    return out;
}

void NetworkEngine::cancel_all_operations() {
    std::vector<Delivery> ds;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ds = cancel_locked(index_.all());
        refresh_requested_ = false;
    }
    LOG_INFO("Cancelled " + std::to_string(ds.size()) + " operation(s)");
    for (auto& d : ds) dispatch(std::move(d));
    emit(EngineEventType::CANCELLED_ALL);
}

void NetworkEngine::cancel_all_operations_with_tag(const std::string& tag) {
    std::vector<Delivery> ds;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ds = cancel_locked(index_.with_tag(tag));
        if (waiting_for_token_.empty()) refresh_requested_ = false;
    }
    LOG_INFO("Cancelled " + std::to_string(ds.size()) + " operation(s) tagged '" + tag + "'");
    for (auto& d : ds) dispatch(std::move(d));
}

void NetworkEngine::cleanup() {
    std::lock_guard<std::mutex> lk(mutex_);
    size_t n = index_.size();
    NetworkError err{ErrorKind::CANCELLED, ERR_CANCELLED, "Engine cleanup", ""};
    for (auto& kv : running_) abandon_locked(kv.second);
    for (auto& op : index_.all()) {
        op->finish(OperationState::CANCELLED, err);
    }
    pending_.clear();
    running_.clear();
    waiting_for_token_.clear();
    index_.clear();
    refresh_requested_ = false;
    LOG_INFO("Engine cleanup dropped " + std::to_string(n) + " operation(s)");
}

// ---------------------------------------------------------------
// Suspension
// ---------------------------------------------------------------

void NetworkEngine::suspend_all_operations() {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        changed = !suspended_;
        suspended_ = true;
    }
    if (!changed) return;
    LOG_INFO("Operations suspended");
    emit(EngineEventType::SUSPENDED);
}

void NetworkEngine::resume_all_operations() {
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        changed = suspended_;
        suspended_ = false;
        background_suspended_ = false;
        admit_locked();
    }
    if (!changed) return;
    LOG_INFO("Operations resumed");
    emit(EngineEventType::RESUMED);
}

bool NetworkEngine::is_suspended() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return suspended_;
}

void NetworkEngine::application_did_enter_background() {
    if (!config_.suspend_on_background) return;
    bool changed = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        changed = !suspended_;
        if (changed) {
            suspended_ = true;
            background_suspended_ = true;
        }
    }
    if (!changed) return;
    LOG_INFO("Entered background, operations suspended");
    emit(EngineEventType::SUSPENDED);
}

void NetworkEngine::application_will_enter_foreground() {
    bool ours = false;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        ours = background_suspended_;
    }
    // An explicit suspend_all_operations() stays in force
    if (ours) resume_all_operations();
}

// ---------------------------------------------------------------
// Session / access token
// ---------------------------------------------------------------

bool NetworkEngine::request_refresh_locked() {
    if (refresh_requested_) return false;
    refresh_requested_ = true;
    return true;
}

void NetworkEngine::set_session(SessionContext ctx) {
    session_.replace(std::move(ctx));
}

void NetworkEngine::set_session_refresh_handler(SessionRefreshHandler handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    refresh_handler_ = std::move(handler);
}

void NetworkEngine::session_refreshed(SessionContext ctx) {
    session_.replace(std::move(ctx));
    replay_operations_waiting_for_access_token();
}

void NetworkEngine::session_refresh_failed(const NetworkError& error) {
    fail_operations_waiting_for_access_token(error);
}

void NetworkEngine::fail_operations_waiting_for_access_token(const NetworkError& error) {
    std::vector<Delivery> ds;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        std::vector<OperationPtr> ops;
        ops.swap(waiting_for_token_);
        refresh_requested_ = false;
        for (auto& op : ops) {
            ds.push_back(terminate_locked(op, OperationState::FAILED, error));
        }
    }
    if (!ds.empty()) {
        LOG_WARN("Failed " + std::to_string(ds.size()) +
                 " operation(s) waiting for an access token: " + describe(error));
    }
    for (auto& d : ds) dispatch(std::move(d));
}

void NetworkEngine::replay_operations_waiting_for_access_token() {
    std::lock_guard<std::mutex> lk(mutex_);
    std::vector<OperationPtr> ops;
    ops.swap(waiting_for_token_);
    refresh_requested_ = false;
    for (auto& op : ops) {
        pending_.emplace(key_for(*op), op);
    }
    if (!ops.empty()) {
        LOG_INFO("Replaying " + std::to_string(ops.size()) + " operation(s) with a new session");
    }
    admit_locked();
}

// ---------------------------------------------------------------
// Requests
// ---------------------------------------------------------------

void NetworkEngine::set_header_value(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lk(mutex_);
    if (value.empty()) {
        headers_.erase(key);
    } else {
        headers_[key] = value;
    }
}

void NetworkEngine::set_file_encryptor(std::shared_ptr<FileEncryptor> encryptor) {
    std::lock_guard<std::mutex> lk(mutex_);
    encryptor_ = std::move(encryptor);
}

// ---------------------------------------------------------------
// Reachability
// ---------------------------------------------------------------

void NetworkEngine::set_network_status(NetworkStatus status) {
    reachability_.update(status);
}

void NetworkEngine::start_reachability_polling(std::unique_ptr<ReachabilityProbe> probe,
                                               std::chrono::milliseconds interval)
{
    reachability_.start_polling(std::move(probe), interval);
}

void NetworkEngine::set_reachability_changed_handler(ReachabilityHandler handler) {
    std::lock_guard<std::mutex> lk(mutex_);
    reachability_handler_ = std::move(handler);
}

void NetworkEngine::on_reachability_changed(NetworkStatus status) {
    concurrency_.set_status(status);
    ReachabilityHandler handler;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (stopping_) return;
        resize_workers_locked();
        admit_locked();
        handler = reachability_handler_;
    }

    if (handler) {
        try {
            callbacks_.post([handler, status]() {
                try {
                    handler(status);
                } catch (const std::exception& e) {
                    LOG_ERROR(std::string("Reachability handler threw: ") + e.what());
                }
            });
        } catch (const std::exception& e) {
            LOG_WARN(std::string("Dropping reachability handler call: ") + e.what());
        }
    }
    emit(EngineEventType::REACHABILITY_CHANGED);
}

// ---------------------------------------------------------------
// Timeout watchdog
// ---------------------------------------------------------------

std::vector<NetworkEngine::Delivery> NetworkEngine::expire_locked(u64 now_ms) {
    std::vector<OperationPtr> expired;
    for (auto& kv : running_) {
        const OperationPtr& op = kv.second;
        u32 limit = op->timeout_ms();
        if (limit > 0 && now_ms - op->admitted_ms() >= limit) expired.push_back(op);
    }

    std::vector<Delivery> out;
    for (auto& op : expired) {
        running_.erase(op->unique_identifier());
        abandon_locked(op);
        LOG_WARN(describe_op(*op) + " timed out after " + std::to_string(op->timeout_ms()) + " ms");
        out.push_back(terminate_locked(op, OperationState::TIMED_OUT,
                                       NetworkError{ErrorKind::TIMEOUT, ERR_TIMED_OUT,
                                                    "Operation timed out", ""}));
    }
    return out;
}

void NetworkEngine::watchdog_loop() {
    auto interval = std::chrono::milliseconds(config_.watchdog_interval_ms);
    std::unique_lock<std::mutex> lk(mutex_);
    while (!stopping_) {
        watchdog_cv_.wait_for(lk, interval);
        if (stopping_) break;

        auto ds = expire_locked(utils::steady_ms());
        if (ds.empty()) continue;
        admit_locked();

        lk.unlock();
        for (auto& d : ds) dispatch(std::move(d));
        lk.lock();
    }
}
