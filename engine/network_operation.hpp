#pragma once

// ============================================================
// network_operation.hpp -- One unit of remote work
//
// Lifecycle:
//   PENDING -> EXECUTING -> COMPLETED | FAILED | CANCELLED | TIMED_OUT
//
// Only NetworkEngine moves an operation between states. Callers
// configure it before enqueueing and read the response after one
// of their callbacks fired.
// ============================================================

#include "network_types.hpp"
#include "retry_policy.hpp"
#include "transport.hpp"
#include <json/json.h>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class NetworkOperation;
class FileEncryptor;
using OperationPtr = std::shared_ptr<NetworkOperation>;

using CompletionCallback = std::function<void(const OperationPtr&)>;
using ErrorCallback      = std::function<void(const NetworkError&)>;
using CancelCallback     = std::function<void(const OperationPtr&)>;
using ProgressCallback   = std::function<void(double)>;   // 0.0 .. 1.0
using BodyEncoder        = std::function<std::string(const Params&)>;
using ParamList          = std::vector<std::pair<std::string, std::string>>;   // keys may repeat

// Alternative to callbacks; held weakly by the operation. Every hook
// runs on the engine's callback executor.
class OperationObserver {
public:
    virtual ~OperationObserver() = default;
    virtual void did_finish(NetworkOperation&) {}
    virtual void did_fail(NetworkOperation&, const NetworkError&) {}
    virtual void did_cancel(NetworkOperation&) {}
    virtual void did_timeout(NetworkOperation&) {}
};

// A file attached as multipart/form-data
struct FilePart {
    std::vector<u8> data;
    std::string     param_name;   // may be empty
    std::string     file_name;
    std::string     mime_type;    // empty -> application/octet-stream
};

class NetworkOperation : public std::enable_shared_from_this<NetworkOperation> {
public:
    // url must be absolute; NetworkEngine::operation() resolves relative ones
    NetworkOperation(HttpMethod method, std::string url, Params params, bool use_ssl);

    // ---- Identity (fixed at construction) ----
    const std::string& unique_identifier() const { return fingerprint_; }
    HttpMethod method() const { return method_; }
    const std::string& url() const { return url_; }
    const Params& params() const { return params_; }
    bool use_ssl() const { return use_ssl_; }

    // Fingerprint of (method, canonical url, canonical params). Every query
    // pair and every param counts, sorted by key then value.
    static std::string compute_fingerprint(HttpMethod method, const std::string& url,
                                           const Params& params);
    // Lowercase scheme/host, default port dropped, no query or fragment.
    // Query pairs found in url are appended to query_out, repeats included.
    static std::string canonical_url(const std::string& url, ParamList& query_out);

    // ---- Configuration ----
    void set_tag(const std::string& tag);
    std::string tag() const;

    void set_timeout_ms(u32 ms);
    u32 timeout_ms() const;

    void set_retry_policy(const RetryPolicy& p);
    RetryPolicy retry_policy() const;

    void set_cache_policy(CachePolicy p);
    CachePolicy cache_policy() const;

    void set_requires_access_token(bool v);
    bool requires_access_token() const;

    void set_encrypt_downloaded_file(bool v);
    bool encrypt_downloaded_file() const;

    void set_download_destination(const std::string& path);
    std::string download_destination() const;

    void set_local_test_data_path(const std::string& path);
    std::string local_test_data_path() const;

    void set_priority(OperationPriority p);
    OperationPriority priority() const;

    void set_expected_download_size(u64 bytes);
    u64 expected_download_size() const;

    // Empty value removes the header
    void set_header_value(const std::string& key, const std::string& value);
    Headers custom_headers() const;

    // Replaces form encoding of params for POST/PUT/PATCH bodies
    void set_body_encoder(BodyEncoder encoder, const std::string& content_type);
    void add_file_part(FilePart part);
    // Reads the file now; the part is named after the file. Throws
    // std::runtime_error if it cannot be read.
    void add_file(const std::string& path, const std::string& param_name,
                  const std::string& mime_type = "");

    // ---- Callback registration (insertion-ordered, repeatable) ----
    void add_completion_handler(CompletionCallback on_complete, ErrorCallback on_error);
    void add_cancel_handler(CancelCallback on_cancel);
    void add_upload_progress_handler(ProgressCallback cb);
    void add_download_progress_handler(ProgressCallback cb);
    void add_observer(std::weak_ptr<OperationObserver> observer);

    // ---- Runtime state ----
    OperationState state() const;
    bool is_finished() const { return is_terminal(state()); }
    u32 retry_count() const;
    int status_code() const;
    Headers response_headers() const;
    std::optional<NetworkError> error() const;

    // ---- Response accessors; empty until the operation is finished ----
    std::optional<std::vector<u8>> response_data() const;
    std::optional<std::string> response_string() const;
    std::optional<Json::Value> response_json() const;

    // ---- Request rendering ----
    // url plus the query string for GET/HEAD/DELETE
    std::string request_url() const;
    // Body for POST/PUT/PATCH; content_type receives the matching header
    std::string encoded_body(std::string& content_type) const;

private:
    friend class NetworkEngine;

    struct CallbackSet {
        std::vector<CompletionCallback>  completions;
        std::vector<ErrorCallback>       errors;
        std::vector<CancelCallback>      cancels;
        std::vector<std::weak_ptr<OperationObserver>> observers;
    };

    // -- engine-only mutators; the engine holds its own lock around these --
    u64 begin_execution(u64 now_ms);
    void return_to_pending(bool count_retry);
    void store_response(const TransportResult& result);
    void store_downloaded_file(const std::string& path, std::shared_ptr<FileEncryptor> encryptor);
    CallbackSet finish(OperationState terminal, std::optional<NetworkError> err);
    void adopt_handlers_from(NetworkOperation& other);
    bool is_current_attempt(u64 attempt) const;
    bool retry_allowed(u64 now_ms, u64 unlimited_ceiling_ms) const;
    u64 admitted_ms() const;
    void notify_progress(ProgressDirection dir, u64 done, u64 total);

    std::string build_multipart(const std::string& boundary) const;

    // Immutable identity
    const HttpMethod  method_;
    const std::string url_;
    const Params      params_;
    const bool        use_ssl_;
    const std::string fingerprint_;

    mutable std::mutex mutex_;

    // Configuration
    std::string       tag_;
    u32               timeout_ms_{180000};
    RetryPolicy       retry_;
    CachePolicy       cache_policy_{CachePolicy::RELOAD_IGNORING_LOCAL_CACHE};
    bool              requires_access_token_{true};
    bool              encrypt_downloaded_file_{true};
    std::string       download_destination_;
    std::string       local_test_data_path_;
    OperationPriority priority_{OperationPriority::NORMAL};
    u64               expected_download_size_{0};
    Headers           headers_;
    BodyEncoder       body_encoder_;
    std::string       body_content_type_;
    std::vector<FilePart> files_;

    // Callbacks
    CallbackSet                   callbacks_;
    std::vector<ProgressCallback> upload_progress_;
    std::vector<ProgressCallback> download_progress_;

    // Runtime
    OperationState              state_{OperationState::PENDING};
    u64                         attempt_{0};
    u32                         retries_{0};
    u64                         first_admitted_ms_{0};
    u64                         admitted_ms_{0};
    u64                         queue_seq_{0};      // FIFO position, kept across retries
    int                         status_code_{0};
    Headers                     response_headers_;
    std::vector<u8>             body_;
    std::string                 stored_file_;       // set when body went to disk
    std::shared_ptr<FileEncryptor> file_encryptor_;
    std::optional<NetworkError> error_;
};
