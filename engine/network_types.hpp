#pragma once

// ============================================================
// network_types.hpp -- Enums and value types shared by the
//   engine, its operations and the transport layer
// ============================================================

#include "../common/platform.hpp"
#include "../common/utils.hpp"
#include <map>
#include <string>
#include <stdexcept>

// ---- HTTP methods (prefixed HTTP_ to avoid Windows macro collisions) ----
enum class HttpMethod {
    HTTP_GET,
    HTTP_POST,
    HTTP_PUT,
    HTTP_DELETE,
    HTTP_PATCH,
    HTTP_HEAD,
};

// Values match the classic Reachability NetworkStatus numbering
enum class NetworkStatus {
    NOT_REACHABLE      = 0,
    REACHABLE_VIA_WWAN = 1,
    REACHABLE_VIA_WIFI = 2,
};

enum class OperationState {
    PENDING,
    EXECUTING,
    COMPLETED,
    FAILED,
    CANCELLED,
    TIMED_OUT,
};

enum class ErrorKind {
    NETWORK,    // connection/DNS/5xx class -- retryable per policy
    SERVER,     // valid response carrying an application-level error
    AUTH,       // access token missing or rejected
    CANCELLED,  // caller-initiated
    TIMEOUT,    // operation deadline exceeded
};

enum class CachePolicy {
    RELOAD_IGNORING_LOCAL_CACHE,
    USE_PROTOCOL_CACHE_POLICY,
    RETURN_CACHE_DATA_ELSE_LOAD,
    RETURN_CACHE_DATA_DONT_LOAD,
};

enum class OperationPriority : int {
    VERY_LOW  = -8,
    LOW       = -4,
    NORMAL    = 0,
    HIGH      = 4,
    VERY_HIGH = 8,
};

// Error codes carried in NetworkError::code when there is no HTTP status
static constexpr int ERR_TRANSPORT        = -1;
static constexpr int ERR_STORAGE          = -2;
static constexpr int ERR_MISSING_TOKEN    = -3;
static constexpr int ERR_CANCELLED        = -4;
static constexpr int ERR_TIMED_OUT        = -5;
static constexpr int ERR_LOCAL_TEST_DATA  = -6;

struct NetworkError {
    ErrorKind   kind{ErrorKind::NETWORK};
    int         code{0};     // HTTP status when available, otherwise ERR_*
    std::string message;
    std::string server_error_code;  // "errorCode" of a server error payload
};

// Header names compare case-insensitively
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const {
        return utils::to_lower(a) < utils::to_lower(b);
    }
};

using Params  = std::map<std::string, std::string>;
using Headers = std::map<std::string, std::string, CaseInsensitiveLess>;

inline const char* method_name(HttpMethod m) {
    switch (m) {
        case HttpMethod::HTTP_GET:    return "GET";
        case HttpMethod::HTTP_POST:   return "POST";
        case HttpMethod::HTTP_PUT:    return "PUT";
        case HttpMethod::HTTP_DELETE: return "DELETE";
        case HttpMethod::HTTP_PATCH:  return "PATCH";
        case HttpMethod::HTTP_HEAD:   return "HEAD";
    }
    return "GET";
}

// Throws std::invalid_argument for an unknown method name
inline HttpMethod parse_method(const std::string& name) {
    std::string n = utils::to_lower(name);
    if (n == "get")    return HttpMethod::HTTP_GET;
    if (n == "post")   return HttpMethod::HTTP_POST;
    if (n == "put")    return HttpMethod::HTTP_PUT;
    if (n == "delete") return HttpMethod::HTTP_DELETE;
    if (n == "patch")  return HttpMethod::HTTP_PATCH;
    if (n == "head")   return HttpMethod::HTTP_HEAD;
    throw std::invalid_argument("Unknown HTTP method: " + name);
}

// Methods whose parameters travel in the query string instead of the body
inline bool params_in_query(HttpMethod m) {
    return m == HttpMethod::HTTP_GET || m == HttpMethod::HTTP_HEAD ||
           m == HttpMethod::HTTP_DELETE;
}

inline const char* state_name(OperationState s) {
    switch (s) {
        case OperationState::PENDING:   return "Pending";
        case OperationState::EXECUTING: return "Executing";
        case OperationState::COMPLETED: return "Completed";
        case OperationState::FAILED:    return "Failed";
        case OperationState::CANCELLED: return "Cancelled";
        case OperationState::TIMED_OUT: return "TimedOut";
    }
    return "Unknown";
}

inline bool is_terminal(OperationState s) {
    return s == OperationState::COMPLETED || s == OperationState::FAILED ||
           s == OperationState::CANCELLED || s == OperationState::TIMED_OUT;
}

inline const char* error_kind_name(ErrorKind k) {
    switch (k) {
        case ErrorKind::NETWORK:   return "NetworkError";
        case ErrorKind::SERVER:    return "ServerError";
        case ErrorKind::AUTH:      return "AuthError";
        case ErrorKind::CANCELLED: return "CancelledError";
        case ErrorKind::TIMEOUT:   return "TimeoutError";
    }
    return "UnknownError";
}

inline const char* status_name(NetworkStatus s) {
    switch (s) {
        case NetworkStatus::NOT_REACHABLE:      return "NotReachable";
        case NetworkStatus::REACHABLE_VIA_WWAN: return "ReachableViaWWAN";
        case NetworkStatus::REACHABLE_VIA_WIFI: return "ReachableViaWiFi";
    }
    return "Unknown";
}

inline std::string describe(const NetworkError& e) {
    std::string s = std::string(error_kind_name(e.kind)) + " (" + std::to_string(e.code) + ")";
    if (!e.server_error_code.empty()) s += " " + e.server_error_code;
    if (!e.message.empty()) s += ": " + e.message;
    return s;
}
