#pragma once

// ============================================================
// transport.hpp -- Abstract request/response transport
//   The engine never opens connections itself; it hands a fully
//   built request to a Transport on a worker thread.
// ============================================================

#include "network_types.hpp"
#include <functional>
#include <string>
#include <vector>

struct TransportRequest {
    HttpMethod  method{HttpMethod::HTTP_GET};
    std::string url;         // absolute, query string included
    Headers     headers;
    std::string body;
    u32         timeout_ms{0};   // 0 = no transport-level limit
    CachePolicy cache_policy{CachePolicy::RELOAD_IGNORING_LOCAL_CACHE};
};

enum class TransportStatus {
    OK,              // a response was received (any HTTP status)
    DNS_FAILED,
    CONNECT_FAILED,
    IO_ERROR,        // send/receive failed mid-flight
    TIMED_OUT,
    ABORTED,         // should_abort returned true
};

struct TransportResult {
    TransportStatus status{TransportStatus::IO_ERROR};
    int             http_status{0};
    Headers         headers;
    std::vector<u8> body;
    std::string     error;   // transport diagnostic when status != OK
};

enum class ProgressDirection {
    UPLOAD,
    DOWNLOAD,
};

// (direction, bytes done, bytes expected; 0 when unknown)
using TransportProgress = std::function<void(ProgressDirection, u64, u64)>;
using AbortCheck        = std::function<bool()>;

class Transport {
public:
    virtual ~Transport() = default;

    // Blocking; always called from an engine worker thread.
    // Implementations that support abort poll should_abort regularly and
    // return ABORTED once it reports true.
    virtual TransportResult perform(const TransportRequest& request,
                                    const TransportProgress& progress,
                                    const AbortCheck& should_abort) = 0;

    virtual bool supports_abort() const { return true; }
};

inline bool is_network_failure(TransportStatus s) {
    return s == TransportStatus::DNS_FAILED || s == TransportStatus::CONNECT_FAILED ||
           s == TransportStatus::IO_ERROR;
}

inline const char* transport_status_name(TransportStatus s) {
    switch (s) {
        case TransportStatus::OK:             return "OK";
        case TransportStatus::DNS_FAILED:     return "DNS_FAILED";
        case TransportStatus::CONNECT_FAILED: return "CONNECT_FAILED";
        case TransportStatus::IO_ERROR:       return "IO_ERROR";
        case TransportStatus::TIMED_OUT:      return "TIMED_OUT";
        case TransportStatus::ABORTED:        return "ABORTED";
    }
    return "UNKNOWN";
}
