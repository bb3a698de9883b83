#pragma once

// ============================================================
// response_classifier.hpp -- Maps a transport result to the
//   operation's next state
// ============================================================

#include "network_types.hpp"
#include "transport.hpp"
#include <optional>
#include <vector>
#include <set>
#include <string>

enum class Outcome {
    COMPLETED,
    NETWORK_ERROR,    // retryable per policy
    AUTH_ERROR,       // token rejected; wait for a session refresh
    SERVER_ERROR,
    TIMED_OUT,
    ABORTED,          // transport gave up because the attempt was withdrawn
};

struct Classification {
    Outcome                     outcome{Outcome::COMPLETED};
    std::optional<NetworkError> error;
};

// Order of checks:
//   transport failure        -> NETWORK_ERROR
//   transport timeout        -> TIMED_OUT
//   401 / auth error payload -> AUTH_ERROR
//   5xx                      -> NETWORK_ERROR
//   single errorCode payload -> SERVER_ERROR
//   other 4xx                -> SERVER_ERROR
//   anything else            -> COMPLETED
//
// When requires_token is false an auth rejection cannot be fixed by a
// refresh, so it is reported as a failed AUTH error instead.
Classification classify_response(const TransportResult& result,
                                 bool requires_token,
                                 const std::set<std::string>& auth_error_codes);

// Returns the errorCode/message of a body shaped like
// [{"errorCode": "...", "message": "..."}], nothing otherwise.
struct ServerErrorPayload {
    std::string error_code;
    std::string message;
};
std::optional<ServerErrorPayload> parse_server_error(const std::vector<u8>& body);

const char* outcome_name(Outcome o);
