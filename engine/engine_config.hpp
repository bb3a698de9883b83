#pragma once

// ============================================================
// engine_config.hpp -- NetworkEngine settings
//
// Every field has a usable default. Operation-level setters
// override the matching defaults after operation() built them.
// ============================================================

#include "network_types.hpp"
#include "retry_policy.hpp"
#include "session_context.hpp"
#include <set>
#include <string>

struct EngineConfig {
    // Per-operation defaults
    u32         operation_timeout_ms{180000};
    RetryPolicy retry;                         // off, unlimited count
    bool        encrypt_downloaded_file{true};
    CachePolicy cache_policy{CachePolicy::RELOAD_IGNORING_LOCAL_CACHE};

    // Engine behaviour
    u32  unlimited_retry_ceiling_secs{600};    // 0 = no ceiling
    bool suspend_on_background{true};
    bool support_local_test_data{false};
    int  wifi_max_concurrent{6};
    int  cellular_max_concurrent{2};
    int  callback_threads{2};
    u32  watchdog_interval_ms{50};
    NetworkStatus initial_network_status{NetworkStatus::REACHABLE_VIA_WIFI};

    // Requests
    std::string remote_host;     // non-empty: tokenless mode against this host
    std::string user_agent;      // empty: "netqueue/1.0 (<os>)"
    Headers     custom_headers;
    std::set<std::string> auth_error_codes{"INVALID_SESSION_ID"};

    // Logging
    std::string log_level;       // empty: leave the logger as is
    std::string log_file;
    std::string operation_error_log;   // empty: failed operations go to the main log only

    SessionContext initial_session;
};

// Applies one "key = value" setting. Throws std::runtime_error naming
// the key for unknown keys or values that do not parse.
void apply_config_entry(EngineConfig& cfg, const std::string& key, const std::string& value);

// Throws std::runtime_error if the combination of values is unusable
void validate_engine_config(const EngineConfig& cfg);

// Reads a text file of "key = value" lines; blank lines and lines
// starting with '#' are skipped. Custom headers use "header.<Name>",
// the initial session uses "session.<field>".
EngineConfig load_engine_config(const std::string& path);

std::string default_user_agent();
