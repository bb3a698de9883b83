// ============================================================
// engine_config.cpp
// ============================================================

#include "engine_config.hpp"
#include "../common/logger.hpp"
#include "../common/platform.hpp"
#include "../common/utils.hpp"
#include <fstream>
#include <stdexcept>

// ---------------------------------------------------------------
// Value parsing
// ---------------------------------------------------------------

static std::runtime_error bad_value(const std::string& key, const std::string& value) {
    return std::runtime_error("Invalid value for " + key + ": '" + value + "'");
}

static bool parse_bool(const std::string& key, const std::string& value) {
    std::string v = utils::to_lower(value);
    if (v == "true" || v == "yes" || v == "on" || v == "1")  return true;
    if (v == "false" || v == "no" || v == "off" || v == "0") return false;
    throw bad_value(key, value);
}

static u64 parse_unsigned(const std::string& key, const std::string& value, u64 max) {
    if (value.empty()) throw bad_value(key, value);
    u64 out = 0;
    for (char c : value) {
        if (c < '0' || c > '9') throw bad_value(key, value);
        out = out * 10 + (u64)(c - '0');
        if (out > max) throw bad_value(key, value);
    }
    return out;
}

static CachePolicy parse_cache_policy(const std::string& key, const std::string& value) {
    std::string v = utils::to_lower(value);
    if (v == "reload")         return CachePolicy::RELOAD_IGNORING_LOCAL_CACHE;
    if (v == "protocol")       return CachePolicy::USE_PROTOCOL_CACHE_POLICY;
    if (v == "cache_else_load") return CachePolicy::RETURN_CACHE_DATA_ELSE_LOAD;
    if (v == "cache_only")     return CachePolicy::RETURN_CACHE_DATA_DONT_LOAD;
    throw bad_value(key, value);
}

static NetworkStatus parse_status(const std::string& key, const std::string& value) {
    std::string v = utils::to_lower(value);
    if (v == "wifi")                        return NetworkStatus::REACHABLE_VIA_WIFI;
    if (v == "wwan" || v == "cellular")     return NetworkStatus::REACHABLE_VIA_WWAN;
    if (v == "none" || v == "unreachable")  return NetworkStatus::NOT_REACHABLE;
    throw bad_value(key, value);
}

static void apply_session_entry(SessionContext& s, const std::string& field,
                                const std::string& key, const std::string& value)
{
    if      (field == "host")            s.host = value;
    else if (field == "organization_id") s.organization_id = value;
    else if (field == "user_id")         s.user_id = value;
    else if (field == "api_path")        s.api_path = value;
    else if (field == "access_token")    s.access_token = value;
    else if (field == "port" || field == "ssl_port") {
        u64 p = parse_unsigned(key, value, 65535);
        if (!utils::validate_port((int)p)) throw bad_value(key, value);
        (field == "port" ? s.port : s.ssl_port) = (u16)p;
    }
    else throw std::runtime_error("Unknown config key: " + key);
}

// ---------------------------------------------------------------
// Public API
// ---------------------------------------------------------------

void apply_config_entry(EngineConfig& cfg, const std::string& key, const std::string& value) {
    if (utils::starts_with(key, "header.")) {
        std::string name = key.substr(7);
        if (name.empty()) throw std::runtime_error("Empty header name in config key: " + key);
        cfg.custom_headers[name] = value;
        return;
    }
    if (utils::starts_with(key, "session.")) {
        apply_session_entry(cfg.initial_session, key.substr(8), key, value);
        return;
    }

    if      (key == "operation_timeout_ms")
        cfg.operation_timeout_ms = (u32)parse_unsigned(key, value, 0xFFFFFFFFULL);
    else if (key == "retry_on_network_error")
        cfg.retry.retry_on_network_error = parse_bool(key, value);
    else if (key == "max_retries")
        cfg.retry.max_retries = (u32)parse_unsigned(key, value, 0xFFFFFFFFULL);
    else if (key == "unlimited_retry_ceiling_secs")
        cfg.unlimited_retry_ceiling_secs = (u32)parse_unsigned(key, value, 0xFFFFFFFFULL);
    else if (key == "encrypt_downloaded_file")
        cfg.encrypt_downloaded_file = parse_bool(key, value);
    else if (key == "cache_policy")
        cfg.cache_policy = parse_cache_policy(key, value);
    else if (key == "suspend_on_background")
        cfg.suspend_on_background = parse_bool(key, value);
    else if (key == "support_local_test_data")
        cfg.support_local_test_data = parse_bool(key, value);
    else if (key == "wifi_max_concurrent")
        cfg.wifi_max_concurrent = (int)parse_unsigned(key, value, 1024);
    else if (key == "cellular_max_concurrent")
        cfg.cellular_max_concurrent = (int)parse_unsigned(key, value, 1024);
    else if (key == "callback_threads")
        cfg.callback_threads = (int)parse_unsigned(key, value, 64);
    else if (key == "watchdog_interval_ms")
        cfg.watchdog_interval_ms = (u32)parse_unsigned(key, value, 60000);
    else if (key == "initial_network_status")
        cfg.initial_network_status = parse_status(key, value);
    else if (key == "remote_host")
        cfg.remote_host = value;
    else if (key == "user_agent")
        cfg.user_agent = value;
    else if (key == "auth_error_codes") {
        cfg.auth_error_codes.clear();
        for (auto& code : utils::split(value, ',')) {
            std::string c = utils::trim(code);
            if (!c.empty()) cfg.auth_error_codes.insert(c);
        }
    }
    else if (key == "log_level") {
        std::string v = utils::to_lower(value);
        if (v != "debug" && v != "info" && v != "warn" && v != "warning" && v != "error") {
            throw bad_value(key, value);
        }
        cfg.log_level = v;
    }
    else if (key == "log_file")
        cfg.log_file = value;
    else if (key == "operation_error_log")
        cfg.operation_error_log = value;
    else
        throw std::runtime_error("Unknown config key: " + key);
}

void validate_engine_config(const EngineConfig& cfg) {
    if (cfg.wifi_max_concurrent < 1) {
        throw std::runtime_error("wifi_max_concurrent must be at least 1");
    }
    if (cfg.cellular_max_concurrent < 1) {
        throw std::runtime_error("cellular_max_concurrent must be at least 1");
    }
    if (cfg.callback_threads < 1) {
        throw std::runtime_error("callback_threads must be at least 1");
    }
    if (cfg.watchdog_interval_ms == 0) {
        throw std::runtime_error("watchdog_interval_ms must be positive");
    }
}

EngineConfig load_engine_config(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot open config file: " + path);

    EngineConfig cfg;
    std::string line;
    int lineno = 0;
    while (std::getline(f, line)) {
        ++lineno;
        std::string t = utils::trim(line);
        if (t.empty() || t[0] == '#') continue;

        auto eq = t.find('=');
        if (eq == std::string::npos) {
            throw std::runtime_error(path + ":" + std::to_string(lineno) +
                                     ": expected key = value");
        }
        apply_config_entry(cfg, utils::trim(t.substr(0, eq)), utils::trim(t.substr(eq + 1)));
    }

    validate_engine_config(cfg);
    LOG_DEBUG("Loaded engine config from " + path);
    return cfg;
}

std::string default_user_agent() {
    return "netqueue/1.0 (" + platform::os_name() + ")";
}
