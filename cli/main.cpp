// ============================================================
// cli/main.cpp -- netq: run one request through the engine
// ============================================================

#include "../common/file_io.hpp"
#include "../common/platform.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include "../engine/curl_transport.hpp"
#include "../engine/engine_config.hpp"
#include "../engine/network_engine.hpp"
#include "../engine/reachability_monitor.hpp"
#include <atomic>
#include <condition_variable>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <mutex>
#include <string>

static std::atomic<bool> g_interrupted{false};

static void sig_handler(int /*sig*/) {
    g_interrupted = true;
}

static void print_usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " <url> [options]\n"
        << "\n"
        << "  url               absolute url, or a path resolved against --host\n"
        << "\nOptions:\n"
        << "  --config FILE     engine settings (key = value per line)\n"
        << "  --host HOST       session host for relative urls\n"
        << "  --api-path PATH   API prefix for relative urls without a leading '/'\n"
        << "  --token TOKEN     access token sent as 'Authorization: Bearer'\n"
        << "  --remote-host H   tokenless mode against host H\n"
        << "  --method M        GET, POST, PUT, DELETE, PATCH or HEAD (default: GET)\n"
        << "  --param K=V       request parameter (repeatable)\n"
        << "  --header K=V      request header (repeatable)\n"
        << "  --tag TAG         tag the operation\n"
        << "  --retries N       retry network errors up to N times (0: unlimited)\n"
        << "  --timeout SECS    operation timeout (default: 180)\n"
        << "  --output FILE     write the response body to FILE\n"
        << "  --probe           detect reachability from /sys/class/net\n"
        << "  --verbose         enable debug logging\n"
        << "\nExamples:\n"
        << "  " << prog << " https://example.com/status --remote-host example.com\n"
        << "  " << prog << " query --host na1.example.com --api-path /services/data/v28.0 \\\n"
        << "      --token 00D...! --param q=SELECT+Id+FROM+Account\n";
}

static bool split_pair(const std::string& arg, std::string& k, std::string& v) {
    auto eq = arg.find('=');
    if (eq == std::string::npos || eq == 0) return false;
    k = arg.substr(0, eq);
    v = arg.substr(eq + 1);
    return true;
}

int main(int argc, char* argv[]) {
    platform::ignore_sigpipe();
    Logger::get().set_level(LogLevel::WARN);
    Logger::get().set_level_from_env("NETQUEUE_LOG_LEVEL");

    if (argc < 2 || std::strcmp(argv[1], "--help") == 0) {
        print_usage(argv[0]);
        return 1;
    }

    std::string url = argv[1];
    std::string config_path, host, api_path, token, remote_host, tag, output;
    std::string method_str = "GET";
    Params  params;
    Headers headers;
    int  retries     = -1;
    int  timeout_sec = -1;
    bool probe       = false;

    for (int i = 2; i < argc; ++i) {
        std::string k, v;
        if (std::strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (std::strcmp(argv[i], "--host") == 0 && i + 1 < argc) {
            host = argv[++i];
        } else if (std::strcmp(argv[i], "--api-path") == 0 && i + 1 < argc) {
            api_path = argv[++i];
        } else if (std::strcmp(argv[i], "--token") == 0 && i + 1 < argc) {
            token = argv[++i];
        } else if (std::strcmp(argv[i], "--remote-host") == 0 && i + 1 < argc) {
            remote_host = argv[++i];
        } else if (std::strcmp(argv[i], "--method") == 0 && i + 1 < argc) {
            method_str = argv[++i];
        } else if (std::strcmp(argv[i], "--param") == 0 && i + 1 < argc) {
            if (!split_pair(argv[++i], k, v)) {
                std::cerr << "ERROR: --param expects K=V, got: " << argv[i] << "\n";
                return 1;
            }
            params[k] = v;
        } else if (std::strcmp(argv[i], "--header") == 0 && i + 1 < argc) {
            if (!split_pair(argv[++i], k, v)) {
                std::cerr << "ERROR: --header expects K=V, got: " << argv[i] << "\n";
                return 1;
            }
            headers[k] = v;
        } else if (std::strcmp(argv[i], "--tag") == 0 && i + 1 < argc) {
            tag = argv[++i];
        } else if (std::strcmp(argv[i], "--retries") == 0 && i + 1 < argc) {
            retries = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--timeout") == 0 && i + 1 < argc) {
            timeout_sec = std::atoi(argv[++i]);
        } else if (std::strcmp(argv[i], "--output") == 0 && i + 1 < argc) {
            output = argv[++i];
        } else if (std::strcmp(argv[i], "--probe") == 0) {
            probe = true;
        } else if (std::strcmp(argv[i], "--verbose") == 0) {
            Logger::get().set_level(LogLevel::DEBUG);
        } else {
            std::cerr << "Unknown option: " << argv[i] << "\n";
            print_usage(argv[0]);
            return 1;
        }
    }

    if (retries < -1 || timeout_sec == 0 || timeout_sec < -1) {
        std::cerr << "ERROR: --retries and --timeout must be positive\n";
        return 1;
    }

    try {
        EngineConfig cfg = config_path.empty() ? EngineConfig{} : load_engine_config(config_path);
        if (!host.empty())        cfg.initial_session.host = host;
        if (!api_path.empty())    cfg.initial_session.api_path = api_path;
        if (!token.empty())       cfg.initial_session.access_token = token;
        if (!remote_host.empty()) cfg.remote_host = remote_host;
        if (retries >= 0) {
            cfg.retry.retry_on_network_error = true;
            cfg.retry.max_retries = (u32)retries;
        }
        if (timeout_sec > 0) cfg.operation_timeout_ms = (u32)timeout_sec * 1000;
        if (probe) {
            cfg.initial_network_status = LinkReachabilityProbe().probe();
            LOG_INFO(std::string("Detected reachability: ") + status_name(cfg.initial_network_status));
        }

        HttpMethod method = parse_method(method_str);

        // Declared before the engine so they outlive its callback threads
        std::mutex mu;
        std::condition_variable cv;
        bool done = false;
        int  rc   = 0;
        auto finish = [&](int code) {
            std::lock_guard<std::mutex> lk(mu);
            rc   = code;
            done = true;
            cv.notify_all();
        };

        NetworkEngine engine(std::make_shared<CurlTransport>(), cfg);
        if (!engine.is_reachable()) {
            std::cerr << "ERROR: network is not reachable\n";
            return 1;
        }

        // No interactive login here: a rejected token ends the run
        engine.set_session_refresh_handler([](NetworkEngine& e) {
            e.session_refresh_failed(NetworkError{ErrorKind::AUTH, 401,
                                                  "Access token rejected or missing", ""});
        });

        auto op = engine.operation(url, params, method);
        for (auto& kv : headers) op->set_header_value(kv.first, kv.second);
        if (!tag.empty()) op->set_tag(tag);
        if (!output.empty()) {
            op->set_download_destination(output);
            op->set_encrypt_downloaded_file(false);
        }

        op->add_completion_handler(
            [&](const OperationPtr& o) {
                std::cerr << "HTTP " << o->status_code() << "\n";
                if (output.empty()) {
                    auto body = o->response_string();
                    if (body) std::cout << *body;
                    std::cout.flush();
                } else {
                    std::cerr << "Saved " << utils::format_bytes(file_io::get_file_size(output)) << " to "
                              << output << "\n";
                }
                finish(0);
            },
            [&](const NetworkError& err) {
                std::cerr << "ERROR: " << describe(err) << "\n";
                finish(1);
            });
        op->add_cancel_handler([&](const OperationPtr&) {
            std::cerr << "Cancelled\n";
            finish(130);
        });

        std::signal(SIGINT,  sig_handler);
        std::signal(SIGTERM, sig_handler);

        engine.enqueue(op);

        std::unique_lock<std::mutex> lk(mu);
        while (!done) {
            cv.wait_for(lk, std::chrono::milliseconds(100));
            if (g_interrupted.exchange(false)) {
                lk.unlock();
                engine.cancel_all_operations();
                lk.lock();
            }
        }
        return rc;
    } catch (const std::exception& e) {
        std::cerr << "FATAL: " << e.what() << "\n";
        return 2;
    }
}
