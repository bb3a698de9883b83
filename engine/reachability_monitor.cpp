// ============================================================
// reachability_monitor.cpp
// ============================================================

#include "reachability_monitor.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <filesystem>
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

// ---------------------------------------------------------------
// LinkReachabilityProbe
// ---------------------------------------------------------------

static bool link_is_up(const fs::path& iface) {
    std::ifstream f(iface / "operstate");
    std::string state;
    if (!(f >> state)) return false;
    // "unknown" is what many tun/virtual drivers report while passing traffic
    return state == "up" || state == "unknown";
}

static bool is_cellular_name(const std::string& name) {
    return utils::starts_with(name, "wwan") || utils::starts_with(name, "rmnet") ||
           utils::starts_with(name, "ppp")  || utils::starts_with(name, "wwp");
}

NetworkStatus LinkReachabilityProbe::probe() {
    std::error_code ec;
    bool wifi_like = false;
    bool cellular  = false;

    for (auto& de : fs::directory_iterator(root_, ec)) {
        std::string name = de.path().filename().string();
        if (name == "lo") continue;
        if (!link_is_up(de.path())) continue;

        if (is_cellular_name(name)) {
            cellular = true;
        } else {
            wifi_like = true;
        }
    }
    if (ec) {
        LOG_DEBUG("LinkReachabilityProbe: cannot read " + root_ + ": " + ec.message());
        return NetworkStatus::NOT_REACHABLE;
    }

    if (wifi_like) return NetworkStatus::REACHABLE_VIA_WIFI;
    if (cellular)  return NetworkStatus::REACHABLE_VIA_WWAN;
    return NetworkStatus::NOT_REACHABLE;
}

// ---------------------------------------------------------------
// ReachabilityMonitor
// ---------------------------------------------------------------

ReachabilityMonitor::ReachabilityMonitor(NetworkStatus initial)
    : current_(initial)
    , last_emitted_(initial)
{
}

ReachabilityMonitor::~ReachabilityMonitor() {
    stop_polling();
}

void ReachabilityMonitor::set_listener(Listener l) {
    std::lock_guard<std::mutex> lk(update_mutex_);
    listener_ = std::move(l);
}

bool ReachabilityMonitor::update(NetworkStatus s) {
    std::lock_guard<std::mutex> lk(update_mutex_);
    current_.store(s);
    if (s == last_emitted_) return false;

    LOG_INFO(std::string("Reachability changed: ") + status_name(last_emitted_) +
             " -> " + status_name(s));
    last_emitted_ = s;
    if (listener_) listener_(s);
    return true;
}

void ReachabilityMonitor::start_polling(std::unique_ptr<ReachabilityProbe> probe,
                                        std::chrono::milliseconds interval)
{
    stop_polling();
    {
        std::lock_guard<std::mutex> lk(poll_mutex_);
        probe_ = std::move(probe);
        poll_stop_ = false;
    }
    poller_ = std::thread([this, interval]() {
        for (;;) {
            update(probe_->probe());
            std::unique_lock<std::mutex> lk(poll_mutex_);
            if (poll_cv_.wait_for(lk, interval, [this] { return poll_stop_; })) return;
        }
    });
}

void ReachabilityMonitor::stop_polling() {
    {
        std::lock_guard<std::mutex> lk(poll_mutex_);
        poll_stop_ = true;
    }
    poll_cv_.notify_all();
    if (poller_.joinable()) poller_.join();
}

bool ReachabilityMonitor::polling() const {
    std::lock_guard<std::mutex> lk(poll_mutex_);
    return poller_.joinable() && !poll_stop_;
}
