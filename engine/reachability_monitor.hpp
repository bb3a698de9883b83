#pragma once

// ============================================================
// reachability_monitor.hpp -- Connectivity class tracking
//
// Status can be pushed (update()) by whoever observes the
// network, or pulled by a background poller that asks a
// ReachabilityProbe at a fixed interval. Either way the
// listener only hears about actual changes.
// ============================================================

#include "network_types.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class ReachabilityProbe {
public:
    virtual ~ReachabilityProbe() = default;
    virtual NetworkStatus probe() = 0;
};

// Classifies the host's links from /sys/class/net:
//   wireless or wired link up         -> REACHABLE_VIA_WIFI
//   wwan*/rmnet*/ppp*/wwp* link up    -> REACHABLE_VIA_WWAN
//   nothing up besides loopback       -> NOT_REACHABLE
class LinkReachabilityProbe : public ReachabilityProbe {
public:
    explicit LinkReachabilityProbe(std::string sysfs_root = "/sys/class/net")
        : root_(std::move(sysfs_root)) {}

    NetworkStatus probe() override;

private:
    std::string root_;
};

class ReachabilityMonitor {
public:
    using Listener = std::function<void(NetworkStatus)>;

    explicit ReachabilityMonitor(NetworkStatus initial = NetworkStatus::NOT_REACHABLE);
    ~ReachabilityMonitor();

    // Called (synchronously, on the updating thread) for every change
    void set_listener(Listener l);

    // Report the latest observed status. Returns true if it differed from
    // the last emitted one and the listener was notified.
    bool update(NetworkStatus s);

    NetworkStatus current() const { return current_.load(); }

    void start_polling(std::unique_ptr<ReachabilityProbe> probe,
                       std::chrono::milliseconds interval);
    void stop_polling();
    bool polling() const;

    ReachabilityMonitor(const ReachabilityMonitor&) = delete;
    ReachabilityMonitor& operator=(const ReachabilityMonitor&) = delete;

private:
    std::atomic<NetworkStatus> current_;
    NetworkStatus              last_emitted_;
    std::mutex                 update_mutex_;   // serializes update()/emission
    Listener                   listener_;

    mutable std::mutex                 poll_mutex_;
    std::condition_variable            poll_cv_;
    bool                               poll_stop_{false};
    std::thread                        poller_;
    std::unique_ptr<ReachabilityProbe> probe_;
};
