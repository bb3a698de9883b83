#pragma once

// ============================================================
// concurrency_controller.hpp -- Reachability -> concurrency cap
// ============================================================

#include "network_types.hpp"
#include <atomic>
#include <stdexcept>

class ConcurrencyController {
public:
    ConcurrencyController(int wifi_cap, int cellular_cap,
                          NetworkStatus initial = NetworkStatus::NOT_REACHABLE)
        : wifi_cap_(wifi_cap), cellular_cap_(cellular_cap), status_(initial)
    {
        if (wifi_cap < 1 || cellular_cap < 1) {
            throw std::invalid_argument("Concurrency caps must be at least 1");
        }
    }

    void set_status(NetworkStatus s) { status_.store(s); }
    NetworkStatus status() const { return status_.load(); }

    int cap_for(NetworkStatus s) const {
        switch (s) {
            case NetworkStatus::REACHABLE_VIA_WIFI: return wifi_cap_;
            case NetworkStatus::REACHABLE_VIA_WWAN: return cellular_cap_;
            case NetworkStatus::NOT_REACHABLE:      return 0;
        }
        return 0;
    }

    // Operations still queue at cap 0; they just aren't admitted
    int current_cap() const { return cap_for(status_.load()); }

private:
    int wifi_cap_;
    int cellular_cap_;
    std::atomic<NetworkStatus> status_;
};
