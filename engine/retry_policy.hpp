#pragma once

// ============================================================
// retry_policy.hpp -- Network-error retry rule per operation
// ============================================================

#include "../common/platform.hpp"

struct RetryPolicy {
    bool retry_on_network_error{false};
    u32  max_retries{0};    // 0 = no count limit

    // retries_so_far: automatic re-admissions already performed.
    // elapsed_ms: time since the operation was first admitted.
    // unlimited_ceiling_ms: wall-clock cap applied only when max_retries
    //   is 0; 0 disables the cap.
    bool allows_retry(u32 retries_so_far, u64 elapsed_ms, u64 unlimited_ceiling_ms) const {
        if (!retry_on_network_error) return false;
        if (max_retries > 0) return retries_so_far < max_retries;
        return unlimited_ceiling_ms == 0 || elapsed_ms < unlimited_ceiling_ms;
    }
};
