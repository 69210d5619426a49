//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ReconnectPolicy.h
// Purpose: Bounded exponential backoff used between reconnect attempts
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>

namespace mcplink {

//==========================================================================================================
// ReconnectPolicy
// Purpose: delay(n) = min(base * 2^(n-1), cap) for attempt n >= 1; attempts beyond maxAttempts are refused.
// Fields:
//   baseDelay: delay before the first attempt.
//   maxDelay: ceiling applied to every attempt.
//   maxAttempts: attempts allowed before the connection gives up (0 disables reconnection).
//==========================================================================================================
struct ReconnectPolicy {
    std::chrono::milliseconds baseDelay{5000};
    std::chrono::milliseconds maxDelay{30000};
    unsigned int maxAttempts{10};

    std::chrono::milliseconds DelayForAttempt(unsigned int attempt) const {
        if (attempt == 0) {
            attempt = 1;
        }
        const int64_t base = baseDelay.count();
        const int64_t cap = maxDelay.count();
        int64_t delay = base;
        for (unsigned int i = 1; i < attempt; ++i) {
            if (delay >= cap) {
                break;
            }
            delay *= 2;
        }
        if (cap > 0 && delay > cap) {
            delay = cap;
        }
        return std::chrono::milliseconds(delay);
    }

    bool CanAttempt(unsigned int attemptsSoFar) const {
        return attemptsSoFar < maxAttempts;
    }
};

} // namespace mcplink
