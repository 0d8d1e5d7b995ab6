//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FallbackScanBudget.hpp
// Purpose: Lifetime budget and fixed-window rate limit guarding the fallback user scan
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>

namespace mcpgate::auth {

//==========================================================================================================
// FallbackScanBudget
// Purpose: Admission control for the expensive fallback scan. One instance per server, shared by all
//          concurrent requests.
// Notes:
//   - The lifetime budget only decreases; it is never replenished.
//   - The window counter resets when the window elapses.
//   - TryAdmit checks and consumes both under a single lock, so a rejected attempt consumes nothing
//     and N+1 concurrent callers against a budget of N admit exactly N.
//==========================================================================================================
class FallbackScanBudget {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    enum class Admission {
        Admitted,
        RateLimited,
        BudgetExhausted
    };

    FallbackScanBudget(uint64_t lifetimeBudget, uint32_t perWindowLimit, std::chrono::milliseconds window);
    FallbackScanBudget(uint64_t lifetimeBudget, uint32_t perWindowLimit, std::chrono::milliseconds window,
                       Clock clock);

    Admission TryAdmit();

    // Scans still allowed over the object's lifetime.
    uint64_t Remaining() const;
    // Scans admitted in the current window.
    uint32_t WindowCount() const;
    // Time until the current window resets (zero when the window has already elapsed).
    std::chrono::milliseconds RetryAfter() const;

private:
    void rollWindowLocked(std::chrono::steady_clock::time_point now) const;
    void noteExhaustedLocked();

    const uint32_t perWindowLimit_;
    const std::chrono::milliseconds window_;
    Clock clock_;

    mutable std::mutex mutex_;
    uint64_t remaining_;
    mutable std::chrono::steady_clock::time_point windowStart_;
    mutable uint32_t windowCount_{0};
    bool exhaustionReported_{false};
};

} // namespace mcpgate::auth
