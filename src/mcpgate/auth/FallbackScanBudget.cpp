//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FallbackScanBudget.cpp
// Purpose: Fixed-window admission control for the fallback scan
//==========================================================================================================

#include "mcpgate/auth/FallbackScanBudget.hpp"

#include "logging/Logger.h"

namespace mcpgate::auth {

FallbackScanBudget::FallbackScanBudget(uint64_t lifetimeBudget, uint32_t perWindowLimit,
                                       std::chrono::milliseconds window)
    : FallbackScanBudget(lifetimeBudget, perWindowLimit, window,
                         []() { return std::chrono::steady_clock::now(); }) {}

FallbackScanBudget::FallbackScanBudget(uint64_t lifetimeBudget, uint32_t perWindowLimit,
                                       std::chrono::milliseconds window, Clock clock)
    : perWindowLimit_(perWindowLimit), window_(window), clock_(std::move(clock)),
      remaining_(lifetimeBudget), windowStart_(clock_()) {}

void FallbackScanBudget::rollWindowLocked(std::chrono::steady_clock::time_point now) const {
    if (now - windowStart_ >= window_) {
        windowStart_ = now;
        windowCount_ = 0u;
    }
}

FallbackScanBudget::Admission FallbackScanBudget::TryAdmit() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (remaining_ == 0u) {
        noteExhaustedLocked();
        LOG_DEBUG("Fallback scan refused: no budget left");
        return Admission::BudgetExhausted;
    }
    rollWindowLocked(clock_());
    if (windowCount_ >= perWindowLimit_) {
        LOG_DEBUG("Fallback scan throttled: {} scans in current window", windowCount_);
        return Admission::RateLimited;
    }
    --remaining_;
    ++windowCount_;
    if (remaining_ == 0u) {
        noteExhaustedLocked();
    }
    return Admission::Admitted;
}

// Warns once per instance; later refusals only log at debug level.
void FallbackScanBudget::noteExhaustedLocked() {
    if (!exhaustionReported_) {
        exhaustionReported_ = true;
        LOG_WARN("Fallback scan budget exhausted; further scans are refused");
    }
}

uint64_t FallbackScanBudget::Remaining() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return remaining_;
}

uint32_t FallbackScanBudget::WindowCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    rollWindowLocked(clock_());
    return windowCount_;
}

std::chrono::milliseconds FallbackScanBudget::RetryAfter() const {
    std::lock_guard<std::mutex> lk(mutex_);
    const auto now = clock_();
    rollWindowLocked(now);
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - windowStart_);
    return elapsed >= window_ ? std::chrono::milliseconds{0} : window_ - elapsed;
}

} // namespace mcpgate::auth
