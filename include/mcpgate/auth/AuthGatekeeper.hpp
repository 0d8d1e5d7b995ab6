//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthGatekeeper.hpp
// Purpose: Layered key validation (admin key, allowlist, key index, budgeted fallback scan)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcpgate/auth/FallbackScanBudget.hpp"
#include "mcpgate/storage/Storage.h"

namespace mcpgate::auth {

//==========================================================================================================
// AuthConfig
// Fields:
//   requireAuth: When false every caller is anonymous and storage is never consulted.
//   adminKey: Key granting the admin identity without storage access.
//   validKeys: Static allowlist.
//   enableKeyIndex: Consult "_auth-index/<hash>" entries.
//   enableFallbackScan: Scan "users/" records when the index has no entry.
//   fallbackScanRateLimit: Scans admitted per window.
//   fallbackScanBudget: Scans admitted over the server's lifetime.
//   fallbackScanWindow: Rate window length.
//   fallbackScanMaxKeys: Records examined per scan.
//==========================================================================================================
struct AuthConfig {
    bool requireAuth{true};
    std::optional<std::string> adminKey;
    std::vector<std::string> validKeys;
    bool enableKeyIndex{false};
    bool enableFallbackScan{false};
    uint32_t fallbackScanRateLimit{5};
    uint64_t fallbackScanBudget{100};
    std::chrono::milliseconds fallbackScanWindow{60000};
    std::size_t fallbackScanMaxKeys{1000};
};

//==========================================================================================================
// AuthResult
// Purpose: Outcome of one authentication attempt. Failed and RateLimited never say which layer rejected.
//==========================================================================================================
struct AuthResult {
    enum class Status {
        Ok,
        Failed,
        RateLimited
    };

    Status status{Status::Failed};
    std::string userId;
    bool isAdmin{false};
    bool debugMode{false};
    std::optional<std::chrono::milliseconds> retryAfter;

    bool ok() const { return status == Status::Ok; }
};

class AuthGatekeeper {
public:
    //==========================================================================================================
    // Args:
    //   config: Auth layer configuration.
    //   storage: Backend for index entries and user records (may be null when neither index nor scan is on).
    //   budget: Shared scan admission state; created from config when null.
    //==========================================================================================================
    AuthGatekeeper(AuthConfig config, std::shared_ptr<storage::IStorage> storage,
                   std::shared_ptr<FallbackScanBudget> budget = nullptr);
    ~AuthGatekeeper();

    AuthGatekeeper(const AuthGatekeeper&) = delete;
    AuthGatekeeper& operator=(const AuthGatekeeper&) = delete;

    //==========================================================================================================
    // Authenticate
    // Purpose: Validates a key through the enabled layers in order and stops at the first decision.
    // Returns:
    //   Future resolving to AuthResult. Storage failures propagate as exceptions through the future.
    //==========================================================================================================
    std::future<AuthResult> Authenticate(const std::string& key);

    const AuthConfig& Config() const;

    // Number of Authenticate calls received.
    uint64_t AuthenticateCalls() const;
    // Number of fallback scans actually executed.
    uint64_t ScanAttempts() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcpgate::auth
