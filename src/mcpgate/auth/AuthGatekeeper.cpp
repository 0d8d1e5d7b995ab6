//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthGatekeeper.cpp
// Purpose: Layered authentication implemented as a coroutine over the storage contract
//==========================================================================================================

#include "mcpgate/auth/AuthGatekeeper.hpp"

#include <atomic>

#include "logging/Logger.h"
#include "mcpgate/async/FutureAwaitable.h"
#include "mcpgate/async/Task.h"
#include "mcpgate/auth/KeyHash.hpp"
#include "mcpgate/auth/KeyIndex.hpp"

namespace mcpgate::auth {

namespace {
AuthResult failed() {
    AuthResult r;
    r.status = AuthResult::Status::Failed;
    return r;
}

AuthResult granted(std::string userId, bool isAdmin, bool debugMode) {
    AuthResult r;
    r.status = AuthResult::Status::Ok;
    r.userId = std::move(userId);
    r.isAdmin = isAdmin;
    r.debugMode = debugMode;
    return r;
}
}

class AuthGatekeeper::Impl : public std::enable_shared_from_this<AuthGatekeeper::Impl> {
public:
    Impl(AuthConfig c, std::shared_ptr<storage::IStorage> s, std::shared_ptr<FallbackScanBudget> b)
        : config(std::move(c)), storage(std::move(s)), budget(std::move(b)) {
        if (!budget) {
            budget = std::make_shared<FallbackScanBudget>(config.fallbackScanBudget,
                                                          config.fallbackScanRateLimit,
                                                          config.fallbackScanWindow);
        }
    }

    async::Task<AuthResult> coAuthenticate(std::string key);

    AuthConfig config;
    std::shared_ptr<storage::IStorage> storage;
    std::shared_ptr<FallbackScanBudget> budget;

    std::atomic<uint64_t> authenticateCalls{0};
    std::atomic<uint64_t> scanAttempts{0};
};

async::Task<AuthResult> AuthGatekeeper::Impl::coAuthenticate(std::string key) {
    FUNC_SCOPE();
    // Keep this object alive across suspension points.
    [[maybe_unused]] auto self = shared_from_this();

    if (!config.requireAuth) {
        co_return granted("anonymous", false, false);
    }
    if (key.empty()) {
        co_return failed();
    }

    // Admin key: no storage access.
    if (config.adminKey.has_value() && !config.adminKey->empty() &&
        ConstantTimeEqual(key, config.adminKey.value())) {
        LOG_DEBUG("Auth: admin key accepted");
        co_return granted("admin", true, true);
    }

    // Static allowlist. Every entry is compared so the match position does not leak.
    bool allowlisted = false;
    for (const auto& valid : config.validKeys) {
        if (ConstantTimeEqual(key, valid)) {
            allowlisted = true;
        }
    }
    if (allowlisted) {
        co_return granted(HashKey(key).substr(0, 16), false, false);
    }

    if (!storage && (config.enableKeyIndex || config.enableFallbackScan)) {
        LOG_ERROR("Auth: key index or fallback scan enabled without a storage backend");
        co_return failed();
    }

    if (config.enableKeyIndex) {
        auto entry = co_await async::makeFutureAwaitable(LookupAuthIndex(key, storage));
        if (entry.has_value()) {
            co_return granted(entry->userId, entry->isAdmin, entry->debugMode);
        }
    }

    if (config.enableFallbackScan) {
        const auto admission = budget->TryAdmit();
        if (admission != FallbackScanBudget::Admission::Admitted) {
            AuthResult r;
            r.status = AuthResult::Status::RateLimited;
            if (admission == FallbackScanBudget::Admission::RateLimited) {
                r.retryAfter = budget->RetryAfter();
            }
            LOG_DEBUG("Auth: fallback scan refused for key {} ({})", KeyHashPrefix(key),
                     admission == FallbackScanBudget::Admission::RateLimited ? "window" : "budget");
            co_return r;
        }
        scanAttempts.fetch_add(1);
        auto scan = co_await async::makeFutureAwaitable(ScanForUser(key, storage, config.fallbackScanMaxKeys));
        LOG_DEBUG("Auth: fallback scan examined {} records", scan.keysScanned);
        if (scan.user.has_value()) {
            const UserRecord& u = scan.user.value();
            co_await async::makeFutureAwaitable(
                WriteAuthIndexEntry(u.id, key, storage, u.isAdmin, u.debugMode));
            LOG_INFO("Auth: indexed key {} for user {} after fallback scan", KeyHashPrefix(key), u.id);
            co_return granted(u.id, u.isAdmin, u.debugMode);
        }
    }

    co_return failed();
}

AuthGatekeeper::AuthGatekeeper(AuthConfig config, std::shared_ptr<storage::IStorage> storage,
                               std::shared_ptr<FallbackScanBudget> budget)
    : pImpl(std::make_shared<Impl>(std::move(config), std::move(storage), std::move(budget))) {}

AuthGatekeeper::~AuthGatekeeper() = default;

std::future<AuthResult> AuthGatekeeper::Authenticate(const std::string& key) {
    pImpl->authenticateCalls.fetch_add(1);
    return pImpl->coAuthenticate(key).toFuture();
}

const AuthConfig& AuthGatekeeper::Config() const {
    return pImpl->config;
}

uint64_t AuthGatekeeper::AuthenticateCalls() const {
    return pImpl->authenticateCalls.load();
}

uint64_t AuthGatekeeper::ScanAttempts() const {
    return pImpl->scanAttempts.load();
}

} // namespace mcpgate::auth
