//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_auth_gatekeeper.cpp
// Purpose: GoogleTests for key resolution order (admin, allowlist, index, fallback scan) and scan throttling
//==========================================================================================================

#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <vector>
#include "mcpgate/auth/AuthGatekeeper.hpp"
#include "mcpgate/auth/KeyHash.hpp"
#include "mcpgate/auth/KeyIndex.hpp"
#include "mcpgate/storage/InMemoryStorage.hpp"

using namespace mcpgate;
using namespace mcpgate::auth;

namespace {
void putUser(storage::IStorage& store, const std::string& id, const std::string& key, bool isAdmin = false) {
    UserRecord u;
    u.id = id;
    u.authKey = key;
    u.isAdmin = isAdmin;
    store.Put(std::string(kUsersPrefix) + id, u.ToJSON()).get();
}

AuthConfig indexOnly() {
    AuthConfig c;
    c.enableKeyIndex = true;
    return c;
}

AuthConfig scanOnly(uint32_t perWindow, uint64_t budget) {
    AuthConfig c;
    c.enableFallbackScan = true;
    c.fallbackScanRateLimit = perWindow;
    c.fallbackScanBudget = budget;
    c.fallbackScanWindow = std::chrono::hours(1);
    return c;
}
}

TEST(AuthGatekeeper, AdminKeyNeedsNoStorage) {
    // Arrange
    auto store = std::make_shared<storage::InMemoryStorage>();
    AuthConfig c = indexOnly();
    c.enableFallbackScan = true;
    c.adminKey = "admin-secret";
    AuthGatekeeper gk(c, store);

    // Act
    auto r = gk.Authenticate("admin-secret").get();

    // Assert
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.userId, "admin");
    EXPECT_TRUE(r.isAdmin);
    EXPECT_TRUE(r.debugMode);
    EXPECT_EQ(store->ReadCount(), 0u);
    EXPECT_EQ(gk.ScanAttempts(), 0u);
}

TEST(AuthGatekeeper, AllowlistedKeyGetsHashDerivedId) {
    auto store = std::make_shared<storage::InMemoryStorage>();
    AuthConfig c;
    c.validKeys = {"k1", "k2"};
    AuthGatekeeper gk(c, store);

    auto r = gk.Authenticate("k2").get();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.userId, HashKey("k2").substr(0, 16));
    EXPECT_FALSE(r.isAdmin);
    EXPECT_EQ(store->ReadCount(), 0u);

    EXPECT_FALSE(gk.Authenticate("k3").get().ok());
}

TEST(AuthGatekeeper, EmptyKeyFails) {
    AuthConfig c;
    c.adminKey = "";
    AuthGatekeeper gk(c, std::make_shared<storage::InMemoryStorage>());
    EXPECT_EQ(gk.Authenticate("").get().status, AuthResult::Status::Failed);
}

TEST(AuthGatekeeper, AuthDisabledIsAnonymous) {
    AuthConfig c;
    c.requireAuth = false;
    AuthGatekeeper gk(c, nullptr);
    auto r = gk.Authenticate("").get();
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(r.userId, "anonymous");
    EXPECT_FALSE(r.isAdmin);
}

TEST(AuthGatekeeper, IndexOnlyHitAndMissNeverScan) {
    // Arrange
    auto store = std::make_shared<storage::InMemoryStorage>();
    putUser(*store, "alice", "alice-key");
    WriteAuthIndexEntry("alice", "alice-key", store, false, false).get();
    putUser(*store, "bob", "bob-key");  // present as a record but not indexed
    AuthGatekeeper gk(indexOnly(), store);

    // Act
    auto hit = gk.Authenticate("alice-key").get();
    auto miss = gk.Authenticate("bob-key").get();

    // Assert
    ASSERT_TRUE(hit.ok());
    EXPECT_EQ(hit.userId, "alice");
    EXPECT_EQ(miss.status, AuthResult::Status::Failed);
    EXPECT_EQ(gk.ScanAttempts(), 0u);
    EXPECT_EQ(store->ListCount(), 0u);
    EXPECT_EQ(gk.AuthenticateCalls(), 2u);
}

TEST(AuthGatekeeper, ScanHitWritesIndexBack) {
    // Arrange
    auto store = std::make_shared<storage::InMemoryStorage>();
    putUser(*store, "carol", "carol-key", true);
    AuthConfig c = scanOnly(5, 100);
    c.enableKeyIndex = true;
    AuthGatekeeper gk(c, store);

    // Act
    auto first = gk.Authenticate("carol-key").get();
    auto second = gk.Authenticate("carol-key").get();

    // Assert: the second call is served by the index
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.userId, "carol");
    EXPECT_TRUE(first.isAdmin);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(gk.ScanAttempts(), 1u);
    auto entry = LookupAuthIndex("carol-key", store).get();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->userId, "carol");
}

TEST(AuthGatekeeper, ScanOnlyConcurrentAttemptsAreThrottled) {
    // Arrange: N+1 concurrent unknown keys against a window of N
    constexpr uint32_t kLimit = 4;
    auto store = std::make_shared<storage::InMemoryStorage>();
    putUser(*store, "dave", "dave-key");
    AuthGatekeeper gk(scanOnly(kLimit, 100), store);

    // Act
    std::vector<std::future<AuthResult>> futures;
    for (uint32_t i = 0; i < kLimit + 1; ++i) {
        futures.push_back(std::async(std::launch::async, [&gk, i]() {
            return gk.Authenticate("unknown-" + std::to_string(i)).get();
        }));
    }
    int failed = 0;
    int limited = 0;
    for (auto& f : futures) {
        auto r = f.get();
        if (r.status == AuthResult::Status::Failed) ++failed;
        if (r.status == AuthResult::Status::RateLimited) {
            ++limited;
            ASSERT_TRUE(r.retryAfter.has_value());
            EXPECT_GT(r.retryAfter->count(), 0);
        }
    }

    // Assert
    EXPECT_EQ(failed, static_cast<int>(kLimit));
    EXPECT_EQ(limited, 1);
    EXPECT_EQ(gk.ScanAttempts(), kLimit);

    // A valid key is throttled too while the window is full
    EXPECT_EQ(gk.Authenticate("dave-key").get().status, AuthResult::Status::RateLimited);
}

TEST(AuthGatekeeper, ConcurrentAttemptsNeverOverspendLifetimeBudget) {
    // Arrange: lifetime budget of N, window limit far above it
    constexpr uint64_t kBudget = 6;
    auto store = std::make_shared<storage::InMemoryStorage>();
    putUser(*store, "frank", "frank-key");
    auto budget = std::make_shared<FallbackScanBudget>(kBudget, 1000, std::chrono::hours(1));
    AuthGatekeeper gk(scanOnly(1000, kBudget), store, budget);

    // Act: N+1 concurrent attempts with unknown keys
    std::vector<std::future<AuthResult>> futures;
    for (uint64_t i = 0; i < kBudget + 1; ++i) {
        futures.push_back(std::async(std::launch::async, [&gk, i]() {
            return gk.Authenticate("stranger-" + std::to_string(i)).get();
        }));
    }
    int failed = 0;
    int limited = 0;
    for (auto& f : futures) {
        auto r = f.get();
        if (r.status == AuthResult::Status::Failed) ++failed;
        if (r.status == AuthResult::Status::RateLimited) {
            ++limited;
            EXPECT_FALSE(r.retryAfter.has_value());
        }
    }

    // Assert
    EXPECT_EQ(gk.ScanAttempts(), kBudget);
    EXPECT_EQ(failed, static_cast<int>(kBudget));
    EXPECT_GE(limited, 1);
    EXPECT_EQ(budget->Remaining(), 0u);
}

TEST(AuthGatekeeper, ExhaustedBudgetReportsRateLimitedWithoutRetryHint) {
    auto store = std::make_shared<storage::InMemoryStorage>();
    auto budget = std::make_shared<FallbackScanBudget>(1, 10, std::chrono::milliseconds(10));
    AuthGatekeeper gk(scanOnly(10, 1), store, budget);

    EXPECT_EQ(gk.Authenticate("a").get().status, AuthResult::Status::Failed);
    auto r = gk.Authenticate("b").get();
    EXPECT_EQ(r.status, AuthResult::Status::RateLimited);
    EXPECT_FALSE(r.retryAfter.has_value());
    EXPECT_EQ(gk.ScanAttempts(), 1u);
}

TEST(AuthGatekeeper, IndexHitSkipsScanBudget) {
    auto store = std::make_shared<storage::InMemoryStorage>();
    WriteAuthIndexEntry("erin", "erin-key", store, false, false).get();
    AuthConfig c = scanOnly(1, 1);
    c.enableKeyIndex = true;
    AuthGatekeeper gk(c, store);

    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(gk.Authenticate("erin-key").get().ok());
    }
    EXPECT_EQ(gk.ScanAttempts(), 0u);
}

TEST(AuthGatekeeper, MissingStorageFailsClosed) {
    AuthGatekeeper gk(indexOnly(), nullptr);
    EXPECT_EQ(gk.Authenticate("anything").get().status, AuthResult::Status::Failed);
}
