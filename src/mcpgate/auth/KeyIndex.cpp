//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeyIndex.cpp
// Purpose: Coroutine implementations of the auth index and fallback scan
//==========================================================================================================

#include "mcpgate/auth/KeyIndex.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include "logging/Logger.h"
#include "mcpgate/async/FutureAwaitable.h"
#include "mcpgate/async/Task.h"
#include "mcpgate/auth/KeyHash.hpp"

namespace mcpgate::auth {

namespace {
constexpr std::size_t kScanPageSize = 100;
constexpr std::size_t kRebuildPageSize = 100;

std::string isoNowUtc() {
    const std::time_t t = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    ::gmtime_r(&t, &tm);
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", tm);
}

async::Task<std::optional<AuthIndexEntry>> coLookup(std::string key, std::shared_ptr<storage::IStorage> storage) {
    auto value = co_await async::makeFutureAwaitable(storage->Get(AuthIndexKey(key)));
    if (!value.has_value()) {
        co_return std::optional<AuthIndexEntry>{};
    }
    auto entry = AuthIndexEntry::FromJSON(value.value());
    if (!entry.has_value()) {
        LOG_WARN("Ignoring malformed auth index entry for key {}", KeyHashPrefix(key));
    }
    co_return entry;
}

async::Task<void> coWrite(std::string userId, std::string key, std::shared_ptr<storage::IStorage> storage,
                          bool isAdmin, bool debugMode) {
    AuthIndexEntry entry;
    entry.userId = std::move(userId);
    entry.isAdmin = isAdmin;
    entry.debugMode = debugMode;
    entry.createdAt = isoNowUtc();
    co_await async::makeFutureAwaitable(storage->Put(AuthIndexKey(key), entry.ToJSON()));
    co_return;
}

async::Task<void> coRemove(std::string key, std::shared_ptr<storage::IStorage> storage) {
    co_await async::makeFutureAwaitable(storage->Delete(AuthIndexKey(key)));
    co_return;
}

async::Task<ScanResult> coScan(std::string key, std::shared_ptr<storage::IStorage> storage, std::size_t maxKeys) {
    ScanResult result;
    std::optional<std::string> cursor;
    while (result.keysScanned < maxKeys) {
        storage::ListOptions opts;
        opts.limit = std::min(kScanPageSize, maxKeys - result.keysScanned);
        opts.cursor = cursor;
        auto page = co_await async::makeFutureAwaitable(storage->List(kUsersPrefix, opts));

        for (const auto& recordKey : page.keys) {
            ++result.keysScanned;
            auto value = co_await async::makeFutureAwaitable(storage->Get(recordKey));
            if (value.has_value()) {
                auto user = UserRecord::FromJSON(value.value());
                if (user.has_value() && ConstantTimeEqual(user->authKey, key)) {
                    result.user = std::move(user);
                    co_return result;
                }
            }
            if (result.keysScanned >= maxKeys) {
                break;
            }
        }
        if (page.complete || !page.cursor.has_value()) {
            break;
        }
        cursor = page.cursor;
    }
    co_return result;
}

async::Task<std::size_t> coRebuild(std::shared_ptr<storage::IStorage> storage,
                                   std::function<void(std::size_t, std::size_t)> onProgress) {
    // First pass counts records so progress can report a total.
    std::size_t total = 0;
    std::optional<std::string> cursor;
    for (;;) {
        storage::ListOptions opts;
        opts.cursor = cursor;
        auto page = co_await async::makeFutureAwaitable(storage->List(kUsersPrefix, opts));
        total += page.keys.size();
        if (page.complete || !page.cursor.has_value()) break;
        cursor = page.cursor;
    }

    std::size_t indexed = 0;
    cursor.reset();
    for (;;) {
        storage::ListOptions opts;
        opts.limit = kRebuildPageSize;
        opts.cursor = cursor;
        auto page = co_await async::makeFutureAwaitable(storage->List(kUsersPrefix, opts));
        for (const auto& recordKey : page.keys) {
            auto value = co_await async::makeFutureAwaitable(storage->Get(recordKey));
            if (!value.has_value()) continue;
            auto user = UserRecord::FromJSON(value.value());
            if (!user.has_value()) {
                LOG_WARN("RebuildAuthIndex: skipping malformed record {}", recordKey);
                continue;
            }
            co_await async::makeFutureAwaitable(
                WriteAuthIndexEntry(user->id, user->authKey, storage, user->isAdmin, user->debugMode));
            ++indexed;
            if (onProgress) onProgress(indexed, total);
        }
        if (page.complete || !page.cursor.has_value()) break;
        cursor = page.cursor;
    }
    LOG_INFO("RebuildAuthIndex: indexed {} of {} user records", indexed, total);
    co_return indexed;
}
}

JSONValue AuthIndexEntry::ToJSON() const {
    JSONValue::Object o;
    o["userId"] = std::make_shared<JSONValue>(userId);
    o["isAdmin"] = std::make_shared<JSONValue>(isAdmin);
    o["debugMode"] = std::make_shared<JSONValue>(debugMode);
    o["createdAt"] = std::make_shared<JSONValue>(createdAt);
    return JSONValue{o};
}

std::optional<AuthIndexEntry> AuthIndexEntry::FromJSON(const JSONValue& v) {
    auto userId = GetStringMember(v, "userId");
    if (!userId.has_value()) {
        return std::nullopt;
    }
    AuthIndexEntry e;
    e.userId = std::move(userId.value());
    e.isAdmin = GetBoolMember(v, "isAdmin").value_or(false);
    e.debugMode = GetBoolMember(v, "debugMode").value_or(false);
    e.createdAt = GetStringMember(v, "createdAt").value_or(std::string());
    return e;
}

JSONValue UserRecord::ToJSON() const {
    JSONValue::Object o;
    o["id"] = std::make_shared<JSONValue>(id);
    o["authKey"] = std::make_shared<JSONValue>(authKey);
    o["isAdmin"] = std::make_shared<JSONValue>(isAdmin);
    o["debugMode"] = std::make_shared<JSONValue>(debugMode);
    return JSONValue{o};
}

std::optional<UserRecord> UserRecord::FromJSON(const JSONValue& v) {
    auto id = GetStringMember(v, "id");
    auto authKey = GetStringMember(v, "authKey");
    if (!id.has_value() || !authKey.has_value() || authKey->empty()) {
        return std::nullopt;
    }
    UserRecord u;
    u.id = std::move(id.value());
    u.authKey = std::move(authKey.value());
    u.isAdmin = GetBoolMember(v, "isAdmin").value_or(false);
    u.debugMode = GetBoolMember(v, "debugMode").value_or(false);
    return u;
}

std::future<std::optional<AuthIndexEntry>> LookupAuthIndex(const std::string& key,
                                                           std::shared_ptr<storage::IStorage> storage) {
    return coLookup(key, std::move(storage)).toFuture();
}

std::future<void> WriteAuthIndexEntry(const std::string& userId, const std::string& key,
                                      std::shared_ptr<storage::IStorage> storage,
                                      bool isAdmin, bool debugMode) {
    return coWrite(userId, key, std::move(storage), isAdmin, debugMode).toFuture();
}

std::future<void> RemoveAuthIndexEntry(const std::string& key, std::shared_ptr<storage::IStorage> storage) {
    return coRemove(key, std::move(storage)).toFuture();
}

std::future<ScanResult> ScanForUser(const std::string& key, std::shared_ptr<storage::IStorage> storage,
                                    std::size_t maxKeys) {
    return coScan(key, std::move(storage), maxKeys).toFuture();
}

std::future<std::size_t> RebuildAuthIndex(std::shared_ptr<storage::IStorage> storage,
                                          std::function<void(std::size_t, std::size_t)> onProgress) {
    return coRebuild(std::move(storage), std::move(onProgress)).toFuture();
}

} // namespace mcpgate::auth
