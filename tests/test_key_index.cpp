//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_key_index.cpp
// Purpose: GoogleTests for key hashing, the hashed-key auth index and the bounded user-record scan
//==========================================================================================================

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "mcpgate/auth/KeyHash.hpp"
#include "mcpgate/auth/KeyIndex.hpp"
#include "mcpgate/storage/InMemoryStorage.hpp"

using namespace mcpgate;
using namespace mcpgate::auth;

namespace {
void putUser(storage::IStorage& store, const std::string& id, const std::string& key,
             bool isAdmin = false, bool debugMode = false) {
    UserRecord u;
    u.id = id;
    u.authKey = key;
    u.isAdmin = isAdmin;
    u.debugMode = debugMode;
    store.Put(std::string(kUsersPrefix) + id, u.ToJSON()).get();
}
}

TEST(KeyHash, Sha256HexDigest) {
    EXPECT_EQ(HashKey("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(HashKey(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(KeyHashPrefix("abc"), "ba7816bf");
    EXPECT_EQ(AuthIndexKey("abc"), std::string(kAuthIndexPrefix) + HashKey("abc"));
}

TEST(KeyHash, ConstantTimeEqual) {
    EXPECT_TRUE(ConstantTimeEqual("secret-key", "secret-key"));
    EXPECT_FALSE(ConstantTimeEqual("secret-key", "secret-kez"));
    EXPECT_FALSE(ConstantTimeEqual("short", "much-longer-value"));
    EXPECT_FALSE(ConstantTimeEqual("", "x"));
}

TEST(KeyIndex, WriteLookupRemove) {
    // Arrange
    auto store = std::make_shared<storage::InMemoryStorage>();

    // Act
    WriteAuthIndexEntry("u1", "key-1", store, false, true).get();
    auto hit = LookupAuthIndex("key-1", store).get();
    auto miss = LookupAuthIndex("key-2", store).get();

    // Assert
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(hit->userId, "u1");
    EXPECT_FALSE(hit->isAdmin);
    EXPECT_TRUE(hit->debugMode);
    EXPECT_EQ(hit->createdAt.size(), 20u);  // YYYY-MM-DDTHH:MM:SSZ
    EXPECT_FALSE(miss.has_value());

    // The raw key is never stored
    auto raw = store->Get(AuthIndexKey("key-1")).get();
    ASSERT_TRUE(raw.has_value());
    EXPECT_EQ(SerializeJSON(raw.value()).find("key-1"), std::string::npos);

    RemoveAuthIndexEntry("key-1", store).get();
    EXPECT_FALSE(LookupAuthIndex("key-1", store).get().has_value());
}

TEST(KeyIndex, MalformedEntryIsAMiss) {
    auto store = std::make_shared<storage::InMemoryStorage>();
    store->Put(AuthIndexKey("k"), JSONValue{std::string("not an object")}).get();
    EXPECT_FALSE(LookupAuthIndex("k", store).get().has_value());
}

TEST(KeyIndex, ScanFindsUserAcrossPages) {
    // Arrange: more records than one scan page
    auto store = std::make_shared<storage::InMemoryStorage>();
    for (int i = 0; i < 250; ++i) {
        putUser(*store, "u" + std::to_string(1000 + i), "key-" + std::to_string(i));
    }

    // Act
    auto found = ScanForUser("key-200", store, 1000).get();
    auto missing = ScanForUser("nope", store, 1000).get();

    // Assert
    ASSERT_TRUE(found.user.has_value());
    EXPECT_EQ(found.user->id, "u1200");
    EXPECT_EQ(found.keysScanned, 201u);
    EXPECT_FALSE(missing.user.has_value());
    EXPECT_EQ(missing.keysScanned, 250u);
}

TEST(KeyIndex, ScanStopsAtMaxKeys) {
    auto store = std::make_shared<storage::InMemoryStorage>();
    for (int i = 0; i < 50; ++i) {
        putUser(*store, "u" + std::to_string(100 + i), "key-" + std::to_string(i));
    }
    auto r = ScanForUser("key-40", store, 10).get();
    EXPECT_FALSE(r.user.has_value());
    EXPECT_EQ(r.keysScanned, 10u);
}

TEST(KeyIndex, ScanSkipsMalformedRecords) {
    auto store = std::make_shared<storage::InMemoryStorage>();
    store->Put(std::string(kUsersPrefix) + "a-broken", JSONValue{JSONValue::Object{}}).get();
    putUser(*store, "b-good", "k");
    auto r = ScanForUser("k", store, 100).get();
    ASSERT_TRUE(r.user.has_value());
    EXPECT_EQ(r.user->id, "b-good");
}

TEST(KeyIndex, RebuildIndexesEveryValidRecord) {
    // Arrange
    auto store = std::make_shared<storage::InMemoryStorage>();
    for (int i = 0; i < 120; ++i) {
        putUser(*store, "u" + std::to_string(1000 + i), "key-" + std::to_string(i), i == 0, i == 1);
    }
    store->Put(std::string(kUsersPrefix) + "zz-broken", JSONValue{JSONValue::Object{}}).get();
    std::vector<std::pair<std::size_t, std::size_t>> progress;

    // Act
    const std::size_t indexed = RebuildAuthIndex(store, [&](std::size_t done, std::size_t total) {
        progress.emplace_back(done, total);
    }).get();

    // Assert
    EXPECT_EQ(indexed, 120u);
    ASSERT_EQ(progress.size(), 120u);
    EXPECT_EQ(progress.back().first, 120u);
    EXPECT_EQ(progress.back().second, 121u);
    auto admin = LookupAuthIndex("key-0", store).get();
    ASSERT_TRUE(admin.has_value());
    EXPECT_TRUE(admin->isAdmin);
    auto debug = LookupAuthIndex("key-1", store).get();
    ASSERT_TRUE(debug.has_value());
    EXPECT_TRUE(debug->debugMode);
    EXPECT_EQ(LookupAuthIndex("key-119", store).get()->userId, "u1119");
}
