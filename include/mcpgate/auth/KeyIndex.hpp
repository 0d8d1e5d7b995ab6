//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeyIndex.hpp
// Purpose: Auth key index (O(1) lookup by key hash) and the bounded fallback scan over user records
//==========================================================================================================

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/storage/Storage.h"

namespace mcpgate::auth {

//==========================================================================================================
// AuthIndexEntry
// Purpose: Value stored at "_auth-index/<sha256-hex(key)>".
// Fields:
//   userId, isAdmin, debugMode: Identity granted to the key.
//   createdAt: ISO-8601 UTC timestamp of when the entry was written.
//==========================================================================================================
struct AuthIndexEntry {
    std::string userId;
    bool isAdmin{false};
    bool debugMode{false};
    std::string createdAt;

    JSONValue ToJSON() const;
    // std::nullopt when the value lacks a string userId.
    static std::optional<AuthIndexEntry> FromJSON(const JSONValue& v);
};

//==========================================================================================================
// UserRecord
// Purpose: Value stored at "users/<id>", the source of truth the index is derived from.
//==========================================================================================================
struct UserRecord {
    std::string id;
    std::string authKey;
    bool isAdmin{false};
    bool debugMode{false};

    JSONValue ToJSON() const;
    // std::nullopt when id or authKey is missing.
    static std::optional<UserRecord> FromJSON(const JSONValue& v);
};

struct ScanResult {
    std::optional<UserRecord> user;
    std::size_t keysScanned{0};
};

// Reads the index entry for a raw key.
std::future<std::optional<AuthIndexEntry>> LookupAuthIndex(const std::string& key,
                                                           std::shared_ptr<storage::IStorage> storage);

//==========================================================================================================
// WriteAuthIndexEntry
// Purpose: Maps the key's hash to the given identity so later lookups skip the scan.
//==========================================================================================================
std::future<void> WriteAuthIndexEntry(const std::string& userId, const std::string& key,
                                      std::shared_ptr<storage::IStorage> storage,
                                      bool isAdmin, bool debugMode);

// Deletes the index entry for a revoked or rotated key.
std::future<void> RemoveAuthIndexEntry(const std::string& key, std::shared_ptr<storage::IStorage> storage);

//==========================================================================================================
// ScanForUser
// Purpose: Walks "users/" in pages of at most 100 keys looking for a record whose authKey matches.
// Args:
//   key: Raw key supplied by the caller.
//   storage: Backend holding user records.
//   maxKeys: Upper bound on records examined in this scan.
// Returns:
//   ScanResult with the matching user (if any) and the number of records examined.
//==========================================================================================================
std::future<ScanResult> ScanForUser(const std::string& key, std::shared_ptr<storage::IStorage> storage,
                                    std::size_t maxKeys);

//==========================================================================================================
// RebuildAuthIndex
// Purpose: Writes an index entry for every user record. Used for initial setup and index recovery.
// Args:
//   onProgress: Optional callback receiving (indexed, total).
// Returns:
//   Number of users indexed.
//==========================================================================================================
std::future<std::size_t> RebuildAuthIndex(std::shared_ptr<storage::IStorage> storage,
                                          std::function<void(std::size_t, std::size_t)> onProgress = {});

} // namespace mcpgate::auth
