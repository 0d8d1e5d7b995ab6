//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Storage.h
// Purpose: Asynchronous key/value storage contract consumed by the auth gatekeeper and tool handlers
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include "mcpgate/JSONRPCTypes.h"

namespace mcpgate::storage {

//==========================================================================================================
// PutOptions
// Fields:
//   ttl: Entry lifetime; the entry is treated as absent once it elapses. No expiry when unset.
//==========================================================================================================
struct PutOptions {
    std::optional<std::chrono::seconds> ttl;
};

//==========================================================================================================
// ListOptions
// Fields:
//   limit: Maximum number of keys returned by one call.
//   cursor: Opaque continuation token from a previous ListResult.
//==========================================================================================================
struct ListOptions {
    std::size_t limit{1000};
    std::optional<std::string> cursor;
};

//==========================================================================================================
// ListResult
// Fields:
//   keys: Matching keys in ascending order.
//   cursor: Continuation token, present when complete is false.
//   complete: True when no further keys match the prefix.
//==========================================================================================================
struct ListResult {
    std::vector<std::string> keys;
    std::optional<std::string> cursor;
    bool complete{true};
};

//==========================================================================================================
// IStorage
// Purpose: Backend-agnostic key/value store. Failures are delivered as exceptions through the futures.
//==========================================================================================================
class IStorage {
public:
    virtual ~IStorage() = default;

    virtual std::future<std::optional<JSONValue>> Get(const std::string& key) = 0;
    virtual std::future<void> Put(const std::string& key, const JSONValue& value, const PutOptions& opts = {}) = 0;
    virtual std::future<void> Delete(const std::string& key) = 0;
    virtual std::future<ListResult> List(const std::string& prefix, const ListOptions& opts = {}) = 0;
};

} // namespace mcpgate::storage
