//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryStorage.hpp
// Purpose: Thread-safe in-process IStorage with TTL expiry, ordered listing and access counters
//==========================================================================================================

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

#include "mcpgate/storage/Storage.h"

namespace mcpgate::storage {

class InMemoryStorage : public IStorage {
public:
    using Clock = std::function<std::chrono::steady_clock::time_point()>;

    InMemoryStorage();
    // Clock is injectable so TTL expiry can be tested without sleeping.
    explicit InMemoryStorage(Clock clock);
    ~InMemoryStorage() override;

    std::future<std::optional<JSONValue>> Get(const std::string& key) override;
    std::future<void> Put(const std::string& key, const JSONValue& value, const PutOptions& opts = {}) override;
    std::future<void> Delete(const std::string& key) override;
    std::future<ListResult> List(const std::string& prefix, const ListOptions& opts = {}) override;

    // Access counters
    uint64_t GetCount() const;
    uint64_t ListCount() const;
    uint64_t PutCount() const;
    uint64_t DeleteCount() const;
    // Total read operations (Get + List)
    uint64_t ReadCount() const;

    // Number of live (unexpired) entries
    std::size_t Size() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcpgate::storage
