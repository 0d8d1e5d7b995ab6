//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryStorage.cpp
// Purpose: In-process storage backend (ordered map guarded by a mutex)
//==========================================================================================================

#include "mcpgate/storage/InMemoryStorage.hpp"

#include <map>
#include <mutex>
#include <stdexcept>

#include "logging/Logger.h"

namespace mcpgate::storage {

namespace {
template <typename T>
std::future<T> readyFuture(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

std::future<void> readyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}
}

class InMemoryStorage::Impl {
public:
    struct Entry {
        JSONValue value;
        std::optional<std::chrono::steady_clock::time_point> expiresAt;
    };

    explicit Impl(Clock c) : clock(std::move(c)) {}

    bool expired(const Entry& e, std::chrono::steady_clock::time_point now) const {
        return e.expiresAt.has_value() && now >= e.expiresAt.value();
    }

    // Drops expired entries; caller holds mutex.
    void purgeExpired(std::chrono::steady_clock::time_point now) {
        for (auto it = entries.begin(); it != entries.end();) {
            if (expired(it->second, now)) {
                it = entries.erase(it);
            } else {
                ++it;
            }
        }
    }

    Clock clock;
    mutable std::mutex mutex;
    std::map<std::string, Entry> entries;

    std::atomic<uint64_t> gets{0};
    std::atomic<uint64_t> lists{0};
    std::atomic<uint64_t> puts{0};
    std::atomic<uint64_t> deletes{0};
};

InMemoryStorage::InMemoryStorage()
    : InMemoryStorage([]() { return std::chrono::steady_clock::now(); }) {}

InMemoryStorage::InMemoryStorage(Clock clock)
    : pImpl(std::make_unique<Impl>(std::move(clock))) {}

InMemoryStorage::~InMemoryStorage() = default;

std::future<std::optional<JSONValue>> InMemoryStorage::Get(const std::string& key) {
    FUNC_SCOPE();
    pImpl->gets.fetch_add(1);
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    auto it = pImpl->entries.find(key);
    if (it == pImpl->entries.end()) {
        return readyFuture<std::optional<JSONValue>>(std::nullopt);
    }
    if (pImpl->expired(it->second, pImpl->clock())) {
        pImpl->entries.erase(it);
        return readyFuture<std::optional<JSONValue>>(std::nullopt);
    }
    return readyFuture<std::optional<JSONValue>>(it->second.value);
}

std::future<void> InMemoryStorage::Put(const std::string& key, const JSONValue& value, const PutOptions& opts) {
    FUNC_SCOPE();
    if (opts.ttl.has_value() && opts.ttl->count() <= 0) {
        std::promise<void> p;
        p.set_exception(std::make_exception_ptr(std::invalid_argument("ttl must be positive")));
        return p.get_future();
    }
    pImpl->puts.fetch_add(1);
    Impl::Entry e;
    e.value = value;
    if (opts.ttl.has_value()) {
        e.expiresAt = pImpl->clock() + opts.ttl.value();
    }
    {
        std::lock_guard<std::mutex> lock(pImpl->mutex);
        pImpl->entries[key] = std::move(e);
    }
    return readyFuture();
}

std::future<void> InMemoryStorage::Delete(const std::string& key) {
    FUNC_SCOPE();
    pImpl->deletes.fetch_add(1);
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->entries.erase(key);
    return readyFuture();
}

std::future<ListResult> InMemoryStorage::List(const std::string& prefix, const ListOptions& opts) {
    FUNC_SCOPE();
    pImpl->lists.fetch_add(1);
    ListResult out;
    const std::size_t limit = opts.limit == 0 ? 1 : opts.limit;

    std::lock_guard<std::mutex> lock(pImpl->mutex);
    pImpl->purgeExpired(pImpl->clock());

    // The cursor is the last key handed out; resume strictly after it.
    auto it = opts.cursor.has_value() ? pImpl->entries.upper_bound(opts.cursor.value())
                                      : pImpl->entries.lower_bound(prefix);
    if (opts.cursor.has_value() && it != pImpl->entries.end() && it->first < prefix) {
        it = pImpl->entries.lower_bound(prefix);
    }
    for (; it != pImpl->entries.end(); ++it) {
        if (it->first.compare(0, prefix.size(), prefix) != 0) {
            break;
        }
        if (out.keys.size() == limit) {
            out.complete = false;
            out.cursor = out.keys.back();
            break;
        }
        out.keys.push_back(it->first);
    }
    LOG_DEBUG("InMemoryStorage list prefix='{}' returned={} complete={}", prefix, out.keys.size(), out.complete);
    return readyFuture<ListResult>(std::move(out));
}

uint64_t InMemoryStorage::GetCount() const { return pImpl->gets.load(); }
uint64_t InMemoryStorage::ListCount() const { return pImpl->lists.load(); }
uint64_t InMemoryStorage::PutCount() const { return pImpl->puts.load(); }
uint64_t InMemoryStorage::DeleteCount() const { return pImpl->deletes.load(); }
uint64_t InMemoryStorage::ReadCount() const { return pImpl->gets.load() + pImpl->lists.load(); }

std::size_t InMemoryStorage::Size() const {
    std::lock_guard<std::mutex> lock(pImpl->mutex);
    const auto now = pImpl->clock();
    std::size_t n = 0;
    for (const auto& [k, e] : pImpl->entries) {
        if (!pImpl->expired(e, now)) ++n;
    }
    return n;
}

} // namespace mcpgate::storage
