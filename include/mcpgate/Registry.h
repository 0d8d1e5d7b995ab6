//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Registry.h
// Purpose: Tool, resource and prompt contracts and the insertion-ordered registry that holds them
//==========================================================================================================

#pragma once

#include <algorithm>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <stdexcept>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/Protocol.h"
#include "mcpgate/storage/Storage.h"

namespace mcpgate {

//==========================================================================================================
// CallContext
// Purpose: Per-call identity and services handed to handlers. Never persisted.
// Fields:
//   authKeyHash: SHA-256 hex of the caller's key (empty for anonymous callers); the raw key is not exposed.
//   userId, isAdmin, debugMode: Identity resolved by the gatekeeper.
//   requestId: Random UUID correlating log lines for this call.
//   storage: Backend shared with the gatekeeper (may be null).
//==========================================================================================================
struct CallContext {
    std::string authKeyHash;
    std::string userId;
    bool isAdmin{false};
    bool debugMode{false};
    std::string requestId;
    std::shared_ptr<storage::IStorage> storage;
};

///////////////////////////////////////// Contracts ///////////////////////////////////////////

// Handlers report failures by throwing: errors::ToolError for caller-visible tool failures,
// errors::McpException for classified failures, anything else is treated as internal.
class ITool {
public:
    virtual ~ITool() = default;
    virtual const Tool& Definition() const = 0;
    virtual std::future<ToolResult> Invoke(const JSONValue& arguments, const CallContext& ctx) = 0;
};

class IResource {
public:
    virtual ~IResource() = default;
    virtual const Resource& Definition() const = 0;
    virtual std::future<ResourceContent> Read(const CallContext& ctx) = 0;
};

class IPrompt {
public:
    virtual ~IPrompt() = default;
    virtual const Prompt& Definition() const = 0;
    virtual std::future<PromptResult> Get(const JSONValue& arguments, const CallContext& ctx) = 0;
};

///////////////////////////////////////// Callable adapters ///////////////////////////////////////////

using ToolHandler = std::function<std::future<ToolResult>(const JSONValue&, const CallContext&)>;
using ResourceHandler = std::function<std::future<ResourceContent>(const CallContext&)>;
using PromptHandler = std::function<std::future<PromptResult>(const JSONValue&, const CallContext&)>;

class FunctionTool : public ITool {
public:
    FunctionTool(Tool def, ToolHandler handler) : def_(std::move(def)), handler_(std::move(handler)) {}
    const Tool& Definition() const override { return def_; }
    std::future<ToolResult> Invoke(const JSONValue& arguments, const CallContext& ctx) override {
        return handler_(arguments, ctx);
    }

private:
    Tool def_;
    ToolHandler handler_;
};

class FunctionResource : public IResource {
public:
    FunctionResource(Resource def, ResourceHandler handler) : def_(std::move(def)), handler_(std::move(handler)) {}
    const Resource& Definition() const override { return def_; }
    std::future<ResourceContent> Read(const CallContext& ctx) override { return handler_(ctx); }

private:
    Resource def_;
    ResourceHandler handler_;
};

class FunctionPrompt : public IPrompt {
public:
    FunctionPrompt(Prompt def, PromptHandler handler) : def_(std::move(def)), handler_(std::move(handler)) {}
    const Prompt& Definition() const override { return def_; }
    std::future<PromptResult> Get(const JSONValue& arguments, const CallContext& ctx) override {
        return handler_(arguments, ctx);
    }

private:
    Prompt def_;
    PromptHandler handler_;
};

// Registry keys: tools and prompts by name, resources by URI.
inline const std::string& RegistryKey(const ITool& t) { return t.Definition().name; }
inline const std::string& RegistryKey(const IResource& r) { return r.Definition().uri; }
inline const std::string& RegistryKey(const IPrompt& p) { return p.Definition().name; }

//==========================================================================================================
// Registry
// Purpose: Insertion-ordered set of definitions keyed by name (or URI).
// Notes:
//   - Populated during server construction and read-only afterwards, so lookups take no lock.
//   - Register throws std::invalid_argument on a duplicate or empty key.
//==========================================================================================================
template <typename T>
class Registry {
public:
    void Register(std::shared_ptr<T> item) {
        if (!item) {
            throw std::invalid_argument("Registry: null entry");
        }
        const std::string key = RegistryKey(*item);
        if (key.empty()) {
            throw std::invalid_argument("Registry: empty key");
        }
        if (index_.find(key) != index_.end()) {
            throw std::invalid_argument("Duplicate registration: " + key);
        }
        index_.emplace(key, items_.size());
        items_.push_back(std::move(item));
    }

    std::shared_ptr<T> Find(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : items_[it->second];
    }

    // Entries [start, start + limit) in registration order; limit 0 means "to the end".
    std::vector<std::shared_ptr<T>> List(std::size_t start = 0, std::size_t limit = 0) const {
        std::vector<std::shared_ptr<T>> out;
        if (start >= items_.size()) {
            return out;
        }
        const std::size_t end = (limit == 0) ? items_.size() : std::min(items_.size(), start + limit);
        out.assign(items_.begin() + static_cast<std::ptrdiff_t>(start),
                   items_.begin() + static_cast<std::ptrdiff_t>(end));
        return out;
    }

    std::size_t Size() const { return items_.size(); }
    bool Empty() const { return items_.empty(); }

private:
    std::vector<std::shared_ptr<T>> items_;
    std::unordered_map<std::string, std::size_t> index_;
};

using ToolRegistry = Registry<ITool>;
using ResourceRegistry = Registry<IResource>;
using PromptRegistry = Registry<IPrompt>;

} // namespace mcpgate
