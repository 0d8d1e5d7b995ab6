//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.h
// Purpose: JSON-RPC dispatcher routing MCP methods to the lifecycle negotiator and the registries
//==========================================================================================================

#pragma once

#include <future>
#include <memory>
#include <string>

#include "mcpgate/Config.h"
#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/Protocol.h"
#include "mcpgate/Registry.h"
#include "mcpgate/auth/AuthGatekeeper.hpp"
#include "mcpgate/auth/FallbackScanBudget.hpp"
#include "mcpgate/storage/Storage.h"

namespace mcpgate {

//==========================================================================================================
// RequestContext
// Purpose: Transport-level metadata accompanying one message.
// Fields:
//   authorization: Raw Authorization header value (may be empty).
//   xAuthKey: Raw X-Auth-Key header value (may be empty).
//==========================================================================================================
struct RequestContext {
    std::string authorization;
    std::string xAuthKey;
};

//==========================================================================================================
// Registries
// Purpose: Tool, resource and prompt definitions handed to the server at construction.
//==========================================================================================================
struct Registries {
    ToolRegistry tools;
    ResourceRegistry resources;
    PromptRegistry prompts;
};

//==========================================================================================================
// IServer
// Purpose: Message-level contract used by transports.
//==========================================================================================================
class IServer {
public:
    virtual ~IServer() = default;

    //==========================================================================================================
    // HandleMessage
    // Purpose: Decodes one raw JSON-RPC body and dispatches it.
    // Args:
    //   body: Raw request body.
    //   ctx: Transport headers.
    // Returns:
    //   Future resolving to the response, or to nullptr once a notification has been handled.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> HandleMessage(const std::string& body,
                                                                       const RequestContext& ctx) = 0;

    //==========================================================================================================
    // HandleRequest
    // Purpose: Dispatches an already decoded request. Always resolves to exactly one response.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> HandleRequest(const JSONRPCRequest& request,
                                                                       const RequestContext& ctx) = 0;

    //==========================================================================================================
    // HandleNotification
    // Purpose: Authenticates and routes a notification like a request, then discards the outcome.
    // Returns:
    //   Future resolving to nullptr once the call has finished.
    //==========================================================================================================
    virtual std::future<std::unique_ptr<JSONRPCResponse>> HandleNotification(const JSONRPCNotification& notification,
                                                                            const RequestContext& ctx) = 0;

    virtual ServerCapabilities GetCapabilities() const = 0;
};

class Server : public IServer {
public:
    //==========================================================================================================
    // Args:
    //   config: Server identity, auth and logging configuration.
    //   registries: Populated tool/resource/prompt registries (read-only from here on).
    //   storage: Backend for the key index, fallback scan and handlers (may be null).
    //   budget: Fallback scan admission state; built from config.auth when null.
    //==========================================================================================================
    Server(ServerConfig config, Registries registries, std::shared_ptr<storage::IStorage> storage,
           std::shared_ptr<auth::FallbackScanBudget> budget = nullptr);
    ~Server() override;

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    std::future<std::unique_ptr<JSONRPCResponse>> HandleMessage(const std::string& body,
                                                               const RequestContext& ctx) override;
    std::future<std::unique_ptr<JSONRPCResponse>> HandleRequest(const JSONRPCRequest& request,
                                                               const RequestContext& ctx) override;
    std::future<std::unique_ptr<JSONRPCResponse>> HandleNotification(const JSONRPCNotification& notification,
                                                                    const RequestContext& ctx) override;
    ServerCapabilities GetCapabilities() const override;

    // Gatekeeper instance (counters are used by tests and diagnostics).
    const auth::AuthGatekeeper& Gatekeeper() const;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

//==========================================================================================================
// IServerFactory
// Purpose: Factory for creating servers from configuration and registries.
//==========================================================================================================
class IServerFactory {
public:
    virtual ~IServerFactory() = default;
    virtual std::unique_ptr<IServer> CreateServer(ServerConfig config, Registries registries,
                                                  std::shared_ptr<storage::IStorage> storage) = 0;
};

class ServerFactory : public IServerFactory {
public:
    std::unique_ptr<IServer> CreateServer(ServerConfig config, Registries registries,
                                          std::shared_ptr<storage::IStorage> storage) override;
};

} // namespace mcpgate
