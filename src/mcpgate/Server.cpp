//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Server.cpp
// Purpose: Dispatcher implementation (envelope decoding, auth gating, routing and error mapping)
//==========================================================================================================

#include "mcpgate/Server.h"

#include <array>
#include <exception>
#include <optional>

#include <fmt/format.h>
#include <openssl/rand.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpgate/Lifecycle.h"
#include "mcpgate/async/FutureAwaitable.h"
#include "mcpgate/async/Task.h"
#include "mcpgate/auth/AuthKey.hpp"
#include "mcpgate/auth/KeyHash.hpp"
#include "mcpgate/errors/Errors.h"
#include "mcpgate/validation/SchemaValidator.h"

namespace mcpgate {

namespace {
using ResponsePtr = std::unique_ptr<JSONRPCResponse>;

std::future<ResponsePtr> readyResponse(ResponsePtr resp) {
    std::promise<ResponsePtr> p;
    p.set_value(std::move(resp));
    return p.get_future();
}

// Random (version 4) UUID used to correlate the log lines of one call.
std::string newRequestId() {
    std::array<unsigned char, 16> b{};
    if (RAND_bytes(b.data(), static_cast<int>(b.size())) != 1) {
        throw std::runtime_error("RAND_bytes failed");
    }
    b[6] = static_cast<unsigned char>((b[6] & 0x0F) | 0x40);
    b[8] = static_cast<unsigned char>((b[8] & 0x3F) | 0x80);
    return fmt::format("{:02x}{:02x}{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-{:02x}{:02x}-"
                       "{:02x}{:02x}{:02x}{:02x}{:02x}{:02x}",
                       b[0], b[1], b[2], b[3], b[4], b[5], b[6], b[7],
                       b[8], b[9], b[10], b[11], b[12], b[13], b[14], b[15]);
}

// Error detail exposed only to debug-mode callers; nullopt otherwise.
std::optional<JSONValue> debugDetail(const CallContext& call, const std::string& what) {
    if (!call.debugMode) {
        return std::nullopt;
    }
    JSONValue::Object d;
    d["message"] = std::make_shared<JSONValue>(what);
    d["requestId"] = std::make_shared<JSONValue>(call.requestId);
    return errors::sanitizeData(JSONValue{d});
}

const JSONValue& paramsOrEmpty(const std::optional<JSONValue>& params) {
    static const JSONValue kEmpty{JSONValue::Object{}};
    return params.has_value() ? params.value() : kEmpty;
}
}

class Server::Impl : public std::enable_shared_from_this<Server::Impl> {
public:
    Impl(ServerConfig c, Registries r, std::shared_ptr<storage::IStorage> s,
         std::shared_ptr<auth::FallbackScanBudget> b)
        : config(std::move(c)),
          registries(std::move(r)),
          storage(std::move(s)),
          gatekeeper(config.auth, storage, std::move(b)),
          lifecycle(Implementation(config.serverName, config.serverVersion), config.instructions,
                    LifecycleNegotiator::ComputeCapabilities(!registries.tools.Empty(),
                                                             !registries.resources.Empty(),
                                                             !registries.prompts.Empty())) {}

    async::Task<ResponsePtr> coDispatch(JSONRPCRequest req, RequestContext ctx);
    async::Task<ResponsePtr> coNotify(JSONRPCNotification note, RequestContext ctx);
    async::Task<JSONValue> coCallTool(std::optional<JSONValue> params, CallContext call);
    async::Task<JSONValue> coReadResource(std::optional<JSONValue> params, CallContext call);
    async::Task<JSONValue> coGetPrompt(std::optional<JSONValue> params, CallContext call);

    JSONValue listTools(const std::optional<JSONValue>& params) const;
    JSONValue listResources(const std::optional<JSONValue>& params) const;
    JSONValue listPrompts(const std::optional<JSONValue>& params) const;
    JSONValue setLogLevel(const std::optional<JSONValue>& params) const;

    static void parsePagingParams(const std::optional<JSONValue>& params, size_t& start, size_t& limit);
    static void attachNextCursor(JSONValue::Object& resultObj, size_t start, size_t returned, size_t total);

    ServerConfig config;
    Registries registries;
    std::shared_ptr<storage::IStorage> storage;
    auth::AuthGatekeeper gatekeeper;
    LifecycleNegotiator lifecycle;
};

///////////////////////////////////////// Paging ///////////////////////////////////////////

void Server::Impl::parsePagingParams(const std::optional<JSONValue>& params, size_t& start, size_t& limit) {
    start = 0;
    limit = 0;
    const JSONValue& p = paramsOrEmpty(params);
    if (const JSONValue* cursor = FindMember(p, "cursor"); cursor != nullptr && !cursor->isNull()) {
        auto parsed = cursor->isString() ? ParseUnsigned(std::get<std::string>(cursor->value)) : std::nullopt;
        if (!parsed.has_value()) {
            throw errors::McpException(errors::invalidParams("Invalid cursor"));
        }
        start = static_cast<size_t>(parsed.value());
    }
    if (const JSONValue* lim = FindMember(p, "limit"); lim != nullptr && !lim->isNull()) {
        if (!std::holds_alternative<int64_t>(lim->value) || std::get<int64_t>(lim->value) <= 0) {
            throw errors::McpException(errors::invalidParams("limit must be a positive integer"));
        }
        limit = static_cast<size_t>(std::get<int64_t>(lim->value));
    }
}

void Server::Impl::attachNextCursor(JSONValue::Object& resultObj, size_t start, size_t returned, size_t total) {
    const size_t next = start + returned;
    if (next < total) {
        resultObj["nextCursor"] = std::make_shared<JSONValue>(std::to_string(next));
    }
}

///////////////////////////////////////// Lists ///////////////////////////////////////////

JSONValue Server::Impl::listTools(const std::optional<JSONValue>& params) const {
    LOG_DEBUG("Handling tools/list request");
    size_t start = 0, limit = 0;
    parsePagingParams(params, start, limit);
    JSONValue::Array arr;
    const auto page = registries.tools.List(start, limit);
    for (const auto& t : page) {
        const Tool& def = t->Definition();
        JSONValue::Object o;
        o["name"] = std::make_shared<JSONValue>(def.name);
        o["description"] = std::make_shared<JSONValue>(def.description);
        o["inputSchema"] = std::make_shared<JSONValue>(def.inputSchema);
        arr.push_back(std::make_shared<JSONValue>(o));
    }
    JSONValue::Object resultObj;
    resultObj["tools"] = std::make_shared<JSONValue>(arr);
    attachNextCursor(resultObj, start, page.size(), registries.tools.Size());
    return JSONValue{resultObj};
}

JSONValue Server::Impl::listResources(const std::optional<JSONValue>& params) const {
    LOG_DEBUG("Handling resources/list request");
    size_t start = 0, limit = 0;
    parsePagingParams(params, start, limit);
    JSONValue::Array arr;
    const auto page = registries.resources.List(start, limit);
    for (const auto& r : page) {
        const Resource& def = r->Definition();
        JSONValue::Object o;
        o["uri"] = std::make_shared<JSONValue>(def.uri);
        o["name"] = std::make_shared<JSONValue>(def.name);
        if (def.description.has_value()) o["description"] = std::make_shared<JSONValue>(def.description.value());
        if (def.mimeType.has_value()) o["mimeType"] = std::make_shared<JSONValue>(def.mimeType.value());
        arr.push_back(std::make_shared<JSONValue>(o));
    }
    JSONValue::Object resultObj;
    resultObj["resources"] = std::make_shared<JSONValue>(arr);
    attachNextCursor(resultObj, start, page.size(), registries.resources.Size());
    return JSONValue{resultObj};
}

JSONValue Server::Impl::listPrompts(const std::optional<JSONValue>& params) const {
    LOG_DEBUG("Handling prompts/list request");
    size_t start = 0, limit = 0;
    parsePagingParams(params, start, limit);
    JSONValue::Array arr;
    const auto page = registries.prompts.List(start, limit);
    for (const auto& p : page) {
        const Prompt& def = p->Definition();
        JSONValue::Array args;
        for (const auto& a : def.arguments) {
            JSONValue::Object ao;
            ao["name"] = std::make_shared<JSONValue>(a.name);
            if (a.description.has_value()) ao["description"] = std::make_shared<JSONValue>(a.description.value());
            ao["required"] = std::make_shared<JSONValue>(a.required);
            args.push_back(std::make_shared<JSONValue>(ao));
        }
        JSONValue::Object o;
        o["name"] = std::make_shared<JSONValue>(def.name);
        o["description"] = std::make_shared<JSONValue>(def.description);
        o["arguments"] = std::make_shared<JSONValue>(args);
        arr.push_back(std::make_shared<JSONValue>(o));
    }
    JSONValue::Object resultObj;
    resultObj["prompts"] = std::make_shared<JSONValue>(arr);
    attachNextCursor(resultObj, start, page.size(), registries.prompts.Size());
    return JSONValue{resultObj};
}

JSONValue Server::Impl::setLogLevel(const std::optional<JSONValue>& params) const {
    auto level = GetStringMember(paramsOrEmpty(params), "level");
    if (!level.has_value()) {
        throw errors::McpException(errors::invalidParams("level is required"));
    }
    if (!LogLevels::isValid(level.value())) {
        throw errors::McpException(errors::invalidParams("Invalid log level: " + level.value()));
    }
    Logger::setLogLevelFromString(level.value());
    LOG_INFO("Log level set to {}", level.value());
    return JSONValue{JSONValue::Object{}};
}

///////////////////////////////////////// Invocations ///////////////////////////////////////////

async::Task<JSONValue> Server::Impl::coCallTool(std::optional<JSONValue> params, CallContext call) {
    FUNC_SCOPE();
    const JSONValue& p = paramsOrEmpty(params);
    auto name = GetStringMember(p, "name");
    if (!name.has_value()) {
        throw errors::McpException(errors::invalidParams("Missing tool name"));
    }
    auto tool = registries.tools.Find(name.value());
    if (!tool) {
        throw errors::McpException(errors::makeError(errors::ErrorCategory::ToolNotFound,
                                                     "Tool not found: " + name.value()));
    }

    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* a = FindMember(p, "arguments"); a != nullptr && !a->isNull()) {
        if (!a->isObject()) {
            throw errors::McpException(errors::invalidParams("arguments must be an object"));
        }
        arguments = *a;
    }
    const auto check = validation::ValidateInput(arguments, tool->Definition().inputSchema);
    if (!check.valid) {
        throw errors::McpException(errors::makeError(errors::ErrorCategory::InvalidParams,
                                                     "Invalid arguments for tool: " + name.value(),
                                                     check.ToJSON()));
    }

    LOG_DEBUG("[{}] tools/call {} by {}", call.requestId, name.value(), call.userId);
    std::optional<errors::McpError> failure;
    std::optional<ToolResult> result;
    try {
        result = co_await async::makeFutureAwaitable(tool->Invoke(arguments, call));
    } catch (const errors::ToolError& e) {
        failure = errors::makeError(errors::ErrorCategory::ToolExecutionError, std::string(e.what()));
    } catch (const errors::McpException& e) {
        failure = e.error();
    } catch (const std::exception& e) {
        LOG_ERROR("[{}] tool '{}' failed: {}", call.requestId, name.value(), e.what());
        failure = errors::makeError(errors::ErrorCategory::ToolExecutionError, std::nullopt,
                                    debugDetail(call, e.what()));
    }
    if (failure.has_value()) {
        throw errors::McpException(failure.value());
    }

    JSONValue::Array content;
    for (const auto& item : result->content) {
        content.push_back(std::make_shared<JSONValue>(item));
    }
    JSONValue::Object resultObj;
    resultObj["content"] = std::make_shared<JSONValue>(content);
    resultObj["isError"] = std::make_shared<JSONValue>(result->isError);
    co_return JSONValue{resultObj};
}

async::Task<JSONValue> Server::Impl::coReadResource(std::optional<JSONValue> params, CallContext call) {
    FUNC_SCOPE();
    auto uri = GetStringMember(paramsOrEmpty(params), "uri");
    if (!uri.has_value()) {
        throw errors::McpException(errors::invalidParams("Missing resource uri"));
    }
    auto resource = registries.resources.Find(uri.value());
    if (!resource) {
        throw errors::McpException(errors::makeError(errors::ErrorCategory::ResourceNotFound,
                                                     "Resource not found: " + uri.value()));
    }

    std::optional<errors::McpError> failure;
    std::optional<ResourceContent> content;
    try {
        content = co_await async::makeFutureAwaitable(resource->Read(call));
    } catch (const errors::McpException& e) {
        failure = e.error();
    } catch (const std::exception& e) {
        LOG_ERROR("[{}] resource '{}' failed: {}", call.requestId, uri.value(), e.what());
        failure = errors::makeError(errors::ErrorCategory::InternalError, std::nullopt,
                                    debugDetail(call, e.what()));
    }
    if (failure.has_value()) {
        throw errors::McpException(failure.value());
    }

    JSONValue::Object item;
    item["uri"] = std::make_shared<JSONValue>(content->uri.empty() ? uri.value() : content->uri);
    if (content->mimeType.has_value()) item["mimeType"] = std::make_shared<JSONValue>(content->mimeType.value());
    if (content->text.has_value()) item["text"] = std::make_shared<JSONValue>(content->text.value());
    if (content->blob.has_value()) item["blob"] = std::make_shared<JSONValue>(content->blob.value());
    JSONValue::Array contents;
    contents.push_back(std::make_shared<JSONValue>(item));
    JSONValue::Object resultObj;
    resultObj["contents"] = std::make_shared<JSONValue>(contents);
    co_return JSONValue{resultObj};
}

async::Task<JSONValue> Server::Impl::coGetPrompt(std::optional<JSONValue> params, CallContext call) {
    FUNC_SCOPE();
    const JSONValue& p = paramsOrEmpty(params);
    auto name = GetStringMember(p, "name");
    if (!name.has_value()) {
        throw errors::McpException(errors::invalidParams("Missing prompt name"));
    }
    auto prompt = registries.prompts.Find(name.value());
    if (!prompt) {
        throw errors::McpException(errors::makeError(errors::ErrorCategory::PromptNotFound,
                                                     "Prompt not found: " + name.value()));
    }

    JSONValue arguments{JSONValue::Object{}};
    if (const JSONValue* a = FindMember(p, "arguments"); a != nullptr && !a->isNull()) {
        if (!a->isObject()) {
            throw errors::McpException(errors::invalidParams("arguments must be an object"));
        }
        arguments = *a;
    }
    for (const auto& arg : prompt->Definition().arguments) {
        const JSONValue* v = FindMember(arguments, arg.name);
        if (arg.required && (v == nullptr || v->isNull())) {
            throw errors::McpException(errors::makeError(errors::ErrorCategory::InvalidParams,
                                                         "Missing required argument: " + arg.name));
        }
    }

    std::optional<errors::McpError> failure;
    std::optional<PromptResult> result;
    try {
        result = co_await async::makeFutureAwaitable(prompt->Get(arguments, call));
    } catch (const errors::McpException& e) {
        failure = e.error();
    } catch (const std::exception& e) {
        LOG_ERROR("[{}] prompt '{}' failed: {}", call.requestId, name.value(), e.what());
        failure = errors::makeError(errors::ErrorCategory::InternalError, std::nullopt,
                                    debugDetail(call, e.what()));
    }
    if (failure.has_value()) {
        throw errors::McpException(failure.value());
    }

    JSONValue::Array messages;
    for (const auto& m : result->messages) {
        messages.push_back(std::make_shared<JSONValue>(m));
    }
    JSONValue::Object resultObj;
    resultObj["description"] = std::make_shared<JSONValue>(result->description);
    resultObj["messages"] = std::make_shared<JSONValue>(messages);
    co_return JSONValue{resultObj};
}

///////////////////////////////////////// Dispatch ///////////////////////////////////////////

async::Task<ResponsePtr> Server::Impl::coDispatch(JSONRPCRequest req, RequestContext ctx) {
    FUNC_SCOPE();
    [[maybe_unused]] auto self = shared_from_this();
    const Method method = methodFromString(req.method);

    CallContext call;
    call.storage = storage;
    call.userId = "anonymous";
    std::optional<errors::McpError> failure;
    std::optional<JSONValue> result;
    std::string internalCause;

    try {
        call.requestId = newRequestId();

        if (config.auth.requireAuth && requiresAuth(method)) {
            auto key = auth::ExtractAuthKey(ctx.authorization, ctx.xAuthKey, req.params);
            if (!key.has_value()) {
                co_return errors::makeErrorResponse(req.id, errors::makeError(errors::ErrorCategory::AuthRequired));
            }
            const auth::AuthResult ar = co_await async::makeFutureAwaitable(gatekeeper.Authenticate(key.value()));
            switch (ar.status) {
                case auth::AuthResult::Status::Ok:
                    break;
                case auth::AuthResult::Status::Failed:
                    LOG_INFO("[{}] {} rejected for key {}", call.requestId, req.method, auth::KeyHashPrefix(key.value()));
                    co_return errors::makeErrorResponse(req.id, errors::makeError(errors::ErrorCategory::AuthFailed));
                case auth::AuthResult::Status::RateLimited: {
                    std::optional<JSONValue> data;
                    if (ar.retryAfter.has_value()) {
                        JSONValue::Object d;
                        d["retryAfterMs"] = std::make_shared<JSONValue>(static_cast<int64_t>(ar.retryAfter->count()));
                        data = JSONValue{d};
                    }
                    co_return errors::makeErrorResponse(
                        req.id, errors::makeError(errors::ErrorCategory::RateLimited, std::nullopt, data));
                }
            }
            call.authKeyHash = auth::HashKey(key.value());
            call.userId = ar.userId;
            call.isAdmin = ar.isAdmin;
            call.debugMode = ar.debugMode;
        }

        switch (method) {
            case Method::Initialize:
                result = lifecycle.Handshake(req.params);
                break;
            case Method::Initialized:
                // Sent with an id by some clients; acknowledge with an empty result.
                result = JSONValue{JSONValue::Object{}};
                break;
            case Method::ToolsList:
                result = listTools(req.params);
                break;
            case Method::ToolsCall:
                result = co_await async::makeFutureAwaitable(coCallTool(req.params, call).toFuture());
                break;
            case Method::ResourcesList:
                result = listResources(req.params);
                break;
            case Method::ResourcesRead:
                result = co_await async::makeFutureAwaitable(coReadResource(req.params, call).toFuture());
                break;
            case Method::PromptsList:
                result = listPrompts(req.params);
                break;
            case Method::PromptsGet:
                result = co_await async::makeFutureAwaitable(coGetPrompt(req.params, call).toFuture());
                break;
            case Method::LoggingSetLevel:
                result = setLogLevel(req.params);
                break;
            case Method::Unknown:
                failure = errors::makeError(errors::ErrorCategory::MethodNotFound, "Method not found: " + req.method);
                break;
        }
    } catch (const errors::McpException& e) {
        failure = e.error();
    } catch (const std::exception& e) {
        internalCause = e.what();
    }

    if (!internalCause.empty()) {
        LOG_ERROR("[{}] {} failed: {}", call.requestId, req.method, internalCause);
        co_return errors::makeErrorResponse(
            req.id, errors::makeError(errors::ErrorCategory::InternalError, std::nullopt,
                                      debugDetail(call, internalCause)));
    }
    if (failure.has_value()) {
        LOG_DEBUG("[{}] {} -> error {} {}", call.requestId, req.method, failure->code, failure->message);
        co_return errors::makeErrorResponse(req.id, failure.value());
    }
    co_return std::make_unique<JSONRPCResponse>(req.id, std::move(result.value()));
}

// Notifications run the same auth and routing as requests; only the response is dropped.
async::Task<ResponsePtr> Server::Impl::coNotify(JSONRPCNotification note, RequestContext ctx) {
    FUNC_SCOPE();
    [[maybe_unused]] auto self = shared_from_this();
    if (methodFromString(note.method) == Method::Initialized) {
        LOG_DEBUG("Client initialized");
        co_return nullptr;
    }
    JSONRPCRequest req(nullptr, note.method, note.params);
    ResponsePtr discarded = co_await async::makeFutureAwaitable(coDispatch(std::move(req), std::move(ctx)).toFuture());
    if (discarded && discarded->error.has_value()) {
        LOG_DEBUG("Notification {} failed: {}", note.method, SerializeJSON(discarded->error.value()));
    }
    co_return nullptr;
}

///////////////////////////////////////// Server ///////////////////////////////////////////

Server::Server(ServerConfig config, Registries registries, std::shared_ptr<storage::IStorage> storage,
               std::shared_ptr<auth::FallbackScanBudget> budget)
    : pImpl(std::make_shared<Impl>(std::move(config), std::move(registries), std::move(storage), std::move(budget))) {
    FUNC_SCOPE();
    LOG_INFO("Server '{}' ready: {} tools, {} resources, {} prompts, auth {}",
             pImpl->config.serverName, pImpl->registries.tools.Size(), pImpl->registries.resources.Size(),
             pImpl->registries.prompts.Size(), pImpl->config.auth.requireAuth ? "required" : "disabled");
}

Server::~Server() = default;

std::future<ResponsePtr> Server::HandleMessage(const std::string& body, const RequestContext& ctx) {
    FUNC_SCOPE();
    JSONValue doc;
    try {
        doc = ParseJSON(body);
    } catch (const std::exception& e) {
        LOG_DEBUG("Rejecting unparseable body: {}", e.what());
        return readyResponse(errors::makeErrorResponse(
            nullptr, errors::makeError(errors::ErrorCategory::ParseError, std::string("Parse error: Invalid JSON"))));
    }

    if (!doc.isObject()) {
        return readyResponse(errors::makeErrorResponse(
            nullptr, errors::makeError(errors::ErrorCategory::InvalidRequest, std::string("Invalid request: expected an object"))));
    }

    const JSONValue* idVal = FindMember(doc, "id");
    const auto method = GetStringMember(doc, "method");
    const auto version = GetStringMember(doc, "jsonrpc");
    const JSONValue* params = FindMember(doc, "params");
    const bool paramsOk = params == nullptr || params->isObject();

    if (idVal == nullptr) {
        // Notifications never produce a response, even when malformed.
        if (version != std::optional<std::string>("2.0") || !method.has_value() || !paramsOk) {
            LOG_WARN("Dropping malformed notification");
            return readyResponse(nullptr);
        }
        JSONRPCNotification note(method.value());
        if (params != nullptr) note.params = *params;
        return HandleNotification(note, ctx);
    }

    auto id = JSONRPCIdFromValue(*idVal);
    if (!id.has_value()) {
        return readyResponse(errors::makeErrorResponse(
            nullptr, errors::makeError(errors::ErrorCategory::InvalidRequest, std::string("Invalid request: bad id"))));
    }
    if (version != std::optional<std::string>("2.0")) {
        return readyResponse(errors::makeErrorResponse(
            id.value(), errors::makeError(errors::ErrorCategory::InvalidRequest, std::string("Invalid request: jsonrpc must be \"2.0\""))));
    }
    if (!method.has_value()) {
        return readyResponse(errors::makeErrorResponse(
            id.value(), errors::makeError(errors::ErrorCategory::InvalidRequest, std::string("Invalid request: method must be a string"))));
    }
    if (!paramsOk) {
        return readyResponse(errors::makeErrorResponse(
            id.value(), errors::makeError(errors::ErrorCategory::InvalidRequest, std::string("Invalid request: params must be an object"))));
    }

    JSONRPCRequest req(id.value(), method.value());
    if (params != nullptr) req.params = *params;
    return HandleRequest(req, ctx);
}

std::future<ResponsePtr> Server::HandleRequest(const JSONRPCRequest& request, const RequestContext& ctx) {
    return pImpl->coDispatch(request, ctx).toFuture();
}

std::future<ResponsePtr> Server::HandleNotification(const JSONRPCNotification& notification,
                                                    const RequestContext& ctx) {
    return pImpl->coNotify(notification, ctx).toFuture();
}

ServerCapabilities Server::GetCapabilities() const {
    return pImpl->lifecycle.Capabilities();
}

const auth::AuthGatekeeper& Server::Gatekeeper() const {
    return pImpl->gatekeeper;
}

std::unique_ptr<IServer> ServerFactory::CreateServer(ServerConfig config, Registries registries,
                                                     std::shared_ptr<storage::IStorage> storage) {
    return std::make_unique<Server>(std::move(config), std::move(registries), std::move(storage));
}

} // namespace mcpgate
