//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Lifecycle.cpp
// Purpose: initialize handshake implementation
//==========================================================================================================

#include "mcpgate/Lifecycle.h"

#include "logging/Logger.h"
#include "mcpgate/errors/Errors.h"

namespace mcpgate {

LifecycleNegotiator::LifecycleNegotiator(Implementation serverInfo, std::optional<std::string> instructions,
                                         ServerCapabilities capabilities)
    : serverInfo_(std::move(serverInfo)), instructions_(std::move(instructions)),
      capabilities_(std::move(capabilities)) {}

ServerCapabilities LifecycleNegotiator::ComputeCapabilities(bool hasTools, bool hasResources, bool hasPrompts) {
    ServerCapabilities caps;
    if (hasTools) caps.tools = ToolsCapability{};
    if (hasResources) caps.resources = ResourcesCapability{};
    if (hasPrompts) caps.prompts = PromptsCapability{};
    caps.logging = LoggingCapability{};
    return caps;
}

JSONValue LifecycleNegotiator::Handshake(const std::optional<JSONValue>& params) const {
    FUNC_SCOPE();
    const JSONValue empty{JSONValue::Object{}};
    const JSONValue& p = params.has_value() ? params.value() : empty;

    auto requested = GetStringMember(p, "protocolVersion");
    if (!requested.has_value() || requested.value() != PROTOCOL_VERSION) {
        JSONValue::Object d;
        d["message"] = std::make_shared<JSONValue>(
            requested.has_value() ? std::string("Unsupported protocol version") : std::string("Missing protocolVersion"));
        d["supported"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
        if (requested.has_value()) {
            d["requested"] = std::make_shared<JSONValue>(requested.value());
        }
        LOG_WARN("initialize rejected: requested protocol version '{}'", requested.value_or("<none>"));
        throw errors::McpException(errors::makeError(errors::ErrorCategory::InvalidParams,
                                                     std::nullopt, JSONValue{d}));
    }

    const JSONValue* clientInfo = FindMember(p, "clientInfo");
    if (clientInfo == nullptr || !GetStringMember(*clientInfo, "name").has_value()) {
        throw errors::McpException(errors::invalidParams("clientInfo.name is required"));
    }
    LOG_INFO("initialize from client '{}'", GetStringMember(*clientInfo, "name").value());

    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>(serverInfo_.name);
    info["version"] = std::make_shared<JSONValue>(serverInfo_.version);

    JSONValue::Object result;
    result["protocolVersion"] = std::make_shared<JSONValue>(std::string(PROTOCOL_VERSION));
    result["capabilities"] = std::make_shared<JSONValue>(SerializeCapabilities(capabilities_));
    result["serverInfo"] = std::make_shared<JSONValue>(JSONValue{info});
    if (instructions_.has_value() && !instructions_->empty()) {
        result["instructions"] = std::make_shared<JSONValue>(instructions_.value());
    }
    return JSONValue{result};
}

JSONValue SerializeCapabilities(const ServerCapabilities& caps) {
    JSONValue::Object capsObj;
    if (caps.tools.has_value()) {
        JSONValue::Object toolsObj;
        toolsObj["listChanged"] = std::make_shared<JSONValue>(caps.tools->listChanged);
        capsObj["tools"] = std::make_shared<JSONValue>(toolsObj);
    }
    if (caps.resources.has_value()) {
        JSONValue::Object resourcesObj;
        resourcesObj["subscribe"] = std::make_shared<JSONValue>(caps.resources->subscribe);
        resourcesObj["listChanged"] = std::make_shared<JSONValue>(caps.resources->listChanged);
        capsObj["resources"] = std::make_shared<JSONValue>(resourcesObj);
    }
    if (caps.prompts.has_value()) {
        JSONValue::Object promptsObj;
        promptsObj["listChanged"] = std::make_shared<JSONValue>(caps.prompts->listChanged);
        capsObj["prompts"] = std::make_shared<JSONValue>(promptsObj);
    }
    if (caps.logging.has_value()) {
        capsObj["logging"] = std::make_shared<JSONValue>(JSONValue::Object{});
    }
    return JSONValue{capsObj};
}

} // namespace mcpgate
