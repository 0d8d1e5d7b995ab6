//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: MCP protocol data structures, method routing enum and constants for mcpgate
//==========================================================================================================

#pragma once

#include "mcpgate/JSONRPCTypes.h"

#include <string>
#include <string_view>
#include <vector>
#include <optional>

namespace mcpgate {

///////////////////////////////////////// Protocol constants ///////////////////////////////////////////

// The single protocol version this server negotiates
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////

struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////

struct ToolsCapability {
    bool listChanged = false;
};

struct ResourcesCapability {
    bool subscribe = false;
    bool listChanged = false;
};

struct PromptsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
    // Presence indicates logging/setLevel is accepted
};

// A feature group is present exactly when its registry is non-empty.
struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<ResourcesCapability> resources;
    std::optional<PromptsCapability> prompts;
    std::optional<LoggingCapability> logging;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////

struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool arguments

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

struct ToolResult {
    std::vector<JSONValue> content;  // Array of content items
    bool isError = false;
};

///////////////////////////////////////// Resources ///////////////////////////////////////////

struct Resource {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mimeType;

    Resource() = default;
    Resource(std::string uri, std::string name,
             std::optional<std::string> description = std::nullopt,
             std::optional<std::string> mimeType = std::nullopt)
        : uri(std::move(uri)), name(std::move(name)),
          description(std::move(description)), mimeType(std::move(mimeType)) {}
};

// One content item returned by resources/read. Exactly one of text or blob (base64) is set.
struct ResourceContent {
    std::string uri;
    std::optional<std::string> mimeType;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

///////////////////////////////////////// Prompts ///////////////////////////////////////////

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

struct Prompt {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;

    Prompt() = default;
    Prompt(std::string name, std::string description, std::vector<PromptArgument> arguments = {})
        : name(std::move(name)), description(std::move(description)), arguments(std::move(arguments)) {}
};

struct PromptResult {
    std::string description;
    std::vector<JSONValue> messages;  // Array of { role, content } objects
};

///////////////////////////////////////// Method names ///////////////////////////////////////////

namespace Methods {
    constexpr const char* Initialize = "initialize";
    constexpr const char* Initialized = "initialized";
    constexpr const char* NotificationsInitialized = "notifications/initialized";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";
    constexpr const char* ListResources = "resources/list";
    constexpr const char* ReadResource = "resources/read";
    constexpr const char* ListPrompts = "prompts/list";
    constexpr const char* GetPrompt = "prompts/get";
    constexpr const char* SetLogLevel = "logging/setLevel";
}

//==========================================================================================================
// Method
// Purpose: Closed set of routable methods. Every dispatch switch must handle each member explicitly.
//==========================================================================================================
enum class Method {
    Initialize,
    Initialized,
    ToolsList,
    ToolsCall,
    ResourcesList,
    ResourcesRead,
    PromptsList,
    PromptsGet,
    LoggingSetLevel,
    Unknown
};

inline Method methodFromString(std::string_view name) {
    if (name == Methods::Initialize) return Method::Initialize;
    if (name == Methods::Initialized || name == Methods::NotificationsInitialized) return Method::Initialized;
    if (name == Methods::ListTools) return Method::ToolsList;
    if (name == Methods::CallTool) return Method::ToolsCall;
    if (name == Methods::ListResources) return Method::ResourcesList;
    if (name == Methods::ReadResource) return Method::ResourcesRead;
    if (name == Methods::ListPrompts) return Method::PromptsList;
    if (name == Methods::GetPrompt) return Method::PromptsGet;
    if (name == Methods::SetLogLevel) return Method::LoggingSetLevel;
    return Method::Unknown;
}

// Lifecycle methods are reachable without credentials; everything else is gated when auth is required.
inline bool requiresAuth(Method m) {
    switch (m) {
        case Method::Initialize:
        case Method::Initialized:
        case Method::Unknown:
            return false;
        case Method::ToolsList:
        case Method::ToolsCall:
        case Method::ResourcesList:
        case Method::ResourcesRead:
        case Method::PromptsList:
        case Method::PromptsGet:
        case Method::LoggingSetLevel:
            return true;
    }
    return true;
}

// Severity names accepted by logging/setLevel
namespace LogLevels {
    constexpr const char* All[] = {
        "debug", "info", "notice", "warning", "error", "critical", "alert", "emergency"
    };

    inline bool isValid(std::string_view level) {
        for (const char* l : All) {
            if (level == l) return true;
        }
        return false;
    }
}

} // namespace mcpgate
