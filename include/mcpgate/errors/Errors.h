//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Error taxonomy, typed error structures and JSON-RPC error mapping helpers for mcpgate
//==========================================================================================================

#pragma once

#include <algorithm>
#include <cctype>
#include <optional>
#include <stdexcept>
#include <string>

#include "mcpgate/JSONRPCTypes.h"

namespace mcpgate {
namespace errors {

// Error kinds. Every failure leaving the core is classified as one of these.
enum class ErrorCategory {
    ParseError,
    InvalidRequest,
    MethodNotFound,
    InvalidParams,
    InternalError,
    AuthRequired,
    AuthFailed,
    RateLimited,
    ToolNotFound,
    ResourceNotFound,
    PromptNotFound,
    ToolExecutionError,
    Unknown
};

// Typed error representation used by the gateway.
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

// Map an ErrorCategory to its protocol-stable numeric code.
//
// Args:
//   category: The error kind.
//
// Returns:
//   The JSON-RPC code; InternalError's code for Unknown.
inline int codeFromCategory(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ParseError: return JSONRPCErrorCodes::ParseError;
        case ErrorCategory::InvalidRequest: return JSONRPCErrorCodes::InvalidRequest;
        case ErrorCategory::MethodNotFound: return JSONRPCErrorCodes::MethodNotFound;
        case ErrorCategory::InvalidParams: return JSONRPCErrorCodes::InvalidParams;
        case ErrorCategory::InternalError: return JSONRPCErrorCodes::InternalError;
        case ErrorCategory::AuthRequired: return JSONRPCErrorCodes::AuthRequired;
        case ErrorCategory::AuthFailed: return JSONRPCErrorCodes::AuthFailed;
        case ErrorCategory::RateLimited: return JSONRPCErrorCodes::RateLimited;
        case ErrorCategory::ToolNotFound: return JSONRPCErrorCodes::ToolNotFound;
        case ErrorCategory::ResourceNotFound: return JSONRPCErrorCodes::ResourceNotFound;
        case ErrorCategory::PromptNotFound: return JSONRPCErrorCodes::PromptNotFound;
        case ErrorCategory::ToolExecutionError: return JSONRPCErrorCodes::ToolExecutionError;
        case ErrorCategory::Unknown: break;
    }
    return JSONRPCErrorCodes::InternalError;
}

// Map a numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code.
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::ParseError;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::InvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::MethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::InvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::InternalError;
        case JSONRPCErrorCodes::AuthRequired: return ErrorCategory::AuthRequired;
        case JSONRPCErrorCodes::AuthFailed: return ErrorCategory::AuthFailed;
        case JSONRPCErrorCodes::RateLimited: return ErrorCategory::RateLimited;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::ToolNotFound;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::ResourceNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::PromptNotFound;
        case JSONRPCErrorCodes::ToolExecutionError: return ErrorCategory::ToolExecutionError;
        default: return ErrorCategory::Unknown;
    }
}

// Default human-readable message for each kind.
inline const char* defaultMessage(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::ParseError: return "Parse error";
        case ErrorCategory::InvalidRequest: return "Invalid request";
        case ErrorCategory::MethodNotFound: return "Method not found";
        case ErrorCategory::InvalidParams: return "Invalid params";
        case ErrorCategory::InternalError: return "Internal error";
        case ErrorCategory::AuthRequired: return "Authentication required";
        case ErrorCategory::AuthFailed: return "Authentication failed";
        case ErrorCategory::RateLimited: return "Rate limit exceeded";
        case ErrorCategory::ToolNotFound: return "Tool not found";
        case ErrorCategory::ResourceNotFound: return "Resource not found";
        case ErrorCategory::PromptNotFound: return "Prompt not found";
        case ErrorCategory::ToolExecutionError: return "Tool execution failed";
        case ErrorCategory::Unknown: break;
    }
    return "Internal error";
}

// Build a typed error for a kind.
//
// Args:
//   category: The error kind.
//   message: Optional message; defaultMessage(category) when absent.
//   data: Optional structured detail.
//
// Returns:
//   McpError with code, message, data and category populated.
inline McpError makeError(ErrorCategory category,
                          std::optional<std::string> message = std::nullopt,
                          std::optional<JSONValue> data = std::nullopt) {
    McpError e;
    e.category = category;
    e.code = codeFromCategory(category);
    e.message = message.has_value() ? std::move(*message) : std::string(defaultMessage(category));
    e.data = std::move(data);
    return e;
}

// Convenience: invalid-params with a { message } detail object.
inline McpError invalidParams(const std::string& detail) {
    JSONValue::Object d;
    d["message"] = std::make_shared<JSONValue>(detail);
    return makeError(ErrorCategory::InvalidParams, std::nullopt, JSONValue{d});
}

//==========================================================================================================
// McpException
// Purpose: Carries a classified McpError through component boundaries up to the dispatcher.
//==========================================================================================================
class McpException : public std::runtime_error {
public:
    explicit McpException(McpError err)
        : std::runtime_error(err.message), error_(std::move(err)) {}

    const McpError& error() const noexcept { return error_; }

private:
    McpError error_;
};

//==========================================================================================================
// ToolError
// Purpose: Thrown by tool handlers for failures whose message is safe to show to the caller.
//          Any other exception escaping a handler is redacted.
//==========================================================================================================
class ToolError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// Returns std::nullopt when the input is not a valid error object.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   std::optional<McpError> populated when shape is valid.
inline std::optional<McpError> mcpErrorFromErrorValue(const JSONValue& errVal) {
    if (!std::holds_alternative<JSONValue::Object>(errVal.value)) {
        return std::nullopt;
    }
    const auto& obj = std::get<JSONValue::Object>(errVal.value);
    auto itCode = obj.find("code");
    auto itMsg = obj.find("message");
    if (itCode == obj.end() || itMsg == obj.end()) {
        return std::nullopt;
    }
    if (!itCode->second || !itMsg->second) {
        return std::nullopt;
    }
    if (!std::holds_alternative<int64_t>(itCode->second->value) ||
        !std::holds_alternative<std::string>(itMsg->second->value)) {
        return std::nullopt;
    }
    int code = static_cast<int>(std::get<int64_t>(itCode->second->value));
    std::string message = std::get<std::string>(itMsg->second->value);

    std::optional<JSONValue> data;
    auto itData = obj.find("data");
    if (itData != obj.end() && itData->second) {
        data = *(itData->second);
    }

    McpError e;
    e.code = code;
    e.message = std::move(message);
    e.data = std::move(data);
    e.category = errorCategoryFromCode(code);
    return e;
}

// Extract McpError from a JSONRPCResponse if it carries an error.
inline std::optional<McpError> mcpErrorFromResponse(const JSONRPCResponse& response) {
    if (!response.error.has_value()) {
        return std::nullopt;
    }
    return mcpErrorFromErrorValue(response.error.value());
}

// Create a JSONValue error object from a typed McpError.
inline JSONValue makeErrorValue(const McpError& err) {
    return CreateErrorObject(err.code, err.message, err.data);
}

// Convenience: Create a JSONRPCResponse error from McpError and id.
//
// Args:
//   id: JSON-RPC id to echo in the response.
//   err: Typed error to map.
//
// Returns:
//   std::unique_ptr<JSONRPCResponse> containing an error.
inline std::unique_ptr<JSONRPCResponse> makeErrorResponse(const JSONRPCId& id, const McpError& err) {
    return CreateErrorResponse(id, err.code, err.message, err.data);
}

// True when a member name looks like it carries a credential.
inline bool isSensitiveKey(const std::string& key) {
    std::string lower;
    lower.reserve(key.size());
    for (char c : key) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    static const char* const kPatterns[] = {"password", "secret", "key", "token", "auth", "credential"};
    return std::any_of(std::begin(kPatterns), std::end(kPatterns), [&](const char* p) {
        return lower.find(p) != std::string::npos;
    });
}

// Recursively drop object members whose names look like credentials before detail leaves the process.
//
// Args:
//   value: Arbitrary detail payload.
//
// Returns:
//   Copy of value without sensitive members.
inline JSONValue sanitizeData(const JSONValue& value) {
    if (std::holds_alternative<JSONValue::Object>(value.value)) {
        JSONValue::Object out;
        for (const auto& [k, v] : std::get<JSONValue::Object>(value.value)) {
            if (isSensitiveKey(k) || !v) continue;
            out[k] = std::make_shared<JSONValue>(sanitizeData(*v));
        }
        return JSONValue{out};
    }
    if (std::holds_alternative<JSONValue::Array>(value.value)) {
        JSONValue::Array out;
        for (const auto& v : std::get<JSONValue::Array>(value.value)) {
            out.push_back(std::make_shared<JSONValue>(v ? sanitizeData(*v) : JSONValue{}));
        }
        return JSONValue{out};
    }
    return value;
}

} // namespace errors
} // namespace mcpgate
