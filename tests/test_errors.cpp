//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the error taxonomy, code mapping and detail sanitization
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/errors/Errors.h"

using namespace mcpgate;
using mcpgate::errors::ErrorCategory;

TEST(Errors, CodesAreStable) {
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::ParseError), -32700);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::InvalidRequest), -32600);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::MethodNotFound), -32601);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::InvalidParams), -32602);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::InternalError), -32603);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::AuthRequired), -32001);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::AuthFailed), -32002);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::RateLimited), -32003);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::ToolNotFound), -32004);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::ResourceNotFound), -32005);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::PromptNotFound), -32006);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::ToolExecutionError), -32007);
}

TEST(Errors, CategoryMapping) {
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::ParseError);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::AuthFailed), ErrorCategory::AuthFailed);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolExecutionError), ErrorCategory::ToolExecutionError);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
    EXPECT_EQ(errors::codeFromCategory(ErrorCategory::Unknown), JSONRPCErrorCodes::InternalError);
}

TEST(Errors, MakeErrorUsesDefaultMessage) {
    auto e = errors::makeError(ErrorCategory::RateLimited);
    EXPECT_EQ(e.code, -32003);
    EXPECT_EQ(e.message, "Rate limit exceeded");
    EXPECT_FALSE(e.data.has_value());

    auto custom = errors::makeError(ErrorCategory::ToolNotFound, std::string("Tool not found: x"));
    EXPECT_EQ(custom.message, "Tool not found: x");
}

TEST(Errors, ErrorResponseShape) {
    // Arrange
    auto err = errors::invalidParams("name is required");

    // Act
    auto resp = errors::makeErrorResponse(JSONRPCId{static_cast<int64_t>(7)}, err);

    // Assert
    ASSERT_TRUE(resp != nullptr);
    ASSERT_TRUE(resp->IsError());
    EXPECT_FALSE(resp->result.has_value());
    EXPECT_EQ(std::get<int64_t>(resp->id), 7);
    auto parsed = errors::mcpErrorFromResponse(*resp);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(parsed->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(parsed->category, ErrorCategory::InvalidParams);
    ASSERT_TRUE(parsed->data.has_value());
    EXPECT_EQ(GetStringMember(parsed->data.value(), "message").value_or(""), "name is required");
}

TEST(Errors, ExceptionCarriesTypedError) {
    try {
        throw errors::McpException(errors::makeError(ErrorCategory::PromptNotFound, std::string("Prompt not found: p")));
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.error().code, -32006);
        EXPECT_STREQ(e.what(), "Prompt not found: p");
    }
}

TEST(Errors, SanitizeDropsCredentialMembers) {
    // Arrange: nested payload mixing safe and sensitive names
    JSONValue::Object inner;
    inner["apiKey"] = std::make_shared<JSONValue>(std::string("sk-123"));
    inner["count"] = std::make_shared<JSONValue>(static_cast<int64_t>(3));
    JSONValue::Object outer;
    outer["Password"] = std::make_shared<JSONValue>(std::string("hunter2"));
    outer["message"] = std::make_shared<JSONValue>(std::string("boom"));
    outer["nested"] = std::make_shared<JSONValue>(JSONValue{inner});
    JSONValue::Array arr;
    JSONValue::Object tokenObj;
    tokenObj["access_token"] = std::make_shared<JSONValue>(std::string("t"));
    arr.push_back(std::make_shared<JSONValue>(JSONValue{tokenObj}));
    outer["list"] = std::make_shared<JSONValue>(JSONValue{arr});

    // Act
    JSONValue clean = errors::sanitizeData(JSONValue{outer});

    // Assert
    EXPECT_EQ(FindMember(clean, "Password"), nullptr);
    EXPECT_EQ(GetStringMember(clean, "message").value_or(""), "boom");
    const JSONValue* nested = FindMember(clean, "nested");
    ASSERT_NE(nested, nullptr);
    EXPECT_EQ(FindMember(*nested, "apiKey"), nullptr);
    EXPECT_NE(FindMember(*nested, "count"), nullptr);
    const JSONValue* list = FindMember(clean, "list");
    ASSERT_NE(list, nullptr);
    ASSERT_TRUE(list->isArray());
    const auto& items = std::get<JSONValue::Array>(list->value);
    ASSERT_EQ(items.size(), 1u);
    EXPECT_EQ(FindMember(*items[0], "access_token"), nullptr);
}

TEST(Errors, SensitiveKeyMatchIsCaseInsensitive) {
    EXPECT_TRUE(errors::isSensitiveKey("AUTHORIZATION"));
    EXPECT_TRUE(errors::isSensitiveKey("clientSecret"));
    EXPECT_TRUE(errors::isSensitiveKey("credentials"));
    EXPECT_FALSE(errors::isSensitiveKey("requestId"));
    EXPECT_FALSE(errors::isSensitiveKey("message"));
}
