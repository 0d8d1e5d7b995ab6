//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_lifecycle.cpp
// Purpose: GoogleTests for initialize negotiation and capability advertisement
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/Lifecycle.h"
#include "mcpgate/Protocol.h"
#include "mcpgate/errors/Errors.h"

using namespace mcpgate;

namespace {
JSONValue initParams(const char* version, const char* clientName = "test-client") {
    JSONValue::Object info;
    info["name"] = std::make_shared<JSONValue>(std::string(clientName));
    info["version"] = std::make_shared<JSONValue>(std::string("0.1"));
    JSONValue::Object p;
    if (version != nullptr) p["protocolVersion"] = std::make_shared<JSONValue>(std::string(version));
    p["capabilities"] = std::make_shared<JSONValue>(JSONValue::Object{});
    p["clientInfo"] = std::make_shared<JSONValue>(JSONValue{info});
    return JSONValue{p};
}
}

TEST(Lifecycle, HandshakeReturnsServerIdentity) {
    // Arrange
    LifecycleNegotiator neg(Implementation("gate", "1.2.3"), std::string("Use the echo tool"),
                            LifecycleNegotiator::ComputeCapabilities(true, true, true));

    // Act
    JSONValue result = neg.Handshake(initParams(PROTOCOL_VERSION));

    // Assert
    EXPECT_EQ(GetStringMember(result, "protocolVersion").value_or(""), PROTOCOL_VERSION);
    EXPECT_EQ(GetStringMember(result, "instructions").value_or(""), "Use the echo tool");
    const JSONValue* info = FindMember(result, "serverInfo");
    ASSERT_NE(info, nullptr);
    EXPECT_EQ(GetStringMember(*info, "name").value_or(""), "gate");
    EXPECT_EQ(GetStringMember(*info, "version").value_or(""), "1.2.3");
    const JSONValue* caps = FindMember(result, "capabilities");
    ASSERT_NE(caps, nullptr);
    EXPECT_NE(FindMember(*caps, "tools"), nullptr);
    EXPECT_NE(FindMember(*caps, "resources"), nullptr);
    EXPECT_NE(FindMember(*caps, "prompts"), nullptr);
    EXPECT_NE(FindMember(*caps, "logging"), nullptr);
}

TEST(Lifecycle, VersionMismatchCarriesSupportedVersion) {
    LifecycleNegotiator neg(Implementation("gate", "1"), std::nullopt,
                            LifecycleNegotiator::ComputeCapabilities(true, false, false));
    try {
        (void)neg.Handshake(initParams("1999-01-01"));
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::InvalidParams);
        ASSERT_TRUE(e.error().data.has_value());
        const JSONValue& d = e.error().data.value();
        EXPECT_EQ(GetStringMember(d, "supported").value_or(""), PROTOCOL_VERSION);
        EXPECT_EQ(GetStringMember(d, "requested").value_or(""), "1999-01-01");
    }
}

TEST(Lifecycle, MissingVersionOrClientNameIsInvalidParams) {
    LifecycleNegotiator neg(Implementation("gate", "1"), std::nullopt, ServerCapabilities{});
    try {
        (void)neg.Handshake(initParams(nullptr));
        FAIL() << "expected McpException";
    } catch (const errors::McpException& e) {
        EXPECT_EQ(e.error().code, JSONRPCErrorCodes::InvalidParams);
        EXPECT_EQ(GetStringMember(e.error().data.value(), "message").value_or(""), "Missing protocolVersion");
        EXPECT_EQ(FindMember(e.error().data.value(), "requested"), nullptr);
    }

    JSONValue noClient = ParseJSON(R"({"protocolVersion":"2024-11-05"})");
    EXPECT_THROW((void)neg.Handshake(noClient), errors::McpException);
    EXPECT_THROW((void)neg.Handshake(std::nullopt), errors::McpException);
}

TEST(Lifecycle, CapabilitiesFollowRegistryContents) {
    auto toolsOnly = LifecycleNegotiator::ComputeCapabilities(true, false, false);
    EXPECT_TRUE(toolsOnly.tools.has_value());
    EXPECT_FALSE(toolsOnly.resources.has_value());
    EXPECT_FALSE(toolsOnly.prompts.has_value());
    EXPECT_TRUE(toolsOnly.logging.has_value());

    JSONValue serialized = SerializeCapabilities(toolsOnly);
    EXPECT_NE(FindMember(serialized, "tools"), nullptr);
    EXPECT_EQ(FindMember(serialized, "resources"), nullptr);
    EXPECT_EQ(FindMember(serialized, "prompts"), nullptr);
}

TEST(Lifecycle, EmptyInstructionsAreOmitted) {
    LifecycleNegotiator neg(Implementation("gate", "1"), std::string(), ServerCapabilities{});
    JSONValue result = neg.Handshake(initParams(PROTOCOL_VERSION));
    EXPECT_EQ(FindMember(result, "instructions"), nullptr);
}
