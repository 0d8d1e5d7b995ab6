//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_envelope.cpp
// Purpose: GoogleTests for JSON parsing/serialization and JSON-RPC envelope (de)serialization
//==========================================================================================================

#include <gtest/gtest.h>
#include <stdexcept>
#include "mcpgate/JSONRPCTypes.h"

using namespace mcpgate;

TEST(JSONParser, ParsesScalarsAndNesting) {
    JSONValue v = ParseJSON(R"({"a":1,"b":[true,null,"x"],"c":{"d":2.5},"e":"café"})");
    ASSERT_TRUE(v.isObject());
    const JSONValue* a = FindMember(v, "a");
    ASSERT_NE(a, nullptr);
    EXPECT_EQ(std::get<int64_t>(a->value), 1);
    const JSONValue* b = FindMember(v, "b");
    ASSERT_NE(b, nullptr);
    ASSERT_TRUE(b->isArray());
    const auto& arr = std::get<JSONValue::Array>(b->value);
    ASSERT_EQ(arr.size(), 3u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_TRUE(arr[1]->isNull());
    const JSONValue* c = FindMember(v, "c");
    ASSERT_NE(c, nullptr);
    EXPECT_DOUBLE_EQ(std::get<double>(FindMember(*c, "d")->value), 2.5);
    EXPECT_EQ(GetStringMember(v, "e").value_or(""), "caf\xc3\xa9");
}

TEST(JSONParser, RejectsMalformedInput) {
    EXPECT_THROW(ParseJSON("{"), std::exception);
    EXPECT_THROW(ParseJSON("{\"a\":}"), std::exception);
    EXPECT_THROW(ParseJSON("[1,2"), std::exception);
    EXPECT_THROW(ParseJSON("{} trailing"), std::exception);
    EXPECT_THROW(ParseJSON(""), std::exception);
}

TEST(JSONParser, SerializeEscapesStrings) {
    JSONValue::Object o;
    o["s"] = std::make_shared<JSONValue>(std::string("line\n\"q\""));
    const std::string text = SerializeJSON(JSONValue{o});
    EXPECT_EQ(text, "{\"s\":\"line\\n\\\"q\\\"\"}");
    JSONValue back = ParseJSON(text);
    EXPECT_EQ(GetStringMember(back, "s").value_or(""), "line\n\"q\"");
}

TEST(JSONRPCId, AcceptsStringIntegerAndNull) {
    EXPECT_TRUE(JSONRPCIdFromValue(JSONValue{std::string("abc")}).has_value());
    EXPECT_TRUE(JSONRPCIdFromValue(JSONValue{static_cast<int64_t>(4)}).has_value());
    EXPECT_TRUE(JSONRPCIdFromValue(JSONValue{nullptr}).has_value());
    EXPECT_FALSE(JSONRPCIdFromValue(JSONValue{true}).has_value());
    EXPECT_FALSE(JSONRPCIdFromValue(JSONValue{JSONValue::Object{}}).has_value());
}

TEST(JSONRPCResponse, ResultAndErrorAreExclusive) {
    // Arrange
    JSONValue::Object r;
    r["ok"] = std::make_shared<JSONValue>(true);
    JSONRPCResponse ok(JSONRPCId{std::string("req-1")}, JSONValue{r});

    // Act
    const std::string wire = ok.Serialize();
    JSONValue doc = ParseJSON(wire);

    // Assert
    EXPECT_EQ(GetStringMember(doc, "jsonrpc").value_or(""), "2.0");
    EXPECT_EQ(GetStringMember(doc, "id").value_or(""), "req-1");
    EXPECT_NE(FindMember(doc, "result"), nullptr);
    EXPECT_EQ(FindMember(doc, "error"), nullptr);

    auto err = CreateErrorResponse(nullptr, JSONRPCErrorCodes::ParseError, "Parse error");
    JSONValue errDoc = ParseJSON(err->Serialize());
    EXPECT_EQ(FindMember(errDoc, "result"), nullptr);
    const JSONValue* id = FindMember(errDoc, "id");
    ASSERT_NE(id, nullptr);
    EXPECT_TRUE(id->isNull());
    const JSONValue* e = FindMember(errDoc, "error");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(std::get<int64_t>(FindMember(*e, "code")->value), -32700);
}

TEST(JSONRPCRequest, DeserializeRoundTrip) {
    JSONRPCRequest req;
    ASSERT_TRUE(req.Deserialize(R"({"jsonrpc":"2.0","id":9,"method":"tools/list","params":{"limit":2}})"));
    EXPECT_EQ(req.method, "tools/list");
    EXPECT_EQ(std::get<int64_t>(req.id), 9);
    ASSERT_TRUE(req.params.has_value());
    EXPECT_EQ(std::get<int64_t>(FindMember(req.params.value(), "limit")->value), 2);
}
