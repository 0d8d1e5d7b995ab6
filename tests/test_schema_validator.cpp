//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_schema_validator.cpp
// Purpose: GoogleTests for the JSON-Schema subset used to check tool arguments
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/validation/SchemaValidator.h"

using namespace mcpgate;
using namespace mcpgate::validation;

TEST(SchemaValidator, AcceptsMatchingObject) {
    auto schema = ParseJSON(R"({"type":"object","properties":{"text":{"type":"string"}},"required":["text"]})");
    auto r = ValidateInput(ParseJSON(R"({"text":"hi"})"), schema);
    EXPECT_TRUE(r.valid);
    EXPECT_TRUE(r.errors.empty());
}

TEST(SchemaValidator, ReportsTypeMismatchWithPath) {
    auto schema = ParseJSON(R"({"type":"object","properties":{"text":{"type":"string"}},"required":["text"]})");
    auto r = ValidateInput(ParseJSON(R"({"text":5})"), schema);
    ASSERT_FALSE(r.valid);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].path, "text");
    EXPECT_EQ(r.errors[0].message, "Expected string, got integer");
}

TEST(SchemaValidator, ReportsMissingRequiredField) {
    auto schema = ParseJSON(R"({"type":"object","required":["a","b"]})");
    auto r = ValidateInput(ParseJSON(R"({"a":1})"), schema);
    ASSERT_FALSE(r.valid);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].path, "b");
    EXPECT_EQ(r.errors[0].message, "Missing required field: b");
}

TEST(SchemaValidator, RootTypeMismatchStopsDescent) {
    auto schema = ParseJSON(R"({"type":"object","required":["a"]})");
    auto r = ValidateInput(ParseJSON(R"([1,2])"), schema);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].path, "");
    EXPECT_EQ(r.errors[0].message, "Expected object, got array");
}

TEST(SchemaValidator, IntegerAcceptsWholeDoubles) {
    auto schema = ParseJSON(R"({"type":"integer"})");
    EXPECT_TRUE(ValidateInput(ParseJSON("3"), schema).valid);
    EXPECT_TRUE(ValidateInput(ParseJSON("3.0"), schema).valid);
    EXPECT_FALSE(ValidateInput(ParseJSON("3.5"), schema).valid);
    EXPECT_TRUE(ValidateInput(ParseJSON("3.5"), ParseJSON(R"({"type":"number"})")).valid);
}

TEST(SchemaValidator, EnumListsAllowedValues) {
    auto schema = ParseJSON(R"({"type":"string","enum":["red","green"]})");
    EXPECT_TRUE(ValidateInput(ParseJSON(R"("green")"), schema).valid);
    auto r = ValidateInput(ParseJSON(R"("blue")"), schema);
    ASSERT_EQ(r.errors.size(), 1u);
    EXPECT_EQ(r.errors[0].message, "Value must be one of: red, green");
}

TEST(SchemaValidator, ArrayItemsCarryIndexInPath) {
    auto schema = ParseJSON(R"({"type":"object","properties":{"tags":{"type":"array","items":{"type":"string"}}}})");
    auto r = ValidateInput(ParseJSON(R"({"tags":["a",2,"c",false]})"), schema);
    ASSERT_EQ(r.errors.size(), 2u);
    EXPECT_EQ(r.errors[0].path, "tags.1");
    EXPECT_EQ(r.errors[1].path, "tags.3");
    EXPECT_EQ(r.errors[1].message, "Expected string, got boolean");
}

TEST(SchemaValidator, UnknownKeywordsAndPropertiesAreIgnored) {
    auto schema = ParseJSON(R"({"type":"object","additionalProperties":false,"properties":{"a":{"minLength":3}}})");
    EXPECT_TRUE(ValidateInput(ParseJSON(R"({"a":"x","extra":1})"), schema).valid);
}

TEST(SchemaValidator, ResultSerializesErrors) {
    auto r = ValidateInput(ParseJSON("{}"), ParseJSON(R"({"type":"object","required":["q"]})"));
    JSONValue j = r.ToJSON();
    const JSONValue* errs = FindMember(j, "errors");
    ASSERT_NE(errs, nullptr);
    ASSERT_TRUE(errs->isArray());
    const auto& arr = std::get<JSONValue::Array>(errs->value);
    ASSERT_EQ(arr.size(), 1u);
    EXPECT_EQ(GetStringMember(*arr[0], "path").value_or(""), "q");
}

TEST(JsonEquals, ComparesStructurally) {
    EXPECT_TRUE(JsonEquals(ParseJSON(R"({"a":[1,{"b":null}]})"), ParseJSON(R"({"a":[1,{"b":null}]})")));
    EXPECT_TRUE(JsonEquals(ParseJSON("1"), ParseJSON("1.0")));
    EXPECT_FALSE(JsonEquals(ParseJSON(R"({"a":1})"), ParseJSON(R"({"a":1,"b":2})")));
    EXPECT_FALSE(JsonEquals(ParseJSON(R"("1")"), ParseJSON("1")));
}
