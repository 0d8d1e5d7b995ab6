//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SchemaValidator.cpp
// Purpose: Recursive JSON Schema subset validator
//==========================================================================================================

#include "mcpgate/validation/SchemaValidator.h"

#include <cmath>

#include <fmt/format.h>

namespace mcpgate {
namespace validation {

namespace {
const char* typeName(const JSONValue& v) {
    if (v.isNull()) return "null";
    if (v.isBool()) return "boolean";
    if (std::holds_alternative<int64_t>(v.value)) return "integer";
    if (std::holds_alternative<double>(v.value)) return "number";
    if (v.isString()) return "string";
    if (v.isArray()) return "array";
    return "object";
}

bool isIntegral(const JSONValue& v) {
    if (std::holds_alternative<int64_t>(v.value)) return true;
    if (std::holds_alternative<double>(v.value)) {
        const double d = std::get<double>(v.value);
        return std::isfinite(d) && std::floor(d) == d;
    }
    return false;
}

bool matchesType(const JSONValue& v, const std::string& type) {
    if (type == "object") return v.isObject();
    if (type == "array") return v.isArray();
    if (type == "string") return v.isString();
    if (type == "number") return v.isNumber();
    if (type == "integer") return isIntegral(v);
    if (type == "boolean") return v.isBool();
    if (type == "null") return v.isNull();
    return true;
}

std::string joinPath(const std::string& base, const std::string& leaf) {
    return base.empty() ? leaf : base + "." + leaf;
}

void validateAt(const JSONValue& input, const JSONValue& schema, const std::string& path,
                std::vector<ValidationError>& errors) {
    if (!schema.isObject()) {
        return;
    }

    if (auto type = GetStringMember(schema, "type")) {
        if (!matchesType(input, type.value())) {
            errors.push_back({path, fmt::format("Expected {}, got {}", type.value(), typeName(input))});
            // Nested keywords are meaningless once the type is wrong.
            return;
        }
    }

    if (const JSONValue* en = FindMember(schema, "enum"); en != nullptr && en->isArray()) {
        const auto& options = std::get<JSONValue::Array>(en->value);
        bool found = false;
        std::string allowed;
        for (const auto& opt : options) {
            if (!opt) continue;
            if (JsonEquals(input, *opt)) found = true;
            if (!allowed.empty()) allowed += ", ";
            allowed += opt->isString() ? std::get<std::string>(opt->value) : SerializeJSON(*opt);
        }
        if (!found) {
            errors.push_back({path, fmt::format("Value must be one of: {}", allowed)});
        }
    }

    if (input.isObject()) {
        const auto& obj = std::get<JSONValue::Object>(input.value);
        if (const JSONValue* req = FindMember(schema, "required"); req != nullptr && req->isArray()) {
            for (const auto& field : std::get<JSONValue::Array>(req->value)) {
                if (!field || !field->isString()) continue;
                const auto& name = std::get<std::string>(field->value);
                if (obj.find(name) == obj.end()) {
                    errors.push_back({joinPath(path, name), fmt::format("Missing required field: {}", name)});
                }
            }
        }
        if (const JSONValue* props = FindMember(schema, "properties"); props != nullptr && props->isObject()) {
            const auto& propSchemas = std::get<JSONValue::Object>(props->value);
            for (const auto& [key, value] : obj) {
                auto it = propSchemas.find(key);
                if (it == propSchemas.end() || !it->second || !value) continue;
                validateAt(*value, *it->second, joinPath(path, key), errors);
            }
        }
    }

    if (input.isArray()) {
        const JSONValue* items = FindMember(schema, "items");
        if (items != nullptr && items->isObject()) {
            const auto& arr = std::get<JSONValue::Array>(input.value);
            for (size_t i = 0; i < arr.size(); ++i) {
                if (!arr[i]) continue;
                validateAt(*arr[i], *items, joinPath(path, std::to_string(i)), errors);
            }
        }
    }
}
}

JSONValue ValidationResult::ToJSON() const {
    JSONValue::Array arr;
    for (const auto& e : errors) {
        JSONValue::Object o;
        o["path"] = std::make_shared<JSONValue>(e.path);
        o["message"] = std::make_shared<JSONValue>(e.message);
        arr.push_back(std::make_shared<JSONValue>(o));
    }
    JSONValue::Object out;
    out["errors"] = std::make_shared<JSONValue>(arr);
    return JSONValue{out};
}

ValidationResult ValidateInput(const JSONValue& input, const JSONValue& schema) {
    ValidationResult r;
    validateAt(input, schema, "", r.errors);
    r.valid = r.errors.empty();
    return r;
}

bool JsonEquals(const JSONValue& a, const JSONValue& b) {
    if (a.isNumber() && b.isNumber()) {
        if (std::holds_alternative<int64_t>(a.value) && std::holds_alternative<int64_t>(b.value)) {
            return std::get<int64_t>(a.value) == std::get<int64_t>(b.value);
        }
        const double da = std::holds_alternative<int64_t>(a.value) ? static_cast<double>(std::get<int64_t>(a.value))
                                                                  : std::get<double>(a.value);
        const double db = std::holds_alternative<int64_t>(b.value) ? static_cast<double>(std::get<int64_t>(b.value))
                                                                  : std::get<double>(b.value);
        return da == db;
    }
    if (a.value.index() != b.value.index()) {
        return false;
    }
    if (a.isNull()) return true;
    if (a.isBool()) return std::get<bool>(a.value) == std::get<bool>(b.value);
    if (a.isString()) return std::get<std::string>(a.value) == std::get<std::string>(b.value);
    if (a.isArray()) {
        const auto& x = std::get<JSONValue::Array>(a.value);
        const auto& y = std::get<JSONValue::Array>(b.value);
        if (x.size() != y.size()) return false;
        for (size_t i = 0; i < x.size(); ++i) {
            if (!x[i] || !y[i]) {
                if (x[i] != y[i]) return false;
                continue;
            }
            if (!JsonEquals(*x[i], *y[i])) return false;
        }
        return true;
    }
    const auto& x = std::get<JSONValue::Object>(a.value);
    const auto& y = std::get<JSONValue::Object>(b.value);
    if (x.size() != y.size()) return false;
    for (const auto& [k, v] : x) {
        auto it = y.find(k);
        if (it == y.end()) return false;
        if (!v || !it->second) {
            if (v != it->second) return false;
            continue;
        }
        if (!JsonEquals(*v, *it->second)) return false;
    }
    return true;
}

} // namespace validation
} // namespace mcpgate
