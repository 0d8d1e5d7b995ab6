//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthKey.cpp
// Purpose: Key extraction from headers and params
//==========================================================================================================

#include "mcpgate/auth/AuthKey.hpp"

#include <cctype>

namespace mcpgate::auth {

namespace {
bool icaseEqual(char a, char b) {
    return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
}

bool startsWithBearer(const std::string& s) {
    const std::string pfx = "Bearer";
    if (s.size() <= pfx.size()) {
        return false;
    }
    for (size_t i = 0; i < pfx.size(); ++i) {
        if (!icaseEqual(s[i], pfx[i])) {
            return false;
        }
    }
    return std::isspace(static_cast<unsigned char>(s[pfx.size()])) != 0;
}

std::string trim(const std::string& s) {
    size_t b = 0;
    size_t e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b])) != 0) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1])) != 0) --e;
    return s.substr(b, e - b);
}
}

std::optional<std::string> ExtractBearerToken(const std::string& authorizationHeader) {
    const std::string header = trim(authorizationHeader);
    if (!startsWithBearer(header)) {
        return std::nullopt;
    }
    std::string token = trim(header.substr(6));
    if (token.empty()) {
        return std::nullopt;
    }
    return token;
}

std::optional<std::string> ExtractMetaAuthKey(const std::optional<JSONValue>& params) {
    if (!params.has_value()) {
        return std::nullopt;
    }
    const JSONValue* meta = FindMember(params.value(), "_meta");
    if (meta == nullptr) {
        return std::nullopt;
    }
    auto key = GetStringMember(*meta, "authKey");
    if (!key.has_value() || key->empty()) {
        return std::nullopt;
    }
    return key;
}

std::optional<std::string> ExtractAuthKey(const std::string& authorizationHeader,
                                          const std::string& xAuthKeyHeader,
                                          const std::optional<JSONValue>& params) {
    if (auto bearer = ExtractBearerToken(authorizationHeader)) {
        return bearer;
    }
    const std::string x = trim(xAuthKeyHeader);
    if (!x.empty()) {
        return x;
    }
    return ExtractMetaAuthKey(params);
}

} // namespace mcpgate::auth
