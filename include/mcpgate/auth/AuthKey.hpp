//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: AuthKey.hpp
// Purpose: Locating the caller's key in transport headers or in JSON-RPC params
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgate/JSONRPCTypes.h"

namespace mcpgate::auth {

//==========================================================================================================
// ExtractBearerToken
// Purpose: Returns the token of an "Authorization: Bearer <token>" header (scheme is case-insensitive).
//==========================================================================================================
std::optional<std::string> ExtractBearerToken(const std::string& authorizationHeader);

// Returns params._meta.authKey when present and a non-empty string.
std::optional<std::string> ExtractMetaAuthKey(const std::optional<JSONValue>& params);

//==========================================================================================================
// ExtractAuthKey
// Purpose: Resolves the key from, in order: Authorization Bearer header, X-Auth-Key header,
//          params._meta.authKey.
//==========================================================================================================
std::optional<std::string> ExtractAuthKey(const std::string& authorizationHeader,
                                          const std::string& xAuthKeyHeader,
                                          const std::optional<JSONValue>& params);

} // namespace mcpgate::auth
