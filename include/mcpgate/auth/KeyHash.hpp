//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeyHash.hpp
// Purpose: SHA-256 key hashing and constant-time comparison helpers (OpenSSL)
//==========================================================================================================

#pragma once

#include <string>

namespace mcpgate::auth {

// Storage prefix under which index entries live
constexpr const char* kAuthIndexPrefix = "_auth-index/";
// Storage prefix under which user records live
constexpr const char* kUsersPrefix = "users/";

//==========================================================================================================
// HashKey
// Purpose: Lowercase hex SHA-256 digest of a key.
// Throws:
//   std::runtime_error when the digest cannot be computed.
//==========================================================================================================
std::string HashKey(const std::string& key);

//==========================================================================================================
// ConstantTimeEqual
// Purpose: Compares two secrets in time independent of where they differ and of their lengths.
// Notes:
//   Both inputs are hashed first, so the compared buffers always have the same size.
//==========================================================================================================
bool ConstantTimeEqual(const std::string& a, const std::string& b);

// Index key for a raw key: "_auth-index/<sha256-hex>"
std::string AuthIndexKey(const std::string& key);

// Short, log-safe identifier for a key (first 8 hex chars of its hash).
std::string KeyHashPrefix(const std::string& key);

} // namespace mcpgate::auth
