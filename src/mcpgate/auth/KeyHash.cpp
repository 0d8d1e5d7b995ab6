//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: KeyHash.cpp
// Purpose: SHA-256 helpers over OpenSSL EVP
//==========================================================================================================

#include "mcpgate/auth/KeyHash.hpp"

#include <array>
#include <memory>
#include <stdexcept>

#include <openssl/crypto.h>
#include <openssl/evp.h>

namespace mcpgate::auth {

namespace {
using Digest = std::array<unsigned char, 32>;

Digest sha256(const std::string& data) {
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    Digest out{};
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
        throw std::runtime_error("SHA-256 digest failed");
    }
    return out;
}
}

std::string HashKey(const std::string& key) {
    static const char* const kHex = "0123456789abcdef";
    const Digest d = sha256(key);
    std::string hex;
    hex.reserve(d.size() * 2);
    for (unsigned char b : d) {
        hex.push_back(kHex[b >> 4]);
        hex.push_back(kHex[b & 0x0F]);
    }
    return hex;
}

bool ConstantTimeEqual(const std::string& a, const std::string& b) {
    const Digest da = sha256(a);
    const Digest db = sha256(b);
    return CRYPTO_memcmp(da.data(), db.data(), da.size()) == 0;
}

std::string AuthIndexKey(const std::string& key) {
    return std::string(kAuthIndexPrefix) + HashKey(key);
}

std::string KeyHashPrefix(const std::string& key) {
    return HashKey(key).substr(0, 8);
}

} // namespace mcpgate::auth
