//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.cpp
// Purpose: Environment-driven configuration loading
//==========================================================================================================

#include "mcpgate/Config.h"

#include <limits>
#include <sstream>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpgate/version.h"

namespace mcpgate {

namespace {
bool boolFromEnv(const char* name, bool def) {
    auto raw = GetEnvOptional(name);
    if (!raw.has_value()) return def;
    auto parsed = ParseBoolFlag(raw.value());
    if (!parsed.has_value()) {
        LOG_WARN("Config: {}='{}' is not a boolean; using {}", name, raw.value(), def);
        return def;
    }
    return parsed.value();
}

uint64_t unsignedFromEnv(const char* name, uint64_t def, uint64_t maxValue, uint64_t minValue = 0) {
    auto raw = GetEnvOptional(name);
    if (!raw.has_value()) return def;
    auto parsed = ParseUnsigned(raw.value());
    if (!parsed.has_value() || parsed.value() > maxValue || parsed.value() < minValue) {
        LOG_WARN("Config: {}='{}' is not a valid value; using {}", name, raw.value(), def);
        return def;
    }
    return parsed.value();
}

std::vector<std::string> splitList(const std::string& csv) {
    std::vector<std::string> out;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        const auto b = item.find_first_not_of(" \t");
        if (b == std::string::npos) continue;
        const auto e = item.find_last_not_of(" \t");
        out.push_back(item.substr(b, e - b + 1));
    }
    return out;
}
}

ServerConfig LoadConfigFromEnv() {
    ServerConfig cfg;
    cfg.serverName = GetEnvOrDefault("MCPGATE_SERVER_NAME", "mcpgate");
    cfg.serverVersion = GetEnvOrDefault("MCPGATE_SERVER_VERSION", getVersionString());
    cfg.instructions = GetEnvOptional("MCPGATE_INSTRUCTIONS");
    cfg.logLevel = GetEnvOrDefault("MCPGATE_LOG_LEVEL", "INFO");
    cfg.listen = GetEnvOrDefault("MCPGATE_LISTEN", "http://127.0.0.1:8787");
    cfg.rpcPath = GetEnvOrDefault("MCPGATE_RPC_PATH", "/mcp");

    auth::AuthConfig& a = cfg.auth;
    a.requireAuth = boolFromEnv("MCPGATE_REQUIRE_AUTH", true);
    a.adminKey = GetEnvOptional("MCPGATE_ADMIN_KEY");
    a.validKeys = splitList(GetEnvOrDefault("MCPGATE_VALID_KEYS", ""));
    a.enableKeyIndex = boolFromEnv("MCPGATE_ENABLE_KEY_INDEX", false);
    a.enableFallbackScan = boolFromEnv("MCPGATE_ENABLE_FALLBACK_SCAN", false);
    a.fallbackScanRateLimit = static_cast<uint32_t>(
        unsignedFromEnv("MCPGATE_FALLBACK_SCAN_RATE_LIMIT", 5, std::numeric_limits<uint32_t>::max()));
    a.fallbackScanBudget = unsignedFromEnv("MCPGATE_FALLBACK_SCAN_BUDGET", 100, std::numeric_limits<uint64_t>::max());
    a.fallbackScanWindow = std::chrono::milliseconds(static_cast<int64_t>(
        unsignedFromEnv("MCPGATE_FALLBACK_SCAN_WINDOW_MS", 60000, std::numeric_limits<int64_t>::max(), 1)));
    a.fallbackScanMaxKeys = static_cast<std::size_t>(
        unsignedFromEnv("MCPGATE_FALLBACK_SCAN_MAX_KEYS", 1000, std::numeric_limits<uint32_t>::max()));

    if (a.requireAuth && !a.adminKey.has_value() && a.validKeys.empty() &&
        !a.enableKeyIndex && !a.enableFallbackScan) {
        LOG_WARN("Config: authentication is required but no key source is configured; every gated call will fail");
    }
    return cfg;
}

} // namespace mcpgate
