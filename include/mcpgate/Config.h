//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Config.h
// Purpose: Server configuration and its environment-variable loader
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgate/auth/AuthGatekeeper.hpp"

namespace mcpgate {

//==========================================================================================================
// ServerConfig
// Fields:
//   serverName/serverVersion: Reported as serverInfo in the initialize result.
//   instructions: Optional usage text returned by initialize.
//   auth: Gatekeeper configuration.
//   logLevel: Initial process log level (DEBUG/INFO/WARN/ERROR/FATAL).
//   listen: Endpoint URI for the HTTP adapter (http://host:port or https://host:port?cert=..&key=..).
//   rpcPath: HTTP path accepting JSON-RPC POSTs.
//==========================================================================================================
struct ServerConfig {
    std::string serverName{"mcpgate"};
    std::string serverVersion;
    std::optional<std::string> instructions;
    auth::AuthConfig auth;
    std::string logLevel{"INFO"};
    std::string listen{"http://127.0.0.1:8787"};
    std::string rpcPath{"/mcp"};
};

//==========================================================================================================
// LoadConfigFromEnv
// Purpose: Builds a ServerConfig from MCPGATE_* environment variables. Malformed values keep the default
//          and log a warning.
//==========================================================================================================
ServerConfig LoadConfigFromEnv();

} // namespace mcpgate
