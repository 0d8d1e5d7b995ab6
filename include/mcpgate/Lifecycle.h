//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Lifecycle.h
// Purpose: initialize handshake and capability advertisement
//==========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/Protocol.h"

namespace mcpgate {

//==========================================================================================================
// LifecycleNegotiator
// Purpose: Answers initialize. Capabilities are fixed at construction, so Handshake has no side effects
//          and repeated calls return identical descriptors.
//==========================================================================================================
class LifecycleNegotiator {
public:
    LifecycleNegotiator(Implementation serverInfo, std::optional<std::string> instructions,
                        ServerCapabilities capabilities);

    //==========================================================================================================
    // ComputeCapabilities
    // Purpose: Advertises a feature group only when its registry has entries; logging is always present.
    //==========================================================================================================
    static ServerCapabilities ComputeCapabilities(bool hasTools, bool hasResources, bool hasPrompts);

    //==========================================================================================================
    // Handshake
    // Purpose: Validates initialize params and builds the result.
    // Args:
    //   params: initialize params ({ protocolVersion, clientInfo: { name, version? }, capabilities? }).
    // Returns:
    //   { protocolVersion, capabilities, serverInfo: { name, version }, instructions? }
    // Throws:
    //   errors::McpException (invalid-params) when the version is absent or unsupported, or
    //   clientInfo.name is missing.
    //==========================================================================================================
    JSONValue Handshake(const std::optional<JSONValue>& params) const;

    const ServerCapabilities& Capabilities() const { return capabilities_; }
    const Implementation& ServerInfo() const { return serverInfo_; }

private:
    Implementation serverInfo_;
    std::optional<std::string> instructions_;
    ServerCapabilities capabilities_;
};

// JSON form of a capability descriptor.
JSONValue SerializeCapabilities(const ServerCapabilities& caps);

} // namespace mcpgate
