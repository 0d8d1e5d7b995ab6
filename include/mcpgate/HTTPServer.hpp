//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HTTPServer.hpp
// Purpose: Coroutine-based HTTP/HTTPS endpoint feeding JSON-RPC bodies to the dispatcher (Boost.Beast)
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string>

#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/Server.h"

namespace mcpgate {

class HTTPServer {
public:
    //==========================================================================================================
    // Options
    // Purpose: Configuration for bind address/port, JSON-RPC path, and TLS files.
    // Fields:
    //   address: Bind address (default: 127.0.0.1)
    //   port: Listen port (default: 8787)
    //   rpcPath: Path accepting JSON-RPC POSTs
    //   scheme: "http" or "https" (TLS 1.3 only for https)
    //   certFile/keyFile: PEM files required when scheme == https
    //==========================================================================================================
    struct Options {
        std::string address{"127.0.0.1"};
        std::string port{"8787"};
        std::string rpcPath{"/mcp"};
        std::string scheme{"http"};
        std::string certFile;
        std::string keyFile;
    };

    // Body + headers in, response (nullptr for notifications) out.
    using MessageHandler = std::function<std::future<std::unique_ptr<JSONRPCResponse>>(
        const std::string& body, const RequestContext& ctx)>;
    using ErrorHandler = std::function<void(const std::string& error)>;

    explicit HTTPServer(const Options& opts);
    ~HTTPServer();

    //==========================================================================================================
    // Starts the accept loop on a background I/O thread.
    // Returns:
    //   Future that becomes ready once the I/O context is running.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stops the server: closes the acceptor, stops the I/O context, and joins the background thread.
    //==========================================================================================================
    std::future<void> Stop();

    void SetMessageHandler(MessageHandler handler);
    void SetErrorHandler(ErrorHandler handler);

    // Routes every POSTed body to server.HandleMessage. The server must outlive this object.
    void Attach(IServer& server);

    const Options& GetOptions() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// HTTPServerFactory
// Purpose: Builds an HTTPServer from a listen URI:
//            - "http://<address>:<port>[/path]"
//            - "https://<address>:<port>[/path]?cert=<pem>&key=<pem>"
//          A path component overrides rpcPath. Unknown parameters are ignored; scheme defaults to http.
//==========================================================================================================
class HTTPServerFactory {
public:
    static HTTPServer::Options ParseListenUri(const std::string& uri);
    std::unique_ptr<HTTPServer> CreateServer(const std::string& uri);
};

} // namespace mcpgate
