//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: tests/test_http_server.cpp
// Purpose: GoogleTests for the HTTP endpoint (routing, header forwarding, status codes, concurrent sessions)
//==========================================================================================================

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include "mcpgate/HTTPServer.hpp"
#include "mcpgate/JSONRPCTypes.h"
#include "mcpgate/Server.h"

namespace http = boost::beast::http;

namespace {

//==========================================================================================================
// httpRequest
// Purpose: Send a single HTTP request and capture the response (synchronously). Retries the connect while
//          the accept loop is still binding.
//==========================================================================================================
static http::response<http::string_body> httpRequest(unsigned short port, http::verb verb,
                                                     const std::string& target, const std::string& body,
                                                     const std::optional<std::string>& authorization) {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::resolver resolver{ioc};
    auto r = resolver.resolve("127.0.0.1", std::to_string(port));
    tcp::socket socket{ioc};
    boost::system::error_code ec;
    for (int attempt = 0; attempt < 50; ++attempt) {
        boost::asio::connect(socket, r, ec);
        if (!ec) break;
        socket = tcp::socket{ioc};
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    if (ec) throw boost::system::system_error(ec);

    http::request<http::string_body> req{verb, target, 11};
    req.set(http::field::host, "127.0.0.1");
    req.set(http::field::content_type, "application/json");
    if (authorization.has_value()) {
        req.set(http::field::authorization, authorization.value());
    }
    req.body() = body;
    req.prepare_payload();
    http::write(socket, req);

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(socket, buffer, res);
    socket.shutdown(tcp::socket::shutdown_both, ec);
    return res;
}

//==========================================================================================================
// findFreePort
// Purpose: Obtain an available local TCP port by binding to port 0 temporarily.
//==========================================================================================================
static unsigned short findFreePort() {
    using boost::asio::ip::tcp;
    boost::asio::io_context ioc;
    tcp::acceptor acc(ioc);
    tcp::endpoint ep(tcp::v4(), 0);
    acc.open(ep.protocol());
    acc.set_option(tcp::acceptor::reuse_address(true));
    acc.bind(ep);
    auto port = acc.local_endpoint().port();
    acc.close();
    return port;
}

mcpgate::Registries echoRegistries() {
    mcpgate::Registries r;
    r.tools.Register(std::make_shared<mcpgate::FunctionTool>(
        mcpgate::Tool{"echo", "Echo", mcpgate::ParseJSON(R"({"type":"object"})")},
        [](const mcpgate::JSONValue&, const mcpgate::CallContext&) {
            std::promise<mcpgate::ToolResult> p;
            p.set_value(mcpgate::ToolResult{});
            return p.get_future();
        }));
    return r;
}

} // namespace

//==========================================================================================================
// POSTs to the RPC path reach the dispatcher; the Authorization header is forwarded.
//==========================================================================================================
TEST(HTTPServer, PostRoutesToDispatcherWithHeaders) {
    // Arrange
    unsigned short port = findFreePort();
    mcpgate::ServerConfig cfg;
    cfg.auth.adminKey = "http-admin";
    mcpgate::Server dispatcher(cfg, echoRegistries(), nullptr);
    mcpgate::HTTPServer::Options opts; opts.port = std::to_string(port); opts.rpcPath = "/rpc";
    mcpgate::HTTPServer server(opts);
    server.Attach(dispatcher);
    ASSERT_NO_THROW({ server.Start().get(); });

    // Act
    const std::string body = R"({"jsonrpc":"2.0","id":1,"method":"tools/list"})";
    auto ok = httpRequest(port, http::verb::post, "/rpc", body, std::string("Bearer http-admin"));
    auto denied = httpRequest(port, http::verb::post, "/rpc?x=1", body, std::nullopt);

    // Assert
    EXPECT_EQ(static_cast<int>(ok.result()), 200);
    auto okDoc = mcpgate::ParseJSON(ok.body());
    EXPECT_NE(mcpgate::FindMember(okDoc, "result"), nullptr);

    EXPECT_EQ(static_cast<int>(denied.result()), 200);
    auto deniedDoc = mcpgate::ParseJSON(denied.body());
    const auto* err = mcpgate::FindMember(deniedDoc, "error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(std::get<int64_t>(mcpgate::FindMember(*err, "code")->value), mcpgate::JSONRPCErrorCodes::AuthRequired);

    ASSERT_NO_THROW({ server.Stop().get(); });
}

//==========================================================================================================
// Notifications get 204; wrong path 404; wrong verb 405 with Allow.
//==========================================================================================================
TEST(HTTPServer, StatusCodesForNonRequests) {
    unsigned short port = findFreePort();
    mcpgate::ServerConfig cfg;
    cfg.auth.requireAuth = false;
    mcpgate::Server dispatcher(cfg, echoRegistries(), nullptr);
    mcpgate::HTTPServer::Options opts; opts.port = std::to_string(port);
    mcpgate::HTTPServer server(opts);
    server.Attach(dispatcher);
    ASSERT_NO_THROW({ server.Start().get(); });

    auto note = httpRequest(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","method":"notifications/initialized"})", std::nullopt);
    EXPECT_EQ(static_cast<int>(note.result()), 204);
    EXPECT_TRUE(note.body().empty());

    auto missing = httpRequest(port, http::verb::post, "/other", "{}", std::nullopt);
    EXPECT_EQ(static_cast<int>(missing.result()), 404);

    auto get = httpRequest(port, http::verb::get, "/mcp", "", std::nullopt);
    EXPECT_EQ(static_cast<int>(get.result()), 405);
    EXPECT_EQ(std::string(get[http::field::allow]), "POST");

    ASSERT_NO_THROW({ server.Stop().get(); });
}

//==========================================================================================================
// A slow tool call does not hold up an unrelated request on another connection.
//==========================================================================================================
TEST(HTTPServer, SlowCallDoesNotBlockOtherConnections) {
    // Arrange
    unsigned short port = findFreePort();
    mcpgate::ServerConfig cfg;
    cfg.auth.requireAuth = false;
    mcpgate::Registries r = echoRegistries();
    r.tools.Register(std::make_shared<mcpgate::FunctionTool>(
        mcpgate::Tool{"slow", "Sleeps before answering", mcpgate::ParseJSON(R"({"type":"object"})")},
        [](const mcpgate::JSONValue&, const mcpgate::CallContext&) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1500));
            std::promise<mcpgate::ToolResult> p;
            p.set_value(mcpgate::ToolResult{});
            return p.get_future();
        }));
    mcpgate::Server dispatcher(cfg, std::move(r), nullptr);
    mcpgate::HTTPServer::Options opts; opts.port = std::to_string(port);
    mcpgate::HTTPServer server(opts);
    server.Attach(dispatcher);
    ASSERT_NO_THROW({ server.Start().get(); });

    // Act
    auto slow = std::async(std::launch::async, [port]() {
        return httpRequest(port, http::verb::post, "/mcp",
                           R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"slow"}})", std::nullopt);
    });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
    const auto started = std::chrono::steady_clock::now();
    auto list = httpRequest(port, http::verb::post, "/mcp", R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})", std::nullopt);
    const auto waited = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);

    // Assert
    EXPECT_EQ(static_cast<int>(list.result()), 200);
    EXPECT_LT(waited.count(), 1000);
    auto slowRes = slow.get();
    EXPECT_EQ(static_cast<int>(slowRes.result()), 200);
    EXPECT_NE(mcpgate::FindMember(mcpgate::ParseJSON(slowRes.body()), "result"), nullptr);

    ASSERT_NO_THROW({ server.Stop().get(); });
}

TEST(HTTPServer, InvalidPortSurfacesError) {
    mcpgate::HTTPServer::Options opts; opts.port = "99999";
    mcpgate::HTTPServer server(opts);
    std::promise<std::string> seen;
    auto fut = seen.get_future();
    std::atomic<bool> once{false};
    server.SetErrorHandler([&](const std::string& e) {
        if (!once.exchange(true)) seen.set_value(e);
    });
    ASSERT_NO_THROW({ server.Start().get(); });
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_NE(fut.get().find("invalid port"), std::string::npos);
    ASSERT_NO_THROW({ server.Stop().get(); });
}
