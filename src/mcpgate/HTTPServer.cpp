//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: src/mcpgate/HTTPServer.cpp
// Purpose: HTTP/HTTPS JSON-RPC endpoint using Boost.Beast (TLS 1.3 only for HTTPS)
//==========================================================================================================

#include <utility>
#include <thread>
#include <atomic>
#include <sstream>
#include <algorithm>
#include <cctype>

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/http.hpp>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcpgate/HTTPServer.hpp"
#include "mcpgate/errors/Errors.h"

#include <openssl/ssl.h>

namespace mcpgate {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

class HTTPServer::Impl {
public:
    HTTPServer::Options opts;
    std::atomic<bool> running{false};

    net::io_context ioc;
    std::unique_ptr<tcp::acceptor> acceptor;
    std::unique_ptr<ssl::context> sslCtx; // present when scheme==https
    std::thread ioThread;
    // Dispatcher futures are waited on here so the io thread never blocks; destroyed before ioc.
    net::thread_pool workers{std::max(4u, std::thread::hardware_concurrency())};

    HTTPServer::MessageHandler messageHandler;
    HTTPServer::ErrorHandler errorHandler;

    explicit Impl(const HTTPServer::Options& o) : opts(o) {
        if (opts.scheme == "https") {
            sslCtx = std::make_unique<ssl::context>(ssl::context::tls_server);
            // TLS 1.3 only
            ::SSL_CTX_set_min_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            ::SSL_CTX_set_max_proto_version(sslCtx->native_handle(), TLS1_3_VERSION);
            try {
                sslCtx->use_certificate_chain_file(opts.certFile);
                sslCtx->use_private_key_file(opts.keyFile, ssl::context::file_format::pem);
            } catch (const std::exception& e) {
                LOG_ERROR("HTTPServer: failed to load certificate/key: {}", e.what());
                throw;
            }
            sslCtx->set_options(
                ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3 |
                ssl::context::no_tlsv1 | ssl::context::no_tlsv1_1 | ssl::context::no_tlsv1_2);
        }
    }

    ~Impl() {
        if (ioThread.joinable()) {
            ioc.stop();
            ioThread.join();
        }
    }

    void setError(const std::string& msg) {
        LOG_ERROR("{}", msg);
        if (errorHandler) { errorHandler(msg); }
    }

    void sessionFailed(const char* kind, const std::exception& e) {
        if (!running.load()) {
            // Shutdown closes sockets under live sessions
            LOG_DEBUG("HTTPServer {} session ended during shutdown: {}", kind, e.what());
        } else {
            setError(fmt::format("HTTPServer {} session error: {}", kind, e.what()));
        }
    }

    net::awaitable<void> session_plain(tcp::socket socket) {
        try {
            boost::beast::tcp_stream stream(std::move(socket));
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(stream, buffer, req, net::use_awaitable);
            auto res = co_await makeResponse(req);
            co_await http::async_write(stream, res, net::use_awaitable);
            boost::system::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_send, ec);
        } catch (const std::exception& e) {
            sessionFailed("plain", e);
        }
        co_return;
    }

    net::awaitable<void> session_tls(tcp::socket socket) {
        try {
            ssl::stream<tcp::socket> tls(std::move(socket), *sslCtx);
            co_await tls.async_handshake(ssl::stream_base::server, net::use_awaitable);
            boost::beast::flat_buffer buffer;
            http::request<http::string_body> req;
            co_await http::async_read(tls, buffer, req, net::use_awaitable);
            auto res = co_await makeResponse(req);
            co_await http::async_write(tls, res, net::use_awaitable);
            boost::system::error_code ec;
            tls.shutdown(ec);
        } catch (const std::exception& e) {
            sessionFailed("TLS", e);
        }
        co_return;
    }

    static std::string headerValue(const http::request<http::string_body>& req, const char* name) {
        auto it = req.find(name);
        return it == req.end() ? std::string() : std::string(it->value());
    }

    // Runs the dispatcher call on a worker thread and suspends the session until it completes. The worker
    // wakes the session by cancelling the timer on the session's executor.
    net::awaitable<std::unique_ptr<JSONRPCResponse>> dispatchOffThread(const std::string& body, const RequestContext& ctx) {
        auto exec = co_await net::this_coro::executor;
        net::steady_timer wake(exec, net::steady_timer::time_point::max());
        std::unique_ptr<JSONRPCResponse> out;
        std::string failure;
        net::post(workers, [&]() {
            try {
                out = messageHandler(body, ctx).get();
            } catch (const std::exception& e) {
                failure = e.what();
            }
            net::post(exec, [&wake]() { wake.cancel(); });
        });
        boost::system::error_code ec;
        co_await wake.async_wait(net::redirect_error(net::use_awaitable, ec));
        if (!failure.empty()) {
            throw std::runtime_error(failure);
        }
        co_return out;
    }

    net::awaitable<http::response<http::string_body>> makeResponse(const http::request<http::string_body>& req) {
        http::response<http::string_body> res{http::status::ok, req.version()};
        res.set(http::field::content_type, "application/json");
        res.keep_alive(false);

        std::string target = std::string(req.target());
        const auto q = target.find('?');
        if (q != std::string::npos) target.resize(q);

        if (target != opts.rpcPath) {
            res.result(http::status::not_found);
            res.body() = std::string("{\"error\":\"Not found\"}");
            res.prepare_payload();
            co_return res;
        }
        if (req.method() != http::verb::post) {
            res.result(http::status::method_not_allowed);
            res.set(http::field::allow, "POST");
            res.body() = std::string("{\"error\":\"POST required\"}");
            res.prepare_payload();
            co_return res;
        }

        RequestContext ctx;
        ctx.authorization = headerValue(req, "Authorization");
        ctx.xAuthKey = headerValue(req, "X-Auth-Key");

        std::unique_ptr<JSONRPCResponse> out;
        std::string failure;
        if (!messageHandler) {
            failure = "no message handler attached";
        } else {
            try {
                out = co_await dispatchOffThread(req.body(), ctx);
            } catch (const std::exception& e) {
                failure = e.what();
            }
            if (failure.empty() && !out) {
                res.result(http::status::no_content);
                res.erase(http::field::content_type);
                res.body().clear();
                res.prepare_payload();
                co_return res;
            }
        }
        if (!failure.empty()) {
            LOG_ERROR("HTTPServer: dispatch failed: {}", failure);
            out = errors::makeErrorResponse(nullptr, errors::makeError(errors::ErrorCategory::InternalError));
        }
        res.body() = out->Serialize();
        res.prepare_payload();
        co_return res;
    }

    net::awaitable<void> acceptLoop() {
        try {
            // Validate port strictly: numeric and within [0, 65535]
            auto portNum = ParseUnsigned(opts.port);
            if (!portNum.has_value() || portNum.value() > 65535u) {
                setError(std::string("HTTPServer invalid port: ") + opts.port);
                co_return;
            }
            tcp::resolver resolver(co_await net::this_coro::executor);
            auto r = resolver.resolve(opts.address, opts.port);
            tcp::endpoint ep = *r.begin();

            acceptor = std::make_unique<tcp::acceptor>(ioc);
            acceptor->open(ep.protocol());
            acceptor->set_option(tcp::acceptor::reuse_address(true));
            acceptor->bind(ep);
            acceptor->listen();
            LOG_INFO("HTTPServer listening on {}://{}:{}{}", opts.scheme, opts.address,
                     acceptor->local_endpoint().port(), opts.rpcPath);

            while (running.load()) {
                tcp::socket socket = co_await acceptor->async_accept(net::use_awaitable);
                if (opts.scheme == "https") {
                    net::co_spawn(ioc, session_tls(std::move(socket)), net::detached);
                } else {
                    net::co_spawn(ioc, session_plain(std::move(socket)), net::detached);
                }
            }
        } catch (const std::exception& e) {
            if (!running.load()) {
                LOG_DEBUG("HTTPServer accept loop ended during shutdown: {}", e.what());
            } else {
                setError(std::string("HTTPServer accept error: ") + e.what());
            }
        }
        co_return;
    }
};

HTTPServer::HTTPServer(const Options& opts)
    : pImpl(std::make_unique<Impl>(opts)) {}

HTTPServer::~HTTPServer() = default;

std::future<void> HTTPServer::Start() {
    std::promise<void> ready; auto fut = ready.get_future();
    pImpl->running.store(true);
    pImpl->ioThread = std::thread([this, pr = std::move(ready)]() mutable {
        bool signalled = false;
        try {
            net::co_spawn(pImpl->ioc, pImpl->acceptLoop(), net::detached);
            pr.set_value();
            signalled = true;
            pImpl->ioc.run();
        } catch (const std::exception& e) {
            pImpl->setError(e.what());
            if (!signalled) pr.set_value();
        }
    });
    return fut;
}

std::future<void> HTTPServer::Stop() {
    std::promise<void> done; auto fut = done.get_future();
    pImpl->running.store(false);
    if (pImpl->acceptor) {
        boost::system::error_code ec; pImpl->acceptor->close(ec);
    }
    pImpl->ioc.stop();
    if (pImpl->ioThread.joinable()) {
        pImpl->ioThread.join();
    }
    done.set_value();
    return fut;
}

void HTTPServer::SetMessageHandler(MessageHandler handler) {
    pImpl->messageHandler = std::move(handler);
}

void HTTPServer::SetErrorHandler(ErrorHandler handler) {
    pImpl->errorHandler = std::move(handler);
}

void HTTPServer::Attach(IServer& server) {
    pImpl->messageHandler = [&server](const std::string& body, const RequestContext& ctx) {
        return server.HandleMessage(body, ctx);
    };
}

const HTTPServer::Options& HTTPServer::GetOptions() const {
    return pImpl->opts;
}

HTTPServer::Options HTTPServerFactory::ParseListenUri(const std::string& uri) {
    HTTPServer::Options opts;

    std::string cfg = uri;
    auto trim = [](std::string& s){
        auto notSpace = [](unsigned char c){ return !std::isspace(c); };
        s.erase(s.begin(), std::find_if(s.begin(), s.end(), notSpace));
        s.erase(std::find_if(s.rbegin(), s.rend(), notSpace).base(), s.end());
    };
    trim(cfg);

    auto startsWith = [](const std::string& s, const char* pfx){ return s.rfind(pfx, 0) == 0; };
    if (startsWith(cfg, "http://")) {
        opts.scheme = "http";
        cfg = cfg.substr(7);
    } else if (startsWith(cfg, "https://")) {
        opts.scheme = "https";
        cfg = cfg.substr(8);
    }

    std::string hostPortPath = cfg;
    std::string query;
    auto qpos = cfg.find('?');
    if (qpos != std::string::npos) {
        hostPortPath = cfg.substr(0, qpos);
        query = cfg.substr(qpos + 1);
    }

    std::string hostPort = hostPortPath;
    auto slash = hostPortPath.find('/');
    if (slash != std::string::npos) {
        hostPort = hostPortPath.substr(0, slash);
        std::string path = hostPortPath.substr(slash);
        if (path.size() > 1) opts.rpcPath = path;
    }
    trim(hostPort);

    // host[:port], IPv6 in [addr]:port form
    if (!hostPort.empty()) {
        if (hostPort.front() == '[') {
            auto rb = hostPort.find(']');
            if (rb != std::string::npos) {
                opts.address = hostPort.substr(1, rb - 1);
                if (rb + 1 < hostPort.size() && hostPort[rb + 1] == ':') {
                    opts.port = hostPort.substr(rb + 2);
                }
            }
        } else {
            auto colon = hostPort.rfind(':');
            if (colon != std::string::npos) {
                opts.address = hostPort.substr(0, colon);
                opts.port = hostPort.substr(colon + 1);
            } else {
                opts.address = hostPort;
            }
        }
        trim(opts.address);
        trim(opts.port);
        if (opts.port.empty()) opts.port = "8787";
    }

    if (!query.empty()) {
        std::stringstream ss(query);
        std::string kv;
        while (std::getline(ss, kv, '&')) {
            auto eq = kv.find('=');
            std::string key = (eq == std::string::npos) ? kv : kv.substr(0, eq);
            std::string val = (eq == std::string::npos) ? std::string() : kv.substr(eq + 1);
            if (key == "cert") opts.certFile = val;
            else if (key == "key") opts.keyFile = val;
        }
    }
    return opts;
}

std::unique_ptr<HTTPServer> HTTPServerFactory::CreateServer(const std::string& uri) {
    return std::make_unique<HTTPServer>(ParseListenUri(uri));
}

} // namespace mcpgate
