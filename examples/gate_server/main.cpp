//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: mcpgate demo server (echo/admin tools, server info resource and a prompt over HTTP)
//==========================================================================================================

#include "logging/Logger.h"
#include "env/EnvVars.h"
#include "mcpgate/Config.h"
#include "mcpgate/HTTPServer.hpp"
#include "mcpgate/Server.h"
#include "mcpgate/auth/KeyHash.hpp"
#include "mcpgate/auth/KeyIndex.hpp"
#include "mcpgate/errors/Errors.h"
#include "mcpgate/storage/InMemoryStorage.hpp"
#include "mcpgate/version.h"

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <sstream>
#include <thread>

#include <fmt/format.h>

using namespace mcpgate;

static std::atomic<bool> gRunning{true};

static void handleSig(int) {
    gRunning.store(false);
}

namespace {
std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == nullptr) continue;
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

JSONValue textContent(const std::string& text) {
    JSONValue::Object c;
    c["type"] = std::make_shared<JSONValue>(std::string("text"));
    c["text"] = std::make_shared<JSONValue>(text);
    return JSONValue{c};
}

template <typename T>
std::future<T> ready(T value) {
    std::promise<T> p;
    p.set_value(std::move(value));
    return p.get_future();
}

JSONValue echoSchema() {
    JSONValue::Object textType; textType["type"] = std::make_shared<JSONValue>(std::string("string"));
    JSONValue::Object props; props["text"] = std::make_shared<JSONValue>(JSONValue{textType});
    JSONValue::Array required; required.push_back(std::make_shared<JSONValue>(std::string("text")));
    JSONValue::Object schema; schema["type"] = std::make_shared<JSONValue>(std::string("object"));
    schema["properties"] = std::make_shared<JSONValue>(JSONValue{props});
    schema["required"] = std::make_shared<JSONValue>(JSONValue{required});
    return JSONValue{schema};
}

// Seeds "users/<id>" records from MCPGATE_DEMO_USERS ("id:key,id2:key2") so index and scan can be tried.
void seedUsers(storage::IStorage& store) {
    std::stringstream ss(GetEnvOrDefault("MCPGATE_DEMO_USERS", ""));
    std::string item;
    while (std::getline(ss, item, ',')) {
        auto colon = item.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 >= item.size()) {
            LOG_WARN("Ignoring malformed MCPGATE_DEMO_USERS entry");
            continue;
        }
        auth::UserRecord u;
        u.id = item.substr(0, colon);
        u.authKey = item.substr(colon + 1);
        store.Put(std::string(auth::kUsersPrefix) + u.id, u.ToJSON()).get();
        LOG_INFO("Seeded user {}", u.id);
    }
}

Registries buildRegistries() {
    Registries r;

    r.tools.Register(std::make_shared<FunctionTool>(
        Tool{"echo", "Echoes the supplied text", echoSchema()},
        [](const JSONValue& args, const CallContext&) {
            ToolResult tr;
            tr.content.push_back(textContent(GetStringMember(args, "text").value_or("")));
            return ready(std::move(tr));
        }));

    JSONValue::Object emptySchema; emptySchema["type"] = std::make_shared<JSONValue>(std::string("object"));
    r.tools.Register(std::make_shared<FunctionTool>(
        Tool{"rebuild_auth_index", "Re-indexes every user record (admin only)", JSONValue{emptySchema}},
        [](const JSONValue&, const CallContext& ctx) -> std::future<ToolResult> {
            if (!ctx.isAdmin) {
                throw errors::ToolError("Admin access required");
            }
            if (!ctx.storage) {
                throw errors::ToolError("No storage backend configured");
            }
            const std::size_t indexed = auth::RebuildAuthIndex(ctx.storage).get();
            ToolResult tr;
            tr.content.push_back(textContent(fmt::format("Indexed {} users", indexed)));
            return ready(std::move(tr));
        }));

    r.resources.Register(std::make_shared<FunctionResource>(
        Resource{"mcpgate://server/info", "Server info", std::string("Server name and version"),
                 std::string("application/json")},
        [](const CallContext& ctx) {
            JSONValue::Object info;
            info["version"] = std::make_shared<JSONValue>(getVersionString());
            info["userId"] = std::make_shared<JSONValue>(ctx.userId);
            ResourceContent c;
            c.uri = "mcpgate://server/info";
            c.mimeType = "application/json";
            c.text = SerializeJSON(JSONValue{info});
            return ready(std::move(c));
        }));

    r.prompts.Register(std::make_shared<FunctionPrompt>(
        Prompt{"summarize", "Asks the model for a short summary",
               {PromptArgument{"text", std::string("Text to summarize"), true}}},
        [](const JSONValue& args, const CallContext&) {
            JSONValue::Object msg;
            msg["role"] = std::make_shared<JSONValue>(std::string("user"));
            msg["content"] = std::make_shared<JSONValue>(
                textContent("Summarize in two sentences:\n" + GetStringMember(args, "text").value_or("")));
            PromptResult pr;
            pr.description = "Summary request";
            pr.messages.push_back(JSONValue{msg});
            return ready(std::move(pr));
        }));

    return r;
}
}

int main(int argc, char** argv) {
    FUNC_SCOPE();
    ServerConfig config = LoadConfigFromEnv();
    Logger::setLogLevelFromString(config.logLevel);
    if (auto listen = getArgValue(argc, argv, "--listen")) {
        config.listen = listen.value();
    }

    Registries registries;
    try {
        registries = buildRegistries();
    } catch (const std::invalid_argument& e) {
        LOG_FATAL("Registration failed: {}", e.what());
    }

    auto store = std::make_shared<storage::InMemoryStorage>();
    seedUsers(*store);

    ServerFactory factory;
    auto server = factory.CreateServer(config, std::move(registries), store);

    auto httpOpts = HTTPServerFactory::ParseListenUri(config.listen);
    if (httpOpts.rpcPath == HTTPServer::Options{}.rpcPath) {
        httpOpts.rpcPath = config.rpcPath;
    }
    std::unique_ptr<HTTPServer> http;
    try {
        http = std::make_unique<HTTPServer>(httpOpts);
    } catch (const std::exception& e) {
        LOG_FATAL("HTTP endpoint setup failed: {}", e.what());
    }

    http->Attach(*server);
    http->SetErrorHandler([](const std::string& e) {
        LOG_ERROR("HTTP endpoint error: {}", e);
        gRunning.store(false);
    });

    ::signal(SIGTERM, handleSig);
    ::signal(SIGINT, handleSig);
    http->Start().get();

    while (gRunning.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    LOG_INFO("Shutting down");
    http->Stop().get();
    return 0;
}
