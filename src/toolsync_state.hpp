/*
 * File: src/toolsync_state.hpp
 * Project: Tool Sync
 * Purpose: Process-wide service state shared by the HTTP and WS servers
 * Notes:
 *  - Declaration order matters: the hub outlives the engine that publishes to it
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_set>
#include <boost/asio.hpp>
#include "common/access_control.hpp"
#include "common/channel_hub.hpp"
#include "common/config.hpp"
#include "common/document_store.hpp"
#include "common/file_document_store.hpp"
#include "common/sync_engine.hpp"

inline std::unique_ptr<DocumentStore> make_document_store(const ServerConfig &c)
{
    if (c.store == "memory")
        return std::make_unique<MemoryDocumentStore>();
    return std::make_unique<FileDocumentStore>(fs::path(c.data_dir) / "toolsync");
}

inline EngineOptions engine_options(const ServerConfig &c)
{
    EngineOptions o;
    o.history_default_limit = static_cast<std::size_t>(std::max(1, c.history_default_limit));
    o.history_max_limit = static_cast<std::size_t>(std::max(1, c.history_max_limit));
    o.cas_retries = c.cas_retries;
    o.ack_default = std::chrono::minutes(c.ack_default_minutes);
    return o;
}

struct ToolSyncState
{
    ServerConfig config;
    std::unique_ptr<DocumentStore> store;
    std::unique_ptr<Authenticator> auth;
    std::unique_ptr<AccessControl> access;
    ChannelHub hub;
    std::unique_ptr<SyncEngine> engine;

    std::mutex ws_mtx;
    std::unordered_set<void *> ws_clients; // track raw ptr keys
    std::atomic<std::size_t> open_streams{0};
    boost::asio::io_context *io = nullptr;
    std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

    explicit ToolSyncState(ServerConfig c, std::unique_ptr<DocumentStore> s = nullptr, NowFn now = system_now)
        : config(std::move(c)),
          store(s ? std::move(s) : make_document_store(config)),
          auth(std::make_unique<TokenAuthenticator>(config.tokens)),
          access(std::make_unique<DocumentAccessControl>(*store))
    {
        engine = std::make_unique<SyncEngine>(*store, *access, &hub, engine_options(config), std::move(now));
    }

    std::size_t ws_client_count()
    {
        std::scoped_lock lk(ws_mtx);
        return ws_clients.size();
    }
};
