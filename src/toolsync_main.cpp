/*
 * File: src/toolsync_main.cpp
 * Project: Tool Sync
 * Purpose: Main server binary: HTTP /v1/tools/* endpoints, WS broker
 * Notes:
 *  - Flags: --config <file.json> --http host:port --ws host:port --data <dir> --store file|memory --threads N
 *  - File store lives under <data>/toolsync, one JSON document per file
 *  - SIGINT/SIGTERM stop the io_context
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <thread>
#include <vector>
#include <boost/asio.hpp>
#include "common/log.hpp"
#include "toolsync_http.hpp"
#include "toolsync_state.hpp"
#include "toolsync_ws.hpp"

int main(int argc, char **argv)
{
    ServerConfig config;
    try
    {
        config = config_from_args(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "toolsync: " << e.what() << "\n";
        return 2;
    }

    try
    {
        auto [http_host, http_port] = split_host_port(config.http_bind);
        auto [ws_host, ws_port] = split_host_port(config.ws_bind);

        boost::asio::io_context ioc{config.threads};
        ToolSyncState state{config};
        state.io = &ioc;

        boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(http_host), http_port};
        boost::asio::ip::tcp::endpoint ws_ep{boost::asio::ip::make_address(ws_host), ws_port};

        HttpServer http{ioc, http_ep, state};
        WsServer ws{ioc, ws_ep, state};

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](boost::system::error_code, int sig)
                           {
            log_info("main", "signal " + std::to_string(sig) + ", shutting down");
            ioc.stop(); });

        log_info("main", "toolsync listening http=" + config.http_bind + " ws=" + config.ws_bind +
                             " store=" + config.store + " data=" + config.data_dir +
                             " threads=" + std::to_string(config.threads));

        std::vector<std::thread> workers;
        for (int i = 1; i < config.threads; ++i)
            workers.emplace_back([&ioc]
                                 { ioc.run(); });
        ioc.run();
        for (auto &t : workers)
            t.join();
    }
    catch (const std::exception &e)
    {
        log_error("main", e.what());
        return 1;
    }
    return 0;
}
