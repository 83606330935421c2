/*
 * File: clients/watch_client/watch_client_main.cpp
 * Project: Tool Sync
 * Purpose: Example WS consumer: subscribes to broadcast channels and prints what arrives
 * Notes:
 *  - Pass --channel more than once to watch several channels
 *  - --ack acknowledges every tool_update that asks for it
 * Last updated: 2026-10-19
 */

#include <iostream>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <nlohmann/json.hpp>

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

int main(int argc, char **argv)
{
    std::string ws_url = "ws://localhost:8090/ws";
    std::string token = "dev-token";
    std::vector<std::string> channels;
    bool ack = false;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
        else if (a == "--token" && i + 1 < argc)
            token = argv[++i];
        else if (a == "--channel" && i + 1 < argc)
            channels.push_back(argv[++i]);
        else if (a == "--ack")
            ack = true;
    }
    if (channels.empty())
        channels.push_back("tool:tool-1:updates");

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = ws_url.find("//");
        auto hp = ws_url.substr(pos + 2);
        auto slash = hp.find("/");
        auto host = hp.substr(0, hp.find(":"));
        auto port = hp.substr(host.size() + 1, slash - host.size() - 1);
        auto target = slash == std::string::npos ? std::string("/") : hp.substr(slash);
        auto const results = res.resolve(host, port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.set_option(websocket::stream_base::decorator([&token](websocket::request_type &req)
                                                        { req.set(boost::beast::http::field::authorization,
                                                                  "Bearer " + token); }));
        ws.handshake(host, target);
        ws.text(true);
        for (const auto &c : channels)
            ws.write(boost::asio::buffer(json{{"action", "subscribe"}, {"channel", c}}.dump()));

        boost::beast::flat_buffer buf;
        while (true)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (!j.is_object())
                continue;
            std::cout << "watch got: " << j.dump() << "\n";
            if (!ack || j.value("type", std::string()) != "message")
                continue;
            const auto &msg = j["message"];
            if (msg.contains("metadata") && msg["metadata"].value("requiresAck", false))
            {
                auto id = msg["content"]["updateEvent"].value("id", std::string());
                ws.write(boost::asio::buffer(json{{"action", "ack"}, {"updateEventId", id}}.dump()));
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "watch: " << e.what() << "\n";
        return 1;
    }
}
