/*
 * File: src/toolsync_ws.hpp
 * Project: Tool Sync
 * Purpose: WebSocket broker for broadcast channels
 * Notes:
 *  - Upgrade requires "Authorization: Bearer <token>", 401 otherwise
 *  - Client frames: {"action":"subscribe"|"unsubscribe","channel":...}, {"action":"ack","updateEventId":...}
 *  - Hub messages are forwarded as {"type":"message","channel":...,"message":...}
 *  - All socket I/O runs on the session strand; writes are queued
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/asio.hpp>
#include <boost/asio/strand.hpp>
#include <nlohmann/json.hpp>

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include "common/errors.hpp"
#include "common/log.hpp"
#include "toolsync_state.hpp"

namespace websocket = boost::beast::websocket;

struct ChannelTarget
{
    std::string tool_id;
    std::optional<std::string> deployment_id;
    std::optional<std::string> space_id;
};

// "tool:T:updates" | "deployment:D:updates" | "space:S:tools"
inline std::optional<ChannelTarget> parse_channel(const std::string &channel)
{
    auto first = channel.find(':');
    auto last = channel.rfind(':');
    if (first == std::string::npos || last == first)
        return std::nullopt;
    auto kind = channel.substr(0, first);
    auto id = channel.substr(first + 1, last - first - 1);
    auto suffix = channel.substr(last + 1);
    if (id.empty())
        return std::nullopt;
    ChannelTarget t;
    if (kind == "tool" && suffix == "updates")
        t.tool_id = id;
    else if (kind == "deployment" && suffix == "updates")
        t.deployment_id = id;
    else if (kind == "space" && suffix == "tools")
        t.space_id = id;
    else
        return std::nullopt;
    return t;
}

class WsServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    ToolSyncState &state_;

public:
    WsServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, ToolSyncState &s)
        : ioc_(ioc), acceptor_(ioc), state_(s)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("ws listen failed: " + ec.message());
        do_accept();
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_),
                               [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket)
                               {
            if (!ec) std::make_shared<Session>(std::move(socket), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        websocket::stream<boost::asio::ip::tcp::socket> ws;
        boost::beast::flat_buffer buffer;
        boost::beast::http::request<boost::beast::http::string_body> upgrade;
        ToolSyncState &state;
        std::string user;
        std::map<std::string, std::uint64_t> subs; // channel -> hub id
        std::deque<std::string> outq;
        bool registered = false;

        Session(boost::asio::ip::tcp::socket &&s, ToolSyncState &st)
            : ws(std::move(s)), state(st) {}

        ~Session()
        {
            for (const auto &kv : subs)
                state.hub.unsubscribe(kv.second);
            if (registered)
            {
                std::scoped_lock lk(state.ws_mtx);
                state.ws_clients.erase(this);
            }
        }

        void run()
        {
            auto self = shared_from_this();
            boost::beast::http::async_read(ws.next_layer(), buffer, upgrade,
                                           [self](boost::beast::error_code ec, std::size_t)
                                           {
                if (!ec) self->on_upgrade(); });
        }

        void on_upgrade()
        {
            namespace http = boost::beast::http;
            if (!websocket::is_upgrade(upgrade))
                return reject(http::status::bad_request, ErrorCode::InvalidInput, "WebSocket upgrade required");
            auto token = bearer_token(std::string(upgrade[http::field::authorization]));
            std::optional<std::string> who;
            if (!token.empty())
                who = state.auth->verify(token);
            if (!who)
                return reject(http::status::unauthorized, ErrorCode::Unauthorized, "Unauthorized");
            user = *who;

            ws.set_option(websocket::stream_base::timeout::suggested(boost::beast::role_type::server));
            auto self = shared_from_this();
            ws.async_accept(upgrade, [self](boost::beast::error_code ec)
                            {
                if (ec) return;
                {
                    std::scoped_lock lk(self->state.ws_mtx);
                    self->state.ws_clients.insert(self.get());
                    self->registered = true;
                }
                self->do_read(); });
        }

        void reject(boost::beast::http::status status, ErrorCode code, const std::string &message)
        {
            namespace http = boost::beast::http;
            auto res = std::make_shared<http::response<http::string_body>>(status, upgrade.version());
            res->set(http::field::server, "toolsync-beast");
            res->set(http::field::content_type, "application/json");
            res->body() = nlohmann::json{{"success", false},
                                         {"error", {{"code", error_code_name(code)}, {"message", message}}}}
                              .dump();
            res->prepare_payload();
            auto self = shared_from_this();
            http::async_write(ws.next_layer(), *res, [self, res](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->ws.next_layer().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void do_read()
        {
            auto self = shared_from_this();
            ws.async_read(buffer, [self](boost::beast::error_code ec, std::size_t)
                          {
                if (ec) return;
                self->on_msg();
                self->do_read(); });
        }

        void on_msg()
        {
            auto data = boost::beast::buffers_to_string(buffer.data());
            buffer.consume(buffer.size());
            auto j = nlohmann::json::parse(data, nullptr, false);
            if (!j.is_object() || !j.contains("action") || !j["action"].is_string())
                return reply_error(ErrorCode::InvalidInput, "Message must be an object with an action");
            auto action = j["action"].get<std::string>();
            try
            {
                if (action == "subscribe" || action == "unsubscribe")
                {
                    auto channel = j.value("channel", std::string());
                    if (action == "subscribe")
                        subscribe(channel);
                    else
                        unsubscribe(channel);
                }
                else if (action == "ack")
                {
                    auto t = state.engine->acknowledge(user, j.value("updateEventId", std::string()));
                    send(nlohmann::json{{"type", "ack"}, {"ackTracking", t}});
                }
                else
                    reply_error(ErrorCode::InvalidInput, "Unknown action: " + action);
            }
            catch (const SyncError &e)
            {
                reply_error(e.code(), e.what());
            }
            catch (const nlohmann::json::exception &e)
            {
                reply_error(ErrorCode::InvalidInput, e.what());
            }
            catch (const std::exception &e)
            {
                log_error("ws", action + " from " + user + ": " + e.what());
                reply_error(ErrorCode::InternalError, "Internal error");
            }
        }

        void subscribe(const std::string &channel)
        {
            auto target = parse_channel(channel);
            if (!target)
                throw SyncError(ErrorCode::InvalidInput, "Unknown channel: " + channel);
            if (!state.access->can_read(user, target->tool_id, target->deployment_id, target->space_id))
                throw SyncError(ErrorCode::Forbidden, "Access denied to " + channel);
            if (!subs.count(channel))
            {
                std::weak_ptr<Session> weak = shared_from_this();
                subs[channel] = state.hub.subscribe(channel, [weak](const std::string &ch, const nlohmann::json &msg)
                                                    {
                    if (auto self = weak.lock())
                        self->send(nlohmann::json{{"type", "message"}, {"channel", ch}, {"message", msg}}); });
                log_info("ws", user + " subscribed to " + channel);
            }
            send(nlohmann::json{{"type", "subscribed"}, {"channel", channel}});
        }

        void unsubscribe(const std::string &channel)
        {
            auto it = subs.find(channel);
            if (it != subs.end())
            {
                state.hub.unsubscribe(it->second);
                subs.erase(it);
            }
            send(nlohmann::json{{"type", "unsubscribed"}, {"channel", channel}});
        }

        void reply_error(ErrorCode code, const std::string &message)
        {
            send(nlohmann::json{{"type", "error"}, {"code", error_code_name(code)}, {"message", message}});
        }

        // Safe from any thread.
        void send(const nlohmann::json &frame)
        {
            auto self = shared_from_this();
            boost::asio::post(ws.get_executor(), [self, text = frame.dump()]() mutable
                              {
                self->outq.push_back(std::move(text));
                if (self->outq.size() == 1) self->do_write(); });
        }

        void do_write()
        {
            auto self = shared_from_this();
            ws.text(true);
            ws.async_write(boost::asio::buffer(outq.front()), [self](boost::beast::error_code ec, std::size_t)
                           {
                if (ec) { self->outq.clear(); return; }
                self->outq.pop_front();
                if (!self->outq.empty()) self->do_write(); });
        }
    };
};
