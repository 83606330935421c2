/*
 * File: src/toolsync_http.hpp
 * Project: Tool Sync
 * Purpose: HTTP routing and handlers
 * Notes:
 *  - HttpRouter is socket-free so it can be driven directly from tests
 *  - Errors leave as {"success":false,"error":{"code","message"}}; store text never leaks
 *  - GET /v1/tools/updates with a streaming Accept header hands the socket to StreamHttpSession
 * Last updated: 2026-10-19
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/strand.hpp>

#include <nlohmann/json.hpp>

#include <cctype>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

#include "common/errors.hpp"
#include "common/log.hpp"
#include "common/sync_engine.hpp"
#include "toolsync_state.hpp"
#include "toolsync_stream.hpp"

namespace http = boost::beast::http;

using Request = http::request<http::string_body>;
using Response = http::response<http::string_body>;

// -------- query helpers --------

inline std::string percent_decode(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '+')
            out.push_back(' ');
        else if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) &&
                 std::isxdigit(static_cast<unsigned char>(s[i + 2])))
        {
            out.push_back(static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16)));
            i += 2;
        }
        else
            out.push_back(s[i]);
    }
    return out;
}

// "/path?a=1&b=x%20y" -> {"a":"1","b":"x y"}
inline std::map<std::string, std::string> parse_query(const std::string &target)
{
    std::map<std::string, std::string> out;
    auto qpos = target.find('?');
    if (qpos == std::string::npos)
        return out;
    auto qs = target.substr(qpos + 1);
    std::size_t start = 0;
    while (start <= qs.size())
    {
        auto amp = qs.find('&', start);
        auto part = qs.substr(start, amp == std::string::npos ? std::string::npos : amp - start);
        if (!part.empty())
        {
            auto eq = part.find('=');
            if (eq == std::string::npos)
                out[percent_decode(part)] = "";
            else
                out[percent_decode(part.substr(0, eq))] = percent_decode(part.substr(eq + 1));
        }
        if (amp == std::string::npos)
            break;
        start = amp + 1;
    }
    return out;
}

inline std::string target_path(const std::string &target)
{
    return target.substr(0, target.find('?'));
}

inline std::optional<std::string> query_opt(const std::map<std::string, std::string> &q, const char *k)
{
    auto it = q.find(k);
    if (it == q.end() || it->second.empty())
        return std::nullopt;
    return it->second;
}

inline bool wants_stream(const Request &req, bool &sse)
{
    std::string accept(req[http::field::accept]);
    sse = accept.find("text/event-stream") != std::string::npos;
    return sse || accept.find("application/x-ndjson") != std::string::npos;
}

// -------- responses --------

inline Response json_response(http::status status, const nlohmann::json &body, unsigned version)
{
    Response res{status, version};
    res.set(http::field::content_type, "application/json");
    res.body() = body.dump();
    res.prepare_payload();
    return res;
}

inline Response error_response(ErrorCode code, const std::string &message, unsigned version)
{
    return json_response(static_cast<http::status>(error_http_status(code)),
                         nlohmann::json{{"success", false},
                                        {"error", {{"code", error_code_name(code)}, {"message", message}}}},
                         version);
}

struct RouteOutcome
{
    Response response;
    std::optional<StreamParams> stream; // set when the socket should switch to live delivery
    bool sse = false;
};

class HttpRouter
{
    ToolSyncState &state_;

    std::string authenticate(const Request &req)
    {
        auto token = bearer_token(std::string(req[http::field::authorization]));
        std::optional<std::string> user;
        if (!token.empty())
            user = state_.auth->verify(token);
        if (!user)
            throw SyncError(ErrorCode::Unauthorized, "Unauthorized");
        return *user;
    }

    static nlohmann::json parse_body(const Request &req)
    {
        auto j = nlohmann::json::parse(req.body(), nullptr, false);
        if (j.is_discarded())
            throw SyncError(ErrorCode::InvalidInput, "Request body is not valid JSON");
        return j;
    }

    Response ok(const Request &req, nlohmann::json body)
    {
        body["success"] = true;
        return json_response(http::status::ok, body, req.version());
    }

    Response submit(const Request &req)
    {
        auto user = authenticate(req);
        auto r = state_.engine->submit_update(user, submit_request_from_json(parse_body(req)));
        const auto &e = r.event;
        return ok(req, {{"updateEvent",
                         {{"id", e.id},
                          {"toolId", e.key.tool_id},
                          {"updateType", to_string(e.update_type)},
                          {"sequenceNumber", e.sequence_number},
                          {"affectedUsers", r.affected_users},
                          {"timestamp", format_iso8601_ms(e.timestamp)}}}});
    }

    RouteOutcome history_or_stream(const Request &req)
    {
        auto user = authenticate(req);
        auto q = parse_query(std::string(req.target()));
        auto deployment = query_opt(q, "deploymentId");
        auto space = query_opt(q, "spaceId");
        auto tool = query_opt(q, "toolId");

        bool sse = false;
        if (wants_stream(req, sse) && deployment)
        {
            if (!state_.access->can_read(user, tool.value_or(""), deployment, space))
                throw SyncError(ErrorCode::Forbidden, "Access denied to this tool");
            StreamParams p;
            p.user_id = user;
            p.deployment_id = *deployment;
            p.tool_id = tool;
            p.space_id = space;
            p.poll_window = std::chrono::milliseconds(state_.config.poll_window_ms);
            p.batch = static_cast<std::size_t>(state_.config.stream_batch);
            RouteOutcome out{Response{http::status::ok, req.version()}, p, sse};
            return out;
        }

        HistoryRequest h;
        h.tool_id = tool.value_or("");
        h.deployment_id = deployment;
        h.space_id = space;
        h.since = query_opt(q, "since");
        if (auto lim = query_opt(q, "limit"))
        {
            try
            {
                h.limit = std::stoll(*lim);
            }
            catch (const std::exception &)
            {
                throw SyncError(ErrorCode::InvalidInput, "limit must be a number");
            }
        }
        h.include_snapshot = query_opt(q, "includeSnapshot").value_or("") == "true";

        auto r = state_.engine->fetch_history(user, h);
        return RouteOutcome{ok(req, {{"updates", r.page.events},
                                     {"stateSnapshot", r.snapshot ? nlohmann::json(*r.snapshot) : nlohmann::json()},
                                     {"syncStatus", r.sync_status},
                                     {"hasMore", r.page.has_more},
                                     {"lastSequenceNumber", r.page.last_sequence_number}})};
    }

    Response sync(const Request &req)
    {
        auto user = authenticate(req);
        auto r = state_.engine->reconcile(user, sync_request_from_json(parse_body(req)));
        nlohmann::json body{{"syncResult", r.sync_result},
                            {"serverState", r.server_state},
                            {"serverVersion", r.server_version},
                            {"conflicts", r.conflicts}};
        if (r.strategy)
            body["resolutionStrategy"] = to_string(*r.strategy);
        return ok(req, body);
    }

    Response cleanup(const Request &req)
    {
        auto user = authenticate(req);
        auto q = parse_query(std::string(req.target()));
        CleanupRequest c;
        c.tool_id = query_opt(q, "toolId").value_or("");
        c.deployment_id = query_opt(q, "deploymentId");
        c.event_id = query_opt(q, "eventId");
        c.older_than = query_opt(q, "olderThan");
        auto n = state_.engine->cleanup(user, c);
        return ok(req, {{"deletedCount", n}, {"message", "Cleaned up " + std::to_string(n) + " tool update events"}});
    }

    Response ack(const Request &req)
    {
        auto user = authenticate(req);
        auto body = parse_body(req);
        if (!body.is_object() || !body.contains("updateEventId") || !body["updateEventId"].is_string())
            throw SyncError(ErrorCode::InvalidInput, "updateEventId is required");
        auto t = state_.engine->acknowledge(user, body["updateEventId"].get<std::string>());
        return ok(req, {{"ackTracking", t}});
    }

    Response ack_status(const Request &req)
    {
        auto user = authenticate(req);
        auto q = parse_query(std::string(req.target()));
        auto t = state_.engine->ack_status(user, query_opt(q, "updateEventId").value_or(""));
        return ok(req, {{"ackTracking", t}});
    }

    Response element_state(const Request &req)
    {
        auto user = authenticate(req);
        auto q = parse_query(std::string(req.target()));
        ToolKey key{query_opt(q, "toolId").value_or(""), query_opt(q, "deploymentId")};
        auto view = state_.engine->element_view(user, key, query_opt(q, "elementId").value_or(""));
        return ok(req, {{"view", view}});
    }

    RouteOutcome dispatch(const Request &req)
    {
        using nlohmann::json;
        const auto path = target_path(std::string(req.target()));
        const auto method = req.method();

        // GET /health
        if (method == http::verb::get && path == "/health")
        {
            auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state_.start).count();
            return {json_response(http::status::ok,
                                  json{{"status", "ok"},
                                       {"uptime_s", up},
                                       {"ws_clients", state_.ws_client_count()},
                                       {"streams", state_.open_streams.load()}},
                                  req.version())};
        }

        // GET /v1/config
        if (method == http::verb::get && path == "/v1/config")
            return {json_response(http::status::ok, config_to_json(state_.config), req.version())};

        if (path == "/v1/tools/updates")
        {
            if (method == http::verb::post)
                return {submit(req)};
            if (method == http::verb::get)
                return history_or_stream(req);
            if (method == http::verb::put)
                return {sync(req)};
            if (method == http::verb::delete_)
                return {cleanup(req)};
        }

        if (path == "/v1/tools/acks")
        {
            if (method == http::verb::post)
                return {ack(req)};
            if (method == http::verb::get)
                return {ack_status(req)};
        }

        if (method == http::verb::get && path == "/v1/tools/state")
            return {element_state(req)};

        // 404 fallback
        return {json_response(http::status::not_found, json{{"error", "not found"}}, req.version())};
    }

public:
    explicit HttpRouter(ToolSyncState &s) : state_(s) {}

    RouteOutcome route(const Request &req)
    {
        try
        {
            return dispatch(req);
        }
        catch (const SyncError &e)
        {
            if (e.code() == ErrorCode::InternalError)
                log_error("http", std::string(req.method_string()) + " " + std::string(req.target()) + ": " + e.what());
            return {error_response(e.code(), e.what(), req.version())};
        }
        catch (const std::exception &e)
        {
            log_error("http", std::string(req.method_string()) + " " + std::string(req.target()) + ": " + e.what());
            return {error_response(ErrorCode::InternalError, "Internal error", req.version())};
        }
    }
};

// -------- HTTP server --------

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    ToolSyncState &state_;

public:
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, ToolSyncState &s)
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
            throw std::runtime_error("http listen failed: " + ec.message());
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
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        Request req;
        ToolSyncState &state;

        Session(boost::asio::ip::tcp::socket &&s, ToolSyncState &st)
            : socket(std::move(s)), state(st) {}

        void run() { do_read(); }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, req, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (!ec) self->handle(); });
        }

        // keep response alive through async_write
        void respond(Response &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<Response>(std::move(res));
            sp->set(http::field::server, "toolsync-beast");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void handle()
        {
            HttpRouter router{state};
            auto out = router.route(req);
            if (out.stream)
            {
                std::make_shared<StreamHttpSession>(std::move(socket), state, std::move(*out.stream), out.sse)
                    ->start(req.version());
                return;
            }
            respond(std::move(out.response));
        }
    };
};
