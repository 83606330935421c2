/*
 * File: tests/test_http_endpoints.cpp
 * Project: Tool Sync
 * Purpose: HTTP routing and handlers, driven through HttpRouter without sockets
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include "test_support.hpp"
#include "toolsync_http.hpp"

using nlohmann::json;

struct HttpFixture
{
    ManualClock clock;
    ToolSyncState state{make_config(), std::make_unique<MemoryDocumentStore>(), clock.fn()};
    HttpRouter router{state};

    static ServerConfig make_config()
    {
        ServerConfig c;
        c.store = "memory";
        c.tokens = {{"tok-author", "author"}, {"tok-viewer", "viewer"}, {"tok-stranger", "stranger"}};
        return c;
    }

    HttpFixture()
    {
        set_log_quiet(true);
        seed_tool(*state.store, "T", "author");
        seed_deployment(*state.store, "D", "deployer", "S");
        seed_member(*state.store, "S", "viewer", "member");
    }

    RouteOutcome call(http::verb verb, const std::string &target, const std::string &token = "tok-author",
                      const std::string &body = "", const std::string &accept = "")
    {
        Request req{verb, target, 11};
        if (!token.empty())
            req.set(http::field::authorization, "Bearer " + token);
        if (!accept.empty())
            req.set(http::field::accept, accept);
        if (!body.empty())
        {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        clock.advance(std::chrono::milliseconds(10));
        return router.route(req);
    }

    json body_of(const RouteOutcome &o) { return json::parse(o.response.body()); }

    json submit(int count)
    {
        auto o = call(http::verb::post, "/v1/tools/updates", "tok-author",
                      json{{"toolId", "T"}, {"deploymentId", "D"}, {"updateType", "state_change"},
                           {"eventData", {{"newState", {{"count", count}}}}}}
                          .dump());
        REQUIRE(o.response.result() == http::status::ok);
        return body_of(o);
    }
};

TEST_CASE("query strings are split and percent-decoded")
{
    auto q = parse_query("/v1/tools/updates?toolId=T&since=2026-03-01T10%3A00%3A00Z&flag&name=a+b");
    REQUIRE(q["toolId"] == "T");
    REQUIRE(q["since"] == "2026-03-01T10:00:00Z");
    REQUIRE(q["flag"].empty());
    REQUIRE(q["name"] == "a b");
    REQUIRE(parse_query("/health").empty());
    REQUIRE(target_path("/v1/tools/state?x=1") == "/v1/tools/state");
}

TEST_CASE_METHOD(HttpFixture, "health and config")
{
    auto o = call(http::verb::get, "/health", "");
    REQUIRE(o.response.result() == http::status::ok);
    auto j = body_of(o);
    REQUIRE(j.at("status") == "ok");
    REQUIRE(j.at("ws_clients") == 0);

    auto c = body_of(call(http::verb::get, "/v1/config", ""));
    REQUIRE(c.at("store") == "memory");
    REQUIRE_FALSE(c.contains("tokens"));
}

TEST_CASE_METHOD(HttpFixture, "unknown routes are 404")
{
    auto o = call(http::verb::get, "/v1/nope");
    REQUIRE(o.response.result() == http::status::not_found);
    REQUIRE(body_of(o) == json{{"error", "not found"}});
    REQUIRE(call(http::verb::patch, "/v1/tools/updates").response.result() == http::status::not_found);
}

TEST_CASE_METHOD(HttpFixture, "missing or unknown bearer token is 401")
{
    auto o = call(http::verb::get, "/v1/tools/updates?toolId=T", "");
    REQUIRE(o.response.result() == http::status::unauthorized);
    REQUIRE(body_of(o).at("error").at("code") == "UNAUTHORIZED");
    REQUIRE(call(http::verb::get, "/v1/tools/updates?toolId=T", "tok-bogus").response.result() ==
            http::status::unauthorized);
}

TEST_CASE_METHOD(HttpFixture, "submit returns the event summary")
{
    auto j = submit(5);
    REQUIRE(j.at("success") == true);
    const auto &e = j.at("updateEvent");
    REQUIRE(e.at("toolId") == "T");
    REQUIRE(e.at("updateType") == "state_change");
    REQUIRE(e.at("sequenceNumber") == 1);
    REQUIRE(e.at("affectedUsers") == 3);
    REQUIRE(e.at("id").get<std::string>().rfind("tool_update_T_", 0) == 0);
}

TEST_CASE_METHOD(HttpFixture, "submit input and permission errors")
{
    auto bad_json = call(http::verb::post, "/v1/tools/updates", "tok-author", "{nope");
    REQUIRE(bad_json.response.result() == http::status::bad_request);
    REQUIRE(body_of(bad_json).at("error").at("code") == "INVALID_INPUT");

    auto missing = call(http::verb::post, "/v1/tools/updates", "tok-author", json{{"toolId", "T"}}.dump());
    REQUIRE(missing.response.result() == http::status::bad_request);
    REQUIRE(body_of(missing).at("error").at("message") == "Tool ID, update type, and event data are required");

    auto forbidden = call(http::verb::post, "/v1/tools/updates", "tok-viewer",
                          json{{"toolId", "T"}, {"updateType", "state_change"}, {"eventData", json::object()}}.dump());
    REQUIRE(forbidden.response.result() == http::status::forbidden);
    REQUIRE(body_of(forbidden).at("success") == false);

    auto unknown = call(http::verb::post, "/v1/tools/updates", "tok-author",
                        json{{"toolId", "X"}, {"updateType", "state_change"}, {"eventData", json::object()}}.dump());
    REQUIRE(unknown.response.result() == http::status::not_found);
    REQUIRE(body_of(unknown).at("error").at("code") == "RESOURCE_NOT_FOUND");
}

TEST_CASE_METHOD(HttpFixture, "history lists updates with snapshot and status")
{
    submit(1);
    submit(2);
    submit(3);
    auto o = call(http::verb::get, "/v1/tools/updates?toolId=T&deploymentId=D&limit=2&includeSnapshot=true",
                  "tok-viewer");
    REQUIRE(o.response.result() == http::status::ok);
    REQUIRE_FALSE(o.stream.has_value());
    auto j = body_of(o);
    REQUIRE(j.at("updates").size() == 2);
    REQUIRE(j.at("updates")[1].at("sequenceNumber") == 3);
    REQUIRE(j.at("hasMore") == true);
    REQUIRE(j.at("lastSequenceNumber") == 3);
    REQUIRE(j.at("stateSnapshot").at("version") == 3);
    REQUIRE(j.at("syncStatus").at("status") == "synced");

    auto plain = body_of(call(http::verb::get, "/v1/tools/updates?toolId=T&deploymentId=D", "tok-viewer"));
    REQUIRE(plain.at("stateSnapshot").is_null());

    REQUIRE(call(http::verb::get, "/v1/tools/updates?toolId=T&limit=lots").response.result() ==
            http::status::bad_request);
    REQUIRE(call(http::verb::get, "/v1/tools/updates?deploymentId=D").response.result() ==
            http::status::bad_request);
}

TEST_CASE_METHOD(HttpFixture, "streaming accept header switches to live delivery")
{
    auto o = call(http::verb::get, "/v1/tools/updates?deploymentId=D&toolId=T", "tok-viewer", "",
                  "text/event-stream");
    REQUIRE(o.stream.has_value());
    REQUIRE(o.sse);
    REQUIRE(o.stream->user_id == "viewer");
    REQUIRE(o.stream->deployment_id == "D");
    REQUIRE(o.stream->tool_id == std::optional<std::string>("T"));

    auto nd = call(http::verb::get, "/v1/tools/updates?deploymentId=D", "tok-viewer", "", "application/x-ndjson");
    REQUIRE(nd.stream.has_value());
    REQUIRE_FALSE(nd.sse);

    auto denied = call(http::verb::get, "/v1/tools/updates?deploymentId=D", "tok-stranger", "", "text/event-stream");
    REQUIRE_FALSE(denied.stream.has_value());
    REQUIRE(denied.response.result() == http::status::forbidden);
}

TEST_CASE_METHOD(HttpFixture, "sync resolves a stale client")
{
    for (int c : {3, 4, 5, 6})
        submit(c);
    auto o = call(http::verb::put, "/v1/tools/updates", "tok-viewer",
                  json{{"toolId", "T"}, {"deploymentId", "D"}, {"clientVersion", 3},
                       {"clientState", {{"count", 99}}}, {"conflictResolution", "latest_wins"}}
                      .dump());
    REQUIRE(o.response.result() == http::status::ok);
    auto j = body_of(o);
    REQUIRE(j.at("syncResult") == "conflict_resolved");
    REQUIRE(j.at("serverState") == json{{"count", 6}});
    REQUIRE(j.at("serverVersion") == 5);
    REQUIRE(j.at("resolutionStrategy") == "latest_wins");
    REQUIRE(j.at("conflicts").size() == 1);

    auto missing = call(http::verb::put, "/v1/tools/updates", "tok-viewer", json{{"toolId", "T"}}.dump());
    REQUIRE(missing.response.result() == http::status::bad_request);
}

TEST_CASE_METHOD(HttpFixture, "cleanup deletes events")
{
    auto id = submit(1).at("updateEvent").at("id").get<std::string>();
    auto o = call(http::verb::delete_, "/v1/tools/updates?toolId=T&eventId=" + id);
    REQUIRE(o.response.result() == http::status::ok);
    auto j = body_of(o);
    REQUIRE(j.at("deletedCount") == 1);
    REQUIRE(j.at("message") == "Cleaned up 1 tool update events");

    REQUIRE(call(http::verb::delete_, "/v1/tools/updates?toolId=T").response.result() == http::status::bad_request);
    REQUIRE(call(http::verb::delete_, "/v1/tools/updates?toolId=T&eventId=" + id).response.result() ==
            http::status::not_found);
}

TEST_CASE_METHOD(HttpFixture, "acks are recorded and queried")
{
    auto o = call(http::verb::post, "/v1/tools/updates", "tok-author",
                  json{{"toolId", "T"}, {"deploymentId", "D"}, {"updateType", "execution_result"},
                       {"eventData", json::object()}, {"targetUsers", {"viewer"}}, {"requiresAck", true}}
                      .dump());
    auto id = body_of(o).at("updateEvent").at("id").get<std::string>();

    auto ack = call(http::verb::post, "/v1/tools/acks", "tok-viewer", json{{"updateEventId", id}}.dump());
    REQUIRE(ack.response.result() == http::status::ok);
    REQUIRE(body_of(ack).at("ackTracking").at("status") == "complete");

    auto st = body_of(call(http::verb::get, "/v1/tools/acks?updateEventId=" + id, "tok-viewer"));
    REQUIRE(st.at("ackTracking").at("receivedAcks") == json::array({"viewer"}));

    REQUIRE(call(http::verb::post, "/v1/tools/acks", "tok-viewer", json::object().dump()).response.result() ==
            http::status::bad_request);
    REQUIRE(call(http::verb::get, "/v1/tools/acks?updateEventId=nope").response.result() == http::status::not_found);
}

TEST_CASE_METHOD(HttpFixture, "element state view")
{
    call(http::verb::post, "/v1/tools/updates", "tok-author",
         json{{"toolId", "T"}, {"deploymentId", "D"}, {"updateType", "value_update"},
              {"eventData", {{"newState", {{"counters", {{"poll-1:yes", 4}}}}}}}}
             .dump());
    auto o = call(http::verb::get, "/v1/tools/state?toolId=T&deploymentId=D&elementId=poll-1", "tok-viewer");
    REQUIRE(o.response.result() == http::status::ok);
    REQUIRE(body_of(o).at("view").at("tally") == json{{"yes", 4}});
    REQUIRE(call(http::verb::get, "/v1/tools/state?toolId=T", "tok-viewer").response.result() ==
            http::status::bad_request);
}

TEST_CASE_METHOD(HttpFixture, "store failures become a generic 500")
{
    auto flaky = std::make_unique<FlakyStore>();
    auto &raw = *flaky;
    ToolSyncState broken{make_config(), std::move(flaky), clock.fn()};
    seed_tool(raw, "T", "author");
    raw.failing.insert(collections::kEvents);
    HttpRouter r{broken};

    Request req{http::verb::post, "/v1/tools/updates", 11};
    req.set(http::field::authorization, "Bearer tok-author");
    req.body() = json{{"toolId", "T"}, {"updateType", "state_change"}, {"eventData", json::object()}}.dump();
    req.prepare_payload();
    auto o = r.route(req);
    REQUIRE(o.response.result() == http::status::internal_server_error);
    auto j = json::parse(o.response.body());
    REQUIRE(j.at("error").at("code") == "INTERNAL_ERROR");
    REQUIRE(j.at("error").at("message") == "Failed to process tool update");
}
