/*
 * File: tests/test_broadcast.cpp
 * Project: Tool Sync
 * Purpose: Channel derivation, outbox message shape, hub delivery
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <vector>
#include "common/broadcast.hpp"
#include "test_support.hpp"

using nlohmann::json;

TEST_CASE("channels derive from tool, deployment and space")
{
    REQUIRE(channels_for("T", std::string("D"), std::string("S"), true) ==
            std::vector<std::string>{"tool:T:updates", "deployment:D:updates", "space:S:tools"});
    REQUIRE(channels_for("T", std::nullopt, std::string("S"), false) ==
            std::vector<std::string>{"tool:T:updates"});
    REQUIRE(channels_for("T", std::string("D"), std::nullopt, true) ==
            std::vector<std::string>{"tool:T:updates", "deployment:D:updates"});
}

static UpdateEvent sample_event()
{
    UpdateEvent e;
    e.id = "evt-1";
    e.key = ToolKey{"T", std::string("D")};
    e.tool_name = "Poll";
    e.user_id = "u1";
    e.update_type = UpdateType::ValueUpdate;
    e.event_data.new_state = json{{"count", 1}};
    e.timestamp = at("2026-03-01T10:00:00Z");
    e.sequence_number = 4;
    e.requires_ack = true;
    e.broadcast_channels = channels_for("T", std::string("D"), std::string("S"), true);
    return e;
}

TEST_CASE("broadcast message carries the reduced event view")
{
    auto e = sample_event();
    auto m = make_broadcast_message(e, "tool:T:updates", "m1", at("2026-03-01T10:00:01Z"));
    REQUIRE(m.at("type") == "tool_update");
    REQUIRE(m.at("senderId") == "system");
    REQUIRE(m.at("channel") == "tool:T:updates");
    REQUIRE(m.at("content").at("action") == "tool_updated");
    const auto &v = m.at("content").at("updateEvent");
    REQUIRE(v.at("id") == "evt-1");
    REQUIRE(v.at("deploymentId") == "D");
    REQUIRE(v.at("sequenceNumber") == 4);
    REQUIRE_FALSE(v.contains("affectedUsers"));
    REQUIRE(m.at("metadata").at("requiresAck") == true);
    REQUIRE(m.at("metadata").at("priority") == "normal");
    REQUIRE(m.at("delivery").at("sent").empty());
}

TEST_CASE("fanout writes one outbox entry per channel and wakes subscribers")
{
    MemoryDocumentStore store;
    ChannelHub hub;
    ManualClock clock;
    std::vector<json> got;
    hub.subscribe("deployment:D:updates", [&](const std::string &, const json &m)
                  { got.push_back(m); });

    BroadcastFanout fanout{store, &hub, clock.fn()};
    REQUIRE(fanout.publish(sample_event()) == 3);
    REQUIRE(store.scan(collections::kMessages, nullptr).size() == 3);
    REQUIRE(got.size() == 1);
    REQUIRE(got[0].at("channel") == "deployment:D:updates");
}

TEST_CASE("fanout failures do not escape")
{
    FlakyStore store;
    store.failing.insert(collections::kMessages);
    ChannelHub hub;
    int calls = 0;
    hub.subscribe("tool:T:updates", [&](const std::string &, const json &)
                  { ++calls; });
    BroadcastFanout fanout{store, &hub};
    REQUIRE(fanout.publish(sample_event()) == 0);
    REQUIRE(calls == 0);
}

TEST_CASE("hub isolates failing subscribers")
{
    ChannelHub hub;
    int ok = 0;
    auto bad = hub.subscribe("c", [](const std::string &, const json &)
                             { throw std::runtime_error("boom"); });
    hub.subscribe("c", [&](const std::string &, const json &)
                  { ++ok; });
    REQUIRE(hub.subscriber_count("c") == 2);
    REQUIRE(hub.publish("c", json::object()) == 1);
    REQUIRE(ok == 1);
    hub.unsubscribe(bad);
    REQUIRE(hub.publish("c", json::object()) == 1);
    REQUIRE(hub.publish("other", json::object()) == 0);
}
