/*
 * File: tests/test_conflict_resolver.cpp
 * Project: Tool Sync
 * Purpose: Resolution strategies, conflict descriptors, resolution event shape
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include "common/conflict_resolver.hpp"
#include "test_support.hpp"

using nlohmann::json;

TEST_CASE("strategy names parse with latest_wins as fallback")
{
    REQUIRE(parse_conflict_strategy("client_wins") == ConflictStrategy::ClientWins);
    REQUIRE(parse_conflict_strategy("merge") == ConflictStrategy::Merge);
    REQUIRE(parse_conflict_strategy("latest_wins") == ConflictStrategy::LatestWins);
    REQUIRE(parse_conflict_strategy("bogus") == ConflictStrategy::LatestWins);
}

TEST_CASE("resolve_state per strategy")
{
    json server{{"a", 1}, {"b", 2}};
    json client{{"b", 3}, {"c", 4}};
    REQUIRE(ConflictResolver::resolve_state(ConflictStrategy::LatestWins, server, client) == server);
    REQUIRE(ConflictResolver::resolve_state(ConflictStrategy::ClientWins, server, client) == client);
    REQUIRE(ConflictResolver::resolve_state(ConflictStrategy::Merge, server, client) ==
            json{{"a", 1}, {"b", 3}, {"c", 4}});
}

TEST_CASE("merge is shallow and treats non-objects as empty")
{
    json server{{"cfg", {{"x", 1}, {"y", 2}}}};
    json client{{"cfg", {{"x", 5}}}};
    REQUIRE(shallow_merge(server, client) == json{{"cfg", {{"x", 5}}}});
    REQUIRE(shallow_merge(json::array({1, 2}), client) == client);
    REQUIRE(shallow_merge(server, json(42)) == server);
    // merging a state with itself is a no-op
    REQUIRE(shallow_merge(server, server) == server);
}

TEST_CASE("conflict descriptors list each differing field")
{
    json server{{"count", 5}, {"same", true}};
    json client{{"count", 6}, {"same", true}, {"extra", "x"}};
    auto resolved = ConflictResolver::resolve_state(ConflictStrategy::LatestWins, server, client);
    auto d = ConflictResolver::describe_conflicts(server, client, resolved);
    REQUIRE(d.size() == 2);
    REQUIRE(d[0] == json{{"field", "count"}, {"serverValue", 5}, {"clientValue", 6}, {"resolvedValue", 5}});
    REQUIRE(d[1].at("field") == "extra");
    REQUIRE(d[1].at("serverValue").is_null());
    REQUIRE(d[1].at("resolvedValue").is_null());
}

TEST_CASE("resolve builds a configuration_change event at server version + 1")
{
    StateSnapshot server;
    server.key = ToolKey{"tool-1", std::string("dep-1")};
    server.current_state = json{{"count", 5}};
    server.version = 4;
    auto now = at("2026-03-01T10:00:00Z");

    auto r = ConflictResolver::resolve(server, json{{"count", 6}}, 2, ConflictStrategy::ClientWins, "u2", "cr-1", now);
    REQUIRE(r.new_version == 5);
    REQUIRE(r.resolved_state == json{{"count", 6}});
    REQUIRE(r.event.update_type == UpdateType::ConfigurationChange);
    REQUIRE(r.event.sequence_number == 5);
    REQUIRE(r.event.id == "cr-1");
    REQUIRE(r.event.key == server.key);
    REQUIRE(*r.event.event_data.previous_state == json{{"count", 5}});
    REQUIRE(r.event.event_data.changed_fields == std::vector<std::string>{"count"});
    const auto &md = r.event.event_data.metadata;
    REQUIRE(md.at("conflictResolution") == "client_wins");
    REQUIRE(md.at("clientVersion") == 2);
    REQUIRE(md.at("serverVersion") == 4);
    REQUIRE(md.at("clientState") == json{{"count", 6}});
}
