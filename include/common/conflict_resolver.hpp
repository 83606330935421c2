/*
 * File: include/common/conflict_resolver.hpp
 * Project: Tool Sync
 * Purpose: Policy-based resolution of a stale client write against the server snapshot
 * Notes:
 *  - Resolution is one step: earlier resolutions are never consulted
 *  - merge is shallow (see state_diff.hpp)
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <string>
#include "common/state_diff.hpp"
#include "common/tool_types.hpp"

struct ConflictResolution
{
    json resolved_state;
    std::int64_t new_version = 0;
    json conflicts = json::array();
    ConflictStrategy strategy = ConflictStrategy::LatestWins;
    UpdateEvent event; // configuration_change carrying the resolution
};

class ConflictResolver
{
public:
    static json resolve_state(ConflictStrategy strategy, const json &server_state, const json &client_state)
    {
        switch (strategy)
        {
        case ConflictStrategy::ClientWins:
            return client_state;
        case ConflictStrategy::Merge:
            return shallow_merge(server_state, client_state);
        case ConflictStrategy::LatestWins:
            break;
        }
        return server_state;
    }

    // One descriptor per top-level field where server and client disagree.
    static json describe_conflicts(const json &server_state, const json &client_state, const json &resolved)
    {
        json out = json::array();
        const auto &res = object_or_empty(resolved);
        for (const auto &field : changed_fields(server_state, client_state))
        {
            json d{{"field", field}};
            const auto &s = object_or_empty(server_state);
            const auto &c = object_or_empty(client_state);
            d["serverValue"] = s.contains(field) ? s.at(field) : json();
            d["clientValue"] = c.contains(field) ? c.at(field) : json();
            d["resolvedValue"] = res.contains(field) ? res.at(field) : json();
            out.push_back(std::move(d));
        }
        return out;
    }

    static ConflictResolution resolve(const StateSnapshot &server, const json &client_state,
                                      std::int64_t client_version, ConflictStrategy strategy,
                                      const std::string &user_id, const std::string &event_id, SysTime now)
    {
        ConflictResolution r;
        r.strategy = strategy;
        r.resolved_state = resolve_state(strategy, server.current_state, client_state);
        r.new_version = server.version + 1;
        r.conflicts = describe_conflicts(server.current_state, client_state, r.resolved_state);

        UpdateEvent &e = r.event;
        e.id = event_id;
        e.key = server.key;
        e.tool_name = "Tool";
        e.space_id = server.space_id;
        e.user_id = user_id;
        e.update_type = UpdateType::ConfigurationChange;
        e.event_data.previous_state = server.current_state;
        e.event_data.new_state = r.resolved_state;
        e.event_data.changed_fields = changed_fields(server.current_state, r.resolved_state);
        e.event_data.metadata = json{{"conflictResolution", to_string(strategy)},
                                     {"clientVersion", client_version},
                                     {"serverVersion", server.version},
                                     {"clientState", client_state}};
        e.timestamp = now;
        e.sequence_number = r.new_version;
        return r;
    }
};
