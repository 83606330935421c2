/*
 * File: include/common/tool_types.hpp
 * Project: Tool Sync
 * Purpose: Snapshot, update event and ack tracking records plus their JSON form
 * Notes:
 *  - JSON field names are the wire/storage names (camelCase)
 *  - State payloads stay opaque nlohmann::json values
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/time_util.hpp"
#include "common/tool_key.hpp"

using nlohmann::json;

enum class UpdateType
{
    StateChange,
    ValueUpdate,
    ConfigurationChange,
    DeploymentUpdate,
    ExecutionResult,
    Error,
    StatusChange,
};

enum class SyncStatus
{
    Synced,
    Pending,
    Conflict,
    Error,
};

enum class ConflictStrategy
{
    LatestWins,
    ClientWins,
    Merge,
};

enum class AckStatus
{
    Pending,
    Complete,
    Expired,
};

inline const char *to_string(UpdateType t)
{
    switch (t)
    {
    case UpdateType::StateChange:
        return "state_change";
    case UpdateType::ValueUpdate:
        return "value_update";
    case UpdateType::ConfigurationChange:
        return "configuration_change";
    case UpdateType::DeploymentUpdate:
        return "deployment_update";
    case UpdateType::ExecutionResult:
        return "execution_result";
    case UpdateType::Error:
        return "error";
    case UpdateType::StatusChange:
        return "status_change";
    }
    return "state_change";
}

inline std::optional<UpdateType> parse_update_type(const std::string &s)
{
    static const UpdateType all[] = {UpdateType::StateChange, UpdateType::ValueUpdate,
                                     UpdateType::ConfigurationChange, UpdateType::DeploymentUpdate,
                                     UpdateType::ExecutionResult, UpdateType::Error,
                                     UpdateType::StatusChange};
    for (auto t : all)
        if (s == to_string(t))
            return t;
    return std::nullopt;
}

inline const char *to_string(SyncStatus s)
{
    switch (s)
    {
    case SyncStatus::Synced:
        return "synced";
    case SyncStatus::Pending:
        return "pending";
    case SyncStatus::Conflict:
        return "conflict";
    case SyncStatus::Error:
        return "error";
    }
    return "synced";
}

inline SyncStatus parse_sync_status(const std::string &s)
{
    if (s == "pending")
        return SyncStatus::Pending;
    if (s == "conflict")
        return SyncStatus::Conflict;
    if (s == "error")
        return SyncStatus::Error;
    return SyncStatus::Synced;
}

inline const char *to_string(ConflictStrategy s)
{
    switch (s)
    {
    case ConflictStrategy::LatestWins:
        return "latest_wins";
    case ConflictStrategy::ClientWins:
        return "client_wins";
    case ConflictStrategy::Merge:
        return "merge";
    }
    return "latest_wins";
}

// Unrecognized names fall back to latest_wins.
inline ConflictStrategy parse_conflict_strategy(const std::string &s)
{
    if (s == "client_wins")
        return ConflictStrategy::ClientWins;
    if (s == "merge")
        return ConflictStrategy::Merge;
    return ConflictStrategy::LatestWins;
}

inline const char *to_string(AckStatus s)
{
    switch (s)
    {
    case AckStatus::Pending:
        return "pending";
    case AckStatus::Complete:
        return "complete";
    case AckStatus::Expired:
        return "expired";
    }
    return "pending";
}

inline AckStatus parse_ack_status(const std::string &s)
{
    if (s == "complete")
        return AckStatus::Complete;
    if (s == "expired")
        return AckStatus::Expired;
    return AckStatus::Pending;
}

struct EventData
{
    std::optional<json> previous_state;
    std::optional<json> new_state;
    std::vector<std::string> changed_fields;
    json metadata = json::object();
    std::optional<json> execution_result;
    std::optional<std::string> error_message;
};

struct UpdateEvent
{
    std::string id;
    ToolKey key;
    std::string tool_name;
    std::optional<std::string> space_id;
    std::string user_id;
    UpdateType update_type = UpdateType::StateChange;
    EventData event_data;
    std::vector<std::string> affected_users;
    SysTime timestamp{};
    std::int64_t sequence_number = 0;
    std::vector<std::string> broadcast_channels;
    bool requires_ack = false;
    std::optional<SysTime> expires_at;
};

struct SnapshotMetadata
{
    SysTime created_at{};
    std::string updated_by;
    SyncStatus sync_status = SyncStatus::Synced;
    std::optional<std::string> conflict_resolution; // manual | automatic | latest_wins
};

struct StateSnapshot
{
    ToolKey key;
    std::optional<std::string> space_id;
    json current_state = json::object();
    std::int64_t version = 0;
    SysTime last_update{};
    std::vector<std::string> active_connections;
    std::vector<UpdateEvent> pending_updates;
    SnapshotMetadata metadata;
};

struct AckTracking
{
    std::string update_event_id;
    ToolKey key;
    std::vector<std::string> required_acks;
    std::vector<std::string> received_acks;
    SysTime ack_deadline{};
    SysTime created_at{};
    AckStatus status = AckStatus::Pending;
};

// -------- JSON mapping --------

namespace detail
{
inline std::optional<std::string> opt_str(const json &j, const char *k)
{
    auto it = j.find(k);
    if (it == j.end() || !it->is_string())
        return std::nullopt;
    return it->get<std::string>();
}

inline SysTime time_field(const json &j, const char *k)
{
    if (auto s = opt_str(j, k))
        if (auto t = parse_iso8601(*s))
            return *t;
    return SysTime{};
}

inline std::vector<std::string> str_list(const json &j, const char *k)
{
    std::vector<std::string> out;
    auto it = j.find(k);
    if (it == j.end() || !it->is_array())
        return out;
    for (const auto &v : *it)
        if (v.is_string())
            out.push_back(v.get<std::string>());
    return out;
}
} // namespace detail

inline void to_json(json &j, const EventData &d)
{
    j = json{{"changedFields", d.changed_fields}, {"metadata", d.metadata}};
    if (d.previous_state)
        j["previousState"] = *d.previous_state;
    if (d.new_state)
        j["newState"] = *d.new_state;
    if (d.execution_result)
        j["executionResult"] = *d.execution_result;
    if (d.error_message)
        j["errorMessage"] = *d.error_message;
}

inline void from_json(const json &j, EventData &d)
{
    d = EventData{};
    if (j.contains("previousState"))
        d.previous_state = j.at("previousState");
    if (j.contains("newState"))
        d.new_state = j.at("newState");
    d.changed_fields = detail::str_list(j, "changedFields");
    auto md = j.find("metadata");
    if (md != j.end() && md->is_object())
        d.metadata = *md;
    if (j.contains("executionResult"))
        d.execution_result = j.at("executionResult");
    d.error_message = detail::opt_str(j, "errorMessage");
}

inline void to_json(json &j, const UpdateEvent &e)
{
    j = json{{"id", e.id},
             {"toolId", e.key.tool_id},
             {"toolName", e.tool_name},
             {"userId", e.user_id},
             {"updateType", to_string(e.update_type)},
             {"eventData", e.event_data},
             {"affectedUsers", e.affected_users},
             {"timestamp", format_iso8601_ms(e.timestamp)},
             {"sequenceNumber", e.sequence_number},
             {"broadcastChannels", e.broadcast_channels},
             {"requiresAck", e.requires_ack}};
    if (e.key.deployment_id)
        j["deploymentId"] = *e.key.deployment_id;
    if (e.space_id)
        j["spaceId"] = *e.space_id;
    if (e.expires_at)
        j["expiresAt"] = format_iso8601_ms(*e.expires_at);
}

inline void from_json(const json &j, UpdateEvent &e)
{
    e = UpdateEvent{};
    e.id = j.value("id", std::string());
    e.key.tool_id = j.value("toolId", std::string());
    e.key.deployment_id = detail::opt_str(j, "deploymentId");
    e.tool_name = j.value("toolName", std::string());
    e.space_id = detail::opt_str(j, "spaceId");
    e.user_id = j.value("userId", std::string());
    e.update_type = parse_update_type(j.value("updateType", std::string())).value_or(UpdateType::StateChange);
    if (j.contains("eventData") && j.at("eventData").is_object())
        e.event_data = j.at("eventData").get<EventData>();
    e.affected_users = detail::str_list(j, "affectedUsers");
    e.timestamp = detail::time_field(j, "timestamp");
    e.sequence_number = j.value("sequenceNumber", std::int64_t{0});
    e.broadcast_channels = detail::str_list(j, "broadcastChannels");
    e.requires_ack = j.value("requiresAck", false);
    if (detail::opt_str(j, "expiresAt"))
        e.expires_at = detail::time_field(j, "expiresAt");
}

inline void to_json(json &j, const StateSnapshot &s)
{
    json md{{"createdAt", format_iso8601_ms(s.metadata.created_at)},
            {"updatedBy", s.metadata.updated_by},
            {"syncStatus", to_string(s.metadata.sync_status)}};
    if (s.metadata.conflict_resolution)
        md["conflictResolution"] = *s.metadata.conflict_resolution;
    j = json{{"toolId", s.key.tool_id},
             {"currentState", s.current_state},
             {"version", s.version},
             {"lastUpdate", format_iso8601_ms(s.last_update)},
             {"activeConnections", s.active_connections},
             {"pendingUpdates", s.pending_updates},
             {"metadata", md}};
    if (s.key.deployment_id)
        j["deploymentId"] = *s.key.deployment_id;
    if (s.space_id)
        j["spaceId"] = *s.space_id;
}

inline void from_json(const json &j, StateSnapshot &s)
{
    s = StateSnapshot{};
    s.key.tool_id = j.value("toolId", std::string());
    s.key.deployment_id = detail::opt_str(j, "deploymentId");
    s.space_id = detail::opt_str(j, "spaceId");
    s.current_state = j.contains("currentState") ? j.at("currentState") : json::object();
    s.version = j.value("version", std::int64_t{0});
    s.last_update = detail::time_field(j, "lastUpdate");
    s.active_connections = detail::str_list(j, "activeConnections");
    auto pu = j.find("pendingUpdates");
    if (pu != j.end() && pu->is_array())
        for (const auto &e : *pu)
            s.pending_updates.push_back(e.get<UpdateEvent>());
    auto md = j.find("metadata");
    if (md != j.end() && md->is_object())
    {
        s.metadata.created_at = detail::time_field(*md, "createdAt");
        s.metadata.updated_by = md->value("updatedBy", std::string());
        s.metadata.sync_status = parse_sync_status(md->value("syncStatus", std::string("synced")));
        s.metadata.conflict_resolution = detail::opt_str(*md, "conflictResolution");
    }
}

inline void to_json(json &j, const AckTracking &a)
{
    j = json{{"updateEventId", a.update_event_id},
             {"toolId", a.key.tool_id},
             {"requiredAcks", a.required_acks},
             {"receivedAcks", a.received_acks},
             {"ackDeadline", format_iso8601_ms(a.ack_deadline)},
             {"createdAt", format_iso8601_ms(a.created_at)},
             {"status", to_string(a.status)}};
    if (a.key.deployment_id)
        j["deploymentId"] = *a.key.deployment_id;
}

inline void from_json(const json &j, AckTracking &a)
{
    a = AckTracking{};
    a.update_event_id = j.value("updateEventId", std::string());
    a.key.tool_id = j.value("toolId", std::string());
    a.key.deployment_id = detail::opt_str(j, "deploymentId");
    a.required_acks = detail::str_list(j, "requiredAcks");
    a.received_acks = detail::str_list(j, "receivedAcks");
    a.ack_deadline = detail::time_field(j, "ackDeadline");
    a.created_at = detail::time_field(j, "createdAt");
    a.status = parse_ack_status(j.value("status", std::string("pending")));
}
