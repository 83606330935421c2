/*
 * File: include/common/sync_engine.hpp
 * Project: Tool Sync
 * Purpose: Submit / history / reconcile / cleanup / ack operations over one document store
 * Notes:
 *  - Primary path: read snapshot -> allocate version+1 -> append event -> CAS snapshot
 *  - A lost CAS erases the event and retries, so sequence numbers stay unique per key
 *  - Fan-out and ack registration run after the commit and never fail the request
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>
#include "common/access_control.hpp"
#include "common/ack_tracker.hpp"
#include "common/broadcast.hpp"
#include "common/conflict_resolver.hpp"
#include "common/errors.hpp"
#include "common/event_log.hpp"
#include "common/log.hpp"
#include "common/read_model.hpp"
#include "common/snapshot_store.hpp"
#include "common/state_diff.hpp"

struct SubmitRequest
{
    std::string tool_id;
    std::optional<std::string> deployment_id;
    std::optional<std::string> space_id;
    UpdateType update_type = UpdateType::StateChange;
    EventData event_data;
    std::vector<std::string> target_users;
    bool broadcast_to_space = true;
    bool requires_ack = false;
    double expires_in_minutes = 60;
};

struct SubmitResult
{
    UpdateEvent event;
    std::size_t affected_users = 0;
};

struct HistoryRequest
{
    std::string tool_id;
    std::optional<std::string> deployment_id;
    std::optional<std::string> space_id;
    std::optional<std::string> since;
    std::optional<long long> limit;
    bool include_snapshot = false;
};

struct HistoryResult
{
    HistoryPage page;
    std::optional<StateSnapshot> snapshot;
    json sync_status;
};

struct SyncRequest
{
    std::string tool_id;
    std::optional<std::string> deployment_id;
    std::int64_t client_version = 0;
    json client_state;
    std::string conflict_resolution = "latest_wins";
    bool force_merge = false;
};

struct SyncResult
{
    std::string sync_result; // client_state_accepted | sync_successful | conflict_resolved
    json server_state;
    std::int64_t server_version = 0;
    json conflicts = json::array();
    std::optional<ConflictStrategy> strategy;
};

struct CleanupRequest
{
    std::string tool_id;
    std::optional<std::string> deployment_id;
    std::optional<std::string> event_id;
    std::optional<std::string> older_than;
};

struct EngineOptions
{
    std::size_t history_default_limit = 50;
    std::size_t history_max_limit = 100;
    int cas_retries = 16;
    std::chrono::minutes ack_default{60};
};

// -------- request parsing --------

namespace detail
{
inline std::optional<std::string> body_str(const json &b, const char *k)
{
    auto it = b.find(k);
    if (it == b.end() || it->is_null())
        return std::nullopt;
    if (!it->is_string())
        throw SyncError(ErrorCode::InvalidInput, std::string(k) + " must be a string");
    return opt_string(it->get<std::string>());
}

inline std::vector<std::string> body_str_list(const json &b, const char *k)
{
    std::vector<std::string> out;
    auto it = b.find(k);
    if (it == b.end() || it->is_null())
        return out;
    if (!it->is_array())
        throw SyncError(ErrorCode::InvalidInput, std::string(k) + " must be a list of strings");
    for (const auto &v : *it)
    {
        if (!v.is_string())
            throw SyncError(ErrorCode::InvalidInput, std::string(k) + " must be a list of strings");
        out.push_back(v.get<std::string>());
    }
    return out;
}

inline bool body_bool(const json &b, const char *k, bool dflt)
{
    auto it = b.find(k);
    if (it == b.end() || it->is_null())
        return dflt;
    if (!it->is_boolean())
        throw SyncError(ErrorCode::InvalidInput, std::string(k) + " must be a boolean");
    return it->get<bool>();
}
} // namespace detail

// Upper bound for expiresInMinutes: one year.
inline constexpr double kMaxExpiresInMinutes = 525600;

inline void check_expiry_minutes(double minutes)
{
    if (!std::isfinite(minutes) || minutes > kMaxExpiresInMinutes)
        throw SyncError(ErrorCode::InvalidInput, "expiresInMinutes must be at most " +
                                                     std::to_string(static_cast<long>(kMaxExpiresInMinutes)));
}

// Only called with a value that passed check_expiry_minutes.
inline std::chrono::milliseconds expiry_after(double minutes)
{
    return std::chrono::milliseconds(std::llround(minutes * 60000.0));
}

inline SubmitRequest submit_request_from_json(const json &b)
{
    if (!b.is_object())
        throw SyncError(ErrorCode::InvalidInput, "Request body must be a JSON object");
    auto tool = detail::body_str(b, "toolId");
    auto type = detail::body_str(b, "updateType");
    auto ed = b.find("eventData");
    if (!tool || !type || ed == b.end() || !ed->is_object())
        throw SyncError(ErrorCode::InvalidInput, "Tool ID, update type, and event data are required");

    SubmitRequest r;
    r.tool_id = *tool;
    r.deployment_id = detail::body_str(b, "deploymentId");
    r.space_id = detail::body_str(b, "spaceId");
    auto ut = parse_update_type(*type);
    if (!ut)
        throw SyncError(ErrorCode::InvalidInput, "Unknown update type: " + *type);
    r.update_type = *ut;
    r.event_data = ed->get<EventData>();
    if (ed->contains("changedFields") && !(*ed)["changedFields"].is_array())
        throw SyncError(ErrorCode::InvalidInput, "eventData.changedFields must be a list");
    r.target_users = detail::body_str_list(b, "targetUsers");
    r.broadcast_to_space = detail::body_bool(b, "broadcastToSpace", true);
    r.requires_ack = detail::body_bool(b, "requiresAck", false);
    auto exp = b.find("expiresInMinutes");
    if (exp != b.end() && !exp->is_null())
    {
        if (!exp->is_number())
            throw SyncError(ErrorCode::InvalidInput, "expiresInMinutes must be a number");
        r.expires_in_minutes = exp->get<double>();
        check_expiry_minutes(r.expires_in_minutes);
    }
    return r;
}

inline SyncRequest sync_request_from_json(const json &b)
{
    if (!b.is_object())
        throw SyncError(ErrorCode::InvalidInput, "Request body must be a JSON object");
    auto tool = detail::body_str(b, "toolId");
    auto cv = b.find("clientVersion");
    auto cs = b.find("clientState");
    if (!tool || cv == b.end() || cv->is_null() || cs == b.end() || cs->is_null())
        throw SyncError(ErrorCode::InvalidInput, "Tool ID, client version, and client state are required");
    if (!cv->is_number_integer())
        throw SyncError(ErrorCode::InvalidInput, "clientVersion must be an integer");

    SyncRequest r;
    r.tool_id = *tool;
    r.deployment_id = detail::body_str(b, "deploymentId");
    r.client_version = cv->get<std::int64_t>();
    r.client_state = *cs;
    if (auto s = detail::body_str(b, "conflictResolution"))
        r.conflict_resolution = *s;
    r.force_merge = detail::body_bool(b, "forceMerge", false);
    return r;
}

inline std::string new_event_id(const std::string &prefix, const std::string &tool_id, SysTime now)
{
    static std::atomic<std::uint64_t> seq{1};
    thread_local std::mt19937_64 rng{std::random_device{}()};
    static const char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::string suffix;
    auto r = rng();
    for (int i = 0; i < 8; ++i, r /= 36)
        suffix.push_back(digits[r % 36]);
    return prefix + "_" + tool_id + "_" + std::to_string(epoch_ms(now)) + "_" + std::to_string(seq.fetch_add(1)) +
           "_" + suffix;
}

// -------- engine --------

class SyncEngine
{
    DocumentStore &store_;
    AccessControl &access_;
    NowFn now_;
    EngineOptions opt_;
    SnapshotStore snapshots_;
    EventLog log_;
    BroadcastFanout fanout_;
    AckTracker acks_;

    // Appends the event and CASes the snapshot. false = another writer got there first.
    bool try_commit(const UpdateEvent &event, const std::optional<StateSnapshot> &previous,
                    const StateSnapshot &next)
    {
        log_.append(event);
        bool committed = false;
        try
        {
            committed = snapshots_.commit(next, previous);
        }
        catch (const StoreError &)
        {
            discard_event(event.id);
            throw;
        }
        if (!committed)
        {
            discard_event(event.id);
            log_info("engine", "version collision on " + next.key.doc_id() + " at sequence " +
                                   std::to_string(event.sequence_number) + ", retrying");
        }
        return committed;
    }

    void discard_event(const std::string &id)
    {
        try
        {
            log_.remove(id);
        }
        catch (const std::exception &e)
        {
            log_error("engine", "could not discard uncommitted event " + id + ": " + e.what());
        }
    }

    [[noreturn]] void contention(const ToolKey &key)
    {
        log_warn("engine", "gave up on " + key.doc_id() + " after " + std::to_string(opt_.cas_retries) +
                               " version collisions");
        throw SyncError(ErrorCode::InternalError, "Concurrent update contention, retry later");
    }

    template <typename Fn>
    auto guarded(const char *what, Fn &&fn) -> decltype(fn())
    {
        try
        {
            return fn();
        }
        catch (const StoreError &e)
        {
            log_error("engine", std::string(what) + ": " + e.what());
            throw SyncError(ErrorCode::InternalError, std::string("Failed to ") + what);
        }
    }

    void require_tool(const std::string &tool_id)
    {
        if (!access_.tool_exists(tool_id))
            throw SyncError(ErrorCode::NotFound, "Tool not found");
    }

public:
    SyncEngine(DocumentStore &store, AccessControl &access, ChannelHub *hub, EngineOptions opt = {},
               NowFn now = system_now)
        : store_(store), access_(access), now_(now), opt_(opt), snapshots_(store), log_(store),
          fanout_(store, hub, now), acks_(store, now, opt.ack_default) {}

    SnapshotStore &snapshots() { return snapshots_; }
    EventLog &events() { return log_; }
    AccessControl &access() { return access_; }
    AckTracker &acks() { return acks_; }
    SysTime now() const { return now_(); }

    SubmitResult submit_update(const std::string &user_id, const SubmitRequest &req)
    {
        if (req.tool_id.empty())
            throw SyncError(ErrorCode::InvalidInput, "Tool ID, update type, and event data are required");
        check_expiry_minutes(req.expires_in_minutes);
        return guarded("process tool update", [&]
                       {
            require_tool(req.tool_id);
            if (!access_.can_update(user_id, req.tool_id, req.deployment_id, req.space_id))
                throw SyncError(ErrorCode::Forbidden, "Not authorized to update this tool");

            ToolKey key{req.tool_id, req.deployment_id};
            std::vector<std::string> affected = req.target_users;
            if (affected.empty())
                affected = access_.tool_users(req.tool_id, req.deployment_id, req.space_id);
            const std::string tool_name = access_.tool_name(req.tool_id);

            for (int attempt = 0; attempt < opt_.cas_retries; ++attempt)
            {
                auto previous = snapshots_.get(key);
                auto now = now_();

                UpdateEvent e;
                e.id = new_event_id("tool_update", req.tool_id, now);
                e.key = key;
                e.tool_name = tool_name;
                e.space_id = req.space_id;
                e.user_id = user_id;
                e.update_type = req.update_type;
                e.event_data = req.event_data;
                if (e.event_data.new_state && previous)
                {
                    if (!e.event_data.previous_state)
                        e.event_data.previous_state = previous->current_state;
                    if (e.event_data.changed_fields.empty())
                        e.event_data.changed_fields = changed_fields(previous->current_state, *e.event_data.new_state);
                }
                e.event_data.metadata["triggeredBy"] = user_id;
                e.event_data.metadata["timestamp"] = format_iso8601_ms(now);
                e.affected_users = affected;
                e.timestamp = now;
                e.sequence_number = Sequencer::next_after(previous);
                e.broadcast_channels = channels_for(req.tool_id, req.deployment_id, req.space_id, req.broadcast_to_space);
                e.requires_ack = req.requires_ack;
                if (req.expires_in_minutes > 0)
                    e.expires_at = now + expiry_after(req.expires_in_minutes);

                if (!try_commit(e, previous, SnapshotStore::apply_update(e, previous)))
                    continue;

                fanout_.publish(e);
                if (e.requires_ack)
                {
                    try
                    {
                        acks_.register_event(e);
                    }
                    catch (const std::exception &ex)
                    {
                        log_error("acks", "tracking for " + e.id + " not initialized: " + ex.what());
                    }
                }
                log_info("engine", "accepted " + std::string(to_string(e.update_type)) + " on " + key.doc_id() +
                                       " seq=" + std::to_string(e.sequence_number));
                return SubmitResult{e, affected.size()};
            }
            contention(key); });
    }

    json sync_status(const ToolKey &key)
    {
        std::optional<StateSnapshot> s;
        try
        {
            s = snapshots_.get(key);
        }
        catch (const std::exception &e)
        {
            log_warn("engine", "sync status for " + key.doc_id() + " unavailable: " + e.what());
            return json{{"status", "error"}, {"lastSync", nullptr}, {"version", 0}, {"pendingUpdates", 0},
                        {"activeConnections", 0}};
        }
        if (!s)
            return json{{"status", "no_state"}, {"lastSync", nullptr}, {"version", 0}, {"pendingUpdates", 0},
                        {"activeConnections", 0}};
        return json{{"status", to_string(s->metadata.sync_status)},
                    {"lastSync", format_iso8601_ms(s->last_update)},
                    {"version", s->version},
                    {"pendingUpdates", s->pending_updates.size()},
                    {"activeConnections", s->active_connections.size()}};
    }

    HistoryResult fetch_history(const std::string &user_id, const HistoryRequest &req)
    {
        if (req.tool_id.empty())
            throw SyncError(ErrorCode::InvalidInput, "Tool ID is required");
        HistoryQuery q;
        q.tool_id = req.tool_id;
        q.deployment_id = req.deployment_id;
        q.space_id = req.space_id;
        if (req.since)
        {
            q.since = parse_iso8601(*req.since);
            if (!q.since)
                throw SyncError(ErrorCode::InvalidInput, "since must be an ISO-8601 timestamp");
        }
        long long limit = req.limit.value_or(static_cast<long long>(opt_.history_default_limit));
        limit = std::max<long long>(1, std::min<long long>(limit, static_cast<long long>(opt_.history_max_limit)));
        q.limit = static_cast<std::size_t>(limit);

        return guarded("get tool updates", [&]
                       {
            if (!access_.can_read(user_id, req.tool_id, req.deployment_id, req.space_id))
                throw SyncError(ErrorCode::Forbidden, "Access denied to this tool");
            ToolKey key{req.tool_id, req.deployment_id};
            HistoryResult r;
            r.page = log_.history(q);
            if (req.include_snapshot)
                r.snapshot = snapshots_.try_get(key);
            r.sync_status = sync_status(key);
            return r; });
    }

    SyncResult reconcile(const std::string &user_id, const SyncRequest &req)
    {
        if (req.tool_id.empty() || req.client_state.is_null())
            throw SyncError(ErrorCode::InvalidInput, "Tool ID, client version, and client state are required");
        return guarded("sync tool state", [&]
                       {
            if (!access_.can_read(user_id, req.tool_id, req.deployment_id, std::nullopt))
                throw SyncError(ErrorCode::Forbidden, "Access denied to this tool");
            ToolKey key{req.tool_id, req.deployment_id};

            for (int attempt = 0; attempt < opt_.cas_retries; ++attempt)
            {
                auto previous = snapshots_.get(key);
                auto now = now_();
                SyncResult out;

                if (!previous)
                {
                    UpdateEvent e;
                    e.id = new_event_id("sync", req.tool_id, now);
                    e.key = key;
                    e.tool_name = "Tool";
                    e.user_id = user_id;
                    e.event_data.new_state = req.client_state;
                    e.event_data.changed_fields = changed_fields(json::object(), req.client_state);
                    e.event_data.metadata = json{{"syncedFrom", "client"}, {"bootstrap", true}};
                    e.timestamp = now;
                    e.sequence_number = 1;
                    if (!try_commit(e, previous, SnapshotStore::create_from_client(key, req.client_state, user_id, now)))
                        continue;
                    out.sync_result = "client_state_accepted";
                    out.server_state = req.client_state;
                    out.server_version = 1;
                    return out;
                }

                if (previous->version == req.client_version && !req.force_merge)
                {
                    UpdateEvent e;
                    e.id = new_event_id("sync", req.tool_id, now);
                    e.key = key;
                    e.tool_name = "Tool";
                    e.space_id = previous->space_id;
                    e.user_id = user_id;
                    e.event_data.previous_state = previous->current_state;
                    e.event_data.new_state = req.client_state;
                    e.event_data.changed_fields = changed_fields(previous->current_state, req.client_state);
                    e.event_data.metadata = json{{"syncedFrom", "client"}};
                    e.timestamp = now;
                    e.sequence_number = Sequencer::next_after(previous);
                    if (!try_commit(e, previous, SnapshotStore::apply_update(e, previous)))
                        continue;
                    out.sync_result = "sync_successful";
                    out.server_state = req.client_state;
                    out.server_version = e.sequence_number;
                    return out;
                }

                auto strategy = parse_conflict_strategy(req.conflict_resolution);
                auto res = ConflictResolver::resolve(*previous, req.client_state, req.client_version, strategy, user_id,
                                                     new_event_id("conflict_resolution", req.tool_id, now), now);
                auto next = SnapshotStore::apply_update(res.event, previous);
                next.metadata.conflict_resolution =
                    strategy == ConflictStrategy::LatestWins ? "latest_wins" : "automatic";
                if (!try_commit(res.event, previous, next))
                    continue;
                log_info("engine", "resolved conflict on " + key.doc_id() + " with " + to_string(strategy) +
                                       " client=" + std::to_string(req.client_version) +
                                       " server=" + std::to_string(previous->version));
                out.sync_result = "conflict_resolved";
                out.server_state = res.resolved_state;
                out.server_version = res.new_version;
                out.conflicts = res.conflicts;
                out.strategy = strategy;
                return out;
            }
            contention(key); });
    }

    std::size_t cleanup(const std::string &user_id, const CleanupRequest &req)
    {
        if (req.tool_id.empty())
            throw SyncError(ErrorCode::InvalidInput, "Tool ID is required");
        if (!req.event_id && !req.older_than)
            throw SyncError(ErrorCode::InvalidInput, "Event ID or olderThan parameter required");
        std::optional<SysTime> cutoff;
        if (!req.event_id)
        {
            cutoff = parse_iso8601(*req.older_than);
            if (!cutoff)
                throw SyncError(ErrorCode::InvalidInput, "olderThan must be an ISO-8601 timestamp");
        }
        return guarded("clean up tool updates", [&]() -> std::size_t
                       {
            require_tool(req.tool_id);
            if (!access_.can_update(user_id, req.tool_id, req.deployment_id, std::nullopt))
                throw SyncError(ErrorCode::Forbidden, "Not authorized to clean up this tool");
            if (req.event_id)
            {
                auto e = log_.find(*req.event_id);
                if (!e || e->key.tool_id != req.tool_id)
                    throw SyncError(ErrorCode::NotFound, "Update event not found");
                return log_.remove(*req.event_id) ? 1 : 0;
            }
            auto n = log_.erase_older_than(req.tool_id, req.deployment_id, *cutoff);
            log_info("engine", "cleaned up " + std::to_string(n) + " events of " + req.tool_id);
            return n; });
    }

    AckTracking acknowledge(const std::string &user_id, const std::string &update_event_id)
    {
        if (update_event_id.empty())
            throw SyncError(ErrorCode::InvalidInput, "updateEventId is required");
        return guarded("record acknowledgment", [&]
                       {
            auto t = acks_.get(update_event_id);
            if (!t)
                throw SyncError(ErrorCode::NotFound, "No acknowledgment tracking for this update");
            bool required = std::find(t->required_acks.begin(), t->required_acks.end(), user_id) != t->required_acks.end();
            if (!required && !access_.can_read(user_id, t->key.tool_id, t->key.deployment_id, std::nullopt))
                throw SyncError(ErrorCode::Forbidden, "Access denied to this update");
            return acks_.record_ack(update_event_id, user_id); });
    }

    AckTracking ack_status(const std::string &user_id, const std::string &update_event_id)
    {
        if (update_event_id.empty())
            throw SyncError(ErrorCode::InvalidInput, "updateEventId is required");
        return guarded("get acknowledgment status", [&]
                       {
            auto t = acks_.get(update_event_id);
            if (!t)
                throw SyncError(ErrorCode::NotFound, "No acknowledgment tracking for this update");
            if (!access_.can_read(user_id, t->key.tool_id, t->key.deployment_id, std::nullopt))
                throw SyncError(ErrorCode::Forbidden, "Access denied to this update");
            return *t; });
    }

    json element_view(const std::string &user_id, const ToolKey &key, const std::string &element_id)
    {
        if (key.tool_id.empty() || element_id.empty())
            throw SyncError(ErrorCode::InvalidInput, "Tool ID and element ID are required");
        return guarded("read tool state", [&]
                       {
            if (!access_.can_read(user_id, key.tool_id, key.deployment_id, std::nullopt))
                throw SyncError(ErrorCode::Forbidden, "Access denied to this tool");
            auto s = snapshots_.get(key);
            const json state = s ? s->current_state : json::object();
            json tally = json::object();
            for (const auto &kv : counter_tally(state, element_id))
                tally[kv.first] = kv.second;
            return json{{"toolId", key.tool_id},
                        {"deploymentId", key.deployment_id ? json(*key.deployment_id) : json()},
                        {"elementId", element_id},
                        {"version", s ? s->version : 0},
                        {"shared", shared_view(state, element_id)},
                        {"tally", tally},
                        {"user", user_view(state, user_id, element_id)}}; });
    }
};
