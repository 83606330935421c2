/*
 * File: include/common/snapshot_store.hpp
 * Project: Tool Sync
 * Purpose: Authoritative per-key state snapshot and the sequencer built on it
 * Notes:
 *  - Every snapshot mutation goes through apply_update/create_from_client + commit
 *  - commit is a version-checked compare-and-set against the snapshot that was read
 *    and refuses to overwrite a document holding a different key
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include "common/document_store.hpp"
#include "common/log.hpp"
#include "common/tool_types.hpp"

class SnapshotStore
{
    DocumentStore &store_;

public:
    explicit SnapshotStore(DocumentStore &store) : store_(store) {}

    // Throws StoreError when the backend is unavailable.
    std::optional<StateSnapshot> get(const ToolKey &key)
    {
        auto doc = store_.get(collections::kSnapshots, key.doc_id());
        if (!doc)
            return std::nullopt;
        return doc->get<StateSnapshot>();
    }

    // Read for convenience paths: a failing store reads as "no snapshot".
    std::optional<StateSnapshot> try_get(const ToolKey &key)
    {
        try
        {
            return get(key);
        }
        catch (const std::exception &e)
        {
            log_warn("snapshot", "read of " + key.doc_id() + " failed: " + e.what());
            return std::nullopt;
        }
    }

    static StateSnapshot apply_update(const UpdateEvent &event, const std::optional<StateSnapshot> &previous)
    {
        bool has_new_state = event.event_data.new_state && !event.event_data.new_state->is_null();
        StateSnapshot next;
        if (previous)
        {
            next = *previous;
            if (has_new_state)
                next.current_state = *event.event_data.new_state;
        }
        else
        {
            next.key = event.key;
            next.space_id = event.space_id;
            next.current_state = has_new_state ? *event.event_data.new_state : json::object();
            next.metadata.created_at = event.timestamp;
        }
        next.version = event.sequence_number;
        next.last_update = event.timestamp;
        next.metadata.updated_by = event.user_id;
        next.metadata.sync_status = SyncStatus::Synced;
        return next;
    }

    static StateSnapshot create_from_client(const ToolKey &key, const json &state, const std::string &user_id,
                                            SysTime now)
    {
        StateSnapshot s;
        s.key = key;
        s.current_state = state;
        s.version = 1;
        s.last_update = now;
        s.metadata.created_at = now;
        s.metadata.updated_by = user_id;
        s.metadata.sync_status = SyncStatus::Synced;
        return s;
    }

    // Stores next only if the stored snapshot is still the one previous was read from.
    bool commit(const StateSnapshot &next, const std::optional<StateSnapshot> &previous)
    {
        std::optional<std::int64_t> expected;
        if (previous)
            expected = previous->version;
        return store_.put_if(
            collections::kSnapshots, next.key.doc_id(),
            [&](const std::optional<json> &cur)
            {
                if (!cur)
                    return !expected.has_value();
                if (!expected.has_value() || cur->value("version", std::int64_t{-1}) != *expected)
                    return false;
                auto dep = cur->find("deploymentId");
                std::optional<std::string> stored_dep;
                if (dep != cur->end() && dep->is_string())
                    stored_dep = dep->get<std::string>();
                return cur->value("toolId", std::string()) == next.key.tool_id &&
                       stored_dep == next.key.deployment_id;
            },
            json(next));
    }
};

// Sequence allocation: version + 1, or 1 for a key with no snapshot.
class Sequencer
{
    SnapshotStore &snapshots_;

public:
    explicit Sequencer(SnapshotStore &s) : snapshots_(s) {}

    static std::int64_t next_after(const std::optional<StateSnapshot> &current)
    {
        return current ? current->version + 1 : 1;
    }

    std::int64_t next(const ToolKey &key) { return next_after(snapshots_.get(key)); }
};
