/*
 * File: include/common/stream_channel.hpp
 * Project: Tool Sync
 * Purpose: Per-connection live delivery state machine (connecting -> streaming -> closed)
 * Notes:
 *  - Read-only over the event log and snapshot store
 *  - A per-key sequence cursor suppresses repeats across overlapping poll windows
 *  - At most `batch` events go out per poll; the rest follow on later polls while inside the window
 *  - Transport and timers live in src/toolsync_stream.hpp
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include "common/log.hpp"
#include "common/sync_engine.hpp"

enum class StreamState
{
    Connecting,
    Streaming,
    Closed,
};

struct StreamParams
{
    std::string user_id;
    std::string deployment_id;
    std::optional<std::string> tool_id; // enables the snapshot survey
    std::optional<std::string> space_id;
    std::chrono::milliseconds poll_window{5000};
    std::size_t batch = 5;
};

class StreamChannel
{
    SyncEngine &engine_;
    StreamParams p_;
    std::atomic<StreamState> state_{StreamState::Connecting};
    std::map<std::string, std::int64_t> cursor_; // ToolKey::doc_id -> last seen sequence

    bool advance(const std::string &key, std::int64_t seq)
    {
        auto &c = cursor_[key];
        if (seq <= c)
            return false;
        c = seq;
        return true;
    }

public:
    StreamChannel(SyncEngine &engine, StreamParams p) : engine_(engine), p_(std::move(p)) {}

    StreamState state() const { return state_.load(); }
    const StreamParams &params() const { return p_; }

    json open()
    {
        state_ = StreamState::Streaming;
        return json{{"type", "connected"},
                    {"deploymentId", p_.deployment_id},
                    {"timestamp", format_iso8601_ms(engine_.now())}};
    }

    json heartbeat() const
    {
        return json{{"type", "heartbeat"}, {"timestamp", format_iso8601_ms(engine_.now())}};
    }

    void close() { state_ = StreamState::Closed; }

    std::vector<json> poll()
    {
        std::vector<json> frames;
        if (state_ != StreamState::Streaming)
            return frames;
        const auto now = engine_.now();
        const auto after = now - p_.poll_window;

        std::vector<UpdateEvent> window;
        try
        {
            window = engine_.events().window_for_deployment(p_.deployment_id, after);
        }
        catch (const std::exception &e)
        {
            log_error("stream", "poll of deployment " + p_.deployment_id + " failed: " + e.what());
        }
        // Oldest undelivered first; anything past the batch stays for the next poll.
        bool held_back = false;
        std::size_t delivered = 0;
        for (const auto &e : window)
        {
            if (delivered == p_.batch)
            {
                held_back = true;
                break;
            }
            if (!advance(e.key.doc_id(), e.sequence_number))
                continue;
            if (e.user_id == p_.user_id)
                continue;
            frames.push_back(json{{"type", "state_update"},
                                  {"toolId", e.key.tool_id},
                                  {"eventId", e.id},
                                  {"sequenceNumber", e.sequence_number},
                                  {"state", e.event_data.new_state && !e.event_data.new_state->is_null()
                                                ? *e.event_data.new_state
                                                : json::object()},
                                  {"updateType", to_string(e.update_type)},
                                  {"timestamp", format_iso8601_ms(e.timestamp)},
                                  {"triggeredBy", e.user_id}});
            ++delivered;
        }

        if (p_.tool_id && !held_back)
        {
            ToolKey key{*p_.tool_id, p_.deployment_id};
            auto snap = engine_.snapshots().try_get(key);
            if (snap && snap->last_update > after && advance(key.doc_id(), snap->version) &&
                snap->metadata.updated_by != p_.user_id)
            {
                frames.push_back(json{{"type", "state_update"},
                                      {"toolId", key.tool_id},
                                      {"version", snap->version},
                                      {"state", snap->current_state},
                                      {"timestamp", format_iso8601_ms(snap->last_update)}});
            }
        }

        // A close that raced the queries wins.
        if (state_ != StreamState::Streaming)
            frames.clear();
        return frames;
    }
};
