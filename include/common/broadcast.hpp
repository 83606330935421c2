/*
 * File: include/common/broadcast.hpp
 * Project: Tool Sync
 * Purpose: Channel derivation and fan-out of accepted updates
 * Notes:
 *  - Each channel gets an outbox entry (realtimeMessages) and a live hub publish
 *  - Fan-out never fails the write that triggered it; failures are logged
 * Last updated: 2026-10-19
 */

#pragma once
#include <optional>
#include <string>
#include <vector>
#include "common/channel_hub.hpp"
#include "common/document_store.hpp"
#include "common/log.hpp"
#include "common/tool_types.hpp"

inline std::vector<std::string> channels_for(const std::string &tool_id,
                                             const std::optional<std::string> &deployment_id,
                                             const std::optional<std::string> &space_id,
                                             bool broadcast_to_space)
{
    std::vector<std::string> channels;
    channels.push_back("tool:" + tool_id + ":updates");
    if (deployment_id)
        channels.push_back("deployment:" + *deployment_id + ":updates");
    if (space_id && broadcast_to_space)
        channels.push_back("space:" + *space_id + ":tools");
    return channels;
}

// Reduced event view carried by broadcast messages.
inline json broadcast_event_view(const UpdateEvent &e)
{
    json v{{"id", e.id},
           {"toolId", e.key.tool_id},
           {"toolName", e.tool_name},
           {"updateType", to_string(e.update_type)},
           {"timestamp", format_iso8601_ms(e.timestamp)},
           {"sequenceNumber", e.sequence_number},
           {"eventData", e.event_data}};
    if (e.key.deployment_id)
        v["deploymentId"] = *e.key.deployment_id;
    return v;
}

inline json make_broadcast_message(const UpdateEvent &e, const std::string &channel, const std::string &id,
                                   SysTime now)
{
    json md{{"timestamp", format_iso8601_ms(now)},
            {"priority", "normal"},
            {"requiresAck", e.requires_ack},
            {"retryCount", 0}};
    if (e.expires_at)
        md["expiresAt"] = format_iso8601_ms(*e.expires_at);
    return json{{"id", id},
                {"type", "tool_update"},
                {"channel", channel},
                {"senderId", "system"},
                {"content", {{"action", "tool_updated"}, {"updateEvent", broadcast_event_view(e)}}},
                {"metadata", md},
                {"delivery",
                 {{"sent", json::array()},
                  {"delivered", json::array()},
                  {"read", json::array()},
                  {"failed", json::array()}}}};
}

class BroadcastFanout
{
    DocumentStore &store_;
    ChannelHub *hub_;
    NowFn now_;

public:
    BroadcastFanout(DocumentStore &store, ChannelHub *hub, NowFn now = system_now)
        : store_(store), hub_(hub), now_(std::move(now)) {}

    // Returns the number of channels whose outbox entry was written.
    std::size_t publish(const UpdateEvent &event)
    {
        std::size_t written = 0;
        for (std::size_t i = 0; i < event.broadcast_channels.size(); ++i)
        {
            const auto &channel = event.broadcast_channels[i];
            try
            {
                auto now = now_();
                std::string id = "tool_update_broadcast_" + event.id + "_" + std::to_string(epoch_ms(now)) +
                                 "_" + std::to_string(i);
                auto msg = make_broadcast_message(event, channel, id, now);
                store_.put(collections::kMessages, id, msg);
                ++written;
                if (hub_)
                    hub_->publish(channel, msg);
            }
            catch (const std::exception &e)
            {
                log_error("broadcast", "fan-out of " + event.id + " to " + channel + " failed: " + e.what());
            }
        }
        return written;
    }
};
