/*
 * File: include/common/ack_tracker.hpp
 * Project: Tool Sync
 * Purpose: Acknowledgment tracking for updates that require it
 * Notes:
 *  - No sweeper: expiry is only observed when an ack arrives after the deadline
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <chrono>
#include <optional>
#include <string>
#include "common/document_store.hpp"
#include "common/errors.hpp"
#include "common/tool_types.hpp"

class AckTracker
{
    DocumentStore &store_;
    NowFn now_;
    std::chrono::minutes default_window_;

    static bool covers(const AckTracking &t)
    {
        return std::all_of(t.required_acks.begin(), t.required_acks.end(), [&](const std::string &u)
                           { return std::find(t.received_acks.begin(), t.received_acks.end(), u) !=
                                    t.received_acks.end(); });
    }

public:
    AckTracker(DocumentStore &store, NowFn now = system_now,
               std::chrono::minutes default_window = std::chrono::minutes(60))
        : store_(store), now_(std::move(now)), default_window_(default_window) {}

    AckTracking register_event(const UpdateEvent &event)
    {
        AckTracking t;
        t.update_event_id = event.id;
        t.key = event.key;
        t.required_acks = event.affected_users;
        t.created_at = now_();
        t.ack_deadline = event.expires_at ? *event.expires_at : t.created_at + default_window_;
        t.status = t.required_acks.empty() ? AckStatus::Complete : AckStatus::Pending;
        store_.put(collections::kAcks, event.id, json(t));
        return t;
    }

    std::optional<AckTracking> get(const std::string &update_event_id)
    {
        auto doc = store_.get(collections::kAcks, update_event_id);
        if (!doc)
            return std::nullopt;
        return doc->get<AckTracking>();
    }

    AckTracking record_ack(const std::string &update_event_id, const std::string &user_id)
    {
        for (int attempt = 0; attempt < 16; ++attempt)
        {
            auto doc = store_.get(collections::kAcks, update_event_id);
            if (!doc)
                throw SyncError(ErrorCode::NotFound, "No acknowledgment tracking for this update");
            auto t = doc->get<AckTracking>();
            if (t.status != AckStatus::Pending)
                return t;

            if (now_() > t.ack_deadline)
                t.status = AckStatus::Expired;
            else
            {
                if (std::find(t.received_acks.begin(), t.received_acks.end(), user_id) == t.received_acks.end())
                    t.received_acks.push_back(user_id);
                if (covers(t))
                    t.status = AckStatus::Complete;
            }
            if (store_.compare_and_put(collections::kAcks, update_event_id, doc, json(t)))
                return t;
        }
        throw SyncError(ErrorCode::InternalError, "Acknowledgment contention, retry later");
    }
};
