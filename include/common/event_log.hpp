/*
 * File: include/common/event_log.hpp
 * Project: Tool Sync
 * Purpose: Append-only record of accepted updates
 * Notes:
 *  - Events are immutable once appended; only cleanup removes them
 * Last updated: 2026-10-19
 */

#pragma once
#include <algorithm>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>
#include "common/document_store.hpp"
#include "common/tool_types.hpp"

struct HistoryQuery
{
    std::string tool_id;
    std::optional<std::string> deployment_id;
    std::optional<std::string> space_id;
    std::optional<SysTime> since;
    std::size_t limit = 50;
};

struct HistoryPage
{
    std::vector<UpdateEvent> events; // chronological
    bool has_more = false;
    std::int64_t last_sequence_number = 0;
};

class EventLog
{
    DocumentStore &store_;

    std::vector<UpdateEvent> collect(const DocumentStore::Filter &filter)
    {
        std::vector<UpdateEvent> out;
        for (const auto &doc : store_.scan(collections::kEvents, filter))
            out.push_back(doc.get<UpdateEvent>());
        return out;
    }

public:
    explicit EventLog(DocumentStore &store) : store_(store) {}

    void append(const UpdateEvent &event)
    {
        json doc = event;
        store_.put(collections::kEvents, event.id, doc);
        store_.on_appended(collections::kEvents, doc);
    }

    std::optional<UpdateEvent> find(const std::string &id)
    {
        auto doc = store_.get(collections::kEvents, id);
        if (!doc)
            return std::nullopt;
        return doc->get<UpdateEvent>();
    }

    bool remove(const std::string &id) { return store_.erase(collections::kEvents, id); }

    // Newest `limit` matches by sequence number, returned oldest first.
    HistoryPage history(const HistoryQuery &q)
    {
        auto events = collect([&](const json &d)
                              {
            if (d.value("toolId", std::string()) != q.tool_id)
                return false;
            if (q.deployment_id && d.value("deploymentId", std::string()) != *q.deployment_id)
                return false;
            if (q.space_id && d.value("spaceId", std::string()) != *q.space_id)
                return false;
            return true; });
        if (q.since)
            events.erase(std::remove_if(events.begin(), events.end(),
                                        [&](const UpdateEvent &e)
                                        { return !(e.timestamp > *q.since); }),
                         events.end());
        std::sort(events.begin(), events.end(), [](const UpdateEvent &a, const UpdateEvent &b)
                  { return a.sequence_number > b.sequence_number; });

        HistoryPage page;
        page.has_more = events.size() > q.limit;
        if (page.has_more)
            events.resize(q.limit);
        for (const auto &e : events)
            page.last_sequence_number = std::max(page.last_sequence_number, e.sequence_number);
        std::reverse(events.begin(), events.end());
        page.events = std::move(events);
        return page;
    }

    // Events on a deployment strictly after `after`, oldest first.
    std::vector<UpdateEvent> window_for_deployment(const std::string &deployment_id, SysTime after)
    {
        auto events = collect([&](const json &d)
                              { return d.value("deploymentId", std::string()) == deployment_id; });
        events.erase(std::remove_if(events.begin(), events.end(),
                                    [&](const UpdateEvent &e)
                                    { return !(e.timestamp > after); }),
                     events.end());
        std::sort(events.begin(), events.end(), [](const UpdateEvent &a, const UpdateEvent &b)
                  { return a.timestamp < b.timestamp ||
                           (a.timestamp == b.timestamp && a.sequence_number < b.sequence_number); });
        return events;
    }

    std::size_t erase_older_than(const std::string &tool_id, const std::optional<std::string> &deployment_id,
                                 SysTime cutoff)
    {
        auto events = collect([&](const json &d)
                              {
            if (d.value("toolId", std::string()) != tool_id)
                return false;
            return !deployment_id || d.value("deploymentId", std::string()) == *deployment_id; });
        std::size_t n = 0;
        for (const auto &e : events)
            if (e.timestamp < cutoff && remove(e.id))
                ++n;
        return n;
    }
};
