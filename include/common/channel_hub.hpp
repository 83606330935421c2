/*
 * File: include/common/channel_hub.hpp
 * Project: Tool Sync
 * Purpose: In-process publish/subscribe keyed by channel id
 * Notes:
 *  - Handlers run on the publisher's thread, outside the registry lock
 *  - A throwing handler is logged and skipped; other handlers still run
 * Last updated: 2026-10-19
 */

#pragma once
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/log.hpp"

class ChannelHub
{
public:
    using Handler = std::function<void(const std::string &channel, const nlohmann::json &message)>;

    std::uint64_t subscribe(const std::string &channel, Handler h)
    {
        std::scoped_lock lk(m_);
        auto id = next_id_++;
        subs_[id] = Sub{channel, std::move(h)};
        return id;
    }

    void unsubscribe(std::uint64_t id)
    {
        std::scoped_lock lk(m_);
        subs_.erase(id);
    }

    std::size_t subscriber_count(const std::string &channel)
    {
        std::scoped_lock lk(m_);
        std::size_t n = 0;
        for (const auto &kv : subs_)
            if (kv.second.channel == channel)
                ++n;
        return n;
    }

    // Returns the number of handlers that accepted the message.
    std::size_t publish(const std::string &channel, const nlohmann::json &message)
    {
        std::vector<Handler> targets;
        {
            std::scoped_lock lk(m_);
            for (const auto &kv : subs_)
                if (kv.second.channel == channel)
                    targets.push_back(kv.second.handler);
        }
        std::size_t delivered = 0;
        for (auto &h : targets)
        {
            try
            {
                h(channel, message);
                ++delivered;
            }
            catch (const std::exception &e)
            {
                log_warn("hub", "subscriber on " + channel + " failed: " + e.what());
            }
        }
        return delivered;
    }

private:
    struct Sub
    {
        std::string channel;
        Handler handler;
    };
    std::mutex m_;
    std::map<std::uint64_t, Sub> subs_;
    std::uint64_t next_id_ = 1;
};
