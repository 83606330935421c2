/*
 * File: include/common/document_store.hpp
 * Project: Tool Sync
 * Purpose: Key-value document store seam and its in-memory implementation
 * Notes:
 *  - put_if is the only conditional write; everything version-checked goes through it
 *  - Implementations raise StoreError on backend failure
 * Last updated: 2026-10-19
 */

#pragma once
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "common/errors.hpp"

namespace collections
{
inline constexpr const char *kSnapshots = "toolStateSnapshots";
inline constexpr const char *kEvents = "toolUpdateEvents";
inline constexpr const char *kMessages = "realtimeMessages";
inline constexpr const char *kAcks = "toolUpdateAcks";
inline constexpr const char *kTools = "tools";
inline constexpr const char *kDeployments = "toolDeployments";
inline constexpr const char *kSpaceMembers = "spaceMembers";
} // namespace collections

class DocumentStore
{
public:
    using Doc = nlohmann::json;
    using Guard = std::function<bool(const std::optional<Doc> &current)>;
    using Filter = std::function<bool(const Doc &)>;

    virtual ~DocumentStore() = default;

    virtual std::optional<Doc> get(const std::string &collection, const std::string &id) = 0;
    virtual void put(const std::string &collection, const std::string &id, const Doc &doc) = 0;

    // Writes desired only if guard accepts the current document; atomic per id.
    virtual bool put_if(const std::string &collection, const std::string &id, const Guard &guard,
                        const Doc &desired) = 0;

    virtual bool erase(const std::string &collection, const std::string &id) = 0;
    virtual std::vector<Doc> scan(const std::string &collection, const Filter &filter) = 0;

    // Hook for stores that keep an append-only audit trail of a collection.
    virtual void on_appended(const std::string &, const Doc &) {}

    bool compare_and_put(const std::string &collection, const std::string &id,
                         const std::optional<Doc> &expected, const Doc &desired)
    {
        return put_if(
            collection, id, [&](const std::optional<Doc> &cur)
            { return cur == expected; },
            desired);
    }
};

class MemoryDocumentStore : public DocumentStore
{
    std::mutex m_;
    std::unordered_map<std::string, std::map<std::string, Doc>> data_;

public:
    std::optional<Doc> get(const std::string &collection, const std::string &id) override
    {
        std::scoped_lock lk(m_);
        auto c = data_.find(collection);
        if (c == data_.end())
            return std::nullopt;
        auto d = c->second.find(id);
        if (d == c->second.end())
            return std::nullopt;
        return d->second;
    }

    void put(const std::string &collection, const std::string &id, const Doc &doc) override
    {
        std::scoped_lock lk(m_);
        data_[collection][id] = doc;
    }

    bool put_if(const std::string &collection, const std::string &id, const Guard &guard,
                const Doc &desired) override
    {
        std::scoped_lock lk(m_);
        auto &c = data_[collection];
        auto d = c.find(id);
        std::optional<Doc> cur;
        if (d != c.end())
            cur = d->second;
        if (!guard(cur))
            return false;
        c[id] = desired;
        return true;
    }

    bool erase(const std::string &collection, const std::string &id) override
    {
        std::scoped_lock lk(m_);
        auto c = data_.find(collection);
        if (c == data_.end())
            return false;
        return c->second.erase(id) > 0;
    }

    std::vector<Doc> scan(const std::string &collection, const Filter &filter) override
    {
        std::scoped_lock lk(m_);
        std::vector<Doc> out;
        auto c = data_.find(collection);
        if (c == data_.end())
            return out;
        for (const auto &kv : c->second)
            if (!filter || filter(kv.second))
                out.push_back(kv.second);
        return out;
    }
};
