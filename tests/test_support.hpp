/*
 * File: tests/test_support.hpp
 * Project: Tool Sync
 * Purpose: Shared fixtures for unit tests: temp dirs, a settable clock, seeded directory data
 * Last updated: 2026-10-19
 */

#pragma once
#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <random>
#include <set>
#include <string>
#include "common/document_store.hpp"
#include "common/time_util.hpp"

namespace fs = std::filesystem;

struct TempDir
{
    fs::path path;
    TempDir()
    {
        std::random_device rd;
        path = fs::temp_directory_path() / ("toolsync_test_" + std::to_string(rd()) + std::to_string(rd()));
        fs::create_directories(path);
    }
    ~TempDir()
    {
        std::error_code ec;
        fs::remove_all(path, ec);
    }
};

inline SysTime at(const std::string &iso) { return *parse_iso8601(iso); }

// Shared so NowFn copies keep following advance().
struct ManualClock
{
    std::shared_ptr<std::atomic<std::int64_t>> ms =
        std::make_shared<std::atomic<std::int64_t>>(epoch_ms(at("2026-03-01T12:00:00.000Z")));

    NowFn fn() const
    {
        auto p = ms;
        return [p]
        { return SysTime(std::chrono::milliseconds(p->load())); };
    }
    SysTime now() const { return SysTime(std::chrono::milliseconds(ms->load())); }
    void advance(std::chrono::milliseconds d) { ms->fetch_add(d.count()); }
};

inline void seed_tool(DocumentStore &s, const std::string &id, const std::string &author,
                      const std::string &name = "Poll")
{
    s.put(collections::kTools, id, nlohmann::json{{"id", id}, {"name", name}, {"authorId", author}});
}

inline void seed_deployment(DocumentStore &s, const std::string &id, const std::string &deployed_by,
                            const std::string &space)
{
    s.put(collections::kDeployments, id,
          nlohmann::json{{"id", id}, {"deployedBy", deployed_by}, {"spaceId", space}});
}

inline void seed_member(DocumentStore &s, const std::string &space, const std::string &user,
                        const std::string &role, const std::string &status = "active")
{
    s.put(collections::kSpaceMembers, space + "_" + user,
          nlohmann::json{{"spaceId", space}, {"userId", user}, {"role", role}, {"status", status}});
}

// Memory store whose listed collections fail like an unreachable backend.
class FlakyStore : public MemoryDocumentStore
{
    void check(const std::string &collection) const
    {
        if (failing.count(collection))
            throw StoreError("backend unavailable: " + collection);
    }

public:
    std::set<std::string> failing;     // every operation fails
    std::set<std::string> failing_cas; // only guarded writes fail

    std::optional<Doc> get(const std::string &c, const std::string &id) override
    {
        check(c);
        return MemoryDocumentStore::get(c, id);
    }
    void put(const std::string &c, const std::string &id, const Doc &doc) override
    {
        check(c);
        MemoryDocumentStore::put(c, id, doc);
    }
    bool put_if(const std::string &c, const std::string &id, const Guard &guard, const Doc &desired) override
    {
        check(c);
        if (failing_cas.count(c))
            throw StoreError("guarded write rejected by backend: " + c);
        return MemoryDocumentStore::put_if(c, id, guard, desired);
    }
    std::vector<Doc> scan(const std::string &c, const Filter &filter) override
    {
        check(c);
        return MemoryDocumentStore::scan(c, filter);
    }
};
