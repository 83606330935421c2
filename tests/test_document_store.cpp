/*
 * File: tests/test_document_store.cpp
 * Project: Tool Sync
 * Purpose: Memory and file document stores: CRUD, guarded writes, scans, audit index
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include <fstream>
#include <thread>
#include <vector>
#include "common/file_document_store.hpp"
#include "test_support.hpp"

using nlohmann::json;

template <typename Store>
static void exercise_store(Store &s)
{
    REQUIRE_FALSE(s.get("things", "a").has_value());
    s.put("things", "a", json{{"n", 1}});
    s.put("things", "b", json{{"n", 2}});
    REQUIRE(s.get("things", "a")->at("n") == 1);

    auto big = s.scan("things", [](const json &d)
                      { return d.at("n").template get<int>() > 1; });
    REQUIRE(big.size() == 1);
    REQUIRE(s.scan("things", nullptr).size() == 2);
    REQUIRE(s.scan("missing", nullptr).empty());

    REQUIRE(s.erase("things", "a"));
    REQUIRE_FALSE(s.erase("things", "a"));
    REQUIRE_FALSE(s.get("things", "a").has_value());
}

TEST_CASE("memory store basic operations")
{
    MemoryDocumentStore s;
    exercise_store(s);
}

TEST_CASE("file store basic operations")
{
    TempDir dir;
    FileDocumentStore s{dir.path};
    exercise_store(s);
}

TEST_CASE("compare_and_put only writes over the expected document")
{
    MemoryDocumentStore s;
    REQUIRE(s.compare_and_put("c", "x", std::nullopt, json{{"v", 1}}));
    REQUIRE_FALSE(s.compare_and_put("c", "x", std::nullopt, json{{"v", 2}}));
    REQUIRE_FALSE(s.compare_and_put("c", "x", json{{"v", 7}}, json{{"v", 2}}));
    REQUIRE(s.compare_and_put("c", "x", json{{"v", 1}}, json{{"v", 2}}));
    REQUIRE(s.get("c", "x")->at("v") == 2);
}

TEST_CASE("put_if serializes concurrent increments")
{
    MemoryDocumentStore s;
    s.put("c", "counter", json{{"v", 0}});
    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t)
        workers.emplace_back([&]
                             {
            for (int i = 0; i < 100; ++i)
            {
                while (true)
                {
                    auto cur = s.get("c", "counter");
                    json next{{"v", cur->at("v").get<int>() + 1}};
                    if (s.compare_and_put("c", "counter", cur, next))
                        break;
                }
            } });
    for (auto &w : workers)
        w.join();
    REQUIRE(s.get("c", "counter")->at("v") == 400);
}

TEST_CASE("file store encodes ids and survives reopen")
{
    TempDir dir;
    {
        FileDocumentStore s{dir.path};
        s.put("toolStateSnapshots", "tool/1_dep 2", json{{"version", 3}});
    }
    FileDocumentStore again{dir.path};
    auto d = again.get("toolStateSnapshots", "tool/1_dep 2");
    REQUIRE(d.has_value());
    REQUIRE(d->at("version") == 3);
    REQUIRE(fs::exists(dir.path / "toolStateSnapshots" / "tool%2F1_dep%202.json"));
}

TEST_CASE("file store reports corrupt documents")
{
    TempDir dir;
    FileDocumentStore s{dir.path};
    s.put("c", "ok", json{{"a", 1}});
    {
        std::ofstream f(dir.path / "c" / "bad.json");
        f << "{not json";
    }
    REQUIRE_THROWS_AS(s.get("c", "bad"), StoreError);
    REQUIRE_THROWS_AS(s.scan("c", nullptr), StoreError);
}

TEST_CASE("file store appends audit lines for appended documents")
{
    TempDir dir;
    FileDocumentStore s{dir.path};
    s.on_appended("toolUpdateEvents", json{{"id", "e1"}});
    s.on_appended("toolUpdateEvents", json{{"id", "e2"}});
    std::ifstream f(dir.path / "toolUpdateEvents" / "index.jsonl");
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(f, line))
        lines.push_back(line);
    REQUIRE(lines.size() == 2);
    REQUIRE(json::parse(lines[1]).at("id") == "e2");
    // index.jsonl is not a document
    REQUIRE(s.scan("toolUpdateEvents", nullptr).empty());
}
