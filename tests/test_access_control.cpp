/*
 * File: tests/test_access_control.cpp
 * Project: Tool Sync
 * Purpose: Bearer token parsing and document-backed permission rules
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include "common/access_control.hpp"
#include "test_support.hpp"

TEST_CASE("bearer token extraction")
{
    REQUIRE(bearer_token("Bearer abc") == "abc");
    REQUIRE(bearer_token("Basic abc").empty());
    REQUIRE(bearer_token("").empty());

    TokenAuthenticator auth{{{"tok-1", "u1"}}};
    REQUIRE(auth.verify("tok-1") == std::optional<std::string>("u1"));
    REQUIRE_FALSE(auth.verify("tok-2").has_value());
}

struct AccessFixture
{
    MemoryDocumentStore store;
    DocumentAccessControl access{store};
    AccessFixture()
    {
        seed_tool(store, "T", "author");
        seed_deployment(store, "D", "deployer", "S");
        seed_member(store, "S", "builder", "builder");
        seed_member(store, "S", "viewer", "member");
        seed_member(store, "S", "gone", "admin", "inactive");
        seed_member(store, "S2", "outsider", "member");
    }
};

TEST_CASE_METHOD(AccessFixture, "update permission")
{
    REQUIRE(access.can_update("author", "T", std::nullopt, std::nullopt));
    REQUIRE(access.can_update("deployer", "T", std::string("D"), std::nullopt));
    REQUIRE(access.can_update("builder", "T", std::nullopt, std::string("S")));
    REQUIRE_FALSE(access.can_update("viewer", "T", std::nullopt, std::string("S")));
    REQUIRE_FALSE(access.can_update("gone", "T", std::nullopt, std::string("S")));
    REQUIRE_FALSE(access.can_update("author", "missing", std::nullopt, std::nullopt));
}

TEST_CASE_METHOD(AccessFixture, "read permission")
{
    REQUIRE(access.can_read("author", "T", std::nullopt, std::nullopt));
    REQUIRE(access.can_read("viewer", "T", std::string("D"), std::nullopt));
    REQUIRE(access.can_read("viewer", "", std::nullopt, std::string("S")));
    REQUIRE_FALSE(access.can_read("outsider", "T", std::string("D"), std::nullopt));
    REQUIRE_FALSE(access.can_read("viewer", "T", std::nullopt, std::nullopt));
}

TEST_CASE_METHOD(AccessFixture, "tool users are the deduplicated union")
{
    auto users = access.tool_users("T", std::string("D"), std::string("S"));
    REQUIRE(users.size() == 4);
    REQUIRE(users[0] == "author");
    REQUIRE(users[1] == "deployer");
    REQUIRE(access.tool_name("T") == "Poll");
    REQUIRE(access.tool_name("missing") == "Unknown Tool");
}

TEST_CASE("permission lookups fail closed")
{
    FlakyStore store;
    seed_tool(store, "T", "author");
    store.failing.insert(collections::kTools);
    DocumentAccessControl access{store};
    REQUIRE_FALSE(access.can_read("author", "T", std::nullopt, std::nullopt));
    REQUIRE_FALSE(access.can_update("author", "T", std::nullopt, std::nullopt));
}
