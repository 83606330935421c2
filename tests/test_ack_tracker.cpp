/*
 * File: tests/test_ack_tracker.cpp
 * Project: Tool Sync
 * Purpose: Acknowledgment tracking lifecycle: pending -> complete, lazy expiry
 * Last updated: 2026-10-19
 */

#include <catch2/catch.hpp>
#include "common/ack_tracker.hpp"
#include "test_support.hpp"

using nlohmann::json;

static UpdateEvent ack_event(std::vector<std::string> users, std::optional<SysTime> expires = std::nullopt)
{
    UpdateEvent e;
    e.id = "evt-ack";
    e.key = ToolKey{"T", std::string("D")};
    e.affected_users = std::move(users);
    e.requires_ack = true;
    e.expires_at = expires;
    return e;
}

TEST_CASE("ack tracking completes once every required user acknowledged")
{
    MemoryDocumentStore store;
    ManualClock clock;
    AckTracker acks{store, clock.fn()};

    auto t = acks.register_event(ack_event({"u1", "u2"}));
    REQUIRE(t.status == AckStatus::Pending);
    REQUIRE(t.ack_deadline == clock.now() + std::chrono::minutes(60));

    t = acks.record_ack("evt-ack", "u1");
    REQUIRE(t.status == AckStatus::Pending);
    t = acks.record_ack("evt-ack", "u1");
    REQUIRE(t.received_acks == std::vector<std::string>{"u1"});
    t = acks.record_ack("evt-ack", "u2");
    REQUIRE(t.status == AckStatus::Complete);
    REQUIRE(acks.get("evt-ack")->status == AckStatus::Complete);

    // finished trackers are returned unchanged
    t = acks.record_ack("evt-ack", "u3");
    REQUIRE(t.received_acks.size() == 2);
}

TEST_CASE("ack with no required users is complete immediately")
{
    MemoryDocumentStore store;
    AckTracker acks{store};
    REQUIRE(acks.register_event(ack_event({})).status == AckStatus::Complete);
}

TEST_CASE("ack after the deadline marks the tracking expired")
{
    MemoryDocumentStore store;
    ManualClock clock;
    AckTracker acks{store, clock.fn()};
    acks.register_event(ack_event({"u1", "u2"}, clock.now() + std::chrono::minutes(5)));

    clock.advance(std::chrono::minutes(6));
    auto t = acks.record_ack("evt-ack", "u1");
    REQUIRE(t.status == AckStatus::Expired);
    REQUIRE(t.received_acks.empty());
    REQUIRE(acks.get("evt-ack")->status == AckStatus::Expired);
}

TEST_CASE("ack for an unknown event is not found")
{
    MemoryDocumentStore store;
    AckTracker acks{store};
    try
    {
        acks.record_ack("nope", "u1");
        FAIL("expected SyncError");
    }
    catch (const SyncError &e)
    {
        REQUIRE(e.code() == ErrorCode::NotFound);
    }
}
