/**
 * @file TestSnapshotBuffer.cpp
 * @brief Unit tests for sync::SnapshotBuffer and sync::JitterQueue.
 */

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "tether/sync/JitterQueue.hpp"
#include "tether/sync/SnapshotBuffer.hpp"

namespace tether::sync {

using Catch::Matchers::WithinAbs;

namespace {

PeerRecord at(double x)
{
    PeerRecord record{Json::objectValue};
    record["x"] = x;
    return record;
}

} // namespace

TEST_CASE("SnapshotBuffer keeps timestamps ordered", "[sync][snapshot]")
{
    SnapshotBuffer buffer;

    buffer.push("p2", 100.0, at(1));
    buffer.push("p2", 50.0, at(0));
    buffer.push("p2", 150.0, at(2));
    buffer.push("p2", 100.0, at(1.5));

    const auto* history = buffer.history("p2");
    REQUIRE(history != nullptr);
    REQUIRE(history->size() == 4);
    for (std::size_t i = 1; i < history->size(); ++i)
        REQUIRE((*history)[i - 1].timestamp <= (*history)[i].timestamp);

    // Equal timestamps keep arrival order.
    REQUIRE_THAT((*history)[1].record["x"].asDouble(), WithinAbs(1.0, 1e-12));
    REQUIRE_THAT((*history)[2].record["x"].asDouble(), WithinAbs(1.5, 1e-12));
}

TEST_CASE("SnapshotBuffer evicts beyond ten snapshots", "[sync][snapshot]")
{
    SnapshotBuffer buffer;
    REQUIRE(buffer.capacity() == 10);

    for (int i = 0; i < 25; ++i)
        buffer.push("p2", i * 10.0, at(i));

    const auto* history = buffer.history("p2");
    REQUIRE(history->size() == 10);
    REQUIRE_THAT(history->front().timestamp, WithinAbs(150.0, 1e-12));
    REQUIRE_THAT(history->back().timestamp, WithinAbs(240.0, 1e-12));
}

TEST_CASE("SnapshotBuffer interpolates between bracketing snapshots", "[sync][snapshot]")
{
    SnapshotBuffer buffer;
    PeerRecord first = at(0);
    first["state"] = "idle";
    PeerRecord second = at(100);
    second["state"] = "running";

    buffer.push("p2", 0.0, first);
    buffer.push("p2", 100.0, second);

    SECTION("midpoint")
    {
        auto sample = buffer.sample("p2", 50.0, nullptr);
        REQUIRE(sample.has_value());
        REQUIRE_THAT((*sample)["x"].asDouble(), WithinAbs(50.0, 1e-9));
        REQUIRE((*sample)["state"].asString() == "idle");
    }

    SECTION("non-numeric fields switch past the half-way point")
    {
        auto sample = buffer.sample("p2", 75.0, nullptr);
        REQUIRE(sample.has_value());
        REQUIRE_THAT((*sample)["x"].asDouble(), WithinAbs(75.0, 1e-9));
        REQUIRE((*sample)["state"].asString() == "running");
    }

    SECTION("bracket picks latest before and earliest after")
    {
        const auto b = buffer.bracket("p2", 0.0);
        REQUIRE(b.before != nullptr);
        REQUIRE(b.after != nullptr);
        REQUIRE_THAT(b.before->timestamp, WithinAbs(0.0, 1e-12));
        REQUIRE_THAT(b.after->timestamp, WithinAbs(100.0, 1e-12));
    }
}

TEST_CASE("SnapshotBuffer switches record shape with the non-numeric fields", "[sync][snapshot]")
{
    SnapshotBuffer buffer;
    PeerRecord first = at(0);
    first["hat"] = "red";
    PeerRecord second = at(100);
    second["shield"] = true;

    buffer.push("p2", 0.0, first);
    buffer.push("p2", 100.0, second);

    SECTION("at the earlier snapshot")
    {
        auto sample = buffer.sample("p2", 0.0, nullptr);
        REQUIRE_THAT((*sample)["x"].asDouble(), WithinAbs(0.0, 1e-9));
        REQUIRE((*sample)["hat"].asString() == "red");
        REQUIRE_FALSE(sample->isMember("shield"));
    }

    SECTION("before the half-way point")
    {
        auto sample = buffer.sample("p2", 25.0, nullptr);
        REQUIRE_THAT((*sample)["x"].asDouble(), WithinAbs(25.0, 1e-9));
        REQUIRE((*sample)["hat"].asString() == "red");
        REQUIRE_FALSE(sample->isMember("shield"));
    }

    SECTION("past the half-way point")
    {
        auto sample = buffer.sample("p2", 75.0, nullptr);
        REQUIRE_THAT((*sample)["x"].asDouble(), WithinAbs(75.0, 1e-9));
        REQUIRE_FALSE(sample->isMember("hat"));
        REQUIRE((*sample)["shield"].asBool());
    }
}

TEST_CASE("SnapshotBuffer nudges toward a single side", "[sync][snapshot]")
{
    SnapshotBuffer buffer;
    buffer.push("p2", 100.0, at(100));
    const PeerRecord live = at(0);

    SECTION("only a later snapshot")
    {
        auto sample = buffer.sample("p2", 50.0, &live);
        REQUIRE_THAT((*sample)["x"].asDouble(), WithinAbs(30.0, 1e-9));
    }

    SECTION("only an earlier snapshot")
    {
        auto sample = buffer.sample("p2", 500.0, &live);
        REQUIRE_THAT((*sample)["x"].asDouble(), WithinAbs(30.0, 1e-9));
    }

    SECTION("no live record takes the snapshot as-is")
    {
        auto sample = buffer.sample("p2", 500.0, nullptr);
        REQUIRE_THAT((*sample)["x"].asDouble(), WithinAbs(100.0, 1e-9));
    }

    SECTION("unknown peer")
    {
        REQUIRE_FALSE(buffer.sample("p9", 50.0, &live).has_value());
    }
}

TEST_CASE("JitterQueue releases items once due, in arrival order", "[sync][jitter]")
{
    JitterQueue queue;
    queue.push({"p2", 140.0, 100.0, at(1)});
    queue.push({"p3", 150.0, 110.0, at(2)});
    queue.push({"p2", 160.0, 120.0, at(3)});

    REQUIRE(queue.promote(139.0).empty());

    auto due = queue.promote(150.0);
    REQUIRE(due.size() == 2);
    REQUIRE(due[0].peerId == "p2");
    REQUIRE(due[1].peerId == "p3");
    REQUIRE(queue.size() == 1);
    REQUIRE(queue.holds("p2"));

    queue.erase("p2");
    REQUIRE(queue.empty());
}

} // namespace tether::sync
