/**
 * @file TestPrivateFieldFilter.cpp
 * @brief Unit tests for sync::PrivateFieldFilter.
 */

#include <catch2/catch_test_macros.hpp>

#include "tether/sync/PrivateFieldFilter.hpp"

namespace tether::sync {

TEST_CASE("PrivateFieldFilter strips marked fields", "[sync][visibility]")
{
    PrivateFieldFilter filter;

    PeerRecord record{Json::objectValue};
    record["x"] = 1;
    record["_secret"] = 2;

    const PeerRecord stripped = filter.strip(record);
    REQUIRE(stripped.isMember("x"));
    REQUIRE_FALSE(stripped.isMember("_secret"));
    REQUIRE(record.isMember("_secret"));
    REQUIRE(filter.hasPrivate(record));
    REQUIRE_FALSE(filter.hasPrivate(stripped));
}

TEST_CASE("PrivateFieldFilter honours explicit annotations", "[sync][visibility]")
{
    PrivateFieldFilter filter;
    filter.markPrivate("inventory");

    PeerRecord record{Json::objectValue};
    record["x"] = 1;
    record["inventory"] = Json::Value{Json::arrayValue};

    filter.stripInPlace(record);
    REQUIRE(record.size() == 1);
    REQUIRE(record.isMember("x"));
}

TEST_CASE("PrivateFieldFilter leaves nested markers alone", "[sync][visibility]")
{
    PrivateFieldFilter filter;

    PeerRecord record{Json::objectValue};
    record["pos"]["_hidden"] = 3;

    const PeerRecord stripped = filter.strip(record);
    REQUIRE(stripped["pos"].isMember("_hidden"));
}

TEST_CASE("PrivateFieldFilter restores local private fields", "[sync][visibility]")
{
    PrivateFieldFilter filter;

    PeerRecord live{Json::objectValue};
    live["x"] = 1;
    live["_sprite"] = "knight.png";

    PeerRecord incoming{Json::objectValue};
    incoming["x"] = 5;

    filter.restore(incoming, live);
    REQUIRE(incoming["x"].asInt() == 5);
    REQUIRE(incoming["_sprite"].asString() == "knight.png");
}

} // namespace tether::sync
