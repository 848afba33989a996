/*
 * File: tests/test_connection_registry.cpp
 * Project: Classwatch Relay
 * Purpose: identifier -> connections bookkeeping
 * Last updated: 2026-10-17
 */

#include <catch2/catch.hpp>
#include "connection_registry.hpp"

namespace
{
struct NullConnection : AlertConnection
{
    bool deliver(const std::shared_ptr<const std::string> &) override { return true; }
    std::string peer() const override { return "test"; }
};
}

TEST_CASE("one identifier may hold several connections")
{
    ConnectionRegistry reg;
    auto phone = std::make_shared<NullConnection>();
    auto laptop = std::make_shared<NullConnection>();
    reg.add("teacher-5", phone);
    reg.add("teacher-5", laptop);
    REQUIRE(reg.contains("teacher-5"));
    REQUIRE(reg.connections_for("teacher-5").size() == 2);
    REQUIRE(reg.counts().at("teacher-5") == 2);
}

TEST_CASE("removing the last connection drops the identifier")
{
    ConnectionRegistry reg;
    auto c = std::make_shared<NullConnection>();
    reg.add("admin-1", c);
    REQUIRE(reg.remove("admin-1", c));
    REQUIRE_FALSE(reg.remove("admin-1", c));
    REQUIRE_FALSE(reg.contains("admin-1"));
    REQUIRE(reg.connections_for("admin-1").empty());
    REQUIRE(reg.counts().empty());
}

TEST_CASE("remove only touches the named identifier")
{
    ConnectionRegistry reg;
    auto c = std::make_shared<NullConnection>();
    reg.add("teacher-5", c);
    REQUIRE_FALSE(reg.remove("teacher-6", c));
    REQUIRE(reg.contains("teacher-5"));
}
