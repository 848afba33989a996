/*
 * File: tests/test_bounded_channel.cpp
 * Project: Classwatch Relay
 * Purpose: Per-subscriber queue: capacity, drop-newest, receive outcomes
 * Last updated: 2026-10-17
 */

#include <catch2/catch.hpp>
#include <boost/asio.hpp>
#include "common/bounded_channel.hpp"

using namespace std::chrono_literals;

TEST_CASE("full channel drops the newest item")
{
    boost::asio::io_context ioc;
    auto ch = std::make_shared<BoundedChannel<int>>(ioc.get_executor(), 2);
    REQUIRE(ch->try_send(1));
    REQUIRE(ch->try_send(2));
    REQUIRE_FALSE(ch->try_send(3));
    REQUIRE(ch->dropped() == 1);
    REQUIRE(ch->size() == 2);
    REQUIRE(ch->try_receive() == 1);
    REQUIRE(ch->try_receive() == 2);
    REQUIRE_FALSE(ch->try_receive().has_value());
}

TEST_CASE("parked receiver gets the item directly")
{
    boost::asio::io_context ioc;
    auto ch = std::make_shared<BoundedChannel<int>>(ioc.get_executor(), 1);
    ReceiveStatus got = ReceiveStatus::closed;
    int value = 0;
    ch->async_receive(5s, [&](ReceiveStatus st, int v)
                      { got = st; value = v; });
    REQUIRE(ch->try_send(42));
    REQUIRE(ch->size() == 0);
    ioc.run();
    REQUIRE(got == ReceiveStatus::item);
    REQUIRE(value == 42);
}

TEST_CASE("receive times out when nothing arrives")
{
    boost::asio::io_context ioc;
    auto ch = std::make_shared<BoundedChannel<int>>(ioc.get_executor(), 1);
    ReceiveStatus got = ReceiveStatus::item;
    ch->async_receive(20ms, [&](ReceiveStatus st, int)
                      { got = st; });
    ioc.run();
    REQUIRE(got == ReceiveStatus::timeout);
}

TEST_CASE("close wakes a parked receiver and rejects sends")
{
    boost::asio::io_context ioc;
    auto ch = std::make_shared<BoundedChannel<int>>(ioc.get_executor(), 4);
    REQUIRE(ch->try_send(1));
    std::vector<ReceiveStatus> seen;
    ch->async_receive(5s, [&](ReceiveStatus st, int)
                      { seen.push_back(st); });
    ioc.run();
    ioc.restart();
    ch->async_receive(5s, [&](ReceiveStatus st, int)
                      { seen.push_back(st); });
    ch->close();
    REQUIRE_FALSE(ch->try_send(2));
    ioc.run();
    REQUIRE(seen == std::vector<ReceiveStatus>{ReceiveStatus::item, ReceiveStatus::closed});
    REQUIRE(ch->closed());
}
