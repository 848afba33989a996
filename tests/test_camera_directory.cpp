/*
 * File: tests/test_camera_directory.cpp
 * Project: Classwatch Relay
 * Purpose: Source key -> camera URL lookups and persistence
 * Last updated: 2026-10-17
 */

#include <catch2/catch.hpp>
#include "camera_directory.hpp"
#include "test_support.hpp"

TEST_CASE("addresses resolve to snapshot URLs")
{
    ScratchDir dir;
    auto path = (dir.path / "cameras.json").string();
    write_atomic(path, R"({"room-7": "192.168.1.101", "lab": "http://10.0.0.5:81/jpg", "gym": {"ip": "10.0.0.6:8081"}, "bad": 5})");
    CameraDirectory cams(path);
    REQUIRE(cams.resolve("room-7") == "http://192.168.1.101/capture");
    REQUIRE(cams.resolve("lab") == "http://10.0.0.5:81/jpg");
    REQUIRE(cams.resolve("gym") == "http://10.0.0.6:8081/capture");
    REQUIRE_FALSE(cams.resolve("bad").has_value());
    REQUIRE_FALSE(cams.resolve("nowhere").has_value());
}

TEST_CASE("missing or malformed file means no cameras")
{
    ScratchDir dir;
    CameraDirectory missing((dir.path / "none.json").string());
    REQUIRE(missing.entries().empty());

    auto path = (dir.path / "cameras.json").string();
    write_atomic(path, "not json");
    CameraDirectory broken(path);
    REQUIRE_FALSE(broken.resolve("room-7").has_value());
}

TEST_CASE("set persists and survives a reload")
{
    ScratchDir dir;
    auto path = (dir.path / "sub" / "cameras.json").string();
    {
        CameraDirectory cams(path, "/snap");
        cams.set("room-7", "10.0.0.7");
        REQUIRE(cams.resolve("room-7") == "http://10.0.0.7/snap");
    }
    CameraDirectory again(path, "/snap");
    REQUIRE(again.address("room-7") == "10.0.0.7");
}

TEST_CASE("external edits are picked up when the file changes")
{
    ScratchDir dir;
    auto path = (dir.path / "cameras.json").string();
    write_atomic(path, R"({"room-7": "10.0.0.7"})");
    CameraDirectory cams(path);
    REQUIRE(cams.address("room-7") == "10.0.0.7");

    write_atomic(path, R"({"room-7": "10.0.0.70"})");
    fs::last_write_time(path, fs::last_write_time(path) + std::chrono::seconds(5));
    REQUIRE(cams.address("room-7") == "10.0.0.70");
}

TEST_CASE("only plain http camera addresses are accepted")
{
    REQUIRE(CameraDirectory::supported("192.168.1.101"));
    REQUIRE(CameraDirectory::supported("10.0.0.6:8081"));
    REQUIRE(CameraDirectory::supported("http://10.0.0.5:81/jpg"));
    REQUIRE_FALSE(CameraDirectory::supported("https://10.0.0.5/capture"));
    REQUIRE_FALSE(CameraDirectory::supported("rtsp://10.0.0.5/stream"));

    ScratchDir dir;
    auto path = (dir.path / "cameras.json").string();
    write_atomic(path, R"({"secure": "https://10.0.0.5/capture", "room-7": "10.0.0.7"})");
    CameraDirectory cams(path);
    REQUIRE_FALSE(cams.resolve("secure").has_value());
    REQUIRE_FALSE(cams.address("secure").has_value());
    REQUIRE(cams.resolve("room-7") == "http://10.0.0.7/capture");

    REQUIRE_THROWS_AS(cams.set("secure", "https://10.0.0.5/capture"), std::invalid_argument);
    REQUIRE_FALSE(cams.address("secure").has_value());
}
