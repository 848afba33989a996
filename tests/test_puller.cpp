/*
 * File: tests/test_puller.cpp
 * Project: Classwatch Relay
 * Purpose: Camera polling loop and supervisor
 * Notes:
 *  - Uses a fake fetcher; intervals are shrunk to milliseconds
 * Last updated: 2026-10-17
 */

#include <catch2/catch.hpp>
#include <iostream>
#include <sstream>
#include <thread>
#include <boost/asio.hpp>
#include "puller.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;

static const PullerTiming fast_timing{10ms, 10ms, 10ms, 100ms};

// Redirects a standard stream for the lifetime of the object.
struct CapturedStream
{
    std::ostream &os;
    std::ostringstream buf;
    std::streambuf *old;

    explicit CapturedStream(std::ostream &s) : os(s), old(s.rdbuf(buf.rdbuf())) {}
    ~CapturedStream() { os.rdbuf(old); }
    std::string text() const { return buf.str(); }
};

static std::size_t occurrences(const std::string &hay, const std::string &needle)
{
    std::size_t n = 0;
    for (auto pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + needle.size()))
        ++n;
    return n;
}

static std::string write_cameras(const ScratchDir &dir, const std::string &json)
{
    auto path = (dir.path / "cameras.json").string();
    write_atomic(path, json);
    return path;
}

TEST_CASE("puller stays idle while nobody watches")
{
    ScratchDir dir;
    CameraDirectory cams(write_cameras(dir, R"({"room-7": "10.0.0.7"})"));
    FakeFetcher fetcher;
    boost::asio::io_context ioc;
    auto relay = std::make_shared<Relay>("room-7", 4);
    auto p = std::make_shared<Puller>(ioc, "room-7", relay, cams, fetcher, fast_timing);
    p->start();
    ioc.run_for(80ms);
    REQUIRE(p->running());
    REQUIRE(p->polls() == 0);
    REQUIRE(fetcher.urls().empty());
    p->stop();
}

TEST_CASE("puller fetches the camera and broadcasts frames to viewers")
{
    ScratchDir dir;
    CameraDirectory cams(write_cameras(dir, R"({"room-7": "10.0.0.7"})"));
    FakeFetcher fetcher;
    boost::asio::io_context ioc;
    auto relay = std::make_shared<Relay>("room-7", 4);
    auto viewer = relay->subscribe(ioc.get_executor());
    auto p = std::make_shared<Puller>(ioc, "room-7", relay, cams, fetcher, fast_timing,
                                      [](const std::string &)
                                      { return std::vector<Prediction>{{1, 2, 3, 4, "phone", 0.8}}; });
    p->start();
    ioc.run_for(80ms);
    p->stop();

    REQUIRE(p->frames() >= 1);
    REQUIRE(fetcher.urls().front() == "http://10.0.0.7/capture");
    auto f = viewer->try_receive();
    REQUIRE(f.has_value());
    REQUIRE((*f)->source_key == "room-7");
    REQUIRE((*f)->content_type == "image/jpeg");
    REQUIRE((*f)->predictions.size() == 1);
    REQUIRE((*f)->predictions[0].label == "phone");
    REQUIRE(relay->last_frame() != nullptr);
}

TEST_CASE("failed or non-image fetches back off without broadcasting")
{
    ScratchDir dir;
    CameraDirectory cams(write_cameras(dir, R"({"room-7": "http://10.0.0.7:81/jpg"})"));
    FakeFetcher fetcher;
    SECTION("transport error")
    {
        fetcher.reply = SnapshotResult{};
        fetcher.reply.error = "connection refused";
    }
    SECTION("camera error status")
    {
        fetcher.reply.status = 503;
    }
    SECTION("body is not an image")
    {
        fetcher.reply.body = "<html>login</html>";
    }
    boost::asio::io_context ioc;
    auto relay = std::make_shared<Relay>("room-7", 4);
    auto viewer = relay->subscribe(ioc.get_executor());
    auto p = std::make_shared<Puller>(ioc, "room-7", relay, cams, fetcher, fast_timing);
    p->start();
    ioc.run_for(100ms);
    p->stop();

    REQUIRE(p->polls() >= 2);
    REQUIRE(p->frames() == 0);
    REQUIRE(relay->last_frame() == nullptr);
    REQUIRE(viewer->size() == 0);
    REQUIRE(fetcher.urls().front() == "http://10.0.0.7:81/jpg");
}

TEST_CASE("unknown camera keeps the puller alive and polling nothing")
{
    ScratchDir dir;
    CameraDirectory cams(write_cameras(dir, R"({})"));
    FakeFetcher fetcher;
    boost::asio::io_context ioc;
    auto relay = std::make_shared<Relay>("room-9", 4);
    auto viewer = relay->subscribe(ioc.get_executor());
    auto p = std::make_shared<Puller>(ioc, "room-9", relay, cams, fetcher, fast_timing);
    CapturedStream err(std::cerr), out(std::cout);
    p->start();
    ioc.run_for(100ms);
    REQUIRE(p->running());
    REQUIRE(fetcher.urls().empty());
    REQUIRE(p->failures() >= 3);
    // one line for the whole outage, not one per retry
    REQUIRE(occurrences(err.text(), "[puller room-9] no camera address") == 1);

    // address shows up later: next iteration picks it up
    cams.set("room-9", "10.0.0.9");
    ioc.restart();
    ioc.run_for(50ms);
    p->stop();
    REQUIRE_FALSE(fetcher.urls().empty());
    REQUIRE(p->frames() >= 1);
    REQUIRE(p->failures() == 0);
    REQUIRE(occurrences(out.text(), "[puller room-9] recovered after") == 1);
    REQUIRE(occurrences(err.text(), "[puller room-9] no camera address") == 1);
}

TEST_CASE("a changing failure is logged again, a repeated one is not")
{
    ScratchDir dir;
    CameraDirectory cams(write_cameras(dir, R"({"room-7": "10.0.0.7"})"));
    FakeFetcher fetcher;
    fetcher.reply.status = 503;
    boost::asio::io_context ioc;
    auto relay = std::make_shared<Relay>("room-7", 4);
    auto viewer = relay->subscribe(ioc.get_executor());
    auto p = std::make_shared<Puller>(ioc, "room-7", relay, cams, fetcher, fast_timing);
    CapturedStream err(std::cerr);
    p->start();
    ioc.run_for(80ms);
    REQUIRE(p->polls() >= 3);
    REQUIRE(occurrences(err.text(), "camera answered 503") == 1);

    fetcher.reply = SnapshotResult{};
    fetcher.reply.error = "connection refused";
    ioc.restart();
    ioc.run_for(80ms);
    p->stop();
    REQUIRE(occurrences(err.text(), "fetch failed: connection refused") == 1);
    REQUIRE(occurrences(err.text(), "camera answered 503") == 1);
}

TEST_CASE("stop cancels the in-flight fetch")
{
    ScratchDir dir;
    CameraDirectory cams(write_cameras(dir, R"({"room-7": "10.0.0.7"})"));
    FakeFetcher fetcher;
    fetcher.hang = true;
    boost::asio::io_context ioc;
    auto relay = std::make_shared<Relay>("room-7", 4);
    auto viewer = relay->subscribe(ioc.get_executor());
    auto p = std::make_shared<Puller>(ioc, "room-7", relay, cams, fetcher, fast_timing);
    p->start();
    ioc.run_for(30ms);
    REQUIRE(fetcher.pending().size() == 1);
    p->stop();
    ioc.restart();
    ioc.run_for(30ms);
    REQUIRE(p->state() == Puller::State::stopped);
    REQUIRE(fetcher.pending().front()->cancelled);
}

TEST_CASE("supervisor runs at most one puller per source")
{
    ScratchDir dir;
    CameraDirectory cams(write_cameras(dir, R"({"room-7": "10.0.0.7"})"));
    FakeFetcher fetcher;
    boost::asio::io_context ioc;
    RelayRegistry relays(4);
    PullerSupervisor sup(ioc, relays, cams, fetcher, fast_timing);

    REQUIRE(sup.ensure_running("room-7"));
    REQUIRE_FALSE(sup.ensure_running("room-7"));
    REQUIRE(sup.running_count() == 1);

    // a stopped puller is replaced when viewers are still there
    auto first = sup.find("room-7");
    first->stop();
    relays.get_or_create("room-7")->subscribe(ioc.get_executor());
    REQUIRE(sup.check_liveness() == 1);
    REQUIRE(sup.find("room-7") != first);
    REQUIRE(sup.running_count() == 1);

    sup.stop_all();
    REQUIRE(sup.running_count() == 0);
    REQUIRE_FALSE(sup.ensure_running("room-7"));
    ioc.run_for(20ms);
}

TEST_CASE("a puller stuck on a fetch is declared stalled and replaced")
{
    ScratchDir dir;
    CameraDirectory cams(write_cameras(dir, R"({"room-7": "10.0.0.7"})"));
    FakeFetcher fetcher;
    fetcher.hang = true;
    boost::asio::io_context ioc;
    RelayRegistry relays(4);
    const PullerTiming tiny{5ms, 5ms, 5ms, 10ms};
    PullerSupervisor sup(ioc, relays, cams, fetcher, tiny);
    relays.get_or_create("room-7")->subscribe(ioc.get_executor());

    REQUIRE(sup.ensure_running("room-7"));
    ioc.run_for(10ms);
    auto stuck = sup.find("room-7");
    REQUIRE(fetcher.pending().size() == 1);
    REQUIRE_FALSE(stuck->stalled(std::chrono::steady_clock::now()));

    // nothing is scheduled while the fetch hangs, so wall-clock time has to pass
    std::this_thread::sleep_for(3 * tiny.max_gap() + 30ms);
    REQUIRE(stuck->running());
    REQUIRE(stuck->stalled(std::chrono::steady_clock::now()));

    REQUIRE(sup.check_liveness() == 1);
    REQUIRE(sup.find("room-7") != stuck);
    REQUIRE(stuck->state() == Puller::State::stopped);
    ioc.restart();
    ioc.run_for(10ms);
    REQUIRE(fetcher.pending().front()->cancelled);
    sup.stop_all();
    ioc.restart();
    ioc.run_for(10ms);
}

TEST_CASE("watchdog restarts a dead puller on its own")
{
    ScratchDir dir;
    CameraDirectory cams(write_cameras(dir, R"({"room-7": "10.0.0.7"})"));
    FakeFetcher fetcher;
    boost::asio::io_context ioc;
    RelayRegistry relays(4);
    PullerSupervisor sup(ioc, relays, cams, fetcher, fast_timing);
    auto viewer = relays.get_or_create("room-7")->subscribe(ioc.get_executor());

    REQUIRE(sup.ensure_running("room-7"));
    auto first = sup.find("room-7");
    first->stop();
    REQUIRE(sup.running_count() == 0);

    sup.start_watchdog(10ms);
    ioc.run_for(60ms);
    REQUIRE(sup.find("room-7") != first);
    REQUIRE(sup.running_count() == 1);
    REQUIRE(sup.find("room-7")->frames() >= 1);

    sup.stop_all();
    ioc.run_for(20ms);
    REQUIRE(sup.running_count() == 0);
}
