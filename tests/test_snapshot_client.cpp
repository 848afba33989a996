/*
 * File: tests/test_snapshot_client.cpp
 * Project: Classwatch Relay
 * Purpose: Camera snapshot GET: timeout, cancel, status handling, body limit, URL parsing
 * Notes:
 *  - Real sockets on loopback; the "camera" is a blocking Beast loop on a thread
 * Last updated: 2026-10-17
 */

#include <catch2/catch.hpp>
#include <atomic>
#include <thread>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "snapshot_client.hpp"
#include "test_support.hpp"

using namespace std::chrono_literals;
using tcp = boost::asio::ip::tcp;

namespace
{
// Answers one connection per entry in `replies`, in order.
struct ScriptedCamera
{
    boost::asio::io_context ioc;
    tcp::acceptor acceptor{ioc, {boost::asio::ip::make_address("127.0.0.1"), 0}};
    std::vector<http::response<http::string_body>> replies;
    std::thread worker;
    std::atomic<std::size_t> served{0};

    void start()
    {
        worker = std::thread([this]
                             {
            for (auto &res : replies)
            {
                tcp::socket sock{ioc};
                boost::system::error_code ec;
                acceptor.accept(sock, ec);
                if (ec)
                    return;
                boost::beast::flat_buffer buf;
                http::request<http::string_body> req;
                http::read(sock, buf, req, ec);
                res.prepare_payload();
                http::write(sock, res, ec);
                sock.shutdown(tcp::socket::shutdown_send, ec);
                ++served;
            } });
    }

    // a failed REQUIRE leaves the loop blocked in accept; feed it empty connections
    ~ScriptedCamera()
    {
        if (!worker.joinable())
            return;
        for (auto left = replies.size() - served; left > 0; --left)
        {
            tcp::socket poke{ioc};
            boost::system::error_code ec;
            poke.connect(acceptor.local_endpoint(), ec);
        }
        worker.join();
    }

    std::string url(const std::string &path = "/capture") const
    {
        return "http://127.0.0.1:" + std::to_string(acceptor.local_endpoint().port()) + path;
    }
};

http::response<http::string_body> camera_reply(http::status status, const std::string &body,
                                               const std::string &type = "image/jpeg")
{
    http::response<http::string_body> res{status, 11};
    res.set(http::field::content_type, type);
    res.body() = body;
    return res;
}

SnapshotResult fetch_once(HttpSnapshotFetcher &fetcher, const std::string &url, std::chrono::milliseconds timeout)
{
    boost::asio::io_context ioc;
    SnapshotResult out;
    int calls = 0;
    fetcher.fetch(ioc.get_executor(), url, timeout, [&](SnapshotResult r)
                  { out = std::move(r); ++calls; });
    ioc.run();
    REQUIRE(calls == 1);
    return out;
}
}

TEST_CASE("a camera that never answers times out")
{
    // listen backlog completes the TCP handshake; nobody reads the request
    boost::asio::io_context server;
    tcp::acceptor silent{server, {boost::asio::ip::make_address("127.0.0.1"), 0}};
    const auto url = "http://127.0.0.1:" + std::to_string(silent.local_endpoint().port()) + "/capture";

    HttpSnapshotFetcher fetcher;
    auto t0 = std::chrono::steady_clock::now();
    auto r = fetch_once(fetcher, url, 200ms);
    auto took = std::chrono::steady_clock::now() - t0;

    REQUIRE_FALSE(r.transport_ok);
    REQUIRE_FALSE(r.usable());
    REQUIRE(r.error == "timeout");
    REQUIRE(took >= 150ms);
    REQUIRE(took < 2s);
}

TEST_CASE("cancel ends a pending fetch exactly once")
{
    boost::asio::io_context server;
    tcp::acceptor silent{server, {boost::asio::ip::make_address("127.0.0.1"), 0}};
    const auto url = "http://127.0.0.1:" + std::to_string(silent.local_endpoint().port()) + "/capture";

    HttpSnapshotFetcher fetcher;
    boost::asio::io_context ioc;
    boost::asio::steady_timer later{ioc, 30ms};
    SnapshotResult out;
    int calls = 0;
    auto pending = fetcher.fetch(ioc.get_executor(), url, 5000ms, [&](SnapshotResult r)
                                 { out = std::move(r); ++calls; });
    REQUIRE(pending != nullptr);
    later.async_wait([&](boost::system::error_code)
                     { pending->cancel(); pending->cancel(); });
    auto t0 = std::chrono::steady_clock::now();
    ioc.run();
    REQUIRE(calls == 1);
    REQUIRE(out.error == "cancelled");
    REQUIRE(std::chrono::steady_clock::now() - t0 < 2s);
}

TEST_CASE("error status is not usable, the next good image is")
{
    ScriptedCamera cam;
    cam.replies.push_back(camera_reply(http::status::service_unavailable, "busy", "text/plain"));
    cam.replies.push_back(camera_reply(http::status::ok, jpeg_bytes("snap")));
    cam.replies.push_back(camera_reply(http::status::ok, ""));
    cam.start();

    HttpSnapshotFetcher fetcher;
    auto busy = fetch_once(fetcher, cam.url(), 2000ms);
    REQUIRE(busy.transport_ok);
    REQUIRE(busy.status == 503);
    REQUIRE_FALSE(busy.usable());

    auto good = fetch_once(fetcher, cam.url(), 2000ms);
    REQUIRE(good.usable());
    REQUIRE(good.body == jpeg_bytes("snap"));
    REQUIRE(good.content_type == "image/jpeg");

    auto empty = fetch_once(fetcher, cam.url(), 2000ms);
    REQUIRE(empty.transport_ok);
    REQUIRE_FALSE(empty.usable());
}

TEST_CASE("oversized camera body is a transport failure")
{
    ScriptedCamera cam;
    cam.replies.push_back(camera_reply(http::status::ok, std::string(4096, 'x')));
    cam.start();

    HttpSnapshotFetcher small(1024);
    auto r = fetch_once(small, cam.url(), 2000ms);
    REQUIRE_FALSE(r.transport_ok);
    REQUIRE_FALSE(r.error.empty());
}

TEST_CASE("unsupported URLs fail fast through the callback")
{
    HttpSnapshotFetcher fetcher;
    boost::asio::io_context ioc;
    SnapshotResult out;
    auto pending = fetcher.fetch(ioc.get_executor(), "https://cam.local/capture", 1000ms, [&](SnapshotResult r)
                                 { out = std::move(r); });
    REQUIRE(pending == nullptr);
    ioc.run();
    REQUIRE_FALSE(out.transport_ok);
    REQUIRE(out.error.find("unsupported url") != std::string::npos);
}

TEST_CASE("http URL parsing")
{
    ParsedUrl u;
    REQUIRE(parse_http_url("http://cam", u));
    REQUIRE(u.host == "cam");
    REQUIRE(u.port == "80");
    REQUIRE(u.target == "/");

    REQUIRE(parse_http_url("http://10.0.0.5:81/jpg?res=vga", u));
    REQUIRE(u.host == "10.0.0.5");
    REQUIRE(u.port == "81");
    REQUIRE(u.target == "/jpg?res=vga");

    REQUIRE_FALSE(parse_http_url("https://cam/capture", u));
    REQUIRE_FALSE(parse_http_url("ftp://cam/capture", u));
    REQUIRE_FALSE(parse_http_url("cam/capture", u));
    REQUIRE_FALSE(parse_http_url("http://", u));
    REQUIRE_FALSE(parse_http_url("http://:81/capture", u));
    REQUIRE_FALSE(parse_http_url("http://cam:/capture", u));
}
