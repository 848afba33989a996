/*
 * File: services/camera_sim/camera_sim_main.cpp
 * Project: Classwatch Relay
 * Purpose: Fake classroom camera: GET /capture returns a still image
 * Notes:
 *  - Cycles through *.jpg / *.png in --images, or serves a built-in JPEG stub
 *  - --fail-every N answers every Nth request with 503 to exercise backoff
 *  - Synchronous, one request per connection
 * Last updated: 2026-10-17
 */

#include <iostream>
#include <algorithm>
#include <vector>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include "common/file_io.hpp"
#include "common/frame.hpp"

namespace http = boost::beast::http;

int main(int argc, char **argv)
{
    std::string listen = "0.0.0.0:8081";
    std::string images_dir;
    std::string capture_path = "/capture";
    int fail_every = 0;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--listen" && i + 1 < argc)
            listen = argv[++i];
        else if (a == "--images" && i + 1 < argc)
            images_dir = argv[++i];
        else if (a == "--path" && i + 1 < argc)
            capture_path = argv[++i];
        else if (a == "--fail-every" && i + 1 < argc)
            fail_every = std::stoi(argv[++i]);
    }

    std::vector<std::string> stills;
    if (!images_dir.empty())
    {
        std::error_code ec;
        std::vector<fs::path> files;
        for (const auto &e : fs::directory_iterator(images_dir, ec))
        {
            auto ext = e.path().extension().string();
            if (ext == ".jpg" || ext == ".jpeg" || ext == ".png")
                files.push_back(e.path());
        }
        if (ec)
            std::cerr << "[camera_sim] cannot list " << images_dir << ": " << ec.message() << "\n";
        std::sort(files.begin(), files.end());
        for (const auto &f : files)
        {
            std::string bytes;
            if (read_file_all(f, bytes) && !image_mime(bytes).empty())
                stills.push_back(std::move(bytes));
        }
    }
    if (stills.empty())
        stills.emplace_back("\xFF\xD8\xFF\xE0\x00\x10JFIF\x00\xFF\xD9", 14);

    try
    {
        auto colon = listen.rfind(':');
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::endpoint ep{boost::asio::ip::make_address(listen.substr(0, colon)),
                                          static_cast<unsigned short>(std::stoi(listen.substr(colon + 1)))};
        boost::asio::ip::tcp::acceptor acceptor{ioc, ep};
        std::cout << "[camera_sim] serving " << stills.size() << " still(s) on " << listen << capture_path << "\n";

        std::size_t served = 0;
        for (unsigned long n = 1;; ++n)
        {
            boost::asio::ip::tcp::socket sock{ioc};
            acceptor.accept(sock);
            boost::beast::flat_buffer buf;
            http::request<http::string_body> req;
            boost::system::error_code ec;
            http::read(sock, buf, req, ec);
            if (ec)
                continue;

            http::response<http::string_body> res{http::status::ok, req.version()};
            res.set(http::field::server, "camera-sim");
            if (req.target() != capture_path)
            {
                res.result(http::status::not_found);
            }
            else if (fail_every > 0 && n % static_cast<unsigned long>(fail_every) == 0)
            {
                res.result(http::status::service_unavailable);
            }
            else
            {
                const auto &img = stills[served++ % stills.size()];
                res.set(http::field::content_type, image_mime(img));
                res.body() = img;
            }
            res.prepare_payload();
            http::write(sock, res, ec);
            if (ec)
                std::cerr << "[camera_sim] write failed: " << ec.message() << "\n";
            sock.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "[camera_sim] " << e.what() << "\n";
        return 1;
    }
}
