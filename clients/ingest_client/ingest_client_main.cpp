/*
 * File: clients/ingest_client/ingest_client_main.cpp
 * Project: Classwatch Relay
 * Purpose: Stand-in for the detection pipeline: posts frames, alerts and violations
 * Notes:
 *  - --frames <sourceKey>  POST /v1/frames/<sourceKey> with a drifting box
 *  - --alert <identifier>  POST /v1/alerts/<identifier>
 *  - --violation <sourceKey> <identifier>  POST /v1/violations with --image as evidence
 * Last updated: 2026-10-17
 */

#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>

#include <nlohmann/json.hpp>
#include <chrono>
#include <thread>

#include "common/base64.hpp"
#include "common/file_io.hpp"

namespace http = boost::beast::http;
using json = nlohmann::json;

static http::response<http::string_body> post_json(boost::asio::io_context &ioc,
                                                   const boost::asio::ip::tcp::resolver::results_type &results,
                                                   const std::string &host, const std::string &target, const json &body)
{
    boost::asio::ip::tcp::socket sock{ioc};
    boost::asio::connect(sock, results.begin(), results.end());
    http::request<http::string_body> req{http::verb::post, target, 11};
    req.set(http::field::host, host);
    req.set(http::field::content_type, "application/json");
    req.body() = body.dump();
    req.prepare_payload();
    http::write(sock, req);
    boost::beast::flat_buffer buf;
    http::response<http::string_body> res;
    http::read(sock, buf, res);
    boost::system::error_code ignored;
    sock.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
    return res;
}

static void print_response(const http::response<http::string_body> &res, bool pretty)
{
    auto j = json::parse(res.body(), nullptr, false);
    std::cout << "[ingest_client] status=" << res.result_int() << " body:\n";
    if (j.is_discarded())
        std::cout << res.body() << std::endl;
    else
        std::cout << (pretty ? j.dump(2) : j.dump()) << std::endl;
}

int main(int argc, char **argv)
{
    bool pretty = false;
    std::string base = "http://localhost:8080";
    std::string mode, source_key, identifier, message = "check room", image_path;
    int count = 20;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--http" && i + 1 < argc)
            base = argv[++i];
        else if (a == "--frames" && i + 1 < argc)
        {
            mode = "frames";
            source_key = argv[++i];
        }
        else if (a == "--alert" && i + 1 < argc)
        {
            mode = "alert";
            identifier = argv[++i];
        }
        else if (a == "--violation" && i + 2 < argc)
        {
            mode = "violation";
            source_key = argv[++i];
            identifier = argv[++i];
        }
        else if (a == "--message" && i + 1 < argc)
            message = argv[++i];
        else if (a == "--image" && i + 1 < argc)
            image_path = argv[++i];
        else if (a == "--count" && i + 1 < argc)
            count = std::stoi(argv[++i]);
        else if (a == "--pretty")
            pretty = true;
    }
    if (mode.empty())
    {
        std::cerr << "usage: ingest_client [--http url] (--frames key | --alert id | --violation key id)"
                     " [--image file] [--message text] [--count n] [--pretty]\n";
        return 2;
    }

    // Smallest byte string that passes the relay's JPEG signature check
    std::string image("\xFF\xD8\xFF\xE0\x00\x10JFIF\x00\xFF\xD9", 14);
    if (!image_path.empty() && !read_file_all(image_path, image))
    {
        std::cerr << "[ingest_client] cannot read " << image_path << "\n";
        return 1;
    }

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto pos = base.find("//");
        auto hp = base.substr(pos == std::string::npos ? 0 : pos + 2);
        auto host = hp.substr(0, hp.find(":"));
        auto port = hp.find(":") == std::string::npos ? std::string("80") : hp.substr(host.size() + 1);
        auto results = res.resolve(host, port);

        if (mode == "alert")
        {
            print_response(post_json(ioc, results, host, "/v1/alerts/" + identifier,
                                     json{{"message", message}, {"timestamp", iso8601_now_ms()}}),
                           pretty);
        }
        else if (mode == "violation")
        {
            print_response(post_json(ioc, results, host, "/v1/violations",
                                     json{{"source_key", source_key}, {"identifier", identifier},
                                          {"detail", message}, {"evidence", base64_encode(image)}}),
                           pretty);
        }
        else
        {
            const auto encoded = base64_encode(image);
            for (int k = 0; k < count; ++k)
            {
                json box{{"x", 40 + 5 * k}, {"y", 60}, {"w", 80}, {"h", 120}, {"class", "phone"}, {"conf", 0.9}};
                print_response(post_json(ioc, results, host, "/v1/frames/" + source_key,
                                         json{{"image", encoded}, {"predictions", json::array({box})}}),
                               pretty);
                std::this_thread::sleep_for(std::chrono::milliseconds(100));
            }
        }
    }
    catch (const std::exception &e)
    {
        std::cerr << "[ingest_client] " << e.what() << "\n";
        return 1;
    }
    return 0;
}
