#include <iostream>
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/core/buffers_to_string.hpp>
#include <nlohmann/json.hpp>
#include "common/base64.hpp"
#include "common/file_io.hpp"

using json = nlohmann::json;
namespace websocket = boost::beast::websocket;

// Watches a stream or alert endpoint and prints one line per message.
// --out <dir> also keeps the newest frame image as <dir>/<sourceKey>.jpg
int main(int argc, char **argv)
{
    std::string ws_url = "ws://localhost:8090/ws/stream/room-1";
    std::string out_dir;
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--ws" && i + 1 < argc)
            ws_url = argv[++i];
        else if (a == "--out" && i + 1 < argc)
            out_dir = argv[++i];
    }

    auto pos = ws_url.find("//");
    if (pos == std::string::npos)
    {
        std::cerr << "viewer: bad url " << ws_url << "\n";
        return 1;
    }
    auto hp = ws_url.substr(pos + 2);
    auto slash = hp.find("/");
    auto authority = hp.substr(0, slash);
    auto colon = authority.find(":");
    auto host = authority.substr(0, colon);
    auto port = colon == std::string::npos ? std::string("80") : authority.substr(colon + 1);
    auto target = slash == std::string::npos ? std::string("/") : hp.substr(slash);

    try
    {
        boost::asio::io_context ioc;
        boost::asio::ip::tcp::resolver res{ioc};
        auto const results = res.resolve(host, port);
        boost::asio::ip::tcp::socket sock{ioc};
        boost::asio::connect(sock, results.begin(), results.end());
        websocket::stream<boost::asio::ip::tcp::socket> ws{std::move(sock)};
        ws.handshake(authority, target);
        std::cout << "viewer: connected " << ws_url << "\n";

        boost::beast::flat_buffer buf;
        while (true)
        {
            ws.read(buf);
            auto s = boost::beast::buffers_to_string(buf.data());
            buf.consume(buf.size());
            auto j = json::parse(s, nullptr, false);
            if (!j.is_object())
                continue;
            const auto type = j.value("type", std::string());
            if (type == "keepalive")
            {
                std::cout << "viewer: keepalive " << j.value("sourceKey", std::string()) << "\n";
            }
            else if (type == "frame")
            {
                auto key = j.value("sourceKey", std::string());
                auto image = base64_decode(j.value("image", std::string()));
                std::cout << "viewer: frame " << key << " seq=" << j.value("seq", 0ull)
                          << " boxes=" << j["predictions"].size()
                          << " bytes=" << (image ? image->size() : 0) << "\n";
                if (!out_dir.empty() && image)
                {
                    ensure_dir(out_dir);
                    write_atomic(fs::path(out_dir) / (key + ".jpg"), *image);
                }
            }
            else
            {
                std::cout << "viewer: alert " << j.dump() << "\n";
            }
        }
    }
    catch (const boost::system::system_error &e)
    {
        if (e.code() == websocket::error::closed)
        {
            std::cout << "viewer: server closed the connection\n";
            return 0;
        }
        std::cerr << "viewer: " << e.what() << "\n";
        return 1;
    }
    catch (const std::exception &e)
    {
        std::cerr << "viewer: " << e.what() << "\n";
        return 1;
    }
}
