/*
 * File: src/relay_main.cpp
 * Project: Classwatch Relay
 * Purpose: Main server binary: HTTP ingest/audit endpoints, WS stream + alert fan-out
 * Notes:
 *  - Single io_context thread; every connection and puller runs on its own strand
 *  - SIGINT/SIGTERM stop pullers and acceptors, then the io_context
 *  - Evidence and audit files live under --data
 * Last updated: 2026-10-17
 */

#include <csignal>
#include <iostream>
#include <boost/asio.hpp>
#include "common/file_io.hpp"
#include "relay_config.hpp"
#include "relay_http.hpp"
#include "relay_state.hpp"
#include "relay_ws.hpp"

int main(int argc, char **argv)
{
    RelayConfig cfg;
    try
    {
        cfg = config_from_args(argc, argv);
    }
    catch (const std::exception &e)
    {
        std::cerr << "[relay] bad configuration: " << e.what() << "\n";
        std::cerr << "usage: classwatch_relay [--config file.json] [--http host:port] [--ws host:port]"
                     " [--data dir] [--cameras file.json] [--mirror identifier]\n";
        return 1;
    }

    // Ensure evidence and audit folders under data_dir exist
    try
    {
        ensure_dir(fs::path(cfg.data_dir) / "evidence");
        ensure_dir(fs::path(cfg.data_dir) / "audit");
    }
    catch (const std::exception &e)
    {
        std::cerr << "[relay] WARN: failed to prepare " << cfg.data_dir << " : " << e.what() << "\n";
    }

    boost::asio::io_context ioc{1};
    RelayState state{ioc, cfg};

    try
    {
        auto [http_host, http_port] = split_host_port(cfg.http_bind);
        auto [ws_host, ws_port] = split_host_port(cfg.ws_bind);
        boost::asio::ip::tcp::endpoint http_ep{boost::asio::ip::make_address(http_host), http_port};
        boost::asio::ip::tcp::endpoint ws_ep{boost::asio::ip::make_address(ws_host), ws_port};

        HttpServer http{ioc, http_ep, state};
        WsServer ws{ioc, ws_ep, state};
        state.pullers.start_watchdog(cfg.liveness_interval);

        boost::asio::signal_set signals{ioc, SIGINT, SIGTERM};
        signals.async_wait([&](const boost::system::error_code &err, int sig)
                           {
            if (err)
                return;
            std::cout << "[relay] signal " << sig << ", shutting down\n";
            state.pullers.stop_all();
            http.stop();
            ws.stop();
            ioc.stop(); });

        std::cout << "[relay] listening http=" << cfg.http_bind << " ws=" << cfg.ws_bind
                  << " data=" << cfg.data_dir << " mirror=" << cfg.mirror_identifier << "\n";
        ioc.run();
    }
    catch (const std::exception &e)
    {
        std::cerr << "[relay] fatal: " << e.what() << "\n";
        state.pullers.stop_all();
        return 1;
    }
    return 0;
}
