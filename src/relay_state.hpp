/*
 * File: src/relay_state.hpp
 * Project: Classwatch Relay
 * Purpose: Process-scoped shared state, passed by reference to every server
 * Notes:
 *  - Created once in main before the io_context runs, never torn down mid-run
 *  - Relay set and alert connection map are the only shared mutable structures
 * Last updated: 2026-10-16
 */

#pragma once
#include <chrono>
#include <memory>
#include <string>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>
#include "alert_broker.hpp"
#include "authenticator.hpp"
#include "camera_directory.hpp"
#include "connection_registry.hpp"
#include "event_recorder.hpp"
#include "puller.hpp"
#include "relay.hpp"
#include "relay_config.hpp"
#include "snapshot_client.hpp"


inline PullerTiming timing_from(const RelayConfig& c){
return PullerTiming{c.idle_interval, c.frame_interval, c.failure_backoff, c.fetch_timeout};
}


struct RelayState {
RelayConfig config;
boost::asio::io_context& io;
RelayRegistry relays;
ConnectionRegistry connections;
AlertBroker alerts;
CameraDirectory cameras;
EventRecorder recorder;
std::unique_ptr<SnapshotFetcher> fetcher;
std::unique_ptr<Authenticator> auth;
PullerSupervisor pullers;
std::chrono::steady_clock::time_point start = std::chrono::steady_clock::now();

// fetcher/auth default to the HTTP client and the configured token table
RelayState(boost::asio::io_context& ioc, RelayConfig cfg,
           std::unique_ptr<SnapshotFetcher> f = nullptr,
           std::unique_ptr<Authenticator> a = nullptr, Detector detector = nullptr)
    : config(std::move(cfg)), io(ioc), relays(config.channel_capacity), connections(),
      alerts(connections, config.mirror_identifier),
      cameras(config.cameras_path(), config.snapshot_path),
      recorder(config.data_dir),
      fetcher(f ? std::move(f) : std::make_unique<HttpSnapshotFetcher>()),
      auth(a ? std::move(a) : std::make_unique<TokenAuthenticator>(config.tokens, config.allow_anonymous)),
      pullers(ioc, relays, cameras, *fetcher, timing_from(config), std::move(detector)) {}

RelayState(const RelayState&) = delete;
RelayState& operator=(const RelayState&) = delete;

// Ingest: detection pipeline -> viewers
std::size_t push_frame(const std::string& source_key, FramePtr frame){
auto relay = relays.get_or_create(source_key);
relay->broadcast(std::move(frame));
return relay->subscriber_count();
}

// Ingest: detection pipeline -> alert recipients
AlertReport raise_alert(const std::string& identifier, const nlohmann::json& message){
return alerts.send_alert(identifier, message);
}

nlohmann::json stats() const {
nlohmann::json rel = nlohmann::json::object();
for (const auto& r : relays.all()) {
auto s = r->stats();
auto p = pullers.find(r->source_key());
rel[r->source_key()] = {
{"subscribers", s.subscribers}, {"has_last", s.has_last},
{"broadcasts", s.broadcasts}, {"drops", s.drops},
{"puller", p ? (p->running() ? "running" : "stopped") : "absent"},
{"polls", p ? p->polls() : 0}};
}
return nlohmann::json{
{"relays", rel},
{"pullers_running", pullers.running_count()},
{"alert_connections", connections.counts()},
{"uptime_s", std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count()}};
}
};
