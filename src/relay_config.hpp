/*
 * File: src/relay_config.hpp
 * Project: Classwatch Relay
 * Purpose: Runtime configuration: JSON file, then command-line overrides
 * Notes:
 *  - Unknown keys are ignored, wrongly typed keys are a startup error
 *  - tokens are never echoed back by /v1/config
 * Last updated: 2026-10-16
 */

#pragma once
#include <chrono>
#include <fstream>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>

enum class RejectPolicy
{
    close,  // accept the upgrade, then close with 1008
    refuse, // answer 401, never upgrade
};

struct RelayConfig
{
    std::string http_bind{"0.0.0.0:8080"};
    std::string ws_bind{"0.0.0.0:8090"};
    std::string data_dir{"/data"};
    std::string cameras_file; // empty: <data_dir>/cameras.json
    std::string mirror_identifier{"1"};
    std::string public_base_url{"http://localhost:8080"};
    std::string snapshot_path{"/capture"};

    std::size_t channel_capacity{4};
    std::chrono::milliseconds idle_interval{2000};
    std::chrono::milliseconds frame_interval{500};
    std::chrono::milliseconds failure_backoff{1500};
    std::chrono::milliseconds fetch_timeout{3000};
    std::chrono::milliseconds keepalive_interval{10000};
    std::chrono::milliseconds liveness_interval{5000};

    RejectPolicy reject_policy{RejectPolicy::close};
    bool allow_anonymous{false};
    std::map<std::string, std::string> tokens; // token -> identity
    std::size_t max_body_bytes{8 * 1024 * 1024};

    std::string cameras_path() const
    {
        return cameras_file.empty() ? data_dir + "/cameras.json" : cameras_file;
    }
};

inline std::pair<std::string, unsigned short> split_host_port(const std::string &s)
{
    auto p = s.rfind(':');
    if (p == std::string::npos || p + 1 == s.size())
        throw std::runtime_error("expected host:port, got '" + s + "'");
    int port = 0;
    try
    {
        port = std::stoi(s.substr(p + 1));
    }
    catch (const std::exception &)
    {
        throw std::runtime_error("bad port in '" + s + "'");
    }
    if (port < 0 || port > 65535)
        throw std::runtime_error("port out of range in '" + s + "'");
    return {s.substr(0, p), static_cast<unsigned short>(port)};
}

inline RejectPolicy reject_policy_from_string(const std::string &s)
{
    if (s == "close")
        return RejectPolicy::close;
    if (s == "refuse")
        return RejectPolicy::refuse;
    throw std::runtime_error("reject_policy must be \"close\" or \"refuse\", got \"" + s + "\"");
}

inline const char *to_string(RejectPolicy p)
{
    return p == RejectPolicy::close ? "close" : "refuse";
}

// Per-viewer ring slots; anything larger is a backlog, not a freshness buffer.
constexpr std::size_t max_channel_capacity = 1024;

inline RelayConfig config_from_json(const nlohmann::json &j)
{
    if (!j.is_object())
        throw std::runtime_error("config root must be a JSON object");
    RelayConfig c;
    try
    {
        // Read signed so negative values are caught instead of wrapping.
        auto positive = [&](const char *key, long long fallback)
        {
            long long v = j.contains(key) ? j.at(key).get<long long>() : fallback;
            if (v <= 0)
                throw std::runtime_error(std::string(key) + " must be positive, got " + std::to_string(v));
            return v;
        };
        auto ms = [&](const char *key, std::chrono::milliseconds &out)
        {
            out = std::chrono::milliseconds(positive(key, out.count()));
        };
        c.http_bind = j.value("http", c.http_bind);
        c.ws_bind = j.value("ws", c.ws_bind);
        c.data_dir = j.value("data_dir", c.data_dir);
        c.cameras_file = j.value("cameras_file", c.cameras_file);
        c.mirror_identifier = j.value("mirror_identifier", c.mirror_identifier);
        c.public_base_url = j.value("public_base_url", c.public_base_url);
        c.snapshot_path = j.value("snapshot_path", c.snapshot_path);
        c.channel_capacity = static_cast<std::size_t>(positive("channel_capacity", static_cast<long long>(c.channel_capacity)));
        ms("idle_interval_ms", c.idle_interval);
        ms("frame_interval_ms", c.frame_interval);
        ms("failure_backoff_ms", c.failure_backoff);
        ms("fetch_timeout_ms", c.fetch_timeout);
        ms("keepalive_interval_ms", c.keepalive_interval);
        ms("liveness_interval_ms", c.liveness_interval);
        if (j.contains("reject_policy"))
            c.reject_policy = reject_policy_from_string(j.at("reject_policy").get<std::string>());
        c.allow_anonymous = j.value("allow_anonymous", c.allow_anonymous);
        if (j.contains("tokens"))
            c.tokens = j.at("tokens").get<std::map<std::string, std::string>>();
        c.max_body_bytes = static_cast<std::size_t>(positive("max_body_bytes", static_cast<long long>(c.max_body_bytes)));
    }
    catch (const nlohmann::json::exception &e)
    {
        throw std::runtime_error(std::string("bad config value: ") + e.what());
    }
    if (c.channel_capacity > max_channel_capacity)
        throw std::runtime_error("channel_capacity must be at most " + std::to_string(max_channel_capacity));
    return c;
}

inline RelayConfig load_config_file(const std::string &path)
{
    std::ifstream f(path);
    if (!f)
        throw std::runtime_error("failed to open config " + path);
    auto j = nlohmann::json::parse(f, nullptr, false);
    if (j.is_discarded())
        throw std::runtime_error("config " + path + " is not valid JSON");
    return config_from_json(j);
}

// --config is applied first so the remaining flags override the file.
inline RelayConfig config_from_args(int argc, char **argv)
{
    RelayConfig c;
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::string(argv[i]) == "--config")
        {
            c = load_config_file(argv[i + 1]);
            break;
        }
    }
    for (int i = 1; i < argc; ++i)
    {
        std::string a = argv[i];
        if (a == "--config" && i + 1 < argc)
            ++i;
        else if (a == "--http" && i + 1 < argc)
            c.http_bind = argv[++i];
        else if (a == "--ws" && i + 1 < argc)
            c.ws_bind = argv[++i];
        else if (a == "--data" && i + 1 < argc)
            c.data_dir = argv[++i];
        else if (a == "--cameras" && i + 1 < argc)
            c.cameras_file = argv[++i];
        else if (a == "--mirror" && i + 1 < argc)
            c.mirror_identifier = argv[++i];
        else
            throw std::runtime_error("unknown or incomplete argument: " + a);
    }
    return c;
}

inline nlohmann::json config_to_json(const RelayConfig &c)
{
    return nlohmann::json{
        {"http", c.http_bind},
        {"ws", c.ws_bind},
        {"data_dir", c.data_dir},
        {"cameras_file", c.cameras_path()},
        {"mirror_identifier", c.mirror_identifier},
        {"public_base_url", c.public_base_url},
        {"snapshot_path", c.snapshot_path},
        {"channel_capacity", c.channel_capacity},
        {"idle_interval_ms", c.idle_interval.count()},
        {"frame_interval_ms", c.frame_interval.count()},
        {"failure_backoff_ms", c.failure_backoff.count()},
        {"fetch_timeout_ms", c.fetch_timeout.count()},
        {"keepalive_interval_ms", c.keepalive_interval.count()},
        {"liveness_interval_ms", c.liveness_interval.count()},
        {"reject_policy", to_string(c.reject_policy)},
        {"allow_anonymous", c.allow_anonymous},
        {"max_body_bytes", c.max_body_bytes}};
}
