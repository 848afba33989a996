/*
 * File: src/relay_http.hpp
 * Project: Classwatch Relay
 * Purpose: HTTP routing and handlers: ingest, violations, audit, cameras, stats
 * Notes:
 *  - One request per connection, then shutdown (send side)
 *  - Ingest never waits on viewers or alert recipients
 *  - /health returns uptime only; no shared state touched
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <boost/asio.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <iostream>
#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>

#include "common/base64.hpp"
#include "common/file_io.hpp"
#include "common/frame.hpp"
#include "common/url.hpp"
#include "relay_state.hpp"

namespace http = boost::beast::http;

inline std::atomic<uint64_t> g_ingest_seq{1}; // per-process sequence for ingested frames

// Identifiers arrive as strings or, from older clients, as integers.
inline std::string id_field(const nlohmann::json &body, const char *key, const char *legacy)
{
    for (const char *k : {key, legacy})
    {
        if (!body.contains(k))
            continue;
        const auto &v = body.at(k);
        if (v.is_string())
            return v.get<std::string>();
        if (v.is_number_integer())
            return std::to_string(v.get<long long>());
    }
    return {};
}

class HttpServer
{
    boost::asio::io_context &ioc_;
    boost::asio::ip::tcp::acceptor acceptor_;
    RelayState &state_;

public:
    // Throws std::runtime_error when the endpoint cannot be bound.
    HttpServer(boost::asio::io_context &ioc, boost::asio::ip::tcp::endpoint ep, RelayState &s)
        : ioc_(ioc), acceptor_(ioc), state_(s)
    {
        boost::system::error_code ec;
        acceptor_.open(ep.protocol(), ec);
        if (!ec)
            acceptor_.set_option(boost::asio::socket_base::reuse_address(true), ec);
        if (!ec)
            acceptor_.bind(ep, ec);
        if (!ec)
            acceptor_.listen(boost::asio::socket_base::max_listen_connections, ec);
        if (ec)
            throw std::runtime_error("http listen failed: " + ec.message());
        do_accept();
    }

    unsigned short port() const { return acceptor_.local_endpoint().port(); }

    void stop()
    {
        boost::system::error_code ignored;
        acceptor_.close(ignored);
    }

private:
    void do_accept()
    {
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec) std::make_shared<Session>(std::move(socket), state_)->run();
            do_accept(); });
    }

    struct Session : std::enable_shared_from_this<Session>
    {
        boost::asio::ip::tcp::socket socket;
        boost::beast::flat_buffer buffer;
        std::optional<http::request_parser<http::string_body>> parser;
        http::request<http::string_body> req;
        RelayState &state;

        Session(boost::asio::ip::tcp::socket &&s, RelayState &st)
            : socket(std::move(s)), state(st) {}

        void run()
        {
            parser.emplace();
            parser->body_limit(state.config.max_body_bytes);
            do_read();
        }

        void do_read()
        {
            auto self = shared_from_this();
            http::async_read(socket, buffer, *parser, [self](boost::beast::error_code ec, std::size_t)
                             {
                if (ec == http::error::body_limit)
                {
                    self->req = self->parser->release();
                    return self->reply(http::status::payload_too_large, {{"error", "body too large"}});
                }
                if (ec)
                    return;
                self->req = self->parser->release();
                self->handle(); });
        }

        // keep response alive through async_write
        void respond(http::response<http::string_body> &&res)
        {
            auto self = shared_from_this();
            auto sp = std::make_shared<http::response<http::string_body>>(std::move(res));
            sp->set(http::field::server, "classwatch-relay");

            http::async_write(socket, *sp, [self, sp](boost::beast::error_code, std::size_t)
                              {
                boost::system::error_code ignored;
                self->socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ignored); });
        }

        void reply(http::status status, const nlohmann::json &body)
        {
            http::response<http::string_body> res{status, req.version()};
            res.set(http::field::content_type, "application/json");
            res.body() = body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
            res.prepare_payload();
            respond(std::move(res));
        }

        void handle()
        {
            using nlohmann::json;
            try
            {
                route();
            }
            catch (const std::exception &e)
            {
                std::cerr << "[http] " << req.method_string() << " " << req.target() << " failed: " << e.what() << "\n";
                reply(http::status::internal_server_error, json{{"error", "internal"}, {"what", e.what()}});
            }
        }

        void route()
        {
            using nlohmann::json;
            std::string path, query;
            split_target(std::string(req.target()), path, query);
            auto seg = path_segments(path);
            const auto verb = req.method();

            // GET /health
            if (verb == http::verb::get && path == "/health")
            {
                auto up = std::chrono::duration<double>(std::chrono::steady_clock::now() - state.start).count();
                return reply(http::status::ok, json{{"status", "ok"}, {"uptime_s", up}});
            }

            // GET /v1/config
            if (verb == http::verb::get && path == "/v1/config")
                return reply(http::status::ok, config_to_json(state.config));

            // GET /v1/stats
            if (verb == http::verb::get && path == "/v1/stats")
                return reply(http::status::ok, state.stats());

            // POST /v1/frames/{sourceKey}
            if (verb == http::verb::post && seg.size() == 3 && seg[0] == "v1" && seg[1] == "frames")
                return ingest_frame(seg[2]);

            // POST /v1/alerts/{identifier}
            if (verb == http::verb::post && seg.size() == 3 && seg[0] == "v1" && seg[1] == "alerts")
                return ingest_alert(seg[2]);

            // POST /v1/violations
            if (verb == http::verb::post && path == "/v1/violations")
                return report_violation();

            // GET /v1/audit/latest
            if (verb == http::verb::get && path == "/v1/audit/latest")
            {
                auto latest = state.recorder.latest();
                if (!latest)
                {
                    http::response<http::string_body> res{http::status::no_content, req.version()};
                    res.prepare_payload();
                    return respond(std::move(res));
                }
                return reply(http::status::ok, *latest);
            }

            // GET /v1/audit/since?ts=...&limit=...
            if (verb == http::verb::get && path == "/v1/audit/since")
            {
                auto ts = query_param(query, "ts");
                if (ts.empty())
                    return reply(http::status::bad_request, json{{"error", "missing ts param"}});
                std::size_t limit = 0;
                auto lim = query_param(query, "limit");
                if (!lim.empty())
                {
                    try
                    {
                        limit = static_cast<std::size_t>(std::stoull(lim));
                    }
                    catch (const std::exception &)
                    {
                        return reply(http::status::bad_request, json{{"error", "bad limit param"}});
                    }
                }
                return reply(http::status::ok, state.recorder.since(ts, limit));
            }

            // GET /v1/cameras, GET|PUT /v1/cameras/{key}
            if (seg.size() >= 2 && seg[0] == "v1" && seg[1] == "cameras")
                return cameras(seg);

            // GET /evidence/{file}
            if (verb == http::verb::get && seg.size() == 2 && seg[0] == "evidence")
                return serve_evidence(seg[1]);

            // 404 fallback
            return reply(http::status::not_found, json{{"error", "not found"}});
        }

        void ingest_frame(const std::string &key)
        {
            using nlohmann::json;
            if (!valid_key(key))
                return reply(http::status::bad_request, json{{"error", "invalid source key"}});

            auto frame = std::make_shared<Frame>();
            frame->source_key = key;
            const std::string ctype(req[http::field::content_type]);
            if (ctype.rfind("image/", 0) == 0)
            {
                frame->image = std::move(req.body());
            }
            else
            {
                auto body = json::parse(req.body(), nullptr, false);
                if (!body.is_object() || !body.contains("image") || !body["image"].is_string())
                    return reply(http::status::bad_request, json{{"error", "expected {image, predictions}"}});
                auto bytes = base64_decode(body["image"].get<std::string>());
                if (!bytes)
                    return reply(http::status::bad_request, json{{"error", "image is not base64"}});
                frame->image = std::move(*bytes);
                try
                {
                    if (body.contains("predictions"))
                        for (const auto &p : body.at("predictions"))
                            frame->predictions.push_back(prediction_from_json(p));
                }
                catch (const json::exception &e)
                {
                    return reply(http::status::bad_request, json{{"error", "bad predictions"}, {"what", e.what()}});
                }
            }
            if (frame->image.empty())
                return reply(http::status::bad_request, json{{"error", "empty image"}});
            auto mime = image_mime(frame->image);
            frame->content_type = mime.empty() ? "image/jpeg" : mime;
            frame->seq = g_ingest_seq.fetch_add(1);

            auto viewers = state.push_frame(key, std::move(frame));
            return reply(http::status::accepted, json{{"status", "accepted"}, {"sourceKey", key}, {"subscribers", viewers}});
        }

        void ingest_alert(const std::string &identifier)
        {
            using nlohmann::json;
            if (!valid_key(identifier))
                return reply(http::status::bad_request, json{{"error", "invalid identifier"}});
            auto body = json::parse(req.body(), nullptr, false);
            if (!body.is_object())
                return reply(http::status::bad_request, json{{"error", "alert body must be a JSON object"}});
            auto report = state.raise_alert(identifier, body);
            return reply(http::status::accepted, json{{"status", "accepted"},
                                                      {"target", delivery_to_json(report.target)},
                                                      {"mirror", delivery_to_json(report.mirror)}});
        }

        void report_violation()
        {
            using nlohmann::json;
            auto body = json::parse(req.body(), nullptr, false);
            if (!body.is_object())
                return reply(http::status::bad_request, json{{"error", "bad json"}});
            const auto source_key = id_field(body, "source_key", "class_id");
            const auto identifier = id_field(body, "identifier", "teacher_id");
            if (!valid_key(source_key) || !valid_key(identifier))
                return reply(http::status::bad_request, json{{"error", "missing fields"}, {"required", {"source_key", "identifier", "detail", "evidence"}}});
            if (body.contains("detail") && !body["detail"].is_string())
                return reply(http::status::bad_request, json{{"error", "detail must be a string"}});
            const auto detail = body.value("detail", std::string());
            if (!body.contains("evidence") || !body["evidence"].is_string())
                return reply(http::status::bad_request, json{{"error", "missing evidence"}});
            auto image = base64_decode(body["evidence"].get<std::string>());
            if (!image || image->empty())
                return reply(http::status::bad_request, json{{"error", "evidence is not base64"}});

            AuditEvent ev;
            ev.source_key = source_key;
            ev.identifier = identifier;
            ev.detail = detail;
            try
            {
                ev.evidence_url = state.recorder.store_evidence(*image);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[http] evidence write failed: " << e.what() << "\n";
                return reply(http::status::internal_server_error, json{{"error", "failed to save image"}, {"what", e.what()}});
            }
            const bool recorded = state.recorder.record(ev);

            const std::string image_url = state.config.public_base_url + "/" + ev.evidence_url;
            auto report = state.raise_alert(identifier, json{
                                                            {"type", "violation"},
                                                            {"message", "Violation: " + detail},
                                                            {"detail", detail},
                                                            {"image_url", image_url},
                                                            {"timestamp", iso8601_ms(ev.t)},
                                                            {"sourceKey", source_key}});
            return reply(http::status::created, json{{"status", "success"},
                                                     {"image_url", ev.evidence_url},
                                                     {"recorded", recorded},
                                                     {"delivered", report.target.delivered + report.mirror.delivered}});
        }

        void cameras(const std::vector<std::string> &seg)
        {
            using nlohmann::json;
            const auto verb = req.method();
            if (seg.size() == 2 && verb == http::verb::get)
                return reply(http::status::ok, json(state.cameras.entries()));
            if (seg.size() != 3 || !valid_key(seg[2]))
                return reply(http::status::not_found, json{{"error", "not found"}});
            const auto &key = seg[2];
            if (verb == http::verb::get)
            {
                auto addr = state.cameras.address(key);
                if (!addr)
                    return reply(http::status::not_found, json{{"error", "unknown camera"}, {"sourceKey", key}});
                return reply(http::status::ok, json{{"sourceKey", key}, {"address", *addr}, {"url", state.cameras.to_url(*addr)}});
            }
            if (verb == http::verb::put)
            {
                auto body = json::parse(req.body(), nullptr, false);
                if (!body.is_object() || !body.contains("address") || !body["address"].is_string())
                    return reply(http::status::bad_request, json{{"error", "expected {address}"}});
                const auto address = body["address"].get<std::string>();
                if (!CameraDirectory::supported(address))
                    return reply(http::status::bad_request, json{{"error", "only http:// camera addresses are supported"}});
                state.cameras.set(key, address);
                std::cout << "[http] camera " << key << " -> " << address << "\n";
                return reply(http::status::ok, json{{"sourceKey", key}, {"address", address}, {"url", state.cameras.to_url(address)}});
            }
            return reply(http::status::method_not_allowed, json{{"error", "method not allowed"}});
        }

        void serve_evidence(const std::string &name)
        {
            using nlohmann::json;
            if (!valid_key(name) || name.find("..") != std::string::npos)
                return reply(http::status::not_found, json{{"error", "not found"}});
            std::string bytes;
            if (!read_file_all(state.recorder.root() / "evidence" / name, bytes))
                return reply(http::status::not_found, json{{"error", "not found"}});
            http::response<http::string_body> res{http::status::ok, req.version()};
            res.set(http::field::content_type, image_mime(bytes).empty() ? "application/octet-stream" : image_mime(bytes));
            res.body() = std::move(bytes);
            res.prepare_payload();
            return respond(std::move(res));
        }
    };
};
