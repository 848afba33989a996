/*
 * File: src/relay_ws.hpp
 * Project: Classwatch Relay
 * Purpose: WebSocket endpoints: /ws/stream/{sourceKey} and /ws/alerts/{identifier}
 * Notes:
 *  - Credential is checked on the upgrade request, before any subscribe/register
 *  - One strand per connection; writes are queued, one async_write in flight
 *  - Viewers pull the next frame only after the previous write finished, so
 *    the per-viewer channel is the only backlog
 * Last updated: 2026-10-17
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include <atomic>
#include <deque>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include "common/url.hpp"
#include "relay_state.hpp"

namespace beast = boost::beast;
namespace http = boost::beast::http;
namespace websocket = boost::beast::websocket;
using tcp = boost::asio::ip::tcp;

struct WsRoute
{
    enum Kind
    {
        none,
        stream,
        alerts
    } kind{none};
    std::string key; // source key or recipient identifier
    std::string token;
};

inline WsRoute parse_ws_target(const std::string &target)
{
    std::string path, query;
    split_target(target, path, query);
    auto seg = path_segments(path);
    WsRoute r;
    if (seg.size() == 3 && seg[0] == "ws")
    {
        if (seg[1] == "stream")
            r.kind = WsRoute::stream;
        else if (seg[1] == "alerts")
            r.kind = WsRoute::alerts;
        r.key = seg[2];
    }
    r.token = query_param(query, "token");
    return r;
}

inline std::string peer_of(const beast::tcp_stream &s)
{
    boost::system::error_code ec;
    auto ep = s.socket().remote_endpoint(ec);
    return ec ? std::string("unknown") : ep.address().to_string() + ":" + std::to_string(ep.port());
}

class WsSession : public std::enable_shared_from_this<WsSession>
{
public:
    WsSession(beast::tcp_stream &&stream, RelayState &state, std::string key)
        : ws_(std::move(stream)), state_(state), key_(std::move(key)), peer_(peer_of(ws_.next_layer())) {}

    virtual ~WsSession() = default;

    void run(http::request<http::string_body> req)
    {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.set_option(websocket::stream_base::decorator([](websocket::response_type &res)
                                                         { res.set(http::field::server, "classwatch-relay"); }));
        ws_.async_accept(req, [self = shared_from_this()](beast::error_code ec)
                         { self->on_accept(ec); });
    }

    bool is_open() const { return open_.load(); }
    const std::string &remote() const { return peer_; }

protected:
    virtual void on_open() = 0;
    virtual void on_closed() = 0;
    virtual void on_drained() {}
    virtual void on_sent() {}

    // Strand only.
    void queue(std::shared_ptr<const std::string> msg)
    {
        if (closed_)
            return;
        outbox_.push_back(std::move(msg));
        if (!writing_)
            do_write();
    }

    // Any thread.
    void post_queue(std::shared_ptr<const std::string> msg)
    {
        boost::asio::post(ws_.get_executor(), [self = shared_from_this(), msg = std::move(msg)]() mutable
                          { self->queue(std::move(msg)); });
    }

    void terminate(const std::string &why)
    {
        if (closed_)
            return;
        closed_ = true;
        open_ = false;
        std::cout << "[ws] " << describe() << " closed (" << why << ")\n";
        on_closed();
        outbox_.clear();
        boost::system::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
    }

    std::string describe() const { return "[" + kind() + " " + key_ + " " + peer_ + "]"; }
    virtual std::string kind() const = 0;

    websocket::stream<beast::tcp_stream> ws_;
    RelayState &state_;
    const std::string key_;
    const std::string peer_;
    bool writing_ = false;
    bool closed_ = false;

private:
    void on_accept(beast::error_code ec)
    {
        if (ec)
        {
            std::cerr << "[ws] accept failed for " << peer_ << ": " << ec.message() << "\n";
            return;
        }
        open_ = true;
        on_open();
        do_read();
    }

    void do_read()
    {
        ws_.async_read(buffer_, [self = shared_from_this()](beast::error_code ec, std::size_t)
                       {
            if (ec)
                return self->terminate(ec == websocket::error::closed ? "peer closed" : ec.message());
            // inbound traffic is liveness only
            self->buffer_.consume(self->buffer_.size());
            self->do_read(); });
    }

    void do_write()
    {
        writing_ = true;
        ws_.text(true);
        ws_.async_write(boost::asio::buffer(*outbox_.front()), [self = shared_from_this()](beast::error_code ec, std::size_t)
                        {
            if (ec)
                return self->terminate("write failed: " + ec.message());
            if (self->closed_)
                return;
            self->outbox_.pop_front();
            self->on_sent();
            if (!self->outbox_.empty())
                return self->do_write();
            self->writing_ = false;
            self->on_drained(); });
    }

    beast::flat_buffer buffer_;
    std::deque<std::shared_ptr<const std::string>> outbox_;
    std::atomic<bool> open_{false};
};

class ViewerSession : public WsSession
{
public:
    using WsSession::WsSession;

protected:
    std::string kind() const override { return "viewer"; }

    void on_open() override
    {
        relay_ = state_.relays.get_or_create(key_);
        channel_ = relay_->subscribe(ws_.get_executor());
        state_.pullers.ensure_running(key_);
        std::cout << "[ws] " << describe() << " subscribed (" << relay_->subscriber_count() << " viewers)\n";
        if (auto last = relay_->last_frame())
            queue(std::make_shared<const std::string>(frame_to_json(*last).dump()));
        pump();
    }

    void on_closed() override
    {
        if (relay_ && channel_)
        {
            relay_->unsubscribe(channel_);
            channel_->close();
        }
    }

    void on_drained() override { pump(); }

private:
    void pump()
    {
        if (closed_ || waiting_ || writing_)
            return;
        waiting_ = true;
        auto self = std::static_pointer_cast<ViewerSession>(shared_from_this());
        channel_->async_receive(state_.config.keepalive_interval, [self](ReceiveStatus st, FramePtr frame)
                                {
            self->waiting_ = false;
            if (self->closed_ || st == ReceiveStatus::closed)
                return;
            if (st == ReceiveStatus::item && frame)
                self->queue(std::make_shared<const std::string>(frame_to_json(*frame).dump()));
            else
                self->queue(std::make_shared<const std::string>(keepalive_to_json(self->key_).dump())); });
    }

    RelayPtr relay_;
    FrameChannelPtr channel_;
    bool waiting_ = false;
};

// A device that stops reading is dropped once max_pending_alerts are queued
// and unwritten; the broker then prunes it like any dead connection.
class AlertSession : public WsSession, public AlertConnection
{
public:
    using WsSession::WsSession;

    static constexpr std::size_t max_pending_alerts = 64;

    // Any thread.
    bool deliver(const std::shared_ptr<const std::string> &payload) override
    {
        if (!is_open())
            return false;
        if (pending_.fetch_add(1) >= max_pending_alerts)
        {
            pending_.fetch_sub(1);
            auto self = std::static_pointer_cast<AlertSession>(shared_from_this());
            boost::asio::post(ws_.get_executor(), [self]
                              { self->terminate("alert backlog full"); });
            return false;
        }
        post_queue(payload);
        return true;
    }

    std::string peer() const override { return remote(); }

protected:
    std::string kind() const override { return "alerts"; }

    void on_open() override
    {
        state_.connections.add(key_, self_connection());
        std::cout << "[ws] " << describe() << " registered for live alerts\n";
    }

    void on_closed() override { state_.connections.remove(key_, self_connection()); }

    void on_sent() override { pending_.fetch_sub(1); }

private:
    AlertConnectionPtr self_connection()
    {
        return std::static_pointer_cast<AlertSession>(shared_from_this());
    }

    std::atomic<std::size_t> pending_{0};
};

// Accept-then-close leniency for bad credentials (reject_policy "close").
class PolicyCloser : public std::enable_shared_from_this<PolicyCloser>
{
public:
    explicit PolicyCloser(beast::tcp_stream &&stream) : ws_(std::move(stream)) {}

    void run(http::request<http::string_body> req)
    {
        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.async_accept(req, [self = shared_from_this()](beast::error_code ec)
                         {
            if (ec)
                return;
            self->ws_.async_close(websocket::close_reason(websocket::close_code::policy_error, "invalid credential"),
                                  [self](beast::error_code) {}); });
    }

private:
    websocket::stream<beast::tcp_stream> ws_;
};

// Reads the upgrade request, authenticates, then hands the stream to a session.
class WsHandshake : public std::enable_shared_from_this<WsHandshake>
{
public:
    WsHandshake(tcp::socket &&socket, RelayState &state)
        : stream_(std::move(socket)), state_(state) {}

    void run()
    {
        stream_.expires_after(std::chrono::seconds(30));
        http::async_read(stream_, buffer_, req_, [self = shared_from_this()](beast::error_code ec, std::size_t)
                         {
            if (!ec)
                self->on_request(); });
    }

private:
    void on_request()
    {
        const std::string target(req_.target());
        const std::string peer = peer_of(stream_);
        if (!websocket::is_upgrade(req_))
            return respond(http::status::bad_request, "websocket upgrade required");

        auto route = parse_ws_target(target);
        if (route.kind == WsRoute::none || !valid_key(route.key))
            return respond(http::status::not_found, "unknown websocket endpoint");

        auto identity = state_.auth->identify(route.token);
        bool allowed = identity.has_value();
        if (allowed && route.kind == WsRoute::alerts)
            allowed = *identity == route.key || *identity == state_.config.mirror_identifier;
        if (!allowed)
        {
            std::cerr << "[ws] rejected " << route.key << " from " << peer
                      << (identity ? " (identity mismatch)" : " (invalid credential)")
                      << " policy=" << to_string(state_.config.reject_policy) << "\n";
            if (state_.config.reject_policy == RejectPolicy::refuse)
                return respond(http::status::unauthorized, "invalid credential");
            stream_.expires_never();
            return std::make_shared<PolicyCloser>(std::move(stream_))->run(std::move(req_));
        }

        stream_.expires_never();
        if (route.kind == WsRoute::stream)
            std::make_shared<ViewerSession>(std::move(stream_), state_, route.key)->run(std::move(req_));
        else
            std::make_shared<AlertSession>(std::move(stream_), state_, route.key)->run(std::move(req_));
    }

    void respond(http::status status, const std::string &why)
    {
        auto res = std::make_shared<http::response<http::string_body>>(status, req_.version());
        res->set(http::field::server, "classwatch-relay");
        res->set(http::field::content_type, "application/json");
        res->keep_alive(false);
        res->body() = nlohmann::json{{"error", why}}.dump();
        res->prepare_payload();
        http::async_write(stream_, *res, [self = shared_from_this(), res](beast::error_code, std::size_t)
                          {
            boost::system::error_code ignored;
            self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored); });
    }

    beast::tcp_stream stream_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
    RelayState &state_;
};

class WsServer
{
    boost::asio::io_context &ioc_;
    tcp::acceptor acceptor_;
    RelayState &state_;

public:
    // Throws std::runtime_error when the endpoint cannot be bound.
    WsServer(boost::asio::io_context &ioc, tcp::endpoint ep, RelayState &s)
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
            throw std::runtime_error("ws listen failed: " + ec.message());
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
        acceptor_.async_accept(boost::asio::make_strand(ioc_), [this](boost::system::error_code ec, tcp::socket socket)
                               {
            if (ec == boost::asio::error::operation_aborted)
                return;
            if (!ec)
                std::make_shared<WsHandshake>(std::move(socket), state_)->run();
            do_accept(); });
    }
};
