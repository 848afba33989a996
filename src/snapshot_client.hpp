/*
 * File: src/snapshot_client.hpp
 * Project: Classwatch Relay
 * Purpose: Bounded-timeout HTTP GET of one camera snapshot
 * Notes:
 *  - One request object per fetch; it owns resolver, socket and buffers and
 *    is released as soon as the completion handler has run
 *  - The callback runs exactly once, also after cancel()
 * Last updated: 2026-10-16
 */

#pragma once
#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace http = boost::beast::http;

struct SnapshotResult
{
    bool transport_ok{false};
    unsigned status{0};
    std::string body;
    std::string content_type;
    std::string error;

    bool usable() const { return transport_ok && status >= 200 && status < 300 && !body.empty(); }
};

struct ParsedUrl
{
    std::string host;
    std::string port{"80"};
    std::string target{"/"};
};

// expects http://host[:port][/path]; returns false on anything else
inline bool parse_http_url(const std::string &url, ParsedUrl &out)
{
    const std::string scheme = "http://";
    if (url.rfind(scheme, 0) != 0)
        return false;
    auto rest = url.substr(scheme.size());
    auto slash = rest.find('/');
    std::string hp = (slash == std::string::npos) ? rest : rest.substr(0, slash);
    out.target = (slash == std::string::npos) ? "/" : rest.substr(slash);
    auto colon = hp.find(':');
    if (colon == std::string::npos)
    {
        out.host = hp;
        out.port = "80";
    }
    else
    {
        out.host = hp.substr(0, colon);
        out.port = hp.substr(colon + 1);
    }
    return !out.host.empty() && !out.port.empty();
}

class PendingFetch
{
public:
    virtual ~PendingFetch() = default;
    virtual void cancel() = 0;
};

class SnapshotFetcher
{
public:
    using Callback = std::function<void(SnapshotResult)>;
    virtual ~SnapshotFetcher() = default;
    // All handlers, including `done`, run on `ex`.
    virtual std::shared_ptr<PendingFetch> fetch(boost::asio::any_io_executor ex,
                                                const std::string &url,
                                                std::chrono::milliseconds timeout,
                                                Callback done) = 0;
};

class HttpSnapshotRequest : public PendingFetch, public std::enable_shared_from_this<HttpSnapshotRequest>
{
public:
    HttpSnapshotRequest(boost::asio::any_io_executor ex, std::size_t body_limit, SnapshotFetcher::Callback done)
        : resolver_(ex), stream_(ex), deadline_(ex), done_(std::move(done))
    {
        parser_.body_limit(body_limit);
    }

    void start(const ParsedUrl &url, std::chrono::milliseconds timeout)
    {
        req_.method(http::verb::get);
        req_.target(url.target);
        req_.version(11);
        req_.set(http::field::host, url.host);
        req_.set(http::field::user_agent, "classwatch-relay");
        req_.set(http::field::accept, "image/jpeg, image/*");

        auto self = shared_from_this();
        deadline_.expires_after(timeout);
        deadline_.async_wait([self](boost::system::error_code ec)
                             {
            if (!ec)
                self->abort("timeout"); });
        resolver_.async_resolve(url.host, url.port, [self](boost::system::error_code ec, boost::asio::ip::tcp::resolver::results_type results)
                                {
            if (ec || self->aborted())
                return self->finish_error(ec);
            self->stream_.async_connect(results, [self](boost::system::error_code ec, const boost::asio::ip::tcp::endpoint &)
                                        {
                if (ec || self->aborted())
                    return self->finish_error(ec);
                http::async_write(self->stream_, self->req_, [self](boost::system::error_code ec, std::size_t)
                                  {
                    if (ec || self->aborted())
                        return self->finish_error(ec);
                    http::async_read(self->stream_, self->buffer_, self->parser_, [self](boost::system::error_code ec, std::size_t)
                                     {
                        if (ec || self->aborted())
                            return self->finish_error(ec);
                        self->finish_ok(); }); }); }); });
    }

    void cancel() override { abort("cancelled"); }

private:
    bool aborted() const { return !reason_.empty(); }

    void abort(const char *why)
    {
        if (finished_)
            return;
        reason_ = why;
        resolver_.cancel();
        boost::system::error_code ignored;
        stream_.socket().close(ignored);
    }

    void finish_error(boost::system::error_code ec)
    {
        SnapshotResult r;
        r.error = reason_.empty() ? ec.message() : reason_;
        complete(std::move(r));
    }

    void finish_ok()
    {
        auto &res = parser_.get();
        SnapshotResult r;
        r.transport_ok = true;
        r.status = res.result_int();
        r.content_type = std::string(res[http::field::content_type]);
        r.body = std::move(res.body());
        boost::system::error_code ignored;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        complete(std::move(r));
    }

    void complete(SnapshotResult r)
    {
        if (finished_)
            return;
        finished_ = true;
        deadline_.cancel();
        boost::system::error_code ignored;
        stream_.socket().close(ignored);
        auto done = std::move(done_);
        done_ = nullptr;
        if (done)
            done(std::move(r));
    }

    boost::asio::ip::tcp::resolver resolver_;
    boost::beast::tcp_stream stream_;
    boost::asio::steady_timer deadline_;
    boost::beast::flat_buffer buffer_;
    http::request<http::empty_body> req_;
    http::response_parser<http::string_body> parser_;
    SnapshotFetcher::Callback done_;
    std::string reason_;
    bool finished_ = false;
};

class HttpSnapshotFetcher : public SnapshotFetcher
{
public:
    explicit HttpSnapshotFetcher(std::size_t body_limit = 4 * 1024 * 1024) : body_limit_(body_limit) {}

    std::shared_ptr<PendingFetch> fetch(boost::asio::any_io_executor ex,
                                        const std::string &url,
                                        std::chrono::milliseconds timeout,
                                        Callback done) override
    {
        ParsedUrl parsed;
        if (!parse_http_url(url, parsed))
        {
            SnapshotResult r;
            r.error = "unsupported url: " + url;
            boost::asio::post(ex, [done = std::move(done), r = std::move(r)]() mutable
                              { done(std::move(r)); });
            return nullptr;
        }
        auto req = std::make_shared<HttpSnapshotRequest>(ex, body_limit_, std::move(done));
        req->start(parsed, timeout);
        return req;
    }

private:
    const std::size_t body_limit_;
};
