/*
 * File: src/puller.hpp
 * Project: Classwatch Relay
 * Purpose: Per-source camera polling task and its supervisor
 * Notes:
 *  - No device request is issued while the relay has zero subscribers
 *  - The loop only ends on stop(); every failure becomes a backoff
 *  - Supervisor liveness check restarts stalled or stopped pullers that
 *    still have viewers
 * Last updated: 2026-10-17
 */

#pragma once
#include <algorithm>
#include <atomic>
#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio.hpp>
#include "common/frame.hpp"
#include "camera_directory.hpp"
#include "relay.hpp"
#include "snapshot_client.hpp"

struct PullerTiming
{
    std::chrono::milliseconds idle_interval{2000};
    std::chrono::milliseconds frame_interval{500};
    std::chrono::milliseconds failure_backoff{1500};
    std::chrono::milliseconds fetch_timeout{3000};

    // Longest legitimate gap between two loop iterations.
    std::chrono::milliseconds max_gap() const
    {
        return std::max({idle_interval, frame_interval, failure_backoff}) + fetch_timeout;
    }
};

// Optional detection hook: image bytes -> boxes. May throw.
using Detector = std::function<std::vector<Prediction>(const std::string &image)>;

class Puller : public std::enable_shared_from_this<Puller>
{
public:
    enum class State
    {
        idle, // created, not started
        running,
        stopped
    };

    Puller(boost::asio::io_context &ioc, std::string source_key, RelayPtr relay,
           CameraDirectory &cameras, SnapshotFetcher &fetcher, PullerTiming timing,
           Detector detector = nullptr)
        : strand_(boost::asio::make_strand(ioc)), timer_(strand_),
          key_(std::move(source_key)), relay_(std::move(relay)), cameras_(cameras),
          fetcher_(fetcher), timing_(timing), detector_(std::move(detector)) {}

    void start()
    {
        State expected = State::idle;
        if (!state_.compare_exchange_strong(expected, State::running))
            return;
        touch();
        std::cout << "[puller " << key_ << "] started\n";
        boost::asio::dispatch(strand_, [self = shared_from_this()]
                              { self->tick(); });
    }

    // Safe from any thread. The in-flight fetch (if any) is cancelled and
    // its socket closed on the puller strand.
    void stop()
    {
        if (state_.exchange(State::stopped) == State::stopped)
            return;
        boost::asio::dispatch(strand_, [self = shared_from_this()]
                              {
            self->timer_.cancel();
            if (self->inflight_)
            {
                self->inflight_->cancel();
                self->inflight_.reset();
            }
            std::cout << "[puller " << self->key_ << "] stopped\n"; });
    }

    State state() const { return state_.load(); }
    bool running() const { return state_.load() == State::running; }
    const std::string &source_key() const { return key_; }
    uint64_t polls() const { return polls_.load(); }
    uint64_t frames() const { return frames_.load(); }
    // Attempts since the last frame; 0 while healthy.
    uint64_t failures() const { return failures_.load(); }

    bool stalled(std::chrono::steady_clock::time_point now) const
    {
        auto last = std::chrono::steady_clock::time_point(
            std::chrono::steady_clock::duration(last_progress_.load()));
        return now - last > 3 * timing_.max_gap();
    }

private:
    void touch()
    {
        last_progress_ = std::chrono::steady_clock::now().time_since_epoch().count();
    }

    void schedule(std::chrono::milliseconds delay)
    {
        if (!running())
            return;
        timer_.expires_after(delay);
        timer_.async_wait([self = shared_from_this()](boost::system::error_code ec)
                          {
            if (ec == boost::asio::error::operation_aborted || !self->running())
                return;
            self->tick(); });
    }

    // Logs a failure only when it differs from the previous one, so a camera
    // that stays down costs one line instead of one per backoff.
    void failed(const std::string &what)
    {
        ++failures_;
        if (what != last_failure_)
        {
            std::cerr << "[puller " << key_ << "] " << what << "; retrying every "
                      << timing_.failure_backoff.count() << "ms\n";
            last_failure_ = what;
        }
        schedule(timing_.failure_backoff);
    }

    void recovered()
    {
        if (last_failure_.empty())
            return;
        std::cout << "[puller " << key_ << "] recovered after " << failures_.load() << " failed attempts\n";
        last_failure_.clear();
        failures_ = 0;
    }

    void tick()
    {
        if (!running())
            return;
        touch();
        try
        {
            if (relay_->subscriber_count() == 0)
                return schedule(timing_.idle_interval);

            auto url = cameras_.resolve(key_);
            if (!url)
                return failed("no camera address");

            ++polls_;
            std::weak_ptr<Puller> weak = shared_from_this();
            inflight_ = fetcher_.fetch(strand_, *url, timing_.fetch_timeout, [weak](SnapshotResult r)
                                       {
                if (auto self = weak.lock())
                    self->on_snapshot(std::move(r)); });
        }
        catch (const std::exception &e)
        {
            std::cerr << "[puller " << key_ << "] iteration failed: " << e.what() << "\n";
            inflight_.reset();
            schedule(timing_.failure_backoff);
        }
    }

    void on_snapshot(SnapshotResult r)
    {
        inflight_.reset();
        if (!running())
            return;
        touch();
        try
        {
            if (!r.usable())
            {
                if (!r.transport_ok)
                    return failed("fetch failed: " + r.error);
                return failed("camera answered " + std::to_string(r.status));
            }
            auto mime = image_mime(r.body);
            if (mime.empty())
                return failed("response is not an image");
            recovered();

            auto frame = std::make_shared<Frame>();
            frame->source_key = key_;
            frame->content_type = mime;
            frame->image = std::move(r.body);
            frame->seq = ++frames_;
            if (detector_)
            {
                try
                {
                    frame->predictions = detector_(frame->image);
                }
                catch (const std::exception &e)
                {
                    std::cerr << "[puller " << key_ << "] detector failed: " << e.what() << "\n";
                }
            }
            relay_->broadcast(std::move(frame));
            schedule(timing_.frame_interval);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[puller " << key_ << "] frame handling failed: " << e.what() << "\n";
            schedule(timing_.failure_backoff);
        }
    }

    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::steady_timer timer_;
    const std::string key_;
    RelayPtr relay_;
    CameraDirectory &cameras_;
    SnapshotFetcher &fetcher_;
    const PullerTiming timing_;
    Detector detector_;
    std::shared_ptr<PendingFetch> inflight_;
    std::atomic<State> state_{State::idle};
    std::atomic<std::chrono::steady_clock::rep> last_progress_{0};
    std::atomic<uint64_t> polls_{0};
    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> failures_{0};
    std::string last_failure_; // strand only
};

using PullerPtr = std::shared_ptr<Puller>;

class PullerSupervisor
{
public:
    PullerSupervisor(boost::asio::io_context &ioc, RelayRegistry &relays, CameraDirectory &cameras,
                     SnapshotFetcher &fetcher, PullerTiming timing, Detector detector = nullptr)
        : ioc_(ioc), watchdog_(ioc), relays_(relays), cameras_(cameras), fetcher_(fetcher),
          timing_(timing), detector_(std::move(detector)) {}

    // Cheap and reentrant; returns true when a new puller was started.
    bool ensure_running(const std::string &source_key)
    {
        PullerPtr fresh;
        {
            std::scoped_lock lk(m_);
            if (shutting_down_)
                return false;
            auto &slot = pullers_[source_key];
            if (slot && slot->running() && !slot->stalled(std::chrono::steady_clock::now()))
                return false;
            if (slot)
            {
                std::cerr << "[supervisor] replacing dead puller for " << source_key << "\n";
                slot->stop();
            }
            fresh = std::make_shared<Puller>(ioc_, source_key, relays_.get_or_create(source_key),
                                             cameras_, fetcher_, timing_, detector_);
            slot = fresh;
        }
        fresh->start();
        return true;
    }

    // Periodic liveness check for relays that still have viewers.
    void start_watchdog(std::chrono::milliseconds interval)
    {
        watchdog_interval_ = interval;
        arm_watchdog();
    }

    void stop_all()
    {
        std::vector<PullerPtr> all;
        {
            std::scoped_lock lk(m_);
            shutting_down_ = true;
            for (auto &[key, p] : pullers_)
                if (p)
                    all.push_back(p);
        }
        watchdog_.cancel();
        for (auto &p : all)
            p->stop();
    }

    std::size_t running_count() const
    {
        std::scoped_lock lk(m_);
        std::size_t n = 0;
        for (const auto &[key, p] : pullers_)
            if (p && p->running())
                ++n;
        return n;
    }

    PullerPtr find(const std::string &source_key) const
    {
        std::scoped_lock lk(m_);
        auto it = pullers_.find(source_key);
        return it == pullers_.end() ? nullptr : it->second;
    }

    std::size_t check_liveness()
    {
        std::size_t restarted = 0;
        for (auto &relay : relays_.all())
        {
            if (relay->subscriber_count() > 0 && ensure_running(relay->source_key()))
                ++restarted;
        }
        return restarted;
    }

private:
    void arm_watchdog()
    {
        watchdog_.expires_after(watchdog_interval_);
        watchdog_.async_wait([this](boost::system::error_code ec)
                             {
            if (ec)
                return;
            {
                std::scoped_lock lk(m_);
                if (shutting_down_)
                    return;
            }
            check_liveness();
            arm_watchdog(); });
    }

    boost::asio::io_context &ioc_;
    boost::asio::steady_timer watchdog_;
    std::chrono::milliseconds watchdog_interval_{5000};
    RelayRegistry &relays_;
    CameraDirectory &cameras_;
    SnapshotFetcher &fetcher_;
    const PullerTiming timing_;
    Detector detector_;
    mutable std::mutex m_;
    std::unordered_map<std::string, PullerPtr> pullers_;
    bool shutting_down_ = false;
};
