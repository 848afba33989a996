/*
 * File: src/relay.hpp
 * Project: Classwatch Relay
 * Purpose: Per-source frame fan-out and the source -> relay registry
 * Notes:
 *  - broadcast() never blocks and never fails on subscriber state
 *  - last frame is kept for late joiners, even with zero subscribers
 * Last updated: 2026-10-16
 */

#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <boost/asio.hpp>
#include "common/bounded_channel.hpp"
#include "common/frame.hpp"

using FrameChannel = BoundedChannel<FramePtr>;
using FrameChannelPtr = std::shared_ptr<FrameChannel>;

struct RelayStats
{
    std::size_t subscribers{0};
    bool has_last{false};
    uint64_t broadcasts{0};
    uint64_t drops{0};
};

class Relay
{
public:
    Relay(std::string source_key, std::size_t channel_capacity)
        : source_key_(std::move(source_key)), channel_capacity_(channel_capacity) {}

    Relay(const Relay &) = delete;
    Relay &operator=(const Relay &) = delete;

    // The channel's receive handlers run on `ex` (the subscriber's strand).
    FrameChannelPtr subscribe(boost::asio::any_io_executor ex)
    {
        auto ch = std::make_shared<FrameChannel>(ex, channel_capacity_);
        std::scoped_lock lk(m_);
        subscribers_.push_back(ch);
        return ch;
    }

    void unsubscribe(const FrameChannelPtr &ch)
    {
        std::scoped_lock lk(m_);
        for (auto it = subscribers_.begin(); it != subscribers_.end(); ++it)
        {
            if (*it == ch)
            {
                subscribers_.erase(it);
                return;
            }
        }
    }

    void broadcast(FramePtr frame)
    {
        std::vector<FrameChannelPtr> targets;
        {
            std::scoped_lock lk(m_);
            last_ = frame;
            ++broadcasts_;
            targets = subscribers_;
        }
        uint64_t missed = 0;
        for (auto &ch : targets)
        {
            if (!ch->try_send(frame))
                ++missed;
        }
        drops_ += missed;
    }

    FramePtr last_frame() const
    {
        std::scoped_lock lk(m_);
        return last_;
    }

    std::size_t subscriber_count() const
    {
        std::scoped_lock lk(m_);
        return subscribers_.size();
    }

    RelayStats stats() const
    {
        std::scoped_lock lk(m_);
        return RelayStats{subscribers_.size(), last_ != nullptr, broadcasts_, drops_.load()};
    }

    const std::string &source_key() const { return source_key_; }

private:
    const std::string source_key_;
    const std::size_t channel_capacity_;
    mutable std::mutex m_;
    FramePtr last_;
    std::vector<FrameChannelPtr> subscribers_;
    uint64_t broadcasts_{0};
    std::atomic<uint64_t> drops_{0};
};

using RelayPtr = std::shared_ptr<Relay>;

// Entries live for the process lifetime; the number of sources is bounded
// by the number of physical cameras.
class RelayRegistry
{
public:
    explicit RelayRegistry(std::size_t channel_capacity = 4)
        : channel_capacity_(channel_capacity) {}

    RelayPtr get_or_create(const std::string &source_key)
    {
        std::scoped_lock lk(m_);
        auto &slot = relays_[source_key];
        if (!slot)
            slot = std::make_shared<Relay>(source_key, channel_capacity_);
        return slot;
    }

    RelayPtr find(const std::string &source_key) const
    {
        std::scoped_lock lk(m_);
        auto it = relays_.find(source_key);
        return it == relays_.end() ? nullptr : it->second;
    }

    std::vector<RelayPtr> all() const
    {
        std::scoped_lock lk(m_);
        std::vector<RelayPtr> out;
        out.reserve(relays_.size());
        for (const auto &[key, relay] : relays_)
            out.push_back(relay);
        return out;
    }

private:
    const std::size_t channel_capacity_;
    mutable std::mutex m_;
    std::unordered_map<std::string, RelayPtr> relays_;
};
