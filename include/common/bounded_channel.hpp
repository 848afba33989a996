/*
 * File: include/common/bounded_channel.hpp
 * Project: Classwatch Relay
 * Purpose: Fixed-capacity per-subscriber queue
 * Notes:
 *  - try_send drops the NEW item when the ring is full
 *  - async_receive completes with item, timeout or closed; handlers are
 *    always posted to the channel executor, never run inline
 * Last updated: 2026-10-16
 */

#pragma once
#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

enum class ReceiveStatus
{
    item,
    timeout,
    closed
};

template <typename T>
class BoundedChannel : public std::enable_shared_from_this<BoundedChannel<T>>
{
public:
    using Handler = std::function<void(ReceiveStatus, T)>;

    BoundedChannel(boost::asio::any_io_executor ex, std::size_t capacity)
        : ex_(ex), timer_(ex), slots_(capacity == 0 ? 1 : capacity) {}

    BoundedChannel(const BoundedChannel &) = delete;
    BoundedChannel &operator=(const BoundedChannel &) = delete;

    // Returns false when the item was dropped (ring full or channel closed).
    bool try_send(T item)
    {
        Handler waiter;
        {
            std::scoped_lock lk(m_);
            if (closed_)
                return false;
            if (!waiter_)
            {
                if (count_ == slots_.size())
                {
                    ++dropped_;
                    return false;
                }
                slots_[(head_ + count_) % slots_.size()] = std::move(item);
                ++count_;
                return true;
            }
            waiter = std::move(waiter_);
            waiter_ = nullptr;
            ++waiter_gen_;
        }
        // A receiver is parked: hand the item over directly.
        auto self = this->shared_from_this();
        boost::asio::post(ex_, [self, waiter = std::move(waiter), item = std::move(item)]() mutable
                          {
            self->timer_.cancel();
            waiter(ReceiveStatus::item, std::move(item)); });
        return true;
    }

    std::optional<T> try_receive()
    {
        std::scoped_lock lk(m_);
        if (count_ == 0)
            return std::nullopt;
        return pop_locked();
    }

    // At most one outstanding receive per channel.
    void async_receive(std::chrono::steady_clock::duration timeout, Handler handler)
    {
        std::uint64_t gen = 0;
        {
            std::scoped_lock lk(m_);
            if (count_ > 0)
            {
                boost::asio::post(ex_, [handler = std::move(handler), item = pop_locked()]() mutable
                                  { handler(ReceiveStatus::item, std::move(item)); });
                return;
            }
            if (closed_)
            {
                boost::asio::post(ex_, [handler = std::move(handler)]()
                                  { handler(ReceiveStatus::closed, T{}); });
                return;
            }
            waiter_ = std::move(handler);
            gen = ++waiter_gen_;
        }
        timer_.expires_after(timeout);
        timer_.async_wait([self = this->shared_from_this(), gen](boost::system::error_code ec)
                          {
            if (ec == boost::asio::error::operation_aborted)
                return;
            self->expire(gen); });
    }

    void close()
    {
        Handler waiter;
        {
            std::scoped_lock lk(m_);
            if (closed_)
                return;
            closed_ = true;
            for (auto &s : slots_)
                s.reset();
            count_ = 0;
            waiter = std::move(waiter_);
            waiter_ = nullptr;
            ++waiter_gen_;
        }
        auto self = this->shared_from_this();
        boost::asio::post(ex_, [self, waiter = std::move(waiter)]()
                          {
            self->timer_.cancel();
            if (waiter)
                waiter(ReceiveStatus::closed, T{}); });
    }

    std::size_t size() const
    {
        std::scoped_lock lk(m_);
        return count_;
    }
    std::size_t capacity() const { return slots_.size(); }
    std::uint64_t dropped() const
    {
        std::scoped_lock lk(m_);
        return dropped_;
    }
    bool closed() const
    {
        std::scoped_lock lk(m_);
        return closed_;
    }

private:
    T pop_locked()
    {
        T item = std::move(*slots_[head_]);
        slots_[head_].reset();
        head_ = (head_ + 1) % slots_.size();
        --count_;
        return item;
    }

    void expire(std::uint64_t gen)
    {
        Handler waiter;
        {
            std::scoped_lock lk(m_);
            if (!waiter_ || gen != waiter_gen_)
                return;
            waiter = std::move(waiter_);
            waiter_ = nullptr;
            ++waiter_gen_;
        }
        waiter(ReceiveStatus::timeout, T{});
    }

    boost::asio::any_io_executor ex_;
    boost::asio::steady_timer timer_;
    mutable std::mutex m_;
    std::vector<std::optional<T>> slots_; // ring arena
    std::size_t head_ = 0;
    std::size_t count_ = 0;
    std::uint64_t dropped_ = 0;
    bool closed_ = false;
    Handler waiter_;
    std::uint64_t waiter_gen_ = 0;
};
