/*
 * File: src/connection_registry.hpp
 * Project: Classwatch Relay
 * Purpose: identifier -> live alert connections (many devices per identifier)
 * Notes:
 *  - Callers register only after the WebSocket accept completed
 *  - connections_for() returns a copy; iteration is safe against concurrent remove()
 * Last updated: 2026-10-16
 */

#pragma once
#include <algorithm>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

// One outbound alert socket. deliver() queues the payload and returns
// false once the connection is known to be dead.
class AlertConnection
{
public:
    virtual ~AlertConnection() = default;
    virtual bool deliver(const std::shared_ptr<const std::string> &payload) = 0;
    virtual std::string peer() const = 0;
};

using AlertConnectionPtr = std::shared_ptr<AlertConnection>;

class ConnectionRegistry
{
public:
    void add(const std::string &identifier, AlertConnectionPtr conn)
    {
        std::scoped_lock lk(m_);
        by_id_[identifier].push_back(std::move(conn));
    }

    // Returns false when the connection was not registered under identifier.
    bool remove(const std::string &identifier, const AlertConnectionPtr &conn)
    {
        std::scoped_lock lk(m_);
        auto it = by_id_.find(identifier);
        if (it == by_id_.end())
            return false;
        auto &conns = it->second;
        auto pos = std::find(conns.begin(), conns.end(), conn);
        if (pos == conns.end())
            return false;
        conns.erase(pos);
        if (conns.empty())
            by_id_.erase(it);
        return true;
    }

    std::vector<AlertConnectionPtr> connections_for(const std::string &identifier) const
    {
        std::scoped_lock lk(m_);
        auto it = by_id_.find(identifier);
        if (it == by_id_.end())
            return {};
        return it->second;
    }

    bool contains(const std::string &identifier) const
    {
        std::scoped_lock lk(m_);
        return by_id_.count(identifier) != 0;
    }

    std::map<std::string, std::size_t> counts() const
    {
        std::scoped_lock lk(m_);
        std::map<std::string, std::size_t> out;
        for (const auto &[id, conns] : by_id_)
            out[id] = conns.size();
        return out;
    }

private:
    mutable std::mutex m_;
    std::unordered_map<std::string, std::vector<AlertConnectionPtr>> by_id_;
};
