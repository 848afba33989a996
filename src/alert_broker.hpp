/*
 * File: src/alert_broker.hpp
 * Project: Classwatch Relay
 * Purpose: Deliver one alert to every device of a target plus the mirror identity
 * Notes:
 *  - Target and mirror deliveries are independent; neither can fail the other
 *  - Best effort, at most once per connected device, no replay
 * Last updated: 2026-10-17
 */

#pragma once
#include <iostream>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "connection_registry.hpp"

struct DeliveryReport
{
    std::size_t attempted{0};
    std::size_t delivered{0}; // queued on a live connection, not yet written
    std::size_t pruned{0};
};

struct AlertReport
{
    DeliveryReport target;
    DeliveryReport mirror;
};

inline nlohmann::json delivery_to_json(const DeliveryReport &r)
{
    return nlohmann::json{{"attempted", r.attempted}, {"delivered", r.delivered}, {"pruned", r.pruned}};
}

class AlertBroker
{
public:
    AlertBroker(ConnectionRegistry &registry, std::string mirror_identifier)
        : registry_(registry), mirror_(std::move(mirror_identifier)) {}

    // Never throws. An offline recipient is a normal outcome.
    AlertReport send_alert(const std::string &target, const nlohmann::json &message) noexcept
    {
        AlertReport report;
        std::shared_ptr<const std::string> payload;
        try
        {
            payload = std::make_shared<const std::string>(message.dump());
        }
        catch (const std::exception &e)
        {
            std::cerr << "[alerts] cannot serialize alert for " << target << ": " << e.what() << "\n";
            return report;
        }

        report.target = deliver_to(target, payload);
        if (!mirror_.empty() && target != mirror_)
            report.mirror = deliver_to(mirror_, payload);
        return report;
    }

    const std::string &mirror_identifier() const { return mirror_; }

private:
    DeliveryReport deliver_to(const std::string &identifier,
                              const std::shared_ptr<const std::string> &payload) noexcept
    {
        DeliveryReport r;
        std::vector<AlertConnectionPtr> conns;
        try
        {
            conns = registry_.connections_for(identifier);
        }
        catch (const std::exception &e)
        {
            std::cerr << "[alerts] lookup failed for " << identifier << ": " << e.what() << "\n";
            return r;
        }
        if (conns.empty())
        {
            std::cout << "[alerts] " << identifier << " is offline; alert not delivered\n";
            return r;
        }

        for (const auto &conn : conns)
        {
            ++r.attempted;
            bool ok = false;
            try
            {
                ok = conn->deliver(payload);
            }
            catch (const std::exception &e)
            {
                std::cerr << "[alerts] send to " << identifier << " failed: " << e.what() << "\n";
            }
            if (ok)
            {
                ++r.delivered;
                continue;
            }
            if (registry_.remove(identifier, conn))
            {
                ++r.pruned;
                std::cerr << "[alerts] dropped dead connection " << conn->peer() << " for " << identifier << "\n";
            }
        }
        return r;
    }

    ConnectionRegistry &registry_;
    const std::string mirror_;
};
