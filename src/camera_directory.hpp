/*
 * File: src/camera_directory.hpp
 * Project: Classwatch Relay
 * Purpose: Resolve a source key to its camera snapshot URL
 * Notes:
 *  - Backing file: {"room-7": "192.168.1.101", "lab": "http://10.0.0.5:81/jpg"}
 *  - The file is re-read when its mtime changes; set() persists atomically
 * Last updated: 2026-10-17
 */

#pragma once
#include <filesystem>
#include <iostream>
#include <map>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "common/file_io.hpp"

class CameraDirectory
{
public:
    CameraDirectory(std::string path, std::string snapshot_path = "/capture")
        : path_(std::move(path)), snapshot_path_(std::move(snapshot_path)) {}

    // Snapshot URL for source_key, or nullopt when unknown.
    std::optional<std::string> resolve(const std::string &source_key)
    {
        std::scoped_lock lk(m_);
        reload_locked();
        auto it = entries_.find(source_key);
        if (it == entries_.end() || it->second.empty())
            return std::nullopt;
        return to_url(it->second);
    }

    std::optional<std::string> address(const std::string &source_key)
    {
        std::scoped_lock lk(m_);
        reload_locked();
        auto it = entries_.find(source_key);
        if (it == entries_.end())
            return std::nullopt;
        return it->second;
    }

    // Bare host[:port] or an http:// URL. Other schemes (https included) are
    // not fetchable by the snapshot client.
    static bool supported(const std::string &address)
    {
        return address.find("://") == std::string::npos || address.rfind("http://", 0) == 0;
    }

    // Throws std::invalid_argument for an unsupported address and
    // std::runtime_error when the directory file cannot be written.
    void set(const std::string &source_key, const std::string &address)
    {
        if (!supported(address))
            throw std::invalid_argument("unsupported camera address: " + address);
        std::scoped_lock lk(m_);
        reload_locked();
        entries_[source_key] = address;
        if (path_.empty())
            return;
        auto parent = fs::path(path_).parent_path();
        if (!parent.empty())
            ensure_dir(parent);
        write_atomic(path_, nlohmann::json(entries_).dump(2));
        std::error_code ec;
        mtime_ = fs::last_write_time(path_, ec);
    }

    std::map<std::string, std::string> entries()
    {
        std::scoped_lock lk(m_);
        reload_locked();
        return entries_;
    }

    std::string to_url(const std::string &address) const
    {
        if (address.rfind("http://", 0) == 0)
            return address;
        return "http://" + address + snapshot_path_;
    }

private:
    void reload_locked()
    {
        if (path_.empty())
            return;
        std::error_code ec;
        auto mtime = fs::last_write_time(path_, ec);
        if (ec || (loaded_ && mtime == mtime_))
            return;
        std::string text;
        if (!read_file_all(path_, text))
            return;
        auto j = nlohmann::json::parse(text, nullptr, false);
        if (!j.is_object())
        {
            std::cerr << "[cameras] ignoring malformed " << path_ << "\n";
            mtime_ = mtime;
            loaded_ = true;
            return;
        }
        std::map<std::string, std::string> next;
        for (auto it = j.begin(); it != j.end(); ++it)
        {
            std::string addr;
            if (it.value().is_string())
                addr = it.value().get<std::string>();
            else if (it.value().is_object() && it.value().contains("ip") && it.value()["ip"].is_string())
                addr = it.value()["ip"].get<std::string>();
            else
                continue;
            if (!supported(addr))
            {
                std::cerr << "[cameras] skipping " << it.key() << ": unsupported address " << addr << "\n";
                continue;
            }
            next[it.key()] = std::move(addr);
        }
        entries_ = std::move(next);
        mtime_ = mtime;
        loaded_ = true;
    }

    const std::string path_;
    const std::string snapshot_path_;
    std::mutex m_;
    std::map<std::string, std::string> entries_;
    fs::file_time_type mtime_{};
    bool loaded_ = false;
};
