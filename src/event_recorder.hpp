/*
 * File: src/event_recorder.hpp
 * Project: Classwatch Relay
 * Purpose: Durable audit trail of alert events and their evidence images
 * Notes:
 *  - <data_dir>/audit/index.jsonl (append) + latest.json (atomic)
 *  - <data_dir>/evidence/violation_<ts>_<seq>.jpg (atomic)
 *  - record() is fire-and-forget: failures are logged, never thrown
 * Last updated: 2026-10-17
 */

#pragma once
#include <atomic>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <nlohmann/json.hpp>
#include "common/file_io.hpp"

struct AuditEvent
{
    std::string source_key;
    std::string identifier;
    std::string detail;
    std::string evidence_url; // relative, e.g. evidence/violation_...jpg
    std::chrono::system_clock::time_point t{std::chrono::system_clock::now()};
};

class EventRecorder
{
public:
    explicit EventRecorder(std::string data_dir) : root_(std::move(data_dir)) {}

    bool record(const AuditEvent &ev) noexcept
    {
        try
        {
            nlohmann::json entry = {
                {"seq", seq_.fetch_add(1)},
                {"ts", iso8601_ms(ev.t)},
                {"source_key", ev.source_key},
                {"identifier", ev.identifier},
                {"detail", ev.detail},
                {"evidence_url", ev.evidence_url}};
            const std::string line = entry.dump();

            std::scoped_lock lk(m_);
            fs::path dir = root_ / "audit";
            ensure_dir(dir);
            append_line(dir / "index.jsonl", line);
            write_atomic(dir / "latest.json", line);
            return true;
        }
        catch (const std::exception &e)
        {
            std::cerr << "[audit] record failed: " << e.what() << "\n";
            return false;
        }
    }

    // Returns the path relative to data_dir. Throws std::runtime_error on I/O failure.
    std::string store_evidence(const std::string &image)
    {
        fs::path dir = root_ / "evidence";
        ensure_dir(dir);
        std::string ts = iso8601_now_ms();
        for (auto &c : ts)
            if (c == ':' || c == '.')
                c = '-';
        std::ostringstream name;
        name << "violation_" << ts << '_' << evidence_seq_.fetch_add(1) << ".jpg";
        write_atomic(dir / name.str(), image);
        return "evidence/" + name.str();
    }

    std::optional<nlohmann::json> latest() const
    {
        std::string s;
        if (!read_file_all(root_ / "audit" / "latest.json", s) || s.empty())
            return std::nullopt;
        auto j = nlohmann::json::parse(s, nullptr, false);
        if (j.is_discarded())
            return std::nullopt;
        return j;
    }

    // Entries with ts strictly greater than `ts` (RFC3339 strings compare in time order).
    nlohmann::json since(const std::string &ts, std::size_t limit) const
    {
        nlohmann::json out = nlohmann::json::array();
        std::ifstream f(root_ / "audit" / "index.jsonl");
        if (!f)
            return out;
        std::string line;
        while (std::getline(f, line))
        {
            if (line.empty())
                continue;
            nlohmann::json j = nlohmann::json::parse(line, nullptr, false);
            if (!j.is_object() || !j.contains("ts") || !j["ts"].is_string())
                continue;
            if (j["ts"].get<std::string>() > ts)
            {
                out.push_back(j);
                if (limit && out.size() >= limit)
                    break;
            }
        }
        return out;
    }

    const fs::path &root() const { return root_; }

private:
    const fs::path root_;
    std::mutex m_;
    std::atomic<uint64_t> seq_{1};
    std::atomic<uint64_t> evidence_seq_{1};
};
