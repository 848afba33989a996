/*
 * File: include/common/file_io.hpp
 * Project: Classwatch Relay
 * Purpose: File helpers for the audit index, evidence and camera directory
 * Notes:
 *  - write_atomic: <path>.tmp, fsync, rename()
 *  - append_line is used for the JSONL audit index only
 * Last updated: 2026-10-16
 */

#pragma once
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <fcntl.h>
#include <unistd.h>

namespace fs = std::filesystem;

// RFC3339 UTC with milliseconds (e.g., 2026-10-16T14:59:01.234Z)
inline std::string iso8601_ms(std::chrono::system_clock::time_point tp)
{
    using namespace std::chrono;
    auto now = time_point_cast<milliseconds>(tp);
    auto ms = duration_cast<milliseconds>(now.time_since_epoch()) % 1000;
    std::time_t tt = system_clock::to_time_t(now);
    std::tm tm{};
    gmtime_r(&tt, &tm);

    char base[32];
    std::strftime(base, sizeof(base), "%Y-%m-%dT%H:%M:%S", &tm);

    std::ostringstream oss;
    oss << base << '.' << std::setw(3) << std::setfill('0') << ms.count() << 'Z';
    return oss.str();
}

inline std::string iso8601_now_ms() { return iso8601_ms(std::chrono::system_clock::now()); }

inline void ensure_dir(const fs::path &p)
{
    std::error_code ec;
    if (!fs::exists(p, ec))
    {
        fs::create_directories(p, ec);
        if (ec)
            throw std::runtime_error("create_directories failed: " + ec.message());
    }
}

// Atomic file writer: writes to <path>.tmp, fsyncs, then rename() to final.
inline void write_atomic(const fs::path &dst, const std::string &data)
{
    fs::path tmp = dst;
    tmp += ".tmp";
    {
        std::ofstream f(tmp, std::ios::binary | std::ios::trunc);
        if (!f)
            throw std::runtime_error("open tmp failed: " + tmp.string());
        f.write(data.data(), static_cast<std::streamsize>(data.size()));
        f.flush();
        if (!f)
            throw std::runtime_error("write tmp failed: " + tmp.string());
    }
    int fd = ::open(tmp.c_str(), O_RDONLY);
    if (fd >= 0)
    {
        ::fsync(fd);
        ::close(fd);
    }
    std::error_code ec;
    fs::rename(tmp, dst, ec);
    if (ec)
        throw std::runtime_error("rename tmp->dst failed: " + ec.message());
}

inline void append_line(const fs::path &dst, const std::string &line)
{
    std::ofstream f(dst, std::ios::app);
    if (!f)
        throw std::runtime_error("open index for append failed: " + dst.string());
    f << line << '\n';
    if (!f)
        throw std::runtime_error("append index failed: " + dst.string());
}

inline bool read_file_all(const fs::path &p, std::string &out)
{
    std::ifstream f(p, std::ios::binary);
    if (!f)
        return false;
    std::ostringstream ss;
    ss << f.rdbuf();
    out = ss.str();
    return true;
}
