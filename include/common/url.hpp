#pragma once
#include <cctype>
#include <string>
#include <vector>

inline std::string url_decode(const std::string &s)
{
    std::string out;
    out.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i)
    {
        if (s[i] == '%' && i + 2 < s.size() && std::isxdigit(static_cast<unsigned char>(s[i + 1])) && std::isxdigit(static_cast<unsigned char>(s[i + 2])))
        {
            out += static_cast<char>(std::stoi(s.substr(i + 1, 2), nullptr, 16));
            i += 2;
        }
        else if (s[i] == '+')
            out += ' ';
        else
            out += s[i];
    }
    return out;
}

// Source keys and identifiers: 1-64 chars of [A-Za-z0-9_.-]
inline bool valid_key(const std::string &k)
{
    if (k.empty() || k.size() > 64)
        return false;
    for (unsigned char c : k)
        if (!std::isalnum(c) && c != '_' && c != '-' && c != '.')
            return false;
    return true;
}

// "/a/b?x=1" -> path "/a/b", query "x=1"
inline void split_target(const std::string &target, std::string &path, std::string &query)
{
    auto q = target.find('?');
    path = target.substr(0, q);
    query = (q == std::string::npos) ? std::string() : target.substr(q + 1);
}

inline std::string query_param(const std::string &query, const std::string &key)
{
    std::size_t pos = 0;
    while (pos <= query.size())
    {
        auto amp = query.find('&', pos);
        auto part = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        auto eq = part.find('=');
        if (part.substr(0, eq) == key)
            return eq == std::string::npos ? std::string() : url_decode(part.substr(eq + 1));
        if (amp == std::string::npos)
            break;
        pos = amp + 1;
    }
    return {};
}

// "/ws/stream/room-7" -> {"ws", "stream", "room-7"}; empty segments dropped
inline std::vector<std::string> path_segments(const std::string &path)
{
    std::vector<std::string> out;
    std::size_t pos = 0;
    while (pos < path.size())
    {
        auto slash = path.find('/', pos);
        auto seg = path.substr(pos, slash == std::string::npos ? std::string::npos : slash - pos);
        if (!seg.empty())
            out.push_back(url_decode(seg));
        if (slash == std::string::npos)
            break;
        pos = slash + 1;
    }
    return out;
}
