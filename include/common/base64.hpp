#pragma once
#include <optional>
#include <string>
#include <boost/beast/core/detail/base64.hpp>

inline std::string base64_encode(const std::string &bytes)
{
    namespace b64 = boost::beast::detail::base64;
    std::string out(b64::encoded_size(bytes.size()), '\0');
    out.resize(b64::encode(&out[0], bytes.data(), bytes.size()));
    return out;
}

// Accepts a bare base64 payload or a "data:<mime>;base64,<payload>" URL.
// Returns nullopt when the payload is not valid base64.
inline std::optional<std::string> base64_decode(std::string in)
{
    namespace b64 = boost::beast::detail::base64;
    if (in.rfind("data:", 0) == 0)
    {
        auto comma = in.find(',');
        if (comma == std::string::npos)
            return std::nullopt;
        in.erase(0, comma + 1);
    }
    while (!in.empty() && (in.back() == '\n' || in.back() == '\r' || in.back() == ' '))
        in.pop_back();
    if (in.empty() || in.size() % 4 != 0)
        return std::nullopt;
    std::string out(b64::decoded_size(in.size()), '\0');
    std::size_t pad = 0;
    while (pad < in.size() && in[in.size() - 1 - pad] == '=')
        ++pad;
    // decode() stops at the first '=' or invalid character
    auto [written, read] = b64::decode(&out[0], in.data(), in.size());
    if (pad > 2 || read != in.size() - pad)
        return std::nullopt;
    out.resize(written);
    return out;
}
