#pragma once
#include <map>
#include <optional>
#include <string>

// Validates the credential presented on a WebSocket handshake and yields
// the identity it belongs to. nullopt means reject.
class Authenticator
{
public:
    virtual ~Authenticator() = default;
    virtual std::optional<std::string> identify(const std::string &token) const = 0;
};

class TokenAuthenticator : public Authenticator
{
public:
    TokenAuthenticator(std::map<std::string, std::string> tokens, bool allow_anonymous)
        : tokens_(std::move(tokens)), allow_anonymous_(allow_anonymous) {}

    std::optional<std::string> identify(const std::string &token) const override
    {
        if (token.empty())
            return allow_anonymous_ ? std::optional<std::string>("anonymous") : std::nullopt;
        auto it = tokens_.find(token);
        if (it == tokens_.end())
            return std::nullopt;
        return it->second;
    }

private:
    std::map<std::string, std::string> tokens_;
    bool allow_anonymous_;
};
