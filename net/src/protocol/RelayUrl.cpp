/**
 * @file RelayUrl.cpp
 * @brief RelayUrl implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/net/protocol/RelayUrl.hpp>
#include <tether/net/protocol/MessageCodec.hpp>

#include <string>

namespace tether::net::protocol {

namespace {

bool isUnreserved(unsigned char c) noexcept
{
    if ((c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9'))
        return true;
    switch (c)
    {
        case '-': case '_': case '.': case '!': case '~':
        case '*': case '\'': case '(': case ')':
            return true;
        default:
            return false;
    }
}

void appendParam(std::string& url, bool& first, std::string_view key, std::string_view value)
{
    url += first ? '?' : '&';
    first = false;
    url += key;
    url += '=';
    url += RelayUrl::encodeComponent(value);
}

} // anonymous namespace

std::string RelayUrl::encodeComponent(std::string_view text)
{
    static constexpr char kHex[] = "0123456789ABCDEF";

    std::string out;
    out.reserve(text.size());
    for (const char ch : text)
    {
        const auto c = static_cast<unsigned char>(ch);
        if (isUnreserved(c))
        {
            out += ch;
        }
        else
        {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

std::string RelayUrl::toWebSocketScheme(std::string_view url)
{
    if (url.starts_with("https://"))
        return "wss://" + std::string{url.substr(8)};
    if (url.starts_with("http://"))
        return "ws://" + std::string{url.substr(7)};
    return std::string{url};
}

std::string RelayUrl::build(const session::RelayEndpoint& endpoint,
                            const session::JoinParams& params)
{
    std::string url = toWebSocketScheme(endpoint.baseUrl);
    while (!url.empty() && url.back() == '/')
        url.pop_back();

    url += "/v1/connect/";
    url += encodeComponent(params.roomId);

    bool first = true;
    appendParam(url, first, "gameId", endpoint.gameId);
    appendParam(url, first, "playerId", params.peerId);

    const auto& options = params.options;
    appendParam(url, first, "create", options.create ? "true" : "false");
    if (options.maxPlayers)
        appendParam(url, first, "maxPlayers", std::to_string(*options.maxPlayers));
    if (options.isPublic)
        appendParam(url, first, "public", *options.isPublic ? "true" : "false");
    if (!options.name.empty())
        appendParam(url, first, "name", options.name);
    if (!options.meta.isNull())
        appendParam(url, first, "meta", MessageCodec::serialize(options.meta));

    return url;
}

} // namespace tether::net::protocol
