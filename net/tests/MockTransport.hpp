/**
 * @file MockTransport.hpp
 * @brief In-memory transport double driven by the tests.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_NET_TESTS_MOCKTRANSPORT_HPP
    #define TETHER_NET_TESTS_MOCKTRANSPORT_HPP

#include "tether/net/transport/ITransport.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tether::net::transport::mock {

/**
 * @brief State of one connection attempt. Outlives the transport so that
 *        tests can inspect it after the session retired the transport.
 */
struct Link
{
    std::string              url;
    TransportHandlers        handlers;
    std::vector<std::string> sent;
    bool                     open{false};
    bool                     closed{false};
    bool                     alive{true};

    void accept()
    {
        open = true;
        if (handlers.onOpen)
            handlers.onOpen();
    }

    void drop()
    {
        open = false;
        if (handlers.onClose)
            handlers.onClose();
    }

    void fail(std::string why)
    {
        open = false;
        if (handlers.onError)
            handlers.onError(core::Error{core::ErrorCode::kTransportError, std::move(why)});
    }

    void deliver(std::string_view text)
    {
        if (handlers.onMessage)
            handlers.onMessage(text);
    }
};

class Transport final : public ITransport
{
public:
    Transport(std::shared_ptr<Link> link, bool failOpen)
        : _link{std::move(link)}, _failOpen{failOpen}
    {}

    ~Transport() override { _link->alive = false; }

    core::Expected<void> open(const std::string& url, TransportHandlers handlers) override
    {
        _link->url = url;
        _link->handlers = std::move(handlers);
        if (_failOpen)
            return core::makeError(core::ErrorCode::kTransportError, "refused");
        return {};
    }

    void close() override
    {
        _link->open = false;
        _link->closed = true;
    }

    core::Expected<void> send(std::string_view text) override
    {
        if (!_link->open)
            return core::makeError(core::ErrorCode::kNotConnected, "mock link closed");
        _link->sent.emplace_back(text);
        return {};
    }

    bool isOpen() const noexcept override { return _link->open; }
    const char* name() const noexcept override { return "mock"; }

private:
    std::shared_ptr<Link> _link;
    bool                  _failOpen;
};

class Factory final : public ITransportFactory
{
public:
    std::unique_ptr<ITransport> create() override
    {
        if (failCreate)
            return nullptr;
        links.push_back(std::make_shared<Link>());
        return std::make_unique<Transport>(links.back(), failOpen);
    }

    [[nodiscard]] Link& last() { return *links.back(); }

    std::vector<std::shared_ptr<Link>> links;
    bool failCreate{false};
    bool failOpen{false};
};

} // namespace tether::net::transport::mock

#endif // TETHER_NET_TESTS_MOCKTRANSPORT_HPP
