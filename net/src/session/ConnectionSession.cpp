/**
 * @file ConnectionSession.cpp
 * @brief ConnectionSession implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/net/session/ConnectionSession.hpp>
#include <tether/net/protocol/RelayUrl.hpp>
#include <tether/core/Log.hpp>

#include <string>
#include <vector>

namespace tether::net::session {

struct ConnectionSession::Impl
{
    time::IScheduler&                                    scheduler;
    transport::ITransportFactory&                        factory;
    RelayEndpoint                                        endpoint;
    core::Millis                                         connectTimeout;

    JoinParams                                           params;
    SessionCallbacks                                     callbacks;
    std::unique_ptr<transport::ITransport>               transport;
    std::vector<std::unique_ptr<transport::ITransport>>  retired;

    LinkState                                            state{LinkState::Idle};
    core::u32                                            generation{0};
    time::TimerId                                        timeoutTimer{time::kInvalidTimer};
    time::TimerId                                        reapTimer{time::kInvalidTimer};

    Impl(time::IScheduler& s, transport::ITransportFactory& f, RelayEndpoint e, core::Millis t)
        : scheduler{s}, factory{f}, endpoint{std::move(e)}, connectTimeout{t}
    {}

    [[nodiscard]] bool current(core::u32 gen) const noexcept
    {
        return gen == generation;
    }

    void cancelTimeout()
    {
        if (timeoutTimer != time::kInvalidTimer)
        {
            scheduler.cancel(timeoutTimer);
            timeoutTimer = time::kInvalidTimer;
        }
    }

    void retireTransport()
    {
        if (!transport)
            return;

        auto old = std::move(transport);
        old->close();
        retired.push_back(std::move(old));

        if (reapTimer == time::kInvalidTimer)
        {
            reapTimer = scheduler.after(0.0, [this] {
                reapTimer = time::kInvalidTimer;
                retired.clear();
            });
        }
    }

    void fail(core::u32 gen, core::Error error)
    {
        if (!current(gen) || (state != LinkState::Connecting && state != LinkState::Open))
            return;

        state = LinkState::Closed;
        cancelTimeout();
        retireTransport();

        core::Log::warn("Session", "connection to room '" + params.roomId + "' lost: " + error.message());

        auto onLost = callbacks.onLost;
        if (onLost)
            onLost(std::move(error));
    }

    transport::TransportHandlers handlersFor(core::u32 gen)
    {
        transport::TransportHandlers handlers;

        handlers.onOpen = [this, gen] {
            if (!current(gen) || state != LinkState::Connecting)
                return;
            cancelTimeout();
            state = LinkState::Open;
            core::Log::info("Session", "connected to room '" + params.roomId + "'");
            auto onOpen = callbacks.onOpen;
            if (onOpen)
                onOpen();
        };

        handlers.onClose = [this, gen] {
            fail(gen, core::Error{core::ErrorCode::kTransportError, "transport closed"});
        };

        handlers.onError = [this, gen](core::Error error) {
            fail(gen, core::Error{core::ErrorCode::kTransportError, error.message()});
        };

        handlers.onMessage = [this, gen](std::string_view text) {
            if (!current(gen) || state != LinkState::Open)
                return;
            auto onMessage = callbacks.onMessage;
            if (onMessage)
                onMessage(text);
        };

        return handlers;
    }

    core::Expected<void> start()
    {
        cancelTimeout();
        retireTransport();

        const core::u32 gen = ++generation;

        transport = factory.create();
        if (!transport)
        {
            state = LinkState::Closed;
            return core::makeError(core::ErrorCode::kTransportError,
                                   "transport factory returned no transport");
        }

        state = LinkState::Connecting;
        timeoutTimer = scheduler.after(connectTimeout, [this, gen] {
            timeoutTimer = time::kInvalidTimer;
            fail(gen, core::Error{core::ErrorCode::kTimeout, "connection timed out"});
        });

        const std::string url = protocol::RelayUrl::build(endpoint, params);
        core::Log::debug("Session", std::string{"opening "} + transport->name() + " to " + url);

        auto started = transport->open(url, handlersFor(gen));
        if (!started.has_value())
        {
            if (current(gen))
            {
                state = LinkState::Closed;
                cancelTimeout();
                retireTransport();
            }
            return core::makeError(core::ErrorCode::kTransportError,
                                   "transport open failed: " + started.error().message());
        }
        return {};
    }
};

ConnectionSession::ConnectionSession(time::IScheduler& scheduler,
                                     transport::ITransportFactory& factory,
                                     RelayEndpoint endpoint,
                                     core::Millis connectTimeout)
    : _impl{std::make_unique<Impl>(scheduler, factory, std::move(endpoint), connectTimeout)}
{}

ConnectionSession::~ConnectionSession()
{
    close();
    if (_impl->reapTimer != time::kInvalidTimer)
        _impl->scheduler.cancel(_impl->reapTimer);
}

core::Expected<void> ConnectionSession::open(JoinParams params, SessionCallbacks callbacks)
{
    _impl->params = std::move(params);
    _impl->callbacks = std::move(callbacks);
    return _impl->start();
}

core::Expected<void> ConnectionSession::reopen()
{
    if (_impl->state == LinkState::Idle)
    {
        return core::makeError(core::ErrorCode::kInvalidState, "no previous connection to reopen");
    }
    return _impl->start();
}

void ConnectionSession::close()
{
    ++_impl->generation;
    _impl->cancelTimeout();
    _impl->retireTransport();
    if (_impl->state != LinkState::Idle)
        _impl->state = LinkState::Closed;
}

core::Expected<void> ConnectionSession::send(std::string_view text)
{
    if (_impl->state != LinkState::Open || !_impl->transport || !_impl->transport->isOpen())
    {
        return core::makeError(core::ErrorCode::kNotConnected, "transport is not open");
    }
    return _impl->transport->send(text);
}

bool ConnectionSession::isOpen() const noexcept
{
    return _impl->state == LinkState::Open && _impl->transport && _impl->transport->isOpen();
}

LinkState         ConnectionSession::state() const noexcept      { return _impl->state; }
const JoinParams& ConnectionSession::params() const noexcept     { return _impl->params; }
core::u32         ConnectionSession::generation() const noexcept { return _impl->generation; }

} // namespace tether::net::session
