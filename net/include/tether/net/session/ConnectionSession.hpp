/**
 * @file ConnectionSession.hpp
 * @brief Owns the single live transport of a room session.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#pragma once

#ifndef TETHER_NET_SESSION_CONNECTIONSESSION_HPP
    #define TETHER_NET_SESSION_CONNECTIONSESSION_HPP

#include <tether/net/session/JoinParams.hpp>
#include <tether/net/transport/ITransport.hpp>
#include <tether/time/IScheduler.hpp>
#include <tether/core/Expected.hpp>
#include <tether/core/NonCopyable.hpp>
#include <tether/core/Types.hpp>

#include <functional>
#include <memory>
#include <string_view>

namespace tether::net::session {

/**
 * @enum LinkState
 * @brief Lifecycle of the current transport.
 */
enum class LinkState : core::u8
{
    Idle,
    Connecting,
    Open,
    Closed
};

/**
 * @struct SessionCallbacks
 * @brief Outcome notifications of a connection attempt.
 *
 * onLost fires exactly once per attempt that does not end with an explicit
 * close(): open failure, connect timeout, or closure after open.
 */
struct SessionCallbacks
{
    std::function<void()>                 onOpen;
    std::function<void(core::Error)>      onLost;
    std::function<void(std::string_view)> onMessage;
};

/**
 * @class ConnectionSession
 * @brief Connection attempt bookkeeping for one room.
 *
 * Guarantees at most one live transport. Every attempt gets a generation
 * number; callbacks of older transports are discarded. Replaced transports
 * are retired and destroyed from a scheduler task, never from inside one of
 * their own callbacks.
 */
class ConnectionSession final : public core::NonCopyable<ConnectionSession>
{
public:
    /**
     * @param scheduler      Timer source for the connect deadline.
     * @param factory        Produces one transport per attempt.
     * @param endpoint       Relay address used to build the connect URL.
     * @param connectTimeout Deadline for onOpen, in milliseconds.
     */
    ConnectionSession(time::IScheduler& scheduler,
                      transport::ITransportFactory& factory,
                      RelayEndpoint endpoint,
                      core::Millis connectTimeout);
    ~ConnectionSession();

    /**
     * @brief Starts connecting to the room described by @p params.
     *
     * Any previous transport is closed first.
     * @return kTransportError when no transport could be created or started.
     */
    [[nodiscard]] core::Expected<void> open(JoinParams params, SessionCallbacks callbacks);

    /** @brief Starts a new attempt with the last parameters and callbacks. */
    [[nodiscard]] core::Expected<void> reopen();

    /** @brief Closes the transport. No callback fires for this attempt. */
    void close();

    /**
     * @brief Sends one frame.
     * @return kNotConnected unless the link is open.
     */
    [[nodiscard]] core::Expected<void> send(std::string_view text);

    [[nodiscard]] bool              isOpen() const noexcept;
    [[nodiscard]] LinkState         state() const noexcept;
    [[nodiscard]] const JoinParams& params() const noexcept;
    [[nodiscard]] core::u32         generation() const noexcept;

private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace tether::net::session

#endif // TETHER_NET_SESSION_CONNECTIONSESSION_HPP
