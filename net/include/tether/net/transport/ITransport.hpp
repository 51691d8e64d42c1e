// /////////////////////////////////////////////////////////////////////////////
/// @file ITransport.hpp
/// @brief Abstract duplex text channel to the relay (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/core/Types.hpp>
#include <tether/core/Expected.hpp>

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace tether::net::transport {

// /////////////////////////////////////////////////////////////////////////////
/// @struct TransportHandlers
/// @brief Callbacks a transport fires on the scheduler thread.
///
/// A transport may fire onError and then onClose for the same failure;
/// consumers must tolerate both.
// /////////////////////////////////////////////////////////////////////////////
struct TransportHandlers
{
    std::function<void()>                 onOpen;
    std::function<void()>                 onClose;
    std::function<void(core::Error)>      onError;
    std::function<void(std::string_view)> onMessage;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransport
/// @brief Strategy interface for the relay connection.
///
/// The engine never ships a concrete transport: hosts plug in their
/// WebSocket client, tests plug in an in-memory double.
// /////////////////////////////////////////////////////////////////////////////
class ITransport
{
public:
    virtual ~ITransport() = default;

    /// @brief Starts connecting to @p url. Completion is reported through
    ///        @p handlers (onOpen, or onError/onClose).
    /// @return Error only if the attempt could not even be started.
    [[nodiscard]] virtual core::Expected<void> open(const std::string& url,
                                                    TransportHandlers handlers) = 0;

    /// @brief Closes the channel. Handlers may still fire during the call.
    virtual void close() = 0;

    /// @brief Sends one text frame.
    [[nodiscard]] virtual core::Expected<void> send(std::string_view text) = 0;

    /// @brief @c true between onOpen and close.
    [[nodiscard]] virtual bool isOpen() const noexcept = 0;

    /// @brief Returns a human-readable name for this transport.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

// /////////////////////////////////////////////////////////////////////////////
/// @class ITransportFactory
/// @brief Produces a fresh transport for every connection attempt.
// /////////////////////////////////////////////////////////////////////////////
class ITransportFactory
{
public:
    virtual ~ITransportFactory() = default;

    /// @return A new, unopened transport, or nullptr if none can be made.
    [[nodiscard]] virtual std::unique_ptr<ITransport> create() = 0;
};

} // namespace tether::net::transport
