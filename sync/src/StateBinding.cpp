/**
 * @file StateBinding.cpp
 * @brief StateBinding implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/StateBinding.hpp>
#include <tether/sync/ClockSync.hpp>
#include <tether/sync/RemoteStateReceiver.hpp>
#include <tether/net/protocol/MessageCodec.hpp>
#include <tether/net/session/ConnectionSession.hpp>
#include <tether/core/Log.hpp>

#include <exception>
#include <random>
#include <string_view>
#include <type_traits>
#include <variant>

namespace tether::sync {

namespace {

std::string randomString(std::string_view alphabet, core::usize length)
{
    static thread_local std::mt19937 engine{std::random_device{}()};
    std::uniform_int_distribution<core::usize> pick{0, alphabet.size() - 1};

    std::string out;
    out.reserve(length);
    for (core::usize i = 0; i < length; ++i)
        out.push_back(alphabet[pick(engine)]);
    return out;
}

net::session::ReconnectPolicy policyFrom(const Config& config)
{
    net::session::ReconnectPolicy policy;
    policy.autoReconnect = config.autoReconnect();
    policy.maxAttempts = config.maxReconnectAttempts();
    return policy;
}

} // namespace

struct StateBinding::Impl
{
    time::IScheduler&                  scheduler;
    IStateAdapter&                     adapter;
    IRoomDirectory*                    directory;
    Config                             config;

    PrivateFieldFilter                 filter;
    RemoteStateReceiver                receiver;
    Broadcaster                        broadcaster;
    ClockSync                          clock;
    EventChannel                       events;
    net::session::ConnectionSession    session;
    net::session::ReconnectionManager  reconnect;

    PeerId                             peerId;
    std::optional<std::string>         roomId;
    std::optional<core::u32>           relayPlayerCount;
    core::Expected<void>               bindingStatus{};
    core::Completion<void>             pendingJoin;

    time::TimerId                      broadcastTimer{time::kInvalidTimer};
    time::TimerId                      renderTimer{time::kInvalidTimer};
    time::TimerId                      pingTimer{time::kInvalidTimer};

    Impl(time::IScheduler& s, net::transport::ITransportFactory& transports,
         IStateAdapter& a, Config c, IRoomDirectory* d)
        : scheduler{s}
        , adapter{a}
        , directory{d}
        , config{std::move(c)}
        , receiver{adapter, filter}
        , broadcaster{adapter, filter, [this](std::string_view text) { return session.send(text); }}
        , session{scheduler, transports,
                  net::session::RelayEndpoint{config.relayUrl(), config.gameId()},
                  config.connectTimeout()}
        , reconnect{scheduler, policyFrom(config)}
        , peerId{config.peerId().empty() ? StateBinding::generatePeerId() : config.peerId()}
    {
        receiver.setLocalPeer(peerId);
        broadcaster.setLocalPeer(peerId);
    }

    // -- timers -------------------------------------------------------------

    static void cancelTimer(time::IScheduler& scheduler, time::TimerId& id)
    {
        if (id != time::kInvalidTimer)
        {
            scheduler.cancel(id);
            id = time::kInvalidTimer;
        }
    }

    /** @brief Runs @p fn, turning a thrown exception into an Error event. */
    template <typename Fn>
    void guarded(std::string_view what, Fn&& fn)
    {
        try
        {
            fn();
        }
        catch (const std::exception& e)
        {
            core::Log::error("Binding", std::string{what} + " failed: " + e.what());
            events.emit(event::Error{core::Error{core::ErrorCode::kInternalError,
                std::string{what} + ": " + e.what()}});
        }
    }

    void startTimers()
    {
        stopTimers();
        broadcastTimer = scheduler.every(config.tickInterval(), [this] {
            guarded("broadcast tick", [this] { broadcaster.tick(); });
        });
        renderTimer = scheduler.every(config.renderInterval(), [this] {
            guarded("render tick", [this] { receiver.render(scheduler.now()); });
        });
        pingTimer = scheduler.every(config.pingInterval(), [this] {
            guarded("ping", [this] { sendPing(); });
        });
    }

    void stopTimers()
    {
        cancelTimer(scheduler, broadcastTimer);
        cancelTimer(scheduler, renderTimer);
        cancelTimer(scheduler, pingTimer);
    }

    void sendPing()
    {
        if (!session.isOpen())
            return;

        auto sent = session.send(net::protocol::MessageCodec::encodePing());
        if (sent.has_value())
            clock.onPingSent(scheduler.now());
    }

    // -- join lifecycle -------------------------------------------------------

    void completeJoin(core::Expected<void> result)
    {
        auto done = std::move(pendingJoin);
        pendingJoin = nullptr;
        if (done)
            done(std::move(result));
    }

    void abortJoin(core::Error error)
    {
        stopTimers();
        session.close();
        reconnect.stop();
        roomId.reset();
        relayPlayerCount.reset();

        core::Log::warn("Binding", "join failed: " + error.message());
        events.emit(event::Error{error});
        completeJoin(core::Unexpected{std::move(error)});
    }

    void onOpen()
    {
        if (reconnect.onConnected())
        {
            broadcaster.invalidate();
            guarded("publish", [this] { broadcaster.tick(); });
            events.emit(event::Reconnected{});
            return;
        }

        startTimers();
        guarded("publish", [this] { broadcaster.tick(); });
        completeJoin({});
        if (roomId)
            events.emit(event::Connected{*roomId, peerId});
    }

    void onLost(core::Error error)
    {
        if (reconnect.state() == ConnectionState::Connecting)
        {
            abortJoin(std::move(error));
            return;
        }

        switch (reconnect.onConnectionLost([this] { retry(); }))
        {
            case net::session::LossOutcome::RetryScheduled:
                events.emit(event::Reconnecting{reconnect.attempt(), reconnect.lastDelay()});
                break;
            case net::session::LossOutcome::Exhausted:
                stopTimers();
                session.close();
                events.emit(event::Error{core::Error{core::ErrorCode::kReconnectExhausted,
                    "gave up after " + std::to_string(reconnect.attempt()) + " reconnection attempts"}});
                break;
            case net::session::LossOutcome::NotRetrying:
                stopTimers();
                session.close();
                events.emit(event::Disconnected{});
                break;
            case net::session::LossOutcome::Ignored:
                break;
        }
    }

    void retry()
    {
        auto reopened = session.reopen();
        if (reopened.has_value())
            return;

        // A transport failing inside open() may already have reported the loss.
        if (reconnect.state() == ConnectionState::Reconnecting && !reconnect.retryPending())
            onLost(reopened.error());
    }

    // -- inbound ------------------------------------------------------------

    void onMessage(std::string_view text)
    {
        guarded("inbound message", [this, text] { dispatch(text); });
    }

    void dispatch(std::string_view text)
    {
        auto decoded = net::protocol::MessageCodec::decode(text);
        if (!decoded.has_value())
        {
            core::Log::warn("Codec", "dropping frame: " + decoded.error().message());
            return;
        }

        const core::Millis now = scheduler.now();
        core::Millis timestamp = now;
        if (decoded->serverTime)
        {
            clock.observe(*decoded->serverTime, now);
            timestamp = clock.toLocalTime(*decoded->serverTime);
        }

        std::visit([&](auto& payload) { handle(payload, timestamp, now); }, decoded->payload);
    }

    void handle(net::protocol::FullStateMessage& msg, core::Millis timestamp, core::Millis)
    {
        if (msg.playerCount)
            relayPlayerCount = msg.playerCount;
        receiver.applyFullState(msg.peers, timestamp);
    }

    void handle(net::protocol::StateMessage& msg, core::Millis timestamp, core::Millis now)
    {
        receiver.applyState(msg.peerId, std::move(msg.data), timestamp, now);
    }

    void handle(net::protocol::PeerJoinedMessage& msg, core::Millis, core::Millis)
    {
        if (msg.playerCount)
            relayPlayerCount = msg.playerCount;
        if (msg.peerId != peerId)
            events.emit(event::PeerJoined{msg.peerId});
    }

    void handle(net::protocol::PeerLeftMessage& msg, core::Millis, core::Millis)
    {
        if (msg.playerCount)
            relayPlayerCount = msg.playerCount;
        if (msg.peerId == peerId)
            return;
        receiver.removePeer(msg.peerId);
        events.emit(event::PeerLeft{msg.peerId});
    }

    void handle(net::protocol::PeerDataMessage& msg, core::Millis, core::Millis)
    {
        events.emit(event::Message{msg.from, std::move(msg.data)});
    }

    void handle(net::protocol::PongMessage&, core::Millis, core::Millis now)
    {
        clock.onPong(now);
    }

    void handle(net::protocol::IgnoredMessage& msg, core::Millis, core::Millis)
    {
        core::Log::debug("Codec", "ignoring message type '" + msg.type + "'");
    }
};

StateBinding::StateBinding(time::IScheduler& scheduler,
                           net::transport::ITransportFactory& transports,
                           IStateAdapter& adapter,
                           Config config,
                           IRoomDirectory* directory)
    : _impl{std::make_unique<Impl>(scheduler, transports, adapter, std::move(config), directory)}
{}

StateBinding::~StateBinding()
{
    _impl->stopTimers();
    _impl->session.close();
    _impl->reconnect.stop();
}

void StateBinding::join(const std::string& roomId, JoinOptions options, core::Completion<void> done)
{
    if (roomId.empty())
    {
        if (done)
            done(core::makeError(core::ErrorCode::kInvalidArgument, "room id must not be empty"));
        return;
    }

    leave();

    auto& impl = *_impl;
    impl.bindingStatus = impl.adapter.bind();
    if (!impl.bindingStatus.has_value())
    {
        core::Log::warn("Binding", "peer sync disabled: " + impl.bindingStatus.error().message());
    }

    impl.receiver.setStrategy(smoothing::makeStrategy(impl.config, impl.filter));
    impl.broadcaster.invalidate();
    impl.clock.reset();
    impl.relayPlayerCount.reset();
    impl.roomId = roomId;
    impl.pendingJoin = std::move(done);
    impl.reconnect.begin();

    net::session::SessionCallbacks callbacks;
    callbacks.onOpen = [&impl] { impl.onOpen(); };
    callbacks.onLost = [&impl](core::Error error) { impl.onLost(std::move(error)); };
    callbacks.onMessage = [&impl](std::string_view text) { impl.onMessage(text); };

    core::Log::info("Binding", "joining room '" + roomId + "' as " + impl.peerId);

    auto opened = impl.session.open(
        net::session::JoinParams{roomId, impl.peerId, std::move(options)}, std::move(callbacks));
    if (!opened.has_value() && impl.reconnect.state() == ConnectionState::Connecting)
        impl.abortJoin(opened.error());
}

void StateBinding::create(JoinOptions options, core::Completion<std::string> done)
{
    std::string code = generateRoomCode();
    options.create = true;

    join(code, std::move(options), [code, done = std::move(done)](core::Expected<void> result) {
        if (!done)
            return;
        if (result.has_value())
            done(code);
        else
            done(core::Unexpected{result.error()});
    });
}

void StateBinding::leave()
{
    auto& impl = *_impl;
    if (!impl.roomId && !impl.pendingJoin)
        return;

    core::Log::info("Binding", "leaving room '" + impl.roomId.value_or("") + "'");

    // Already reported when the connection dropped without a retry.
    const bool announce = impl.reconnect.state() != ConnectionState::Disconnected;

    impl.stopTimers();
    impl.session.close();
    impl.reconnect.stop();
    impl.receiver.clearRemote();
    impl.roomId.reset();
    impl.relayPlayerCount.reset();

    if (impl.pendingJoin)
        impl.completeJoin(core::makeError(core::ErrorCode::kInvalidState, "join interrupted by leave"));

    if (announce)
        impl.events.emit(event::Disconnected{});
}

core::Expected<void> StateBinding::broadcast(const Json::Value& data)
{
    return _impl->session.send(net::protocol::MessageCodec::encodeBroadcast(data));
}

BroadcastResult StateBinding::flush()
{
    return _impl->broadcaster.flush();
}

SubscriptionId StateBinding::on(EventKind kind, EventHandler handler)
{
    return _impl->events.subscribe(kind, std::move(handler));
}

bool StateBinding::off(SubscriptionId id)
{
    return _impl->events.unsubscribe(id);
}

void StateBinding::listRooms(core::Completion<std::vector<RoomInfo>> done)
{
    if (!done)
        return;
    if (!_impl->directory)
    {
        done(core::makeError(core::ErrorCode::kNotSupported, "no room directory configured"));
        return;
    }
    _impl->directory->listRooms(_impl->config.gameId(), std::move(done));
}

const PeerId& StateBinding::myId() const noexcept { return _impl->peerId; }
const std::optional<std::string>& StateBinding::roomId() const noexcept { return _impl->roomId; }

bool StateBinding::connected() const noexcept
{
    return _impl->reconnect.state() == ConnectionState::Connected && _impl->session.isOpen();
}

core::u32 StateBinding::playerCount() const
{
    if (_impl->relayPlayerCount)
        return *_impl->relayPlayerCount;

    const Json::Value* collection = _impl->adapter.getPeerCollection();
    if (!collection || !collection->isObject())
        return 0;
    return static_cast<core::u32>(collection->size());
}

core::Millis StateBinding::latency() const noexcept { return _impl->clock.latency(); }
ConnectionState StateBinding::connectionState() const noexcept { return _impl->reconnect.state(); }
const core::Expected<void>& StateBinding::bindingStatus() const noexcept { return _impl->bindingStatus; }
core::Millis StateBinding::clockOffset() const noexcept { return _impl->clock.offset(); }
const Config& StateBinding::config() const noexcept { return _impl->config; }
PrivateFieldFilter& StateBinding::visibility() noexcept { return _impl->filter; }

PeerId StateBinding::generatePeerId()
{
    return "p_" + randomString("abcdefghijklmnopqrstuvwxyz0123456789", core::kPeerIdSuffixLength);
}

std::string StateBinding::generateRoomCode()
{
    return randomString("ABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789", core::kRoomCodeLength);
}

} // namespace tether::sync
