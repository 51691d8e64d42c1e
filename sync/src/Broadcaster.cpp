/**
 * @file Broadcaster.cpp
 * @brief Broadcaster implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/Broadcaster.hpp>
#include <tether/net/protocol/MessageCodec.hpp>
#include <tether/core/Log.hpp>

namespace tether::sync {

Broadcaster::Broadcaster(IStateAdapter& adapter, const PrivateFieldFilter& filter, Sender sender)
    : _adapter{adapter}, _filter{filter}, _sender{std::move(sender)}
{}

void Broadcaster::setLocalPeer(PeerId peer)
{
    _localPeer = std::move(peer);
    _lastSent.reset();
}

BroadcastResult Broadcaster::tick()
{
    return publish(false);
}

BroadcastResult Broadcaster::flush()
{
    return publish(true);
}

void Broadcaster::invalidate() noexcept
{
    _lastSent.reset();
}

BroadcastResult Broadcaster::publish(bool force)
{
    Json::Value* collection = _adapter.getPeerCollection();
    if (!collection || _localPeer.empty() || !collection->isMember(_localPeer))
        return BroadcastResult::NoRecord;

    const Json::Value& own = (*collection)[_localPeer];
    if (!own.isObject())
        return BroadcastResult::NoRecord;

    const PeerRecord publicRecord = _filter.strip(own);
    std::string serialized = net::protocol::MessageCodec::serialize(publicRecord);

    if (!force && _lastSent && *_lastSent == serialized)
        return BroadcastResult::Unchanged;

    if (!_sender)
        return BroadcastResult::Dropped;

    auto sent = _sender(net::protocol::MessageCodec::encodeState(publicRecord));
    if (!sent.has_value())
    {
        core::Log::debug("Broadcaster", "state dropped: " + sent.error().message());
        return BroadcastResult::Dropped;
    }

    _lastSent = std::move(serialized);
    ++_sentCount;
    return BroadcastResult::Sent;
}

} // namespace tether::sync
