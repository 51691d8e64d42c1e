/**
 * @file RemoteStateReceiver.cpp
 * @brief RemoteStateReceiver implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/RemoteStateReceiver.hpp>
#include <tether/core/Log.hpp>

namespace tether::sync {

RemoteStateReceiver::RemoteStateReceiver(IStateAdapter& adapter, const PrivateFieldFilter& filter)
    : _adapter{adapter}, _filter{filter}
{}

void RemoteStateReceiver::setStrategy(std::unique_ptr<smoothing::ISmoothingStrategy> strategy)
{
    _strategy = std::move(strategy);
}

void RemoteStateReceiver::setLocalPeer(PeerId peer)
{
    _localPeer = std::move(peer);
}

bool RemoteStateReceiver::accepts(const PeerId& peer) const noexcept
{
    return _strategy && !peer.empty() && peer != _localPeer;
}

void RemoteStateReceiver::applyState(const PeerId& peer, PeerRecord record,
                                     core::Millis timestamp, core::Millis now)
{
    Json::Value* collection = _adapter.getPeerCollection();
    if (!collection || !accepts(peer))
        return;

    if (!record.isObject())
    {
        core::Log::debug("Receiver", "ignoring non-object record from '" + peer + "'");
        return;
    }

    _filter.stripInPlace(record);
    _strategy->onRecord(*collection, peer, std::move(record), timestamp, now);
}

void RemoteStateReceiver::applyFullState(const Json::Value& peers, core::Millis timestamp)
{
    Json::Value* collection = _adapter.getPeerCollection();
    if (!collection || !_strategy || !peers.isObject())
        return;

    core::usize applied = 0;
    for (const auto& peer : peers.getMemberNames())
    {
        if (!accepts(peer) || !peers[peer].isObject())
            continue;

        _strategy->prime(*collection, peer, _filter.strip(peers[peer]), timestamp);
        ++applied;
    }
    core::Log::debug("Receiver", "full state applied to " + std::to_string(applied) + " peer(s)");
}

void RemoteStateReceiver::removePeer(const PeerId& peer)
{
    if (_strategy)
        _strategy->forget(peer);

    Json::Value* collection = _adapter.getPeerCollection();
    if (!collection || peer.empty() || peer == _localPeer)
        return;
    collection->removeMember(peer);
}

void RemoteStateReceiver::clearRemote()
{
    if (_strategy)
        _strategy->clear();

    Json::Value* collection = _adapter.getPeerCollection();
    if (!collection || !collection->isObject())
        return;

    for (const auto& peer : collection->getMemberNames())
    {
        if (peer != _localPeer)
            collection->removeMember(peer);
    }
}

void RemoteStateReceiver::render(core::Millis now)
{
    Json::Value* collection = _adapter.getPeerCollection();
    if (!collection || !_strategy)
        return;
    _strategy->render(*collection, now);
}

core::usize RemoteStateReceiver::remoteCount()
{
    Json::Value* collection = _adapter.getPeerCollection();
    if (!collection || !collection->isObject())
        return 0;

    core::usize count = collection->size();
    if (!_localPeer.empty() && collection->isMember(_localPeer))
        --count;
    return count;
}

} // namespace tether::sync
