/**
 * @file SnapshotBuffer.cpp
 * @brief SnapshotBuffer implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/SnapshotBuffer.hpp>

#include <algorithm>

namespace tether::sync {

SnapshotBuffer::SnapshotBuffer(core::usize capacity)
    : _capacity{capacity == 0 ? 1 : capacity}
{}

void SnapshotBuffer::push(const PeerId& peer, core::Millis timestamp, PeerRecord record)
{
    auto& snapshots = _history[peer];

    const auto pos = std::upper_bound(snapshots.begin(), snapshots.end(), timestamp,
                                      [](core::Millis t, const Snapshot& s) {
                                          return t < s.timestamp;
                                      });
    snapshots.insert(pos, Snapshot{timestamp, std::move(record)});

    while (snapshots.size() > _capacity)
    {
        snapshots.pop_front();
    }
}

SnapshotBracket SnapshotBuffer::bracket(const PeerId& peer, core::Millis renderTime) const
{
    SnapshotBracket result;
    const auto it = _history.find(peer);
    if (it == _history.end())
        return result;

    for (const auto& snapshot : it->second)
    {
        if (snapshot.timestamp <= renderTime)
        {
            result.before = &snapshot;
        }
        else
        {
            result.after = &snapshot;
            break;
        }
    }
    return result;
}

std::optional<PeerRecord> SnapshotBuffer::sample(const PeerId& peer, core::Millis renderTime,
                                                 const PeerRecord* live) const
{
    const SnapshotBracket b = bracket(peer, renderTime);

    if (b.before && b.after)
    {
        const core::Millis span = b.after->timestamp - b.before->timestamp;
        core::f64 fraction = span > 0.0 ? (renderTime - b.before->timestamp) / span : 1.0;
        fraction = std::clamp(fraction, 0.0, 1.0);
        return blend(b.before->record, b.after->record, fraction, kSnapThreshold);
    }

    const Snapshot* only = b.before ? b.before : b.after;
    if (!only)
        return std::nullopt;

    if (!live || !live->isObject())
        return only->record;

    return blend(*live, only->record, kNudgeFactor, -1.0);
}

const std::deque<Snapshot>* SnapshotBuffer::history(const PeerId& peer) const
{
    const auto it = _history.find(peer);
    return it == _history.end() ? nullptr : &it->second;
}

bool SnapshotBuffer::contains(const PeerId& peer) const
{
    const auto it = _history.find(peer);
    return it != _history.end() && !it->second.empty();
}

std::vector<PeerId> SnapshotBuffer::peers() const
{
    std::vector<PeerId> result;
    result.reserve(_history.size());
    for (const auto& [peer, snapshots] : _history)
    {
        if (!snapshots.empty())
            result.push_back(peer);
    }
    return result;
}

void SnapshotBuffer::erase(const PeerId& peer)
{
    _history.erase(peer);
}

void SnapshotBuffer::clear() noexcept
{
    _history.clear();
}

} // namespace tether::sync
