/**
 * @file SnapshotBuffer.hpp
 * @brief Bounded per-peer history of timestamped records.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_SNAPSHOTBUFFER_HPP
    #define TETHER_SYNC_SNAPSHOTBUFFER_HPP

#include <tether/sync/Record.hpp>
#include <tether/core/Constants.hpp>

#include <deque>
#include <optional>
#include <unordered_map>
#include <vector>

namespace tether::sync {

/** @brief Timestamped copy of a peer record (local clock, ms). */
struct Snapshot
{
    core::Millis timestamp{0.0};
    PeerRecord   record{Json::objectValue};
};

/** @brief Snapshots surrounding a render time. Either side may be absent. */
struct SnapshotBracket
{
    const Snapshot* before{nullptr};
    const Snapshot* after{nullptr};
};

/**
 * @class SnapshotBuffer
 * @brief Keeps the most recent snapshots of every peer, oldest first.
 *
 * Inserts are sorted so that a late record never breaks the ordering;
 * equal timestamps keep arrival order. When a peer exceeds the capacity
 * its oldest snapshot is evicted.
 */
class SnapshotBuffer final
{
public:
    /** @brief Portion of the distance covered when only one side exists. */
    static constexpr core::f64 kNudgeFactor = core::kExtrapolationNudge;

    /** @brief Fraction past which non-numeric fields take the later value. */
    static constexpr core::f64 kSnapThreshold = 0.5;

    explicit SnapshotBuffer(core::usize capacity = core::kSnapshotCapacity);

    void push(const PeerId& peer, core::Millis timestamp, PeerRecord record);

    /**
     * @brief before = latest snapshot with t <= @p renderTime,
     *        after  = earliest snapshot with t > @p renderTime.
     */
    [[nodiscard]] SnapshotBracket bracket(const PeerId& peer, core::Millis renderTime) const;

    /**
     * @brief Record to display for @p peer at @p renderTime.
     *
     * With both sides, numeric fields are interpolated and the rest switch
     * over past the half-way point. With a single side, @p live is nudged
     * toward it (or the snapshot is returned as-is if there is no live
     * record).
     *
     * @return nullopt when the peer has no history.
     */
    [[nodiscard]] std::optional<PeerRecord> sample(const PeerId& peer, core::Millis renderTime,
                                                   const PeerRecord* live) const;

    [[nodiscard]] const std::deque<Snapshot>* history(const PeerId& peer) const;
    [[nodiscard]] bool contains(const PeerId& peer) const;
    [[nodiscard]] std::vector<PeerId> peers() const;

    void erase(const PeerId& peer);
    void clear() noexcept;

    [[nodiscard]] core::usize capacity() const noexcept { return _capacity; }

private:
    core::usize _capacity;
    std::unordered_map<PeerId, std::deque<Snapshot>> _history;
};

} // namespace tether::sync

#endif // TETHER_SYNC_SNAPSHOTBUFFER_HPP
