/**
 * @file JitterQueue.hpp
 * @brief Artificial delay line for inbound peer records.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_JITTERQUEUE_HPP
    #define TETHER_SYNC_JITTERQUEUE_HPP

#include <tether/sync/Record.hpp>

#include <deque>
#include <vector>

namespace tether::sync {

struct JitterItem
{
    PeerId       peerId;
    core::Millis deliverAt{0.0};
    core::Millis timestamp{0.0};
    PeerRecord   record{Json::objectValue};
};

/**
 * @class JitterQueue
 * @brief Holds records until their delivery time, then releases them in
 *        arrival order.
 */
class JitterQueue final
{
public:
    void push(JitterItem item);

    /** @brief Removes and returns every item with deliverAt <= @p now. */
    [[nodiscard]] std::vector<JitterItem> promote(core::Millis now);

    /** @brief @c true if an item for @p peer is still waiting. */
    [[nodiscard]] bool holds(const PeerId& peer) const;

    void erase(const PeerId& peer);
    void clear() noexcept { _items.clear(); }

    [[nodiscard]] core::usize size() const noexcept { return _items.size(); }
    [[nodiscard]] bool empty() const noexcept { return _items.empty(); }

private:
    std::deque<JitterItem> _items;
};

} // namespace tether::sync

#endif // TETHER_SYNC_JITTERQUEUE_HPP
