/**
 * @file EventChannel.hpp
 * @brief Subscriber registry dispatching SyncEvent values by kind.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_EVENTCHANNEL_HPP
    #define TETHER_SYNC_EVENTCHANNEL_HPP

#include <tether/sync/Events.hpp>

#include <array>
#include <functional>
#include <utility>
#include <vector>

namespace tether::sync {

using SubscriptionId = core::u64;
using EventHandler   = std::function<void(const SyncEvent&)>;

inline constexpr SubscriptionId kInvalidSubscription = 0;

/**
 * @class EventChannel
 * @brief Ordered per-kind handler lists.
 *
 * Handlers run in subscription order. A handler may subscribe or
 * unsubscribe (itself included) while an event is being dispatched; the
 * change applies from the next emit. An exception escaping a handler is
 * logged and the remaining handlers still run.
 */
class EventChannel final
{
public:
    /** @return kInvalidSubscription for an empty handler or kind Count. */
    SubscriptionId subscribe(EventKind kind, EventHandler handler);

    /** @return @c false if @p id was not subscribed. */
    bool unsubscribe(SubscriptionId id);

    void emit(const SyncEvent& event);

    [[nodiscard]] core::usize count(EventKind kind) const noexcept;

    void clear() noexcept;

private:
    static constexpr auto kKinds = static_cast<core::usize>(EventKind::Count);

    std::array<std::vector<std::pair<SubscriptionId, EventHandler>>, kKinds> _handlers;
    SubscriptionId _nextId{1};
};

} // namespace tether::sync

#endif // TETHER_SYNC_EVENTCHANNEL_HPP
