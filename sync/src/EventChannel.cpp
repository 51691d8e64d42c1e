/**
 * @file EventChannel.cpp
 * @brief EventChannel implementation and event kind names.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/EventChannel.hpp>
#include <tether/core/Log.hpp>

#include <algorithm>
#include <exception>
#include <string>

namespace tether::sync {

std::string_view toString(EventKind kind) noexcept
{
    switch (kind)
    {
        case EventKind::Connected:    return "connected";
        case EventKind::Disconnected: return "disconnected";
        case EventKind::Reconnecting: return "reconnecting";
        case EventKind::Reconnected:  return "reconnected";
        case EventKind::PeerJoined:   return "join";
        case EventKind::PeerLeft:     return "leave";
        case EventKind::Message:      return "message";
        case EventKind::Error:        return "error";
        default:                      return "unknown";
    }
}

SubscriptionId EventChannel::subscribe(EventKind kind, EventHandler handler)
{
    if (!handler || kind >= EventKind::Count)
        return kInvalidSubscription;

    const SubscriptionId id = _nextId++;
    _handlers[static_cast<core::usize>(kind)].emplace_back(id, std::move(handler));
    return id;
}

bool EventChannel::unsubscribe(SubscriptionId id)
{
    for (auto& list : _handlers)
    {
        const auto it = std::find_if(list.begin(), list.end(),
                                     [id](const auto& entry) { return entry.first == id; });
        if (it != list.end())
        {
            list.erase(it);
            return true;
        }
    }
    return false;
}

void EventChannel::emit(const SyncEvent& event)
{
    const EventKind kind = kindOf(event);

    // Handlers may (un)subscribe while running; dispatch over a snapshot.
    const auto handlers = _handlers[static_cast<core::usize>(kind)];
    for (const auto& [id, handler] : handlers)
    {
        try
        {
            handler(event);
        }
        catch (const std::exception& e)
        {
            core::Log::error("Binding", "'" + std::string{toString(kind)} + "' handler #"
                                            + std::to_string(id) + " threw: " + e.what());
        }
    }
}

core::usize EventChannel::count(EventKind kind) const noexcept
{
    if (kind >= EventKind::Count)
        return 0;
    return _handlers[static_cast<core::usize>(kind)].size();
}

void EventChannel::clear() noexcept
{
    for (auto& list : _handlers)
        list.clear();
}

} // namespace tether::sync
