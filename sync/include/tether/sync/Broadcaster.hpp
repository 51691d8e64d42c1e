/**
 * @file Broadcaster.hpp
 * @brief Change-only publication of the local peer's record.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_BROADCASTER_HPP
    #define TETHER_SYNC_BROADCASTER_HPP

#include <tether/sync/PrivateFieldFilter.hpp>
#include <tether/sync/StateAdapter.hpp>
#include <tether/core/Expected.hpp>
#include <tether/core/NonCopyable.hpp>

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace tether::sync {

/**
 * @enum BroadcastResult
 * @brief What a single tick did.
 */
enum class BroadcastResult : core::u8
{
    NoRecord,   ///< Unbound collection, unknown local id, or no own entry.
    Unchanged,  ///< Public fields equal the last sent ones.
    Sent,
    Dropped     ///< Transport refused the frame; retried next tick.
};

/**
 * @class Broadcaster
 * @brief Publishes the public fields of the local entry when they change.
 *
 * Edits made between two ticks coalesce into a single frame. A frame the
 * transport refuses is not queued and does not count as sent.
 */
class Broadcaster final : public core::NonCopyable<Broadcaster>
{
public:
    using Sender = std::function<core::Expected<void>(std::string_view)>;

    Broadcaster(IStateAdapter& adapter, const PrivateFieldFilter& filter, Sender sender);

    void setLocalPeer(PeerId peer);

    /** @brief Periodic step: send if the public record changed. */
    BroadcastResult tick();

    /** @brief Sends the current public record even if unchanged. */
    BroadcastResult flush();

    /** @brief Forgets the last sent record so the next tick republishes. */
    void invalidate() noexcept;

    [[nodiscard]] const std::optional<std::string>& lastSent() const noexcept { return _lastSent; }
    [[nodiscard]] core::u64 sentCount() const noexcept { return _sentCount; }

private:
    BroadcastResult publish(bool force);

    IStateAdapter&             _adapter;
    const PrivateFieldFilter&  _filter;
    Sender                     _sender;
    PeerId                     _localPeer;
    std::optional<std::string> _lastSent;
    core::u64                  _sentCount{0};
};

} // namespace tether::sync

#endif // TETHER_SYNC_BROADCASTER_HPP
