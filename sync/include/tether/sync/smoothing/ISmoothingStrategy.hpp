// /////////////////////////////////////////////////////////////////////////////
/// @file ISmoothingStrategy.hpp
/// @brief Abstract smoothing strategy interface (Strategy pattern).
// /////////////////////////////////////////////////////////////////////////////

#pragma once

#include <tether/sync/PrivateFieldFilter.hpp>
#include <tether/sync/Config.hpp>

#include <memory>

namespace tether::sync::smoothing {

// /////////////////////////////////////////////////////////////////////////////
/// @class ISmoothingStrategy
/// @brief Decides how a sanitized remote record reaches the peer collection.
///
/// Concrete strategies:
///   - @c DirectStrategy: overwrite the entry as soon as a record arrives.
///   - @c LerpStrategy: approach the latest record a fraction per render tick.
///   - @c InterpolateStrategy: render between buffered snapshots, delayed.
///
/// Records handed to a strategy never carry private fields.
// /////////////////////////////////////////////////////////////////////////////
class ISmoothingStrategy
{
public:
    virtual ~ISmoothingStrategy() = default;

    /// @brief Handles a record for a peer the strategy may already track.
    /// @param collection Bound peer collection.
    /// @param peer       Remote peer id.
    /// @param record     Public fields of the update.
    /// @param timestamp  Local time the record describes.
    /// @param now        Current local time.
    virtual void onRecord(Json::Value& collection, const PeerId& peer, PeerRecord record,
                          core::Millis timestamp, core::Millis now) = 0;

    /// @brief Applies @p record at once and restarts the peer's smoothing
    ///        from it. Used for first sightings and full-state recovery.
    virtual void prime(Json::Value& collection, const PeerId& peer, PeerRecord record,
                       core::Millis timestamp) = 0;

    /// @brief @c true if the strategy holds state for @p peer.
    [[nodiscard]] virtual bool tracks(const PeerId& peer) const = 0;

    /// @brief Discards the smoothing state of a departed peer.
    virtual void forget(const PeerId& peer) = 0;

    /// @brief Discards every peer's smoothing state.
    virtual void clear() = 0;

    /// @brief Render-cadence step.
    virtual void render(Json::Value& collection, core::Millis now) = 0;

    /// @brief Returns a human-readable name.
    [[nodiscard]] virtual const char* name() const noexcept = 0;
};

/// @brief Builds the strategy selected by @p config.
/// @param filter Must outlive the returned strategy.
[[nodiscard]] std::unique_ptr<ISmoothingStrategy> makeStrategy(const Config& config,
                                                               const PrivateFieldFilter& filter);

/// @brief Overwrites @p collection[@p peer] with @p record, keeping private
///        fields already present on the entry.
void overwrite(Json::Value& collection, const PeerId& peer, PeerRecord record,
               const PrivateFieldFilter& filter);

} // namespace tether::sync::smoothing
