/**
 * @file PrivateFieldFilter.hpp
 * @brief Visibility policy separating public from private record fields.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_PRIVATEFIELDFILTER_HPP
    #define TETHER_SYNC_PRIVATEFIELDFILTER_HPP

#include <tether/sync/Record.hpp>

#include <functional>
#include <set>
#include <string>
#include <string_view>

namespace tether::sync {

/**
 * @class PrivateFieldFilter
 * @brief Decides which top-level fields of a record may leave the process.
 *
 * A field is private when its name starts with the marker character
 * (default '_') or when it was annotated with markPrivate(). Markers on
 * members nested inside a field are not interpreted.
 */
class PrivateFieldFilter final
{
public:
    static constexpr char kDefaultMarker = '_';

    explicit PrivateFieldFilter(char marker = kDefaultMarker);

    /** @brief Declares @p name private regardless of its spelling. */
    void markPrivate(std::string name);

    [[nodiscard]] bool isPrivate(std::string_view name) const;

    /** @brief Copy of @p record without its private fields. */
    [[nodiscard]] PeerRecord strip(const PeerRecord& record) const;

    /** @brief Removes private fields from @p record in place. */
    void stripInPlace(PeerRecord& record) const;

    /**
     * @brief Copies the private fields of @p source into @p target.
     *
     * Used after a remote record replaced a collection entry, so that
     * fields the local application attached to that entry survive.
     */
    void restore(PeerRecord& target, const PeerRecord& source) const;

    /** @brief @c true if @p record has at least one private field. */
    [[nodiscard]] bool hasPrivate(const PeerRecord& record) const;

private:
    char                  _marker;
    std::set<std::string, std::less<>> _names;
};

} // namespace tether::sync

#endif // TETHER_SYNC_PRIVATEFIELDFILTER_HPP
