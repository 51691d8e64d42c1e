/**
 * @file PrivateFieldFilter.cpp
 * @brief PrivateFieldFilter implementation.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/PrivateFieldFilter.hpp>

namespace tether::sync {

PrivateFieldFilter::PrivateFieldFilter(char marker)
    : _marker{marker}
{}

void PrivateFieldFilter::markPrivate(std::string name)
{
    _names.insert(std::move(name));
}

bool PrivateFieldFilter::isPrivate(std::string_view name) const
{
    if (!name.empty() && name.front() == _marker)
        return true;
    return _names.find(name) != _names.end();
}

PeerRecord PrivateFieldFilter::strip(const PeerRecord& record) const
{
    PeerRecord copy = record;
    stripInPlace(copy);
    return copy;
}

void PrivateFieldFilter::stripInPlace(PeerRecord& record) const
{
    if (!record.isObject())
        return;

    for (const auto& name : record.getMemberNames())
    {
        if (isPrivate(name))
            record.removeMember(name);
    }
}

void PrivateFieldFilter::restore(PeerRecord& target, const PeerRecord& source) const
{
    if (!target.isObject() || !source.isObject())
        return;

    for (const auto& name : source.getMemberNames())
    {
        if (isPrivate(name))
            target[name] = source[name];
    }
}

bool PrivateFieldFilter::hasPrivate(const PeerRecord& record) const
{
    if (!record.isObject())
        return false;

    for (const auto& name : record.getMemberNames())
    {
        if (isPrivate(name))
            return true;
    }
    return false;
}

} // namespace tether::sync
