/**
 * @file Record.cpp
 * @brief Field-wise record blending.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/Record.hpp>

namespace tether::sync {

PeerRecord blend(const PeerRecord& from, const PeerRecord& to,
                 core::f64 t, core::f64 snapAfter)
{
    if (!to.isObject())
        return to;

    PeerRecord out{Json::objectValue};
    const bool haveFrom = from.isObject();

    for (const auto& name : to.getMemberNames())
    {
        const Json::Value& target = to[name];
        const Json::Value* source = haveFrom ? from.find(name.data(), name.data() + name.size())
                                             : nullptr;

        if (source && isNumber(*source) && isNumber(target))
        {
            const core::f64 a = source->asDouble();
            const core::f64 b = target.asDouble();
            if (a == b)
                out[name] = target;
            else
                out[name] = a + (b - a) * t;
        }
        else if (t > snapAfter)
        {
            out[name] = target;
        }
        else if (source)
        {
            out[name] = *source;
        }
    }

    if (haveFrom && t <= snapAfter)
    {
        for (const auto& name : from.getMemberNames())
        {
            if (!to.isMember(name))
                out[name] = from[name];
        }
    }

    return out;
}

} // namespace tether::sync
