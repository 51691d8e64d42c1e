/**
 * @file StateAdapter.cpp
 * @brief Keyed and heuristic peer collection adapters.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */

#include <tether/sync/StateAdapter.hpp>
#include <tether/core/Log.hpp>

namespace tether::sync {

namespace {

void replaceContents(Json::Value* bound, Json::Value peers)
{
    if (!bound)
        return;
    if (!peers.isObject())
    {
        core::Log::warn("Binding", "ignored non-object peer collection");
        return;
    }
    // Assigning through the pointer keeps the application's object in place.
    *bound = std::move(peers);
}

} // anonymous namespace

KeyedStateAdapter::KeyedStateAdapter(Json::Value& state, std::string key, bool createIfMissing)
    : _state{state}
    , _key{std::move(key)}
    , _createIfMissing{createIfMissing}
{}

core::Expected<void> KeyedStateAdapter::bind()
{
    _bound = nullptr;

    if (!_state.isObject() && !(_state.isNull() && _createIfMissing))
        return core::makeError(core::ErrorCode::kNotFound, "state is not an object");

    if (!_state.isMember(_key))
    {
        if (!_createIfMissing)
            return core::makeError(core::ErrorCode::kNotFound, "state has no member '" + _key + "'");
        _state[_key] = Json::Value{Json::objectValue};
    }

    Json::Value& candidate = _state[_key];
    if (!candidate.isObject())
        return core::makeError(core::ErrorCode::kNotFound, "member '" + _key + "' is not an object");

    _bound = &candidate;
    return {};
}

Json::Value* KeyedStateAdapter::getPeerCollection()
{
    return _bound;
}

void KeyedStateAdapter::setPeerCollection(Json::Value peers)
{
    replaceContents(_bound, std::move(peers));
}

HeuristicStateAdapter::HeuristicStateAdapter(Json::Value& state)
    : _state{state}
{}

core::Expected<void> HeuristicStateAdapter::bind()
{
    _bound = nullptr;
    _boundKey.clear();

    if (!_state.isObject())
        return core::makeError(core::ErrorCode::kNotFound, "state is not an object");

    for (const auto key : kConventionalKeys)
    {
        const std::string name{key};
        if (_state.isMember(name) && _state[name].isObject())
        {
            _bound = &_state[name];
            _boundKey = name;
            return {};
        }
    }

    for (const auto& name : _state.getMemberNames())
    {
        Json::Value& member = _state[name];
        if (member.isObject())
        {
            _bound = &member;
            _boundKey = name;
            core::Log::debug("Binding", "peer collection resolved by fallback to '" + name + "'");
            return {};
        }
    }

    return core::makeError(core::ErrorCode::kNotFound, "state has no object-valued member");
}

Json::Value* HeuristicStateAdapter::getPeerCollection()
{
    return _bound;
}

void HeuristicStateAdapter::setPeerCollection(Json::Value peers)
{
    replaceContents(_bound, std::move(peers));
}

} // namespace tether::sync
