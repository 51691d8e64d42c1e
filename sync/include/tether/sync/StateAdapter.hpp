/**
 * @file StateAdapter.hpp
 * @brief Access to the peer collection inside application-owned state.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_SYNC_STATEADAPTER_HPP
    #define TETHER_SYNC_STATEADAPTER_HPP

#include <tether/sync/Record.hpp>
#include <tether/core/Expected.hpp>

#include <array>
#include <string>
#include <string_view>

namespace tether::sync {

/**
 * @class IStateAdapter
 * @brief Primary contract between the engine and the application state.
 *
 * The engine never owns or replaces the application's state; it only reads
 * and writes entries of the collection returned here.
 */
class IStateAdapter
{
public:
    virtual ~IStateAdapter() = default;

    /**
     * @brief Resolves the collection for a new session.
     * @return kNotFound when the state has no usable collection; the
     *         binding then stays disabled until the next bind().
     */
    [[nodiscard]] virtual core::Expected<void> bind() = 0;

    /** @brief The bound collection (peer id -> record), or nullptr. */
    [[nodiscard]] virtual Json::Value* getPeerCollection() = 0;

    /** @brief Replaces the contents of the bound collection in place. */
    virtual void setPeerCollection(Json::Value peers) = 0;
};

/**
 * @class KeyedStateAdapter
 * @brief Collection stored under a fixed top-level key.
 */
class KeyedStateAdapter final : public IStateAdapter
{
public:
    /**
     * @param state Application state, must outlive the adapter.
     * @param key   Top-level member holding the collection.
     * @param createIfMissing Insert an empty object when the key is absent.
     */
    KeyedStateAdapter(Json::Value& state, std::string key, bool createIfMissing = false);

    [[nodiscard]] core::Expected<void> bind() override;
    [[nodiscard]] Json::Value* getPeerCollection() override;
    void setPeerCollection(Json::Value peers) override;

    [[nodiscard]] const std::string& key() const noexcept { return _key; }

private:
    Json::Value& _state;
    std::string  _key;
    bool         _createIfMissing;
    Json::Value* _bound{nullptr};
};

/**
 * @class HeuristicStateAdapter
 * @brief Schema-free convenience layer over KeyedStateAdapter semantics.
 *
 * bind() looks for the first conventional name (see kConventionalKeys)
 * present at the top level with an object value, then falls back to the
 * first object-valued member in key order. Nothing found leaves the
 * adapter unbound.
 */
class HeuristicStateAdapter final : public IStateAdapter
{
public:
    static constexpr std::array<std::string_view, 6> kConventionalKeys{
        "players", "peers", "entities", "users", "clients", "members"
    };

    explicit HeuristicStateAdapter(Json::Value& state);

    [[nodiscard]] core::Expected<void> bind() override;
    [[nodiscard]] Json::Value* getPeerCollection() override;
    void setPeerCollection(Json::Value peers) override;

    /** @brief Key chosen by the last successful bind(), empty otherwise. */
    [[nodiscard]] const std::string& boundKey() const noexcept { return _boundKey; }

private:
    Json::Value& _state;
    std::string  _boundKey;
    Json::Value* _bound{nullptr};
};

} // namespace tether::sync

#endif // TETHER_SYNC_STATEADAPTER_HPP
