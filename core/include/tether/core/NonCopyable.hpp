/**
 * @file NonCopyable.hpp
 * @brief CRTP base that removes copy operations from a derived class.
 *
 * @author MasterLaplace
 * @version 0.1.0
 * @date 2026-02-26
 * @copyright MIT License
 */
#pragma once

#ifndef TETHER_CORE_NONCOPYABLE_HPP
    #define TETHER_CORE_NONCOPYABLE_HPP

namespace tether::core {

/**
 * @brief Derive from this to forbid copying; moves stay available unless
 *        the derived class removes them itself.
 * @tparam Derived The CRTP derived class.
 */
template <typename Derived>
class NonCopyable {
protected:
    NonCopyable()  = default;
    ~NonCopyable() = default;

    NonCopyable(const NonCopyable &)            = delete;
    NonCopyable &operator=(const NonCopyable &)  = delete;

    NonCopyable(NonCopyable &&)                 = default;
    NonCopyable &operator=(NonCopyable &&)       = default;
};

} // namespace tether::core

#endif // TETHER_CORE_NONCOPYABLE_HPP
