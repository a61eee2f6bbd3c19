/**
 * @file opaque_ptr_key.hpp
 */
#pragma once
#include "modgraph/common/common.hpp"

namespace modgraph
{

/**
 * @brief A non-dereferenceable, hashable identity derived from an object address.
 *
 * @details
 * OpaquePtrKey captures a pointer's address as a `std::uintptr_t`. The analyzer uses it
 * to key side tables by compiled-unit identity: two structurally equal units built
 * separately are different keys, and the same shared unit reached twice is the same key.
 * The original pointer cannot be recovered.
 *
 * @par Construction
 * - From `const T*` or from `std::shared_ptr<const T>` / `std::shared_ptr<T>`.
 * - A key built from `nullptr` is null; test with `!key`.
 *
 * @par Ownership and lifetime
 * - Non-owning. A key must not outlive the object it was taken from when it is used
 *   for lookups, because address reuse would make a different object compare equal.
 *   Compiled units are held by `shared_ptr` for the whole analysis, so keys taken
 *   during one `analyze()` call stay unique for that call.
 *
 * @par Type safety
 * - Comparison only accepts keys of the same `T`.
 * - Hash values incorporate `typeid(T)`.
 */
template <typename T>
class OpaquePtrKey
{
public:
    explicit OpaquePtrKey(const T* ptr) noexcept
        : m_value(reinterpret_cast<std::uintptr_t>(ptr))
    {
    }

    explicit OpaquePtrKey(const std::shared_ptr<T>& ptr) noexcept
        : m_value(reinterpret_cast<std::uintptr_t>(ptr.get()))
    {
    }

    explicit OpaquePtrKey(const std::shared_ptr<const T>& ptr) noexcept
        : m_value(reinterpret_cast<std::uintptr_t>(ptr.get()))
    {
    }

    bool operator==(const OpaquePtrKey<T>& other) const noexcept
    {
        return m_value == other.m_value;
    }

    bool operator!=(const OpaquePtrKey<T>& other) const noexcept
    {
        return !(*this == other);
    }

    bool operator<(const OpaquePtrKey<T>& other) const noexcept
    {
        return m_value < other.m_value;
    }

    bool operator!() const noexcept
    {
        return !m_value;
    }

    std::size_t hash() const noexcept
    {
        return std::hash<std::uintptr_t>()(m_value) ^ stc_type_hash();
    }

private:
    static std::size_t stc_type_hash() noexcept
    {
        return std::type_index(typeid(T)).hash_code();
    }

private:
    std::uintptr_t m_value;
};

} // namespace modgraph

namespace std
{

template <typename T>
struct hash<modgraph::OpaquePtrKey<T>>
{
    std::size_t operator()(const modgraph::OpaquePtrKey<T>& key) const noexcept
    {
        return key.hash();
    }
};

} // namespace std
