#ifndef INCLUDE_ITEMCRYPT_SECURITY_SCOPEWIPE_HPP
#define INCLUDE_ITEMCRYPT_SECURITY_SCOPEWIPE_HPP

#include "itemcrypt/security/MemoryWiper.hpp"
#include <span>
#include <type_traits>

namespace itemcrypt::security
{

// Wipes a caller-owned object (typically a primitive's hashing context) when the guard leaves scope.
class [[nodiscard]] ScopeWipe final
{
public:
    explicit ScopeWipe(std::span<std::byte> region) noexcept : m_region{ region }
    {
    }

    ScopeWipe(const ScopeWipe&) = delete;
    ScopeWipe& operator=(const ScopeWipe&) = delete;
    ScopeWipe(ScopeWipe&&) = delete;
    ScopeWipe& operator=(ScopeWipe&&) = delete;

    ~ScopeWipe() noexcept
    {
        secureWipe(m_region);
    }

private:
    std::span<std::byte> m_region;
};

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
[[nodiscard]] std::span<std::byte> wipeRegionOf(T& object) noexcept
{
    return std::as_writable_bytes(std::span<T, 1>{ &object, 1 });
}

} // namespace itemcrypt::security

#endif // INCLUDE_ITEMCRYPT_SECURITY_SCOPEWIPE_HPP
