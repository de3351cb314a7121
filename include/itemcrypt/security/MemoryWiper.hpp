#ifndef INCLUDE_ITEMCRYPT_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_ITEMCRYPT_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace itemcrypt::security
{

// Zeroes the range; the write is never elided by the optimizer.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> region) noexcept
{
    secureWipe(std::as_writable_bytes(region));
}

} // namespace itemcrypt::security

#endif // INCLUDE_ITEMCRYPT_SECURITY_MEMORYWIPER_HPP
