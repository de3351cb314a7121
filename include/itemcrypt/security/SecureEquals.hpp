#ifndef INCLUDE_ITEMCRYPT_SECURITY_SECUREEQUALS_HPP
#define INCLUDE_ITEMCRYPT_SECURITY_SECUREEQUALS_HPP

#include "itemcrypt/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace itemcrypt::security
{

// Constant time in the length of the inputs. Ranges of different length are never equal.
[[nodiscard]] inline bool secureEquals(std::span<const std::uint8_t> a, std::span<const std::uint8_t> b) noexcept
{
    if (a.size() != b.size())
    {
        return false;
    }

    volatile std::uint8_t diff{};
    for (std::size_t i{}; i < a.size(); ++i)
    {
        diff |= static_cast<std::uint8_t>(a[i] ^ b[i]);
    }
    return diff == 0U;
}

[[nodiscard]] inline bool secureEquals(const SecureBuffer& a, const SecureBuffer& b) noexcept
{
    return secureEquals(asSpan(a), asSpan(b));
}

} // namespace itemcrypt::security

#endif // INCLUDE_ITEMCRYPT_SECURITY_SECUREEQUALS_HPP
