#ifndef INCLUDE_ITEMCRYPT_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_ITEMCRYPT_SECURITY_SECUREBUFFER_HPP

#include "itemcrypt/security/ZeroAllocator.hpp"
#include <cstdint>
#include <span>
#include <vector>

namespace itemcrypt::security
{

// Owner of key material: seeds, IVs, salts, MAC tags and derived keys.
using SecureBuffer = std::vector<std::uint8_t, ZeroAllocator<std::uint8_t>>;

[[nodiscard]] inline SecureBuffer secureBufferFrom(std::span<const std::uint8_t> bytes)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureBuffer(bytes.begin(), bytes.end());
}

[[nodiscard]] inline std::span<const std::uint8_t> asSpan(const SecureBuffer& b) noexcept
{
    return std::span{ b };
}

[[nodiscard]] inline std::span<std::uint8_t> asSpan(SecureBuffer& b) noexcept
{
    return std::span{ b };
}

// Growth goes through ZeroAllocator, so a reallocation leaves no stale copy behind.
inline void append(SecureBuffer& out, std::span<const std::uint8_t> bytes)
{
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace itemcrypt::security

#endif // INCLUDE_ITEMCRYPT_SECURITY_SECUREBUFFER_HPP
