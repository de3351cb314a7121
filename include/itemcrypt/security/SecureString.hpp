#ifndef INCLUDE_ITEMCRYPT_SECURITY_SECURESTRING_HPP
#define INCLUDE_ITEMCRYPT_SECURITY_SECURESTRING_HPP

#include "itemcrypt/security/ZeroAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace itemcrypt::security
{

// Password text after normalization. UTF-8, not NUL-terminated, wiped on release.
using SecureString = std::vector<char, ZeroAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    return s.empty() ? std::string_view{} : std::string_view{ s.data(), s.size() };
}

// The KDF consumes the password as raw octets.
[[nodiscard]] inline std::span<const std::byte> asBytes(const SecureString& s) noexcept
{
    return std::as_bytes(std::span{ s });
}

} // namespace itemcrypt::security

#endif // INCLUDE_ITEMCRYPT_SECURITY_SECURESTRING_HPP
