#ifndef INCLUDE_ITEMCRYPT_SECURITY_SECURERANDOM_HPP
#define INCLUDE_ITEMCRYPT_SECURITY_SECURERANDOM_HPP

#include <cstdint>
#include <span>

namespace itemcrypt::security
{

// Fills `out` from the operating system CSPRNG. Returns false if the source fails; `out` is then unspecified.
[[nodiscard]] bool secureRandomFill(std::span<std::uint8_t> out) noexcept;

} // namespace itemcrypt::security

#endif // INCLUDE_ITEMCRYPT_SECURITY_SECURERANDOM_HPP
