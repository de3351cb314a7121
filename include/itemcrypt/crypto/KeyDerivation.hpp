#ifndef INCLUDE_ITEMCRYPT_CRYPTO_KEYDERIVATION_HPP
#define INCLUDE_ITEMCRYPT_CRYPTO_KEYDERIVATION_HPP

#include "itemcrypt/scheme/Scheme.hpp"
#include "itemcrypt/security/SecureBuffer.hpp"
#include <cstddef>
#include <span>

namespace itemcrypt::crypto
{

constexpr std::size_t g_kMinSaltBytes{ 8U };
constexpr std::size_t g_kMinKeyBytes{ 16U };
constexpr std::size_t g_kMaxKeyBytes{ 64U };

// Argon2id (v1.3) over monocypher.
[[nodiscard]] itemcrypt::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> password,
                                                                  std::span<const std::uint8_t> salt,
                                                                  itemcrypt::scheme::Argon2idParams params,
                                                                  std::size_t keyBytes);

} // namespace itemcrypt::crypto

#endif // INCLUDE_ITEMCRYPT_CRYPTO_KEYDERIVATION_HPP
