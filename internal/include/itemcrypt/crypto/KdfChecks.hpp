#ifndef INTERNAL_INCLUDE_ITEMCRYPT_CRYPTO_KDFCHECKS_HPP
#define INTERNAL_INCLUDE_ITEMCRYPT_CRYPTO_KDFCHECKS_HPP

#include "itemcrypt/crypto/KeyDerivation.hpp"
#include "itemcrypt/scheme/Scheme.hpp"
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>

namespace itemcrypt::crypto::detail
{

// Shared by every backend so that all of them reject the same inputs. An empty password is valid Argon2 input.
inline void requireKdfInputs(std::span<const std::byte> password, std::span<const std::uint8_t> salt,
                             std::size_t keyBytes)
{
    if (password.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKey: password too large");
    }
    if (salt.size() < g_kMinSaltBytes || salt.size() > std::numeric_limits<std::uint32_t>::max())
    {
        throw std::invalid_argument("deriveKey: invalid salt size");
    }
    if (keyBytes < g_kMinKeyBytes || keyBytes > g_kMaxKeyBytes)
    {
        throw std::invalid_argument("deriveKey: invalid key size");
    }
}

inline void requireArgon2idParamsSafe(const itemcrypt::scheme::Argon2idParams& params)
{
    if (params.iterations == 0U || params.parallelism == 0U)
    {
        throw std::invalid_argument("deriveKey: invalid Argon2id parameters");
    }

    constexpr std::uint32_t parallelismCap{ 16U };
    constexpr std::uint32_t memoryKiBCap{ 1024U * 1024U };
    constexpr std::uint32_t iterationsCap{ 10U };
    if (params.parallelism > parallelismCap || params.memoryKiB > memoryKiBCap || params.iterations > iterationsCap)
    {
        throw std::invalid_argument("deriveKey: unsafe Argon2id parameters");
    }

    // Argon2 needs at least 8 blocks per lane, in whole multiples of 4 per lane.
    if (params.memoryKiB < params.parallelism * 8U || (params.memoryKiB % (params.parallelism * 4U)) != 0U)
    {
        throw std::invalid_argument("deriveKey: invalid Argon2id parameters");
    }
}

inline void requireSchemeSupported(const itemcrypt::scheme::Scheme& scheme)
{
    if (scheme.kdfAlgorithm != itemcrypt::scheme::KdfAlgorithm::Argon2id)
    {
        throw std::invalid_argument("deriveKey: unsupported KDF algorithm");
    }
    requireArgon2idParamsSafe(scheme.argon2id);
}

} // namespace itemcrypt::crypto::detail

#endif // INTERNAL_INCLUDE_ITEMCRYPT_CRYPTO_KDFCHECKS_HPP
