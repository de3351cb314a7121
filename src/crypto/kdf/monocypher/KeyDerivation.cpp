#include "itemcrypt/crypto/KeyDerivation.hpp"

#include "itemcrypt/crypto/KdfChecks.hpp"
#include "itemcrypt/security/ZeroAllocator.hpp"
#include <monocypher.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <new>
#include <vector>

namespace itemcrypt::crypto
{

itemcrypt::security::SecureBuffer deriveKeyArgon2id(std::span<const std::byte> password,
                                                    std::span<const std::uint8_t> salt,
                                                    itemcrypt::scheme::Argon2idParams params, std::size_t keyBytes)
{
    detail::requireKdfInputs(password, salt, keyBytes);
    detail::requireArgon2idParamsSafe(params);

    constexpr std::size_t kU64WordsPerKiB{ 128U }; // 1024 / sizeof(uint64_t)
    if (params.memoryKiB > (std::numeric_limits<std::size_t>::max() / kU64WordsPerKiB))
    {
        throw std::bad_alloc{};
    }
    std::vector<std::uint64_t, itemcrypt::security::ZeroAllocator<std::uint64_t>> workArea(
        static_cast<std::size_t>(params.memoryKiB) * kU64WordsPerKiB);

    itemcrypt::security::SecureBuffer key(keyBytes);

    const crypto_argon2_config cfg{ .algorithm = CRYPTO_ARGON2_ID,
                                    .nb_blocks = params.memoryKiB,
                                    .nb_passes = params.iterations,
                                    .nb_lanes = params.parallelism };

    const crypto_argon2_inputs inputs{ .pass = reinterpret_cast<const std::uint8_t*>(password.data()),
                                       .salt = salt.data(),
                                       .pass_size = static_cast<std::uint32_t>(password.size()),
                                       .salt_size = static_cast<std::uint32_t>(salt.size()) };

    crypto_argon2(key.data(), static_cast<std::uint32_t>(key.size()), workArea.data(), cfg, inputs,
                  crypto_argon2_no_extras);

    return key;
}

} // namespace itemcrypt::crypto
