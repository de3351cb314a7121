#ifndef INCLUDE_ITEMCRYPT_SCHEME_SCHEME_HPP
#define INCLUDE_ITEMCRYPT_SCHEME_SCHEME_HPP

#include "itemcrypt/scheme/Format.hpp"
#include <cstddef>
#include <cstdint>

namespace itemcrypt::scheme
{

// MAC used to turn a seed plus keywords into the treated salt.
enum class MacAlgorithm : std::uint8_t
{
    // V1. Keyed BLAKE2b with a 32-byte tag, not an HMAC construction.
    Blake2b256,
    // V2. HMAC over SHA-512, 64-byte tag.
    HmacSha512,
};

enum class KdfAlgorithm : std::uint8_t
{
    Argon2id,
};

struct Argon2idParams final
{
    std::uint32_t iterations{};
    std::uint32_t memoryKiB{};
    std::uint32_t parallelism{};

    bool operator==(const Argon2idParams&) const = default;
};

struct Scheme final
{
    Format format{ g_primaryFormat };
    std::size_t seedSize{};
    std::size_t initializationVectorSize{};
    std::size_t stretchedSaltSize{};
    std::size_t keySize{};
    MacAlgorithm macAlgorithm{ MacAlgorithm::Blake2b256 };
    KdfAlgorithm kdfAlgorithm{ KdfAlgorithm::Argon2id };
    Argon2idParams argon2id{};

    bool operator==(const Scheme&) const = default;
};

[[nodiscard]] std::size_t macOutputBytes(MacAlgorithm algorithm) noexcept;

// Scheme parameters are a pure function of the version tag.
[[nodiscard]] Scheme schemeFor(Format format) noexcept;

[[nodiscard]] inline Scheme defaultScheme() noexcept
{
    return schemeFor(g_primaryFormat);
}

// True when `scheme` is exactly schemeFor(scheme.format). Serialized keys carry only the format tag, so
// keys can only be built under registered schemes.
[[nodiscard]] bool isRegistered(const Scheme& scheme) noexcept;

// True when the MAC tag width equals the stretched salt size, i.e. a salt treated under this scheme
// passes the scheme's own size check.
[[nodiscard]] bool isSelfConsistent(const Scheme& scheme) noexcept;

} // namespace itemcrypt::scheme

#endif // INCLUDE_ITEMCRYPT_SCHEME_SCHEME_HPP
