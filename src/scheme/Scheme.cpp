#include "itemcrypt/scheme/Scheme.hpp"

namespace itemcrypt::scheme
{
namespace
{

constexpr std::uint32_t g_kKiBPerMiB{ 1024U };

constexpr Scheme g_kSchemeV1{
    .format = Format::V1,
    .seedSize = 16U,
    .initializationVectorSize = 16U,
    .stretchedSaltSize = 32U,
    .keySize = 32U,
    .macAlgorithm = MacAlgorithm::Blake2b256,
    .kdfAlgorithm = KdfAlgorithm::Argon2id,
    .argon2id = { .iterations = 3U, .memoryKiB = 64U * g_kKiBPerMiB, .parallelism = 1U },
};

constexpr Scheme g_kSchemeV2{
    .format = Format::V2,
    .seedSize = 32U,
    .initializationVectorSize = 16U,
    .stretchedSaltSize = 64U,
    .keySize = 32U,
    .macAlgorithm = MacAlgorithm::HmacSha512,
    .kdfAlgorithm = KdfAlgorithm::Argon2id,
    .argon2id = { .iterations = 4U, .memoryKiB = 256U * g_kKiBPerMiB, .parallelism = 1U },
};

} // namespace

std::size_t macOutputBytes(MacAlgorithm algorithm) noexcept
{
    switch (algorithm)
    {
    case MacAlgorithm::Blake2b256:
        return 32U;
    case MacAlgorithm::HmacSha512:
        return 64U;
    }
    return 0U;
}

Scheme schemeFor(Format format) noexcept
{
    switch (format)
    {
    case Format::V1:
        return g_kSchemeV1;
    case Format::V2:
        return g_kSchemeV2;
    }
    return g_kSchemeV1;
}

bool isRegistered(const Scheme& scheme) noexcept
{
    return isKnownFormat(static_cast<std::uint32_t>(scheme.format)) && scheme == schemeFor(scheme.format);
}

bool isSelfConsistent(const Scheme& scheme) noexcept
{
    return macOutputBytes(scheme.macAlgorithm) == scheme.stretchedSaltSize;
}

} // namespace itemcrypt::scheme
