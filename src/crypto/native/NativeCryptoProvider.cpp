#include "itemcrypt/crypto/KdfChecks.hpp"
#include "itemcrypt/crypto/KeyDerivation.hpp"
#include "itemcrypt/crypto/providers/NativeProviderFactory.hpp"
#include "itemcrypt/security/ScopeWipe.hpp"
#include "itemcrypt/security/SecureBuffer.hpp"
#include "itemcrypt/security/SecureRandom.hpp"
#include <monocypher-ed25519.h>
#include <monocypher.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

namespace itemcrypt::crypto::providers
{
namespace
{

constexpr std::size_t g_kBlake2bMaxKeyBytes{ 64U };
constexpr std::size_t g_kHmacSha512Bytes{ 64U };

[[nodiscard]] const std::uint8_t* asU8(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const std::uint8_t*>(s.data());
}

itemcrypt::security::SecureBuffer blake2bKeyed(std::span<const std::uint8_t> key,
                                               std::span<const std::span<const std::byte>> parts,
                                               std::size_t outBytes)
{
    if (key.empty() || key.size() > g_kBlake2bMaxKeyBytes)
    {
        throw std::invalid_argument("mac: invalid BLAKE2b key size");
    }

    crypto_blake2b_ctx ctx{};
    const itemcrypt::security::ScopeWipe wipeCtx{ itemcrypt::security::wipeRegionOf(ctx) };

    crypto_blake2b_keyed_init(&ctx, outBytes, key.data(), key.size());
    for (const auto part : parts)
    {
        crypto_blake2b_update(&ctx, asU8(part), part.size());
    }

    itemcrypt::security::SecureBuffer tag(outBytes);
    crypto_blake2b_final(&ctx, tag.data());
    return tag;
}

itemcrypt::security::SecureBuffer hmacSha512(std::span<const std::uint8_t> key,
                                             std::span<const std::span<const std::byte>> parts)
{
    if (key.empty())
    {
        throw std::invalid_argument("mac: empty HMAC key");
    }

    crypto_sha512_hmac_ctx ctx{};
    const itemcrypt::security::ScopeWipe wipeCtx{ itemcrypt::security::wipeRegionOf(ctx) };

    crypto_sha512_hmac_init(&ctx, key.data(), key.size());
    for (const auto part : parts)
    {
        crypto_sha512_hmac_update(&ctx, asU8(part), part.size());
    }

    itemcrypt::security::SecureBuffer tag(g_kHmacSha512Bytes);
    crypto_sha512_hmac_final(&ctx, tag.data());
    return tag;
}

class NativeCryptoProvider final : public itemcrypt::crypto::ICryptoProvider
{
public:
    [[nodiscard]] itemcrypt::security::SecureBuffer
    mac(itemcrypt::scheme::MacAlgorithm algorithm, std::span<const std::uint8_t> key,
        std::span<const std::span<const std::byte>> parts) const override
    {
        switch (algorithm)
        {
        case itemcrypt::scheme::MacAlgorithm::Blake2b256:
            return blake2bKeyed(key, parts, itemcrypt::scheme::macOutputBytes(algorithm));
        case itemcrypt::scheme::MacAlgorithm::HmacSha512:
            return hmacSha512(key, parts);
        }
        throw std::invalid_argument("mac: unsupported algorithm");
    }

    [[nodiscard]] itemcrypt::security::SecureBuffer deriveKey(std::span<const std::byte> password,
                                                              std::span<const std::uint8_t> salt,
                                                              const itemcrypt::scheme::Scheme& scheme) const override
    {
        itemcrypt::crypto::detail::requireSchemeSupported(scheme);
        return itemcrypt::crypto::deriveKeyArgon2id(password, salt, scheme.argon2id, scheme.keySize);
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return itemcrypt::security::secureRandomFill(out);
    }
};

} // namespace

std::unique_ptr<itemcrypt::crypto::ICryptoProvider> makeNativeCryptoProvider()
{
    return std::make_unique<NativeCryptoProvider>();
}

} // namespace itemcrypt::crypto::providers
