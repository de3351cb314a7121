#include "itemcrypt/crypto/KdfChecks.hpp"
#include "itemcrypt/crypto/providers/OpenSslProviderFactory.hpp"
#include "itemcrypt/security/SecureBuffer.hpp"
#include "itemcrypt/security/SecureRandom.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <span>
#include <stdexcept>

namespace itemcrypt::crypto::providers
{
namespace
{

constexpr const char* g_kKdfParamArgon2Memcost{ "memcost" };
constexpr const char* g_kKdfParamArgon2Lanes{ "lanes" };
constexpr const char* g_kKdfParamThreads{ "threads" };
constexpr const char* g_kKdfParamArgon2Version{ "version" };

// Argon2 v1.3, the only version monocypher implements.
constexpr std::uint32_t g_kArgon2VersionV13{ 0x13U };

constexpr std::size_t g_kBlake2bMaxKeyBytes{ 64U };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;

EvpKdfPtr fetchArgon2idKdf()
{
    return EvpKdfPtr{ EVP_KDF_fetch(nullptr, "ARGON2ID", nullptr), &EVP_KDF_free };
}

EvpMacPtr fetchBlake2bMac()
{
    // OpenSSL MAC algorithm names are string-based. Try common variants.
    constexpr std::array<const char*, 2> kNames{ "BLAKE2BMAC", "BLAKE2B-MAC" };
    for (const char* name : kNames)
    {
        if (EVP_MAC * mac{ EVP_MAC_fetch(nullptr, name, nullptr) }; mac != nullptr)
        {
            return EvpMacPtr{ mac, &EVP_MAC_free };
        }
    }
    return EvpMacPtr{ nullptr, &EVP_MAC_free };
}

EvpMacPtr fetchHmac()
{
    return EvpMacPtr{ EVP_MAC_fetch(nullptr, "HMAC", nullptr), &EVP_MAC_free };
}

itemcrypt::security::SecureBuffer runMac(EVP_MAC* algorithm, std::span<const std::uint8_t> key,
                                         std::span<const std::span<const std::byte>> parts, OSSL_PARAM* initParams,
                                         std::size_t outBytes)
{
    EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(algorithm), &EVP_MAC_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error("mac: EVP_MAC_CTX_new failed");
    }
    if (EVP_MAC_init(ctx.get(), key.data(), key.size(), initParams) != 1)
    {
        throw std::runtime_error("mac: EVP_MAC_init failed");
    }

    for (const auto part : parts)
    {
        if (part.empty())
        {
            continue;
        }
        const auto* msg{ reinterpret_cast<const unsigned char*>(part.data()) };
        if (EVP_MAC_update(ctx.get(), msg, part.size()) != 1)
        {
            throw std::runtime_error("mac: EVP_MAC_update failed");
        }
    }

    itemcrypt::security::SecureBuffer tag(outBytes);
    std::size_t written{ tag.size() };
    if (EVP_MAC_final(ctx.get(), tag.data(), &written, tag.size()) != 1 || written != tag.size())
    {
        throw std::runtime_error("mac: EVP_MAC_final failed");
    }
    return tag;
}

class OpenSslCryptoProvider final : public itemcrypt::crypto::ICryptoProvider
{
public:
    OpenSslCryptoProvider()
        : m_argon2idKdf{ fetchArgon2idKdf() }, m_blake2bMac{ fetchBlake2bMac() }, m_hmac{ fetchHmac() }
    {
    }

    [[nodiscard]] itemcrypt::security::SecureBuffer
    mac(itemcrypt::scheme::MacAlgorithm algorithm, std::span<const std::uint8_t> key,
        std::span<const std::span<const std::byte>> parts) const override
    {
        switch (algorithm)
        {
        case itemcrypt::scheme::MacAlgorithm::Blake2b256:
            return blake2bKeyed(key, parts);
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
        itemcrypt::crypto::detail::requireKdfInputs(password, salt, scheme.keySize);

        if (!m_argon2idKdf)
        {
            throw std::runtime_error("deriveKey: OpenSSL Argon2id KDF not available");
        }

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_argon2idKdf.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_CTX_new failed");
        }

        std::uint32_t iter{ scheme.argon2id.iterations };
        std::uint32_t memcostKiB{ scheme.argon2id.memoryKiB };
        std::uint32_t lanes{ scheme.argon2id.parallelism };
        // Lanes fix the output; threads only schedule them. One thread needs no OSSL_set_max_threads().
        std::uint32_t threads{ 1U };
        std::uint32_t version{ g_kArgon2VersionV13 };

        // OSSL_PARAM takes non-const pointers even for inputs, so hand it private copies. The provider rejects a
        // null password pointer, so the copy keeps at least one byte even when the password is empty.
        itemcrypt::security::SecureBuffer passwordCopy(std::max<std::size_t>(password.size(), 1U));
        if (!password.empty())
        {
            std::memcpy(passwordCopy.data(), password.data(), password.size());
        }
        itemcrypt::security::SecureBuffer saltCopy{ itemcrypt::security::secureBufferFrom(salt) };

        OSSL_PARAM params[]{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, passwordCopy.data(), password.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltCopy.data(), saltCopy.size()),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_ITER, &iter),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Memcost, &memcostKiB),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Lanes, &lanes),
            OSSL_PARAM_construct_uint32(g_kKdfParamThreads, &threads),
            OSSL_PARAM_construct_uint32(g_kKdfParamArgon2Version, &version),
            OSSL_PARAM_construct_end(),
        };

        itemcrypt::security::SecureBuffer out(scheme.keySize);
        if (EVP_KDF_derive(ctx.get(), out.data(), out.size(), params) <= 0)
        {
            throw std::runtime_error("deriveKey: EVP_KDF_derive failed");
        }
        return out;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return itemcrypt::security::secureRandomFill(out);
    }

private:
    [[nodiscard]] itemcrypt::security::SecureBuffer
    blake2bKeyed(std::span<const std::uint8_t> key, std::span<const std::span<const std::byte>> parts) const
    {
        if (key.empty() || key.size() > g_kBlake2bMaxKeyBytes)
        {
            throw std::invalid_argument("mac: invalid BLAKE2b key size");
        }
        if (!m_blake2bMac)
        {
            throw std::runtime_error("mac: OpenSSL BLAKE2BMAC not available");
        }

        std::size_t outSize{ itemcrypt::scheme::macOutputBytes(itemcrypt::scheme::MacAlgorithm::Blake2b256) };
        OSSL_PARAM params[]{
            OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &outSize),
            OSSL_PARAM_construct_end(),
        };
        return runMac(m_blake2bMac.get(), key, parts, params, outSize);
    }

    [[nodiscard]] itemcrypt::security::SecureBuffer
    hmacSha512(std::span<const std::uint8_t> key, std::span<const std::span<const std::byte>> parts) const
    {
        if (key.empty())
        {
            throw std::invalid_argument("mac: empty HMAC key");
        }
        if (!m_hmac)
        {
            throw std::runtime_error("mac: OpenSSL HMAC not available");
        }

        char digestName[]{ "SHA512" };
        OSSL_PARAM params[]{
            OSSL_PARAM_construct_utf8_string(OSSL_MAC_PARAM_DIGEST, digestName, 0),
            OSSL_PARAM_construct_end(),
        };
        return runMac(m_hmac.get(), key, parts, params,
                      itemcrypt::scheme::macOutputBytes(itemcrypt::scheme::MacAlgorithm::HmacSha512));
    }

    EvpKdfPtr m_argon2idKdf{ nullptr, &EVP_KDF_free };
    EvpMacPtr m_blake2bMac{ nullptr, &EVP_MAC_free };
    EvpMacPtr m_hmac{ nullptr, &EVP_MAC_free };
};

} // namespace

std::unique_ptr<itemcrypt::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace itemcrypt::crypto::providers
