#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "itemcrypt/crypto/KeyDerivation.hpp"
#include "itemcrypt/crypto/providers/NativeProviderFactory.hpp"
#include "itemcrypt/security/SecureEquals.hpp"
#include "test_utils/Hex.hpp"

namespace
{

constexpr std::uint32_t g_fastMemoryKiB{ 8U };

std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

std::span<const std::uint8_t> asU8(std::string_view s) noexcept
{
    return { reinterpret_cast<const std::uint8_t*>(s.data()), s.size() };
}

itemcrypt::scheme::Scheme fastScheme()
{
    auto scheme{ itemcrypt::scheme::defaultScheme() };
    scheme.argon2id = { .iterations = 1U, .memoryKiB = g_fastMemoryKiB, .parallelism = 1U };
    return scheme;
}

} // namespace

// RFC 4231, test case 2.
TEST(NativeCryptoProvider, HmacSha512KnownAnswer)
{
    auto provider{ itemcrypt::crypto::providers::makeNativeCryptoProvider() };

    const std::array<std::span<const std::byte>, 1> parts{ asBytes("what do ya want for nothing?") };
    const auto tag{ provider->mac(itemcrypt::scheme::MacAlgorithm::HmacSha512, asU8("Jefe"), parts) };

    EXPECT_EQ(itemcrypt::test_utils::toHex(itemcrypt::security::asSpan(tag)),
              "164b7a7bfcf819e2e395fbe73b56e0a387bd64222e831fd610270cd7ea250554"
              "9758bf75c05a994a6d034f65f8f0e6fdcaeab1a34d4a6b4b636e070a38bce737");
}

TEST(NativeCryptoProvider, MacOutputMatchesAlgorithmWidth)
{
    auto provider{ itemcrypt::crypto::providers::makeNativeCryptoProvider() };
    const std::array<std::uint8_t, 16> key{ 0x01U };
    const std::array<std::span<const std::byte>, 1> parts{ asBytes("alice@example.com") };

    for (const auto algorithm :
         { itemcrypt::scheme::MacAlgorithm::Blake2b256, itemcrypt::scheme::MacAlgorithm::HmacSha512 })
    {
        EXPECT_EQ(provider->mac(algorithm, key, parts).size(), itemcrypt::scheme::macOutputBytes(algorithm));
    }
}

TEST(NativeCryptoProvider, MacStreamsPartsInOrder)
{
    auto provider{ itemcrypt::crypto::providers::makeNativeCryptoProvider() };
    const std::array<std::uint8_t, 16> key{ 0x42U };

    const std::vector<std::span<const std::byte>> split{ asBytes("alice@"), asBytes(""), asBytes("example.com") };
    const std::vector<std::span<const std::byte>> joined{ asBytes("alice@example.com") };
    const std::vector<std::span<const std::byte>> swapped{ asBytes("example.com"), asBytes("alice@") };

    for (const auto algorithm :
         { itemcrypt::scheme::MacAlgorithm::Blake2b256, itemcrypt::scheme::MacAlgorithm::HmacSha512 })
    {
        const auto a{ provider->mac(algorithm, key, split) };
        const auto b{ provider->mac(algorithm, key, joined) };
        const auto c{ provider->mac(algorithm, key, swapped) };
        EXPECT_TRUE(itemcrypt::security::secureEquals(a, b));
        EXPECT_FALSE(itemcrypt::security::secureEquals(a, c));
    }
}

TEST(NativeCryptoProvider, MacDependsOnKey)
{
    auto provider{ itemcrypt::crypto::providers::makeNativeCryptoProvider() };
    const std::array<std::uint8_t, 16> keyA{ 0x01U };
    const std::array<std::uint8_t, 16> keyB{ 0x02U };
    const std::array<std::span<const std::byte>, 1> parts{ asBytes("x") };

    EXPECT_FALSE(itemcrypt::security::secureEquals(
        provider->mac(itemcrypt::scheme::MacAlgorithm::Blake2b256, keyA, parts),
        provider->mac(itemcrypt::scheme::MacAlgorithm::Blake2b256, keyB, parts)));
}

TEST(NativeCryptoProvider, MacRejectsBadKeys)
{
    auto provider{ itemcrypt::crypto::providers::makeNativeCryptoProvider() };
    const std::array<std::uint8_t, 65> longKey{};

    EXPECT_THROW((void)provider->mac(itemcrypt::scheme::MacAlgorithm::Blake2b256, {}, {}), std::invalid_argument);
    EXPECT_THROW((void)provider->mac(itemcrypt::scheme::MacAlgorithm::Blake2b256, longKey, {}),
                 std::invalid_argument);
    EXPECT_THROW((void)provider->mac(itemcrypt::scheme::MacAlgorithm::HmacSha512, {}, {}), std::invalid_argument);
}

TEST(NativeCryptoProvider, DeriveKeyMatchesKdfBackend)
{
    auto provider{ itemcrypt::crypto::providers::makeNativeCryptoProvider() };
    const auto scheme{ fastScheme() };

    std::array<std::uint8_t, 32> salt{};
    salt[0] = 0x01U;

    constexpr std::string_view kPassword{ "strongPassword" };
    const auto a{ provider->deriveKey(asBytes(kPassword), salt, scheme) };
    const auto b{ itemcrypt::crypto::deriveKeyArgon2id(asBytes(kPassword), salt, scheme.argon2id, scheme.keySize) };

    ASSERT_EQ(a.size(), scheme.keySize);
    EXPECT_TRUE(itemcrypt::security::secureEquals(a, b));
}

TEST(NativeCryptoProvider, RandomBytesFillsBuffer)
{
    auto provider{ itemcrypt::crypto::providers::makeNativeCryptoProvider() };
    std::array<std::uint8_t, 32> a{};
    std::array<std::uint8_t, 32> b{};

    ASSERT_TRUE(provider->randomBytes(a));
    ASSERT_TRUE(provider->randomBytes(b));
    EXPECT_NE(a, b);
}
