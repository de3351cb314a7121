#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>
#include <string_view>

#include "itemcrypt/crypto/KeyDerivation.hpp"
#include "itemcrypt/security/SecureEquals.hpp"

namespace
{

constexpr std::size_t g_saltBytes{ 32U };
constexpr std::size_t g_keyBytes{ 32U };

constexpr itemcrypt::scheme::Argon2idParams g_kFastTestParams{ .iterations = 1U, .memoryKiB = 8U, .parallelism = 1U };

constexpr std::string_view g_kStrongPassword{ "strongPassword" };

std::span<const std::byte> asBytes(std::string_view s)
{
    return { reinterpret_cast<const std::byte*>(s.data()), s.size() };
}

itemcrypt::security::SecureBuffer derive(std::span<const std::uint8_t> salt,
                                         itemcrypt::scheme::Argon2idParams params = g_kFastTestParams,
                                         std::size_t keyBytes = g_keyBytes)
{
    return itemcrypt::crypto::deriveKeyArgon2id(asBytes(g_kStrongPassword), salt, params, keyBytes);
}

} // namespace

TEST(KeyDerivation, EmptyPasswordDerivesDeterministicKey)
{
    std::array<std::uint8_t, g_saltBytes> salt{};
    const auto deriveEmpty = [&] {
        return itemcrypt::crypto::deriveKeyArgon2id(std::span<const std::byte>{}, std::span{ salt }, g_kFastTestParams,
                                                    g_keyBytes);
    };

    const auto a{ deriveEmpty() };
    const auto b{ deriveEmpty() };

    ASSERT_EQ(a.size(), g_keyBytes);
    EXPECT_TRUE(itemcrypt::security::secureEquals(a, b));
    EXPECT_FALSE(itemcrypt::security::secureEquals(a, derive(std::span{ salt })));
}

TEST(KeyDerivation, RejectsShortSalt)
{
    std::array<std::uint8_t, itemcrypt::crypto::g_kMinSaltBytes - 1U> salt{};
    EXPECT_THROW((void)derive(std::span{ salt }), std::invalid_argument);
}

TEST(KeyDerivation, RejectsOutOfRangeKeySize)
{
    std::array<std::uint8_t, g_saltBytes> salt{};
    EXPECT_THROW((void)derive(std::span{ salt }, g_kFastTestParams, itemcrypt::crypto::g_kMinKeyBytes - 1U),
                 std::invalid_argument);
    EXPECT_THROW((void)derive(std::span{ salt }, g_kFastTestParams, itemcrypt::crypto::g_kMaxKeyBytes + 1U),
                 std::invalid_argument);
}

TEST(KeyDerivation, RejectsUnsafeParameters)
{
    std::array<std::uint8_t, g_saltBytes> salt{};

    EXPECT_THROW((void)derive(std::span{ salt }, { .iterations = 0U, .memoryKiB = 8U, .parallelism = 1U }),
                 std::invalid_argument);
    EXPECT_THROW((void)derive(std::span{ salt }, { .iterations = 1U, .memoryKiB = 7U, .parallelism = 1U }),
                 std::invalid_argument);
    EXPECT_THROW((void)derive(std::span{ salt }, { .iterations = 11U, .memoryKiB = 8U, .parallelism = 1U }),
                 std::invalid_argument);
    EXPECT_THROW(
        (void)derive(std::span{ salt }, { .iterations = 1U, .memoryKiB = 1024U * 1024U + 1U, .parallelism = 1U }),
        std::invalid_argument);
    EXPECT_THROW((void)derive(std::span{ salt }, { .iterations = 1U, .memoryKiB = 8U, .parallelism = 0U }),
                 std::invalid_argument);
}

TEST(KeyDerivation, RejectsMemoryThatDoesNotFitLanes)
{
    std::array<std::uint8_t, g_saltBytes> salt{};
    EXPECT_THROW((void)derive(std::span{ salt }, { .iterations = 1U, .memoryKiB = 8U, .parallelism = 2U }),
                 std::invalid_argument);
    EXPECT_THROW((void)derive(std::span{ salt }, { .iterations = 1U, .memoryKiB = 20U, .parallelism = 2U }),
                 std::invalid_argument);
}

TEST(KeyDerivation, ProducesRequestedSizeAndIsDeterministic)
{
    std::array<std::uint8_t, g_saltBytes> salt{};
    salt[0] = 0x01U;
    salt[1] = 0x02U;

    const auto a{ derive(std::span{ salt }) };
    const auto b{ derive(std::span{ salt }) };

    ASSERT_EQ(a.size(), g_keyBytes);
    EXPECT_TRUE(itemcrypt::security::secureEquals(a, b));

    constexpr std::size_t kLongKey{ 64U };
    EXPECT_EQ(derive(std::span{ salt }, g_kFastTestParams, kLongKey).size(), kLongKey);
}

TEST(KeyDerivation, DifferentSaltProducesDifferentKey)
{
    std::array<std::uint8_t, g_saltBytes> saltA{};
    std::array<std::uint8_t, g_saltBytes> saltB{};
    saltA[0] = 0x01U;
    saltB[0] = 0x02U;

    EXPECT_FALSE(itemcrypt::security::secureEquals(derive(std::span{ saltA }), derive(std::span{ saltB })));
}

TEST(KeyDerivation, DifferentParallelismProducesDifferentKey)
{
    std::array<std::uint8_t, g_saltBytes> salt{};

    constexpr itemcrypt::scheme::Argon2idParams kP1{ .iterations = 1U, .memoryKiB = 16U, .parallelism = 1U };
    constexpr itemcrypt::scheme::Argon2idParams kP2{ .iterations = 1U, .memoryKiB = 16U, .parallelism = 2U };

    EXPECT_FALSE(itemcrypt::security::secureEquals(derive(std::span{ salt }, kP1), derive(std::span{ salt }, kP2)));
}
