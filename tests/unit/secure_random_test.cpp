#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

#include "itemcrypt/security/SecureRandom.hpp"

TEST(SecureRandom, FillEmptyIsNoOp)
{
    std::array<std::uint8_t, 0> bytes{};
    EXPECT_TRUE(itemcrypt::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, FillNonEmptyReturnsTrue)
{
    constexpr std::size_t kBytesLen{ 32U };
    std::array<std::uint8_t, kBytesLen> bytes{};
    EXPECT_TRUE(itemcrypt::security::secureRandomFill(std::span{ bytes }));
}

TEST(SecureRandom, TwoFillsDiffer)
{
    constexpr std::size_t kBytesLen{ 32U };
    std::array<std::uint8_t, kBytesLen> a{};
    std::array<std::uint8_t, kBytesLen> b{};
    ASSERT_TRUE(itemcrypt::security::secureRandomFill(std::span{ a }));
    ASSERT_TRUE(itemcrypt::security::secureRandomFill(std::span{ b }));
    EXPECT_NE(a, b);
}

TEST(SecureRandom, FillsLargeBuffer)
{
    constexpr std::size_t kBytesLen{ 1024U * 1024U };
    std::vector<std::uint8_t> bytes(kBytesLen);
    ASSERT_TRUE(itemcrypt::security::secureRandomFill(std::span{ bytes }));

    std::size_t zeros{};
    for (const auto b : bytes)
    {
        zeros += (b == 0U) ? 1U : 0U;
    }
    EXPECT_LT(zeros, kBytesLen / 64U);
}
