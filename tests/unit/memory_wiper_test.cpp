#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

#include "itemcrypt/security/MemoryWiper.hpp"

namespace
{

template <typename T>
concept CanSecureWipe = requires(T region) { itemcrypt::security::secureWipe(region); };

static_assert(CanSecureWipe<std::span<std::uint8_t>>);
static_assert(CanSecureWipe<std::span<std::uint64_t, 4>>);
static_assert(!CanSecureWipe<std::span<const std::uint8_t>>);
static_assert(!CanSecureWipe<std::span<std::string>>);

constexpr std::uint8_t g_fill{ 0xA5U };

} // namespace

TEST(MemoryWiper, WipesOnlyTheGivenSubrange)
{
    std::array<std::uint8_t, 48> buffer{};
    buffer.fill(g_fill);

    itemcrypt::security::secureWipe(std::span{ buffer }.subspan(16U, 16U));

    for (std::size_t i{}; i < buffer.size(); ++i)
    {
        const bool inside{ i >= 16U && i < 32U };
        EXPECT_EQ(buffer[i], inside ? std::uint8_t{} : g_fill) << "index " << i;
    }
}

TEST(MemoryWiper, WipesWordsThroughTypedOverload)
{
    std::array<std::uint64_t, 8> words{};
    words.fill(0x0123456789ABCDEFULL);

    itemcrypt::security::secureWipe(std::span<std::uint64_t>{ words });

    for (const auto w : words)
    {
        EXPECT_EQ(w, std::uint64_t{});
    }
}

TEST(MemoryWiper, EmptySpanIsNoOp)
{
    itemcrypt::security::secureWipe(std::span<std::byte>{});
    itemcrypt::security::secureWipe(std::span<std::uint8_t>{});
}
