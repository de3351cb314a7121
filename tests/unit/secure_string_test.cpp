#include <gtest/gtest.h>

#include <cstddef>
#include <string_view>

#include "itemcrypt/security/SecureString.hpp"

TEST(SecureString, EmptyViewsAreSafe)
{
    const itemcrypt::security::SecureString s{};
    EXPECT_TRUE(itemcrypt::security::asStringView(s).empty());
    EXPECT_TRUE(itemcrypt::security::asBytes(s).empty());
}

TEST(SecureString, FromCopiesBytesIncludingNonAscii)
{
    constexpr char bytes[]{ 'p', '\x00', '\x7F', static_cast<char>(0xC3), static_cast<char>(0xA9) };
    const std::string_view input{ bytes, sizeof(bytes) };

    const itemcrypt::security::SecureString s{ itemcrypt::security::secureStringFrom(input) };

    EXPECT_EQ(itemcrypt::security::asStringView(s), input);

    const auto octets{ itemcrypt::security::asBytes(s) };
    ASSERT_EQ(octets.size(), input.size());
    EXPECT_EQ(octets[3], std::byte{ 0xC3 });
}
