#ifndef INCLUDE_ITEMCRYPT_KEY_PASSWORDNORMALIZER_HPP
#define INCLUDE_ITEMCRYPT_KEY_PASSWORDNORMALIZER_HPP

#include "itemcrypt/security/SecureString.hpp"
#include <string_view>

namespace itemcrypt::key
{

// Trims leading and trailing White_Space code points (spaces, tabs, newlines, no-break spaces), then applies
// Unicode NFKD. Input and output are UTF-8; malformed input sequences become U+FFFD.
// Throws std::runtime_error if ICU reports a failure.
[[nodiscard]] itemcrypt::security::SecureString normalizePassword(std::string_view utf8);

} // namespace itemcrypt::key

#endif // INCLUDE_ITEMCRYPT_KEY_PASSWORDNORMALIZER_HPP
