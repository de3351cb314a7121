#ifndef INCLUDE_ITEMCRYPT_SCHEME_FORMAT_HPP
#define INCLUDE_ITEMCRYPT_SCHEME_FORMAT_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>

namespace itemcrypt::scheme
{

// Version tag leading every serialized key. Stored as a little-endian uint32.
enum class Format : std::uint32_t
{
    V1 = 1U,
    V2 = 2U,
};

constexpr std::size_t g_formatTagBytes{ sizeof(std::uint32_t) };
constexpr Format g_primaryFormat{ Format::V1 };

using FormatTag = std::array<std::uint8_t, g_formatTagBytes>;

[[nodiscard]] FormatTag encodeFormat(Format format) noexcept;

// Reads the first g_formatTagBytes of `bytes`. Returns std::nullopt when the input is shorter than a tag
// or the tag is not a known format.
[[nodiscard]] std::optional<Format> decodeFormat(std::span<const std::uint8_t> bytes) noexcept;

[[nodiscard]] bool isKnownFormat(std::uint32_t raw) noexcept;

} // namespace itemcrypt::scheme

#endif // INCLUDE_ITEMCRYPT_SCHEME_FORMAT_HPP
