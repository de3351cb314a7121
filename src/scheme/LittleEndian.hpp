#ifndef ITEMCRYPT_SRC_SCHEME_LITTLEENDIAN_HPP
#define ITEMCRYPT_SRC_SCHEME_LITTLEENDIAN_HPP

#include <cstddef>
#include <cstdint>
#include <span>

namespace itemcrypt::scheme::detail
{

constexpr std::size_t g_kU32Bytes{ sizeof(std::uint32_t) };
constexpr std::uint32_t g_kBitsPerByte{ 8U };
constexpr std::uint32_t g_kByteMask{ 0xFFU };

inline void writeU32LE(std::span<std::uint8_t, g_kU32Bytes> out, std::uint32_t v) noexcept
{
    for (std::size_t i{}; i < out.size(); ++i)
    {
        out[i] = static_cast<std::uint8_t>((v >> (static_cast<std::uint32_t>(i) * g_kBitsPerByte)) & g_kByteMask);
    }
}

[[nodiscard]] inline std::uint32_t readU32LE(std::span<const std::uint8_t, g_kU32Bytes> in) noexcept
{
    std::uint32_t v{};
    for (std::size_t i{}; i < in.size(); ++i)
    {
        v |= static_cast<std::uint32_t>(in[i]) << (static_cast<std::uint32_t>(i) * g_kBitsPerByte);
    }
    return v;
}

} // namespace itemcrypt::scheme::detail

#endif // ITEMCRYPT_SRC_SCHEME_LITTLEENDIAN_HPP
