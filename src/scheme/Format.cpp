#include "itemcrypt/scheme/Format.hpp"

#include "LittleEndian.hpp"

namespace itemcrypt::scheme
{

FormatTag encodeFormat(Format format) noexcept
{
    FormatTag tag{};
    detail::writeU32LE(std::span<std::uint8_t, g_formatTagBytes>{ tag }, static_cast<std::uint32_t>(format));
    return tag;
}

std::optional<Format> decodeFormat(std::span<const std::uint8_t> bytes) noexcept
{
    if (bytes.size() < g_formatTagBytes)
    {
        return std::nullopt;
    }

    const std::uint32_t raw{ detail::readU32LE(bytes.first<g_formatTagBytes>()) };
    if (!isKnownFormat(raw))
    {
        return std::nullopt;
    }
    return static_cast<Format>(raw);
}

bool isKnownFormat(std::uint32_t raw) noexcept
{
    switch (static_cast<Format>(raw))
    {
    case Format::V1:
    case Format::V2:
        return true;
    }
    return false;
}

} // namespace itemcrypt::scheme
