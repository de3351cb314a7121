#ifndef INCLUDE_ITEMCRYPT_KEY_KEYERRORS_HPP
#define INCLUDE_ITEMCRYPT_KEY_KEYERRORS_HPP

#include <cstddef>
#include <cstdint>
#include <stdexcept>

namespace itemcrypt::key
{

enum class ImproperKeyKind : std::uint8_t
{
    BadFormatData,
    InitializationVectorSize,
    SaltSize,
    SeedSize,
};

// Raised when key material or a serialized key does not fit its scheme.
// For the size kinds, expected() is the scheme's size and actual() the size that was supplied.
class ImproperKey final : public std::invalid_argument
{
public:
    [[nodiscard]] static ImproperKey badFormatData();
    [[nodiscard]] static ImproperKey initializationVectorSize(std::size_t expected, std::size_t actual);
    [[nodiscard]] static ImproperKey saltSize(std::size_t expected, std::size_t actual);
    [[nodiscard]] static ImproperKey seedSize(std::size_t expected, std::size_t actual);

    [[nodiscard]] ImproperKeyKind kind() const noexcept
    {
        return m_kind;
    }
    [[nodiscard]] std::size_t expected() const noexcept
    {
        return m_expected;
    }
    [[nodiscard]] std::size_t actual() const noexcept
    {
        return m_actual;
    }

private:
    ImproperKey(ImproperKeyKind kind, std::size_t expected, std::size_t actual);

    ImproperKeyKind m_kind;
    std::size_t m_expected;
    std::size_t m_actual;
};

} // namespace itemcrypt::key

#endif // INCLUDE_ITEMCRYPT_KEY_KEYERRORS_HPP
