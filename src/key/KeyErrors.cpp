#include "itemcrypt/key/KeyErrors.hpp"

#include <string>

namespace itemcrypt::key
{
namespace
{

[[nodiscard]] std::string describe(ImproperKeyKind kind, std::size_t expected, std::size_t actual)
{
    const char* component{ "" };
    switch (kind)
    {
    case ImproperKeyKind::BadFormatData:
        return "improper key: data does not start with a known format tag";
    case ImproperKeyKind::InitializationVectorSize:
        component = "initialization vector";
        break;
    case ImproperKeyKind::SaltSize:
        component = "salt";
        break;
    case ImproperKeyKind::SeedSize:
        component = "seed";
        break;
    }

    std::string msg{ "improper key: " };
    msg += component;
    msg += " is ";
    msg += std::to_string(actual);
    msg += " bytes, scheme requires ";
    msg += std::to_string(expected);
    return msg;
}

} // namespace

ImproperKey::ImproperKey(ImproperKeyKind kind, std::size_t expected, std::size_t actual)
    : std::invalid_argument{ describe(kind, expected, actual) }, m_kind{ kind }, m_expected{ expected },
      m_actual{ actual }
{
}

ImproperKey ImproperKey::badFormatData()
{
    return ImproperKey{ ImproperKeyKind::BadFormatData, 0U, 0U };
}

ImproperKey ImproperKey::initializationVectorSize(std::size_t expected, std::size_t actual)
{
    return ImproperKey{ ImproperKeyKind::InitializationVectorSize, expected, actual };
}

ImproperKey ImproperKey::saltSize(std::size_t expected, std::size_t actual)
{
    return ImproperKey{ ImproperKeyKind::SaltSize, expected, actual };
}

ImproperKey ImproperKey::seedSize(std::size_t expected, std::size_t actual)
{
    return ImproperKey{ ImproperKeyKind::SeedSize, expected, actual };
}

} // namespace itemcrypt::key
