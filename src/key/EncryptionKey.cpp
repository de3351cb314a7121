#include "itemcrypt/key/EncryptionKey.hpp"

#include "itemcrypt/key/KeyErrors.hpp"
#include "itemcrypt/key/PasswordNormalizer.hpp"
#include "itemcrypt/security/SecureEquals.hpp"
#include "itemcrypt/security/SecureString.hpp"
#include <stdexcept>
#include <utility>
#include <vector>

namespace itemcrypt::key
{
namespace
{

using itemcrypt::security::SecureBuffer;

void requireRegisteredScheme(const itemcrypt::scheme::Scheme& scheme)
{
    if (!itemcrypt::scheme::isRegistered(scheme))
    {
        throw std::invalid_argument("EncryptionKey: scheme differs from the registered scheme for its format");
    }
}

void requireSeedSize(std::span<const std::uint8_t> seed, const itemcrypt::scheme::Scheme& scheme)
{
    if (seed.size() != scheme.seedSize)
    {
        throw ImproperKey::seedSize(scheme.seedSize, seed.size());
    }
}

void requireSaltSize(std::span<const std::uint8_t> salt, const itemcrypt::scheme::Scheme& scheme)
{
    if (salt.size() != scheme.stretchedSaltSize)
    {
        throw ImproperKey::saltSize(scheme.stretchedSaltSize, salt.size());
    }
}

void requireIvSize(std::span<const std::uint8_t> iv, const itemcrypt::scheme::Scheme& scheme)
{
    if (iv.size() != scheme.initializationVectorSize)
    {
        throw ImproperKey::initializationVectorSize(scheme.initializationVectorSize, iv.size());
    }
}

[[nodiscard]] std::size_t hashBytes(std::span<const std::uint8_t> bytes) noexcept
{
    const std::string_view view{ reinterpret_cast<const char*>(bytes.data()), bytes.size() };
    return std::hash<std::string_view>{}(view);
}

void hashCombine(std::size_t& seed, std::size_t value) noexcept
{
    constexpr auto kGolden{ static_cast<std::size_t>(0x9e3779b97f4a7c15ULL) };
    seed ^= value + kGolden + (seed << 6U) + (seed >> 2U);
}

} // namespace

EncryptionKey::EncryptionKey(itemcrypt::scheme::Scheme scheme, SecureBuffer keyData, SecureBuffer initializationVector,
                             SecureBuffer salt) noexcept
    : m_scheme{ scheme }, m_keyData{ std::move(keyData) }, m_initializationVector{ std::move(initializationVector) },
      m_salt{ std::move(salt) }
{
}

EncryptionKey EncryptionKey::fromRandomPassword(itemcrypt::crypto::ICryptoProvider& crypto, std::string_view password,
                                                std::span<const std::string> additionalKeywords,
                                                const itemcrypt::scheme::Scheme& scheme)
{
    requireRegisteredScheme(scheme);

    SecureBuffer seed(scheme.seedSize);
    SecureBuffer iv(scheme.initializationVectorSize);
    if (!crypto.randomBytes(itemcrypt::security::asSpan(seed)) || !crypto.randomBytes(itemcrypt::security::asSpan(iv)))
    {
        throw std::runtime_error("fromRandomPassword: CSPRNG failure");
    }

    return fromSeed(crypto, password, additionalKeywords, itemcrypt::security::asSpan(seed),
                    itemcrypt::security::asSpan(iv), scheme);
}

EncryptionKey EncryptionKey::fromSeed(const itemcrypt::crypto::ICryptoProvider& crypto,
                                      std::string_view untreatedPassword,
                                      std::span<const std::string> additionalKeywords,
                                      std::span<const std::uint8_t> seed, std::span<const std::uint8_t> iv,
                                      const itemcrypt::scheme::Scheme& scheme)
{
    requireRegisteredScheme(scheme);
    requireSeedSize(seed, scheme);
    requireIvSize(iv, scheme);

    std::vector<std::span<const std::byte>> parts{};
    parts.reserve(additionalKeywords.size());
    for (const std::string& keyword : additionalKeywords)
    {
        parts.push_back(std::as_bytes(std::span<const char>{ keyword.data(), keyword.size() }));
    }

    const SecureBuffer treatedSalt{ crypto.mac(scheme.macAlgorithm, seed, parts) };
    return fromSalt(crypto, untreatedPassword, itemcrypt::security::asSpan(treatedSalt), iv, scheme);
}

EncryptionKey EncryptionKey::fromSalt(const itemcrypt::crypto::ICryptoProvider& crypto,
                                      std::string_view untreatedPassword, std::span<const std::uint8_t> treatedSalt,
                                      std::span<const std::uint8_t> iv, const itemcrypt::scheme::Scheme& scheme)
{
    requireRegisteredScheme(scheme);
    requireSaltSize(treatedSalt, scheme);
    requireIvSize(iv, scheme);

    const itemcrypt::security::SecureString password{ normalizePassword(untreatedPassword) };

    SecureBuffer keyData{ crypto.deriveKey(itemcrypt::security::asBytes(password), treatedSalt, scheme) };
    return EncryptionKey{ scheme, std::move(keyData), itemcrypt::security::secureBufferFrom(iv),
                          itemcrypt::security::secureBufferFrom(treatedSalt) };
}

EncryptionKey EncryptionKey::fromRawData(std::span<const std::uint8_t> data)
{
    const auto format{ itemcrypt::scheme::decodeFormat(data) };
    if (!format)
    {
        throw ImproperKey::badFormatData();
    }
    const itemcrypt::scheme::Scheme scheme{ itemcrypt::scheme::schemeFor(*format) };

    auto rest{ data.subspan(itemcrypt::scheme::g_formatTagBytes) };

    if (rest.size() < scheme.stretchedSaltSize)
    {
        throw ImproperKey::saltSize(scheme.stretchedSaltSize, rest.size());
    }
    const auto salt{ rest.last(scheme.stretchedSaltSize) };
    rest = rest.first(rest.size() - salt.size());

    if (rest.size() < scheme.initializationVectorSize)
    {
        throw ImproperKey::initializationVectorSize(scheme.initializationVectorSize, rest.size());
    }
    const auto iv{ rest.last(scheme.initializationVectorSize) };
    rest = rest.first(rest.size() - iv.size());

    return EncryptionKey{ scheme, itemcrypt::security::secureBufferFrom(rest),
                          itemcrypt::security::secureBufferFrom(iv), itemcrypt::security::secureBufferFrom(salt) };
}

SecureBuffer EncryptionKey::rawData() const
{
    const auto tag{ itemcrypt::scheme::encodeFormat(m_scheme.format) };

    SecureBuffer out{};
    out.reserve(tag.size() + m_keyData.size() + m_initializationVector.size() + m_salt.size());
    itemcrypt::security::append(out, tag);
    itemcrypt::security::append(out, keyData());
    itemcrypt::security::append(out, initializationVector());
    itemcrypt::security::append(out, salt());
    return out;
}

EncryptionKey EncryptionKey::withContext(std::optional<std::string> context) const
{
    EncryptionKey relabeled{ *this };
    relabeled.m_context = std::move(context);
    return relabeled;
}

std::size_t EncryptionKey::hashValue() const noexcept
{
    std::size_t seed{ std::hash<std::uint32_t>{}(static_cast<std::uint32_t>(m_scheme.format)) };
    hashCombine(seed, m_scheme.keySize);
    hashCombine(seed, hashBytes(initializationVector()));
    hashCombine(seed, hashBytes(salt()));
    hashCombine(seed, hashBytes(keyData()));
    hashCombine(seed, m_context ? std::hash<std::string>{}(*m_context) : 0U);
    return seed;
}

bool EncryptionKey::operator==(const EncryptionKey& other) const noexcept
{
    return m_scheme == other.m_scheme && m_initializationVector == other.m_initializationVector &&
           m_salt == other.m_salt && itemcrypt::security::secureEquals(m_keyData, other.m_keyData) &&
           m_context == other.m_context;
}

} // namespace itemcrypt::key
