#ifndef INCLUDE_ITEMCRYPT_KEY_ENCRYPTIONKEY_HPP
#define INCLUDE_ITEMCRYPT_KEY_ENCRYPTIONKEY_HPP

#include "itemcrypt/crypto/ICryptoProvider.hpp"
#include "itemcrypt/scheme/Scheme.hpp"
#include "itemcrypt/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>

namespace itemcrypt::key
{

// A symmetric key derived from a password, together with the IV and treated salt it was derived with.
//
// Serialized layout (rawData):
//   [ format tag (scheme::g_formatTagBytes) ][ keyData ][ initializationVector ][ salt ]
// Only the tag has a static width; IV and salt widths follow from the scheme the tag names, and keyData is
// whatever lies between.
//
// Everything but context() is fixed at construction. Key bytes, IV and salt are wiped when the key is destroyed.
// Size violations throw ImproperKey (see KeyErrors.hpp) before any key material is derived.
// Every factory takes only registered schemes (scheme::isRegistered); any other Scheme is a caller error and
// throws std::invalid_argument before randomness, MAC or KDF are touched.
class EncryptionKey final
{
public:
    // Fresh random seed and IV: calling twice with the same arguments yields different keys.
    // Throws std::runtime_error if the provider's CSPRNG fails.
    [[nodiscard]] static EncryptionKey fromRandomPassword(itemcrypt::crypto::ICryptoProvider& crypto,
                                                          std::string_view password,
                                                          std::span<const std::string> additionalKeywords = {},
                                                          const itemcrypt::scheme::Scheme& scheme =
                                                              itemcrypt::scheme::defaultScheme());

    // The treated salt is the scheme's MAC keyed by `seed` over each keyword in order.
    [[nodiscard]] static EncryptionKey fromSeed(const itemcrypt::crypto::ICryptoProvider& crypto,
                                                std::string_view untreatedPassword,
                                                std::span<const std::string> additionalKeywords,
                                                std::span<const std::uint8_t> seed,
                                                std::span<const std::uint8_t> iv,
                                                const itemcrypt::scheme::Scheme& scheme);

    // No keywords: the treated salt is the MAC of the empty message.
    [[nodiscard]] static EncryptionKey fromSeed(const itemcrypt::crypto::ICryptoProvider& crypto,
                                                std::string_view untreatedPassword,
                                                std::span<const std::uint8_t> seed,
                                                std::span<const std::uint8_t> iv,
                                                const itemcrypt::scheme::Scheme& scheme)
    {
        return fromSeed(crypto, untreatedPassword, std::span<const std::string>{}, seed, iv, scheme);
    }

    // The password is trimmed and NFKD-normalized here, and only here.
    [[nodiscard]] static EncryptionKey fromSalt(const itemcrypt::crypto::ICryptoProvider& crypto,
                                                std::string_view untreatedPassword,
                                                std::span<const std::uint8_t> treatedSalt,
                                                std::span<const std::uint8_t> iv,
                                                const itemcrypt::scheme::Scheme& scheme);

    // Reconstructs a key from rawData() output. keyData is taken verbatim, nothing is re-derived.
    // The parsed key has no context.
    [[nodiscard]] static EncryptionKey fromRawData(std::span<const std::uint8_t> data);

    [[nodiscard]] itemcrypt::security::SecureBuffer rawData() const;

    [[nodiscard]] const itemcrypt::scheme::Scheme& scheme() const noexcept
    {
        return m_scheme;
    }
    [[nodiscard]] std::span<const std::uint8_t> keyData() const noexcept
    {
        return itemcrypt::security::asSpan(m_keyData);
    }
    [[nodiscard]] std::span<const std::uint8_t> initializationVector() const noexcept
    {
        return itemcrypt::security::asSpan(m_initializationVector);
    }
    [[nodiscard]] std::span<const std::uint8_t> salt() const noexcept
    {
        return itemcrypt::security::asSpan(m_salt);
    }

    // Label such as an account id. Not part of the derivation nor of rawData(), but part of equality and hash.
    [[nodiscard]] const std::optional<std::string>& context() const noexcept
    {
        return m_context;
    }

    void setContext(std::optional<std::string> context) noexcept
    {
        m_context = std::move(context);
    }

    [[nodiscard]] EncryptionKey withContext(std::optional<std::string> context) const;

    [[nodiscard]] std::size_t hashValue() const noexcept;

    [[nodiscard]] bool operator==(const EncryptionKey& other) const noexcept;

private:
    EncryptionKey(itemcrypt::scheme::Scheme scheme, itemcrypt::security::SecureBuffer keyData,
                  itemcrypt::security::SecureBuffer initializationVector,
                  itemcrypt::security::SecureBuffer salt) noexcept;

    itemcrypt::scheme::Scheme m_scheme;
    itemcrypt::security::SecureBuffer m_keyData;
    itemcrypt::security::SecureBuffer m_initializationVector;
    itemcrypt::security::SecureBuffer m_salt;
    std::optional<std::string> m_context;
};

} // namespace itemcrypt::key

namespace std
{

template <> struct hash<itemcrypt::key::EncryptionKey>
{
    [[nodiscard]] std::size_t operator()(const itemcrypt::key::EncryptionKey& key) const noexcept
    {
        return key.hashValue();
    }
};

} // namespace std

#endif // INCLUDE_ITEMCRYPT_KEY_ENCRYPTIONKEY_HPP
