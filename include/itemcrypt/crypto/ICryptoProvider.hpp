#ifndef INCLUDE_ITEMCRYPT_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_ITEMCRYPT_CRYPTO_ICRYPTOPROVIDER_HPP

#include "itemcrypt/scheme/Scheme.hpp"
#include "itemcrypt/security/SecureBuffer.hpp"
#include <cstddef>
#include <cstdint>
#include <span>

namespace itemcrypt::crypto
{

class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // Keyed MAC over the concatenation of `parts`, fed in order into one running state.
    // Output length is scheme::macOutputBytes(algorithm).
    // Unsupported algorithms throw std::invalid_argument; backend failures throw std::runtime_error.
    [[nodiscard]] virtual itemcrypt::security::SecureBuffer
    mac(itemcrypt::scheme::MacAlgorithm algorithm, std::span<const std::uint8_t> key,
        std::span<const std::span<const std::byte>> parts) const = 0;

    // Runs the scheme's KDF. Deterministic; output length is scheme.keySize.
    // Contract violations (short salt, unsafe parameters) throw std::invalid_argument. An empty password is valid.
    [[nodiscard]] virtual itemcrypt::security::SecureBuffer
    deriveKey(std::span<const std::byte> password, std::span<const std::uint8_t> salt,
              const itemcrypt::scheme::Scheme& scheme) const = 0;

    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;
};

} // namespace itemcrypt::crypto

#endif // INCLUDE_ITEMCRYPT_CRYPTO_ICRYPTOPROVIDER_HPP
