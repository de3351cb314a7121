#ifndef INCLUDE_ITEMCRYPT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_ITEMCRYPT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "itemcrypt/crypto/ICryptoProvider.hpp"
#include <memory>

namespace itemcrypt::crypto::providers
{

// OpenSSL 3 backend. Argon2id needs OpenSSL 3.2 or newer; deriveKey throws std::runtime_error otherwise.
[[nodiscard]] std::unique_ptr<itemcrypt::crypto::ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace itemcrypt::crypto::providers

#endif // INCLUDE_ITEMCRYPT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
