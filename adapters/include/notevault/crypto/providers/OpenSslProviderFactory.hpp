#ifndef INCLUDE_NOTEVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
#define INCLUDE_NOTEVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP

#include "notevault/crypto/ICryptoProvider.hpp"
#include <memory>

namespace notevault::crypto::providers
{

// Backed by OpenSSL 3 (EVP_KDF scrypt, EVP_MAC BLAKE2BMAC, EVP_CIPHER ChaCha20-Poly1305) and the OS CSPRNG.
// Throws std::runtime_error when the loaded OpenSSL lacks one of them.
[[nodiscard]] std::unique_ptr<ICryptoProvider> makeOpenSslCryptoProvider();

} // namespace notevault::crypto::providers

#endif // INCLUDE_NOTEVAULT_CRYPTO_PROVIDERS_OPENSSLPROVIDERFACTORY_HPP
