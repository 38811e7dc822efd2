#ifndef INCLUDE_NOTEVAULT_CORE_CIPHER_HPP
#define INCLUDE_NOTEVAULT_CORE_CIPHER_HPP

#include "notevault/core/CredentialManager.hpp"
#include "notevault/core/VaultError.hpp"
#include "notevault/crypto/ICryptoProvider.hpp"
#include "notevault/security/SecureBuffer.hpp"
#include "notevault/security/SecureString.hpp"
#include <string>
#include <string_view>

namespace notevault::core
{

// Token layout: "v1." + base64url(nonce || tag || ciphertext), no padding.
// The prefix is authenticated as associated data.
constexpr std::string_view g_kCipherTokenPrefixV1{ "v1." };

class Cipher final
{
public:
    // Derives the record key from `credential`; the credential itself is not retained.
    Cipher(notevault::crypto::ICryptoProvider& crypto, const CredentialManager& credentials,
           const notevault::security::SecureBuffer& credential);

    Cipher(const Cipher&) = delete;
    Cipher& operator=(const Cipher&) = delete;
    Cipher(Cipher&& other) noexcept;
    Cipher& operator=(Cipher&& other) noexcept;
    ~Cipher() noexcept;

    // Throws std::runtime_error if the CSPRNG or the AEAD backend fails.
    [[nodiscard]] std::string encrypt(std::string_view plainText);
    [[nodiscard]] std::string encrypt(const notevault::security::SecureString& plainText);

    // VaultError::CipherError for a foreign prefix, malformed encoding, short token or bad tag.
    [[nodiscard]] VaultResult<notevault::security::SecureString> decrypt(std::string_view token);

private:
    [[nodiscard]] std::string encryptBytes(std::span<const std::byte> plainText);

    notevault::crypto::ICryptoProvider* m_crypto{ nullptr };
    notevault::security::SecureBuffer m_key;
};

} // namespace notevault::core

#endif // INCLUDE_NOTEVAULT_CORE_CIPHER_HPP
