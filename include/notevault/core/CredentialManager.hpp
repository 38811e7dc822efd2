#ifndef INCLUDE_NOTEVAULT_CORE_CREDENTIALMANAGER_HPP
#define INCLUDE_NOTEVAULT_CORE_CREDENTIALMANAGER_HPP

#include "notevault/core/VaultError.hpp"
#include "notevault/crypto/ICryptoProvider.hpp"
#include "notevault/security/SecureBuffer.hpp"
#include "notevault/security/SecureString.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace notevault::core
{

constexpr std::size_t g_kPasswordMinChars{ 8U };
constexpr std::size_t g_kPasswordMaxChars{ 32U };
constexpr std::size_t g_kSaltEntropyBytes{ 16U };
constexpr std::size_t g_kVerifierBytes{ 32U };

constexpr std::string_view g_kPasswordRequirementsText{
    "Password requirements:\n"
    "   * Length between 8 and 32\n"
    "   * Upper and lowercase Latin letters,\n"
    "     numbers and any of the following symbols:\n"
    "     !\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~\n"
};

// Turns passwords into credentials and verifiers. Holds no secrets itself; the KDF parameters are fixed.
//
// credential = scrypt(password, salt)          (never stored)
// verifier   = BLAKE2b(credential, "verifier") (stored in the vault config)
// cipher key = BLAKE2b(credential, "records")  (lives only inside a session Cipher)
class CredentialManager final
{
public:
    explicit CredentialManager(notevault::crypto::ICryptoProvider& crypto) noexcept;

    [[nodiscard]] static bool meetsRequirements(std::string_view password) noexcept;

    // URL-safe text carrying g_kSaltEntropyBytes of CSPRNG output.
    [[nodiscard]] VaultResult<std::string> generateSalt() noexcept;

    // Runs the KDF once. Throws std::invalid_argument for an empty password or salt.
    [[nodiscard]] notevault::security::SecureBuffer deriveKey(const notevault::security::SecureString& password,
                                                              std::string_view salt) const;

    [[nodiscard]] notevault::security::SecureBuffer verifierFor(const notevault::security::SecureBuffer& credential) const;
    [[nodiscard]] notevault::security::SecureBuffer
    cipherKeyFor(const notevault::security::SecureBuffer& credential) const;

    // Constant-time check of the password against a stored verifier. Any failure, including a KDF error, is `false`.
    [[nodiscard]] bool verify(const notevault::security::SecureString& password, std::string_view salt,
                              std::span<const std::uint8_t> expectedVerifier) const noexcept;

    // Same check as verify(), but hands back the credential so a login pays for the KDF only once.
    [[nodiscard]] VaultResult<notevault::security::SecureBuffer>
    authenticate(const notevault::security::SecureString& password, std::string_view salt,
                 std::span<const std::uint8_t> expectedVerifier) const noexcept;

private:
    notevault::crypto::ICryptoProvider* m_crypto{ nullptr };
};

} // namespace notevault::core

#endif // INCLUDE_NOTEVAULT_CORE_CREDENTIALMANAGER_HPP
