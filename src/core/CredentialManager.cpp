#include "notevault/core/CredentialManager.hpp"
#include "notevault/crypto/Base64Url.hpp"
#include "notevault/logging/LogRegistry.hpp"
#include "notevault/security/SecureEquals.hpp"
#include <array>
#include <exception>

namespace notevault::core
{
namespace
{

constexpr std::string_view g_kVerifierContext{ "notevault.password.verifier.v1" };
constexpr std::string_view g_kRecordKeyContext{ "notevault.records.aead_key.v1" };

constexpr char g_kFirstPrintableAscii{ '!' };
constexpr char g_kLastPrintableAscii{ '~' };

[[nodiscard]] std::span<const std::byte> asBytes(std::string_view s) noexcept
{
    return std::as_bytes(std::span<const char>{ s.data(), s.size() });
}

} // namespace

CredentialManager::CredentialManager(notevault::crypto::ICryptoProvider& crypto) noexcept : m_crypto(&crypto)
{
}

bool CredentialManager::meetsRequirements(std::string_view password) noexcept
{
    if (password.size() < g_kPasswordMinChars || password.size() > g_kPasswordMaxChars)
    {
        return false;
    }
    // Visible ASCII is exactly letters, digits and punctuation. Space, controls and UTF-8 lead bytes fall outside.
    for (const char c : password)
    {
        if (c < g_kFirstPrintableAscii || c > g_kLastPrintableAscii)
        {
            return false;
        }
    }
    return true;
}

VaultResult<std::string> CredentialManager::generateSalt() noexcept
{
    std::array<std::uint8_t, g_kSaltEntropyBytes> raw{};
    if (!m_crypto->randomBytes(std::span<std::uint8_t>{ raw }))
    {
        notevault::logging::LogRegistry::crypto()->error("generateSalt: CSPRNG failure");
        return VaultError::RandomFailed;
    }
    return notevault::crypto::base64UrlEncode(std::span<const std::uint8_t>{ raw });
}

notevault::security::SecureBuffer CredentialManager::deriveKey(const notevault::security::SecureString& password,
                                                               std::string_view salt) const
{
    return m_crypto->deriveCredential(notevault::security::asBytes(password), asBytes(salt),
                                     notevault::crypto::g_kScryptVaultParams);
}

notevault::security::SecureBuffer
CredentialManager::verifierFor(const notevault::security::SecureBuffer& credential) const
{
    return m_crypto->deriveSubkey(notevault::security::asSpan(credential), asBytes(g_kVerifierContext),
                                  g_kVerifierBytes);
}

notevault::security::SecureBuffer
CredentialManager::cipherKeyFor(const notevault::security::SecureBuffer& credential) const
{
    return m_crypto->deriveSubkey(notevault::security::asSpan(credential), asBytes(g_kRecordKeyContext),
                                  notevault::crypto::g_kAeadKeyBytes);
}

bool CredentialManager::verify(const notevault::security::SecureString& password, std::string_view salt,
                               std::span<const std::uint8_t> expectedVerifier) const noexcept
{
    auto credential{ authenticate(password, salt, expectedVerifier) };
    if (auto* key{ std::get_if<notevault::security::SecureBuffer>(&credential) })
    {
        notevault::security::secureRelease(*key);
        return true;
    }
    return false;
}

VaultResult<notevault::security::SecureBuffer>
CredentialManager::authenticate(const notevault::security::SecureString& password, std::string_view salt,
                                std::span<const std::uint8_t> expectedVerifier) const noexcept
{
    if (password.empty() || expectedVerifier.size() != g_kVerifierBytes)
    {
        return VaultError::AuthenticationFailed;
    }

    try
    {
        auto credential{ deriveKey(password, salt) };
        auto verifier{ verifierFor(credential) };
        const bool matches{ notevault::security::secureEquals(notevault::security::asSpan(verifier),
                                                              expectedVerifier) };
        notevault::security::secureRelease(verifier);
        if (!matches)
        {
            notevault::security::secureRelease(credential);
            return VaultError::AuthenticationFailed;
        }
        return credential;
    }
    catch (const std::exception& e)
    {
        notevault::logging::LogRegistry::crypto()->error("authenticate: key derivation failed: {}", e.what());
        return VaultError::AuthenticationFailed;
    }
}

} // namespace notevault::core
