#include "notevault/core/Cipher.hpp"
#include "notevault/crypto/Base64Url.hpp"
#include "notevault/logging/LogRegistry.hpp"
#include <algorithm>
#include <exception>
#include <optional>
#include <stdexcept>
#include <vector>

namespace notevault::core
{
namespace
{

constexpr std::size_t g_kTokenHeaderBytes{ notevault::crypto::g_kAeadNonceBytes + notevault::crypto::g_kAeadTagBytes };

[[nodiscard]] std::span<const std::byte> prefixAad() noexcept
{
    return std::as_bytes(std::span<const char>{ g_kCipherTokenPrefixV1.data(), g_kCipherTokenPrefixV1.size() });
}

[[nodiscard]] std::string encodeToken(const notevault::crypto::SealedBox& box)
{
    std::vector<std::uint8_t> payload{};
    payload.reserve(g_kTokenHeaderBytes + box.cipherText.size());
    payload.insert(payload.end(), box.nonce.begin(), box.nonce.end());
    payload.insert(payload.end(), box.tag.begin(), box.tag.end());
    payload.insert(payload.end(), box.cipherText.begin(), box.cipherText.end());

    std::string token{ g_kCipherTokenPrefixV1 };
    token += notevault::crypto::base64UrlEncode(std::span<const std::uint8_t>{ payload });
    return token;
}

[[nodiscard]] std::optional<notevault::crypto::SealedBox> decodeToken(std::string_view token)
{
    if (!token.starts_with(g_kCipherTokenPrefixV1))
    {
        return std::nullopt;
    }
    token.remove_prefix(g_kCipherTokenPrefixV1.size());

    const auto payload{ notevault::crypto::base64UrlDecode(token) };
    if (!payload || payload->size() < g_kTokenHeaderBytes)
    {
        return std::nullopt;
    }

    notevault::crypto::SealedBox box{};
    const auto nonceEnd{ payload->begin() + static_cast<std::ptrdiff_t>(box.nonce.size()) };
    const auto tagEnd{ nonceEnd + static_cast<std::ptrdiff_t>(box.tag.size()) };
    std::copy(payload->begin(), nonceEnd, box.nonce.begin());
    std::copy(nonceEnd, tagEnd, box.tag.begin());
    box.cipherText.assign(tagEnd, payload->end());
    return box;
}

} // namespace

Cipher::Cipher(notevault::crypto::ICryptoProvider& crypto, const CredentialManager& credentials,
               const notevault::security::SecureBuffer& credential)
    : m_crypto(&crypto), m_key(credentials.cipherKeyFor(credential))
{
    if (m_key.size() != notevault::crypto::g_kAeadKeyBytes)
    {
        notevault::security::secureRelease(m_key);
        throw std::invalid_argument("Cipher: derived key has wrong size");
    }
}

Cipher::Cipher(Cipher&& other) noexcept : m_crypto(other.m_crypto), m_key{}
{
    m_key.swap(other.m_key);
}

Cipher& Cipher::operator=(Cipher&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }
    notevault::security::secureRelease(m_key);
    m_crypto = other.m_crypto;
    m_key.swap(other.m_key);
    return *this;
}

Cipher::~Cipher() noexcept
{
    notevault::security::secureRelease(m_key);
}

std::string Cipher::encrypt(std::string_view plainText)
{
    return encryptBytes(std::as_bytes(std::span<const char>{ plainText.data(), plainText.size() }));
}

std::string Cipher::encrypt(const notevault::security::SecureString& plainText)
{
    return encryptBytes(notevault::security::asBytes(plainText));
}

std::string Cipher::encryptBytes(std::span<const std::byte> plainText)
{
    if (m_key.empty())
    {
        throw std::logic_error("Cipher: used after move");
    }
    const auto box{ m_crypto->seal(notevault::security::asSpan(m_key), plainText, prefixAad()) };
    return encodeToken(box);
}

VaultResult<notevault::security::SecureString> Cipher::decrypt(std::string_view token)
{
    if (m_key.empty())
    {
        throw std::logic_error("Cipher: used after move");
    }

    const auto box{ decodeToken(token) };
    if (!box)
    {
        notevault::logging::LogRegistry::crypto()->warn("decrypt: malformed token ({} chars)", token.size());
        return VaultError::CipherError;
    }

    std::optional<notevault::security::SecureBuffer> plain{};
    try
    {
        plain = m_crypto->open(notevault::security::asSpan(m_key), *box, prefixAad());
    }
    catch (const std::exception& e)
    {
        notevault::logging::LogRegistry::crypto()->error("decrypt: AEAD backend failure: {}", e.what());
        return VaultError::CipherError;
    }
    if (!plain)
    {
        notevault::logging::LogRegistry::crypto()->warn("decrypt: authentication tag mismatch");
        return VaultError::CipherError;
    }

    auto text{ notevault::security::secureStringFrom(notevault::security::asSpan(*plain)) };
    notevault::security::secureRelease(*plain);
    return text;
}

} // namespace notevault::core
