#include "notevault/crypto/providers/OpenSslProviderFactory.hpp"
#include "notevault/logging/LogRegistry.hpp"
#include "notevault/security/SecureBuffer.hpp"
#include "notevault/security/SecureRandom.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <openssl/core_names.h>
#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/params.h>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>
#include <vector>

namespace notevault::crypto::providers
{
namespace
{

using notevault::security::SecureBuffer;

constexpr std::size_t g_kMaxSubkeyBytes{ 64U };
constexpr std::uint64_t g_kScryptMaxCostN{ 1ULL << 20U };
constexpr std::uint32_t g_kScryptMaxBlockSize{ 32U };
constexpr std::uint32_t g_kScryptMaxParallelism{ 16U };

using EvpKdfPtr = std::unique_ptr<EVP_KDF, decltype(&EVP_KDF_free)>;
using EvpKdfCtxPtr = std::unique_ptr<EVP_KDF_CTX, decltype(&EVP_KDF_CTX_free)>;
using EvpMacPtr = std::unique_ptr<EVP_MAC, decltype(&EVP_MAC_free)>;
using EvpMacCtxPtr = std::unique_ptr<EVP_MAC_CTX, decltype(&EVP_MAC_CTX_free)>;
using EvpCipherPtr = std::unique_ptr<EVP_CIPHER, decltype(&EVP_CIPHER_free)>;
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

// Error text from the top of OpenSSL's thread-local error queue; the queue is cleared.
[[nodiscard]] std::string opensslFailure(const char* what)
{
    std::string message{ what };
    if (const unsigned long code{ ERR_get_error() }; code != 0UL)
    {
        std::array<char, 256> buf{};
        ERR_error_string_n(code, buf.data(), buf.size());
        message += ": ";
        message += buf.data();
    }
    ERR_clear_error();
    return message;
}

[[nodiscard]] bool fitsInInt(std::size_t n) noexcept
{
    return n <= static_cast<std::size_t>(std::numeric_limits<int>::max());
}

[[nodiscard]] const unsigned char* bytePtr(std::span<const std::byte> s) noexcept
{
    return reinterpret_cast<const unsigned char*>(s.data());
}

void requireScryptParams(const notevault::crypto::ScryptParams& params)
{
    const bool powerOfTwo{ params.costN > 1U && (params.costN & (params.costN - 1U)) == 0U };
    if (!powerOfTwo || params.blockSizeR == 0U || params.parallelismP == 0U)
    {
        throw std::invalid_argument("deriveCredential: invalid scrypt parameters");
    }
    if (params.costN > g_kScryptMaxCostN || params.blockSizeR > g_kScryptMaxBlockSize ||
        params.parallelismP > g_kScryptMaxParallelism)
    {
        throw std::invalid_argument("deriveCredential: scrypt parameters exceed the supported range");
    }
}

// 128 * N * r bytes per lane, doubled for OpenSSL's own allocations.
[[nodiscard]] std::uint64_t scryptMemoryBudget(const notevault::crypto::ScryptParams& params) noexcept
{
    constexpr std::uint64_t kBlockUnit{ 128U };
    const std::uint64_t lanes{ static_cast<std::uint64_t>(params.parallelismP) + 1U };
    return 2U * kBlockUnit * params.costN * params.blockSizeR * lanes;
}

// Key and nonce are installed in one call; the nonce length is the cipher default of 12 bytes.
[[nodiscard]] EvpCipherCtxPtr startAead(const EVP_CIPHER* cipher, std::span<const std::uint8_t> key,
                                        std::span<const std::uint8_t> nonce,
                                        std::span<const std::byte> associatedData, bool encrypt)
{
    EvpCipherCtxPtr ctx{ EVP_CIPHER_CTX_new(), &EVP_CIPHER_CTX_free };
    if (!ctx)
    {
        throw std::runtime_error(opensslFailure("aead: EVP_CIPHER_CTX_new failed"));
    }
    if (EVP_CipherInit_ex2(ctx.get(), cipher, key.data(), nonce.data(), encrypt ? 1 : 0, nullptr) != 1)
    {
        throw std::runtime_error(opensslFailure("aead: EVP_CipherInit_ex2 failed"));
    }

    if (!associatedData.empty())
    {
        int ignored{ 0 };
        if (EVP_CipherUpdate(ctx.get(), nullptr, &ignored, bytePtr(associatedData),
                             static_cast<int>(associatedData.size())) != 1)
        {
            throw std::runtime_error(opensslFailure("aead: associated data rejected"));
        }
    }
    return ctx;
}

class OpenSslCryptoProvider final : public notevault::crypto::ICryptoProvider
{
public:
    // Throws std::runtime_error if the default provider lacks scrypt, BLAKE2b-MAC or ChaCha20-Poly1305.
    OpenSslCryptoProvider()
        : m_scrypt{ EVP_KDF_fetch(nullptr, OSSL_KDF_NAME_SCRYPT, nullptr), &EVP_KDF_free },
          m_blake2b{ EVP_MAC_fetch(nullptr, OSSL_MAC_NAME_BLAKE2BMAC, nullptr), &EVP_MAC_free },
          m_chacha{ EVP_CIPHER_fetch(nullptr, "ChaCha20-Poly1305", nullptr), &EVP_CIPHER_free }
    {
        if (!m_scrypt || !m_blake2b || !m_chacha)
        {
            throw std::runtime_error(
                opensslFailure("OpenSSL provider is missing scrypt, BLAKE2BMAC or ChaCha20-Poly1305"));
        }
        notevault::logging::LogRegistry::crypto()->debug("crypto: {} ready", OpenSSL_version(OPENSSL_VERSION));
    }

    [[nodiscard]] SecureBuffer deriveCredential(std::span<const std::byte> password, std::span<const std::byte> salt,
                                               const notevault::crypto::ScryptParams& params) const override
    {
        if (password.empty() || salt.empty())
        {
            throw std::invalid_argument("deriveCredential: password and salt must not be empty");
        }
        requireScryptParams(params);

        EvpKdfCtxPtr ctx{ EVP_KDF_CTX_new(m_scrypt.get()), &EVP_KDF_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error(opensslFailure("deriveCredential: EVP_KDF_CTX_new failed"));
        }

        // OSSL_PARAM wants mutable pointers even for inputs.
        SecureBuffer secret(password.size());
        std::memcpy(secret.data(), password.data(), password.size());
        std::vector<unsigned char> saltBytes(salt.size());
        std::memcpy(saltBytes.data(), salt.data(), salt.size());

        std::uint64_t costN{ params.costN };
        std::uint32_t blockSizeR{ params.blockSizeR };
        std::uint32_t parallelismP{ params.parallelismP };
        std::uint64_t maxMem{ scryptMemoryBudget(params) };
        const std::array<OSSL_PARAM, 7> osslParams{
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_PASSWORD, secret.data(), secret.size()),
            OSSL_PARAM_construct_octet_string(OSSL_KDF_PARAM_SALT, saltBytes.data(), saltBytes.size()),
            OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_SCRYPT_N, &costN),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_SCRYPT_R, &blockSizeR),
            OSSL_PARAM_construct_uint32(OSSL_KDF_PARAM_SCRYPT_P, &parallelismP),
            OSSL_PARAM_construct_uint64(OSSL_KDF_PARAM_SCRYPT_MAXMEM, &maxMem),
            OSSL_PARAM_construct_end(),
        };

        SecureBuffer key(notevault::crypto::g_kCredentialBytes);
        const int rc{ EVP_KDF_derive(ctx.get(), key.data(), key.size(), osslParams.data()) };
        notevault::security::secureRelease(secret);
        if (rc <= 0)
        {
            notevault::security::secureRelease(key);
            throw std::runtime_error(opensslFailure("deriveCredential: scrypt failed"));
        }
        return key;
    }

    [[nodiscard]] SecureBuffer deriveSubkey(std::span<const std::uint8_t> key, std::span<const std::byte> context,
                                            std::size_t outBytes) const override
    {
        if (key.empty() || context.empty())
        {
            throw std::invalid_argument("deriveSubkey: key and context must not be empty");
        }
        if (outBytes == 0U || outBytes > g_kMaxSubkeyBytes)
        {
            throw std::invalid_argument("deriveSubkey: output size must be 1..64 bytes");
        }

        EvpMacCtxPtr ctx{ EVP_MAC_CTX_new(m_blake2b.get()), &EVP_MAC_CTX_free };
        if (!ctx)
        {
            throw std::runtime_error(opensslFailure("deriveSubkey: EVP_MAC_CTX_new failed"));
        }

        std::size_t digestSize{ outBytes };
        const std::array<OSSL_PARAM, 2> params{
            OSSL_PARAM_construct_size_t(OSSL_MAC_PARAM_SIZE, &digestSize),
            OSSL_PARAM_construct_end(),
        };
        if (EVP_MAC_init(ctx.get(), key.data(), key.size(), params.data()) != 1 ||
            EVP_MAC_update(ctx.get(), bytePtr(context), context.size()) != 1)
        {
            throw std::runtime_error(opensslFailure("deriveSubkey: BLAKE2b-MAC failed"));
        }

        SecureBuffer subkey(outBytes);
        std::size_t written{ 0U };
        if (EVP_MAC_final(ctx.get(), subkey.data(), &written, subkey.size()) != 1 || written != subkey.size())
        {
            notevault::security::secureRelease(subkey);
            throw std::runtime_error(opensslFailure("deriveSubkey: EVP_MAC_final failed"));
        }
        return subkey;
    }

    [[nodiscard]] bool randomBytes(std::span<std::uint8_t> out) noexcept override
    {
        return notevault::security::secureRandomFill(out);
    }

    [[nodiscard]] notevault::crypto::SealedBox seal(std::span<const std::uint8_t> key,
                                                         std::span<const std::byte> plainText,
                                                         std::span<const std::byte> associatedData) override
    {
        if (key.size() != notevault::crypto::g_kAeadKeyBytes)
        {
            throw std::invalid_argument("seal: key must be 32 bytes");
        }
        if (!fitsInInt(plainText.size()) || !fitsInInt(associatedData.size()))
        {
            throw std::invalid_argument("seal: input too large");
        }

        notevault::crypto::SealedBox box{};
        if (!randomBytes(box.nonce))
        {
            throw std::runtime_error("seal: CSPRNG failure");
        }

        auto ctx{ startAead(m_chacha.get(), key, box.nonce, associatedData, true) };

        box.cipherText.resize(plainText.size());
        int produced{ 0 };
        if (!plainText.empty() && EVP_CipherUpdate(ctx.get(), box.cipherText.data(), &produced, bytePtr(plainText),
                                                   static_cast<int>(plainText.size())) != 1)
        {
            throw std::runtime_error(opensslFailure("seal: EVP_CipherUpdate failed"));
        }
        if (static_cast<std::size_t>(produced) != plainText.size())
        {
            throw std::runtime_error("seal: short ciphertext");
        }

        // Stream cipher: Final only computes the tag.
        std::array<unsigned char, notevault::crypto::g_kAeadTagBytes> scratch{};
        int trailing{ 0 };
        if (EVP_CipherFinal_ex(ctx.get(), scratch.data(), &trailing) != 1 || trailing != 0)
        {
            throw std::runtime_error(opensslFailure("seal: EVP_CipherFinal_ex failed"));
        }

        std::array<OSSL_PARAM, 2> tagParams{
            OSSL_PARAM_construct_octet_string(OSSL_CIPHER_PARAM_AEAD_TAG, box.tag.data(), box.tag.size()),
            OSSL_PARAM_construct_end(),
        };
        if (EVP_CIPHER_CTX_get_params(ctx.get(), tagParams.data()) != 1)
        {
            throw std::runtime_error(opensslFailure("seal: reading the tag failed"));
        }
        return box;
    }

    [[nodiscard]] std::optional<SecureBuffer> open(std::span<const std::uint8_t> key,
                                                          const notevault::crypto::SealedBox& box,
                                                          std::span<const std::byte> associatedData) override
    {
        if (key.size() != notevault::crypto::g_kAeadKeyBytes)
        {
            throw std::invalid_argument("open: key must be 32 bytes");
        }
        if (!fitsInInt(box.cipherText.size()) || !fitsInInt(associatedData.size()))
        {
            throw std::invalid_argument("open: input too large");
        }

        auto ctx{ startAead(m_chacha.get(), key, box.nonce, associatedData, false) };

        auto tag{ box.tag };
        std::array<OSSL_PARAM, 2> tagParams{
            OSSL_PARAM_construct_octet_string(OSSL_CIPHER_PARAM_AEAD_TAG, tag.data(), tag.size()),
            OSSL_PARAM_construct_end(),
        };
        if (EVP_CIPHER_CTX_set_params(ctx.get(), tagParams.data()) != 1)
        {
            throw std::runtime_error(opensslFailure("open: setting the tag failed"));
        }

        SecureBuffer plainText(box.cipherText.size());
        int produced{ 0 };
        if (!box.cipherText.empty() && EVP_CipherUpdate(ctx.get(), plainText.data(), &produced,
                                                        box.cipherText.data(),
                                                        static_cast<int>(box.cipherText.size())) != 1)
        {
            notevault::security::secureRelease(plainText);
            ERR_clear_error();
            return std::nullopt;
        }

        std::array<unsigned char, notevault::crypto::g_kAeadTagBytes> scratch{};
        int trailing{ 0 };
        if (static_cast<std::size_t>(produced) != plainText.size() ||
            EVP_CipherFinal_ex(ctx.get(), scratch.data(), &trailing) != 1 || trailing != 0)
        {
            notevault::security::secureRelease(plainText);
            ERR_clear_error();
            return std::nullopt;
        }
        return plainText;
    }

private:
    EvpKdfPtr m_scrypt;
    EvpMacPtr m_blake2b;
    EvpCipherPtr m_chacha;
};

} // namespace

std::unique_ptr<notevault::crypto::ICryptoProvider> makeOpenSslCryptoProvider()
{
    return std::make_unique<OpenSslCryptoProvider>();
}

} // namespace notevault::crypto::providers
