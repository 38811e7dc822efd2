#ifndef INCLUDE_NOTEVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
#define INCLUDE_NOTEVAULT_CRYPTO_ICRYPTOPROVIDER_HPP

#include "notevault/crypto/KdfParams.hpp"
#include "notevault/security/SecureBuffer.hpp"
#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace notevault::crypto
{

// ChaCha20-Poly1305, IETF variant.
constexpr std::size_t g_kAeadKeyBytes{ 32 };
constexpr std::size_t g_kAeadNonceBytes{ 12 };
constexpr std::size_t g_kAeadTagBytes{ 16 };

// Output of one seal() call. The nonce travels with the ciphertext.
struct SealedBox final
{
    std::array<std::uint8_t, g_kAeadNonceBytes> nonce{};
    std::array<std::uint8_t, g_kAeadTagBytes> tag{};
    std::vector<std::uint8_t> cipherText;
};

// Every primitive the vault needs, behind one seam so tests can inject failures.
//
// Contract violations (empty inputs, wrong key size, unsupported parameters) throw std::invalid_argument;
// backend failures throw std::runtime_error. Authentication failure is not an error: open() returns nullopt.
class ICryptoProvider
{
public:
    ICryptoProvider() = default;
    ICryptoProvider(const ICryptoProvider&) = delete;
    ICryptoProvider& operator=(const ICryptoProvider&) = delete;
    ICryptoProvider(ICryptoProvider&&) = delete;
    ICryptoProvider& operator=(ICryptoProvider&&) = delete;
    virtual ~ICryptoProvider() = default;

    // scrypt(password, salt), g_kCredentialBytes long.
    [[nodiscard]] virtual notevault::security::SecureBuffer
    deriveCredential(std::span<const std::byte> password, std::span<const std::byte> salt,
                     const ScryptParams& params) const = 0;

    // BLAKE2b keyed with `key` over `context`. Different contexts yield independent subkeys.
    [[nodiscard]] virtual notevault::security::SecureBuffer deriveSubkey(std::span<const std::uint8_t> key,
                                                                         std::span<const std::byte> context,
                                                                         std::size_t outBytes) const = 0;

    // OS CSPRNG. False on failure, never a partial success.
    [[nodiscard]] virtual bool randomBytes(std::span<std::uint8_t> out) noexcept = 0;

    // Encrypts under a fresh random nonce.
    [[nodiscard]] virtual SealedBox seal(std::span<const std::uint8_t> key, std::span<const std::byte> plainText,
                                         std::span<const std::byte> associatedData) = 0;

    [[nodiscard]] virtual std::optional<notevault::security::SecureBuffer>
    open(std::span<const std::uint8_t> key, const SealedBox& box, std::span<const std::byte> associatedData) = 0;
};

} // namespace notevault::crypto

#endif // INCLUDE_NOTEVAULT_CRYPTO_ICRYPTOPROVIDER_HPP
