#ifndef INCLUDE_NOTEVAULT_CORE_VAULTCONFIG_HPP
#define INCLUDE_NOTEVAULT_CORE_VAULTCONFIG_HPP

#include "notevault/core/CredentialManager.hpp"
#include "notevault/core/VaultError.hpp"
#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>

namespace notevault::core
{

constexpr std::string_view g_kConfigFileName{ "notevault.meta" };
constexpr std::string_view g_kVerifierFileName{ "notevault.verifier" };

using PasswordVerifier = std::array<std::uint8_t, g_kVerifierBytes>;

// Salt and password verifier of one vault.
//
// On disk: `notevault.meta` (magic, version, storage path, salt) and `notevault.verifier` (raw bytes).
// The two files exist together or not at all; anything else is a corrupt vault.
class VaultConfig final
{
public:
    // True if either artifact is present, so a half-written vault is reported by load() instead of overwritten.
    [[nodiscard]] static bool exists(const std::filesystem::path& storageDir) noexcept;

    // ConfigParse for malformed or incomplete artifacts, ConfigIO when they cannot be read.
    [[nodiscard]] static VaultResult<VaultConfig> load(const std::filesystem::path& storageDir) noexcept;

    // In-memory config for a vault that has no password yet. Nothing is written until save().
    [[nodiscard]] static VaultConfig initialize(std::filesystem::path storageDir, std::string salt);

    [[nodiscard]] const std::filesystem::path& storagePath() const noexcept
    {
        return m_storagePath;
    }
    [[nodiscard]] const std::string& passwordSalt() const noexcept
    {
        return m_passwordSalt;
    }
    [[nodiscard]] bool hasVerifier() const noexcept
    {
        return m_verifier.has_value();
    }
    // Empty span while no password is set.
    [[nodiscard]] std::span<const std::uint8_t> verifier() const noexcept;

    // Overwrites any previous verifier (password change). Throws std::invalid_argument on a wrong length.
    void setVerifier(std::span<const std::uint8_t> verifier);

    // Writes both files via temp file + rename, meta first and verifier last. A failure before the verifier
    // rename leaves the previously saved verifier in place.
    [[nodiscard]] VaultResult<std::monostate> save() const noexcept;

    // Removes both files and forgets the verifier. On failure the in-memory verifier is kept.
    [[nodiscard]] VaultResult<std::monostate> erase() noexcept;

private:
    VaultConfig(std::filesystem::path storageDir, std::string salt, std::optional<PasswordVerifier> verifier);

    std::filesystem::path m_storagePath;
    std::string m_passwordSalt;
    std::optional<PasswordVerifier> m_verifier;
};

} // namespace notevault::core

#endif // INCLUDE_NOTEVAULT_CORE_VAULTCONFIG_HPP
