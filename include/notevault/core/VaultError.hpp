#ifndef INCLUDE_NOTEVAULT_CORE_VAULTERROR_HPP
#define INCLUDE_NOTEVAULT_CORE_VAULTERROR_HPP

#include <cstdint>
#include <string_view>
#include <variant>

namespace notevault::core
{

enum class VaultError : std::uint8_t
{
    RandomFailed,
    RequirementsNotMet,
    AuthenticationFailed,
    DuplicateTitle,
    CipherError,
    ConfigParse,
    ConfigIO,
    StorageIO,
    EmptyInput,
    InvalidTransition,
};

template <class T> using VaultResult = std::variant<T, VaultError>;

[[nodiscard]] std::string_view toString(VaultError error) noexcept;

} // namespace notevault::core

#endif // INCLUDE_NOTEVAULT_CORE_VAULTERROR_HPP
