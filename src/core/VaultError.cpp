#include "notevault/core/VaultError.hpp"

namespace notevault::core
{

std::string_view toString(VaultError error) noexcept
{
    switch (error)
    {
    case VaultError::RandomFailed:
        return "random generator failure";
    case VaultError::RequirementsNotMet:
        return "password does not meet requirements";
    case VaultError::AuthenticationFailed:
        return "invalid password";
    case VaultError::DuplicateTitle:
        return "a note with this title already exists";
    case VaultError::CipherError:
        return "note could not be decrypted";
    case VaultError::ConfigParse:
        return "vault configuration is corrupt";
    case VaultError::ConfigIO:
        return "vault configuration could not be read or written";
    case VaultError::StorageIO:
        return "note storage failure";
    case VaultError::EmptyInput:
        return "title or body is empty";
    case VaultError::InvalidTransition:
        return "operation not allowed in the current state";
    }
    return "unknown error";
}

} // namespace notevault::core
