#ifndef INCLUDE_NOTEVAULT_CORE_ACCESSSTATE_HPP
#define INCLUDE_NOTEVAULT_CORE_ACCESSSTATE_HPP

#include <cstdint>
#include <string_view>

namespace notevault::core
{

enum class AccessState : std::uint8_t
{
    Empty,
    InvalidNewPassword,
    LoggedOff,
    InvalidPassword,
    LoggedOn,
    AddRecord,
    FindRecord,
    DeleteRecord,
    RecordFound,
    RecordNotFound,
    ChangePassword,
    ChangePasswordFailed,
    ConfirmHardReset,
    ConfirmHardResetFailed,
    HardReset,
};

// States in which record operations are offered. Dialogs that merely keep a session alive
// (password change, hard reset confirmation) are not included.
[[nodiscard]] constexpr bool isAuthenticated(AccessState state) noexcept
{
    switch (state)
    {
    case AccessState::LoggedOn:
    case AccessState::AddRecord:
    case AccessState::FindRecord:
    case AccessState::DeleteRecord:
    case AccessState::RecordFound:
    case AccessState::RecordNotFound:
        return true;
    default:
        return false;
    }
}

[[nodiscard]] std::string_view toString(AccessState state) noexcept;

} // namespace notevault::core

#endif // INCLUDE_NOTEVAULT_CORE_ACCESSSTATE_HPP
