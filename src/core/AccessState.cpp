#include "notevault/core/AccessState.hpp"

namespace notevault::core
{

std::string_view toString(AccessState state) noexcept
{
    switch (state)
    {
    case AccessState::Empty:
        return "Empty";
    case AccessState::InvalidNewPassword:
        return "InvalidNewPassword";
    case AccessState::LoggedOff:
        return "LoggedOff";
    case AccessState::InvalidPassword:
        return "InvalidPassword";
    case AccessState::LoggedOn:
        return "LoggedOn";
    case AccessState::AddRecord:
        return "AddRecord";
    case AccessState::FindRecord:
        return "FindRecord";
    case AccessState::DeleteRecord:
        return "DeleteRecord";
    case AccessState::RecordFound:
        return "RecordFound";
    case AccessState::RecordNotFound:
        return "RecordNotFound";
    case AccessState::ChangePassword:
        return "ChangePassword";
    case AccessState::ChangePasswordFailed:
        return "ChangePasswordFailed";
    case AccessState::ConfirmHardReset:
        return "ConfirmHardReset";
    case AccessState::ConfirmHardResetFailed:
        return "ConfirmHardResetFailed";
    case AccessState::HardReset:
        return "HardReset";
    }
    return "Unknown";
}

} // namespace notevault::core
