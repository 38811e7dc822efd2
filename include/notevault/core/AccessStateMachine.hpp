#ifndef INCLUDE_NOTEVAULT_CORE_ACCESSSTATEMACHINE_HPP
#define INCLUDE_NOTEVAULT_CORE_ACCESSSTATEMACHINE_HPP

#include "notevault/core/AccessState.hpp"
#include "notevault/core/CredentialManager.hpp"
#include "notevault/core/Session.hpp"
#include "notevault/core/VaultConfig.hpp"
#include "notevault/core/VaultError.hpp"
#include "notevault/crypto/ICryptoProvider.hpp"
#include "notevault/security/SecureString.hpp"
#include "notevault/storage/IRecordStore.hpp"
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notevault::core
{

// Gates every vault operation on the current AccessState.
//
// Each intent returns the resulting state. An intent that is not legal in the current state leaves
// the state unchanged and sets lastError() to InvalidTransition. lastError() is reset by every intent.
// If the session has been idle longer than its timeout, the user is logged off before the intent runs.
class AccessStateMachine final
{
public:
    // Starts in LoggedOff when `config` carries a verifier, in Empty otherwise.
    // Borrows `crypto` and `records`; both must outlive the machine.
    AccessStateMachine(notevault::crypto::ICryptoProvider& crypto, notevault::storage::IRecordStore& records,
                       VaultConfig config, Session::Duration idleTimeout,
                       Session::NowProvider nowProvider = Session::Clock::now);

    AccessStateMachine(const AccessStateMachine&) = delete;
    AccessStateMachine& operator=(const AccessStateMachine&) = delete;
    AccessStateMachine(AccessStateMachine&&) = delete;
    AccessStateMachine& operator=(AccessStateMachine&&) = delete;
    ~AccessStateMachine() = default;

    AccessState submitNewPassword(const notevault::security::SecureString& password);
    AccessState submitLogin(const notevault::security::SecureString& password);
    AccessState acknowledge();

    AccessState selectAdd();
    AccessState selectFind();
    AccessState selectDelete();
    AccessState submitRecord(std::string_view title, const notevault::security::SecureString& body);
    AccessState submitFind(std::string_view title);
    AccessState submitDelete(std::string_view title);
    AccessState cancel();

    AccessState requestChangePassword();
    AccessState submitChangePassword(const notevault::security::SecureString& currentPassword,
                                     const notevault::security::SecureString& newPassword);

    AccessState requestHardReset();
    AccessState confirmHardReset(const notevault::security::SecureString& password);
    AccessState declineHardReset();

    AccessState logoff();

    // Logs off an idle session. Returns true if it did.
    bool expireIdleSession();

    [[nodiscard]] AccessState state() const noexcept
    {
        return m_state;
    }
    [[nodiscard]] std::optional<VaultError> lastError() const noexcept
    {
        return m_lastError;
    }
    [[nodiscard]] bool hasSession() const noexcept
    {
        return m_session.has_value();
    }
    [[nodiscard]] const VaultConfig& config() const noexcept
    {
        return m_config;
    }
    // nullopt without a session or when idle expiry is disabled.
    [[nodiscard]] std::optional<Session::Duration> idleTimeLeft() const noexcept
    {
        return m_session ? m_session->remaining() : std::nullopt;
    }

    // Decrypted body of the last successful find; empty outside RecordFound.
    [[nodiscard]] std::optional<std::string_view> foundRecord() const noexcept;

    // InvalidTransition unless authenticated; StorageIO when the store fails.
    [[nodiscard]] VaultResult<std::vector<std::string>> titles();

private:
    void beginIntent();
    AccessState moveTo(AccessState next);
    AccessState fail(AccessState next, VaultError error);
    AccessState reject();
    void endSession() noexcept;

    AccessState select(AccessState target);
    // Decrypts every body with `from` and encrypts it with `to`. Nothing is written.
    [[nodiscard]] VaultResult<std::vector<notevault::storage::StoredRecord>>
    reencryptAll(std::vector<notevault::storage::StoredRecord> records, Cipher& from, Cipher& to);

    notevault::crypto::ICryptoProvider* m_crypto{ nullptr };
    notevault::storage::IRecordStore* m_records{ nullptr };
    CredentialManager m_credentials;
    VaultConfig m_config;
    Session::Duration m_idleTimeout{};
    Session::NowProvider m_now;

    AccessState m_state{ AccessState::Empty };
    std::optional<VaultError> m_lastError{};
    std::optional<Session> m_session{};
    std::optional<notevault::security::SecureString> m_foundRecord{};
};

} // namespace notevault::core

#endif // INCLUDE_NOTEVAULT_CORE_ACCESSSTATEMACHINE_HPP
