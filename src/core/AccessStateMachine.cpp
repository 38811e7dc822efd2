#include "notevault/core/AccessStateMachine.hpp"

#include "notevault/logging/LogRegistry.hpp"
#include "notevault/security/SecureBuffer.hpp"
#include "notevault/storage/StorageErrors.hpp"
#include <exception>
#include <stdexcept>
#include <utility>

namespace notevault::core
{

using notevault::logging::LogRegistry;
using notevault::security::SecureString;
using notevault::storage::DuplicateTitleError;
using notevault::storage::StorageIOError;
using notevault::storage::StoredRecord;

AccessStateMachine::AccessStateMachine(notevault::crypto::ICryptoProvider& crypto,
                                       notevault::storage::IRecordStore& records, VaultConfig config,
                                       Session::Duration idleTimeout, Session::NowProvider nowProvider)
    : m_crypto(&crypto), m_records(&records), m_credentials(crypto), m_config(std::move(config)),
      m_idleTimeout(idleTimeout), m_now(std::move(nowProvider))
{
    m_state = m_config.hasVerifier() ? AccessState::LoggedOff : AccessState::Empty;
    LogRegistry::auth()->debug("access: starting in {}", toString(m_state));
}

AccessState AccessStateMachine::submitNewPassword(const SecureString& password)
{
    beginIntent();
    if (m_state != AccessState::Empty)
    {
        return reject();
    }
    if (!CredentialManager::meetsRequirements(notevault::security::asStringView(password)))
    {
        LogRegistry::auth()->info("access: new password rejected by requirements");
        return fail(AccessState::InvalidNewPassword, VaultError::RequirementsNotMet);
    }

    VaultConfig candidate{ m_config };
    try
    {
        auto credential{ m_credentials.deriveKey(password, candidate.passwordSalt()) };
        auto verifier{ m_credentials.verifierFor(credential) };
        notevault::security::secureRelease(credential);
        candidate.setVerifier(notevault::security::asSpan(verifier));
    }
    catch (const std::exception& e)
    {
        LogRegistry::crypto()->error("access: deriving the new verifier failed: {}", e.what());
        return fail(AccessState::Empty, VaultError::CipherError);
    }

    const auto saved{ candidate.save() };
    if (const auto* err{ std::get_if<VaultError>(&saved) })
    {
        return fail(AccessState::Empty, *err);
    }

    m_config = std::move(candidate);
    LogRegistry::auth()->info("access: password set");
    return moveTo(AccessState::LoggedOff);
}

AccessState AccessStateMachine::submitLogin(const SecureString& password)
{
    beginIntent();
    if (m_state != AccessState::LoggedOff)
    {
        return reject();
    }

    auto result{ m_credentials.authenticate(password, m_config.passwordSalt(), m_config.verifier()) };
    if (const auto* err{ std::get_if<VaultError>(&result) })
    {
        LogRegistry::auth()->info("access: login failed");
        return fail(AccessState::InvalidPassword, *err);
    }

    auto& credential{ std::get<notevault::security::SecureBuffer>(result) };
    try
    {
        Cipher cipher{ *m_crypto, m_credentials, credential };
        notevault::security::secureRelease(credential);
        m_session.emplace(std::move(cipher), m_idleTimeout, m_now);
    }
    catch (const std::exception& e)
    {
        notevault::security::secureRelease(credential);
        LogRegistry::crypto()->error("access: building the session cipher failed: {}", e.what());
        return fail(AccessState::InvalidPassword, VaultError::CipherError);
    }

    LogRegistry::auth()->info("access: login succeeded");
    return moveTo(AccessState::LoggedOn);
}

AccessState AccessStateMachine::acknowledge()
{
    beginIntent();
    switch (m_state)
    {
    case AccessState::InvalidNewPassword:
    case AccessState::HardReset:
        return moveTo(AccessState::Empty);
    case AccessState::InvalidPassword:
        return moveTo(AccessState::LoggedOff);
    case AccessState::RecordFound:
    case AccessState::RecordNotFound:
    case AccessState::ChangePasswordFailed:
    case AccessState::ConfirmHardResetFailed:
        return moveTo(AccessState::LoggedOn);
    default:
        return reject();
    }
}

AccessState AccessStateMachine::selectAdd()
{
    return select(AccessState::AddRecord);
}

AccessState AccessStateMachine::selectFind()
{
    return select(AccessState::FindRecord);
}

AccessState AccessStateMachine::selectDelete()
{
    return select(AccessState::DeleteRecord);
}

AccessState AccessStateMachine::select(AccessState target)
{
    beginIntent();
    if (m_state != AccessState::LoggedOn && m_state != AccessState::RecordFound &&
        m_state != AccessState::RecordNotFound)
    {
        return reject();
    }
    return moveTo(target);
}

AccessState AccessStateMachine::submitRecord(std::string_view title, const SecureString& body)
{
    beginIntent();
    if (m_state != AccessState::AddRecord)
    {
        return reject();
    }
    if (title.empty() || body.empty())
    {
        return fail(AccessState::AddRecord, VaultError::EmptyInput);
    }

    std::string token{};
    try
    {
        token = m_session->cipher().encrypt(body);
    }
    catch (const std::runtime_error& e)
    {
        LogRegistry::crypto()->error("access: encrypting record failed: {}", e.what());
        return fail(AccessState::AddRecord, VaultError::CipherError);
    }

    try
    {
        m_records->put(title, token);
    }
    catch (const DuplicateTitleError&)
    {
        LogRegistry::storage()->info("access: record '{}' already exists", title);
        return fail(AccessState::AddRecord, VaultError::DuplicateTitle);
    }
    catch (const StorageIOError& e)
    {
        LogRegistry::storage()->error("{}", e.what());
        return fail(AccessState::AddRecord, VaultError::StorageIO);
    }

    LogRegistry::storage()->debug("access: record '{}' added", title);
    return moveTo(AccessState::LoggedOn);
}

AccessState AccessStateMachine::submitFind(std::string_view title)
{
    beginIntent();
    if (m_state != AccessState::FindRecord)
    {
        return reject();
    }
    if (title.empty())
    {
        return fail(AccessState::FindRecord, VaultError::EmptyInput);
    }

    std::optional<std::string> token{};
    try
    {
        token = m_records->get(title);
    }
    catch (const StorageIOError& e)
    {
        LogRegistry::storage()->error("{}", e.what());
        return fail(AccessState::RecordNotFound, VaultError::StorageIO);
    }
    if (!token)
    {
        return moveTo(AccessState::RecordNotFound);
    }

    auto plain{ m_session->cipher().decrypt(*token) };
    if (std::holds_alternative<VaultError>(plain))
    {
        LogRegistry::crypto()->warn("access: record '{}' failed authentication, possible tampering", title);
        return fail(AccessState::RecordNotFound, VaultError::CipherError);
    }

    m_foundRecord = std::move(std::get<SecureString>(plain));
    return moveTo(AccessState::RecordFound);
}

AccessState AccessStateMachine::submitDelete(std::string_view title)
{
    beginIntent();
    if (m_state != AccessState::DeleteRecord)
    {
        return reject();
    }
    if (title.empty())
    {
        return fail(AccessState::DeleteRecord, VaultError::EmptyInput);
    }

    try
    {
        m_records->remove(title);
    }
    catch (const StorageIOError& e)
    {
        LogRegistry::storage()->error("{}", e.what());
        return fail(AccessState::DeleteRecord, VaultError::StorageIO);
    }

    LogRegistry::storage()->debug("access: record '{}' deleted", title);
    return moveTo(AccessState::LoggedOn);
}

AccessState AccessStateMachine::cancel()
{
    beginIntent();
    switch (m_state)
    {
    case AccessState::AddRecord:
    case AccessState::FindRecord:
    case AccessState::DeleteRecord:
    case AccessState::ChangePassword:
        return moveTo(AccessState::LoggedOn);
    default:
        return reject();
    }
}

AccessState AccessStateMachine::requestChangePassword()
{
    beginIntent();
    if (!isAuthenticated(m_state))
    {
        return reject();
    }
    return moveTo(AccessState::ChangePassword);
}

VaultResult<std::vector<StoredRecord>> AccessStateMachine::reencryptAll(std::vector<StoredRecord> records,
                                                                       Cipher& from, Cipher& to)
{
    for (auto& record : records)
    {
        auto plain{ from.decrypt(record.body) };
        if (std::holds_alternative<VaultError>(plain))
        {
            LogRegistry::crypto()->warn("access: record '{}' failed authentication during re-encryption",
                                        record.title);
            return VaultError::CipherError;
        }
        auto& text{ std::get<SecureString>(plain) };
        record.body = to.encrypt(text);
        notevault::security::secureRelease(text);
    }
    return records;
}

AccessState AccessStateMachine::submitChangePassword(const SecureString& currentPassword,
                                                     const SecureString& newPassword)
{
    beginIntent();
    if (m_state != AccessState::ChangePassword)
    {
        return reject();
    }

    if (!m_credentials.verify(currentPassword, m_config.passwordSalt(), m_config.verifier()))
    {
        LogRegistry::auth()->info("access: password change refused, current password wrong");
        return fail(AccessState::ChangePasswordFailed, VaultError::AuthenticationFailed);
    }
    if (!CredentialManager::meetsRequirements(notevault::security::asStringView(newPassword)))
    {
        return fail(AccessState::ChangePasswordFailed, VaultError::RequirementsNotMet);
    }

    VaultConfig candidate{ m_config };
    std::optional<Cipher> newCipher{};
    try
    {
        auto credential{ m_credentials.deriveKey(newPassword, m_config.passwordSalt()) };
        auto verifier{ m_credentials.verifierFor(credential) };
        candidate.setVerifier(notevault::security::asSpan(verifier));
        newCipher.emplace(*m_crypto, m_credentials, credential);
        notevault::security::secureRelease(credential);
    }
    catch (const std::exception& e)
    {
        LogRegistry::crypto()->error("access: deriving the new key failed: {}", e.what());
        return fail(AccessState::ChangePasswordFailed, VaultError::CipherError);
    }

    std::vector<StoredRecord> original{};
    try
    {
        original = m_records->listRecords();
        auto rewritten{ reencryptAll(original, m_session->cipher(), *newCipher) };
        if (const auto* err{ std::get_if<VaultError>(&rewritten) })
        {
            return fail(AccessState::ChangePasswordFailed, *err);
        }
        m_records->replaceBodies(std::get<std::vector<StoredRecord>>(rewritten));
    }
    catch (const StorageIOError& e)
    {
        LogRegistry::storage()->error("{}", e.what());
        return fail(AccessState::ChangePasswordFailed, VaultError::StorageIO);
    }
    catch (const std::runtime_error& e)
    {
        LogRegistry::crypto()->error("access: re-encryption failed: {}", e.what());
        return fail(AccessState::ChangePasswordFailed, VaultError::CipherError);
    }

    const auto saved{ candidate.save() };
    if (const auto* err{ std::get_if<VaultError>(&saved) })
    {
        // The verifier on disk was not replaced, so the old tokens are still the valid ones; put them back.
        try
        {
            m_records->replaceBodies(original);
        }
        catch (const StorageIOError& e)
        {
            LogRegistry::storage()->critical("access: restoring records after failed config save failed: {}",
                                             e.what());
        }
        return fail(AccessState::ChangePasswordFailed, *err);
    }

    m_config = std::move(candidate);
    m_session->rebind(std::move(*newCipher));
    LogRegistry::auth()->info("access: password changed, {} records re-encrypted", original.size());
    return moveTo(AccessState::LoggedOn);
}

AccessState AccessStateMachine::requestHardReset()
{
    beginIntent();
    if (!isAuthenticated(m_state))
    {
        return reject();
    }
    return moveTo(AccessState::ConfirmHardReset);
}

AccessState AccessStateMachine::confirmHardReset(const SecureString& password)
{
    beginIntent();
    if (m_state != AccessState::ConfirmHardReset)
    {
        return reject();
    }
    if (!m_credentials.verify(password, m_config.passwordSalt(), m_config.verifier()))
    {
        LogRegistry::auth()->info("access: hard reset refused, wrong password");
        return fail(AccessState::ConfirmHardResetFailed, VaultError::AuthenticationFailed);
    }

    auto salt{ m_credentials.generateSalt() };
    if (const auto* err{ std::get_if<VaultError>(&salt) })
    {
        return fail(AccessState::ConfirmHardResetFailed, *err);
    }

    try
    {
        m_records->clear();
    }
    catch (const StorageIOError& e)
    {
        LogRegistry::storage()->error("{}", e.what());
        return fail(AccessState::ConfirmHardResetFailed, VaultError::StorageIO);
    }

    // Records are gone from here on; the reset completes even when the config files cannot be removed.
    const auto erased{ m_config.erase() };
    endSession();
    m_config = VaultConfig::initialize(m_config.storagePath(), std::move(std::get<std::string>(salt)));
    LogRegistry::auth()->warn("access: vault reset, all records destroyed");
    if (const auto* err{ std::get_if<VaultError>(&erased) })
    {
        LogRegistry::config()->critical("access: stale configuration left in {} after reset",
                                        m_config.storagePath().string());
        return fail(AccessState::HardReset, *err);
    }
    return moveTo(AccessState::HardReset);
}

AccessState AccessStateMachine::declineHardReset()
{
    beginIntent();
    if (m_state != AccessState::ConfirmHardReset)
    {
        return reject();
    }
    return moveTo(AccessState::ConfirmHardResetFailed);
}

AccessState AccessStateMachine::logoff()
{
    beginIntent();
    if (!m_session)
    {
        return reject();
    }
    endSession();
    LogRegistry::auth()->info("access: logged off");
    return moveTo(AccessState::LoggedOff);
}

bool AccessStateMachine::expireIdleSession()
{
    if (!m_session || !m_session->isExpired())
    {
        return false;
    }
    endSession();
    LogRegistry::auth()->info("access: session idle for more than {}s, logged off", m_idleTimeout.count());
    (void)moveTo(AccessState::LoggedOff);
    return true;
}

std::optional<std::string_view> AccessStateMachine::foundRecord() const noexcept
{
    if (m_state != AccessState::RecordFound || !m_foundRecord)
    {
        return std::nullopt;
    }
    return notevault::security::asStringView(*m_foundRecord);
}

VaultResult<std::vector<std::string>> AccessStateMachine::titles()
{
    (void)expireIdleSession();
    if (!isAuthenticated(m_state))
    {
        return VaultError::InvalidTransition;
    }
    m_session->touch();
    try
    {
        return m_records->listTitles();
    }
    catch (const StorageIOError& e)
    {
        LogRegistry::storage()->error("{}", e.what());
        return VaultError::StorageIO;
    }
}

void AccessStateMachine::beginIntent()
{
    (void)expireIdleSession();
    m_lastError.reset();
    if (m_foundRecord)
    {
        notevault::security::secureRelease(*m_foundRecord);
        m_foundRecord.reset();
    }
    if (m_session)
    {
        m_session->touch();
    }
}

AccessState AccessStateMachine::moveTo(AccessState next)
{
    if (next != m_state)
    {
        LogRegistry::auth()->trace("access: {} -> {}", toString(m_state), toString(next));
    }
    m_state = next;
    return m_state;
}

AccessState AccessStateMachine::fail(AccessState next, VaultError error)
{
    m_lastError = error;
    LogRegistry::auth()->debug("access: {} failed with {}", toString(m_state), toString(error));
    return moveTo(next);
}

AccessState AccessStateMachine::reject()
{
    m_lastError = VaultError::InvalidTransition;
    LogRegistry::auth()->debug("access: intent not allowed in {}", toString(m_state));
    return m_state;
}

void AccessStateMachine::endSession() noexcept
{
    m_session.reset();
    if (m_foundRecord)
    {
        notevault::security::secureRelease(*m_foundRecord);
        m_foundRecord.reset();
    }
}

} // namespace notevault::core
