#include "notevault/core/AccessStateMachine.hpp"
#include "notevault/core/Cipher.hpp"
#include "notevault/core/CredentialManager.hpp"
#include "notevault/core/VaultConfig.hpp"
#include "notevault/security/SecureString.hpp"
#include "notevault/storage/StorageErrors.hpp"
#include "notevault/storage/sqlite/SqliteRecordStoreFactory.hpp"
#include "test_utils/Fakes.hpp"
#include "test_utils/TestUtils.hpp"
#include <cstdint>
#include <filesystem>
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace
{

namespace fs = std::filesystem;
using notevault::core::AccessState;
using notevault::core::AccessStateMachine;
using notevault::core::Session;
using notevault::core::VaultConfig;
using notevault::core::VaultError;
using notevault::storage::StorageIOError;
using ::testing::Return;
using ::testing::Throw;

constexpr std::string_view g_kPassword{ "Str0ng!Pass" };
constexpr std::string_view g_kNewPassword{ "N3w!Passw0rd" };
constexpr Session::Duration g_kIdleTimeout{ 300 };

[[nodiscard]] notevault::security::SecureString pw(std::string_view s)
{
    return notevault::security::secureStringFrom(s);
}

[[nodiscard]] std::string newSalt(notevault::crypto::ICryptoProvider& crypto)
{
    notevault::core::CredentialManager credentials{ crypto };
    return std::get<std::string>(credentials.generateSalt());
}

// Any directory at the temp path makes the atomic write fail at open time.
void blockConfigWrites(const fs::path& dir, std::string_view file = notevault::core::g_kVerifierFileName)
{
    fs::create_directory(dir / (std::string{ file } + ".tmp"));
}

void unblockConfigWrites(const fs::path& dir, std::string_view file = notevault::core::g_kVerifierFileName)
{
    fs::remove(dir / (std::string{ file } + ".tmp"));
}

class AccessStateMachineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.valid());
        m_store = notevault::storage::sqlite::makeSqliteRecordStore(m_dir.path());
        m_machine = makeMachine(VaultConfig::initialize(m_dir.path(), newSalt(m_crypto)));
    }

    [[nodiscard]] std::unique_ptr<AccessStateMachine> makeMachine(VaultConfig config)
    {
        return std::make_unique<AccessStateMachine>(m_crypto, *m_store, std::move(config), g_kIdleTimeout,
                                                    [this]() { return m_now; });
    }

    // Simulates a restart: a new machine built from what is on disk.
    void restart()
    {
        m_machine.reset();
        auto loaded{ VaultConfig::load(m_dir.path()) };
        ASSERT_TRUE(std::holds_alternative<VaultConfig>(loaded));
        m_machine = makeMachine(std::move(std::get<VaultConfig>(loaded)));
    }

    void registerPassword()
    {
        ASSERT_EQ(m_machine->submitNewPassword(pw(g_kPassword)), AccessState::LoggedOff);
    }

    void registerAndLogin()
    {
        registerPassword();
        ASSERT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
    }

    void addRecord(std::string_view title, std::string_view body)
    {
        ASSERT_EQ(m_machine->selectAdd(), AccessState::AddRecord);
        ASSERT_EQ(m_machine->submitRecord(title, pw(body)), AccessState::LoggedOn);
    }

    [[nodiscard]] std::string findRecord(std::string_view title)
    {
        EXPECT_EQ(m_machine->selectFind(), AccessState::FindRecord);
        std::string out{};
        if (m_machine->submitFind(title) == AccessState::RecordFound)
        {
            out = std::string{ m_machine->foundRecord().value_or("") };
        }
        (void)m_machine->acknowledge();
        return out;
    }

    notevault::test_utils::FlakyCrypto m_crypto;                 // NOLINT
    notevault::test_utils::TempDir m_dir{ "access_machine_" };   // NOLINT
    std::unique_ptr<notevault::storage::IRecordStore> m_store;  // NOLINT
    Session::TimePoint m_now{};                                 // NOLINT
    std::unique_ptr<AccessStateMachine> m_machine;              // NOLINT
};

TEST_F(AccessStateMachineTest, StartsEmptyWithoutPassword)
{
    EXPECT_EQ(m_machine->state(), AccessState::Empty);
    EXPECT_FALSE(m_machine->hasSession());
    EXPECT_FALSE(m_machine->lastError().has_value());
}

TEST_F(AccessStateMachineTest, ShortPasswordIsRejected)
{
    EXPECT_EQ(m_machine->submitNewPassword(pw("short")), AccessState::InvalidNewPassword);
    EXPECT_EQ(m_machine->lastError(), VaultError::RequirementsNotMet);
    EXPECT_FALSE(VaultConfig::exists(m_dir.path()));

    EXPECT_EQ(m_machine->acknowledge(), AccessState::Empty);
}

TEST_F(AccessStateMachineTest, StrongPasswordPersistsVerifier)
{
    EXPECT_EQ(m_machine->submitNewPassword(pw(g_kPassword)), AccessState::LoggedOff);
    EXPECT_TRUE(m_machine->config().hasVerifier());

    auto loaded{ VaultConfig::load(m_dir.path()) };
    ASSERT_TRUE(std::holds_alternative<VaultConfig>(loaded));
    EXPECT_TRUE(std::get<VaultConfig>(loaded).hasVerifier());
    EXPECT_EQ(std::get<VaultConfig>(loaded).passwordSalt(), m_machine->config().passwordSalt());
}

TEST_F(AccessStateMachineTest, LoginWithCorrectPassword)
{
    registerPassword();
    EXPECT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
    EXPECT_TRUE(m_machine->hasSession());
    EXPECT_TRUE(notevault::core::isAuthenticated(m_machine->state()));
}

TEST_F(AccessStateMachineTest, LoginWithWrongPasswordStaysLocked)
{
    registerPassword();
    const auto verifierBefore{ std::vector<std::uint8_t>(m_machine->config().verifier().begin(),
                                                         m_machine->config().verifier().end()) };

    EXPECT_EQ(m_machine->submitLogin(pw("Wr0ng!Pass")), AccessState::InvalidPassword);
    EXPECT_EQ(m_machine->lastError(), VaultError::AuthenticationFailed);
    EXPECT_FALSE(m_machine->hasSession());
    EXPECT_EQ(m_machine->acknowledge(), AccessState::LoggedOff);

    const std::vector<std::uint8_t> verifierAfter(m_machine->config().verifier().begin(),
                                                  m_machine->config().verifier().end());
    EXPECT_EQ(verifierBefore, verifierAfter);
}

TEST_F(AccessStateMachineTest, RestartStartsLoggedOff)
{
    registerAndLogin();
    addRecord("groceries", "milk, eggs");

    restart();
    EXPECT_EQ(m_machine->state(), AccessState::LoggedOff);
    EXPECT_FALSE(m_machine->hasSession());
    ASSERT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
    EXPECT_EQ(findRecord("groceries"), "milk, eggs");
}

TEST_F(AccessStateMachineTest, IllegalIntentsLeaveStateUnchanged)
{
    EXPECT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::Empty);
    EXPECT_EQ(m_machine->lastError(), VaultError::InvalidTransition);
    EXPECT_EQ(m_machine->selectAdd(), AccessState::Empty);
    EXPECT_EQ(m_machine->logoff(), AccessState::Empty);

    registerPassword();
    EXPECT_EQ(m_machine->submitNewPassword(pw(g_kNewPassword)), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->lastError(), VaultError::InvalidTransition);
    EXPECT_EQ(m_machine->selectFind(), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->requestChangePassword(), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->requestHardReset(), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->submitFind("x"), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->acknowledge(), AccessState::LoggedOff);

    ASSERT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
    EXPECT_EQ(m_machine->submitRecord("t", pw("b")), AccessState::LoggedOn);
    EXPECT_EQ(m_machine->lastError(), VaultError::InvalidTransition);
    EXPECT_EQ(m_machine->cancel(), AccessState::LoggedOn);
    EXPECT_EQ(m_machine->declineHardReset(), AccessState::LoggedOn);
}

TEST_F(AccessStateMachineTest, SuccessfulIntentClearsLastError)
{
    registerPassword();
    (void)m_machine->selectAdd();
    ASSERT_EQ(m_machine->lastError(), VaultError::InvalidTransition);
    (void)m_machine->submitLogin(pw(g_kPassword));
    EXPECT_FALSE(m_machine->lastError().has_value());
}

TEST_F(AccessStateMachineTest, AddThenFind)
{
    registerAndLogin();
    addRecord("groceries", "milk, eggs");

    ASSERT_EQ(m_machine->selectFind(), AccessState::FindRecord);
    ASSERT_EQ(m_machine->submitFind("groceries"), AccessState::RecordFound);
    ASSERT_TRUE(m_machine->foundRecord().has_value());
    EXPECT_EQ(*m_machine->foundRecord(), "milk, eggs");

    EXPECT_EQ(m_machine->acknowledge(), AccessState::LoggedOn);
    EXPECT_FALSE(m_machine->foundRecord().has_value());
}

TEST_F(AccessStateMachineTest, BodiesAreStoredEncrypted)
{
    registerAndLogin();
    addRecord("groceries", "milk, eggs");

    const auto stored{ m_store->get("groceries") };
    ASSERT_TRUE(stored.has_value());
    EXPECT_TRUE(stored->starts_with(notevault::core::g_kCipherTokenPrefixV1));
    EXPECT_EQ(stored->find("milk"), std::string::npos);
}

TEST_F(AccessStateMachineTest, EmptyTitleOrBodyStaysInAdd)
{
    registerAndLogin();
    ASSERT_EQ(m_machine->selectAdd(), AccessState::AddRecord);

    EXPECT_EQ(m_machine->submitRecord("", pw("body")), AccessState::AddRecord);
    EXPECT_EQ(m_machine->lastError(), VaultError::EmptyInput);
    EXPECT_EQ(m_machine->submitRecord("title", pw("")), AccessState::AddRecord);
    EXPECT_EQ(m_machine->lastError(), VaultError::EmptyInput);

    EXPECT_EQ(m_machine->cancel(), AccessState::LoggedOn);
    EXPECT_TRUE(m_store->listTitles().empty());
}

TEST_F(AccessStateMachineTest, DuplicateTitleStaysInAdd)
{
    registerAndLogin();
    addRecord("groceries", "milk");

    ASSERT_EQ(m_machine->selectAdd(), AccessState::AddRecord);
    EXPECT_EQ(m_machine->submitRecord("groceries", pw("bread")), AccessState::AddRecord);
    EXPECT_EQ(m_machine->lastError(), VaultError::DuplicateTitle);
    (void)m_machine->cancel();

    EXPECT_EQ(findRecord("groceries"), "milk");
}

TEST_F(AccessStateMachineTest, FindMissingRecord)
{
    registerAndLogin();
    ASSERT_EQ(m_machine->selectFind(), AccessState::FindRecord);
    EXPECT_EQ(m_machine->submitFind("nothing"), AccessState::RecordNotFound);
    EXPECT_FALSE(m_machine->lastError().has_value());
    EXPECT_FALSE(m_machine->foundRecord().has_value());
    EXPECT_EQ(m_machine->acknowledge(), AccessState::LoggedOn);
}

TEST_F(AccessStateMachineTest, EmptyFindTitleStaysInFind)
{
    registerAndLogin();
    ASSERT_EQ(m_machine->selectFind(), AccessState::FindRecord);
    EXPECT_EQ(m_machine->submitFind(""), AccessState::FindRecord);
    EXPECT_EQ(m_machine->lastError(), VaultError::EmptyInput);
    EXPECT_EQ(m_machine->cancel(), AccessState::LoggedOn);
}

TEST_F(AccessStateMachineTest, TamperedRecordIsReportedNotShown)
{
    registerAndLogin();
    addRecord("groceries", "milk");

    auto token{ *m_store->get("groceries") };
    token.back() = (token.back() == 'A') ? 'B' : 'A';
    m_store->remove("groceries");
    m_store->put("groceries", token);

    ASSERT_EQ(m_machine->selectFind(), AccessState::FindRecord);
    EXPECT_EQ(m_machine->submitFind("groceries"), AccessState::RecordNotFound);
    EXPECT_EQ(m_machine->lastError(), VaultError::CipherError);
    EXPECT_FALSE(m_machine->foundRecord().has_value());
}

TEST_F(AccessStateMachineTest, SelectWorksFromResultStates)
{
    registerAndLogin();
    ASSERT_EQ(m_machine->selectFind(), AccessState::FindRecord);
    ASSERT_EQ(m_machine->submitFind("nothing"), AccessState::RecordNotFound);
    EXPECT_EQ(m_machine->selectAdd(), AccessState::AddRecord);
}

TEST_F(AccessStateMachineTest, DeleteRecord)
{
    registerAndLogin();
    addRecord("groceries", "milk");

    ASSERT_EQ(m_machine->selectDelete(), AccessState::DeleteRecord);
    EXPECT_EQ(m_machine->submitDelete("groceries"), AccessState::LoggedOn);
    EXPECT_EQ(findRecord("groceries"), "");

    ASSERT_EQ(m_machine->selectDelete(), AccessState::DeleteRecord);
    EXPECT_EQ(m_machine->submitDelete("never-existed"), AccessState::LoggedOn);
    EXPECT_FALSE(m_machine->lastError().has_value());
}

TEST_F(AccessStateMachineTest, TitlesRequireAuthentication)
{
    registerPassword();
    const auto locked{ m_machine->titles() };
    ASSERT_TRUE(std::holds_alternative<VaultError>(locked));
    EXPECT_EQ(std::get<VaultError>(locked), VaultError::InvalidTransition);

    ASSERT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
    addRecord("pear", "1");
    addRecord("apple", "2");
    const auto titles{ m_machine->titles() };
    ASSERT_TRUE(std::holds_alternative<std::vector<std::string>>(titles));
    EXPECT_THAT(std::get<std::vector<std::string>>(titles), ::testing::ElementsAre("apple", "pear"));
}

TEST_F(AccessStateMachineTest, LogoffDestroysSession)
{
    registerAndLogin();
    EXPECT_EQ(m_machine->logoff(), AccessState::LoggedOff);
    EXPECT_FALSE(m_machine->hasSession());

    EXPECT_EQ(m_machine->logoff(), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->lastError(), VaultError::InvalidTransition);
}

TEST_F(AccessStateMachineTest, LogoffFromDialogs)
{
    registerAndLogin();
    ASSERT_EQ(m_machine->requestChangePassword(), AccessState::ChangePassword);
    EXPECT_TRUE(m_machine->hasSession());
    EXPECT_FALSE(notevault::core::isAuthenticated(m_machine->state()));
    EXPECT_EQ(m_machine->logoff(), AccessState::LoggedOff);

    ASSERT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
    ASSERT_EQ(m_machine->requestHardReset(), AccessState::ConfirmHardReset);
    EXPECT_EQ(m_machine->logoff(), AccessState::LoggedOff);
}

TEST_F(AccessStateMachineTest, ChangePasswordKeepsRecordsReadable)
{
    registerAndLogin();
    addRecord("groceries", "milk, eggs");
    addRecord("todo", "call mom");
    const auto oldToken{ *m_store->get("groceries") };

    ASSERT_EQ(m_machine->requestChangePassword(), AccessState::ChangePassword);
    ASSERT_EQ(m_machine->submitChangePassword(pw(g_kPassword), pw(g_kNewPassword)), AccessState::LoggedOn);
    EXPECT_NE(*m_store->get("groceries"), oldToken);
    EXPECT_EQ(findRecord("groceries"), "milk, eggs");

    restart();
    EXPECT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::InvalidPassword);
    ASSERT_EQ(m_machine->acknowledge(), AccessState::LoggedOff);
    ASSERT_EQ(m_machine->submitLogin(pw(g_kNewPassword)), AccessState::LoggedOn);
    EXPECT_EQ(findRecord("groceries"), "milk, eggs");
    EXPECT_EQ(findRecord("todo"), "call mom");
}

TEST_F(AccessStateMachineTest, ChangePasswordWithWrongCurrentPassword)
{
    registerAndLogin();
    ASSERT_EQ(m_machine->requestChangePassword(), AccessState::ChangePassword);
    EXPECT_EQ(m_machine->submitChangePassword(pw("Wr0ng!Pass"), pw(g_kNewPassword)),
              AccessState::ChangePasswordFailed);
    EXPECT_EQ(m_machine->lastError(), VaultError::AuthenticationFailed);
    EXPECT_EQ(m_machine->acknowledge(), AccessState::LoggedOn);

    restart();
    EXPECT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
}

TEST_F(AccessStateMachineTest, ChangePasswordRejectsWeakNewPassword)
{
    registerAndLogin();
    ASSERT_EQ(m_machine->requestChangePassword(), AccessState::ChangePassword);
    EXPECT_EQ(m_machine->submitChangePassword(pw(g_kPassword), pw("weak")), AccessState::ChangePasswordFailed);
    EXPECT_EQ(m_machine->lastError(), VaultError::RequirementsNotMet);
}

TEST_F(AccessStateMachineTest, CancelChangePassword)
{
    registerAndLogin();
    ASSERT_EQ(m_machine->requestChangePassword(), AccessState::ChangePassword);
    EXPECT_EQ(m_machine->cancel(), AccessState::LoggedOn);
}

TEST_F(AccessStateMachineTest, ChangePasswordRollsBackWhenConfigSaveFails)
{
    registerAndLogin();
    addRecord("groceries", "milk, eggs");
    const auto oldToken{ *m_store->get("groceries") };

    blockConfigWrites(m_dir.path());
    ASSERT_EQ(m_machine->requestChangePassword(), AccessState::ChangePassword);
    EXPECT_EQ(m_machine->submitChangePassword(pw(g_kPassword), pw(g_kNewPassword)),
              AccessState::ChangePasswordFailed);
    EXPECT_EQ(m_machine->lastError(), VaultError::ConfigIO);
    unblockConfigWrites(m_dir.path());

    EXPECT_EQ(*m_store->get("groceries"), oldToken);
    ASSERT_EQ(m_machine->acknowledge(), AccessState::LoggedOn);
    EXPECT_EQ(findRecord("groceries"), "milk, eggs");

    restart();
    EXPECT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
}

TEST_F(AccessStateMachineTest, FailedMetaWriteDuringChangeKeepsOldPasswordAcrossRestart)
{
    registerAndLogin();
    addRecord("groceries", "milk, eggs");

    blockConfigWrites(m_dir.path(), notevault::core::g_kConfigFileName);
    ASSERT_EQ(m_machine->requestChangePassword(), AccessState::ChangePassword);
    EXPECT_EQ(m_machine->submitChangePassword(pw(g_kPassword), pw(g_kNewPassword)),
              AccessState::ChangePasswordFailed);
    EXPECT_EQ(m_machine->lastError(), VaultError::ConfigIO);
    unblockConfigWrites(m_dir.path(), notevault::core::g_kConfigFileName);

    restart();
    EXPECT_EQ(m_machine->submitLogin(pw(g_kNewPassword)), AccessState::InvalidPassword);
    ASSERT_EQ(m_machine->acknowledge(), AccessState::LoggedOff);
    ASSERT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
    EXPECT_EQ(findRecord("groceries"), "milk, eggs");
}

TEST_F(AccessStateMachineTest, NewPasswordSaveFailureStaysEmpty)
{
    blockConfigWrites(m_dir.path());
    EXPECT_EQ(m_machine->submitNewPassword(pw(g_kPassword)), AccessState::Empty);
    EXPECT_EQ(m_machine->lastError(), VaultError::ConfigIO);
    EXPECT_FALSE(m_machine->config().hasVerifier());
    EXPECT_FALSE(VaultConfig::exists(m_dir.path()));
    unblockConfigWrites(m_dir.path());

    EXPECT_EQ(m_machine->submitNewPassword(pw(g_kPassword)), AccessState::LoggedOff);
}

TEST_F(AccessStateMachineTest, HardResetDestroysEverything)
{
    registerAndLogin();
    addRecord("groceries", "milk");
    const auto oldSalt{ m_machine->config().passwordSalt() };

    ASSERT_EQ(m_machine->requestHardReset(), AccessState::ConfirmHardReset);
    EXPECT_EQ(m_machine->confirmHardReset(pw(g_kPassword)), AccessState::HardReset);
    EXPECT_FALSE(m_machine->hasSession());
    EXPECT_TRUE(m_store->listTitles().empty());
    EXPECT_FALSE(VaultConfig::exists(m_dir.path()));
    EXPECT_FALSE(m_machine->config().hasVerifier());
    EXPECT_NE(m_machine->config().passwordSalt(), oldSalt);

    EXPECT_EQ(m_machine->acknowledge(), AccessState::Empty);
    EXPECT_EQ(m_machine->submitNewPassword(pw(g_kNewPassword)), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->submitLogin(pw(g_kNewPassword)), AccessState::LoggedOn);
}

TEST_F(AccessStateMachineTest, HardResetCompletesWhenConfigCannotBeRemoved)
{
    registerAndLogin();
    addRecord("groceries", "milk");
    const fs::path metaPath{ m_dir.path() / notevault::core::g_kConfigFileName };
    fs::remove(metaPath);
    fs::create_directories(metaPath / "pinned");

    ASSERT_EQ(m_machine->requestHardReset(), AccessState::ConfirmHardReset);
    EXPECT_EQ(m_machine->confirmHardReset(pw(g_kPassword)), AccessState::HardReset);
    EXPECT_EQ(m_machine->lastError(), VaultError::ConfigIO);
    EXPECT_FALSE(m_machine->hasSession());
    EXPECT_TRUE(m_store->listTitles().empty());
    EXPECT_FALSE(m_machine->config().hasVerifier());
    EXPECT_EQ(m_machine->acknowledge(), AccessState::Empty);

    fs::remove_all(metaPath);
    EXPECT_EQ(m_machine->submitNewPassword(pw(g_kNewPassword)), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->submitLogin(pw(g_kNewPassword)), AccessState::LoggedOn);
}

TEST_F(AccessStateMachineTest, HardResetWithWrongPasswordKeepsData)
{
    registerAndLogin();
    addRecord("groceries", "milk");

    ASSERT_EQ(m_machine->requestHardReset(), AccessState::ConfirmHardReset);
    EXPECT_EQ(m_machine->confirmHardReset(pw("Wr0ng!Pass")), AccessState::ConfirmHardResetFailed);
    EXPECT_EQ(m_machine->lastError(), VaultError::AuthenticationFailed);
    EXPECT_TRUE(m_machine->hasSession());
    EXPECT_EQ(m_machine->acknowledge(), AccessState::LoggedOn);
    EXPECT_EQ(findRecord("groceries"), "milk");
}

TEST_F(AccessStateMachineTest, DeclineHardReset)
{
    registerAndLogin();
    ASSERT_EQ(m_machine->requestHardReset(), AccessState::ConfirmHardReset);
    EXPECT_EQ(m_machine->declineHardReset(), AccessState::ConfirmHardResetFailed);
    EXPECT_EQ(m_machine->acknowledge(), AccessState::LoggedOn);
    EXPECT_TRUE(VaultConfig::exists(m_dir.path()));
}

TEST_F(AccessStateMachineTest, HardResetNeedsRandomSalt)
{
    registerAndLogin();
    addRecord("groceries", "milk");

    m_crypto.setFailRandom(true);
    ASSERT_EQ(m_machine->requestHardReset(), AccessState::ConfirmHardReset);
    EXPECT_EQ(m_machine->confirmHardReset(pw(g_kPassword)), AccessState::ConfirmHardResetFailed);
    EXPECT_EQ(m_machine->lastError(), VaultError::RandomFailed);
    m_crypto.setFailRandom(false);

    EXPECT_TRUE(VaultConfig::exists(m_dir.path()));
    EXPECT_EQ(m_store->listTitles().size(), 1U);
}

TEST_F(AccessStateMachineTest, EncryptionFailureStaysInAdd)
{
    registerAndLogin();
    m_crypto.setFailEncrypt(true);
    ASSERT_EQ(m_machine->selectAdd(), AccessState::AddRecord);
    EXPECT_EQ(m_machine->submitRecord("title", pw("body")), AccessState::AddRecord);
    EXPECT_EQ(m_machine->lastError(), VaultError::CipherError);
    m_crypto.setFailEncrypt(false);
    EXPECT_TRUE(m_store->listTitles().empty());
}

TEST_F(AccessStateMachineTest, IdleSessionIsLoggedOffBeforeNextIntent)
{
    registerAndLogin();

    m_now += Session::Duration{ 200 };
    EXPECT_EQ(m_machine->selectAdd(), AccessState::AddRecord);
    EXPECT_EQ(m_machine->cancel(), AccessState::LoggedOn);

    m_now += g_kIdleTimeout + Session::Duration{ 1 };
    EXPECT_EQ(m_machine->selectAdd(), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->lastError(), VaultError::InvalidTransition);
    EXPECT_FALSE(m_machine->hasSession());
}

TEST_F(AccessStateMachineTest, ExpireIdleSessionReportsOnce)
{
    registerAndLogin();
    EXPECT_FALSE(m_machine->expireIdleSession());

    m_now += g_kIdleTimeout + Session::Duration{ 1 };
    EXPECT_TRUE(m_machine->expireIdleSession());
    EXPECT_FALSE(m_machine->expireIdleSession());
    EXPECT_EQ(m_machine->state(), AccessState::LoggedOff);
}

TEST_F(AccessStateMachineTest, IdleExpiryAppliesToTitles)
{
    registerAndLogin();
    m_now += g_kIdleTimeout + Session::Duration{ 1 };
    const auto titles{ m_machine->titles() };
    ASSERT_TRUE(std::holds_alternative<VaultError>(titles));
    EXPECT_EQ(m_machine->state(), AccessState::LoggedOff);
}

// Storage failures injected through a mock store.
class AccessStateMachineStorageFailureTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        ASSERT_TRUE(m_dir.valid());
        m_machine = std::make_unique<AccessStateMachine>(
            m_crypto, m_store, VaultConfig::initialize(m_dir.path(), newSalt(m_crypto)), g_kIdleTimeout);
        ASSERT_EQ(m_machine->submitNewPassword(pw(g_kPassword)), AccessState::LoggedOff);
        ASSERT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
    }

    notevault::test_utils::FlakyCrypto m_crypto;                            // NOLINT
    notevault::test_utils::TempDir m_dir{ "access_machine_mock_" };         // NOLINT
    ::testing::NiceMock<notevault::test_utils::MockRecordStore> m_store;    // NOLINT
    std::unique_ptr<AccessStateMachine> m_machine;                         // NOLINT
};

TEST_F(AccessStateMachineStorageFailureTest, PutFailureStaysInAdd)
{
    EXPECT_CALL(m_store, put).WillOnce(Throw(StorageIOError{ "disk full" }));
    ASSERT_EQ(m_machine->selectAdd(), AccessState::AddRecord);
    EXPECT_EQ(m_machine->submitRecord("title", pw("body")), AccessState::AddRecord);
    EXPECT_EQ(m_machine->lastError(), VaultError::StorageIO);
}

TEST_F(AccessStateMachineStorageFailureTest, GetFailureIsNotFound)
{
    EXPECT_CALL(m_store, get).WillOnce(Throw(StorageIOError{ "io" }));
    ASSERT_EQ(m_machine->selectFind(), AccessState::FindRecord);
    EXPECT_EQ(m_machine->submitFind("title"), AccessState::RecordNotFound);
    EXPECT_EQ(m_machine->lastError(), VaultError::StorageIO);
}

TEST_F(AccessStateMachineStorageFailureTest, RemoveFailureStaysInDelete)
{
    EXPECT_CALL(m_store, remove).WillOnce(Throw(StorageIOError{ "io" }));
    ASSERT_EQ(m_machine->selectDelete(), AccessState::DeleteRecord);
    EXPECT_EQ(m_machine->submitDelete("title"), AccessState::DeleteRecord);
    EXPECT_EQ(m_machine->lastError(), VaultError::StorageIO);
}

TEST_F(AccessStateMachineStorageFailureTest, ListFailureIsReported)
{
    EXPECT_CALL(m_store, listTitles).WillOnce(Throw(StorageIOError{ "io" }));
    const auto titles{ m_machine->titles() };
    ASSERT_TRUE(std::holds_alternative<VaultError>(titles));
    EXPECT_EQ(std::get<VaultError>(titles), VaultError::StorageIO);
}

TEST_F(AccessStateMachineStorageFailureTest, ReencryptionFailureKeepsOldPassword)
{
    EXPECT_CALL(m_store, listRecords).WillOnce(Return(std::vector<notevault::storage::StoredRecord>{}));
    EXPECT_CALL(m_store, replaceBodies).WillOnce(Throw(StorageIOError{ "io" }));

    ASSERT_EQ(m_machine->requestChangePassword(), AccessState::ChangePassword);
    EXPECT_EQ(m_machine->submitChangePassword(pw(g_kPassword), pw(g_kNewPassword)),
              AccessState::ChangePasswordFailed);
    EXPECT_EQ(m_machine->lastError(), VaultError::StorageIO);

    ASSERT_EQ(m_machine->acknowledge(), AccessState::LoggedOn);
    ASSERT_EQ(m_machine->logoff(), AccessState::LoggedOff);
    EXPECT_EQ(m_machine->submitLogin(pw(g_kPassword)), AccessState::LoggedOn);
}

TEST_F(AccessStateMachineStorageFailureTest, ClearFailureKeepsSession)
{
    EXPECT_CALL(m_store, clear).WillOnce(Throw(StorageIOError{ "io" }));

    ASSERT_EQ(m_machine->requestHardReset(), AccessState::ConfirmHardReset);
    EXPECT_EQ(m_machine->confirmHardReset(pw(g_kPassword)), AccessState::ConfirmHardResetFailed);
    EXPECT_EQ(m_machine->lastError(), VaultError::StorageIO);
    EXPECT_TRUE(m_machine->hasSession());
    EXPECT_TRUE(VaultConfig::exists(m_dir.path()));
}

} // namespace
