#include "InteractiveShell.hpp"
#include "Tokenizer.hpp"
#include "notevault/core/CredentialManager.hpp"
#include "notevault/logging/LogRegistry.hpp"
#include "notevault/security/WipeGuard.hpp"

#include <CLI/CLI.hpp>
#include <utility>
#include <vector>

namespace notevault::ui::cli
{

using notevault::core::AccessState;
using notevault::security::asStringView;
using notevault::security::WipeGuard;

InteractiveShell::InteractiveShell(notevault::core::AccessStateMachine& machine, std::istream& in, std::ostream& out,
                                   SecretReader readSecret, SecretReader readText)
    : m_machine(machine), m_in(in), m_out(out), m_readSecret(std::move(readSecret)), m_readText(std::move(readText))
{
}

int InteractiveShell::run()
{
    m_out << "NoteVault shell\n";
    m_out << "Type 'help' for available commands.\n";
    if (m_machine.state() == AccessState::Empty)
    {
        m_out << "No password set yet. Use 'init' to create one.\n";
    }

    std::string line;
    while (m_running && m_in.good())
    {
        m_out << prompt();

        if (!std::getline(m_in, line))
        {
            break; // EOF
        }

        if (line.empty())
        {
            continue;
        }

        processLine(line);
    }

    if (m_machine.hasSession())
    {
        (void)m_machine.logoff();
    }
    return 0;
}

std::string InteractiveShell::prompt() const
{
    return m_machine.hasSession() ? "notevault(unlocked)> " : "notevault> ";
}

void InteractiveShell::processLine(const std::string& line)
{
    auto tokens = Tokenizer::tokenize(line);
    if (!tokens)
    {
        m_out << "Syntax Error: unterminated quote\n";
        return;
    }
    std::vector<std::string> userArgs = std::move(*tokens);
    if (userArgs.empty())
    {
        return;
    }

    if (m_machine.expireIdleSession())
    {
        m_out << "Session expired due to inactivity. Logged off.\n";
    }

    // 'help' must print the root help, not the help of the 'help' subcommand.
    if (userArgs[0] == "help")
    {
        userArgs[0] = "--help";
    }
    notevault::logging::LogRegistry::shell()->debug("shell: command '{}'", userArgs[0]);

    std::vector<std::string> args;
    args.reserve(userArgs.size() + 1);
    args.emplace_back("notevault");
    args.insert(args.end(), userArgs.begin(), userArgs.end());

    CLI::App app{ "NoteVault shell" };
    app.require_subcommand(1);

    app.add_subcommand("help", "Print this help message")->callback([]() { throw CLI::CallForHelp(); });
    app.add_subcommand("exit", "Exit the shell")->alias("quit")->callback([this]() { m_running = false; });
    app.add_subcommand("status", "Show vault state and location")->callback([this]() { doStatus(); });
    app.add_subcommand("init", "Set the vault password (first run)")->callback([this]() { doInit(); });
    app.add_subcommand("login", "Unlock the vault")->callback([this]() { doLogin(); });
    app.add_subcommand("logout", "Lock the vault")->callback([this]() { doLogout(); });
    app.add_subcommand("list", "List note titles")->callback([this]() { doList(); });
    app.add_subcommand("passwd", "Change the vault password")->callback([this]() { doChangePassword(); });
    app.add_subcommand("reset", "Delete all notes and the password")->callback([this]() { doReset(); });

    std::string titleArg;
    auto* subAdd = app.add_subcommand("add", "Store a note (prompts for the body)");
    subAdd->add_option("title", titleArg, "Note title")->required();
    subAdd->callback([&]() { doAdd(titleArg); });

    auto* subFind = app.add_subcommand("find", "Show a note");
    subFind->add_option("title", titleArg, "Note title")->required();
    subFind->callback([&]() { doFind(titleArg); });

    auto* subDelete = app.add_subcommand("delete", "Delete a note");
    subDelete->add_option("title", titleArg, "Note title")->required();
    subDelete->callback([&]() { doDelete(titleArg); });

    try
    {
        std::vector<char*> argv;
        argv.reserve(args.size());
        for (const auto& arg : args)
        {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }

        app.parse(static_cast<int>(argv.size()), argv.data());
    }
    catch ([[maybe_unused]] const CLI::CallForHelp&)
    {
        m_out << app.help();
    }
    catch (const CLI::ParseError& e)
    {
        m_out << "Syntax Error: " << e.what() << "\n";
    }
}

void InteractiveShell::printLastError()
{
    const auto err{ m_machine.lastError() };
    if (err == notevault::core::VaultError::InvalidTransition && m_machine.state() == AccessState::LoggedOff)
    {
        m_out << "Error: Session expired. Use 'login' again.\n";
        return;
    }
    if (err)
    {
        m_out << "Error: " << notevault::core::toString(*err) << ".\n";
    }
}

bool InteractiveShell::requireLoggedOn()
{
    if (notevault::core::isAuthenticated(m_machine.state()))
    {
        return true;
    }
    if (m_machine.state() == AccessState::Empty)
    {
        m_out << "Error: No password set yet. Use 'init' first.\n";
    }
    else
    {
        m_out << "Error: Vault is locked. Use 'login' first.\n";
    }
    return false;
}

// --- Handlers ---

void InteractiveShell::doStatus()
{
    const auto& config = m_machine.config();
    m_out << "State: " << notevault::core::toString(m_machine.state()) << "\n";
    m_out << "Storage: " << config.storagePath().string() << "\n";
    m_out << "Password set: " << (config.hasVerifier() ? "yes" : "no") << "\n";
    if (const auto left{ m_machine.idleTimeLeft() })
    {
        m_out << "Auto-lock in: " << left->count() << "s\n";
    }
}

void InteractiveShell::doInit()
{
    if (m_machine.state() != AccessState::Empty)
    {
        m_out << "Error: A password is already set.\n";
        return;
    }

    m_out << notevault::core::g_kPasswordRequirementsText;
    auto p1 = m_readSecret("New password: ");
    auto p2 = m_readSecret("Confirm password: ");
    const WipeGuard wipe{ p1, p2 };

    if (asStringView(p1) != asStringView(p2))
    {
        m_out << "Error: Passwords do not match.\n";
        return;
    }

    switch (m_machine.submitNewPassword(p1))
    {
    case AccessState::LoggedOff:
        m_out << "Password set. Use 'login' to unlock the vault.\n";
        break;
    case AccessState::InvalidNewPassword:
        m_out << "Error: Password does not meet the requirements.\n";
        m_out << notevault::core::g_kPasswordRequirementsText;
        (void)m_machine.acknowledge();
        break;
    default:
        printLastError();
        break;
    }
}

void InteractiveShell::doLogin()
{
    if (m_machine.hasSession())
    {
        m_out << "Already logged in.\n";
        return;
    }
    if (m_machine.state() == AccessState::Empty)
    {
        m_out << "Error: No password set yet. Use 'init' first.\n";
        return;
    }

    auto pass = m_readSecret("Password: ");
    const WipeGuard wipe{ pass };

    if (m_machine.submitLogin(pass) == AccessState::LoggedOn)
    {
        m_out << "Vault unlocked.\n";
        return;
    }
    m_out << "Error: Wrong password. The vault remains locked.\n";
    (void)m_machine.acknowledge();
}

void InteractiveShell::doLogout()
{
    if (!m_machine.hasSession())
    {
        m_out << "Error: Not logged in.\n";
        return;
    }
    (void)m_machine.logoff();
    m_out << "Logged off.\n";
}

void InteractiveShell::doAdd(const std::string& title)
{
    if (!requireLoggedOn())
    {
        return;
    }
    (void)m_machine.selectAdd();

    auto body = m_readText("Note: ");
    const WipeGuard wipe{ body };

    if (m_machine.submitRecord(title, body) == AccessState::LoggedOn)
    {
        m_out << "Note saved.\n";
        return;
    }
    printLastError();
    (void)m_machine.cancel();
}

void InteractiveShell::doFind(const std::string& title)
{
    if (!requireLoggedOn())
    {
        return;
    }
    (void)m_machine.selectFind();

    const auto state{ m_machine.submitFind(title) };
    if (state == AccessState::RecordFound)
    {
        if (const auto body{ m_machine.foundRecord() })
        {
            m_out << *body << "\n";
        }
    }
    else if (m_machine.lastError())
    {
        printLastError();
    }
    else
    {
        m_out << "Error: Note not found.\n";
    }
    if (state == AccessState::FindRecord)
    {
        (void)m_machine.cancel();
        return;
    }
    (void)m_machine.acknowledge();
}

void InteractiveShell::doDelete(const std::string& title)
{
    if (!requireLoggedOn())
    {
        return;
    }
    (void)m_machine.selectDelete();

    if (m_machine.submitDelete(title) == AccessState::LoggedOn)
    {
        m_out << "Note deleted (if it existed).\n";
        return;
    }
    printLastError();
    (void)m_machine.cancel();
}

void InteractiveShell::doList()
{
    if (!requireLoggedOn())
    {
        return;
    }

    auto result = m_machine.titles();
    if (const auto* err = std::get_if<notevault::core::VaultError>(&result))
    {
        m_out << "Error: " << notevault::core::toString(*err) << ".\n";
        return;
    }

    const auto& titles = std::get<std::vector<std::string>>(result);
    if (titles.empty())
    {
        m_out << "(empty)\n";
        return;
    }
    for (const auto& t : titles)
    {
        m_out << " - " << t << "\n";
    }
}

void InteractiveShell::doChangePassword()
{
    if (!requireLoggedOn())
    {
        return;
    }
    (void)m_machine.requestChangePassword();

    auto current = m_readSecret("Current password: ");
    auto p1 = m_readSecret("New password: ");
    auto p2 = m_readSecret("Confirm new password: ");
    const WipeGuard wipe{ current, p1, p2 };

    if (asStringView(p1) != asStringView(p2))
    {
        m_out << "Error: Passwords do not match.\n";
        (void)m_machine.cancel();
        return;
    }

    if (m_machine.submitChangePassword(current, p1) == AccessState::LoggedOn)
    {
        m_out << "Password changed.\n";
        return;
    }
    printLastError();
    if (m_machine.lastError() == notevault::core::VaultError::RequirementsNotMet)
    {
        m_out << notevault::core::g_kPasswordRequirementsText;
    }
    (void)m_machine.acknowledge();
}

void InteractiveShell::doReset()
{
    if (!requireLoggedOn())
    {
        return;
    }
    (void)m_machine.requestHardReset();

    m_out << "WARNING: this permanently deletes every note and the password.\n";
    auto pass = m_readSecret("Password to confirm (empty to abort): ");
    const WipeGuard wipe{ pass };

    if (pass.empty())
    {
        (void)m_machine.declineHardReset();
        (void)m_machine.acknowledge();
        m_out << "Reset aborted.\n";
        return;
    }

    if (m_machine.confirmHardReset(pass) == AccessState::HardReset)
    {
        if (m_machine.lastError())
        {
            printLastError();
        }
        (void)m_machine.acknowledge();
        m_out << "Vault reset. Use 'init' to set a new password.\n";
        return;
    }
    printLastError();
    (void)m_machine.acknowledge();
}

} // namespace notevault::ui::cli
