#ifndef NOTEVAULT_UI_CLI_INTERACTIVESHELL_HPP
#define NOTEVAULT_UI_CLI_INTERACTIVESHELL_HPP

#include "notevault/core/AccessStateMachine.hpp"
#include "notevault/security/SecureString.hpp"

#include <functional>
#include <iostream>
#include <string>

namespace notevault::ui::cli
{

// In tests: returns a pre-determined string.
using SecretReader = std::function<notevault::security::SecureString(const std::string&)>;

// Line-oriented frontend. Every command becomes one or more AccessStateMachine intents, and the
// printed message is derived from the state they end in.
class InteractiveShell final
{
public:
    // `readSecret` is used for passwords, `readText` for note bodies.
    InteractiveShell(notevault::core::AccessStateMachine& machine, std::istream& in, std::ostream& out,
                     SecretReader readSecret, SecretReader readText);

    int run();

    // Executes one command line. Exposed for tests.
    void processLine(const std::string& line);

    [[nodiscard]] bool isRunning() const noexcept
    {
        return m_running;
    }

private:
    notevault::core::AccessStateMachine& m_machine;
    std::istream& m_in;
    std::ostream& m_out;
    SecretReader m_readSecret;
    SecretReader m_readText;
    bool m_running{ true };

    [[nodiscard]] std::string prompt() const;
    [[nodiscard]] bool requireLoggedOn();
    void printLastError();

    void doStatus();
    void doInit();
    void doLogin();
    void doLogout();
    void doAdd(const std::string& title);
    void doFind(const std::string& title);
    void doDelete(const std::string& title);
    void doList();
    void doChangePassword();
    void doReset();
};

} // namespace notevault::ui::cli

#endif // NOTEVAULT_UI_CLI_INTERACTIVESHELL_HPP
