#ifndef NOTEVAULT_UI_CLI_CONSOLEUTILS_HPP
#define NOTEVAULT_UI_CLI_CONSOLEUTILS_HPP

#include "notevault/security/SecureString.hpp"
#include <string>

namespace notevault::ui::cli
{

// Locks current and future pages in RAM and disables core dumps. Returns false if either step failed.
[[nodiscard]] bool lockProcessMemory() noexcept;

// Reads one line from stdin with terminal echo off.
[[nodiscard]] notevault::security::SecureString readPassword(const std::string& prompt);

// Reads one line from stdin with echo on. Used for note bodies, which are secret but typed visibly.
[[nodiscard]] notevault::security::SecureString readLine(const std::string& prompt);

} // namespace notevault::ui::cli

#endif // NOTEVAULT_UI_CLI_CONSOLEUTILS_HPP
