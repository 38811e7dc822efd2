#include "ConsoleUtils.hpp"

#include "notevault/security/MemoryWiper.hpp"
#include <iostream>
#include <string>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace notevault::ui::cli
{

namespace
{

// Turns echo off for its lifetime when stdin is a terminal; restores the previous mode afterwards.
class EchoGuard final
{
public:
    EchoGuard() noexcept
    {
#if defined(_WIN32)
        m_handle = GetStdHandle(STD_INPUT_HANDLE);
        if (GetConsoleMode(m_handle, &m_saved) != 0)
        {
            m_active = SetConsoleMode(m_handle, m_saved & ~static_cast<DWORD>(ENABLE_ECHO_INPUT)) != 0;
        }
#else
        if (isatty(STDIN_FILENO) != 0 && tcgetattr(STDIN_FILENO, &m_saved) == 0)
        {
            termios quiet{ m_saved };
            quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
            m_active = tcsetattr(STDIN_FILENO, TCSANOW, &quiet) == 0;
        }
#endif
    }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;
    EchoGuard(EchoGuard&&) = delete;
    EchoGuard& operator=(EchoGuard&&) = delete;

    ~EchoGuard()
    {
        if (!m_active)
        {
            return;
        }
#if defined(_WIN32)
        (void)SetConsoleMode(m_handle, m_saved);
#else
        (void)tcsetattr(STDIN_FILENO, TCSANOW, &m_saved);
#endif
    }

private:
#if defined(_WIN32)
    HANDLE m_handle{ nullptr };
    DWORD m_saved{ 0 };
#else
    termios m_saved{};
#endif
    bool m_active{ false };
};

[[nodiscard]] notevault::security::SecureString readLineFromStdin()
{
    std::string line{};
    if (!std::getline(std::cin, line))
    {
        return {};
    }
    auto out{ notevault::security::secureStringFrom(line) };
    notevault::security::secureWipe(line);
    return out;
}

} // namespace

bool lockProcessMemory() noexcept
{
#if defined(_WIN32)
    return false;
#else
    const bool locked{ mlockall(MCL_CURRENT | MCL_FUTURE) == 0 };
    const rlimit noCore{ 0, 0 };
    const bool coreDisabled{ setrlimit(RLIMIT_CORE, &noCore) == 0 };
    return locked && coreDisabled;
#endif
}

notevault::security::SecureString readPassword(const std::string& prompt)
{
    std::cout << prompt << std::flush;
    notevault::security::SecureString out{};
    {
        EchoGuard noEcho{};
        out = readLineFromStdin();
    }
    std::cout << "\n";
    return out;
}

notevault::security::SecureString readLine(const std::string& prompt)
{
    std::cout << prompt << std::flush;
    return readLineFromStdin();
}

} // namespace notevault::ui::cli
