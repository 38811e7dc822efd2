#include "notevault/security/MemoryWiper.hpp"

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__) || defined(__FreeBSD__) || defined(__OpenBSD__)
#include <string.h>
#define NOTEVAULT_HAS_EXPLICIT_BZERO 1
#endif

namespace notevault::security
{

void secureWipe(std::span<std::byte> bytes) noexcept
{
    if (bytes.empty())
    {
        return;
    }
#if defined(_WIN32)
    ::SecureZeroMemory(bytes.data(), bytes.size());
#elif defined(NOTEVAULT_HAS_EXPLICIT_BZERO)
    ::explicit_bzero(bytes.data(), bytes.size());
#else
    // Stores through a volatile pointer are observable and survive dead-store elimination.
    volatile auto* p{ reinterpret_cast<volatile unsigned char*>(bytes.data()) };
    for (std::size_t i{}; i < bytes.size(); ++i)
    {
        p[i] = 0U;
    }
#endif
}

void secureWipe(std::string& text) noexcept
{
    // Short strings live inline; data() covers both layouts.
    secureWipe(std::as_writable_bytes(std::span{ text.data(), text.size() }));
    text.clear();
}

} // namespace notevault::security
