#include "notevault/security/SecureRandom.hpp"
#include <algorithm>
#include <cerrno>
#include <cstddef>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#include <bcrypt.h>
#elif defined(__linux__)
#include <sys/random.h>
#else
#include <unistd.h>
#endif

namespace notevault::security
{
namespace
{

#if defined(_WIN32)
constexpr std::size_t g_kMaxChunk{ 1U << 20U };

[[nodiscard]] bool fillChunk(std::uint8_t* dst, std::size_t n) noexcept
{
    const NTSTATUS status{ ::BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(dst), static_cast<ULONG>(n),
                                             BCRYPT_USE_SYSTEM_PREFERRED_RNG) };
    return BCRYPT_SUCCESS(status);
}
#elif defined(__linux__)
constexpr std::size_t g_kMaxChunk{ 1U << 20U };

// getrandom may return fewer bytes than asked for; the caller loops.
[[nodiscard]] std::size_t fillSome(std::uint8_t* dst, std::size_t n) noexcept
{
    for (;;)
    {
        const ssize_t got{ ::getrandom(dst, n, 0) };
        if (got > 0)
        {
            return static_cast<std::size_t>(got);
        }
        if (got < 0 && errno == EINTR)
        {
            continue;
        }
        return 0U;
    }
}
#else
// getentropy refuses requests above 256 bytes.
constexpr std::size_t g_kMaxChunk{ 256U };

[[nodiscard]] bool fillChunk(std::uint8_t* dst, std::size_t n) noexcept
{
    return ::getentropy(dst, n) == 0;
}
#endif

} // namespace

bool secureRandomFill(std::span<std::uint8_t> out) noexcept
{
    while (!out.empty())
    {
        const std::size_t want{ std::min(out.size(), g_kMaxChunk) };
#if defined(__linux__)
        const std::size_t got{ fillSome(out.data(), want) };
        if (got == 0U || got > want)
        {
            return false;
        }
        out = out.subspan(got);
#else
        if (!fillChunk(out.data(), want))
        {
            return false;
        }
        out = out.subspan(want);
#endif
    }
    return true;
}

} // namespace notevault::security
